#include <logtmpl/error.hpp>

namespace logtmpl {

const char* TemplateError::code_name(Code c) {
    switch (c) {
        case Format:     return "Format";
        case OutOfRange: return "OutOfRange";
        case Config:     return "Config";
        case IO:         return "IO";
        case Parse:      return "Parse";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string TemplateError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace logtmpl
