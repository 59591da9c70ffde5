#pragma once

#include <string>

namespace logtmpl {

struct TemplateError {
    enum Code {
        Format,
        OutOfRange,
        Config,
        IO,
        Parse,
        InvalidArg
    };

    Code code = Format;
    std::string message;
    std::string hint;

    TemplateError() = default;
    TemplateError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    TemplateError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace logtmpl
