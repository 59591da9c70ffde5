#pragma once

#include <logtmpl/error.hpp>
#include <utility>
#include <variant>

namespace logtmpl {

template<typename T>
class Result {
    std::variant<T, TemplateError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from TemplateError so LOGTMPL_TRY can return errors across Result<T> types
    Result(TemplateError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(TemplateError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<TemplateError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    TemplateError& error() & { return std::get<TemplateError>(data_); }
    const TemplateError& error() const& { return std::get<TemplateError>(data_); }
    TemplateError&& error() && { return std::get<TemplateError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define LOGTMPL_TRY(expr) \
    do { \
        auto _logtmpl_result = (expr); \
        if (_logtmpl_result.is_err()) return std::move(_logtmpl_result).error(); \
    } while(0)

} // namespace logtmpl
