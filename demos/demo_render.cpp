// demo_render.cpp
//
// Renders a message template against arguments given on the command line
// and prints the structured name/value pairs a logging backend would index.
//
//     ./demo_render "User {UserId} logged in from {Ip}" 42 10.0.0.1
//     ./demo_render "Batch {Ids} done" "1|null|3"      # list argument
//     ./demo_render --config logtmpl.toml "{A,-8}|" x    # options from TOML
//     ./demo_render --no-color "{A}" x                   # plain log prefixes
//
// Argument conventions: "null" is a null value, "a|b|c" is a list, an
// all-digit argument is an integer, anything else is text.

#include <logtmpl/config.hpp>
#include <logtmpl/formatted_values.hpp>
#include <logtmpl/log.hpp>

#include <cctype>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace logtmpl;

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------

struct Invocation {
    Config config;
    std::string format;
    std::vector<std::string> args;
};

static Value scalar_from_arg(const std::string& arg) {
    if (arg == "null") return Value::null();

    bool negative = !arg.empty() && arg[0] == '-';
    std::string digits = negative ? arg.substr(1) : arg;
    bool numeric = !digits.empty() && digits.size() < 19;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) numeric = false;
    }
    if (numeric) return Value(std::stoll(arg));
    return Value(arg);
}

static Value value_from_arg(const std::string& arg) {
    if (arg.find('|') == std::string::npos) return scalar_from_arg(arg);

    Value::List items;
    size_t start = 0;
    while (true) {
        size_t bar = arg.find('|', start);
        items.push_back(scalar_from_arg(arg.substr(start, bar - start)));
        if (bar == std::string::npos) break;
        start = bar + 1;
    }
    return Value(std::move(items));
}

static Result<Invocation> parse_args(int argc, char** argv) {
    Invocation inv;
    int i = 1;

    if (i < argc && std::strcmp(argv[i], "--no-color") == 0) {
        log::set_color_enabled(false);
        ++i;
    }

    if (i < argc && std::strcmp(argv[i], "--config") == 0) {
        if (i + 1 >= argc) {
            return TemplateError{TemplateError::InvalidArg,
                "--config needs a file argument"};
        }
        auto cfg = Config::load(argv[i + 1]);
        LOGTMPL_TRY(cfg);
        log::info("loaded config %s", argv[i + 1]);
        inv.config.merge(cfg.value());
        i += 2;
    }

    if (i >= argc) {
        return TemplateError{TemplateError::InvalidArg,
            "no template specified",
            "usage: demo_render [--no-color] [--config file.toml] <template> [args...]"};
    }
    inv.format = argv[i++];
    for (; i < argc; ++i) inv.args.emplace_back(argv[i]);
    return Result<Invocation>::ok(std::move(inv));
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

static Status run(int argc, char** argv) {
    auto inv = parse_args(argc, argv);
    LOGTMPL_TRY(inv);
    inv.value().config.apply_log_level();

    auto formatter = std::make_shared<const LogValuesFormatter>(
        inv.value().format, inv.value().config.formatter);

    std::vector<Value> values;
    for (const auto& a : inv.value().args) values.push_back(value_from_arg(a));

    log::debug("template has %zu placeholder(s), %zu argument(s) given",
               formatter->value_names().size(), values.size());

    FormattedValues entry(formatter, std::move(values));

    auto message = entry.to_string();
    LOGTMPL_TRY(message);
    std::cout << message.value() << "\n";

    auto pairs = entry.pairs();
    LOGTMPL_TRY(pairs);
    for (const auto& p : pairs.value()) {
        std::cout << "  " << p.name << " = ";
        if (p.value.is_null()) {
            std::cout << formatter->options().null_marker;
        } else {
            std::cout << p.value.to_string();
        }
        std::cout << "\n";
    }
    return ok_status();
}

int main(int argc, char** argv) {
    auto status = run(argc, argv);
    if (status.is_err()) {
        log::error("demo_render failed");
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
