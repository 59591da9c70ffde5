#include <logtmpl/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace logtmpl {

const char* values_layout_name(ValuesLayout layout) {
    switch (layout) {
        case ValuesLayout::Compat:  return "compat";
        case ValuesLayout::Compact: return "compact";
    }
    return "unknown";
}

static std::optional<ValuesLayout> parse_values_layout(const std::string& s) {
    if (s == "compat") return ValuesLayout::Compat;
    if (s == "compact") return ValuesLayout::Compact;
    return std::nullopt;
}

static Status read_string(const toml::table& tbl, const char* table, const char* key,
                          std::string& out, bool& set) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto s = node.value<std::string>();
    if (!s) {
        return TemplateError{TemplateError::Config,
            std::string(table) + "." + key + " must be a string"};
    }
    out = *s;
    set = true;
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return TemplateError{TemplateError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [formatter] section
    if (auto fmt = doc["formatter"].as_table()) {
        LOGTMPL_TRY(read_string(*fmt, "formatter", "null-marker",
                                cfg.formatter.null_marker, cfg.null_marker_set));
        LOGTMPL_TRY(read_string(*fmt, "formatter", "list-separator",
                                cfg.formatter.list_separator, cfg.list_separator_set));
        LOGTMPL_TRY(read_string(*fmt, "formatter", "original-format-key",
                                cfg.formatter.original_format_key, cfg.original_format_key_set));

        std::string layout_name;
        bool layout_given = false;
        LOGTMPL_TRY(read_string(*fmt, "formatter", "values-layout", layout_name, layout_given));
        if (layout_given) {
            auto layout = parse_values_layout(layout_name);
            if (!layout) {
                return TemplateError{TemplateError::Config,
                    "unknown values-layout '" + layout_name + "'",
                    "expected \"compat\" or \"compact\""};
            }
            cfg.formatter.values_layout = *layout;
            cfg.values_layout_set = true;
        }

        for (const auto& [key, node] : *fmt) {
            (void)node;
            std::string k(key.str());
            if (k != "null-marker" && k != "list-separator" &&
                k != "original-format-key" && k != "values-layout") {
                log::warn("ignoring unknown config key 'formatter.%s'", k.c_str());
            }
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        std::string level_name;
        bool level_given = false;
        LOGTMPL_TRY(read_string(*lg, "log", "level", level_name, level_given));
        if (level_given) {
            auto lvl = log::parse_level(level_name);
            if (!lvl) {
                return TemplateError{TemplateError::Config,
                    "unknown log level '" + level_name + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = *lvl;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TemplateError{TemplateError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.null_marker_set) {
        formatter.null_marker = other.formatter.null_marker;
        null_marker_set = true;
    }
    if (other.list_separator_set) {
        formatter.list_separator = other.formatter.list_separator;
        list_separator_set = true;
    }
    if (other.original_format_key_set) {
        formatter.original_format_key = other.formatter.original_format_key;
        original_format_key_set = true;
    }
    if (other.values_layout_set) {
        formatter.values_layout = other.formatter.values_layout;
        values_layout_set = true;
    }
    if (other.log_level.has_value()) {
        log_level = other.log_level;
    }
}

void Config::apply_log_level() const {
    if (log_level.has_value()) {
        log::set_level(*log_level);
    }
}

} // namespace logtmpl
