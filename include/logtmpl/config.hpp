#pragma once

#include <logtmpl/log.hpp>
#include <logtmpl/result.hpp>
#include <optional>
#include <string>

namespace logtmpl {

// How get_values() sizes its output.
enum class ValuesLayout {
    Compat,   // values.size() + 1 slots, unnamed gap slots before the trailing pair
    Compact,  // names.size() + 1 slots
};

const char* values_layout_name(ValuesLayout layout);

// Fixed conventions applied by a formatter. Defaults are the canonical ones.
struct FormatterOptions {
    std::string null_marker = "(null)";
    std::string list_separator = ", ";
    std::string original_format_key = "{OriginalFormat}";
    ValuesLayout values_layout = ValuesLayout::Compat;
};

// Layered configuration read from the [formatter] and [log] tables of a
// TOML document. Later layers override only the keys they set.
struct Config {
    FormatterOptions formatter;
    std::optional<log::Level> log_level;

    bool null_marker_set = false;
    bool list_separator_set = false;
    bool original_format_key_set = false;
    bool values_layout_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Set the logger threshold if the config names one
    void apply_log_level() const;
};

} // namespace logtmpl
