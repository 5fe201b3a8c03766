#pragma once
#include "configuration.h"
#include "jsonparser.h"

#include "AgeRisk.Core/string_util.h"

#include <fmt/color.h>
#include <nlohmann/json.hpp>

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace agerisk::input {
/// @brief Reads a required JSON section
/// @param j The parent JSON object
/// @param key The section name
/// @throw ConfigurationError: Section not found, the name is printed in red
/// @return The section value
nlohmann::json get(const nlohmann::json &j, const std::string &key);

/// @brief Converts a JSON value into out, reporting failures on the console
///
/// Missing keys and values that do not convert to T are printed in red, out is
/// left unchanged in both cases.
/// @tparam T The converted type, any type with a from_json overload
/// @return true on success, otherwise false
template <class T> bool get_to(const nlohmann::json &j, const std::string &key, T &out) noexcept {
    try {
        out = j.at(key).get<T>();
        return true;
    } catch (const nlohmann::json::out_of_range &) {
        fmt::print(fg(fmt::color::red), "Missing key \"{}\"\n", key);
    } catch (const nlohmann::json::type_error &ex) {
        fmt::print(fg(fmt::color::red), "Key \"{}\" is of wrong type: {}\n", key, ex.what());
    }

    return false;
}

/// @brief Converts a JSON value into out, clearing the success flag on failure
///
/// The flag is never set back to true, so a run of calls reports whether all of them
/// succeeded.
template <class T>
bool get_to(const nlohmann::json &j, const std::string &key, T &out, bool &success) noexcept {
    if (get_to(j, key, out)) {
        return true;
    }

    success = false;
    return false;
}

/// @brief Converts an optional JSON value into out, keeping the default when absent
/// @return false only if the key is present and does not convert
template <class T>
bool get_optional_to(const nlohmann::json &j, const std::string &key, T &out,
                     bool &success) noexcept {
    if (!j.is_object() || !j.contains(key)) {
        return true;
    }

    return get_to(j, key, out, success);
}

/// @brief Maps a configuration option name onto its enumerated value, ignoring case
/// @param what The option description for error messages, e.g. "likelihood family"
/// @param name The configured name
/// @param choices The accepted names and their values
/// @throw ConfigurationError: Unknown name, printed in red
template <class E>
E parse_option(std::string_view what, const std::string &name,
               std::initializer_list<std::pair<std::string_view, E>> choices) {
    for (const auto &[choice, value] : choices) {
        if (core::case_insensitive::equals(name, choice)) {
            return value;
        }
    }

    fmt::print(fg(fmt::color::red), "Unknown {}: {}\n", what, name);
    throw ConfigurationError{fmt::format("Unknown {}: {}", what, name)};
}
} // namespace agerisk::input
