#pragma once

#include "errors.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Flag value parsing shared by the command-line tools. Malformed values raise
// ConfigurationError naming the flag.
namespace cli_args {

inline std::vector<std::string> split_list(const std::string& s, char sep = ',') {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else if (c != ' ') {
            cur += c;
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

inline int parse_int(const std::string& flag, const std::string& value) {
    const std::string err = flag + ": expected an integer, got '" + value + "'";
    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(value, &pos);
    } catch (const std::exception&) {
        throw ConfigurationError(err);
    }
    if (pos != value.size()) throw ConfigurationError(err);
    return v;
}

inline double parse_double(const std::string& flag, const std::string& value) {
    const std::string err = flag + ": expected a number, got '" + value + "'";
    size_t pos = 0;
    double v = 0;
    try {
        v = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw ConfigurationError(err);
    }
    if (pos != value.size()) throw ConfigurationError(err);
    return v;
}

inline std::vector<int> parse_int_list(const std::string& flag, const std::string& value) {
    std::vector<int> out;
    for (const auto& item : split_list(value)) out.push_back(parse_int(flag, item));
    if (out.empty()) throw ConfigurationError(flag + ": empty list");
    return out;
}

inline std::vector<double> parse_double_list(const std::string& flag, const std::string& value) {
    std::vector<double> out;
    for (const auto& item : split_list(value)) out.push_back(parse_double(flag, item));
    if (out.empty()) throw ConfigurationError(flag + ": empty list");
    return out;
}

// "none" (or "None") stands for an absent value, e.g. --sl none,0.0005
inline std::vector<std::optional<double>> parse_optional_list(const std::string& flag,
                                                              const std::string& value) {
    std::vector<std::optional<double>> out;
    for (const auto& item : split_list(value)) {
        if (item == "none" || item == "None") {
            out.push_back(std::nullopt);
        } else {
            out.push_back(parse_double(flag, item));
        }
    }
    if (out.empty()) throw ConfigurationError(flag + ": empty list");
    return out;
}

// "1=0.0002,3=0.0005" -> {1: 0.0002, 3: 0.0005}; "none" gives an empty map.
inline std::map<int, double> parse_int_double_map(const std::string& flag,
                                                  const std::string& value) {
    std::map<int, double> out;
    if (value == "none" || value == "None") return out;
    for (const auto& item : split_list(value)) {
        size_t eq = item.find('=');
        if (eq == std::string::npos) {
            throw ConfigurationError(flag + ": expected <key>=<value>, got '" + item + "'");
        }
        out[parse_int(flag, item.substr(0, eq))] = parse_double(flag, item.substr(eq + 1));
    }
    if (out.empty()) throw ConfigurationError(flag + ": empty list");
    return out;
}

}  // namespace cli_args
