// StringUtils.h
#pragma once

#include <algorithm>
#include <cctype>
#include <string>

inline std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

inline std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string Trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return (first < last) ? std::string(first, last) : std::string();
}

inline bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// "Snooz AB12" for ("Snooz", "AA:BB:CC:DD:AB:12")
inline std::string MakeDisplayName(const std::string& name, const std::string& address) {
    std::string hex;
    for (char c : address) {
        if (std::isxdigit(static_cast<unsigned char>(c))) hex.push_back(c);
    }
    if (hex.size() > 4) hex = hex.substr(hex.size() - 4);
    if (hex.empty()) return name;
    return name + " " + ToUpper(hex);
}
