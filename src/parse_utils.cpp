#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

static bool all_digits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long v = std::stoul(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<unsigned int>(v);
    } catch (const std::logic_error&) {
        return 0;
    }
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::logic_error&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, bool& ok) {
    ok = false;
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!val.empty() && val.back() == 'b')
        val.pop_back();
    unsigned long long mult = 1;
    if (!val.empty() && val.back() == 'k') {
        mult = 1024ull;
        val.pop_back();
    } else if (!val.empty() && val.back() == 'm') {
        mult = 1024ull * 1024;
        val.pop_back();
    } else if (!val.empty() && val.back() == 'g') {
        mult = 1024ull * 1024 * 1024;
        val.pop_back();
    }
    if (!all_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::logic_error&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    ok = true;
    return static_cast<size_t>(base * mult);
}

bool parse_bool_value(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "1" || v == "true" || v == "yes" || v == "on";
}
