#include "validators.h"
#include <algorithm>
#include <cctype>

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

bool parse_ipv4(const std::string& ip, std::string& canonical) {
    std::string out;
    int groups = 0;
    size_t pos = 0;

    while (true) {
        size_t dot = ip.find('.', pos);
        std::string part = ip.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        if (part.empty()) {
            return false;
        }

        int value = 0;
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
            value = value * 10 + (c - '0');
            if (value > 255) {
                return false;
            }
        }

        if (groups > 0) {
            out += '.';
        }
        out += std::to_string(value);
        ++groups;
        if (groups > 4) {
            return false;
        }
        if (dot == std::string::npos) {
            break;
        }
        pos = dot + 1;
    }

    if (groups != 4) {
        return false;
    }
    canonical = out;
    return true;
}

bool is_valid_ipv4(const std::string& ip) {
    std::string unused;
    return parse_ipv4(ip, unused);
}

std::string normalize_pin(const std::string& raw) {
    std::string pin = trim(raw);
    std::transform(pin.begin(), pin.end(), pin.begin(),
                   [](unsigned char c){ return (char)std::toupper(c); });
    return pin;
}

bool is_valid_pin(const std::string& pin) {
    if (pin.size() != 6) {
        return false;
    }
    return std::all_of(pin.begin(), pin.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}
