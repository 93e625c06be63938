#pragma once
#include <string>

// Four dot-separated decimal groups, each in [0,255]. On success
// 'canonical' gets the dotted quad without leading zeros ("010.0.0.5"
// becomes "10.0.0.5"); resolvers read a leading zero as octal.
bool parse_ipv4(const std::string& ip, std::string& canonical);

bool is_valid_ipv4(const std::string& ip);

// Trims surrounding whitespace and uppercases.
std::string normalize_pin(const std::string& raw);

// Exactly 6 characters over 0-9A-F, case-insensitive.
bool is_valid_pin(const std::string& pin);

std::string trim(const std::string& s);
