#pragma once

#include <string>

// "tel:" prefix test, case-insensitive
bool is_tel_uri(const std::string& text);

// Strips the 4-character "tel:" prefix and removes '-', ' ', '(' and ')'.
// Digits and a leading '+' are kept. Returns empty for non-tel input.
std::string normalize_tel_uri(const std::string& uri);
