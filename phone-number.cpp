#include "phone-number.h"
#include <cctype>

static const char kTelPrefix[] = "tel:";
static const size_t kTelPrefixLen = 4;

bool is_tel_uri(const std::string& text) {
    if (text.size() < kTelPrefixLen) return false;
    for (size_t i = 0; i < kTelPrefixLen; ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != kTelPrefix[i]) return false;
    }
    return true;
}

std::string normalize_tel_uri(const std::string& uri) {
    if (!is_tel_uri(uri)) return "";

    std::string number;
    number.reserve(uri.size() - kTelPrefixLen);
    for (size_t i = kTelPrefixLen; i < uri.size(); ++i) {
        char c = uri[i];
        if (c == '-' || c == ' ' || c == '(' || c == ')') continue;
        number.push_back(c);
    }
    return number;
}
