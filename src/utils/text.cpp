#include "outbound_caller/utils/text.hpp"

#include <algorithm>
#include <cctype>

namespace outbound_caller::utils {

namespace {

bool is_separator(unsigned char ch) {
    return std::isspace(ch) || ch == '-' || ch == '.' || ch == '(' || ch == ')';
}

bool is_dtmf(unsigned char ch) {
    return ch == 'w' || ch == 'W' || ch == 'p' || ch == 'P' || ch == '*' || ch == '#';
}

}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::string normalize_text(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());
    bool in_space = false;
    for (unsigned char ch : text) {
        if (std::isspace(ch)) {
            if (!in_space) {
                normalized.push_back(' ');
                in_space = true;
            }
        } else {
            normalized.push_back(static_cast<char>(std::tolower(ch)));
            in_space = false;
        }
    }
    if (!normalized.empty() && normalized.front() == ' ') {
        normalized.erase(normalized.begin());
    }
    if (!normalized.empty() && normalized.back() == ' ') {
        normalized.pop_back();
    }
    return normalized;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += separator;
        }
        result += item;
    }
    return result;
}

std::string normalize_phone_number(const std::string& raw) {
    const auto value = trim(raw);
    std::string result;
    result.reserve(value.size());
    size_t digits = 0;
    for (unsigned char ch : value) {
        if (is_separator(ch)) {
            continue;
        }
        if (ch == '+') {
            if (!result.empty()) {
                return "";
            }
            result.push_back('+');
            continue;
        }
        if (std::isdigit(ch)) {
            result.push_back(static_cast<char>(ch));
            ++digits;
            continue;
        }
        if (is_dtmf(ch) && digits > 0) {
            result.push_back(static_cast<char>(std::tolower(ch)));
            continue;
        }
        return "";
    }
    if (digits < 3) {
        return "";
    }
    return result;
}

}
