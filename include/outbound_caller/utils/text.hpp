#pragma once

#include <string>
#include <vector>

namespace outbound_caller::utils {

std::string trim(std::string value);
std::string normalize_text(const std::string& text);
std::string join(const std::vector<std::string>& items, const std::string& separator);

// Strips visual separators from a dial string. Returns an empty string when the
// result is not a dialable number: an optional leading '+', at least three digits,
// and DTMF characters ('w', 'p', '*', '#') only after the first digit.
std::string normalize_phone_number(const std::string& raw);

}
