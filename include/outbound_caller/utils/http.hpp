#pragma once

#include <string>

namespace outbound_caller::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

std::string join_path(const std::string& base_path, const std::string& path);

// http(s):// becomes ws(s)://; a bare host gets ws://.
std::string to_ws_url(const std::string& base_url);

}
