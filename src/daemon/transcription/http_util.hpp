#pragma once

#include <cstddef>
#include <string>

namespace http {

// libcurl write callback appending into a std::string passed as userdata.
inline size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

inline std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

} // namespace http
