#ifndef REQ_PROBE_STRING_UTILS_HPP
#define REQ_PROBE_STRING_UTILS_HPP

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool starts_with_any(std::string_view sv, std::initializer_list<std::string_view> prefixes);

    std::string trim(std::string s);

    std::string to_upper(std::string s);

    std::vector<std::string> split(std::string_view sv, char delimiter);
}  // namespace string_utils

#endif
