#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool starts_with_any(std::string_view sv, std::initializer_list<std::string_view> prefixes) {
        return std::ranges::any_of(prefixes, [sv](std::string_view prefix) { return sv.starts_with(prefix); });
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string to_upper(std::string s) {
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    // Keeps empty tokens; callers decide what an empty piece means.
    std::vector<std::string> split(std::string_view sv, char delimiter) {
        std::vector<std::string> out;
        size_t start = 0;
        for (;;) {
            size_t pos = sv.find(delimiter, start);
            size_t end = (pos == std::string_view::npos) ? sv.size() : pos;

            out.emplace_back(sv.substr(start, end - start));

            if (pos == std::string_view::npos) {
                break;
            }

            start = pos + 1;
        }
        return out;
    }
}  // namespace string_utils
