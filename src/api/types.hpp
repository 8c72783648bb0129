#ifndef TABFETCH_API_TYPES_HPP
#define TABFETCH_API_TYPES_HPP

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tabfetch {

/**
 * @brief Ordered query/form parameters (order is preserved on the wire)
 */
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief ASCII case-insensitive ordering for HTTP header names
 */
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) {
                return std::tolower(x) < std::tolower(y);
            });
    }
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

/**
 * @brief Set or replace a parameter, keeping its original position if present
 */
inline void set_param(QueryParams& params, const std::string& key, const std::string& value) {
    for (auto& [k, v] : params) {
        if (k == key) {
            v = value;
            return;
        }
    }
    params.emplace_back(key, value);
}

inline bool is_success_status(long status) {
    return status >= 200 && status < 300;
}

} // namespace tabfetch

#endif // TABFETCH_API_TYPES_HPP
