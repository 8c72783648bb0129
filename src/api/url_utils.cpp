#include "api/url_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace tabfetch {

namespace {

std::string basename_of(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string dirname_of(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

UrlParts split_url(const std::string& url) {
    UrlParts parts;
    std::string rest = url;

    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        parts.fragment = rest.substr(hash + 1);
        rest.erase(hash);
    }

    size_t question = rest.find('?');
    if (question != std::string::npos) {
        parts.query = rest.substr(question + 1);
        rest.erase(question);
    }

    if (has_scheme(rest)) {
        size_t colon = rest.find(':');
        parts.scheme = rest.substr(0, colon);
        rest.erase(0, colon + 1);
    }

    if (rest.compare(0, 2, "//") == 0) {
        size_t path_start = rest.find('/', 2);
        if (path_start == std::string::npos) {
            parts.authority = rest.substr(2);
            rest.clear();
        } else {
            parts.authority = rest.substr(2, path_start - 2);
            rest.erase(0, path_start);
        }
    }

    parts.path = rest;
    return parts;
}

std::string join_url(const UrlParts& parts) {
    std::string url;
    if (!parts.scheme.empty()) {
        url += parts.scheme + ":";
    }
    if (!parts.authority.empty() || parts.scheme == "file") {
        url += "//" + parts.authority;
    }
    url += parts.path;
    if (!parts.query.empty()) {
        url += "?" + parts.query;
    }
    if (!parts.fragment.empty()) {
        url += "#" + parts.fragment;
    }
    return url;
}

std::string url_encode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string url_decode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%' && i + 2 < value.size()) {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi < 0 || lo < 0) {
                result += c;
                continue;
            }
            result += static_cast<char>(hi * 16 + lo);
            i += 2;
        } else {
            result += c;
        }
    }
    return result;
}

QueryParams parse_query(const std::string& query) {
    QueryParams params;
    std::stringstream ss(query);
    std::string pair;
    while (std::getline(ss, pair, '&')) {
        if (pair.empty()) {
            continue;
        }
        size_t eq = pair.find('=');
        std::string key = url_decode(pair.substr(0, eq));
        std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
        if (key.empty()) {
            continue;
        }
        set_param(params, key, value);
    }
    return params;
}

std::string encode_query(const QueryParams& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += url_encode(key) + "=" + url_encode(value);
    }
    return query;
}

std::string url_for_get(const std::string& url, const QueryParams& params) {
    UrlParts parts = split_url(url);
    QueryParams merged = parse_query(parts.query);
    for (const auto& [key, value] : params) {
        set_param(merged, key, value);
    }
    parts.query = encode_query(merged);
    return join_url(parts);
}

std::pair<std::string, QueryParams> url_params_for_post(const std::string& url,
                                                        const QueryParams& params) {
    UrlParts parts = split_url(url);
    QueryParams merged = parse_query(parts.query);
    for (const auto& [key, value] : params) {
        set_param(merged, key, value);
    }
    parts.query.clear();
    return {join_url(parts), merged};
}

bool has_scheme(const std::string& url) {
    size_t colon = url.find(':');
    if (colon == std::string::npos || colon < 2) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(url[0]))) {
        return false;
    }
    for (size_t i = 1; i < colon; ++i) {
        unsigned char c = static_cast<unsigned char>(url[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

std::optional<std::string> file_url_path(const std::string& url) {
    if (!has_scheme(url)) {
        return std::nullopt;
    }
    UrlParts parts = split_url(url);
    std::string scheme = parts.scheme;
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "file") {
        return std::nullopt;
    }
    if (!parts.authority.empty() && parts.authority != "localhost") {
        return std::nullopt;
    }

    // '+' is literal in a path
    std::string path;
    for (char c : parts.path) {
        path += c == '+' ? std::string("%2B") : std::string(1, c);
    }
    return url_decode(path);
}

std::string slugify(const std::string& value) {
    std::string slug;
    bool pending_dash = false;
    for (unsigned char c : value) {
        if (std::isalnum(c)) {
            if (pending_dash && !slug.empty()) {
                slug += '-';
            }
            pending_dash = false;
            slug += static_cast<char>(std::tolower(c));
        } else {
            pending_dash = true;
        }
    }
    return slug;
}

std::string filename_from_url(const std::string& url) {
    UrlParts parts = split_url(url_decode(url));
    std::string filename = basename_of(parts.path);
    if (filename.empty()) {
        filename = slugify(parts.query);
    }
    if (filename.empty()) {
        filename = basename_of(dirname_of(parts.path));
    }
    return filename;
}

std::string truncate_for_log(const std::string& url, std::size_t max_length) {
    if (url.size() <= max_length) {
        return url;
    }
    return url.substr(0, max_length) + "...";
}

} // namespace tabfetch
