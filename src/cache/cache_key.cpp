#include "cache/cache_key.hpp"
#include "api/url_utils.hpp"
#include "cache/temp_dir.hpp"
#include "errors.hpp"
#include "io/content_hash.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace tabfetch {

std::pair<std::string, std::string> CacheKey::split_extension(const std::string& filename) {
    size_t dot = filename.find_last_of('.');
    // A leading dot marks a hidden file, not an extension
    if (dot == std::string::npos || dot == 0) {
        return {filename, ""};
    }
    return {filename.substr(0, dot), filename.substr(dot)};
}

std::string CacheKey::derived_filename(const std::string& url) {
    std::string base = filename_from_url(url);
    if (base.empty()) {
        base = "download";
    }
    auto [stem, extension] = split_extension(base);

    Md5Hasher hasher;
    hasher.update(url);
    return stem + "_" + hasher.hex_digest().substr(0, kUrlHashLength) + extension;
}

std::string CacheKey::path(const std::string& root, const std::string& url, const std::string& filename) {
    std::string name = filename.empty() ? derived_filename(url) : filename;
    return (fs::path(root) / name).string();
}

std::string CacheKey::unique_path_for_url(const std::string& url, const std::string& folder,
                                          const std::string& filename, const std::string& path,
                                          bool overwrite) {
    std::string target_folder = folder;
    std::string target_name = filename;
    if (!path.empty()) {
        if (!folder.empty() || !filename.empty()) {
            throw ConfigurationError("Cannot use folder or filename and path arguments together");
        }
        fs::path p(path);
        target_folder = p.parent_path().string();
        target_name = p.filename().string();
    }
    if (target_name.empty()) {
        target_name = filename_from_url(url);
    }
    if (target_folder.empty()) {
        target_folder = temp_root();
    }

    auto [stem, extension] = split_extension(target_name);
    fs::path result = fs::path(target_folder) / target_name;

    if (overwrite) {
        std::error_code ec;
        fs::remove(result, ec);
        if (ec) {
            throw TabfetchError("Cannot remove existing file " + result.string() + ": " + ec.message());
        }
    } else {
        int count = 0;
        while (fs::exists(result)) {
            ++count;
            result = fs::path(target_folder) / (stem + std::to_string(count) + extension);
        }
    }
    return result.string();
}

} // namespace tabfetch
