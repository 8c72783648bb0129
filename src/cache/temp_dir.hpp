/**
 * @file temp_dir.hpp
 * @brief Temporary directory resolution and scoped temporary folders
 */

#ifndef TABFETCH_CACHE_TEMP_DIR_HPP
#define TABFETCH_CACHE_TEMP_DIR_HPP

#include <string>

namespace tabfetch {

/**
 * @brief Root for temporary files: TEMP_DIR if set, else the system temp directory
 */
std::string temp_root();

/**
 * @brief Folder under temp_root(), created on construction and removed on destruction
 *
 * With delete_on_success false the folder is kept when the scope exits
 * normally; with delete_on_failure false it is kept when the scope exits
 * through an exception.
 */
class TempDir {
public:
    /**
     * @param folder Name under temp_root(); empty picks a unique name
     * @param delete_on_success Remove the folder on normal scope exit
     * @param delete_on_failure Remove the folder on exit through an exception
     */
    explicit TempDir(const std::string& folder = "", bool delete_on_success = true,
                     bool delete_on_failure = true);
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    bool delete_on_success_;
    bool delete_on_failure_;
    int uncaught_at_entry_;
};

} // namespace tabfetch

#endif // TABFETCH_CACHE_TEMP_DIR_HPP
