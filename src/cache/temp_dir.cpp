#include "cache/temp_dir.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace tabfetch {

std::string temp_root() {
    const char* env = std::getenv("TEMP_DIR");
    if (env && *env) {
        return env;
    }
    return fs::temp_directory_path().string();
}

TempDir::TempDir(const std::string& folder, bool delete_on_success, bool delete_on_failure)
    : delete_on_success_(delete_on_success)
    , delete_on_failure_(delete_on_failure)
    , uncaught_at_entry_(std::uncaught_exceptions())
{
    std::string name = folder;
    if (name.empty()) {
        std::mt19937_64 rng(static_cast<std::uint64_t>(
            std::chrono::steady_clock::now().time_since_epoch().count()));
        std::ostringstream oss;
        oss << "tabfetch-" << std::hex << rng();
        name = oss.str();
    }
    path_ = (fs::path(temp_root()) / name).string();

    std::error_code ec;
    fs::create_directories(path_, ec);
    if (ec) {
        throw TabfetchError("Failed to create temporary folder " + path_ + ": " + ec.message());
    }
}

TempDir::~TempDir() {
    bool failing = std::uncaught_exceptions() > uncaught_at_entry_;
    if ((failing && !delete_on_failure_) || (!failing && !delete_on_success_)) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        Logger::get_instance().log_warning("Failed to remove temporary folder",
                                           {{"path", path_}, {"error", ec.message()}});
    }
}

} // namespace tabfetch
