/**
 * @file scoped_overlay_file.hpp
 * @brief Temporary compose override file removed when it goes out of scope
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>

namespace redock {
namespace utils {

/**
 * @class ScopedOverlayFile
 * @brief Owns a compose override that pins one service's image
 *
 * The file is created in the system temp directory on construction and
 * deleted in the destructor, so every exit path (including exceptions)
 * releases it.
 *
 * @code
 * {
 *     ScopedOverlayFile overlay("web", "nginx:1.27");
 *     invocation.override_files.push_back(overlay.path().string());
 *     compose.Pull(invocation, "web");
 * }   // overlay removed here
 * @endcode
 */
class ScopedOverlayFile {
public:
    /**
     * @throws std::runtime_error if the file cannot be created or written
     */
    ScopedOverlayFile(const std::string& service, const std::string& image);
    ~ScopedOverlayFile();

    ScopedOverlayFile(const ScopedOverlayFile&) = delete;
    ScopedOverlayFile& operator=(const ScopedOverlayFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

    /// Override body (JSON, which compose accepts as YAML) for a service/image pair
    static std::string Render(const std::string& service, const std::string& image);

private:
    std::filesystem::path path_;
};

} // namespace utils
} // namespace redock
