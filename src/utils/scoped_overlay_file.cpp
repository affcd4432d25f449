/**
 * @file scoped_overlay_file.cpp
 * @brief RAII compose override file
 *
 * @date 2025
 */

#include "redock/utils/scoped_overlay_file.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <unistd.h>

namespace redock {
namespace utils {

ScopedOverlayFile::ScopedOverlayFile(const std::string& service, const std::string& image) {
    auto pattern = (std::filesystem::temp_directory_path() / "redock-override-XXXXXX.yml").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemps(buffer.data(), 4);
    if (fd < 0) {
        throw std::runtime_error(std::string("Failed to create compose override file: ") +
                                 std::strerror(errno));
    }
    path_ = buffer.data();

    const std::string body = Render(service, image);
    std::size_t written = 0;
    while (written < body.size()) {
        ssize_t n = write(fd, body.data() + written, body.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            const std::string error = std::strerror(errno);
            close(fd);
            std::error_code ec;
            std::filesystem::remove(path_, ec);
            throw std::runtime_error("Failed to write compose override file: " + error);
        }
        written += static_cast<std::size_t>(n);
    }
    close(fd);

    spdlog::debug("Compose override {} pins {} to {}", path_.string(), service, image);
}

ScopedOverlayFile::~ScopedOverlayFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove compose override {}: {}", path_.string(), ec.message());
    }
}

std::string ScopedOverlayFile::Render(const std::string& service, const std::string& image) {
    // Compose reads JSON as YAML
    nlohmann::json overlay;
    overlay["services"][service]["image"] = image;
    return overlay.dump(2) + "\n";
}

} // namespace utils
} // namespace redock
