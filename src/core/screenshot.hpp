#pragma once

#include <cstdint>
#include <string>
#include <filesystem>

namespace sgba {

// Writes core framebuffers to PNG files
class Screenshot {
public:
    // Pixels are packed 0xAABBGGRR (R in the low byte), top to bottom.
    // Returns true on success
    static bool save_png(const std::filesystem::path& path,
                         const uint32_t* pixels,
                         int width, int height);

    // Timestamped filename, e.g. supergba_20260101_120000_042.png
    static std::string generate_filename(const std::string& prefix = "supergba");
};

} // namespace sgba
