#pragma once

#include <cstdint>
#include <string>

#include <rcs/core/config.hpp>
#include <rcs/core/error.hpp>
#include <rcs/core/logger.hpp>

namespace rcs::ft {

enum class ImageResizeOption {
    ALWAYS_PERFORM = 0,
    ONLY_ABOVE_MAX_SIZE = 1,
    ASK = 2
};

std::string imageResizeOptionToString(ImageResizeOption option);
core::Result<ImageResizeOption> imageResizeOptionFromInt(int64_t value);

struct FileTransferServiceConfiguration {
    // Bytes; 0 means no limit
    uint64_t max_size = 0;
    uint64_t warn_size = 0;
    // Concurrent transfers; 0 means no limit
    uint32_t max_sessions = 0;
    bool auto_accept_mode_changeable = true;
    bool auto_accept = false;
    bool auto_accept_in_roaming = false;
    ImageResizeOption image_resize_option = ImageResizeOption::ONLY_ABOVE_MAX_SIZE;
    bool file_icon_supported = true;
};

// Reads and writes the "ft" and "log" sections of the configuration tree.
// Missing keys keep their defaults, wrongly typed keys are InvalidData.
class FileTransferSettings {
public:
    static core::Result<FileTransferServiceConfiguration> load(const core::Config& config);
    static void save(core::Config& config, const FileTransferServiceConfiguration& settings);

    static core::Result<core::LogLevel> loadLogLevel(const core::Config& config);
};

} // namespace rcs::ft
