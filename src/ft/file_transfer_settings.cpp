#include "rcs/ft/file_transfer_settings.hpp"

namespace rcs::ft {

namespace {

constexpr const char* kSection = "ft";
constexpr const char* kLogSection = "log";

core::Result<uint64_t> readSize(const core::ConfigNode& node, const std::string& key, uint64_t fallback) {
    auto value = node.getOr<int64_t>(key, static_cast<int64_t>(fallback));
    if (value.is_error()) {
        return value.error();
    }
    if (value.value() < 0) {
        return {core::ErrorCode::InvalidData, "Negative value for " + key};
    }
    return static_cast<uint64_t>(value.value());
}

} // namespace

std::string imageResizeOptionToString(ImageResizeOption option) {
    switch (option) {
        case ImageResizeOption::ALWAYS_PERFORM: return "ALWAYS_PERFORM";
        case ImageResizeOption::ONLY_ABOVE_MAX_SIZE: return "ONLY_ABOVE_MAX_SIZE";
        case ImageResizeOption::ASK: return "ASK";
    }
    return "UNKNOWN";
}

core::Result<ImageResizeOption> imageResizeOptionFromInt(int64_t value) {
    switch (value) {
        case 0: return ImageResizeOption::ALWAYS_PERFORM;
        case 1: return ImageResizeOption::ONLY_ABOVE_MAX_SIZE;
        case 2: return ImageResizeOption::ASK;
        default:
            return {core::ErrorCode::InvalidArgument,
                    "Invalid image resize option: " + std::to_string(value)};
    }
}

core::Result<FileTransferServiceConfiguration> FileTransferSettings::load(const core::Config& config) {
    FileTransferServiceConfiguration settings;
    auto node = config.section(kSection);

    // Batas ukuran file
    auto max_size = readSize(*node, "maxSize", settings.max_size);
    if (max_size.is_error()) return max_size.error();
    settings.max_size = max_size.value();

    auto warn_size = readSize(*node, "warnSize", settings.warn_size);
    if (warn_size.is_error()) return warn_size.error();
    settings.warn_size = warn_size.value();

    auto max_sessions = readSize(*node, "maxSessions", settings.max_sessions);
    if (max_sessions.is_error()) return max_sessions.error();
    settings.max_sessions = static_cast<uint32_t>(max_sessions.value());

    // Auto accept flags
    auto changeable = node->getOr<bool>("autoAcceptModeChangeable", settings.auto_accept_mode_changeable);
    if (changeable.is_error()) return changeable.error();
    settings.auto_accept_mode_changeable = changeable.value();

    auto auto_accept = node->getOr<bool>("autoAccept", settings.auto_accept);
    if (auto_accept.is_error()) return auto_accept.error();
    settings.auto_accept = auto_accept.value();

    auto in_roaming = node->getOr<bool>("autoAcceptInRoaming", settings.auto_accept_in_roaming);
    if (in_roaming.is_error()) return in_roaming.error();
    settings.auto_accept_in_roaming = in_roaming.value();

    // Nilai di luar enum ditolak sebagai data invalid
    auto resize = node->getOr<int64_t>("imageResizeOption",
                                       static_cast<int64_t>(settings.image_resize_option));
    if (resize.is_error()) return resize.error();
    auto option = imageResizeOptionFromInt(resize.value());
    if (option.is_error()) {
        return core::Error(core::ErrorCode::InvalidData, option.error().what());
    }
    settings.image_resize_option = option.value();

    auto icon = node->getOr<bool>("fileIconSupported", settings.file_icon_supported);
    if (icon.is_error()) return icon.error();
    settings.file_icon_supported = icon.value();

    return settings;
}

void FileTransferSettings::save(core::Config& config, const FileTransferServiceConfiguration& settings) {
    auto node = config.root()->getOrCreateObject(kSection);
    node->set("maxSize", static_cast<int64_t>(settings.max_size));
    node->set("warnSize", static_cast<int64_t>(settings.warn_size));
    node->set("maxSessions", static_cast<int64_t>(settings.max_sessions));
    node->set("autoAcceptModeChangeable", settings.auto_accept_mode_changeable);
    node->set("autoAccept", settings.auto_accept);
    node->set("autoAcceptInRoaming", settings.auto_accept_in_roaming);
    node->set("imageResizeOption", static_cast<int64_t>(settings.image_resize_option));
    node->set("fileIconSupported", settings.file_icon_supported);
}

core::Result<core::LogLevel> FileTransferSettings::loadLogLevel(const core::Config& config) {
    auto level = config.section(kLogSection)->getOr<std::string>("level", "info");
    if (level.is_error()) {
        return level.error();
    }
    return core::Logger::levelFromString(level.value());
}

} // namespace rcs::ft
