#pragma once

#include <cstdint>
#include <string>

namespace rcs::content {

enum class FileTransferProtocol {
    MSRP,
    HTTP
};

std::string protocolToString(FileTransferProtocol protocol);

// Descriptor of shared content: where it lives, its type and size
class MmContent {
public:
    MmContent() = default;
    MmContent(std::string uri, std::string encoding, uint64_t size, std::string name)
        : uri_(std::move(uri))
        , encoding_(std::move(encoding))
        , size_(size)
        , name_(std::move(name)) {}

    const std::string& getUri() const { return uri_; }
    const std::string& getEncoding() const { return encoding_; }
    uint64_t getSize() const { return size_; }
    const std::string& getName() const { return name_; }

    void setUri(const std::string& uri) { uri_ = uri; }

    bool isImage() const;

    bool operator==(const MmContent& other) const {
        return uri_ == other.uri_ && encoding_ == other.encoding_ &&
               size_ == other.size_ && name_ == other.name_;
    }

private:
    std::string uri_;
    std::string encoding_;
    uint64_t size_ = 0;
    std::string name_;
};

} // namespace rcs::content
