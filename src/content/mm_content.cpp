#include <rcs/content/mm_content.hpp>

namespace rcs::content {

bool MmContent::isImage() const {
    return encoding_.rfind("image/", 0) == 0;
}

std::string protocolToString(FileTransferProtocol protocol) {
    switch (protocol) {
        case FileTransferProtocol::MSRP: return "MSRP";
        case FileTransferProtocol::HTTP: return "HTTP";
        default: return "UNKNOWN";
    }
}

} // namespace rcs::content
