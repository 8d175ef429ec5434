#include "core/types/Endpoint.hpp"

namespace ftpprobe::core {

std::string protocolToString(Protocol protocol) {
    switch (protocol) {
    case Protocol::Ftp:
        return "FTP";
    case Protocol::Sftp:
        return "SFTP";
    }
    return "Unknown";
}

std::optional<Protocol> protocolFromId(int id) {
    switch (id) {
    case 0:
        return Protocol::Ftp;
    case 1:
        return Protocol::Sftp;
    default:
        return std::nullopt;
    }
}

uint16_t defaultPort(Protocol protocol) {
    return protocol == Protocol::Sftp ? 22 : 21;
}

} // namespace ftpprobe::core
