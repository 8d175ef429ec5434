#include "core/types/ProbeResult.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ftpprobe::core {

ProbeResult ProbeResult::forDescriptor(const ProbeDescriptor& descriptor) {
    ProbeResult result;
    result.host = descriptor.endpoint.host;
    result.port = descriptor.endpoint.port;
    result.protocol = descriptor.endpoint.protocol;
    result.username = descriptor.credential.username;
    result.password = descriptor.credential.password;
    result.timestamp = std::chrono::system_clock::now();
    return result;
}

ProbeResult ProbeResult::failure(const ProbeDescriptor& descriptor, const std::string& error) {
    auto result = forDescriptor(descriptor);
    result.errors.push_back(error);
    return result;
}

std::string ProbeResult::pathTypeToString(PathType type) {
    switch (type) {
    case PathType::File:
        return "file";
    case PathType::Directory:
        return "directory";
    case PathType::Unknown:
        return "unknown";
    }
    return "unknown";
}

double roundedMilliseconds(std::chrono::steady_clock::duration duration) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(duration).count();
    return std::round(static_cast<double>(us) / 10.0) / 100.0;
}

std::string formatIsoTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                      tp.time_since_epoch() % std::chrono::seconds(1))
                      .count();
    if (micros < 0) {
        micros += 1000000;
    }

    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
        << micros;
    return out.str();
}

} // namespace ftpprobe::core
