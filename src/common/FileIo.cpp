#include "mdview/common/FileIo.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>

namespace mdview::common {

std::expected<std::string, std::string> readStream(std::istream& in) {
    std::string content;
    std::array<char, 64 * 1024> buffer{};

    // istream::read goes through the sentry, which turns a throwing underflow
    // into badbit instead of letting the exception escape.
    while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || in.gcount() > 0) {
        content.append(buffer.data(), static_cast<size_t>(in.gcount()));
        if (in.eof()) {
            break;
        }
    }
    if (in.bad()) {
        return std::unexpected(std::format("read error after {} bytes", content.size()));
    }
    return content;
}

std::expected<std::string, std::string> readFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return std::unexpected(std::format("'{}' is a directory", path.string()));
    }

    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        const int openErrno = errno;
        return std::unexpected(openErrno != 0
                                   ? std::format("Failed to open '{}': {}", path.string(), std::strerror(openErrno))
                                   : std::format("Failed to open '{}'", path.string()));
    }

    auto content = readStream(in);
    if (!content.has_value()) {
        return std::unexpected(std::format("Failed while reading '{}': {}", path.string(), content.error()));
    }
    return content;
}

}  // namespace mdview::common
