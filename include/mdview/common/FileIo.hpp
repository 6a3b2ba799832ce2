#pragma once

#include <expected>
#include <filesystem>
#include <istream>
#include <string>

namespace mdview::common {

/// Reads `in` to end of stream. A read error part way through (including one
/// the streambuf throws) is reported instead of returning truncated data.
std::expected<std::string, std::string> readStream(std::istream& in);

/// Opens and reads a whole file. Directories and unreadable files are errors.
std::expected<std::string, std::string> readFile(const std::filesystem::path& path);

}  // namespace mdview::common
