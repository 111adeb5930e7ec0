/**
 * @file json_io.cpp
 * @brief Reading and writing JSON documents on disk
 */

#include "jsonassert/json_io.hpp"

#include <exception>
#include <fstream>
#include <string>

namespace jsonassert::common {

Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("ParseError",
                        "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

VoidResult write_text_file(const std::filesystem::path& path, std::string_view text)
{
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << text;
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace jsonassert::common
