#pragma once

/**
 * @file json_io.hpp
 * @brief Reading and writing JSON documents on disk
 */

#include "jsonassert/common.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace jsonassert::common {

/**
 * Read and parse a JSON file
 * @return Parsed document, IOError or ParseError
 */
[[nodiscard]] Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Write text as-is
 */
[[nodiscard]] VoidResult write_text_file(const std::filesystem::path& path, std::string_view text);

}  // namespace jsonassert::common
