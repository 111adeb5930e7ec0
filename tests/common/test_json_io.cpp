/**
 * @file test_json_io.cpp
 * @brief Tests for JSON file reading and writing
 */

#include "jsonassert/json_io.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace {

namespace fs = std::filesystem;

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

[[nodiscard]] std::string read_text(const fs::path& path)
{
    std::ifstream in(path);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

TEST(JsonIo, WriteThenRead)
{
    TempDir temp("jsonassert_json_io_roundtrip");
    const auto file = temp.path() / "doc.json";
    const auto payload = nlohmann::json::parse(R"({"b": [1, 2], "a": null})");

    auto written = jsonassert::common::write_text_file(file, payload.dump(2) + "\n");
    ASSERT_TRUE(written.has_value()) << written.error().message;
    EXPECT_EQ(read_text(file).back(), '\n');

    auto read = jsonassert::common::read_json_file(file);
    ASSERT_TRUE(read.has_value()) << read.error().message;
    EXPECT_EQ(*read, payload);
}

TEST(JsonIo, MissingFileIsIoError)
{
    TempDir temp("jsonassert_json_io_missing");
    auto read = jsonassert::common::read_json_file(temp.path() / "absent.json");
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code, "IOError");
}

TEST(JsonIo, MalformedFileIsParseError)
{
    TempDir temp("jsonassert_json_io_malformed");
    const auto file = temp.path() / "bad.json";
    auto written = jsonassert::common::write_text_file(file, "{\"a\": ");
    ASSERT_TRUE(written.has_value());

    auto read = jsonassert::common::read_json_file(file);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code, "ParseError");
}

TEST(JsonIo, UnwritableDirectoryIsIoError)
{
    TempDir temp("jsonassert_json_io_unwritable");
    auto written = jsonassert::common::write_text_file(temp.path() / "no" / "such" / "file.txt", "x");
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, "IOError");
}

}  // namespace
