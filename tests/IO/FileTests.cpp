#include <BENC/IO/File.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

namespace
{
    std::filesystem::path WriteTempFile(const char* name, const std::string& contents)
    {
        const auto    path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << contents;
        return path;
    }
}// namespace

TEST_CASE("File reads whole contents", "[IO][File]")
{
    const std::string contents = "d8:announce3:urle";
    const auto        path     = WriteTempFile("benc_file_read_all.torrent", contents);

    BENC::IO::File file;
    REQUIRE(file.Open(path.string()).HasValue());
    REQUIRE(file.IsOpen());

    auto size = file.Size();
    REQUIRE(size.HasValue());
    CHECK(size.ValueUnsafe() == contents.size());

    auto data = file.ReadAll();
    REQUIRE(data.HasValue());
    REQUIRE(data.ValueUnsafe().size() == contents.size());
    CHECK(static_cast<char>(data.ValueUnsafe()[0]) == 'd');

    file.Close();
    CHECK_FALSE(file.IsOpen());
    std::filesystem::remove(path);
}

TEST_CASE("File enforces the ReadAll size limit", "[IO][File]")
{
    const auto path = WriteTempFile("benc_file_limit.torrent", std::string(64, 'x'));

    BENC::IO::File file;
    REQUIRE(file.Open(path.string()).HasValue());
    auto limited = file.ReadAll(16);
    REQUIRE_FALSE(limited.HasValue());
    CHECK(limited.ErrorUnsafe().code == BENC::IO::IOErrorCode::InvalidArgument);

    file.Close();
    std::filesystem::remove(path);
}

TEST_CASE("File reports open failures and closed handles", "[IO][File]")
{
    BENC::IO::File file;
    auto           missing = file.Open("/nonexistent/benc/file.torrent");
    REQUIRE_FALSE(missing.HasValue());
    CHECK(missing.ErrorUnsafe().code == BENC::IO::IOErrorCode::SystemError);
    CHECK(missing.ErrorUnsafe().systemCode != 0);

    auto empty = file.Open("");
    REQUIRE_FALSE(empty.HasValue());
    CHECK(empty.ErrorUnsafe().code == BENC::IO::IOErrorCode::InvalidArgument);

    auto size = file.Size();
    REQUIRE_FALSE(size.HasValue());
    CHECK(size.ErrorUnsafe().code == BENC::IO::IOErrorCode::InvalidArgument);
    CHECK(BENC::IO::ToString(size.ErrorUnsafe().code) == "InvalidArgument");
}
