// SPDX-License-Identifier: MIT
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "error.hpp"
#include "gzip.hpp"
#include "testenv.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <random>

class Gzip : public TempDir {
protected:
    /** Compress file, expect failure of specified type. */
    void expect_failure(const std::filesystem::path& src,
                        const std::filesystem::path& dst,
                        const CompressError::Kind kind)
    {
        try {
            gzip_file(src, dst, log);
            FAIL() << "no exception";
        } catch (const CompressError& e) {
            EXPECT_EQ(e.kind(), kind);
            EXPECT_NE(e.code(), 0);
        }
    }

    std::ostringstream out;
    Log log { out };
};

TEST_F(Gzip, Text)
{
    const std::string content = "a,b\n1,2\n";
    write_file(root / "in.csv", content);

    gzip_file(root / "in.csv", root / "in.csv.gz", log);
    EXPECT_EQ(gunzip(root / "in.csv.gz"), content);

    // gzip magic
    std::ifstream in(root / "in.csv.gz", std::ios::binary);
    unsigned char magic[2] = {};
    in.read(reinterpret_cast<char*>(magic), sizeof(magic));
    EXPECT_EQ(magic[0], 0x1f);
    EXPECT_EQ(magic[1], 0x8b);
}

TEST_F(Gzip, Empty)
{
    write_file(root / "empty", "");
    gzip_file(root / "empty", root / "empty.gz", log);
    EXPECT_TRUE(std::filesystem::exists(root / "empty.gz"));
    EXPECT_TRUE(gunzip(root / "empty.gz").empty());
}

TEST_F(Gzip, Large)
{
    // larger than copy buffer, not aligned to its size
    std::string content(GZIP_BUFFER_SIZE * 5 + 123, '\0');
    std::mt19937 rnd(42);
    for (auto& it : content) {
        it = static_cast<char>(rnd() & 0x3f);
    }
    write_file(root / "large.bin", content);

    gzip_file(root / "large.bin", root / "large.bin.gz", log);
    EXPECT_EQ(gunzip(root / "large.bin.gz"), content);
    EXPECT_LT(std::filesystem::file_size(root / "large.bin.gz"),
              content.size());
}

TEST_F(Gzip, Overwrite)
{
    write_file(root / "src", "first version, longer than the second one");
    gzip_file(root / "src", root / "src.gz", log);

    write_file(root / "src", "second");
    gzip_file(root / "src", root / "src.gz", log);
    EXPECT_EQ(gunzip(root / "src.gz"), "second");
}

TEST_F(Gzip, SourceMissing)
{
    expect_failure(root / "missing", root / "missing.gz",
                   CompressError::Kind::SourceUnreadable);
    EXPECT_FALSE(std::filesystem::exists(root / "missing.gz"));
}

TEST_F(Gzip, SourceDirectory)
{
    std::filesystem::create_directory(root / "dir");
    expect_failure(root / "dir", root / "dir.gz",
                   CompressError::Kind::SourceUnreadable);
    EXPECT_FALSE(std::filesystem::exists(root / "dir.gz"));
}

TEST_F(Gzip, SourceFifo)
{
    // no writer on the other side, open must not block
    ASSERT_EQ(mkfifo((root / "pipe").c_str(), 0644), 0);
    expect_failure(root / "pipe", root / "pipe.gz",
                   CompressError::Kind::SourceUnreadable);
    EXPECT_FALSE(std::filesystem::exists(root / "pipe.gz"));
}

TEST_F(Gzip, DestinationUnwritable)
{
    write_file(root / "src", "data");
    expect_failure(root / "src", root / "no" / "such" / "dir.gz",
                   CompressError::Kind::DestinationWriteFailed);

    std::filesystem::create_directory(root / "taken.gz");
    expect_failure(root / "src", root / "taken.gz",
                   CompressError::Kind::DestinationWriteFailed);
}

TEST_F(Gzip, DestinationFull)
{
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full is not available";
    }
    // compressed data of random content does not fit in gzip buffers
    std::string content(GZIP_BUFFER_SIZE * 4, '\0');
    std::mt19937 rnd(1);
    for (auto& it : content) {
        it = static_cast<char>(rnd());
    }
    write_file(root / "src", content);

    expect_failure(root / "src", "/dev/full",
                   CompressError::Kind::DestinationWriteFailed);
    EXPECT_NE(out.str().find("Partial file \"/dev/full\" left in target"),
              std::string::npos);
}

TEST_F(Gzip, DirectorySyncFailure)
{
    if (geteuid() == 0) {
        GTEST_SKIP() << "permissions are not checked for root";
    }
    write_file(root / "src", "data");
    std::filesystem::create_directory(root / "dst");
    // directory can be written to but can not be opened for sync
    std::filesystem::permissions(root / "dst",
                                 std::filesystem::perms::owner_write |
                                     std::filesystem::perms::owner_exec);

    expect_failure(root / "src", root / "dst" / "src.gz",
                   CompressError::Kind::DestinationWriteFailed);
    const std::string partial =
        std::format("Partial file \"{}\" left in target",
                    (root / "dst" / "src.gz").string());
    EXPECT_NE(out.str().find(partial), std::string::npos);

    std::filesystem::permissions(root / "dst",
                                 std::filesystem::perms::owner_all);
}
