// SPDX-License-Identifier: MIT
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <gtest/gtest.h>
#include <unistd.h>
#include <zlib.h>

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <thread>

/** Test fixture with temporary directory. */
class TempDir : public ::testing::Test {
protected:
    void SetUp() override
    {
        const ::testing::TestInfo* info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        root = std::filesystem::temp_directory_path() /
            std::format("files2gz_{}_{}_{}", info->test_suite_name(),
                        info->name(), getpid());
        std::filesystem::remove_all(root);
        ASSERT_TRUE(std::filesystem::create_directories(root));
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    /** Create file with specified content, including parent directories. */
    static void write_file(const std::filesystem::path& path,
                           const std::string& content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    /** Read and decompress gzip file. */
    static std::string gunzip(const std::filesystem::path& path)
    {
        std::string data;
        gzFile gz = gzopen(path.c_str(), "rb");
        if (!gz) {
            return data;
        }
        char buf[4096];
        int len;
        while ((len = gzread(gz, buf, sizeof(buf))) > 0) {
            data.append(buf, static_cast<size_t>(len));
        }
        gzclose(gz);
        return data;
    }

    /** Wait for condition with timeout. */
    static bool wait_for(const std::function<bool()>& cond,
                         const std::chrono::milliseconds timeout =
                             std::chrono::seconds(10))
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!cond()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return true;
    }

    std::filesystem::path root;
};
