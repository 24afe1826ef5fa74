// SPDX-License-Identifier: MIT
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "fsmonitor.hpp"
#include "testenv.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <mutex>
#include <vector>

using namespace std::chrono_literals;

class FsMonitorTest : public TempDir {
protected:
    void SetUp() override
    {
        TempDir::SetUp();
        src = std::filesystem::canonical(root);
        outside = src.parent_path() / (src.filename().string() + "_outside");
        std::filesystem::remove_all(outside);
        std::filesystem::create_directory(outside);
    }

    void TearDown() override
    {
        monitor.unsubscribe();
        std::filesystem::remove_all(outside);
        TempDir::TearDown();
    }

    /** Start monitoring the root directory. */
    void start()
    {
        ASSERT_TRUE(monitor.subscribe(src, [this](const FileEvent& event) {
            std::lock_guard lock(mutex);
            events.push_back(event.path);
        }));
    }

    /** Get copy of received events. */
    std::vector<std::filesystem::path> received()
    {
        std::lock_guard lock(mutex);
        return events;
    }

    /** Wait for specified number of events. */
    bool wait_events(const size_t num)
    {
        return wait_for([this, num]() {
            return received().size() >= num;
        });
    }

    std::filesystem::path src;
    std::filesystem::path outside; ///< Directory beside the watched one
    std::ostringstream out;
    Log log { out };
    InotifyMonitor monitor { log };
    std::mutex mutex;
    std::vector<std::filesystem::path> events;
};

TEST_F(FsMonitorTest, CreateFile)
{
    start();
    write_file(src / "file.txt", "content");

    ASSERT_TRUE(wait_events(1));
    EXPECT_EQ(received()[0], src / "file.txt");
}

TEST_F(FsMonitorTest, ReportedAfterClose)
{
    start();

    const int fd =
        open((src / "slow").c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    ASSERT_NE(fd, -1);
    ASSERT_EQ(write(fd, "part", 4), 4);
    std::this_thread::sleep_for(200ms);
    EXPECT_TRUE(received().empty());

    close(fd);
    ASSERT_TRUE(wait_events(1));
    EXPECT_EQ(received()[0], src / "slow");
}

TEST_F(FsMonitorTest, ExistingSubdirectory)
{
    std::filesystem::create_directories(src / "a" / "b");
    start();

    write_file(src / "a" / "b" / "c.txt", "c");
    ASSERT_TRUE(wait_events(1));
    EXPECT_EQ(received()[0], src / "a" / "b" / "c.txt");
}

TEST_F(FsMonitorTest, NewSubdirectory)
{
    start();

    std::filesystem::create_directories(src / "x" / "y");
    std::this_thread::sleep_for(300ms);
    EXPECT_TRUE(received().empty()); // directories are not reported

    write_file(src / "x" / "y" / "z.txt", "z");
    ASSERT_TRUE(wait_events(1));
    EXPECT_EQ(received()[0], src / "x" / "y" / "z.txt");
}

TEST_F(FsMonitorTest, MovedInDirectory)
{
    write_file(outside / "in" / "moved.txt", "m");

    start();
    std::filesystem::rename(outside / "in", src / "in");

    ASSERT_TRUE(wait_events(1));
    EXPECT_EQ(received()[0], src / "in" / "moved.txt");
}

TEST_F(FsMonitorTest, MovedInDirectoryWithOpenFile)
{
    std::filesystem::create_directory(outside / "d");
    const int fd = open((outside / "d" / "f").c_str(),
                        O_WRONLY | O_CREAT | O_TRUNC, 0644);
    ASSERT_NE(fd, -1);
    ASSERT_EQ(write(fd, "part", 4), 4);

    start();
    std::filesystem::rename(outside / "d", src / "d");
    ASSERT_TRUE(wait_events(1));
    EXPECT_EQ(received()[0], src / "d" / "f");

    // complete file is reported once more
    ASSERT_EQ(write(fd, "rest", 4), 4);
    close(fd);
    ASSERT_TRUE(wait_events(2));
    EXPECT_EQ(received()[1], src / "d" / "f");
}

TEST_F(FsMonitorTest, MovedOutDirectory)
{
    std::filesystem::create_directories(src / "d");
    start();

    std::filesystem::rename(src / "d", outside / "d");
    write_file(outside / "d" / "late.txt", "late");
    write_file(src / "mark.txt", "mark");

    ASSERT_TRUE(wait_events(1));
    std::this_thread::sleep_for(200ms);
    ASSERT_EQ(received().size(), 1U);
    EXPECT_EQ(received()[0], src / "mark.txt");
}

TEST_F(FsMonitorTest, MovedInFile)
{
    write_file(outside / "file", "f");

    start();
    std::filesystem::rename(outside / "file", src / "file");

    ASSERT_TRUE(wait_events(1));
    EXPECT_EQ(received()[0], src / "file");
}

TEST_F(FsMonitorTest, MovedInFifo)
{
    ASSERT_EQ(mkfifo((outside / "pipe").c_str(), 0644), 0);

    start();
    std::filesystem::rename(outside / "pipe", src / "pipe");
    write_file(src / "mark.txt", "mark");

    ASSERT_TRUE(wait_events(1));
    std::this_thread::sleep_for(200ms);
    ASSERT_EQ(received().size(), 1U);
    EXPECT_EQ(received()[0], src / "mark.txt");
}

TEST_F(FsMonitorTest, HardLink)
{
    write_file(outside / "origin", "origin");

    start();
    std::filesystem::create_hard_link(outside / "origin", src / "link");

    ASSERT_TRUE(wait_events(1));
    EXPECT_EQ(received()[0], src / "link");
}

TEST_F(FsMonitorTest, Unsubscribe)
{
    start();
    monitor.unsubscribe();

    write_file(src / "late.txt", "late");
    std::this_thread::sleep_for(200ms);
    EXPECT_TRUE(received().empty());

    // monitor can be started again
    start();
    write_file(src / "again.txt", "again");
    ASSERT_TRUE(wait_events(1));
    EXPECT_EQ(received()[0], src / "again.txt");
}

TEST_F(FsMonitorTest, MissingRoot)
{
    EXPECT_FALSE(monitor.subscribe(src / "missing", [](const FileEvent&) {}));
    EXPECT_NE(out.str().find("Unable to add monitoring path"),
              std::string::npos);
}
