// SPDX-License-Identifier: MIT
// Gzip file compression.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "gzip.hpp"

#include "error.hpp"
#include "fdevent.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <zlib.h>

#include <cerrno>
#include <cstdint>
#include <memory>
#include <vector>

using Kind = CompressError::Kind;

/**
 * Get error code of the last failed gzip operation.
 * @param gz gzip stream
 * @return system error code
 */
static int gz_errno(gzFile gz)
{
    int zerr = Z_OK;
    gzerror(gz, &zerr);
    if (zerr == Z_ERRNO && errno) {
        return errno;
    }
    return EIO;
}

/**
 * Flush directory entries to disk.
 * @param dir path to the directory
 * @return system error code, 0 on success
 */
static int sync_dir(const std::filesystem::path& dir)
{
    const Fd fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (!fd.valid()) {
        return errno;
    }
    if (fsync(fd) == -1 && errno != EINVAL) {
        return errno;
    }
    return 0;
}

/**
 * Read data from file.
 * @param fd file descriptor
 * @param buf destination buffer
 * @return number of bytes read, 0 on end of file, -1 on errors
 */
static ssize_t read_chunk(int fd, std::vector<uint8_t>& buf)
{
    ssize_t len;
    do {
        len = read(fd, buf.data(), buf.size());
    } while (len == -1 && errno == EINTR);
    return len;
}

void gzip_file(const std::filesystem::path& src,
               const std::filesystem::path& dst, Log& log)
{
    // open source, without blocking on fifos that have no writer
    const Fd in = open(src.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (!in.valid()) {
        throw CompressError(Kind::SourceUnreadable, src, errno);
    }
    struct stat st;
    if (fstat(in, &st) == -1) {
        throw CompressError(Kind::SourceUnreadable, src, errno);
    }
    if (!S_ISREG(st.st_mode)) {
        throw CompressError(Kind::SourceUnreadable, src,
                            S_ISDIR(st.st_mode) ? EISDIR : EINVAL);
    }

    // open destination, the gzip stream owns a duplicate of the descriptor
    const Fd out =
        open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (!out.valid()) {
        throw CompressError(Kind::DestinationWriteFailed, dst, errno);
    }

    auto partial = [&log, &dst](const Kind kind,
                                const std::filesystem::path& path, int code) {
        log.warning("Partial file \"{}\" left in target", dst.string());
        return CompressError(kind, path, code);
    };

    const int gz_fd = dup(out);
    if (gz_fd == -1) {
        throw partial(Kind::DestinationWriteFailed, dst, errno);
    }
    std::unique_ptr<gzFile_s, decltype(&gzclose)> gz(gzdopen(gz_fd, "wb"),
                                                     gzclose);
    if (!gz) {
        close(gz_fd);
        throw partial(Kind::DestinationWriteFailed, dst, ENOMEM);
    }

    // copy data
    std::vector<uint8_t> buffer(GZIP_BUFFER_SIZE);
    while (true) {
        const ssize_t len = read_chunk(in, buffer);
        if (len == 0) {
            break; // eof
        }
        if (len < 0) {
            throw partial(Kind::SourceUnreadable, src, errno);
        }
        if (gzwrite(gz.get(), buffer.data(), static_cast<unsigned>(len)) !=
            len) {
            throw partial(Kind::DestinationWriteFailed, dst,
                          gz_errno(gz.get()));
        }
    }

    // finish gzip stream and flush everything to disk
    errno = 0;
    const int rc = gzclose(gz.release());
    if (rc != Z_OK) {
        throw partial(Kind::DestinationWriteFailed, dst,
                      rc == Z_ERRNO && errno ? errno : EIO);
    }
    if (fsync(out) == -1) {
        throw partial(Kind::DestinationWriteFailed, dst, errno);
    }
    const int code = sync_dir(dst.parent_path());
    if (code) {
        throw partial(Kind::DestinationWriteFailed, dst.parent_path(), code);
    }
}
