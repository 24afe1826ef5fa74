// SPDX-License-Identifier: MIT
// Per-file compression errors.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>

/** Failure of a single file mirroring. */
class CompressError : public std::runtime_error {
public:
    /** Failure types. */
    enum class Kind : uint8_t {
        OutsideWatchedTree,     ///< Source path is not under the source root
        DirectoryCreateFailed,  ///< Unable to create target directory
        SourceUnreadable,       ///< Unable to open or read source file
        DestinationWriteFailed, ///< Unable to write compressed file
    };

    /**
     * Constructor.
     * @param kind failure type
     * @param path offending path
     * @param code system error code, 0 if not applicable
     */
    CompressError(const Kind kind, const std::filesystem::path& path,
                  const int code = 0);

    Kind kind() const { return type; }
    const std::filesystem::path& path() const { return failed; }
    int code() const { return errcode; }

private:
    Kind type;
    std::filesystem::path failed;
    int errcode;
};
