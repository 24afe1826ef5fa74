// SPDX-License-Identifier: MIT
// Per-file compression errors.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "error.hpp"

#include <format>

/**
 * Compose error message.
 * @param kind failure type
 * @param path offending path
 * @return message text
 */
static std::string describe(const CompressError::Kind kind,
                            const std::filesystem::path& path)
{
    const char* what = "";
    switch (kind) {
        case CompressError::Kind::OutsideWatchedTree:
            what = "Path is outside of the watched directory";
            break;
        case CompressError::Kind::DirectoryCreateFailed:
            what = "Unable to create directory";
            break;
        case CompressError::Kind::SourceUnreadable:
            what = "Unable to read source file";
            break;
        case CompressError::Kind::DestinationWriteFailed:
            what = "Unable to write compressed file";
            break;
    }
    return std::format("{} \"{}\"", what, path.string());
}

CompressError::CompressError(const Kind kind,
                             const std::filesystem::path& path, const int code)
    : std::runtime_error(describe(kind, path))
    , type(kind)
    , failed(path)
    , errcode(code)
{
}
