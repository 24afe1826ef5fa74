// SPDX-License-Identifier: MIT
// Gzip file compression.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "log.hpp"

#include <filesystem>

/** Size of the buffer used to copy file data. */
constexpr size_t GZIP_BUFFER_SIZE = 64 * 1024;

/**
 * Compress file: copy source file data into gzip stream.
 * The destination file is created or truncated and synced to disk on success.
 * If writing fails, the partially written destination file is left in place.
 * @param src path to the source file
 * @param dst path to the destination (compressed) file
 * @param log logger used to report partial files
 * @throw CompressError (SourceUnreadable or DestinationWriteFailed)
 */
void gzip_file(const std::filesystem::path& src,
               const std::filesystem::path& dst, Log& log);
