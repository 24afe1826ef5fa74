// SPDX-License-Identifier: MIT
// Mapping of the source tree onto the target tree.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "log.hpp"

#include <filesystem>

/** Suffix of compressed files. */
constexpr const char* GZIP_SUFFIX = ".gz";

/** Paths derived from a single source file. */
struct MappedPaths {
    std::filesystem::path relative;    ///< Path relative to the source root
    std::filesystem::path target_file; ///< Compressed file in the target tree
    std::filesystem::path target_dir;  ///< Parent directory of target file
};

/**
 * Check if path is equal to or located inside the root directory.
 * Comparison is lexical, both paths are expected to be normalized.
 * @param path path to check
 * @param root root directory
 * @return true if path is the root or its descendant
 */
bool is_within(const std::filesystem::path& path,
               const std::filesystem::path& root);

/**
 * Map source file to its compressed copy in the target tree.
 * @param source_root root of the source tree
 * @param target_root root of the target tree
 * @param file absolute path to the source file
 * @return mapped paths
 * @throw CompressError (OutsideWatchedTree) if file is not under source root
 */
MappedPaths map_path(const std::filesystem::path& source_root,
                     const std::filesystem::path& target_root,
                     const std::filesystem::path& file);

/**
 * Create directory and all missing parents.
 * @param dir path to the directory
 * @param log logger used to report created directory
 * @return true if directory was created, false if it already exists
 * @throw CompressError (DirectoryCreateFailed) on errors
 */
bool materialize(const std::filesystem::path& dir, Log& log);
