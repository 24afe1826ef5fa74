// SPDX-License-Identifier: MIT
// Mapping of the source tree onto the target tree.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "mirror.hpp"

#include "error.hpp"

/**
 * Normalize directory path: remove dot elements and trailing separator.
 * @param dir path to normalize
 * @return normalized path
 */
static std::filesystem::path normalize_dir(const std::filesystem::path& dir)
{
    std::filesystem::path norm = dir.lexically_normal();
    if (!norm.has_filename() && norm.has_relative_path()) {
        norm = norm.parent_path();
    }
    return norm;
}

bool is_within(const std::filesystem::path& path,
               const std::filesystem::path& root)
{
    const std::filesystem::path rel =
        normalize_dir(path).lexically_relative(normalize_dir(root));
    return !rel.empty() && *rel.begin() != "..";
}

MappedPaths map_path(const std::filesystem::path& source_root,
                     const std::filesystem::path& target_root,
                     const std::filesystem::path& file)
{
    using Kind = CompressError::Kind;

    if (!file.is_absolute()) {
        throw CompressError(Kind::OutsideWatchedTree, file);
    }

    const std::filesystem::path rel =
        file.lexically_normal().lexically_relative(normalize_dir(source_root));
    if (rel.empty() || rel == "." || *rel.begin() == ".." ||
        !rel.has_filename()) {
        throw CompressError(Kind::OutsideWatchedTree, file);
    }

    MappedPaths mp;
    mp.relative = rel;
    mp.target_file = target_root / rel;
    mp.target_file += GZIP_SUFFIX;
    mp.target_dir = mp.target_file.parent_path();

    return mp;
}

bool materialize(const std::filesystem::path& dir, Log& log)
{
    std::error_code ec;
    const bool created = std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw CompressError(CompressError::Kind::DirectoryCreateFailed, dir,
                            ec.value());
    }
    if (created) {
        log.info("Created directory {}", dir.string());
    }
    return created;
}
