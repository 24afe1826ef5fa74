// SPDX-License-Identifier: MIT
// File event handler: mirrors created files as gzip archives.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "compressor.hpp"

#include "error.hpp"
#include "gzip.hpp"
#include "mirror.hpp"

Compressor::Compressor(const WatchConfig& config, Log& log)
    : config(config)
    , log(log)
{
}

bool Compressor::handle(const FileEvent& event) const
{
    try {
        const MappedPaths mp =
            map_path(config.source, config.target, event.path);
        materialize(mp.target_dir, log);
        gzip_file(event.path, mp.target_file, log);
        log.info("Compressed file {}", mp.relative.string());
        return true;
    } catch (const CompressError& e) {
        log.error(e.code(), "{}", e.what());
    } catch (const std::exception& e) {
        log.error("Unable to compress file \"{}\": {}", event.path.string(),
                  e.what());
    }
    return false;
}
