/*
 * optfile Front End Configuration
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Settings read from an rc file of key=value lines ('#' starts a comment).
 *   Looked up in $OPTFILE_RC, falling back to ~/.optfilerc.
 */
#pragma once
#include <string>

namespace optfile {

struct Config {
    bool trace = false;          // trace
    std::string base_dir;        // base_dir: resolves relative @file names
    char separator = '\n';       // separator: newline|nul
};

// Missing or unreadable file yields defaults; unknown keys are ignored.
Config load_config(const std::string& path);

// Path of the rc file to use, empty if none can be determined.
std::string default_config_path();

} // namespace optfile
