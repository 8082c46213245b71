/*
 * optfile Front End
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Argument handling of optfile-expand. Flags (--trace, -0, -h/--help) are
 *   recognized until "--"; any other argument, single-dash ones included, is
 *   expanded through a FileSystemProvider and written to out, one record per
 *   argument. Diagnostics go to err.
 *
 *   Exit status: 0 success, 1 expansion or output failure, 2 usage error.
 */
#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "optfile/config/config.hpp"

namespace optfile {

// args excludes the program name.
int run_front_end(const std::vector<std::string>& args, Config cfg, std::ostream& out, std::ostream& err);

} // namespace optfile
