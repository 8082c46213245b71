/*
 * optfile Front End Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <optfile/cli/front_end.hpp>
#include <optfile/errors.hpp>
#include <optfile/expand/expander.hpp>
#include <optfile/io/provider.hpp>

namespace optfile {

static void usage(std::ostream& err) {
    err << "Usage: optfile-expand [--trace] [-0] [--] ARGS..." << std::endl;
}

int run_front_end(const std::vector<std::string>& args, Config cfg, std::ostream& out, std::ostream& err) {
    std::vector<std::string> raw;
    bool flags = true;
    for (auto &a : args) {
        if (flags) {
            if (a=="--") { flags = false; continue; }
            if (a=="--trace") { cfg.trace = true; continue; }
            if (a=="-0") { cfg.separator = '\0'; continue; }
            if (a=="-h"||a=="--help") { usage(err); return 0; }
            if (a.size()>1 && a[0]=='-' && a[1]=='-') {
                err << "optfile-expand: unknown option " << a << std::endl;
                usage(err);
                return 2;
            }
        }
        raw.push_back(a);
    }

    FileSystemProvider provider(cfg.base_dir);
    ExpanderOptions opts; opts.trace = cfg.trace;
    Expander expander(provider, opts);

    std::vector<std::string> expanded;
    try {
        expanded = expander.expand_arguments(raw);
    } catch (const OptionFileError& e) {
        err << "optfile-expand: " << e.what() << std::endl;
        return 1;
    }
    for (auto &a : expanded) out << a << cfg.separator;
    out.flush();
    return out ? 0 : 1;
}

} // namespace optfile
