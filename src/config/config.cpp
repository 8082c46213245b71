/*
 * optfile Front End Configuration Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <optfile/config/config.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace optfile {

static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

static void parse_bool(const std::string& val, bool& dst) {
    if (val=="1"||val=="true"||val=="on") dst = true;
    else if (val=="0"||val=="false"||val=="off") dst = false;
}

std::string default_config_path() {
    std::string rc = getenv_or("OPTFILE_RC"); if (!rc.empty()) return rc;
    std::string home = getenv_or("HOME"); if (home.empty()) return "";
    return home + "/.optfilerc";
}

Config load_config(const std::string& path) {
    Config cfg;
    if (path.empty()) return cfg;
    std::ifstream in(path); if (!in) return cfg;
    std::string line; size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) { std::cerr << "optfile: " << path << ":" << lineno << ": ignoring line without '='" << std::endl; continue; }
        auto key = trim(line.substr(0, eq)); auto val = trim(line.substr(eq+1));
        if (key=="trace") parse_bool(val, cfg.trace);
        else if (key=="base_dir") cfg.base_dir = val;
        else if (key=="separator") {
            if (val=="nul") cfg.separator = '\0';
            else if (val=="newline") cfg.separator = '\n';
        }
    }
    return cfg;
}

} // namespace optfile
