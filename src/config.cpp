// config.cpp
#include "config.h"
#include <cctype>
#include <limits>

static bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static uint64_t parseUnsigned(const std::string& opt, const std::string& v) {
    if (v.empty()) throw ConfigError("missing value for " + opt);
    for (char c : v)
        if (!std::isdigit((unsigned char)c)) throw ConfigError("bad value for " + opt + ": '" + v + "'");
    try {
        return std::stoull(v);
    }
    catch (const std::out_of_range&) {
        throw ConfigError("value out of range for " + opt + ": '" + v + "'");
    }
}

GameConfig parseArgs(const std::vector<std::string>& args, GameConfig cfg) {
    for (const std::string& a : args) {
        if (a == "--help" || a == "-h") {
            cfg.showHelp = true;
        }
        else if (startsWith(a, "--seed=")) {
            cfg.seed = parseUnsigned("--seed", a.substr(7));
            cfg.hasSeed = true;
        }
        else if (startsWith(a, "--level=")) {
            uint64_t lv = parseUnsigned("--level", a.substr(8));
            if (lv < 1 || lv > (uint64_t)std::numeric_limits<int>::max())
                throw ConfigError("--level must be >= 1");
            cfg.startLevel = (int)lv;
        }
        else {
            throw ConfigError("unknown option '" + a + "'");
        }
    }
    return cfg;
}

std::vector<std::string> splitCommandLine(const std::string& cmdLine) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : cmdLine) {
        if (std::isspace((unsigned char)c)) {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
        }
        else cur += c;
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

const char* usageText() {
    return "usage: mazemaster [--seed=<n>] [--level=<n>] [--help]\n"
        "  --seed=<n>   seed the maze/spawn RNG for a reproducible run\n"
        "  --level=<n>  start at level n (default 1)\n";
}
