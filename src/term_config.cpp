///// Otter: CLI-Parser im Stil von init_cli – strcmp-Schleife, keine Fremdbibliothek.
///// Schneefuchs: Ungueltige Werte werden geloggt und ignoriert; kein exit() im Parser.
///// Datei: src/term_config.cpp

#include "term_config.hpp"
#include "kachel_log.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace kachel {

namespace {
    bool parsePositiveInt(const char* s, int& out) {
        if (!s || !*s) return false;
        char* end = nullptr;
        const long v = std::strtol(s, &end, 10);
        if (end == s || *end != '\0' || v <= 0 || v > 100000) return false;
        out = static_cast<int>(v);
        return true;
    }

    bool parseSize(const char* s, int& w, int& h) {
        if (!s) return false;
        int pw = 0, ph = 0;
        char tail = 0;
        if (std::sscanf(s, "%dx%d%c", &pw, &ph, &tail) != 2) return false;
        if (pw <= 0 || ph <= 0) return false;
        w = pw;
        h = ph;
        return true;
    }
} // namespace

bool parseCommandLine(int argc, const char* const* argv, TerminalConfig& cfg) {
    bool ok = true;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-d") == 0 || std::strcmp(arg, "--debug") == 0) {
            cfg.debug = true;
        } else if (std::strcmp(arg, "--uncapped") == 0) {
            cfg.frameSleepMs.reset();
        } else if (std::strcmp(arg, "--fps") == 0) {
            int fps = 0;
            if (i + 1 < argc && parsePositiveInt(argv[i + 1], fps)) {
                cfg.frameSleepMs = (fps >= 1000) ? 1 : 1000 / fps;
                ++i;
            } else {
                KACHEL_LOG_HOST("[CONFIG] --fps expects a positive integer");
                ok = false;
            }
        } else if (std::strcmp(arg, "--scanlines") == 0) {
            cfg.postScanlines = true;
        } else if (std::strcmp(arg, "--screenburn") == 0) {
            cfg.postScreenburn = true;
        } else if (std::strcmp(arg, "--events") == 0) {
            cfg.useEvents = true;
        } else if (std::strcmp(arg, "--no-resize-scaling") == 0) {
            cfg.resizeScaling = false;
        } else if (std::strcmp(arg, "--size") == 0) {
            if (i + 1 < argc && parseSize(argv[i + 1], cfg.width, cfg.height)) {
                ++i;
            } else {
                KACHEL_LOG_HOST("[CONFIG] --size expects <w>x<h>");
                ok = false;
            }
        } else {
            KACHEL_LOG_HOST("[CONFIG] unknown argument '%s' ignored", arg);
            ok = false;
        }
    }
    return ok;
}

} // namespace kachel
