///// Otter: Host-Logging – eine Zeile pro Aufruf, Zeitstempel mit Millisekunden.
///// Schneefuchs: Zeile wird einmal formatiert und dann an alle Senken gegeben; Mutex serialisiert.
///// Maus: Zu lange Zeilen werden mit "..." gekappt; Windows spiegelt in den Debugger.
///// Datei: src/kachel_log.cpp

#include "kachel_log.hpp"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#if defined(_WIN32)
  #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
  #endif
  #include <windows.h> // OutputDebugStringA
#endif

namespace kachel::Log {

namespace {

std::mutex g_sinkMutex;

constexpr std::size_t kLineCap = 2048;

const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
#if defined(_WIN32)
    if (const char* back = std::strrchr(path, '\\'); back && (!slash || back > slash)) slash = back;
#endif
    return slash ? slash + 1 : path;
}

// "[YYYY-MM-DD HH:MM:SS.mmm]"; returns characters written.
int stampNow(char* out, std::size_t cap) {
    using namespace std::chrono;
    const auto now    = system_clock::now();
    const auto secs   = system_clock::to_time_t(now);
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &secs);
#else
    localtime_r(&secs, &local);
#endif
    char date[24];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);
    return std::snprintf(out, cap, "[%s.%03d]", date, static_cast<int>(millis));
}

void emit(const char* line) {
    std::fputs(line, stdout);
    std::fflush(stdout);
#if defined(_WIN32)
    OutputDebugStringA(line);
#endif
}

} // namespace

void logMessage(const char* file, int line, const char* fmt, ...) {
    char buf[kLineCap];
    // Leave room for "...\n" so a truncated line still ends cleanly.
    constexpr std::size_t body = kLineCap - 5;

    int used = stampNow(buf, body);
    if (used < 0) used = 0;
    const int head = std::snprintf(buf + used, body - static_cast<std::size_t>(used),
                                   "[%s][%d]: ", baseName(file), line);
    if (head > 0) used += head;

    bool clipped = static_cast<std::size_t>(used) >= body;
    if (!clipped) {
        va_list args;
        va_start(args, fmt);
        const int msg = std::vsnprintf(buf + used, body - static_cast<std::size_t>(used), fmt, args);
        va_end(args);
        if (msg > 0) {
            clipped = static_cast<std::size_t>(used) + static_cast<std::size_t>(msg) >= body;
        }
    }

    std::size_t end = clipped ? body - 1 : std::strlen(buf);
    if (clipped) {
        std::memcpy(buf + end, "...", 3);
        end += 3;
    }
    buf[end++] = '\n';
    buf[end] = '\0';

    std::lock_guard<std::mutex> guard(g_sinkMutex);
    emit(buf);
}

void flushLogs() {
    std::lock_guard<std::mutex> guard(g_sinkMutex);
    std::fflush(stdout);
}

} // namespace kachel::Log
