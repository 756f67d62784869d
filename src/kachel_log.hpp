///// Otter: Host-Logging, klarer Vertrag, ASCII-only; ein Makro fuer alle Call-Sites.
///// Schneefuchs: Keine Header-Seiteneffekte; Thread-safe via Mutex in der .cpp; /WX-fest.
///// Maus: GL-Fehler werden in opengl_utils geloggt, nicht hier; keine iostreams.
///// Datei: src/kachel_log.hpp

#pragma once

namespace kachel::Log {

// Thread-safe host logger with uniform formatting:
// [YYYY-MM-DD HH:MM:SS.mmm][file][line]: message
// Lines are capped at 2 KiB; on Windows they are mirrored to the debugger.
void logMessage(const char* file, int line, const char* fmt, ...);
void flushLogs();

} // namespace kachel::Log

// Variadic convenience macro: captures call site file/line.
#define KACHEL_LOG_HOST(...) ::kachel::Log::logMessage(__FILE__, __LINE__, __VA_ARGS__)
