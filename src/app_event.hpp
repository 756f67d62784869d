///// Otter: Anwendungsseitiges Ereignisvokabular; FIFO-Queue lebt im InputState.
///// Schneefuchs: Geschlossene Variante, kein RTTI; Groessen im skalierten Pixelraum.
///// Datei: src/app_event.hpp

#pragma once

#include <cstddef>
#include <variant>

#include "kachel_types.hpp"

namespace kachel {

namespace event {

struct Resized            { PointI newSize; float dpiScaleFactor = 1.0f; };
struct Moved              { PointI newPosition; };
struct CloseRequested     {};
struct Character          { char32_t c = 0; };
struct Focused            { bool focused = false; };
struct CursorEntered      {};
struct CursorLeft         {};
struct ScaleFactorChanged { PointI newSize; float dpiScaleFactor = 1.0f; };
struct KeyboardInput      { int key = 0; int scancode = 0; bool pressed = false; };
struct MouseClick         { std::size_t button = 0; bool pressed = false; };

} // namespace event

using AppEvent = std::variant<event::Resized,
                              event::Moved,
                              event::CloseRequested,
                              event::Character,
                              event::Focused,
                              event::CursorEntered,
                              event::CursorLeft,
                              event::ScaleFactorChanged,
                              event::KeyboardInput,
                              event::MouseClick>;

} // namespace kachel
