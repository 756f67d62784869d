///// Otter: Native Ereignisse als geschlossene Variante; unabhaengig von GLFW-Headern.
///// Schneefuchs: Jedes Ereignis traegt die Fenster-ID; Payload minimal.
///// Maus: Die GLFW-Surface erzeugt sie, der EventTranslator verbraucht sie.
///// Datei: src/native_event.hpp

#pragma once

#include <cstdint>
#include <optional>
#include <variant>

#include "kachel_types.hpp"

namespace kachel {

namespace native {

// All native events of one pump have been delivered; time to (maybe) render.
struct RedrawEventsCleared {};

struct WindowMoved       { int x = 0; int y = 0; };
struct WindowResized     { PixelSize size; };
struct CloseRequested    {};
struct CharacterReceived { char32_t c = 0; };
struct FocusChanged      { bool focused = false; };
struct CursorMoved       { double x = 0.0; double y = 0.0; }; // physical pixels
struct CursorEntered     {};
struct CursorLeft        {};

enum class MouseButtonKind { Left, Right, Middle, Other };

struct MouseButton {
    MouseButtonKind kind       = MouseButtonKind::Left;
    std::uint16_t   otherIndex = 0; // only meaningful for Other
    bool            pressed    = false;
};

struct ScaleFactorChanged { PixelSize newSize; double scale = 1.0; };

// keycode is empty when the platform could not resolve a key.
struct KeyboardInput {
    std::optional<int> keycode;
    int                scancode = 0;
    bool               pressed  = false;
};

struct ModifiersChanged { bool shift = false; bool alt = false; bool ctrl = false; };

using Payload = std::variant<RedrawEventsCleared,
                             WindowMoved,
                             WindowResized,
                             CloseRequested,
                             CharacterReceived,
                             FocusChanged,
                             CursorMoved,
                             CursorEntered,
                             CursorLeft,
                             MouseButton,
                             ScaleFactorChanged,
                             KeyboardInput,
                             ModifiersChanged>;

} // namespace native

struct NativeEvent {
    WindowId        window = 0;
    native::Payload payload;
};

} // namespace kachel
