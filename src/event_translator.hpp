///// Otter: Native Ereignisse -> Anwendungsvokabular; Resize nur in den Single-Slot.
///// Schneefuchs: Fremde Fenster werden verworfen; ScaleFactorChanged wird sofort angewendet.
///// Maus: Maus-IDs stabil: links 0, rechts 1, Mitte 2, weitere 3+n.
///// Datei: src/event_translator.hpp

#pragma once

#include <cstddef>

#include "display_surface.hpp"
#include "input_state.hpp"
#include "native_event.hpp"
#include "pending_resize.hpp"
#include "resize_coordinator.hpp"
#include "terminal.hpp"

namespace kachel {

enum class TranslateResult {
    Filtered,       // foreign window or nothing to do
    StateUpdated,   // analog input state changed, nothing queued
    EventQueued,    // discrete application event handed to the input queue
    ResizeQueued,   // pending resize slot (re)filled
    ResizeApplied,  // scale change applied synchronously
    ResizeFailed,   // synchronous apply failed (logged)
    QuitRequested   // close without structured events
};

[[nodiscard]] std::size_t mouseButtonId(const native::MouseButton& b) noexcept;

enum class ModifierKey { None, Shift, Alt, Ctrl };

// Modifier chord after a key event. X11 reports the chord as it was before
// the event, so a modifier key sets or clears its own bit from `pressed`;
// twinHeld keeps the bit while the key on the other side is still down.
[[nodiscard]] native::ModifiersChanged modifiersAfterKey(native::ModifiersChanged reported, ModifierKey key,
                                                         bool pressed, bool twinHeld) noexcept;

[[nodiscard]] const char* toString(TranslateResult r) noexcept;

class EventTranslator {
public:
    EventTranslator(WindowId window, DisplaySurface& surface, InputState& input, Terminal& term,
                    ResizeSlot& pending, ResizeCoordinator& coordinator) noexcept
        : window_(window), surface_(surface), input_(input), term_(term),
          pending_(pending), coordinator_(coordinator) {}

    // Handles one native event. RedrawEventsCleared is the scheduler's
    // business and is reported as Filtered here.
    TranslateResult translate(const NativeEvent& ev);

private:
    WindowId           window_;
    DisplaySurface&    surface_;
    InputState&        input_;
    Terminal&          term_;
    ResizeSlot&        pending_;
    ResizeCoordinator& coordinator_;
};

} // namespace kachel
