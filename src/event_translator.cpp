///// Otter: Event-Uebersetzung per std::visit; eine Zeile Debug-Log pro Ereignis.
///// Schneefuchs: Kein Geometrie-Update bei Resize/Move – nur Slot; Apply macht der Scheduler.
///// Maus: Close ohne useEvents beendet sofort; mit useEvents entscheidet die Anwendung.
///// Datei: src/event_translator.cpp

#include "event_translator.hpp"
#include "kachel_log.hpp"
#include "settings.hpp"

#include <type_traits>
#include <variant>

namespace kachel {

std::size_t mouseButtonId(const native::MouseButton& b) noexcept {
    switch (b.kind) {
        case native::MouseButtonKind::Left:   return 0;
        case native::MouseButtonKind::Right:  return 1;
        case native::MouseButtonKind::Middle: return 2;
        case native::MouseButtonKind::Other:  return 3u + static_cast<std::size_t>(b.otherIndex);
    }
    return 0;
}

native::ModifiersChanged modifiersAfterKey(native::ModifiersChanged reported, ModifierKey key,
                                           bool pressed, bool twinHeld) noexcept {
    const bool held = pressed || twinHeld;
    switch (key) {
        case ModifierKey::Shift: reported.shift = held; break;
        case ModifierKey::Alt:   reported.alt   = held; break;
        case ModifierKey::Ctrl:  reported.ctrl  = held; break;
        case ModifierKey::None:  break;
    }
    return reported;
}

const char* toString(TranslateResult r) noexcept {
    switch (r) {
        case TranslateResult::Filtered:      return "filtered";
        case TranslateResult::StateUpdated:  return "state";
        case TranslateResult::EventQueued:   return "queued";
        case TranslateResult::ResizeQueued:  return "resize-queued";
        case TranslateResult::ResizeApplied: return "resize-applied";
        case TranslateResult::ResizeFailed:  return "resize-failed";
        case TranslateResult::QuitRequested: return "quit";
    }
    return "?";
}

TranslateResult EventTranslator::translate(const NativeEvent& ev) {
    if (std::holds_alternative<native::RedrawEventsCleared>(ev.payload)) {
        return TranslateResult::Filtered;
    }
    if (ev.window != window_) {
        if constexpr (Settings::debugLogging) {
            KACHEL_LOG_HOST("[EVENT] dropped event for foreign window %llu",
                            static_cast<unsigned long long>(ev.window));
        }
        return TranslateResult::Filtered;
    }

    const TranslateResult result = std::visit([this](const auto& e) -> TranslateResult {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, native::WindowMoved>) {
            input_.pushEvent(event::Moved{ PointI{ e.x, e.y } });
            pending_.offer(PendingResize{ surface_.innerSize(), surface_.scaleFactor(), true });
            return TranslateResult::ResizeQueued;
        } else if constexpr (std::is_same_v<T, native::WindowResized>) {
            pending_.offer(PendingResize{ e.size, surface_.scaleFactor(), true });
            return TranslateResult::ResizeQueued;
        } else if constexpr (std::is_same_v<T, native::CloseRequested>) {
            if (!input_.useEvents()) {
                term_.quit();
                return TranslateResult::QuitRequested;
            }
            input_.pushEvent(event::CloseRequested{});
            return TranslateResult::EventQueued;
        } else if constexpr (std::is_same_v<T, native::CharacterReceived>) {
            input_.pushEvent(event::Character{ e.c });
            return TranslateResult::EventQueued;
        } else if constexpr (std::is_same_v<T, native::FocusChanged>) {
            input_.pushEvent(event::Focused{ e.focused });
            return TranslateResult::EventQueued;
        } else if constexpr (std::is_same_v<T, native::CursorMoved>) {
            input_.onMousePosition(e.x, e.y);
            return TranslateResult::StateUpdated;
        } else if constexpr (std::is_same_v<T, native::CursorEntered>) {
            input_.pushEvent(event::CursorEntered{});
            return TranslateResult::EventQueued;
        } else if constexpr (std::is_same_v<T, native::CursorLeft>) {
            input_.pushEvent(event::CursorLeft{});
            return TranslateResult::EventQueued;
        } else if constexpr (std::is_same_v<T, native::MouseButton>) {
            const std::size_t id = mouseButtonId(e);
            input_.onMouseButton(id, e.pressed);
            input_.pushEvent(event::MouseClick{ id, e.pressed });
            return TranslateResult::EventQueued;
        } else if constexpr (std::is_same_v<T, native::ScaleFactorChanged>) {
            // The native layer wants the new size acknowledged now, not next frame.
            const PixelSize inner = surface_.innerSize();
            const double    scale = surface_.scaleFactor();
            const bool      ok    = coordinator_.apply(inner, scale, false);
            // The application hears about the new scale even if the GPU side failed.
            input_.pushEvent(event::ScaleFactorChanged{
                PointI{ static_cast<int>(e.newSize.width), static_cast<int>(e.newSize.height) },
                static_cast<float>(scale) });
            if (!ok) {
                KACHEL_LOG_HOST("[EVENT] scale change to %.3f could not be applied", scale);
                return TranslateResult::ResizeFailed;
            }
            return TranslateResult::ResizeApplied;
        } else if constexpr (std::is_same_v<T, native::KeyboardInput>) {
            if (!e.keycode) return TranslateResult::Filtered;
            input_.onKey(*e.keycode, e.scancode, e.pressed);
            input_.pushEvent(event::KeyboardInput{ *e.keycode, e.scancode, e.pressed });
            return TranslateResult::EventQueued;
        } else if constexpr (std::is_same_v<T, native::ModifiersChanged>) {
            input_.setModifiers(e.shift, e.alt, e.ctrl);
            return TranslateResult::StateUpdated;
        } else {
            return TranslateResult::Filtered;
        }
    }, ev.payload);

    if constexpr (Settings::debugLogging) {
        KACHEL_LOG_HOST("[EVENT] kind=%zu -> %s", ev.payload.index(), toString(result));
    }
    return result;
}

} // namespace kachel
