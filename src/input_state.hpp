///// Otter: Geteilter Eingabezustand – Cursor, Tasten, Modifier, Event-Queue.
///// Schneefuchs: Nur vom Owner-Thread benutzt; keine Locks (Single-Thread-Loop).
///// Maus: Chord-Flags sind persistent; clearFrameState() nur nach einem gerenderten Frame.
///// Datei: src/input_state.hpp

#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <set>

#include "app_event.hpp"
#include "kachel_types.hpp"

namespace kachel {

class InputState {
public:
    explicit InputState(bool useEvents = false) noexcept : useEvents_(useEvents) {}

    // DPI scale used to translate physical cursor positions into logical ones.
    // Non-finite or non-positive values fall back to 1.0.
    void   setScaleFactor(double scale) noexcept;
    [[nodiscard]] double scaleFactor() const noexcept { return scale_; }

    void onMousePosition(double x, double y) noexcept;
    [[nodiscard]] double mousePhysicalX() const noexcept { return mouseX_; }
    [[nodiscard]] double mousePhysicalY() const noexcept { return mouseY_; }
    [[nodiscard]] PointI mouseLogical() const noexcept;

    void onMouseButton(std::size_t button, bool pressed);
    [[nodiscard]] bool isMouseButtonPressed(std::size_t button) const { return mouseButtons_.count(button) != 0; }
    [[nodiscard]] bool leftClick() const noexcept { return leftClick_; }

    void onKey(int key, int scancode, bool pressed);
    [[nodiscard]] bool isKeyPressed(int key) const { return keys_.count(key) != 0; }
    [[nodiscard]] bool isScancodePressed(int scancode) const { return scancodes_.count(scancode) != 0; }
    [[nodiscard]] std::optional<int> lastKey() const noexcept { return lastKey_; }
    [[nodiscard]] std::optional<int> lastScancode() const noexcept { return lastScancode_; }

    void setModifiers(bool shift, bool alt, bool ctrl) noexcept;
    [[nodiscard]] bool shift()   const noexcept { return shift_; }
    [[nodiscard]] bool alt()     const noexcept { return alt_; }
    [[nodiscard]] bool control() const noexcept { return ctrl_; }

    // Structured event handling. When disabled, pushEvent() drops events so a
    // host that never drains the queue cannot grow it.
    void setUseEvents(bool enable) noexcept { useEvents_ = enable; }
    [[nodiscard]] bool useEvents() const noexcept { return useEvents_; }

    void pushEvent(const AppEvent& e);
    [[nodiscard]] std::optional<AppEvent> popEvent();
    [[nodiscard]] std::size_t pendingEvents() const noexcept { return queue_.size(); }

    // Per-frame transient flags (last key, last scancode, left click).
    void clearFrameState() noexcept;

private:
    double scale_  = 1.0;
    double mouseX_ = 0.0;
    double mouseY_ = 0.0;

    std::set<std::size_t> mouseButtons_;
    std::set<int>         keys_;
    std::set<int>         scancodes_;

    std::optional<int> lastKey_;
    std::optional<int> lastScancode_;
    bool leftClick_ = false;

    bool shift_ = false;
    bool alt_   = false;
    bool ctrl_  = false;

    bool                 useEvents_ = false;
    std::deque<AppEvent> queue_;
};

} // namespace kachel
