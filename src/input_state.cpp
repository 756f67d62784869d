///// Otter: Eingabezustand – DPI-Uebersetzung des Cursors, Tastensets, FIFO.
///// Schneefuchs: Keine Ausnahmen ausser bad_alloc; NaN-Filter fuer Skalierung.
///// Datei: src/input_state.cpp

#include "input_state.hpp"
#include "kachel_log.hpp"
#include "settings.hpp"

#include <cmath>

namespace kachel {

void InputState::setScaleFactor(double scale) noexcept {
    if (!std::isfinite(scale) || scale <= 0.0) {
        if constexpr (Settings::debugLogging) {
            KACHEL_LOG_HOST("[INPUT] invalid scale factor %.3f -> 1.0", scale);
        }
        scale = 1.0;
    }
    scale_ = scale;
}

void InputState::onMousePosition(double x, double y) noexcept {
    mouseX_ = x;
    mouseY_ = y;
}

PointI InputState::mouseLogical() const noexcept {
    return PointI{ static_cast<int>(std::floor(mouseX_ / scale_)),
                   static_cast<int>(std::floor(mouseY_ / scale_)) };
}

void InputState::onMouseButton(std::size_t button, bool pressed) {
    if (pressed) {
        mouseButtons_.insert(button);
        if (button == 0) leftClick_ = true;
    } else {
        mouseButtons_.erase(button);
    }
}

void InputState::onKey(int key, int scancode, bool pressed) {
    if (pressed) {
        keys_.insert(key);
        scancodes_.insert(scancode);
        lastKey_      = key;
        lastScancode_ = scancode;
    } else {
        keys_.erase(key);
        scancodes_.erase(scancode);
    }
}

void InputState::setModifiers(bool shift, bool alt, bool ctrl) noexcept {
    shift_ = shift;
    alt_   = alt;
    ctrl_  = ctrl;
}

void InputState::pushEvent(const AppEvent& e) {
    if (!useEvents_) return;
    queue_.push_back(e);
}

std::optional<AppEvent> InputState::popEvent() {
    if (queue_.empty()) return std::nullopt;
    AppEvent e = queue_.front();
    queue_.pop_front();
    return e;
}

void InputState::clearFrameState() noexcept {
    lastKey_.reset();
    lastScancode_.reset();
    leftClick_ = false;
}

} // namespace kachel
