///// Otter: Single-Slot fuer Resize-Coalescing; neuere Werte ersetzen aeltere.
///// Schneefuchs: Bewusst keine Queue – ein Coordinator-Durchlauf pro gerendertem Frame.
///// Maus: take() liefert und leert atomar (Single-Thread); header-only.
///// Datei: src/pending_resize.hpp

#pragma once

#include <optional>

#include "kachel_types.hpp"

namespace kachel {

struct PendingResize {
    PixelSize physicalSize;
    double    dpiScale = 1.0;
    bool      notify   = true;
};

inline bool operator==(const PendingResize& a, const PendingResize& b) noexcept {
    return a.physicalSize == b.physicalSize && a.dpiScale == b.dpiScale && a.notify == b.notify;
}

class ResizeSlot {
public:
    // Stores r as the latest pending resize. Returns true if the slot changed
    // (an identical record already waiting is left as is).
    bool offer(const PendingResize& r) noexcept {
        if (pending_ && *pending_ == r) return false;
        pending_ = r;
        return true;
    }

    // Consumes the pending record; the slot is empty afterwards.
    [[nodiscard]] std::optional<PendingResize> take() noexcept {
        std::optional<PendingResize> r = pending_;
        pending_.reset();
        return r;
    }

    [[nodiscard]] const std::optional<PendingResize>& peek() const noexcept { return pending_; }
    [[nodiscard]] bool empty() const noexcept { return !pending_.has_value(); }

private:
    std::optional<PendingResize> pending_;
};

} // namespace kachel
