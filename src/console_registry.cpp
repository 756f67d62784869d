///// Otter: Registry – groesster aktiver Font, Backing-Abgleich, Auto-Scale.
///// Schneefuchs: Ungueltiger Font-Index wird geloggt und uebersprungen, kein Crash.
///// Datei: src/console_registry.cpp

#include "console_registry.hpp"
#include "kachel_log.hpp"
#include "settings.hpp"

#include <algorithm>
#include <stdexcept>

namespace kachel {

std::size_t ConsoleRegistry::addFont(const FontDescriptor& font) {
    fonts_.push_back(font);
    return fonts_.size() - 1;
}

std::size_t ConsoleRegistry::addConsole(std::unique_ptr<ConsoleBackend> console) {
    if (!console) throw std::invalid_argument("ConsoleRegistry: null console");
    consoles_.push_back(std::move(console));
    return consoles_.size() - 1;
}

const FontDescriptor* ConsoleRegistry::fontFor(const ConsoleBackend& c) const noexcept {
    const std::size_t idx = c.fontIndex();
    return idx < fonts_.size() ? &fonts_[idx] : nullptr;
}

PixelSize ConsoleRegistry::largestActiveFont() const {
    PixelSize maxSize{};
    for (const auto& c : consoles_) {
        const FontDescriptor* f = fontFor(*c);
        if (!f) continue;
        maxSize.width  = std::max(maxSize.width,  f->tileWidth);
        maxSize.height = std::max(maxSize.height, f->tileHeight);
    }
    return maxSize;
}

bool ConsoleRegistry::syncBackings() {
    bool ok = true;
    for (std::size_t i = 0; i < consoles_.size(); ++i) {
        if (!consoles_[i]->ensureBacking()) {
            KACHEL_LOG_HOST("[CONSOLE] backing for console %zu could not be created", i);
            ok = false;
        }
    }
    return ok;
}

void ConsoleRegistry::rebuildDirty() {
    for (auto& c : consoles_) c->rebuildIfDirty();
}

void ConsoleRegistry::drawAll(GraphicsOps& gfx) {
    for (std::size_t i = 0; i < consoles_.size(); ++i) {
        const FontDescriptor* f = fontFor(*consoles_[i]);
        if (!f) {
            if constexpr (Settings::debugLogging) {
                KACHEL_LOG_HOST("[CONSOLE] console %zu references missing font %zu - skipped",
                                i, consoles_[i]->fontIndex());
            }
            continue;
        }
        consoles_[i]->draw(gfx, *f, placement_);
    }
}

void ConsoleRegistry::applyAutoScale(std::uint32_t availableWidth, std::uint32_t availableHeight) {
    for (std::size_t i = 0; i < consoles_.size(); ++i) {
        const FontDescriptor* f = fontFor(*consoles_[i]);
        if (!f || f->tileWidth == 0 || f->tileHeight == 0) {
            KACHEL_LOG_HOST("[CONSOLE] console %zu has no usable font - grid unchanged", i);
            continue;
        }
        const std::uint32_t w = availableWidth  / f->tileWidth;
        const std::uint32_t h = availableHeight / f->tileHeight;
        consoles_[i]->setCharSize(w, h);
    }
}

} // namespace kachel
