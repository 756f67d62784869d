///// Otter: GLFW-Fenster als DisplaySurface; 4.3 Core, GLEW nach MakeContextCurrent.
///// Schneefuchs: Callbacks schreiben nur in die interne Queue; Auswertung im EventTranslator.
///// Maus: Destruktor raeumt Fenster + GLFW ab; nicht kopierbar.
///// Datei: src/glfw_surface.hpp

#pragma once

#include <vector>

#include "display_surface.hpp"
#include "term_config.hpp"

struct GLFWwindow;

namespace kachel {

class GlfwSurface final : public DisplaySurface {
public:
    GlfwSurface() = default;
    ~GlfwSurface() override;

    GlfwSurface(const GlfwSurface&) = delete;
    GlfwSurface& operator=(const GlfwSurface&) = delete;

    // Creates the window, makes its context current and loads GL entry points.
    [[nodiscard]] bool open(const TerminalConfig& cfg);

    [[nodiscard]] WindowId  windowId() const override;
    [[nodiscard]] PixelSize innerSize() const override;
    [[nodiscard]] double    scaleFactor() const override;

    void swapBuffers() override;
    void pumpEvents(std::vector<NativeEvent>& out) override;

    [[nodiscard]] GLFWwindow* window() const noexcept { return window_; }

private:
    void push(native::Payload payload);
    void installCallbacks();

    GLFWwindow*              window_ = nullptr;
    bool                     glfwUp_ = false;
    std::vector<NativeEvent> queue_;
    native::ModifiersChanged mods_;
};

} // namespace kachel
