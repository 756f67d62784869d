///// Otter: GLFW-Setup in fester Reihenfolge: glfwInit -> Error-Callback -> Hints -> Fenster -> GLEW.
///// Schneefuchs: Callbacks ueber den User-Pointer; jede Meldung landet als NativeEvent in der Queue.
///// Maus: Close setzt das Flag zurueck; die Entscheidung trifft der Translator.
///// Datei: src/glfw_surface.cpp

#include "pch.hpp"
#include "glfw_surface.hpp"
#include "event_translator.hpp"
#include "kachel_log.hpp"
#include "settings.hpp"

#include <utility>

namespace kachel {

namespace {

void glfwErrorCallback(int code, const char* description) {
    KACHEL_LOG_HOST("[GLFW-ERROR] code=%d desc=%s", code, description ? description : "(null)");
}

GlfwSurface* self(GLFWwindow* win) {
    return static_cast<GlfwSurface*>(glfwGetWindowUserPointer(win));
}

// Window coordinates -> framebuffer (physical) pixels.
void cursorToPhysical(GLFWwindow* win, double& x, double& y) {
    int ww = 0, wh = 0, fw = 0, fh = 0;
    glfwGetWindowSize(win, &ww, &wh);
    glfwGetFramebufferSize(win, &fw, &fh);
    if (ww > 0) x *= static_cast<double>(fw) / static_cast<double>(ww);
    if (wh > 0) y *= static_cast<double>(fh) / static_cast<double>(wh);
}

native::MouseButton toMouseButton(int button, int action) {
    native::MouseButton mb;
    mb.pressed = (action == GLFW_PRESS);
    switch (button) {
        case GLFW_MOUSE_BUTTON_LEFT:   mb.kind = native::MouseButtonKind::Left;   break;
        case GLFW_MOUSE_BUTTON_RIGHT:  mb.kind = native::MouseButtonKind::Right;  break;
        case GLFW_MOUSE_BUTTON_MIDDLE: mb.kind = native::MouseButtonKind::Middle; break;
        default:
            mb.kind       = native::MouseButtonKind::Other;
            mb.otherIndex = static_cast<std::uint16_t>(button - GLFW_MOUSE_BUTTON_4);
            break;
    }
    return mb;
}

struct ModifierKeyInfo {
    ModifierKey kind = ModifierKey::None;
    int         twin = GLFW_KEY_UNKNOWN;
};

ModifierKeyInfo classifyModifier(int key) {
    switch (key) {
        case GLFW_KEY_LEFT_SHIFT:    return { ModifierKey::Shift, GLFW_KEY_RIGHT_SHIFT };
        case GLFW_KEY_RIGHT_SHIFT:   return { ModifierKey::Shift, GLFW_KEY_LEFT_SHIFT };
        case GLFW_KEY_LEFT_ALT:      return { ModifierKey::Alt,   GLFW_KEY_RIGHT_ALT };
        case GLFW_KEY_RIGHT_ALT:     return { ModifierKey::Alt,   GLFW_KEY_LEFT_ALT };
        case GLFW_KEY_LEFT_CONTROL:  return { ModifierKey::Ctrl,  GLFW_KEY_RIGHT_CONTROL };
        case GLFW_KEY_RIGHT_CONTROL: return { ModifierKey::Ctrl,  GLFW_KEY_LEFT_CONTROL };
        default:                     return {};
    }
}

} // namespace

GlfwSurface::~GlfwSurface() {
    if (window_) {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    if (glfwUp_) {
        glfwTerminate();
        glfwUp_ = false;
    }
}

bool GlfwSurface::open(const TerminalConfig& cfg) {
    if (!glfwInit()) {
        KACHEL_LOG_HOST("[ERROR] GLFW init failed");
        return false;
    }
    glfwUp_ = true;
    glfwSetErrorCallback(glfwErrorCallback);

    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif
    if constexpr (Settings::debugLogging) {
        glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, GLFW_TRUE);
    }
    glfwWindowHint(GLFW_DOUBLEBUFFER, GLFW_TRUE);
    glfwWindowHint(GLFW_RESIZABLE,    GLFW_TRUE);
    glfwWindowHint(GLFW_VISIBLE,      GLFW_TRUE);

    window_ = glfwCreateWindow(cfg.width, cfg.height, cfg.title.c_str(), nullptr, nullptr);
    if (!window_) {
        KACHEL_LOG_HOST("[ERROR] Window creation failed w=%d h=%d", cfg.width, cfg.height);
        return false;
    }

    glfwMakeContextCurrent(window_);

    glewExperimental = GL_TRUE;
    const GLenum glewErr = glewInit();
    if (glewErr != GLEW_OK) {
        KACHEL_LOG_HOST("[ERROR] glewInit failed: %s",
                        reinterpret_cast<const char*>(glewGetErrorString(glewErr)));
        return false;
    }
    // GLEW leaves GL_INVALID_ENUM behind on core profiles.
    while (glGetError() != GL_NO_ERROR) {}

    glfwSwapInterval(cfg.vsync ? 1 : 0);

    installCallbacks();

    KACHEL_LOG_HOST("[GLFW] window %dx%d \"%s\" GL=%s vsync=%d",
                    cfg.width, cfg.height, cfg.title.c_str(),
                    reinterpret_cast<const char*>(glGetString(GL_VERSION)), cfg.vsync ? 1 : 0);
    return true;
}

void GlfwSurface::installCallbacks() {
    glfwSetWindowUserPointer(window_, this);

    glfwSetFramebufferSizeCallback(window_, [](GLFWwindow* win, int w, int h) {
        if (auto* s = self(win)) {
            s->push(native::WindowResized{ PixelSize{ static_cast<std::uint32_t>(w < 0 ? 0 : w),
                                                      static_cast<std::uint32_t>(h < 0 ? 0 : h) } });
        }
    });
    glfwSetWindowPosCallback(window_, [](GLFWwindow* win, int x, int y) {
        if (auto* s = self(win)) s->push(native::WindowMoved{ x, y });
    });
    glfwSetWindowCloseCallback(window_, [](GLFWwindow* win) {
        glfwSetWindowShouldClose(win, GLFW_FALSE);
        if (auto* s = self(win)) s->push(native::CloseRequested{});
    });
    glfwSetCharCallback(window_, [](GLFWwindow* win, unsigned int codepoint) {
        if (auto* s = self(win)) s->push(native::CharacterReceived{ static_cast<char32_t>(codepoint) });
    });
    glfwSetWindowFocusCallback(window_, [](GLFWwindow* win, int focused) {
        if (auto* s = self(win)) s->push(native::FocusChanged{ focused == GLFW_TRUE });
    });
    glfwSetCursorPosCallback(window_, [](GLFWwindow* win, double x, double y) {
        if (auto* s = self(win)) {
            cursorToPhysical(win, x, y);
            s->push(native::CursorMoved{ x, y });
        }
    });
    glfwSetCursorEnterCallback(window_, [](GLFWwindow* win, int entered) {
        if (auto* s = self(win)) {
            if (entered == GLFW_TRUE) s->push(native::CursorEntered{});
            else                      s->push(native::CursorLeft{});
        }
    });
    glfwSetMouseButtonCallback(window_, [](GLFWwindow* win, int button, int action, int /*mods*/) {
        if (auto* s = self(win)) s->push(toMouseButton(button, action));
    });
    glfwSetWindowContentScaleCallback(window_, [](GLFWwindow* win, float xs, float /*ys*/) {
        if (auto* s = self(win)) {
            int fw = 0, fh = 0;
            glfwGetFramebufferSize(win, &fw, &fh);
            s->push(native::ScaleFactorChanged{
                PixelSize{ static_cast<std::uint32_t>(fw < 0 ? 0 : fw),
                           static_cast<std::uint32_t>(fh < 0 ? 0 : fh) },
                static_cast<double>(xs) });
        }
    });
    glfwSetKeyCallback(window_, [](GLFWwindow* win, int key, int scancode, int action, int mods) {
        auto* s = self(win);
        if (!s) return;

        // GLFW reports modifiers only alongside keys; emit a change when the chord differs.
        const native::ModifiersChanged reported{ (mods & GLFW_MOD_SHIFT) != 0,
                                                 (mods & GLFW_MOD_ALT) != 0,
                                                 (mods & GLFW_MOD_CONTROL) != 0 };
        const ModifierKeyInfo mk = classifyModifier(key);
        const bool twinHeld = mk.kind != ModifierKey::None && glfwGetKey(win, mk.twin) == GLFW_PRESS;
        const native::ModifiersChanged m =
            modifiersAfterKey(reported, mk.kind, action != GLFW_RELEASE, twinHeld);
        if (m.shift != s->mods_.shift || m.alt != s->mods_.alt || m.ctrl != s->mods_.ctrl) {
            s->mods_ = m;
            s->push(m);
        }

        native::KeyboardInput k;
        if (key != GLFW_KEY_UNKNOWN) k.keycode = key;
        k.scancode = scancode;
        k.pressed  = (action != GLFW_RELEASE);
        s->push(k);
    });
}

void GlfwSurface::push(native::Payload payload) {
    queue_.push_back(NativeEvent{ windowId(), std::move(payload) });
}

WindowId GlfwSurface::windowId() const {
    return reinterpret_cast<WindowId>(window_);
}

PixelSize GlfwSurface::innerSize() const {
    int w = 0, h = 0;
    if (window_) glfwGetFramebufferSize(window_, &w, &h);
    return PixelSize{ static_cast<std::uint32_t>(w < 0 ? 0 : w),
                      static_cast<std::uint32_t>(h < 0 ? 0 : h) };
}

double GlfwSurface::scaleFactor() const {
    float xs = 1.0f, ys = 1.0f;
    if (window_) glfwGetWindowContentScale(window_, &xs, &ys);
    return xs > 0.0f ? static_cast<double>(xs) : 1.0;
}

void GlfwSurface::swapBuffers() {
    glfwSwapBuffers(window_);
}

void GlfwSurface::pumpEvents(std::vector<NativeEvent>& out) {
    glfwPollEvents();
    for (auto& e : queue_) out.push_back(std::move(e));
    queue_.clear();
    out.push_back(NativeEvent{ windowId(), native::RedrawEventsCleared{} });
}

} // namespace kachel
