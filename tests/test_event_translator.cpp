#include <gtest/gtest.h>

#include <variant>

#include "test_harness.hpp"

using namespace kachel;
using namespace kachel::test;

namespace {
NativeEvent ev(native::Payload p, WindowId w = kWindow) { return NativeEvent{ w, std::move(p) }; }
}

TEST(EventTranslator, ResizeIsQueuedNotApplied) {
    Harness h(makeConfig(true));
    auto r = h.loop.translator().translate(ev(native::WindowResized{ PixelSize{ 1024, 768 } }));
    EXPECT_EQ(r, TranslateResult::ResizeQueued);
    ASSERT_TRUE(h.loop.pendingResize().peek().has_value());
    EXPECT_EQ(h.loop.pendingResize().peek()->physicalSize, (PixelSize{ 1024, 768 }));
    EXPECT_TRUE(h.loop.pendingResize().peek()->notify);
    EXPECT_EQ(h.gfx.builds, 0);
    EXPECT_EQ(h.input.pendingEvents(), 0u);
}

TEST(EventTranslator, LaterResizeReplacesEarlier) {
    Harness h(makeConfig(false));
    auto& t = h.loop.translator();
    t.translate(ev(native::WindowResized{ PixelSize{ 640, 480 } }));
    t.translate(ev(native::WindowResized{ PixelSize{ 700, 500 } }));
    t.translate(ev(native::WindowResized{ PixelSize{ 801, 600 } }));
    auto taken = h.loop.pendingResize().take();
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->physicalSize, (PixelSize{ 801, 600 }));
    EXPECT_TRUE(h.loop.pendingResize().empty());
}

TEST(EventTranslator, MoveQueuesEventAndResize) {
    Harness h(makeConfig(true), PixelSize{ 640, 400 }, 1.5);
    auto r = h.loop.translator().translate(ev(native::WindowMoved{ 10, 20 }));
    EXPECT_EQ(r, TranslateResult::ResizeQueued);

    auto e = h.input.popEvent();
    ASSERT_TRUE(e.has_value());
    ASSERT_TRUE(std::holds_alternative<event::Moved>(*e));
    EXPECT_EQ(std::get<event::Moved>(*e).newPosition, (PointI{ 10, 20 }));

    const auto& p = h.loop.pendingResize().peek();
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->physicalSize, (PixelSize{ 640, 400 }));
    EXPECT_DOUBLE_EQ(p->dpiScale, 1.5);
}

TEST(EventTranslator, ForeignWindowIsIgnored) {
    Harness h(makeConfig(true));
    auto r = h.loop.translator().translate(ev(native::CloseRequested{}, kWindow + 1));
    EXPECT_EQ(r, TranslateResult::Filtered);
    EXPECT_FALSE(h.term.quitting());
    EXPECT_EQ(h.input.pendingEvents(), 0u);
}

TEST(EventTranslator, CloseQuitsWithoutStructuredEvents) {
    Harness h(makeConfig(false));
    EXPECT_EQ(h.loop.translator().translate(ev(native::CloseRequested{})), TranslateResult::QuitRequested);
    EXPECT_TRUE(h.term.quitting());
}

TEST(EventTranslator, CloseIsDeliveredWithStructuredEvents) {
    Harness h(makeConfig(true));
    EXPECT_EQ(h.loop.translator().translate(ev(native::CloseRequested{})), TranslateResult::EventQueued);
    EXPECT_FALSE(h.term.quitting());
    auto e = h.input.popEvent();
    ASSERT_TRUE(e.has_value());
    EXPECT_TRUE(std::holds_alternative<event::CloseRequested>(*e));
}

TEST(EventTranslator, KeyWithoutKeycodeIsDropped) {
    Harness h(makeConfig(true));
    native::KeyboardInput k;
    k.scancode = 99;
    k.pressed  = true;
    EXPECT_EQ(h.loop.translator().translate(ev(k)), TranslateResult::Filtered);
    EXPECT_FALSE(h.input.isScancodePressed(99));
    EXPECT_EQ(h.input.pendingEvents(), 0u);
}

TEST(EventTranslator, KeyUpdatesStateAndQueues) {
    Harness h(makeConfig(true));
    native::KeyboardInput k;
    k.keycode  = 83;
    k.scancode = 31;
    k.pressed  = true;
    EXPECT_EQ(h.loop.translator().translate(ev(k)), TranslateResult::EventQueued);
    EXPECT_TRUE(h.input.isKeyPressed(83));
    EXPECT_EQ(h.input.lastKey().value_or(-1), 83);

    auto e = h.input.popEvent();
    ASSERT_TRUE(e.has_value());
    const auto& ki = std::get<event::KeyboardInput>(*e);
    EXPECT_EQ(ki.key, 83);
    EXPECT_EQ(ki.scancode, 31);
    EXPECT_TRUE(ki.pressed);
}

TEST(EventTranslator, KeyStateUpdatesEvenWhenEventsAreOff) {
    Harness h(makeConfig(false));
    native::KeyboardInput k;
    k.keycode = 256;
    k.pressed = true;
    h.loop.translator().translate(ev(k));
    EXPECT_TRUE(h.input.isKeyPressed(256));
    EXPECT_EQ(h.input.pendingEvents(), 0u);
}

TEST(EventTranslator, CursorAndModifiersOnlyTouchState) {
    Harness h(makeConfig(true));
    auto& t = h.loop.translator();
    EXPECT_EQ(t.translate(ev(native::CursorMoved{ 12.5, 40.0 })), TranslateResult::StateUpdated);
    EXPECT_EQ(t.translate(ev(native::ModifiersChanged{ true, false, true })), TranslateResult::StateUpdated);
    EXPECT_DOUBLE_EQ(h.input.mousePhysicalX(), 12.5);
    EXPECT_DOUBLE_EQ(h.input.mousePhysicalY(), 40.0);
    EXPECT_TRUE(h.input.shift());
    EXPECT_TRUE(h.input.control());
    EXPECT_EQ(h.input.pendingEvents(), 0u);
}

TEST(EventTranslator, ExtraMouseButtonsGetStableIds) {
    Harness h(makeConfig(true));
    native::MouseButton b{ native::MouseButtonKind::Other, 2, true };
    h.loop.translator().translate(ev(b));
    EXPECT_TRUE(h.input.isMouseButtonPressed(5));
    auto e = h.input.popEvent();
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(std::get<event::MouseClick>(*e).button, 5u);
}

TEST(EventTranslator, ScaleChangeAppliesImmediately) {
    Harness h(makeConfig(true), PixelSize{ 1600, 1200 }, 1.0);
    h.surface.setScale(2.0);
    const PixelSize gridBefore = h.console->charSize();

    auto r = h.loop.translator().translate(ev(native::ScaleFactorChanged{ PixelSize{ 1600, 1200 }, 2.0 }));
    EXPECT_EQ(r, TranslateResult::ResizeApplied);
    EXPECT_EQ(h.gfx.builds, 1);
    EXPECT_DOUBLE_EQ(h.input.scaleFactor(), 2.0);
    EXPECT_EQ(h.loop.scaler().logicalSize(), (PixelSize{ 800, 600 }));
    EXPECT_TRUE(h.loop.pendingResize().empty());
    // Silent pass: no Resized event and grids stay.
    EXPECT_EQ(h.console->charSize(), gridBefore);

    auto e = h.input.popEvent();
    ASSERT_TRUE(e.has_value());
    ASSERT_TRUE(std::holds_alternative<event::ScaleFactorChanged>(*e));
    EXPECT_FLOAT_EQ(std::get<event::ScaleFactorChanged>(*e).dpiScaleFactor, 2.0f);
    EXPECT_FALSE(h.input.popEvent().has_value());
}

TEST(EventTranslator, ScaleChangeFailureIsReported) {
    Harness h(makeConfig(true));
    h.gfx.failBuild = true;
    auto r = h.loop.translator().translate(ev(native::ScaleFactorChanged{ PixelSize{ 800, 600 }, 1.25 }));
    EXPECT_EQ(r, TranslateResult::ResizeFailed);
    EXPECT_TRUE(h.rc.backingBuffer == nullptr);

    // The scale change still reaches the application.
    ASSERT_EQ(h.input.pendingEvents(), 1u);
    auto e = h.input.popEvent();
    ASSERT_TRUE(std::holds_alternative<event::ScaleFactorChanged>(*e));
    EXPECT_FLOAT_EQ(std::get<event::ScaleFactorChanged>(*e).dpiScaleFactor, 1.0f);
}

TEST(EventTranslator, ScaleChangeUpdatesTerminalPixelsAndPlacement) {
    Harness h(makeConfig(true), PixelSize{ 800, 600 }, 1.0);
    ASSERT_TRUE(h.loop.coordinator().apply(PixelSize{ 800, 600 }, 1.0, true));
    ASSERT_TRUE(h.input.popEvent().has_value());

    h.surface.setSize(PixelSize{ 1600, 1200 });
    h.surface.setScale(2.0);
    auto r = h.loop.translator().translate(ev(native::ScaleFactorChanged{ PixelSize{ 1600, 1200 }, 2.0 }));
    ASSERT_EQ(r, TranslateResult::ResizeApplied);

    EXPECT_EQ(h.term.widthPixels(), 1600u);
    EXPECT_EQ(h.term.heightPixels(), 1200u);
    EXPECT_DOUBLE_EQ(h.consoles.placement().scale, 2.0);
}

TEST(EventTranslator, TextFocusAndCursorPresenceAreQueued) {
    Harness h(makeConfig(true));
    auto& t = h.loop.translator();
    t.translate(ev(native::CharacterReceived{ U'x' }));
    t.translate(ev(native::FocusChanged{ true }));
    t.translate(ev(native::CursorEntered{}));
    t.translate(ev(native::CursorLeft{}));
    ASSERT_EQ(h.input.pendingEvents(), 4u);
    EXPECT_EQ(std::get<event::Character>(*h.input.popEvent()).c, U'x');
    EXPECT_TRUE(std::get<event::Focused>(*h.input.popEvent()).focused);
    EXPECT_TRUE(std::holds_alternative<event::CursorEntered>(*h.input.popEvent()));
    EXPECT_TRUE(std::holds_alternative<event::CursorLeft>(*h.input.popEvent()));
}

TEST(EventTranslator, ModifierKeyOwnsItsBit) {
    // Left Shift alone: chord reported before the event, empty on press, shift on release.
    const auto down = modifiersAfterKey(native::ModifiersChanged{}, ModifierKey::Shift, true, false);
    EXPECT_TRUE(down.shift);
    const auto up = modifiersAfterKey(native::ModifiersChanged{ true, false, false }, ModifierKey::Shift, false, false);
    EXPECT_FALSE(up.shift);

    const auto other = modifiersAfterKey(native::ModifiersChanged{ false, true, false }, ModifierKey::None, true, false);
    EXPECT_TRUE(other.alt);
    EXPECT_FALSE(other.shift);
}

TEST(EventTranslator, ReleasedShiftDoesNotStick) {
    Harness h(makeConfig(false));
    auto& t = h.loop.translator();

    t.translate(ev(modifiersAfterKey(native::ModifiersChanged{}, ModifierKey::Shift, true, false)));
    EXPECT_TRUE(h.input.shift());
    t.translate(ev(modifiersAfterKey(native::ModifiersChanged{ true, false, false }, ModifierKey::Shift, false, false)));
    EXPECT_FALSE(h.input.shift());
}

TEST(EventTranslator, ModifierStaysWhileOtherSideIsHeld) {
    const auto chord = modifiersAfterKey(native::ModifiersChanged{ false, false, true }, ModifierKey::Ctrl, false, true);
    EXPECT_TRUE(chord.ctrl);
}
