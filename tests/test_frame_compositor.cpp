#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "frame_compositor.hpp"
#include "test_fakes.hpp"

using namespace kachel;
using namespace kachel::test;

namespace {

class RecordingDraw final : public CustomDraw {
public:
    explicit RecordingDraw(const FakeConsole& c) : console(c) {}
    void draw(GraphicsOps& gfx) override {
        ++calls;
        consoleDrawsBefore = console.draws;
        gfx.setScissor(0, 0, 1, 1);
    }
    const FakeConsole& console;
    int calls = 0;
    int consoleDrawsBefore = -1;
};

struct CompositorFixture : ::testing::Test {
    CompositorFixture()
        : cfg()
        , rc(cfg)
        , input(false)
        , term(rc, input, consoles, cfg)
        , compositor(gfx, rc, consoles, term, stats) {
        const std::size_t font = consoles.addFont(FontDescriptor{});
        auto c = std::make_unique<FakeConsole>(font, PixelSize{ 10, 10 });
        console = c.get();
        consoles.addConsole(std::move(c));
        term.resizePixels(4, 2);
        rc.backingBuffer = std::make_unique<FakeTarget>(PixelSize{ 4, 2 }, 1);
        stats.start(0);
    }

    TerminalConfig     cfg;
    FakeGraphicsDevice gfx;
    RenderContext      rc;
    InputState         input;
    ConsoleRegistry    consoles;
    Terminal           term;
    FrameStats         stats;
    FrameCompositor    compositor;
    FakeConsole*       console = nullptr;
    RecordingGame      game;
};

} // namespace

TEST_F(CompositorFixture, DirectFrameWithoutPostProcessing) {
    term.postScanlines = false;
    FrameReport r = compositor.tock(game, 16);
    EXPECT_FALSE(r.composited);
    EXPECT_EQ(gfx.calls, (std::vector<std::string>{ "bindDefault", "clear" }));
    EXPECT_FLOAT_EQ(gfx.lastClear[0], 0.0f);
    EXPECT_FLOAT_EQ(gfx.lastClear[3], 1.0f);
    EXPECT_EQ(game.ticks, 1);
    EXPECT_EQ(console->backingChecks, 1);
    EXPECT_EQ(console->rebuilds, 1);
    EXPECT_EQ(console->draws, 1);
}

TEST_F(CompositorFixture, PostPassSamplesTheCompositeTarget) {
    term.postScanlines  = true;
    term.postScreenburn = true;
    term.screenBurnColor = ColorRGB{ 0.0f, 1.0f, 1.0f };

    FrameReport r = compositor.tock(game, 16);
    EXPECT_TRUE(r.composited);
    EXPECT_EQ(gfx.calls, (std::vector<std::string>{ "bindComposite", "clear", "bindDefault", "post" }));
    EXPECT_EQ(gfx.lastPostTarget, (PixelSize{ 4, 2 }));
    EXPECT_FLOAT_EQ(gfx.lastPost.screenWidth, 4.0f);
    EXPECT_FLOAT_EQ(gfx.lastPost.screenHeight, 2.0f);
    EXPECT_TRUE(gfx.lastPost.screenBurn);
    EXPECT_FLOAT_EQ(gfx.lastPost.screenBurnColor.g, 1.0f);
}

TEST_F(CompositorFixture, MissingTargetFallsBackToDirect) {
    term.postScanlines = true;
    rc.backingBuffer.reset();
    FrameReport r = compositor.tock(game, 16);
    EXPECT_FALSE(r.composited);
    EXPECT_EQ(gfx.count("bindComposite"), 0);
    EXPECT_EQ(gfx.count("post"), 0);
    EXPECT_EQ(game.ticks, 1);
}

TEST_F(CompositorFixture, CustomDrawRunsAfterConsoles) {
    RecordingDraw draw(*console);
    rc.customDraw = &draw;
    compositor.tock(game, 16);
    EXPECT_EQ(draw.calls, 1);
    EXPECT_EQ(draw.consoleDrawsBefore, 1);
    EXPECT_EQ(gfx.count("scissor"), 1);
}

TEST_F(CompositorFixture, TimingIsPublishedBeforeTheTick) {
    float seenFrameTime = -1.0f;
    game.onTick = [&](Terminal& t) { seenFrameTime = t.frameTimeMs(); };
    compositor.tock(game, 25);
    EXPECT_FLOAT_EQ(seenFrameTime, 25.0f);
}

TEST_F(CompositorFixture, ScreenshotIsWrittenAndRequestCleared) {
    const std::string path = std::string(::testing::TempDir()) + "kachel_tock.bmp";
    term.screenshot(path);
    ASSERT_TRUE(rc.screenshotRequest.has_value());

    FrameReport r = compositor.tock(game, 16);
    EXPECT_TRUE(r.screenshotAttempted);
    EXPECT_TRUE(r.screenshotSaved);
    EXPECT_FALSE(rc.screenshotRequest.has_value());
    EXPECT_EQ(gfx.count("read"), 1);

    std::ifstream in(path, std::ios::binary | std::ios::ate);
    ASSERT_TRUE(in.good());
    EXPECT_EQ(static_cast<long>(in.tellg()), 54L + 12L * 2L); // 4 px * 3 = 12 bytes per row
    in.close();
    std::remove(path.c_str());
}

TEST_F(CompositorFixture, FailedScreenshotIsNotRetried) {
    gfx.failRead = true;
    term.screenshot(std::string(::testing::TempDir()) + "kachel_never.bmp");

    FrameReport first = compositor.tock(game, 16);
    EXPECT_TRUE(first.screenshotAttempted);
    EXPECT_FALSE(first.screenshotSaved);
    EXPECT_FALSE(rc.screenshotRequest.has_value());
    EXPECT_EQ(game.ticks, 1);

    FrameReport second = compositor.tock(game, 32);
    EXPECT_FALSE(second.screenshotAttempted);
    EXPECT_EQ(gfx.count("read"), 1);
}

TEST_F(CompositorFixture, ScreenshotRequestedDuringTickIsTakenThisFrame) {
    const std::string path = std::string(::testing::TempDir()) + "kachel_in_tick.bmp";
    game.onTick = [&](Terminal& t) { t.screenshot(path); };
    FrameReport r = compositor.tock(game, 16);
    EXPECT_TRUE(r.screenshotSaved);
    std::remove(path.c_str());
}
