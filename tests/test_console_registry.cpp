#include <gtest/gtest.h>

#include <stdexcept>

#include "test_fakes.hpp"
#include "tile_console.hpp"

using namespace kachel;
using namespace kachel::test;

namespace {
FontDescriptor font(std::uint32_t w, std::uint32_t h) {
    FontDescriptor f;
    f.tileWidth  = w;
    f.tileHeight = h;
    return f;
}
}

TEST(ConsoleRegistry, LargestActiveFontOnlyCountsUsedFonts) {
    ConsoleRegistry reg;
    const auto small = reg.addFont(font(8, 8));
    reg.addFont(font(32, 32)); // never used
    const auto tall = reg.addFont(font(8, 16));
    reg.addConsole(std::make_unique<FakeConsole>(small, PixelSize{ 1, 1 }));
    reg.addConsole(std::make_unique<FakeConsole>(tall, PixelSize{ 1, 1 }));
    EXPECT_EQ(reg.largestActiveFont(), (PixelSize{ 8, 16 }));
}

TEST(ConsoleRegistry, NoConsolesMeansNoFont) {
    ConsoleRegistry reg;
    reg.addFont(font(8, 8));
    EXPECT_EQ(reg.largestActiveFont(), (PixelSize{ 0, 0 }));
}

TEST(ConsoleRegistry, NullConsoleIsRejected) {
    ConsoleRegistry reg;
    EXPECT_THROW(reg.addConsole(nullptr), std::invalid_argument);
}

TEST(ConsoleRegistry, AutoScaleUsesEachConsolesFont) {
    ConsoleRegistry reg;
    const auto a = reg.addFont(font(8, 8));
    const auto b = reg.addFont(font(16, 16));
    const auto z = reg.addFont(font(0, 8));
    auto* ca = new FakeConsole(a, PixelSize{});
    auto* cb = new FakeConsole(b, PixelSize{});
    auto* cz = new FakeConsole(z, PixelSize{ 3, 3 });
    reg.addConsole(std::unique_ptr<ConsoleBackend>(ca));
    reg.addConsole(std::unique_ptr<ConsoleBackend>(cb));
    reg.addConsole(std::unique_ptr<ConsoleBackend>(cz));

    reg.applyAutoScale(800, 600);
    EXPECT_EQ(ca->charSize(), (PixelSize{ 100, 75 }));
    EXPECT_EQ(cb->charSize(), (PixelSize{ 50, 37 }));
    EXPECT_EQ(cz->charSize(), (PixelSize{ 3, 3 }));
}

TEST(ConsoleRegistry, DrawSkipsConsolesWithMissingFont) {
    ConsoleRegistry reg;
    const auto f = reg.addFont(font(8, 8));
    auto* good = new FakeConsole(f, PixelSize{});
    auto* bad  = new FakeConsole(42, PixelSize{});
    reg.addConsole(std::unique_ptr<ConsoleBackend>(good));
    reg.addConsole(std::unique_ptr<ConsoleBackend>(bad));

    FakeGraphicsDevice gfx;
    reg.drawAll(gfx);
    EXPECT_EQ(good->draws, 1);
    EXPECT_EQ(bad->draws, 0);
}

TEST(ConsoleRegistry, SyncReportsAnyFailure) {
    ConsoleRegistry reg;
    const auto f = reg.addFont(font(8, 8));
    auto* ok   = new FakeConsole(f, PixelSize{});
    auto* fail = new FakeConsole(f, PixelSize{});
    fail->backingOk = false;
    reg.addConsole(std::unique_ptr<ConsoleBackend>(ok));
    reg.addConsole(std::unique_ptr<ConsoleBackend>(fail));
    EXPECT_FALSE(reg.syncBackings());
    EXPECT_EQ(ok->backingChecks, 1);
    EXPECT_EQ(fail->backingChecks, 1);
}

TEST(TileConsole, DrawsLitCellsTopDown) {
    TileConsole con(0, 4, 3);
    con.set(1, 0, ColorRGB{ 1.0f, 0.0f, 0.0f });
    con.set(3, 2, ColorRGB{ 0.0f, 1.0f, 0.0f });
    con.set(9, 9, ColorRGB{ 1.0f, 1.0f, 1.0f }); // ignored
    EXPECT_TRUE(con.dirty());
    con.rebuildIfDirty();
    EXPECT_FALSE(con.dirty());
    EXPECT_EQ(con.litCells(), 2u);

    FakeGraphicsDevice gfx;
    gfx.viewport = PixelSize{ 32, 24 };
    con.draw(gfx, font(8, 8), ConsolePlacement{});

    ASSERT_EQ(gfx.scissors.size(), 2u);
    EXPECT_EQ(gfx.scissors[0], (std::vector<int>{ 8, 16, 8, 8 }));
    EXPECT_EQ(gfx.scissors[1], (std::vector<int>{ 24, 0, 8, 8 }));
    EXPECT_EQ(gfx.count("clear"), 2);
    EXPECT_EQ(gfx.calls.back(), "noscissor");
}

TEST(TileConsole, ResizeKeepsTheOverlap) {
    TileConsole con(0, 4, 4);
    con.set(1, 1, ColorRGB{ 0.5f, 0.5f, 0.5f });
    con.set(3, 3, ColorRGB{ 0.5f, 0.5f, 0.5f });
    con.setCharSize(2, 2);
    EXPECT_EQ(con.charSize(), (PixelSize{ 2, 2 }));
    EXPECT_FLOAT_EQ(con.at(1, 1).r, 0.5f);
    con.setCharSize(6, 6);
    EXPECT_FLOAT_EQ(con.at(1, 1).r, 0.5f);
    EXPECT_FLOAT_EQ(con.at(3, 3).r, 0.0f);
}

TEST(TileConsole, ClsEmptiesTheGrid) {
    TileConsole con(0, 2, 2);
    con.set(0, 0, ColorRGB{ 1.0f, 1.0f, 1.0f });
    con.cls();
    con.rebuildIfDirty();
    EXPECT_EQ(con.litCells(), 0u);
    FakeGraphicsDevice gfx;
    con.draw(gfx, font(8, 8), ConsolePlacement{});
    EXPECT_TRUE(gfx.calls.empty());
}

TEST(TileConsole, HighDpiScalesTilesAndHonorsGutter) {
    TileConsole con(0, 2, 2);
    con.set(0, 0, ColorRGB{ 1.0f, 0.0f, 0.0f });
    con.set(1, 1, ColorRGB{ 0.0f, 0.0f, 1.0f });
    con.rebuildIfDirty();

    FakeGraphicsDevice gfx;
    gfx.viewport = PixelSize{ 100, 80 };
    con.draw(gfx, font(8, 8), ConsolePlacement{ 2.0, 3, 1 });

    // Logical tile (3,1)-(11,9) becomes (6,2)-(22,18); GL counts y from the bottom.
    ASSERT_EQ(gfx.scissors.size(), 2u);
    EXPECT_EQ(gfx.scissors[0], (std::vector<int>{ 6, 62, 16, 16 }));
    EXPECT_EQ(gfx.scissors[1], (std::vector<int>{ 22, 46, 16, 16 }));
}

TEST(TileConsole, FractionalScaleLeavesNoSeams) {
    TileConsole con(0, 2, 1);
    con.set(0, 0, ColorRGB{ 1.0f, 1.0f, 1.0f });
    con.set(1, 0, ColorRGB{ 1.0f, 1.0f, 1.0f });
    con.rebuildIfDirty();

    FakeGraphicsDevice gfx;
    gfx.viewport = PixelSize{ 64, 64 };
    con.draw(gfx, font(5, 5), ConsolePlacement{ 1.5, 0, 0 });

    ASSERT_EQ(gfx.scissors.size(), 2u);
    const auto& a = gfx.scissors[0];
    const auto& b = gfx.scissors[1];
    EXPECT_EQ(a[0] + a[2], b[0]);
    EXPECT_EQ(b[0] + b[2], 15);
}

TEST(ConsoleRegistry, DrawPassesCurrentPlacement) {
    ConsoleRegistry reg;
    const auto f = reg.addFont(font(8, 8));
    auto* con = new FakeConsole(f, PixelSize{});
    reg.addConsole(std::unique_ptr<ConsoleBackend>(con));
    reg.setPlacement(ConsolePlacement{ 1.5, 4, 2 });

    FakeGraphicsDevice gfx;
    reg.drawAll(gfx);
    EXPECT_DOUBLE_EQ(con->lastPlace.scale, 1.5);
    EXPECT_EQ(con->lastPlace.originX, 4u);
    EXPECT_EQ(con->lastPlace.originY, 2u);
}
