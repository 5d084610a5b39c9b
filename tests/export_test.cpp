#include "export.hpp"
#include "render_session.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <string>

namespace {

bool has_png_signature(const std::string& path)
{
    FILE* fp = std::fopen(path.c_str(), "rb");
    if (!fp) return false;
    unsigned char sig[8] = {};
    const size_t n = std::fread(sig, 1, sizeof(sig), fp);
    std::fclose(fp);
    static const unsigned char expected[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    return n == sizeof(sig) && std::equal(sig, sig + 8, expected);
}

}  // namespace

TEST(Export, RowConversionFollowsBufferLayout)
{
    PixelBuffer buf;
    buf.resize(2, 2);
    buf.pixels[0] = {  0.0, 100.0, 100.0, 250.0};
    buf.pixels[1] = {  0.0,   0.0,   0.0, 250.0};
    buf.pixels[2] = {120.0, 100.0, 100.0, 255.0};
    buf.pixels[3] = {240.0, 100.0, 100.0, 255.0};

    uint32_t row[2];
    to_rgba_row(buf, 0, row);
    EXPECT_EQ(row[0], 0xFA0000FFu);
    EXPECT_EQ(row[1], 0xFA000000u);
    to_rgba_row(buf, 1, row);
    EXPECT_EQ(row[0], 0xFF00FF00u);
    EXPECT_EQ(row[1], 0xFFFF0000u);
}

TEST(Export, RejectsBufferWithWrongPixelCount)
{
    PixelBuffer buf;
    buf.resize(4, 4);
    buf.pixels.pop_back();
    EXPECT_NE(export_png((::testing::TempDir() + "short.png").c_str(), buf), "");
}

TEST(Export, WritesPngFromRenderedFrame)
{
    RenderSession session(48, 32);
    ConfigPatch patch;
    patch.max_iter   = 64;
    patch.base_color = HsbColor{200.0, 60.0, 60.0};
    ASSERT_EQ(session.update(patch), "");
    ASSERT_EQ(session.render_frame(), "");

    const std::string path = ::testing::TempDir() + "fractal_sketch_export_test.png";
    ASSERT_EQ(export_image(path, session.buffer()), "");
    EXPECT_TRUE(has_png_signature(path));
    std::remove(path.c_str());
}

TEST(Export, ExtensionIsCaseInsensitive)
{
    RenderSession session(4, 4);
    ASSERT_EQ(session.render_frame(), "");
    const std::string path = ::testing::TempDir() + "fractal_sketch_upper.PNG";
    EXPECT_EQ(export_image(path, session.buffer()), "");
    std::remove(path.c_str());
}

TEST(Export, RejectsUnknownFormat)
{
    RenderSession session(4, 4);
    ASSERT_EQ(session.render_frame(), "");
    EXPECT_NE(export_image(::testing::TempDir() + "out.bmp", session.buffer()), "");
    EXPECT_NE(export_image("no_extension", session.buffer()), "");
}

TEST(Export, RejectsEmptyBuffer)
{
    PixelBuffer empty;
    EXPECT_NE(export_png((::testing::TempDir() + "empty.png").c_str(), empty), "");
}

TEST(Export, ReportsUnwritablePath)
{
    RenderSession session(4, 4);
    ASSERT_EQ(session.render_frame(), "");
    EXPECT_NE(export_png("/nonexistent-dir/sub/out.png", session.buffer()), "");
}
