#include <gtest/gtest.h>
#include <vellum/image.hpp>
#include <vector>

using namespace vellum;

// --- MakeFromPixmap ---

TEST(Image, MakeFromPixmapCopiesData) {
    auto pm = Pixmap::Alloc(4, 4);
    ASSERT_TRUE(pm.valid());
    pm.clear({0xAA, 0xBB, 0xCC, 0xDD});

    auto img = Image::MakeFromPixmap(pm);
    ASSERT_NE(img, nullptr);
    EXPECT_EQ(img->width(), 4);
    EXPECT_EQ(img->height(), 4);

    // Modify the original pixmap; the image keeps its own copy.
    pm.setColor(0, 0, {1, 2, 3, 4});
    EXPECT_EQ(img->getColor(0, 0).toU32(), 0xAABBCCDDu);
}

TEST(Image, MakeFromPixmapInvalidReturnsNull) {
    Pixmap pm;
    EXPECT_EQ(Image::MakeFromPixmap(pm), nullptr);
}

// --- MakeFromRGBA ---

TEST(Image, MakeFromRGBAExactLength) {
    std::vector<u8> bytes = {
        255, 0, 0, 255,   0, 255, 0, 255,
        0, 0, 255, 255,   1, 2, 3, 4,
    };
    auto img = Image::MakeFromRGBA(2, 2, bytes.data(), bytes.size());
    ASSERT_NE(img, nullptr);
    EXPECT_EQ(img->stride(), 8);
    EXPECT_EQ(img->getColor(1, 0).toU32(), 0x00FF00FFu);
    EXPECT_EQ(img->getColor(1, 1).toU32(), 0x01020304u);
}

TEST(Image, MakeFromRGBACopiesCallerBuffer) {
    std::vector<u8> bytes(4 * 4, 7);
    auto img = Image::MakeFromRGBA(2, 2, bytes.data(), bytes.size());
    ASSERT_NE(img, nullptr);
    bytes[0] = 99;
    EXPECT_EQ(img->getColor(0, 0).r, 7);
}

TEST(Image, MakeFromRGBALengthMismatchReturnsNull) {
    std::vector<u8> bytes(15, 0);
    EXPECT_EQ(Image::MakeFromRGBA(2, 2, bytes.data(), bytes.size()), nullptr);
}

TEST(Image, MakeFromRGBAEmptyDimensionsReturnNull) {
    std::vector<u8> bytes(16, 0);
    EXPECT_EQ(Image::MakeFromRGBA(0, 4, bytes.data(), 0), nullptr);
    EXPECT_EQ(Image::MakeFromRGBA(2, 2, nullptr, 16), nullptr);
}

// --- Identity ---

TEST(Image, UniqueIdsDiffer) {
    auto pm = Pixmap::Alloc(1, 1);
    auto a = Image::MakeFromPixmap(pm);
    auto b = Image::MakeFromPixmap(pm);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_NE(a->uniqueId(), b->uniqueId());
}
