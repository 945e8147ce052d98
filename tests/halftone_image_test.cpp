#include <gtest/gtest.h>

#include <vector>

#include "halftone_error.hpp"
#include "halftone_image.hpp"

TEST(GrayscaleImageTest, RejectsNonPositiveDimensions) {
  EXPECT_THROW(GrayscaleImage(0, 4), ConfigurationError);
  EXPECT_THROW(GrayscaleImage(4, -1), ConfigurationError);
  EXPECT_THROW(BinaryImage(0, 0), ConfigurationError);
}

TEST(GrayscaleImageTest, RejectsBufferOfWrongLength) {
  std::vector<uint8_t> data(5, 0);
  EXPECT_THROW(GrayscaleImage(2, 2, data), ConfigurationError);
}

TEST(GrayscaleImageTest, RowMajorAccess) {
  GrayscaleImage img(3, 2, std::vector<uint8_t>{0, 1, 2, 3, 4, 5});
  EXPECT_EQ(img.at(2, 0), 2);
  EXPECT_EQ(img.at(0, 1), 3);
  EXPECT_EQ(img.at(2, 1), 5);
}

TEST(PackRowsTest, MsbFirstWithZeroPadding) {
  BinaryImage img(10, 2);
  img.set(0, 0, true);
  img.set(7, 0, true);
  img.set(9, 0, true);
  img.set(1, 1, true);

  const std::vector<uint8_t> raster = pack_rows(img);
  ASSERT_EQ(raster.size(), 4u);
  EXPECT_EQ(raster[0], 0x81);
  EXPECT_EQ(raster[1], 0x40);
  EXPECT_EQ(raster[2], 0x40);
  EXPECT_EQ(raster[3], 0x00);
}

TEST(PackRowsTest, UnpackRestoresImage) {
  BinaryImage img(13, 3);
  for(int y = 0; y < 3; y++) {
    for(int x = 0; x < 13; x++) {
      img.set(x, y, (x * 7 + y * 3) % 5 == 0);
    }
  }
  EXPECT_EQ(unpack_rows(pack_rows(img), 13, 3), img);
}

TEST(PackRowsTest, UnpackRejectsShortRaster) {
  std::vector<uint8_t> raster(3, 0);
  EXPECT_THROW(unpack_rows(raster, 9, 2), ConfigurationError);
}

TEST(ToneAdjustTest, BrightnessScalesAndClamps) {
  GrayscaleImage img(2, 1, std::vector<uint8_t>{100, 240});
  GrayscaleImage out = adjust_brightness(img, 1.2);
  EXPECT_EQ(out.at(0, 0), 120);
  EXPECT_EQ(out.at(1, 0), 255);
  EXPECT_EQ(img.at(0, 0), 100);
}

TEST(ToneAdjustTest, ContrastPivotsAroundMean) {
  GrayscaleImage img(2, 1, std::vector<uint8_t>{100, 200});
  GrayscaleImage out = adjust_contrast(img, 2.0);
  EXPECT_EQ(out.at(0, 0), 50);
  EXPECT_EQ(out.at(1, 0), 250);

  GrayscaleImage same = adjust_contrast(img, 1.0);
  EXPECT_EQ(same.at(0, 0), 100);
  EXPECT_EQ(same.at(1, 0), 200);
}

TEST(ToneAdjustTest, RejectsNegativeFactor) {
  GrayscaleImage img(2, 2);
  EXPECT_THROW(adjust_brightness(img, -0.5), ConfigurationError);
  EXPECT_THROW(adjust_contrast(img, -1.0), ConfigurationError);
}
