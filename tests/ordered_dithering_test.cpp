#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "halftone_error.hpp"
#include "ordered_dithering.hpp"

static GrayscaleImage gradient(int w, int h) {
  GrayscaleImage img(w, h);
  for(int y = 0; y < h; y++) {
    for(int x = 0; x < w; x++) {
      img.set(x, y, static_cast<uint8_t>((x * 255) / (w - 1)));
    }
  }
  return img;
}

TEST(OrderedDitherTest, CheckerboardWithOrderTwoMatrix) {
  GrayscaleImage img(2, 2, std::vector<uint8_t>{0, 255, 255, 0});
  OrderedDither dither("test", ThresholdMatrix(2, {64, 192, 192, 64}));
  BinaryImage out = dither.dither(img);

  EXPECT_TRUE(out.at(0, 0));
  EXPECT_FALSE(out.at(1, 0));
  EXPECT_FALSE(out.at(0, 1));
  EXPECT_TRUE(out.at(1, 1));
}

TEST(OrderedDitherTest, MatrixWrapsForNonMultipleSizes) {
  // one dark threshold cell at (1, 0) of a 2x2 tile
  OrderedDither dither("test", ThresholdMatrix(2, {0, 255, 0, 0}));
  GrayscaleImage img(5, 3, 100);
  BinaryImage out = dither.dither(img);
  ASSERT_EQ(out.width(), 5);
  ASSERT_EQ(out.height(), 3);
  for(int y = 0; y < 3; y++) {
    for(int x = 0; x < 5; x++) {
      EXPECT_EQ(out.at(x, y), x % 2 == 1 && y % 2 == 0) << x << "," << y;
    }
  }
}

TEST(OrderedDitherTest, RunningTwiceIsBitIdentical) {
  OrderedDither dither("bayer", ThresholdMatrix::bayer(8));
  GrayscaleImage img = gradient(37, 11);
  EXPECT_EQ(dither.dither(img), dither.dither(img));
}

TEST(OrderedDitherTest, WhiteStaysLightBlackGoesDark) {
  const ThresholdMatrix matrices[] = {
    ThresholdMatrix::flat(128), ThresholdMatrix::bayer(4), ThresholdMatrix::bayer(8), ThresholdMatrix::cluster(8),
  };
  for(const ThresholdMatrix& m : matrices) {
    OrderedDither dither("m", m);
    EXPECT_EQ(count_dark(dither.dither(GrayscaleImage(4, 4, 255))), 0u);
    EXPECT_EQ(count_dark(dither.dither(GrayscaleImage(4, 4, 0))), 16u);
  }
}

TEST(ThresholdMatrixTest, BayerIndicesAreAPermutation) {
  for(int order : {1, 2, 4, 8, 16}) {
    std::vector<int> idx = bayer_indices(order);
    std::sort(idx.begin(), idx.end());
    for(int i = 0; i < order * order; i++) {
      EXPECT_EQ(idx[i], i);
    }
  }
}

TEST(ThresholdMatrixTest, BayerOrderTwo) {
  EXPECT_EQ(bayer_indices(2), (std::vector<int>{0, 2, 3, 1}));
  ThresholdMatrix m = ThresholdMatrix::bayer(2);
  EXPECT_EQ(m.at(0, 0), 32);
  EXPECT_EQ(m.at(1, 0), 160);
  EXPECT_EQ(m.at(0, 1), 224);
  EXPECT_EQ(m.at(1, 1), 96);
}

TEST(ThresholdMatrixTest, FlatIsPlainThreshold) {
  OrderedDither dither("threshold", ThresholdMatrix::flat(128));
  GrayscaleImage img(2, 1, std::vector<uint8_t>{127, 128});
  BinaryImage out = dither.dither(img);
  EXPECT_TRUE(out.at(0, 0));
  EXPECT_FALSE(out.at(1, 0));
}

TEST(ThresholdMatrixTest, ClusterGrowsFromTheCentre) {
  ThresholdMatrix m = ThresholdMatrix::cluster(4);
  const uint8_t centre = std::min(std::min(m.at(1, 1), m.at(2, 1)), std::min(m.at(1, 2), m.at(2, 2)));
  const uint8_t corner = std::max(std::max(m.at(0, 0), m.at(3, 0)), std::max(m.at(0, 3), m.at(3, 3)));
  EXPECT_GT(centre, corner);

  std::vector<int> seen;
  for(int y = 0; y < 4; y++) {
    for(int x = 0; x < 4; x++) {
      seen.push_back(m.at(x, y));
    }
  }
  std::sort(seen.begin(), seen.end());
  EXPECT_TRUE(std::adjacent_find(seen.begin(), seen.end()) == seen.end());
}

TEST(ThresholdMatrixTest, RejectsBadOrder) {
  EXPECT_THROW(ThresholdMatrix::bayer(3), ConfigurationError);
  EXPECT_THROW(ThresholdMatrix::cluster(0), ConfigurationError);
  EXPECT_THROW(ThresholdMatrix::bayer(128), ConfigurationError);
  EXPECT_THROW(ThresholdMatrix(2, {1, 2, 3}), ConfigurationError);
}

TEST(YliluomaDitherTest, ExtremesAndMidGray) {
  YliluomaDither dither(8, {0, 255});
  EXPECT_EQ(count_dark(dither.dither(GrayscaleImage(8, 8, 255))), 0u);
  EXPECT_EQ(count_dark(dither.dither(GrayscaleImage(8, 8, 0))), 64u);
  EXPECT_EQ(count_dark(dither.dither(GrayscaleImage(8, 8, 128))), 32u);
}

TEST(YliluomaDitherTest, DarkCountIsMonotonicInIntensity) {
  YliluomaDither dither(8, {0, 255});
  std::size_t prev = 64;
  for(int v = 0; v < 256; v += 5) {
    const std::size_t dark = count_dark(dither.dither(GrayscaleImage(8, 8, static_cast<uint8_t>(v))));
    EXPECT_LE(dark, prev) << "intensity " << v;
    prev = dark;
  }
}

TEST(YliluomaDitherTest, ResolvesToPaletteEntries) {
  YliluomaDither dither(4, {255, 0, 85, 170, 85});
  for(int v = 0; v < 256; v += 17) {
    const uint8_t c = dither.resolve(3, 1, static_cast<uint8_t>(v));
    EXPECT_TRUE(c == 0 || c == 85 || c == 170 || c == 255) << int(c);
  }
}

TEST(YliluomaDitherTest, RejectsDegeneratePalette) {
  EXPECT_THROW(YliluomaDither(8, {128}), ConfigurationError);
  EXPECT_THROW(YliluomaDither(8, {7, 7}), ConfigurationError);
}

TEST(ThresholdMatrixTest, LargeMatricesStillMarkBlackAndSkipWhite) {
  const int orders[] = {16, 32, 64};
  for(int order : orders) {
    OrderedDither bayer("bayer", ThresholdMatrix::bayer(order));
    OrderedDither cluster("cluster", ThresholdMatrix::cluster(order));
    const GrayscaleImage black(order, order, 0);
    const GrayscaleImage white(order, order, 255);
    const std::size_t cells = static_cast<std::size_t>(order) * order;
    EXPECT_EQ(count_dark(bayer.dither(black)), cells) << order;
    EXPECT_EQ(count_dark(cluster.dither(black)), cells) << order;
    EXPECT_EQ(count_dark(bayer.dither(white)), 0u) << order;
    EXPECT_EQ(count_dark(cluster.dither(white)), 0u) << order;
  }
}
