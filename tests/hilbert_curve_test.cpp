#include <gtest/gtest.h>

#include <cstdlib>
#include <vector>

#include "halftone_error.hpp"
#include "hilbert_curve.hpp"

static void expect_covers_rectangle(int w, int h) {
  HilbertPath path(w, h);
  std::vector<int> seen(static_cast<std::size_t>(w) * h, 0);
  std::size_t n = 0;
  for(const hilbert_point& p : path) {
    ASSERT_GE(p.x, 0);
    ASSERT_GE(p.y, 0);
    ASSERT_LT(p.x, w);
    ASSERT_LT(p.y, h);
    seen[p.y * w + p.x]++;
    n++;
  }
  EXPECT_EQ(n, path.size());
  EXPECT_EQ(n, static_cast<std::size_t>(w) * h);
  for(int count : seen) {
    EXPECT_EQ(count, 1);
  }
}

TEST(HilbertCurveTest, CoversEveryCellOnce) {
  const int sizes[][2] = {{1, 1}, {1, 7}, {5, 1}, {2, 2}, {3, 5}, {8, 8}, {17, 4}, {30, 31}, {64, 9}};
  for(const auto& s : sizes) {
    SCOPED_TRACE(testing::Message() << s[0] << "x" << s[1]);
    expect_covers_rectangle(s[0], s[1]);
  }
}

TEST(HilbertCurveTest, ConsecutivePointsAdjacentOnPowerOfTwoSquare) {
  for(int order : {2, 4, 16, 32}) {
    HilbertPath path(order, order);
    bool first = true;
    hilbert_point prev = {0, 0};
    for(const hilbert_point& p : path) {
      if(!first) {
        EXPECT_EQ(std::abs(p.x - prev.x) + std::abs(p.y - prev.y), 1);
      }
      prev = p;
      first = false;
    }
  }
}

TEST(HilbertCurveTest, StartsAtOriginAndIsDeterministic) {
  HilbertPath a(13, 9);
  HilbertPath b(13, 9);
  EXPECT_EQ(*a.begin(), (hilbert_point{0, 0}));

  std::vector<hilbert_point> pa(a.begin(), a.end());
  std::vector<hilbert_point> pb(b.begin(), b.end());
  EXPECT_TRUE(pa == pb);
}

TEST(HilbertCurveTest, OrderIsNextPowerOfTwo) {
  EXPECT_EQ(hilbert_order(1), 1);
  EXPECT_EQ(hilbert_order(2), 2);
  EXPECT_EQ(hilbert_order(3), 4);
  EXPECT_EQ(hilbert_order(694), 1024);
  EXPECT_EQ(HilbertPath(5, 12).order(), 16);
}

TEST(HilbertCurveTest, FirstLevelShape) {
  EXPECT_EQ(hilbert_d2xy(2, 0), (hilbert_point{0, 0}));
  EXPECT_EQ(hilbert_d2xy(2, 1), (hilbert_point{0, 1}));
  EXPECT_EQ(hilbert_d2xy(2, 2), (hilbert_point{1, 1}));
  EXPECT_EQ(hilbert_d2xy(2, 3), (hilbert_point{1, 0}));
}

TEST(HilbertCurveTest, RejectsEmptyRectangle) {
  EXPECT_THROW(HilbertPath(0, 3), ConfigurationError);
}
