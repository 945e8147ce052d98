#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include "halftone_config.hpp"

namespace {

const int THREAD_COUNT = 4;

class SolidRampProvider : public GlyphRampProvider {
  public:
    GlyphRamp load_ramp() const override {
      std::vector<BinaryImage> glyphs;
      for(int ink = 0; ink <= 9; ink++) {
        BinaryImage g(3, 3);
        for(int i = 0; i < ink; i++) {
          g.set(i % 3, i / 3, true);
        }
        glyphs.push_back(g);
      }
      return GlyphRamp(glyphs);
    }
};

// diagonal ramp with a per-thread phase so every thread gets its own input
GrayscaleImage test_image(int seed) {
  const int w = 37;
  const int h = 29;
  GrayscaleImage img(w, h);
  for(int y = 0; y < h; y++) {
    for(int x = 0; x < w; x++) {
      img.set(x, y, static_cast<uint8_t>((x * 7 + y * 5 + seed * 31) % 256));
    }
  }
  return img;
}

}

TEST(ConcurrentDitherTest, SharedDithererMatchesSingleThreadedRun) {
  SolidRampProvider glyphs;
  for(DitherStrategy s : all_dither_strategies()) {
    dither_config cfg;
    cfg.strategy = s;
    std::unique_ptr<Ditherer> d = make_ditherer(cfg, &glyphs);

    std::vector<GrayscaleImage> inputs;
    std::vector<BinaryImage> expected;
    for(int i = 0; i < THREAD_COUNT; i++) {
      inputs.push_back(test_image(i));
      expected.push_back(d->dither(inputs.back()));
    }

    std::vector<BinaryImage> results(THREAD_COUNT);
    std::vector<std::thread> threads;
    const Ditherer* shared = d.get();
    for(int i = 0; i < THREAD_COUNT; i++) {
      threads.push_back(std::thread([shared, &inputs, &results, i] {
        // repeat so the passes overlap
        for(int n = 0; n < 8; n++) {
          results[i] = shared->dither(inputs[i]);
        }
      }));
    }
    for(std::thread& t : threads) {
      t.join();
    }

    for(int i = 0; i < THREAD_COUNT; i++) {
      EXPECT_EQ(results[i], expected[i]) << dither_strategy_name(s) << " thread " << i;
    }
  }
}
