#ifndef LABEL_HALFTONE_ORDERED_DITHERING_HPP
#define LABEL_HALFTONE_ORDERED_DITHERING_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "ditherer.hpp"

#define THRESHOLD_MATRIX_MAX_ORDER 64

// Square threshold pattern of order N (a power of two), stored row-major with
// rows indexed by y. Lookups wrap, so any image size tiles the pattern.
class ThresholdMatrix {
  private:
    int ORDER;
    std::vector<uint8_t> values;

  public:
    ThresholdMatrix(int order, const std::vector<uint8_t>& thresholds);

    int order() const { return ORDER; }
    uint8_t at(int x, int y) const { return values[(y % ORDER) * ORDER + (x % ORDER)]; }

    // order 1, every pixel compared against the same value
    static ThresholdMatrix flat(uint8_t threshold);
    static ThresholdMatrix bayer(int order);
    static ThresholdMatrix cluster(int order);
};

// Throws ConfigurationError unless order is a power of two in [1, 64].
void check_matrix_order(int order);

// Recursive Bayer index matrix, values 0 .. order*order-1, row-major.
std::vector<int> bayer_indices(int order);

// Spreads rank levels 0 .. order*order-1 evenly over 1..255.
uint8_t threshold_from_level(int level, int order);

// dark = intensity < matrix(x, y). No error term, pixels are independent.
class OrderedDither final : public Ditherer {
  private:
    std::string label;
    ThresholdMatrix matrix;

  protected:
    BinaryImage dither_pixels(const GrayscaleImage& image) const override;

  public:
    OrderedDither(const std::string& name, const ThresholdMatrix& m);

    const char* name() const override { return label.c_str(); }
    const ThresholdMatrix& threshold_matrix() const { return matrix; }
};

// Yliluoma's ordered dithering (algorithm 1) over a gray palette. For every
// input level the best two-colour mix and its ratio are searched once; the
// Bayer index at (x, y) then picks one colour of the pair.
class YliluomaDither final : public Ditherer {
  private:
    struct mixing_plan {
      uint8_t color1;
      uint8_t color2;
      int ratio;
    };

    int ORDER;
    std::vector<int> indices;
    std::vector<uint8_t> palette;
    mixing_plan plans[256];

    mixing_plan devise_mixing_plan(int value) const;

  protected:
    BinaryImage dither_pixels(const GrayscaleImage& image) const override;

  public:
    YliluomaDither(int order, const std::vector<uint8_t>& gray_palette);

    const char* name() const override { return "yliluoma"; }

    // gray level the pixel at (x, y) resolves to
    uint8_t resolve(int x, int y, uint8_t value) const;
};

#endif
