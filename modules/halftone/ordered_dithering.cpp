#include "ordered_dithering.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "halftone_error.hpp"

void check_matrix_order(int order) {
  if(order < 1 || order > THRESHOLD_MATRIX_MAX_ORDER || (order & (order - 1)) != 0) {
    throw ConfigurationError("Threshold matrix order must be a power of two in [1, " + std::to_string(THRESHOLD_MATRIX_MAX_ORDER) + "] (got " + std::to_string(order) + ")");
  }
}

ThresholdMatrix::ThresholdMatrix(int order, const std::vector<uint8_t>& thresholds) {
  check_matrix_order(order);
  if(thresholds.size() != static_cast<std::size_t>(order) * order) {
    throw ConfigurationError("Threshold matrix of order " + std::to_string(order) + " needs " + std::to_string(order * order) + " values");
  }
  ORDER = order;
  values = thresholds;
}

ThresholdMatrix ThresholdMatrix::flat(uint8_t threshold) {
  return ThresholdMatrix(1, std::vector<uint8_t>(1, threshold));
}

std::vector<int> bayer_indices(int order) {
  check_matrix_order(order);
  std::vector<int> m(1, 0);
  int n = 1;
  while(n < order) {
    const int n2 = n * 2;
    std::vector<int> next(static_cast<std::size_t>(n2) * n2);
    for(int y = 0; y < n; y++) {
      for(int x = 0; x < n; x++) {
        const int v = 4 * m[y * n + x];
        next[y * n2 + x] = v;
        next[y * n2 + x + n] = v + 2;
        next[(y + n) * n2 + x] = v + 3;
        next[(y + n) * n2 + x + n] = v + 1;
      }
    }
    m.swap(next);
    n = n2;
  }
  return m;
}

uint8_t threshold_from_level(int level, int order) {
  const int cells = order * order;
  // never 0, so black still marks at orders where cells > 128
  const int t = (2 * level + 1) * 128 / cells;
  return static_cast<uint8_t>(t < 1 ? 1 : t);
}

ThresholdMatrix ThresholdMatrix::bayer(int order) {
  const std::vector<int> idx = bayer_indices(order);
  std::vector<uint8_t> t(idx.size());
  for(std::size_t i = 0; i < idx.size(); i++) {
    t[i] = threshold_from_level(idx[i], order);
  }
  return ThresholdMatrix(order, t);
}

// Round dot: the spot function peaks at the cell centre, so the centre cells
// get the highest thresholds and darken first as the input gets darker.
ThresholdMatrix ThresholdMatrix::cluster(int order) {
  check_matrix_order(order);
  const int cells = order * order;
  std::vector<double> spot(cells);
  for(int y = 0; y < order; y++) {
    for(int x = 0; x < order; x++) {
      const double u = (x + 0.5) * 2.0 / order - 1.0;
      const double v = (y + 0.5) * 2.0 / order - 1.0;
      spot[y * order + x] = std::cos(M_PI * u) + std::cos(M_PI * v);
    }
  }

  std::vector<int> rank(cells);
  for(int i = 0; i < cells; i++) {
    rank[i] = i;
  }
  std::stable_sort(rank.begin(), rank.end(), [&spot](int a, int b) {
    return spot[a] > spot[b];
  });

  std::vector<uint8_t> t(cells);
  for(int r = 0; r < cells; r++) {
    t[rank[r]] = threshold_from_level(cells - 1 - r, order);
  }
  return ThresholdMatrix(order, t);
}

OrderedDither::OrderedDither(const std::string& name, const ThresholdMatrix& m)
  : label(name), matrix(m) {}

BinaryImage OrderedDither::dither_pixels(const GrayscaleImage& image) const {
  BinaryImage out(image.width(), image.height());
  for(int y = 0; y < image.height(); y++) {
    for(int x = 0; x < image.width(); x++) {
      out.set(x, y, image.at(x, y) < matrix.at(x, y));
    }
  }
  return out;
}

YliluomaDither::YliluomaDither(int order, const std::vector<uint8_t>& gray_palette) {
  check_matrix_order(order);
  if(gray_palette.size() < 2) {
    throw ConfigurationError("Yliluoma palette needs at least two gray levels");
  }
  ORDER = order;
  indices = bayer_indices(order);

  palette = gray_palette;
  std::sort(palette.begin(), palette.end());
  palette.erase(std::unique(palette.begin(), palette.end()), palette.end());
  if(palette.size() < 2) {
    throw ConfigurationError("Yliluoma palette needs at least two distinct gray levels");
  }

  for(int v = 0; v < 256; v++) {
    plans[v] = devise_mixing_plan(v);
  }
}

YliluomaDither::mixing_plan YliluomaDither::devise_mixing_plan(int value) const {
  const int cells = ORDER * ORDER;
  double least_penalty = std::numeric_limits<double>::max();
  mixing_plan best = {palette[0], palette[0], 0};

  for(std::size_t i = 0; i < palette.size(); i++) {
    for(std::size_t j = i; j < palette.size(); j++) {
      const int c1 = palette[i];
      const int c2 = palette[j];
      int ratio = 0;
      if(c1 != c2) {
        ratio = static_cast<int>(std::lround(static_cast<double>(value - c1) * cells / (c2 - c1)));
        ratio = std::max(0, std::min(cells, ratio));
      }
      const double mixed = c1 + static_cast<double>(ratio) * (c2 - c1) / cells;
      const double err = (value - mixed) / 255.0;
      const double spread = (c1 - c2) / 255.0;
      const double penalty = err * err
        + 0.1 * spread * spread * (std::fabs(static_cast<double>(ratio) / cells - 0.5) + 0.5);
      if(penalty < least_penalty) {
        least_penalty = penalty;
        best.color1 = static_cast<uint8_t>(c1);
        best.color2 = static_cast<uint8_t>(c2);
        best.ratio = ratio;
      }
    }
  }
  return best;
}

uint8_t YliluomaDither::resolve(int x, int y, uint8_t value) const {
  const mixing_plan& plan = plans[value];
  const int index = indices[(y % ORDER) * ORDER + (x % ORDER)];
  return index < plan.ratio ? plan.color2 : plan.color1;
}

BinaryImage YliluomaDither::dither_pixels(const GrayscaleImage& image) const {
  BinaryImage out(image.width(), image.height());
  for(int y = 0; y < image.height(); y++) {
    for(int x = 0; x < image.width(); x++) {
      out.set(x, y, resolve(x, y, image.at(x, y)) < 128);
    }
  }
  return out;
}
