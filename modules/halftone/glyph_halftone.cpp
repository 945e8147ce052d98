#include "glyph_halftone.hpp"

#include <cmath>

#include "halftone_error.hpp"
#include "halftone_log.hpp"

GlyphRamp::GlyphRamp(const std::vector<BinaryImage>& bitmaps, const std::string& labels) {
  if(bitmaps.empty()) {
    throw ConfigurationError("Glyph ramp is empty");
  }
  if(!labels.empty() && labels.size() != bitmaps.size()) {
    throw ConfigurationError("Glyph ramp has " + std::to_string(bitmaps.size()) + " glyphs but " + std::to_string(labels.size()) + " labels");
  }

  const int w = bitmaps[0].width();
  const int h = bitmaps[0].height();
  if(w <= 0 || h <= 0) {
    throw ConfigurationError("Glyph cell size must be positive");
  }

  std::size_t prev_ink = 0;
  for(std::size_t i = 0; i < bitmaps.size(); i++) {
    if(bitmaps[i].width() != w || bitmaps[i].height() != h) {
      throw ConfigurationError("Glyph " + std::to_string(i) + " is not " + std::to_string(w) + "x" + std::to_string(h));
    }
    const std::size_t ink = count_dark(bitmaps[i]);
    if(ink < prev_ink) {
      throw ConfigurationError("Glyph " + std::to_string(i) + " is lighter than the glyph before it");
    }
    prev_ink = ink;
  }

  glyphs = bitmaps;
  chars = labels;
  GLYPH_WIDTH = w;
  GLYPH_HEIGHT = h;
}

std::size_t glyph_index(int intensity, std::size_t ramp_length) {
  if(ramp_length <= 1) {
    return 0;
  }
  if(intensity < 0) {
    intensity = 0;
  } else if(intensity > 255) {
    intensity = 255;
  }
  const double pos = (255.0 - intensity) / 255.0 * (ramp_length - 1);
  return static_cast<std::size_t>(std::lround(pos));
}

// Per output index: the source samples it covers and by how much.
struct coverage {
  int first;
  std::vector<double> weights;
};

static std::vector<coverage> box_coverage(int src_len, int dst_len) {
  std::vector<coverage> table(dst_len);
  const double scale = static_cast<double>(src_len) / dst_len;
  for(int i = 0; i < dst_len; i++) {
    const double start = i * scale;
    const double end = (i + 1) * scale;
    int first = static_cast<int>(std::floor(start));
    int last = static_cast<int>(std::ceil(end)) - 1;
    if(last >= src_len) {
      last = src_len - 1;
    }
    table[i].first = first;
    for(int j = first; j <= last; j++) {
      const double lo = start > j ? start : j;
      const double hi = end < j + 1 ? end : j + 1;
      table[i].weights.push_back(hi > lo ? (hi - lo) / scale : 0.0);
    }
  }
  return table;
}

GrayscaleImage area_resample(const GrayscaleImage& image, int w, int h) {
  check_dimensions(image.width(), image.height());
  check_dimensions(w, h);

  const std::vector<coverage> cols = box_coverage(image.width(), w);
  const std::vector<coverage> rows = box_coverage(image.height(), h);

  // horizontal pass into a w x src_h float buffer, then vertical
  std::vector<double> tmp(static_cast<std::size_t>(w) * image.height());
  for(int y = 0; y < image.height(); y++) {
    for(int x = 0; x < w; x++) {
      double v = 0.0;
      for(std::size_t k = 0; k < cols[x].weights.size(); k++) {
        v += image.at(cols[x].first + static_cast<int>(k), y) * cols[x].weights[k];
      }
      tmp[static_cast<std::size_t>(y) * w + x] = v;
    }
  }

  GrayscaleImage out(w, h);
  for(int y = 0; y < h; y++) {
    for(int x = 0; x < w; x++) {
      double v = 0.0;
      for(std::size_t k = 0; k < rows[y].weights.size(); k++) {
        v += tmp[static_cast<std::size_t>(rows[y].first + static_cast<int>(k)) * w + x] * rows[y].weights[k];
      }
      long q = std::lround(v);
      out.set(x, y, static_cast<uint8_t>(q < 0 ? 0 : (q > 255 ? 255 : q)));
    }
  }
  return out;
}

BinaryImage glyph_halftone(const GrayscaleImage& image, int target_w, int target_h, const GlyphRamp& ramp) {
  check_dimensions(image.width(), image.height());
  check_dimensions(target_w, target_h);

  const int gw = ramp.glyph_width();
  const int gh = ramp.glyph_height();
  const int cols = target_w / gw;
  const int rows = target_h / gh;
  BinaryImage out(target_w, target_h);
  // no whole cell fits: the target is all margin
  if(cols == 0 || rows == 0) {
    log_debug("target %dx%d smaller than one %dx%d glyph cell", target_w, target_h, gw, gh);
    return out;
  }

  const GrayscaleImage grid = area_resample(image, cols, rows);

  for(int r = 0; r < rows; r++) {
    for(int c = 0; c < cols; c++) {
      const BinaryImage& g = ramp.glyph(glyph_index(grid.at(c, r), ramp.size()));
      const int x0 = c * gw;
      const int y0 = r * gh;
      for(int y = 0; y < gh; y++) {
        for(int x = 0; x < gw; x++) {
          if(g.at(x, y)) {
            out.set(x0 + x, y0 + y, true);
          }
        }
      }
    }
  }
  return out;
}

BinaryImage GlyphHalftone::dither_pixels(const GrayscaleImage& image) const {
  return glyph_halftone(image, image.width(), image.height(), ramp);
}
