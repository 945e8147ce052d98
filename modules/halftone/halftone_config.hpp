#ifndef LABEL_HALFTONE_HALFTONE_CONFIG_HPP
#define LABEL_HALFTONE_HALFTONE_CONFIG_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ditherer.hpp"
#include "font_glyph_ramp.hpp"
#include "glyph_halftone.hpp"

enum class DitherStrategy {
  THRESHOLD,
  BAYER,
  CLUSTER,
  YLILUOMA,
  FLOYD_STEINBERG,
  ATKINSON,
  JARVIS_JUDICE_NINKE,
  STUCKI,
  BURKES,
  SIERRA3,
  SIERRA2,
  SIERRA_2_4A,
  ASCII,
  RIEMERSMA,
};

// Accepts the canonical names plus "none" and "floyd".
// Throws ConfigurationError for anything else.
DitherStrategy parse_dither_strategy(const std::string& name);
const char* dither_strategy_name(DitherStrategy strategy);
const std::vector<DitherStrategy>& all_dither_strategies();

struct dither_config {
  DitherStrategy strategy = DitherStrategy::FLOYD_STEINBERG;

  // bayer, cluster, yliluoma
  int matrix_order = 8;
  std::vector<uint8_t> yliluoma_palette = {0, 255};

  // riemersma
  int history_depth = 16;
  double decay_ratio = 0.1;

  // ascii
  glyph_metrics glyphs;
};

void validate_config(const dither_config& cfg);

// `glyph_provider` is only consulted for ASCII; when null, glyphs come from
// a FontGlyphRampProvider built from cfg.glyphs.
std::unique_ptr<Ditherer> make_ditherer(const dither_config& cfg, const GlyphRampProvider* glyph_provider = nullptr);

BinaryImage dither_image(const dither_config& cfg, const GrayscaleImage& image);

#endif
