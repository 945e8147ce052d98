#ifndef LABEL_HALFTONE_FONT_GLYPH_RAMP_HPP
#define LABEL_HALFTONE_FONT_GLYPH_RAMP_HPP

#include <string>

#include "glyph_halftone.hpp"

#ifndef LABEL_HALFTONE_DEFAULT_FONT_FAMILY
#define LABEL_HALFTONE_DEFAULT_FONT_FAMILY "monospace"
#endif

#ifndef LABEL_HALFTONE_DEFAULT_DPI
#define LABEL_HALFTONE_DEFAULT_DPI 300
#endif

struct glyph_metrics {
  std::string font_family = LABEL_HALFTONE_DEFAULT_FONT_FAMILY;
  double font_size_pt = 8.0;
  int dpi = LABEL_HALFTONE_DEFAULT_DPI;
  std::string chars = " .:-=+*#%@";
};

void check_glyph_metrics(const glyph_metrics& metrics);

struct font_match {
  std::string file;
  bool monospace = false;
};

// FC_MONO or FC_CHARCELL
bool is_monospace_spacing(int spacing);

// Resolves a font file for the family through fontconfig, asking for a
// monospace face. fontconfig may still return a proportional one; that is
// reported in `monospace` and logged.
font_match find_font(const std::string& family);

// Rasterizes the ramp characters with FreeType in 1-bit mode. Cells are
// max-advance wide and one line high; glyphs are reordered by ink coverage
// so index 0 is the lightest.
class FontGlyphRampProvider final : public GlyphRampProvider {
  private:
    glyph_metrics metrics;

  public:
    explicit FontGlyphRampProvider(const glyph_metrics& m);

    GlyphRamp load_ramp() const override;
};

#endif
