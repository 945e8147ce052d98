#ifndef LABEL_HALFTONE_GLYPH_HALFTONE_HPP
#define LABEL_HALFTONE_GLYPH_HALFTONE_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "ditherer.hpp"

// Glyph bitmaps ordered light -> dark, all of one cell size. true = ink.
class GlyphRamp {
  private:
    std::vector<BinaryImage> glyphs;
    std::string chars;
    int GLYPH_WIDTH = 0;
    int GLYPH_HEIGHT = 0;

  public:
    // Throws ConfigurationError for an empty ramp, mixed cell sizes or ink
    // coverage that decreases along the ramp. `labels` is informational and
    // may be empty; otherwise it has one character per glyph.
    GlyphRamp(const std::vector<BinaryImage>& bitmaps, const std::string& labels = std::string());

    std::size_t size() const { return glyphs.size(); }
    int glyph_width() const { return GLYPH_WIDTH; }
    int glyph_height() const { return GLYPH_HEIGHT; }
    const BinaryImage& glyph(std::size_t index) const { return glyphs[index]; }
    const std::string& labels() const { return chars; }
};

// Source of a ramp, e.g. a font rasterizer. Kept out of the engine so the
// caller decides where glyphs come from.
class GlyphRampProvider {
  public:
    virtual ~GlyphRampProvider() = default;
    virtual GlyphRamp load_ramp() const = 0;
};

// round((255 - intensity) / 255 * (ramp_length - 1)); darker -> higher index
std::size_t glyph_index(int intensity, std::size_t ramp_length);

// Box filter with exact fractional coverage, usable both ways.
GrayscaleImage area_resample(const GrayscaleImage& image, int w, int h);

// Output is exactly target_w x target_h. Cells are glyph-sized; the margin
// left by integer division stays blank; a target smaller than one cell
// comes back entirely blank.
BinaryImage glyph_halftone(const GrayscaleImage& image, int target_w, int target_h, const GlyphRamp& ramp);

// Glyph halftone at the input's own size.
class GlyphHalftone final : public Ditherer {
  private:
    GlyphRamp ramp;

  protected:
    BinaryImage dither_pixels(const GrayscaleImage& image) const override;

  public:
    explicit GlyphHalftone(const GlyphRamp& r) : ramp(r) {}

    const char* name() const override { return "ascii"; }
    const GlyphRamp& glyph_ramp() const { return ramp; }
};

#endif
