#include "font_glyph_ramp.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fontconfig/fontconfig.h>

#include <ft2build.h>
#include FT_FREETYPE_H

#include "halftone_error.hpp"
#include "halftone_log.hpp"

void check_glyph_metrics(const glyph_metrics& metrics) {
  if(metrics.chars.empty()) {
    throw ConfigurationError("Glyph ramp characters are empty");
  }
  if(!(metrics.font_size_pt > 0.0)) {
    throw ConfigurationError("Glyph font size must be positive");
  }
  if(metrics.dpi <= 0) {
    throw ConfigurationError("Glyph DPI must be positive");
  }
}

bool is_monospace_spacing(int spacing) {
  return spacing == FC_MONO || spacing == FC_CHARCELL;
}

font_match find_font(const std::string& family) {
  if(!FcInit()) {
    throw std::runtime_error("Failed to initialize fontconfig");
  }

  FcPattern *pattern = FcNameParse(reinterpret_cast<const FcChar8*>(family.c_str()));
  if(pattern == nullptr) {
    throw std::runtime_error("Failed to parse font pattern: " + family);
  }
  FcPatternAddInteger(pattern, FC_SPACING, FC_MONO);
  FcConfigSubstitute(nullptr, pattern, FcMatchPattern);
  FcDefaultSubstitute(pattern);

  FcResult result;
  FcPattern *match = FcFontMatch(nullptr, pattern, &result);
  FcPatternDestroy(pattern);
  if(match == nullptr) {
    throw std::runtime_error("No font matches: " + family);
  }

  font_match found;
  FcChar8 *path = nullptr;
  if(FcPatternGetString(match, FC_FILE, 0, &path) == FcResultMatch && path != nullptr) {
    found.file = reinterpret_cast<const char*>(path);
  }
  // FC_SPACING in the request is only a preference
  int spacing = FC_PROPORTIONAL;
  found.monospace = FcPatternGetInteger(match, FC_SPACING, 0, &spacing) == FcResultMatch
    && is_monospace_spacing(spacing);
  FcPatternDestroy(match);

  if(found.file.empty()) {
    throw std::runtime_error("Font match for " + family + " has no file");
  }
  if(!found.monospace) {
    log_info("font %s for '%s' is not monospace, cells use the widest advance", found.file.c_str(), family.c_str());
  }
  return found;
}


// Owns the FreeType library and face for one load_ramp() call.
class FreeTypeFace {
  private:
    FT_Library library = nullptr;
    FT_Face face = nullptr;

  public:
    explicit FreeTypeFace(const std::string& file) {
      FT_Error error = FT_Init_FreeType(&library);
      if(error) {
        library = nullptr;
        throw std::runtime_error("Failed to initialize the FreeType library with error: " + std::to_string(error));
      }
      error = FT_New_Face(library, file.c_str(), 0, &face);
      if(error) {
        face = nullptr;
        FT_Done_FreeType(library);
        library = nullptr;
        throw std::runtime_error("Failed to open font " + file + " with error: " + std::to_string(error));
      }
    }

    ~FreeTypeFace() {
      if(face != nullptr) {
        FT_Done_Face(face);
      }
      if(library != nullptr) {
        FT_Done_FreeType(library);
      }
    }

    FreeTypeFace(const FreeTypeFace&) = delete;
    FreeTypeFace& operator=(const FreeTypeFace&) = delete;

    FT_Face get() const { return face; }
};

FontGlyphRampProvider::FontGlyphRampProvider(const glyph_metrics& m) : metrics(m) {
  check_glyph_metrics(metrics);
}

GlyphRamp FontGlyphRampProvider::load_ramp() const {
  const std::string file = find_font(metrics.font_family).file;
  log_info("glyph ramp font: %s (%.1fpt @ %d dpi)", file.c_str(), metrics.font_size_pt, metrics.dpi);

  FreeTypeFace ft(file);
  FT_Face face = ft.get();

  const FT_F26Dot6 char_size = static_cast<FT_F26Dot6>(metrics.font_size_pt * 64.0 + 0.5);
  FT_Error error = FT_Set_Char_Size(face, 0, char_size, metrics.dpi, metrics.dpi);
  if(error) {
    throw std::runtime_error("Failed to set font size with error: " + std::to_string(error));
  }

  const int ascender = static_cast<int>((face->size->metrics.ascender + 63) >> 6);
  const int cell_w = static_cast<int>((face->size->metrics.max_advance + 63) >> 6);
  const int cell_h = static_cast<int>((face->size->metrics.height + 63) >> 6);
  if(cell_w <= 0 || cell_h <= 0) {
    throw std::runtime_error("Font " + file + " reports an empty cell size");
  }

  std::vector<std::pair<std::size_t, std::pair<char, BinaryImage> > > rendered;
  for(char ch : metrics.chars) {
    error = FT_Load_Char(face, static_cast<unsigned char>(ch), FT_LOAD_RENDER | FT_LOAD_TARGET_MONO);
    if(error) {
      throw std::runtime_error(std::string("Failed to render glyph '") + ch + "' with error: " + std::to_string(error));
    }
    const FT_GlyphSlot slot = face->glyph;
    const FT_Bitmap& bitmap = slot->bitmap;

    BinaryImage cell(cell_w, cell_h);
    const int x0 = slot->bitmap_left;
    const int y0 = ascender - slot->bitmap_top;
    for(unsigned int row = 0; row < bitmap.rows; row++) {
      const unsigned char *src = bitmap.buffer + static_cast<long>(row) * bitmap.pitch;
      for(unsigned int col = 0; col < bitmap.width; col++) {
        bool ink;
        if(bitmap.pixel_mode == FT_PIXEL_MODE_MONO) {
          ink = (src[col >> 3] & (0x80 >> (col & 7))) != 0;
        } else {
          ink = src[col] >= 128;
        }
        const int x = x0 + static_cast<int>(col);
        const int y = y0 + static_cast<int>(row);
        if(ink && x >= 0 && x < cell_w && y >= 0 && y < cell_h) {
          cell.set(x, y, true);
        }
      }
    }
    rendered.push_back(std::make_pair(count_dark(cell), std::make_pair(ch, cell)));
  }

  std::stable_sort(rendered.begin(), rendered.end(),
    [](const std::pair<std::size_t, std::pair<char, BinaryImage> >& a,
       const std::pair<std::size_t, std::pair<char, BinaryImage> >& b) {
      return a.first < b.first;
    });

  std::vector<BinaryImage> bitmaps;
  std::string labels;
  for(const auto& r : rendered) {
    labels.push_back(r.second.first);
    bitmaps.push_back(r.second.second);
  }
  log_debug("glyph ramp '%s', cell %dx%d", labels.c_str(), cell_w, cell_h);
  return GlyphRamp(bitmaps, labels);
}
