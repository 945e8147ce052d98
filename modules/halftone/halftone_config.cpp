#include "halftone_config.hpp"

#include "error_diffusion.hpp"
#include "halftone_error.hpp"
#include "halftone_log.hpp"
#include "ordered_dithering.hpp"
#include "riemersma_dithering.hpp"

struct strategy_name {
  DitherStrategy strategy;
  const char* name;
};

static const strategy_name strategy_names[] = {
  {DitherStrategy::THRESHOLD, "threshold"},
  {DitherStrategy::BAYER, "bayer"},
  {DitherStrategy::CLUSTER, "cluster"},
  {DitherStrategy::YLILUOMA, "yliluoma"},
  {DitherStrategy::FLOYD_STEINBERG, "floyd-steinberg"},
  {DitherStrategy::ATKINSON, "atkinson"},
  {DitherStrategy::JARVIS_JUDICE_NINKE, "jarvis-judice-ninke"},
  {DitherStrategy::STUCKI, "stucki"},
  {DitherStrategy::BURKES, "burkes"},
  {DitherStrategy::SIERRA3, "sierra3"},
  {DitherStrategy::SIERRA2, "sierra2"},
  {DitherStrategy::SIERRA_2_4A, "sierra-2-4a"},
  {DitherStrategy::ASCII, "ascii"},
  {DitherStrategy::RIEMERSMA, "riemersma"},
};

DitherStrategy parse_dither_strategy(const std::string& name) {
  if(name == "none") {
    return DitherStrategy::THRESHOLD;
  }
  if(name == "floyd") {
    return DitherStrategy::FLOYD_STEINBERG;
  }
  for(const strategy_name& s : strategy_names) {
    if(name == s.name) {
      return s.strategy;
    }
  }
  log_error("unknown dithering strategy '%s'", name.c_str());
  throw ConfigurationError("Unknown dithering strategy: " + name);
}

const char* dither_strategy_name(DitherStrategy strategy) {
  for(const strategy_name& s : strategy_names) {
    if(s.strategy == strategy) {
      return s.name;
    }
  }
  return "unknown";
}

const std::vector<DitherStrategy>& all_dither_strategies() {
  static const std::vector<DitherStrategy> strategies = [] {
    std::vector<DitherStrategy> v;
    for(const strategy_name& s : strategy_names) {
      v.push_back(s.strategy);
    }
    return v;
  }();
  return strategies;
}

static bool uses_matrix(DitherStrategy strategy) {
  return strategy == DitherStrategy::BAYER
    || strategy == DitherStrategy::CLUSTER
    || strategy == DitherStrategy::YLILUOMA;
}

void validate_config(const dither_config& cfg) {
  try {
    if(std::string(dither_strategy_name(cfg.strategy)) == "unknown") {
      throw ConfigurationError("Unknown dithering strategy value " + std::to_string(static_cast<int>(cfg.strategy)));
    }
    if(uses_matrix(cfg.strategy)) {
      check_matrix_order(cfg.matrix_order);
    }
    if(cfg.strategy == DitherStrategy::YLILUOMA && cfg.yliluoma_palette.size() < 2) {
      throw ConfigurationError("Yliluoma palette needs at least two gray levels");
    }
    if(cfg.strategy == DitherStrategy::RIEMERSMA) {
      check_riemersma_params(cfg.history_depth, cfg.decay_ratio);
    }
    if(cfg.strategy == DitherStrategy::ASCII) {
      check_glyph_metrics(cfg.glyphs);
    }
  } catch(const ConfigurationError& e) {
    log_error("%s", e.what());
    throw;
  }
}

std::unique_ptr<Ditherer> make_ditherer(const dither_config& cfg, const GlyphRampProvider* glyph_provider) {
  validate_config(cfg);

  switch(cfg.strategy) {
    case DitherStrategy::THRESHOLD:
      return std::unique_ptr<Ditherer>(new OrderedDither("threshold", ThresholdMatrix::flat(128)));
    case DitherStrategy::BAYER:
      return std::unique_ptr<Ditherer>(new OrderedDither("bayer", ThresholdMatrix::bayer(cfg.matrix_order)));
    case DitherStrategy::CLUSTER:
      return std::unique_ptr<Ditherer>(new OrderedDither("cluster", ThresholdMatrix::cluster(cfg.matrix_order)));
    case DitherStrategy::YLILUOMA:
      return std::unique_ptr<Ditherer>(new YliluomaDither(cfg.matrix_order, cfg.yliluoma_palette));
    case DitherStrategy::FLOYD_STEINBERG:
    case DitherStrategy::ATKINSON:
    case DitherStrategy::JARVIS_JUDICE_NINKE:
    case DitherStrategy::STUCKI:
    case DitherStrategy::BURKES:
    case DitherStrategy::SIERRA3:
    case DitherStrategy::SIERRA2:
    case DitherStrategy::SIERRA_2_4A:
      return std::unique_ptr<Ditherer>(new ErrorDiffusion(find_diffusion_kernel(dither_strategy_name(cfg.strategy))));
    case DitherStrategy::RIEMERSMA:
      return std::unique_ptr<Ditherer>(new RiemersmaDither(cfg.history_depth, cfg.decay_ratio));
    case DitherStrategy::ASCII:
      if(glyph_provider != nullptr) {
        return std::unique_ptr<Ditherer>(new GlyphHalftone(glyph_provider->load_ramp()));
      } else {
        FontGlyphRampProvider fonts(cfg.glyphs);
        return std::unique_ptr<Ditherer>(new GlyphHalftone(fonts.load_ramp()));
      }
  }
  throw ConfigurationError("Unknown dithering strategy value " + std::to_string(static_cast<int>(cfg.strategy)));
}

BinaryImage dither_image(const dither_config& cfg, const GrayscaleImage& image) {
  check_dimensions(image.width(), image.height());
  std::unique_ptr<Ditherer> ditherer = make_ditherer(cfg, nullptr);
  return ditherer->dither(image);
}
