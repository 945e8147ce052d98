#include "error_diffusion.hpp"

#include "halftone_error.hpp"
#include "halftone_log.hpp"

const std::vector<DiffusionKernel>& diffusion_kernels() {
  static const std::vector<DiffusionKernel> kernels = {
    {"floyd-steinberg", {
      {1, 0, 7},
      {-1, 1, 3}, {0, 1, 5}, {1, 1, 1},
    }, 16},
    // 6/8 of the error is kept, the rest is dropped on purpose
    {"atkinson", {
      {1, 0, 1}, {2, 0, 1},
      {-1, 1, 1}, {0, 1, 1}, {1, 1, 1},
      {0, 2, 1},
    }, 8},
    {"jarvis-judice-ninke", {
      {1, 0, 7}, {2, 0, 5},
      {-2, 1, 3}, {-1, 1, 5}, {0, 1, 7}, {1, 1, 5}, {2, 1, 3},
      {-2, 2, 1}, {-1, 2, 3}, {0, 2, 5}, {1, 2, 3}, {2, 2, 1},
    }, 48},
    {"stucki", {
      {1, 0, 8}, {2, 0, 4},
      {-2, 1, 2}, {-1, 1, 4}, {0, 1, 8}, {1, 1, 4}, {2, 1, 2},
      {-2, 2, 1}, {-1, 2, 2}, {0, 2, 4}, {1, 2, 2}, {2, 2, 1},
    }, 42},
    {"burkes", {
      {1, 0, 8}, {2, 0, 4},
      {-2, 1, 2}, {-1, 1, 4}, {0, 1, 8}, {1, 1, 4}, {2, 1, 2},
    }, 32},
    {"sierra3", {
      {1, 0, 5}, {2, 0, 3},
      {-2, 1, 2}, {-1, 1, 4}, {0, 1, 5}, {1, 1, 4}, {2, 1, 2},
      {-1, 2, 2}, {0, 2, 3}, {1, 2, 2},
    }, 32},
    {"sierra2", {
      {1, 0, 4}, {2, 0, 3},
      {-2, 1, 1}, {-1, 1, 2}, {0, 1, 3}, {1, 1, 2}, {2, 1, 1},
    }, 16},
    {"sierra-2-4a", {
      {1, 0, 2},
      {-1, 1, 1}, {0, 1, 1},
    }, 4},
  };
  return kernels;
}

const DiffusionKernel& find_diffusion_kernel(const std::string& name) {
  for(const DiffusionKernel& k : diffusion_kernels()) {
    if(k.name == name) {
      return k;
    }
  }
  log_error("unknown diffusion kernel '%s'", name.c_str());
  throw ConfigurationError("Unknown diffusion kernel: " + name);
}

ErrorDiffusion::ErrorDiffusion(const DiffusionKernel& k) : kernel(k) {
  if(kernel.divisor <= 0) {
    throw ConfigurationError("Diffusion kernel " + kernel.name + " needs a positive divisor");
  }
  for(const diffusion_tap& t : kernel.taps) {
    if(t.dy < 0 || (t.dy == 0 && t.dx <= 0)) {
      throw ConfigurationError("Diffusion kernel " + kernel.name + " has a tap at (" + std::to_string(t.dx) + ", " + std::to_string(t.dy) + ") that is already visited");
    }
  }
}

BinaryImage ErrorDiffusion::dither_pixels(const GrayscaleImage& image) const {
  const int w = image.width();
  const int h = image.height();

  std::vector<double> work(image.data(), image.data() + image.size());
  std::vector<double> weights;
  weights.reserve(kernel.taps.size());
  for(const diffusion_tap& t : kernel.taps) {
    weights.push_back(static_cast<double>(t.weight) / kernel.divisor);
  }

  BinaryImage out(w, h);
  for(int y = 0; y < h; y++) {
    double *row = work.data() + static_cast<std::size_t>(y) * w;
    for(int x = 0; x < w; x++) {
      double v = row[x];
      if(v < 0.0) {
        v = 0.0;
      } else if(v > 255.0) {
        v = 255.0;
      }
      const bool dark = v < 127.5;
      out.set(x, y, dark);
      const double error = v - (dark ? 0.0 : 255.0);

      for(std::size_t i = 0; i < kernel.taps.size(); i++) {
        const int tx = x + kernel.taps[i].dx;
        const int ty = y + kernel.taps[i].dy;
        if(tx < 0 || tx >= w || ty >= h) {
          continue;
        }
        work[static_cast<std::size_t>(ty) * w + tx] += error * weights[i];
      }
    }
  }
  return out;
}
