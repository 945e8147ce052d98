#ifndef LABEL_HALFTONE_ERROR_DIFFUSION_HPP
#define LABEL_HALFTONE_ERROR_DIFFUSION_HPP

#include <string>
#include <vector>

#include "ditherer.hpp"

struct diffusion_tap {
  int dx;
  int dy;
  int weight;
};

// Offsets are relative to the current pixel in raster order; each tap gets
// error * weight / divisor. Taps must point at pixels not yet visited.
struct DiffusionKernel {
  std::string name;
  std::vector<diffusion_tap> taps;
  int divisor;
};

const std::vector<DiffusionKernel>& diffusion_kernels();

// Throws ConfigurationError for an unknown name.
const DiffusionKernel& find_diffusion_kernel(const std::string& name);

// Raster-order (no serpentine) error diffusion over a private double copy of
// the input. Error that would land outside the image is dropped.
class ErrorDiffusion final : public Ditherer {
  private:
    DiffusionKernel kernel;

  protected:
    BinaryImage dither_pixels(const GrayscaleImage& image) const override;

  public:
    explicit ErrorDiffusion(const DiffusionKernel& k);

    const char* name() const override { return kernel.name.c_str(); }
    const DiffusionKernel& diffusion_kernel() const { return kernel; }
};

#endif
