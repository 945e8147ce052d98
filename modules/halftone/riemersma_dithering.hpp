#ifndef LABEL_HALFTONE_RIEMERSMA_DITHERING_HPP
#define LABEL_HALFTONE_RIEMERSMA_DITHERING_HPP

#include <vector>

#include "ditherer.hpp"

// Last `depth` quantization errors, newest at index 0, with a fixed weight
// per age: weight[i] = ratio^(i/(depth-1)), normalized to sum to 1.
class ErrorHistory {
  private:
    std::vector<double> errors;
    std::vector<double> weights;
    std::size_t head = 0;

  public:
    ErrorHistory(int depth, double ratio);

    std::size_t depth() const { return errors.size(); }
    double weight(std::size_t age) const { return weights[age]; }
    double error(std::size_t age) const { return errors[(head + age) % errors.size()]; }

    // drops the oldest entry
    void push(double error);
    double weighted_sum() const;
};

// Error diffusion along a Hilbert curve: each pixel gets the weighted sum of
// the errors of the pixels visited just before it.
class RiemersmaDither final : public Ditherer {
  private:
    int history_depth;
    double decay_ratio;

  protected:
    BinaryImage dither_pixels(const GrayscaleImage& image) const override;

  public:
    RiemersmaDither(int depth, double ratio);

    const char* name() const override { return "riemersma"; }
};

void check_riemersma_params(int depth, double ratio);

#endif
