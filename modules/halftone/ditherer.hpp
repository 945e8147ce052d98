#ifndef LABEL_HALFTONE_DITHERER_HPP
#define LABEL_HALFTONE_DITHERER_HPP

#include "halftone_image.hpp"

// Common contract of every strategy: GrayscaleImage in, BinaryImage of the
// same size out. Implementations hold only immutable settings, so one
// instance may be shared by several threads.
class Ditherer {
  protected:
    virtual BinaryImage dither_pixels(const GrayscaleImage& image) const = 0;

  public:
    Ditherer() = default;
    virtual ~Ditherer() = default;

    Ditherer(const Ditherer&) = delete;
    Ditherer& operator=(const Ditherer&) = delete;

    virtual const char* name() const = 0;

    BinaryImage dither(const GrayscaleImage& image) const;
};

#endif
