#include "ditherer.hpp"

#include <chrono>
#include <string>

#include "halftone_error.hpp"
#include "halftone_log.hpp"

BinaryImage Ditherer::dither(const GrayscaleImage& image) const {
  check_dimensions(image.width(), image.height());

  const auto t_start = std::chrono::steady_clock::now();
  BinaryImage out = dither_pixels(image);
  const auto t_end = std::chrono::steady_clock::now();

  if(out.width() != image.width() || out.height() != image.height()) {
    throw InvariantViolation(std::string(name()) + " produced " + std::to_string(out.width()) + "x" + std::to_string(out.height())
      + " output for " + std::to_string(image.width()) + "x" + std::to_string(image.height()) + " input");
  }

  const long long diff_time = std::chrono::duration_cast<std::chrono::microseconds>(t_end - t_start).count();
  log_debug("%s %dx%d: %.3f ms", name(), image.width(), image.height(), diff_time / 1000.0);
  return out;
}
