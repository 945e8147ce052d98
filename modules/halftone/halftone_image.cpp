#include "halftone_image.hpp"

#include <cmath>
#include <string>

#include "halftone_error.hpp"

static const uint8_t add_bit[8] = {0b10000000, 0b01000000, 0b00100000, 0b00010000, 0b00001000, 0b00000100, 0b00000010, 0b00000001};

void check_dimensions(int w, int h) {
  if(w <= 0 || h <= 0) {
    throw ConfigurationError("Image dimensions must be positive (got " + std::to_string(w) + "x" + std::to_string(h) + ")");
  }
}

GrayscaleImage::GrayscaleImage(int w, int h, uint8_t fill) {
  check_dimensions(w, h);
  WIDTH = w;
  HEIGHT = h;
  pixels.assign(static_cast<std::size_t>(w) * h, fill);
}

GrayscaleImage::GrayscaleImage(int w, int h, const std::vector<uint8_t>& data)
  : GrayscaleImage(w, h, data.data(), data.size()) {}

GrayscaleImage::GrayscaleImage(int w, int h, const uint8_t* data, std::size_t length) {
  check_dimensions(w, h);
  const std::size_t expected = static_cast<std::size_t>(w) * h;
  if(data == nullptr || length != expected) {
    throw ConfigurationError("Pixel buffer holds " + std::to_string(length) + " bytes, expected " + std::to_string(expected));
  }
  WIDTH = w;
  HEIGHT = h;
  pixels.assign(data, data + length);
}

BinaryImage::BinaryImage(int w, int h) {
  check_dimensions(w, h);
  WIDTH = w;
  HEIGHT = h;
  marks.assign(static_cast<std::size_t>(w) * h, 0);
}

bool BinaryImage::operator==(const BinaryImage& other) const {
  return WIDTH == other.WIDTH && HEIGHT == other.HEIGHT && marks == other.marks;
}

std::size_t count_dark(const BinaryImage& image) {
  std::size_t n = 0;
  for(int y = 0; y < image.height(); y++) {
    for(int x = 0; x < image.width(); x++) {
      if(image.at(x, y)) {
        n++;
      }
    }
  }
  return n;
}

int packed_row_bytes(int width) {
  return (width + 7) / 8;
}

std::vector<uint8_t> pack_rows(const BinaryImage& image) {
  const int row_bytes = packed_row_bytes(image.width());
  std::vector<uint8_t> raster(static_cast<std::size_t>(row_bytes) * image.height(), 0);

  uint8_t *raster_index = raster.data();
  int bit_count;

  for(int y = 0; y < image.height(); y++) {
    bit_count = 0;
    for(int x = 0; x < image.width(); x++) {
      if(image.at(x, y)) {
        *raster_index |= add_bit[bit_count];
      }
      bit_count = (bit_count+1)&7;
      raster_index += 1 - (bool)bit_count;
    }
    // partial last byte, padding bits stay zero
    if(bit_count != 0) {
      raster_index++;
    }
  }
  return raster;
}

BinaryImage unpack_rows(const std::vector<uint8_t>& raster, int w, int h) {
  check_dimensions(w, h);
  const int row_bytes = packed_row_bytes(w);
  const std::size_t expected = static_cast<std::size_t>(row_bytes) * h;
  if(raster.size() != expected) {
    throw ConfigurationError("Raster holds " + std::to_string(raster.size()) + " bytes, expected " + std::to_string(expected));
  }

  BinaryImage image(w, h);
  for(int y = 0; y < h; y++) {
    const uint8_t *row = raster.data() + static_cast<std::size_t>(y) * row_bytes;
    for(int x = 0; x < w; x++) {
      image.set(x, y, (row[x >> 3] & add_bit[x & 7]) != 0);
    }
  }
  return image;
}

static uint8_t clamp_round(double v) {
  if(v <= 0.0) {
    return 0;
  }
  if(v >= 255.0) {
    return 255;
  }
  return static_cast<uint8_t>(std::lround(v));
}

GrayscaleImage adjust_brightness(const GrayscaleImage& image, double factor) {
  if(!(factor >= 0.0)) {
    throw ConfigurationError("Brightness factor must be >= 0");
  }
  check_dimensions(image.width(), image.height());
  GrayscaleImage out(image.width(), image.height());
  for(int y = 0; y < image.height(); y++) {
    for(int x = 0; x < image.width(); x++) {
      out.set(x, y, clamp_round(image.at(x, y) * factor));
    }
  }
  return out;
}

GrayscaleImage adjust_contrast(const GrayscaleImage& image, double factor) {
  if(!(factor >= 0.0)) {
    throw ConfigurationError("Contrast factor must be >= 0");
  }
  check_dimensions(image.width(), image.height());
  double sum = 0.0;
  for(std::size_t i = 0; i < image.size(); i++) {
    sum += image.data()[i];
  }
  // blend away from (or toward) a flat image of the mean gray
  const double mean = std::round(sum / image.size());

  GrayscaleImage out(image.width(), image.height());
  for(int y = 0; y < image.height(); y++) {
    for(int x = 0; x < image.width(); x++) {
      out.set(x, y, clamp_round(mean + (image.at(x, y) - mean) * factor));
    }
  }
  return out;
}
