#ifndef LABEL_HALFTONE_HALFTONE_IMAGE_HPP
#define LABEL_HALFTONE_HALFTONE_IMAGE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// 8-bit grayscale, row-major. 0 = black, 255 = white (paper).
class GrayscaleImage {
  private:
    int WIDTH = 0;
    int HEIGHT = 0;
    std::vector<uint8_t> pixels;

  public:
    GrayscaleImage() = default;
    GrayscaleImage(int w, int h, uint8_t fill = 255);
    GrayscaleImage(int w, int h, const std::vector<uint8_t>& data);
    GrayscaleImage(int w, int h, const uint8_t* data, std::size_t length);

    int width() const { return WIDTH; }
    int height() const { return HEIGHT; }
    bool empty() const { return pixels.empty(); }

    uint8_t at(int x, int y) const { return pixels[y * WIDTH + x]; }
    void set(int x, int y, uint8_t v) { pixels[y * WIDTH + x] = v; }

    const uint8_t* data() const { return pixels.data(); }
    std::size_t size() const { return pixels.size(); }
};

// 1-bit raster, row-major. true = dark mark (burned dot on a thermal head).
class BinaryImage {
  private:
    int WIDTH = 0;
    int HEIGHT = 0;
    std::vector<uint8_t> marks;

  public:
    BinaryImage() = default;
    BinaryImage(int w, int h);

    int width() const { return WIDTH; }
    int height() const { return HEIGHT; }

    bool at(int x, int y) const { return marks[y * WIDTH + x] != 0; }
    void set(int x, int y, bool dark) { marks[y * WIDTH + x] = dark ? 1 : 0; }

    bool operator==(const BinaryImage& other) const;
    bool operator!=(const BinaryImage& other) const { return !(*this == other); }
};

// Throws ConfigurationError unless w > 0 and h > 0.
void check_dimensions(int w, int h);

std::size_t count_dark(const BinaryImage& image);

// Spooler raster form: ceil(width/8) bytes per row, MSB first, 1 = dark.
int packed_row_bytes(int width);
std::vector<uint8_t> pack_rows(const BinaryImage& image);
BinaryImage unpack_rows(const std::vector<uint8_t>& raster, int w, int h);

// Tone helpers for the caller's preprocessing. Both return a new image.
GrayscaleImage adjust_brightness(const GrayscaleImage& image, double factor);
GrayscaleImage adjust_contrast(const GrayscaleImage& image, double factor);

#endif
