#ifndef LABEL_HALFTONE_HILBERT_CURVE_HPP
#define LABEL_HALFTONE_HILBERT_CURVE_HPP

#include <cstddef>
#include <cstdint>
#include <iterator>

struct hilbert_point {
  int x;
  int y;
};

inline bool operator==(const hilbert_point& a, const hilbert_point& b) {
  return a.x == b.x && a.y == b.y;
}

// Smallest power of two >= value (value >= 1).
int hilbert_order(int value);

// Index -> coordinate inside an order x order square (order a power of two).
hilbert_point hilbert_d2xy(int order, uint64_t d);

// Lazy Hilbert traversal of a width x height rectangle. The curve is laid
// over the enclosing power-of-two square and points outside the rectangle
// are skipped, so every cell is produced exactly once in curve order.
class HilbertPath {
  private:
    int WIDTH;
    int HEIGHT;
    int ORDER;

  public:
    class iterator {
      private:
        const HilbertPath* path = nullptr;
        uint64_t d = 0;
        hilbert_point cur = {0, 0};

        void seek();

      public:
        typedef std::input_iterator_tag iterator_category;
        typedef hilbert_point value_type;
        typedef std::ptrdiff_t difference_type;
        typedef const hilbert_point* pointer;
        typedef const hilbert_point& reference;

        iterator() = default;
        iterator(const HilbertPath* p, uint64_t start);

        reference operator*() const { return cur; }
        pointer operator->() const { return &cur; }
        iterator& operator++();
        iterator operator++(int);

        bool operator==(const iterator& other) const { return d == other.d; }
        bool operator!=(const iterator& other) const { return d != other.d; }
    };

    HilbertPath(int w, int h);

    int width() const { return WIDTH; }
    int height() const { return HEIGHT; }
    int order() const { return ORDER; }

    // number of points produced: width * height
    std::size_t size() const { return static_cast<std::size_t>(WIDTH) * HEIGHT; }

    iterator begin() const;
    iterator end() const;
};

#endif
