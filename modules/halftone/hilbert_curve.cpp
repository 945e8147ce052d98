#include "hilbert_curve.hpp"

#include "halftone_image.hpp"

int hilbert_order(int value) {
  int order = 1;
  while(order < value) {
    order <<= 1;
  }
  return order;
}

// Two bits of d per level, lowest level first. Each level rotates/reflects
// the partial coordinate into the quadrant those bits select.
hilbert_point hilbert_d2xy(int order, uint64_t d) {
  int x = 0;
  int y = 0;
  uint64_t t = d;
  for(int s = 1; s < order; s <<= 1) {
    const int rx = static_cast<int>(1 & (t >> 1));
    const int ry = static_cast<int>(1 & (t ^ static_cast<uint64_t>(rx)));
    if(ry == 0) {
      if(rx == 1) {
        x = s - 1 - x;
        y = s - 1 - y;
      }
      const int tmp = x;
      x = y;
      y = tmp;
    }
    x += s * rx;
    y += s * ry;
    t >>= 2;
  }
  hilbert_point p = {x, y};
  return p;
}

HilbertPath::HilbertPath(int w, int h) {
  check_dimensions(w, h);
  WIDTH = w;
  HEIGHT = h;
  ORDER = hilbert_order(w > h ? w : h);
}

HilbertPath::iterator HilbertPath::begin() const {
  return iterator(this, 0);
}

HilbertPath::iterator HilbertPath::end() const {
  return iterator(this, static_cast<uint64_t>(ORDER) * ORDER);
}

HilbertPath::iterator::iterator(const HilbertPath* p, uint64_t start)
  : path(p), d(start) {
  seek();
}

void HilbertPath::iterator::seek() {
  const uint64_t last = static_cast<uint64_t>(path->ORDER) * path->ORDER;
  while(d < last) {
    cur = hilbert_d2xy(path->ORDER, d);
    if(cur.x < path->WIDTH && cur.y < path->HEIGHT) {
      return;
    }
    d++;
  }
}

HilbertPath::iterator& HilbertPath::iterator::operator++() {
  d++;
  seek();
  return *this;
}

HilbertPath::iterator HilbertPath::iterator::operator++(int) {
  iterator prev = *this;
  ++(*this);
  return prev;
}
