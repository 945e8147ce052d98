// https://www.compuphase.com/riemer.htm

#include "riemersma_dithering.hpp"

#include <cmath>
#include <string>

#include "halftone_error.hpp"
#include "hilbert_curve.hpp"

void check_riemersma_params(int depth, double ratio) {
  if(depth < 2) {
    throw ConfigurationError("Riemersma history depth must be >= 2 (got " + std::to_string(depth) + ")");
  }
  if(!(ratio > 0.0 && ratio <= 1.0)) {
    throw ConfigurationError("Riemersma decay ratio must be in (0, 1] (got " + std::to_string(ratio) + ")");
  }
}

ErrorHistory::ErrorHistory(int depth, double ratio) {
  if(depth < 1) {
    throw ConfigurationError("Error history depth must be >= 1");
  }
  if(!(ratio > 0.0 && ratio <= 1.0)) {
    throw ConfigurationError("Error history ratio must be in (0, 1]");
  }
  errors.assign(depth, 0.0);
  weights.assign(depth, 1.0);

  // depth 1: plain threshold with the full previous error fed back
  if(depth > 1) {
    double m = exp(log(ratio) / (depth - 1));
    double v = 1.0;
    for(int i = 0; i < depth; i++) {
      weights[i] = v;
      v *= m;
    }
  }

  double total = 0.0;
  for(int i = 0; i < depth; i++) {
    total += weights[i];
  }
  for(int i = 0; i < depth; i++) {
    weights[i] /= total;
  }
}

void ErrorHistory::push(double error) {
  head = (head + errors.size() - 1) % errors.size();
  errors[head] = error;
}

double ErrorHistory::weighted_sum() const {
  double err = 0.0;
  for(std::size_t i = 0; i < errors.size(); i++) {
    err += error(i) * weights[i];
  }
  return err;
}

RiemersmaDither::RiemersmaDither(int depth, double ratio)
  : history_depth(depth), decay_ratio(ratio) {
  check_riemersma_params(depth, ratio);
}

BinaryImage RiemersmaDither::dither_pixels(const GrayscaleImage& image) const {
  HilbertPath path(image.width(), image.height());
  ErrorHistory history(history_depth, decay_ratio);
  BinaryImage out(image.width(), image.height());

  std::size_t visited = 0;
  for(const hilbert_point& p : path) {
    const double expected = image.at(p.x, p.y) + history.weighted_sum();
    const bool light = expected > 127.5;
    out.set(p.x, p.y, !light);
    history.push(expected - (light ? 255.0 : 0.0));
    visited++;
  }

  if(visited != path.size()) {
    throw InvariantViolation("Hilbert path visited " + std::to_string(visited) + " of " + std::to_string(path.size()) + " pixels");
  }
  return out;
}
