#include "game/math.h"

float Math::wrap(float v, float size) {
  float r = std::fmod(v, size);
  if (r < 0) {
    r += size;
  }
  // -epsilon + size rounds up to size in float
  if (r >= size) {
    r -= size;
  }
  return r;
}

float Math::wrap_delta(float a, float b, float size) {
  float d = std::fmod(b - a, size);
  if (d > size / 2) {
    d -= size;
  } else if (d < -size / 2) {
    d += size;
  }
  return d;
}

float Math::distance_squared(float p0_x, float p0_y, float p1_x, float p1_y) {
  const float dx = p0_x - p1_x;
  const float dy = p0_y - p1_y;
  return dx * dx + dy * dy;
}

float Math::wrap_distance_squared(float p0_x, float p0_y, float p1_x, float p1_y, float size) {
  const float dx = wrap_delta(p0_x, p1_x, size);
  const float dy = wrap_delta(p0_y, p1_y, size);
  return dx * dx + dy * dy;
}

float Math::wrap_manhattan(float p0_x, float p0_y, float p1_x, float p1_y, float size) {
  return std::fabs(wrap_delta(p0_x, p1_x, size)) + std::fabs(wrap_delta(p0_y, p1_y, size));
}
