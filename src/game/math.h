#ifndef SRC_GAME_MATH_H_
#define SRC_GAME_MATH_H_

#include <cmath>
#include <cstdint>

struct Point {
  float x;
  float y;
};

class Math {
  Math() = delete;

 public:
  // Maps any value into [0, size), negative values included.
  static float wrap(float v, float size);

  // Shortest signed distance from a to b on a ring of the given size.
  static float wrap_delta(float a, float b, float size);

  static float distance_squared(float p0_x, float p0_y, float p1_x, float p1_y);

  // Distances across the wrap seam take the short way round.
  static float wrap_distance_squared(float p0_x, float p0_y, float p1_x, float p1_y, float size);
  static float wrap_manhattan(float p0_x, float p0_y, float p1_x, float p1_y, float size);

  inline static bool intersect_circle(float c_x, float c_y, float p_x, float p_y, float r,
                                      float size) {
    return wrap_distance_squared(c_x, c_y, p_x, p_y, size) < r * r;
  }

  inline static float dot(float ax, float ay, float bx, float by) {
    return ax * bx + ay * by;
  }

  inline static float length(float x, float y) {
    return std::sqrt(x * x + y * y);
  }
};

#endif  // SRC_GAME_MATH_H_
