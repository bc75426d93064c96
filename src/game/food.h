#ifndef SRC_GAME_FOOD_H_
#define SRC_GAME_FOOD_H_

#include <cstdint>
#include <vector>

struct Food {
  uint16_t x;
  uint16_t y;

  Food() = default;
  Food(uint16_t in_x, uint16_t in_y) : x(in_x), y(in_y) {}
};

typedef std::vector<Food> FoodSeq;

#endif  // SRC_GAME_FOOD_H_
