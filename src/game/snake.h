#ifndef SRC_GAME_SNAKE_H_
#define SRC_GAME_SNAKE_H_

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "game/config.h"
#include "game/food.h"
#include "game/math.h"

struct Body {
  float x; float y;
  inline void Offset(float dx, float dy) { x += dx; y += dy; }
};

typedef std::vector<Body> BodySeq;

class Snake {
 public:
  typedef std::shared_ptr<Snake> Ptr;

  Snake(player_id_t in_id, const std::string &in_name, const std::string &in_color, long now);

  player_id_t id;
  std::string name;
  std::string color;
  BodySeq parts;
  Point direction;
  float speed;
  uint32_t score;
  bool alive;
  long created_at;

  // Lays out `len` parts backwards from the head along the current direction.
  void PlaceBody(float head_x, float head_y, size_t len, float world_size);

  // Prepends the next head, wrapped into the world. No trimming here.
  void Move(float world_size);

  // Drops one tail part when longer than the target length.
  void TrimTail();

  // Eaten food: score +1, tail kept and duplicated.
  void Grow();

  // Returns false when the request is refused (reverse turn).
  bool SetDirection(float dx, float dy);

  // Index of the first food item within pickup radius of the head, -1 if none.
  int FindFood(const FoodSeq &food, float world_size) const;

  // Head of this snake against the sampled body of `foe`.
  bool CollidesWith(const Snake &foe, float world_size) const;

  bool InGracePeriod(long now, long grace_ms) const { return now - created_at < grace_ms; }

  size_t get_target_length() const;

  inline const Body &get_head() const { return parts[0]; }
  inline float get_head_x() const { return parts[0].x; }
  inline float get_head_y() const { return parts[0].y; }

  // Changes smaller than this on both axes keep the old heading.
  static constexpr float direction_threshold = 0.05f;
};

typedef std::map<player_id_t, Snake::Ptr> SnakeMap;
typedef SnakeMap::iterator SnakeMapIter;
typedef std::vector<player_id_t> Ids;

#endif  // SRC_GAME_SNAKE_H_
