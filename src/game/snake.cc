#include "game/snake.h"

#include <algorithm>
#include <cmath>

constexpr float Snake::direction_threshold;

Snake::Snake(player_id_t in_id, const std::string &in_name, const std::string &in_color,
             long now)
    : id(in_id),
      name(in_name),
      color(in_color),
      direction(Point{1.0f, 0.0f}),
      speed(WorldConfig::move_speed),
      score(0),
      alive(true),
      created_at(now) {}

// ----------------------------------------------------------------------
// BODY
// ----------------------------------------------------------------------

void Snake::PlaceBody(float head_x, float head_y, size_t len, float world_size) {
  parts.clear();
  len = std::min(len, static_cast<size_t>(WorldConfig::max_length));
  for (size_t i = 0; i < len; ++i) {
    const float step = i * WorldConfig::segment_spacing;
    parts.push_back(Body{Math::wrap(head_x - direction.x * step, world_size),
                         Math::wrap(head_y - direction.y * step, world_size)});
  }
}

void Snake::Move(float world_size) {
  if (!alive || parts.empty()) {
    return;
  }

  Body head = parts[0];
  head.Offset(direction.x * speed, direction.y * speed);
  head.x = Math::wrap(head.x, world_size);
  head.y = Math::wrap(head.y, world_size);

  parts.insert(parts.begin(), head);
}

size_t Snake::get_target_length() const {
  const size_t target = WorldConfig::base_length + score / WorldConfig::score_per_segment;
  return std::min(target, static_cast<size_t>(WorldConfig::max_length));
}

void Snake::TrimTail() {
  if (parts.size() > get_target_length()) {
    parts.pop_back();
  }
  if (parts.size() > WorldConfig::max_length) {
    parts.resize(WorldConfig::max_length);
  }
}

void Snake::Grow() {
  score++;
  if (parts.empty()) {
    return;
  }

  const Body tail = parts.back();
  parts.push_back(tail);
  if (parts.size() > WorldConfig::max_length) {
    parts.resize(WorldConfig::max_length);
  }
}

// ----------------------------------------------------------------------
// STEERING
// ----------------------------------------------------------------------

bool Snake::SetDirection(float dx, float dy) {
  // no 180 degree turns
  if (Math::dot(direction.x, direction.y, dx, dy) < 0) {
    return false;
  }

  if (std::fabs(dx - direction.x) <= direction_threshold &&
      std::fabs(dy - direction.y) <= direction_threshold) {
    return true;
  }

  const double len = std::hypot(static_cast<double>(dx), static_cast<double>(dy));
  if (!std::isfinite(len) || len <= 0) {
    return false;
  }
  direction.x = static_cast<float>(dx / len);
  direction.y = static_cast<float>(dy / len);
  return true;
}

// ----------------------------------------------------------------------
// CONTACTS
// ----------------------------------------------------------------------

int Snake::FindFood(const FoodSeq &food, float world_size) const {
  if (!alive || parts.empty()) {
    return -1;
  }

  const Body &head = get_head();
  for (size_t i = 0; i < food.size(); ++i) {
    if (Math::intersect_circle(head.x, head.y, food[i].x, food[i].y,
                               WorldConfig::pickup_radius, world_size)) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

bool Snake::CollidesWith(const Snake &foe, float world_size) const {
  if (&foe == this || foe.id == id || parts.empty() || foe.parts.empty()) {
    return false;
  }

  const Body &head = get_head();
  const Body &foe_head = foe.get_head();
  if (Math::wrap_manhattan(head.x, head.y, foe_head.x, foe_head.y, world_size) >
      WorldConfig::fast_reject_distance) {
    return false;
  }

  // every other part is enough at this speed
  for (size_t i = 0; i < foe.parts.size(); i += WorldConfig::collision_sample_step) {
    const Body &b = foe.parts[i];
    if (Math::intersect_circle(head.x, head.y, b.x, b.y, WorldConfig::collision_radius,
                               world_size)) {
      return true;
    }
  }
  return false;
}
