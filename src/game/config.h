#ifndef SRC_GAME_CONFIG_H_
#define SRC_GAME_CONFIG_H_

#include <cstdint>

typedef uint32_t player_id_t;

struct WorldConfig {
  // side of the square wrap-around arena
  uint16_t world_size = 3000;
  uint16_t food_count = 850;

  // Timing, milliseconds
  long respawn_delay_ms = 5000;
  long grace_period_ms = 5000;

  // Scoring
  uint16_t kill_bonus = 10;

  // 0 picks a random seed
  uint32_t seed = 0;

  // Snake shape
  static const uint16_t base_length = 5;
  static const uint16_t max_length = 100;
  static const uint16_t score_per_segment = 10;
  static constexpr float segment_spacing = 3.0f;
  static constexpr float move_speed = 4.0f;

  // Distances
  static constexpr float pickup_radius = 15.0f;
  static constexpr float collision_radius = 12.0f;  // snake radius 10 * 1.2
  static constexpr float fast_reject_distance = 500.0f;
  static const uint16_t collision_sample_step = 2;

  // Spawn placement
  static constexpr float spawn_separation = 50.0f;
  static const int spawn_attempts = 20;
  static const uint16_t spawn_margin = 200;
  static const uint16_t spawn_fallback_margin = 500;
  static const uint16_t reconnect_margin = 100;
};

#endif  // SRC_GAME_CONFIG_H_
