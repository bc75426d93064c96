#include "game/world.h"

#include <ctime>

#include "game/math.h"

const uint16_t WorldConfig::base_length;
const uint16_t WorldConfig::max_length;
const uint16_t WorldConfig::score_per_segment;
constexpr float WorldConfig::segment_spacing;
constexpr float WorldConfig::move_speed;
constexpr float WorldConfig::pickup_radius;
constexpr float WorldConfig::collision_radius;
constexpr float WorldConfig::fast_reject_distance;
const uint16_t WorldConfig::collision_sample_step;
constexpr float WorldConfig::spawn_separation;
const int WorldConfig::spawn_attempts;
const uint16_t WorldConfig::spawn_margin;
const uint16_t WorldConfig::spawn_fallback_margin;
const uint16_t WorldConfig::reconnect_margin;

void World::Init(WorldConfig in_config) {
  config = in_config;

  InitRandom();
  InitFood();
}

void World::InitRandom() {
  const uint32_t seed =
      config.seed != 0 ? config.seed : static_cast<uint32_t>(std::time(nullptr));
  rng.seed(seed);
}

int World::NextRandom(int lo, int hi) {
  if (hi <= lo) {
    return lo;
  }
  std::uniform_int_distribution<int> dist(lo, hi - 1);
  return dist(rng);
}

void World::InitFood() {
  food.clear();
  food.reserve(config.food_count);
  for (uint16_t i = 0; i < config.food_count; i++) {
    food.push_back(NextFood());
  }
}

Food World::NextFood() {
  return Food(static_cast<uint16_t>(NextRandom(0, config.world_size)),
              static_cast<uint16_t>(NextRandom(0, config.world_size)));
}

// ----------------------------------------------------------------------
// SPAWNING
// ----------------------------------------------------------------------

bool World::IsLocationSafe(const BodySeq &candidate) const {
  static const float safe_sq = WorldConfig::spawn_separation * WorldConfig::spawn_separation;
  const float size = config.world_size;

  for (const auto &pair : snakes) {
    for (const Body &other : pair.second->parts) {
      for (const Body &mine : candidate) {
        if (Math::wrap_distance_squared(other.x, other.y, mine.x, mine.y, size) < safe_sq) {
          return false;
        }
      }
    }
  }
  return true;
}

Snake::Ptr World::CreateSnake(player_id_t id, const std::string &name,
                              const std::string &color, long now) {
  auto s = std::make_shared<Snake>(id, name, color, now);

  const int size = config.world_size;
  int x = 0;
  int y = 0;
  bool safe = false;

  for (int attempts = 0; attempts < WorldConfig::spawn_attempts; attempts++) {
    x = NextRandom(WorldConfig::spawn_margin, size - WorldConfig::spawn_margin);
    y = NextRandom(WorldConfig::spawn_margin, size - WorldConfig::spawn_margin);
    s->PlaceBody(x, y, WorldConfig::base_length, size);

    if (IsLocationSafe(s->parts)) {
      safe = true;
      break;
    }
  }

  // Crowded map: park it in the far corner and accept the risk.
  if (!safe) {
    x = NextRandom(size - WorldConfig::spawn_fallback_margin, size - WorldConfig::spawn_margin);
    y = NextRandom(size - WorldConfig::spawn_fallback_margin, size - WorldConfig::spawn_margin);
    s->PlaceBody(x, y, WorldConfig::base_length, size);
    Log("No safe spawn for player " + std::to_string(id) + ", using fallback region");
  }

  return s;
}

Snake::Ptr World::CreateSnakeWithScore(player_id_t id, const std::string &name,
                                       const std::string &color, uint32_t score, int length,
                                       long now) {
  auto s = std::make_shared<Snake>(id, name, color, now);
  s->score = score;

  const int size = config.world_size;
  const int x = NextRandom(WorldConfig::reconnect_margin, size - WorldConfig::reconnect_margin);
  const int y = NextRandom(WorldConfig::reconnect_margin, size - WorldConfig::reconnect_margin);

  const size_t len = length > 0 ? static_cast<size_t>(length) : WorldConfig::base_length;
  s->PlaceBody(x, y, len, size);

  return s;
}

Snake::Ptr World::AddPlayer(const SpawnRequest &req, long now) {
  Snake::Ptr ptr;
  if (req.reconnect && req.last_score > 0) {
    ptr = CreateSnakeWithScore(req.id, req.name, req.color, req.last_score, req.last_length, now);
    Log("Restored score " + std::to_string(ptr->score) + " and length " +
        std::to_string(ptr->parts.size()) + " for reconnecting player " + req.name);
  } else {
    ptr = CreateSnake(req.id, req.name, req.color, now);
  }

  AddSnake(ptr);
  return ptr;
}

void World::AddSnake(Snake::Ptr ptr) {
  snakes[ptr->id] = ptr;
  lives[ptr->id] = PlayerLife(player_active, 0);
}

void World::RemoveSnake(player_id_t id) {
  snakes.erase(id);

  const auto life_i = lives.find(id);
  if (life_i != lives.end()) {
    life_i->second = PlayerLife(player_disconnected, 0);
  }
}

bool World::SetDirection(player_id_t id, float dx, float dy) {
  const auto snake_i = snakes.find(id);
  if (snake_i == snakes.end() || !snake_i->second->alive) {
    return false;
  }
  return snake_i->second->SetDirection(dx, dy);
}

// ----------------------------------------------------------------------
// TICK
// ----------------------------------------------------------------------

void World::Tick(long now) {
  ticks++;

  RespawnSnakes(now);
  MoveSnakes();
  EatFood();
  CheckCollisions(now);
}

void World::RespawnSnakes(long now) {
  for (auto &pair : lives) {
    const player_id_t id = pair.first;
    PlayerLife &life = pair.second;

    if (life.state != player_pending_respawn || now - life.since < config.respawn_delay_ms) {
      continue;
    }

    const auto sn_i = snakes.find(id);
    if (sn_i == snakes.end()) {
      life = PlayerLife(player_disconnected, 0);
      continue;
    }

    const Snake::Ptr old = sn_i->second;
    snakes.erase(sn_i);

    Snake::Ptr fresh = CreateSnake(id, old->name, old->color, now);
    fresh->score = old->score / 2;
    snakes[id] = fresh;
    life = PlayerLife(player_active, 0);

    Log(std::string(COLOR_MAGENTA "Player ") + std::to_string(id) + " respawned" COLOR_RESET
        " with score " + std::to_string(fresh->score));
  }
}

void World::MoveSnakes() {
  const float size = config.world_size;
  for (auto &pair : snakes) {
    pair.second->Move(size);
  }
}

void World::EatFood() {
  const float size = config.world_size;
  for (auto &pair : snakes) {
    Snake *const s = pair.second.get();
    if (!s->alive || s->parts.empty()) {
      continue;
    }

    const int food_i = s->FindFood(food, size);
    if (food_i < 0) {
      s->TrimTail();
      continue;
    }

    s->Grow();
    food[food_i] = NextFood();
  }
}

void World::CheckCollisions(long now) {
  const float size = config.world_size;

  // Deaths in this pass do not hide a snake from the rest of the pass.
  std::vector<Snake *> living;
  for (auto &pair : snakes) {
    Snake *const s = pair.second.get();
    if (s->alive && !s->parts.empty()) {
      living.push_back(s);
    }
  }

  for (Snake *s : living) {
    if (s->InGracePeriod(now, config.grace_period_ms)) {
      continue;
    }

    for (Snake *foe : living) {
      if (foe == s || !s->CollidesWith(*foe, size)) {
        continue;
      }

      s->alive = false;
      lives[s->id] = PlayerLife(player_pending_respawn, now);
      foe->score += config.kill_bonus;

      Log(std::string(COLOR_RED "Snake ") + std::to_string(s->id) + " hit snake " +
          std::to_string(foe->id) + COLOR_RESET ", respawn scheduled");
      break;
    }
  }
}

// ----------------------------------------------------------------------
// ACCESS
// ----------------------------------------------------------------------

SnakeMapIter World::GetSnake(player_id_t id) { return snakes.find(id); }

SnakeMap &World::GetSnakes() { return snakes; }

const SnakeMap &World::GetSnakes() const { return snakes; }

FoodSeq &World::GetFood() { return food; }

const FoodSeq &World::GetFood() const { return food; }

const PlayerLifeMap &World::GetLives() const { return lives; }

Ids World::GetPendingRespawns() const {
  Ids ids;
  for (const auto &pair : lives) {
    if (pair.second.state == player_pending_respawn) {
      ids.push_back(pair.first);
    }
  }
  return ids;
}

void World::Log(const std::string &msg) {
  if (log != nullptr) {
    log->write(alevel::app, msg);
  }
}

std::ostream &operator<<(std::ostream &out, const World &w) {
  const WorldConfig &c = w.GetConfig();
  return out << "\tworld_size = " << c.world_size
             << "\n\tfood_count = " << c.food_count
             << "\n\tbase_length = " << WorldConfig::base_length
             << "\n\tmax_length = " << WorldConfig::max_length
             << "\n\tmove_speed = " << WorldConfig::move_speed
             << "\n\tsegment_spacing = " << WorldConfig::segment_spacing
             << "\n\tpickup_radius = " << WorldConfig::pickup_radius
             << "\n\tcollision_radius = " << WorldConfig::collision_radius
             << "\n\tfast_reject_distance = " << WorldConfig::fast_reject_distance
             << "\n\trespawn_delay_ms = " << c.respawn_delay_ms
             << "\n\tgrace_period_ms = " << c.grace_period_ms
             << "\n\tkill_bonus = " << c.kill_bonus
             << "\n\tseed = " << c.seed;
}
