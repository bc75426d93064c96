#ifndef SRC_GAME_WORLD_H_
#define SRC_GAME_WORLD_H_

#include <cstdint>
#include <map>
#include <memory>
#include <ostream>
#include <random>
#include <string>
#include <vector>

#include "game/log.h"
#include "game/snake.h"

enum player_state_t : uint8_t {
  player_active = 0,
  player_pending_respawn = 1,
  player_disconnected = 2
};

struct PlayerLife {
  player_state_t state;
  long since;  // death time while pending respawn

  PlayerLife() : state(player_active), since(0) {}
  PlayerLife(player_state_t st, long t) : state(st), since(t) {}
};

typedef std::map<player_id_t, PlayerLife> PlayerLifeMap;

// What the server knows about a joining player when it asks for a snake.
struct SpawnRequest {
  player_id_t id = 0;
  std::string name;
  std::string color;
  bool reconnect = false;
  uint32_t last_score = 0;
  int last_length = WorldConfig::base_length;
};

class World {
 public:
  World() = default;
  explicit World(alog_type *in_log) : log(in_log) {}

  void Init(WorldConfig in_config);
  void InitFood();

  void Tick(long now);

  Snake::Ptr CreateSnake(player_id_t id, const std::string &name, const std::string &color,
                         long now);
  Snake::Ptr CreateSnakeWithScore(player_id_t id, const std::string &name,
                                  const std::string &color, uint32_t score, int length,
                                  long now);

  // Join path: reconnects with a score restore progress, others get a safe spot.
  Snake::Ptr AddPlayer(const SpawnRequest &req, long now);

  void AddSnake(Snake::Ptr ptr);

  // Disconnect: the snake is gone at once, no respawn.
  void RemoveSnake(player_id_t id);

  // Returns false when there is no living snake or the turn is refused.
  bool SetDirection(player_id_t id, float dx, float dy);

  void InitRandom();
  int NextRandom(int lo, int hi);  // [lo, hi)

  SnakeMapIter GetSnake(player_id_t id);
  SnakeMap &GetSnakes();
  const SnakeMap &GetSnakes() const;
  FoodSeq &GetFood();
  const FoodSeq &GetFood() const;
  const PlayerLifeMap &GetLives() const;
  Ids GetPendingRespawns() const;
  const WorldConfig &GetConfig() const { return config; }
  uint64_t GetTicks() const { return ticks; }

 private:
  void RespawnSnakes(long now);
  void MoveSnakes();
  void EatFood();
  void CheckCollisions(long now);

  Food NextFood();
  bool IsLocationSafe(const BodySeq &candidate) const;

  void Log(const std::string &msg);

 private:
  SnakeMap snakes;
  FoodSeq food;
  PlayerLifeMap lives;

  std::mt19937 rng;
  uint64_t ticks = 0;

  WorldConfig config;
  alog_type *log = nullptr;
};

std::ostream &operator<<(std::ostream &out, const World &w);

#endif  // SRC_GAME_WORLD_H_
