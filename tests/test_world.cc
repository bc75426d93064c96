#include <gtest/gtest.h>

#include <sstream>

#include "game/world.h"

namespace {

class WorldTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config.seed = 42;
    config.food_count = 0;
    config.grace_period_ms = 0;
    world.Init(config);
  }

  Snake::Ptr Place(player_id_t id, float x, float y, Point dir, size_t len = 5) {
    auto s = std::make_shared<Snake>(id, "snake" + std::to_string(id), "#00ff00", 0);
    s->direction = dir;
    s->PlaceBody(x, y, len, config.world_size);
    world.AddSnake(s);
    return s;
  }

  SpawnRequest Request(player_id_t id, const std::string &name) {
    SpawnRequest req;
    req.id = id;
    req.name = name;
    req.color = "#123456";
    return req;
  }

  WorldConfig config;
  World world;
};

}  // namespace

TEST_F(WorldTest, InitFillsFood) {
  WorldConfig c;
  c.seed = 7;
  World w;
  w.Init(c);
  EXPECT_EQ(w.GetFood().size(), 850u);
  for (const Food &f : w.GetFood()) {
    EXPECT_LT(f.x, c.world_size);
    EXPECT_LT(f.y, c.world_size);
  }
}

TEST_F(WorldTest, HeadsStayInsideArena) {
  WorldConfig c;
  c.seed = 3;
  c.world_size = 1000;
  c.food_count = 50;
  World w;
  w.Init(c);

  for (player_id_t id = 1; id <= 6; ++id) {
    w.AddPlayer(Request(id, "p" + std::to_string(id)), 0);
  }

  for (int t = 0; t < 2000; ++t) {
    if (t % 25 == 0) {
      for (player_id_t id = 1; id <= 6; ++id) {
        w.SetDirection(id, static_cast<float>(w.NextRandom(-100, 101)),
                       static_cast<float>(w.NextRandom(-100, 101)));
      }
    }
    w.Tick(t * 15);

    for (const auto &pair : w.GetSnakes()) {
      for (const Body &b : pair.second->parts) {
        ASSERT_GE(b.x, 0.0f);
        ASSERT_LT(b.x, 1000.0f);
        ASSERT_GE(b.y, 0.0f);
        ASSERT_LT(b.y, 1000.0f);
      }
    }
    ASSERT_EQ(w.GetFood().size(), 50u);
  }
}

TEST_F(WorldTest, EatingAddsOnePointAndTwoParts) {
  auto s = Place(1, 1000, 1000, Point{1.0f, 0.0f});
  world.GetFood().push_back(Food(1004, 1000));

  world.Tick(0);
  EXPECT_EQ(s->score, 1u);
  EXPECT_EQ(s->parts.size(), 7u);
  ASSERT_EQ(world.GetFood().size(), 1u);
}

TEST_F(WorldTest, TrimOnlyKeepsLengthSteady) {
  auto s = Place(1, 1000, 1000, Point{1.0f, 0.0f}, 9);
  ASSERT_EQ(s->get_target_length(), 5u);

  // one part per tick comes off, the new head puts one back
  world.Tick(0);
  EXPECT_EQ(s->parts.size(), 9u);
  world.Tick(15);
  EXPECT_EQ(s->parts.size(), 9u);

  world.GetFood().push_back(Food(1012, 1000));
  world.Tick(30);
  EXPECT_EQ(s->parts.size(), 11u);
  world.Tick(45);
  EXPECT_EQ(s->parts.size(), 11u);
}

TEST_F(WorldTest, MaxLengthSnakeDoesNotGrowPastCap) {
  auto s = Place(1, 1000, 1000, Point{1.0f, 0.0f}, WorldConfig::max_length);
  s->score = 2000;
  world.GetFood().push_back(Food(1004, 1000));

  world.Tick(0);
  EXPECT_EQ(s->score, 2001u);
  EXPECT_EQ(s->parts.size(), static_cast<size_t>(WorldConfig::max_length));
}

TEST_F(WorldTest, ReverseInputIsRefused) {
  Place(1, 1000, 1000, Point{1.0f, 0.0f});
  EXPECT_TRUE(world.SetDirection(1, 1, 0));
  EXPECT_FALSE(world.SetDirection(1, -1, 0));
  EXPECT_FALSE(world.SetDirection(99, 0, 1));

  const auto s = world.GetSnake(1)->second;
  EXPECT_FLOAT_EQ(s->direction.x, 1.0f);
  EXPECT_FLOAT_EQ(s->direction.y, 0.0f);
}

TEST_F(WorldTest, HeadOnBodyKillsAndRewardsFoe) {
  auto a = Place(1, 1000, 1000, Point{1.0f, 0.0f});
  auto b = Place(2, 1010, 988, Point{0.0f, -1.0f});
  a->score = 30;

  world.Tick(100);

  EXPECT_FALSE(a->alive);
  EXPECT_TRUE(b->alive);
  EXPECT_EQ(b->score, config.kill_bonus);

  const Ids pending = world.GetPendingRespawns();
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending[0], 1u);
  EXPECT_EQ(world.GetLives().at(1).state, player_pending_respawn);
  EXPECT_EQ(world.GetLives().at(1).since, 100);

  // dead snakes stay put until they respawn
  const Body head = a->get_head();
  world.Tick(115);
  EXPECT_FLOAT_EQ(a->get_head_x(), head.x);
}

TEST_F(WorldTest, RespawnAfterDelayHalvesScore) {
  auto a = Place(1, 1000, 1000, Point{1.0f, 0.0f});
  Place(2, 1010, 988, Point{0.0f, -1.0f});
  a->score = 31;

  world.Tick(100);
  ASSERT_FALSE(a->alive);

  world.Tick(100 + config.respawn_delay_ms - 1);
  EXPECT_FALSE(world.GetSnake(1)->second->alive);

  world.Tick(100 + config.respawn_delay_ms);
  const auto fresh = world.GetSnake(1)->second;
  EXPECT_NE(fresh, a);
  EXPECT_TRUE(fresh->alive);
  EXPECT_EQ(fresh->score, 15u);
  EXPECT_EQ(fresh->name, a->name);
  EXPECT_EQ(world.GetLives().at(1).state, player_active);
  EXPECT_TRUE(world.GetPendingRespawns().empty());
}

TEST_F(WorldTest, GracePeriodPreventsDeath) {
  WorldConfig c = config;
  c.grace_period_ms = 5000;
  world.Init(c);

  auto a = Place(1, 1000, 1000, Point{1.0f, 0.0f});
  auto b = Place(2, 1010, 988, Point{0.0f, -1.0f});
  a->created_at = 100;

  world.Tick(200);
  EXPECT_TRUE(a->alive);
  EXPECT_EQ(b->score, 0u);
}

TEST_F(WorldTest, SimultaneousHeadOnKillsBoth) {
  auto a = Place(1, 1000, 1000, Point{1.0f, 0.0f});
  auto b = Place(2, 1010, 1000, Point{-1.0f, 0.0f});

  world.Tick(0);

  EXPECT_FALSE(a->alive);
  EXPECT_FALSE(b->alive);
  EXPECT_EQ(world.GetPendingRespawns().size(), 2u);
}

TEST_F(WorldTest, DistantSnakesNeverCollide) {
  auto a = Place(1, 500, 500, Point{1.0f, 0.0f});
  auto b = Place(2, 1500, 1500, Point{-1.0f, 0.0f});

  for (int t = 0; t < 50; ++t) {
    world.Tick(t * 15);
  }
  EXPECT_TRUE(a->alive);
  EXPECT_TRUE(b->alive);
}

TEST_F(WorldTest, ReconnectRestoresScoreAndLength) {
  SpawnRequest req = Request(7, "returning");
  req.reconnect = true;
  req.last_score = 130;
  req.last_length = 12;

  const Snake::Ptr s = world.AddPlayer(req, 0);
  EXPECT_EQ(s->score, 130u);
  EXPECT_EQ(s->parts.size(), 12u);
  EXPECT_GE(s->get_head_x(), WorldConfig::reconnect_margin);
  EXPECT_LT(s->get_head_x(), config.world_size - WorldConfig::reconnect_margin);
}

TEST_F(WorldTest, CrowdedArenaUsesFallbackRegion) {
  WorldConfig c;
  c.seed = 9;
  c.world_size = 1000;
  c.food_count = 0;
  World w;
  w.Init(c);

  // Full-length rows 90 apart, wrapping end to end, leave no safe spot.
  const float heads[] = {300, 600, 900, 200};
  player_id_t id = 100;
  for (int y = 0; y < c.world_size; y += 90) {
    for (float x : heads) {
      auto s = std::make_shared<Snake>(id, "wall" + std::to_string(id), "#808080", 0);
      s->PlaceBody(x, y, WorldConfig::max_length, c.world_size);
      w.AddSnake(s);
      ++id;
    }
  }

  const Snake::Ptr late = w.AddPlayer(Request(1, "late"), 0);
  ASSERT_TRUE(late);
  EXPECT_TRUE(late->alive);
  EXPECT_EQ(late->parts.size(), static_cast<size_t>(WorldConfig::base_length));
  ASSERT_EQ(w.GetSnakes().count(1), 1u);
  EXPECT_EQ(w.GetSnakes().at(1), late);

  const float lo = c.world_size - WorldConfig::spawn_fallback_margin;
  const float hi = c.world_size - WorldConfig::spawn_margin;
  EXPECT_GE(late->get_head_x(), lo);
  EXPECT_LT(late->get_head_x(), hi);
  EXPECT_GE(late->get_head_y(), lo);
  EXPECT_LT(late->get_head_y(), hi);
}

TEST_F(WorldTest, ReconnectLengthIsCapped) {
  SpawnRequest req = Request(7, "returning");
  req.reconnect = true;
  req.last_score = 5000;
  req.last_length = 900;

  const Snake::Ptr s = world.AddPlayer(req, 0);
  EXPECT_EQ(s->parts.size(), static_cast<size_t>(WorldConfig::max_length));
}

TEST_F(WorldTest, ReconnectWithoutScoreIsAFreshSpawn) {
  SpawnRequest req = Request(3, "newbie");
  req.reconnect = true;
  req.last_length = 40;

  const Snake::Ptr s = world.AddPlayer(req, 0);
  EXPECT_EQ(s->score, 0u);
  EXPECT_EQ(s->parts.size(), static_cast<size_t>(WorldConfig::base_length));
}

TEST_F(WorldTest, SpawnsKeepTheirDistance) {
  for (player_id_t id = 1; id <= 10; ++id) {
    world.AddPlayer(Request(id, "p" + std::to_string(id)), 0);
  }

  const SnakeMap &snakes = world.GetSnakes();
  ASSERT_EQ(snakes.size(), 10u);
  for (const auto &p : snakes) {
    for (const auto &q : snakes) {
      if (p.first == q.first) {
        continue;
      }
      for (const Body &a : p.second->parts) {
        for (const Body &b : q.second->parts) {
          EXPECT_GE(Math::wrap_distance_squared(a.x, a.y, b.x, b.y, config.world_size),
                    WorldConfig::spawn_separation * WorldConfig::spawn_separation);
        }
      }
    }
  }
}

TEST_F(WorldTest, RemoveSnakeMarksDisconnected) {
  world.AddPlayer(Request(4, "leaver"), 0);
  ASSERT_EQ(world.GetSnakes().count(4), 1u);

  world.RemoveSnake(4);
  EXPECT_EQ(world.GetSnakes().count(4), 0u);
  EXPECT_EQ(world.GetLives().at(4).state, player_disconnected);
  EXPECT_FALSE(world.SetDirection(4, 0, 1));
}

TEST_F(WorldTest, DisconnectWhileDeadCancelsRespawn) {
  auto a = Place(1, 1000, 1000, Point{1.0f, 0.0f});
  Place(2, 1010, 988, Point{0.0f, -1.0f});

  world.Tick(100);
  ASSERT_FALSE(a->alive);

  world.RemoveSnake(1);
  world.Tick(100 + config.respawn_delay_ms);
  EXPECT_EQ(world.GetSnakes().count(1), 0u);
  EXPECT_TRUE(world.GetPendingRespawns().empty());
}

TEST_F(WorldTest, PrintsConfig) {
  std::stringstream s;
  s << world;
  EXPECT_NE(s.str().find("world_size = 3000"), std::string::npos);
  EXPECT_NE(s.str().find("seed = 42"), std::string::npos);
}
