#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "server/session.h"

namespace {

packet_join JoinAs(const std::string &name) {
  packet_join req;
  req.name = name;
  req.has_name = true;
  return req;
}

}  // namespace

TEST(InputQueueTest, DrainsInOrder) {
  InputQueue q;
  packet_input a;
  a.dx = 1;
  packet_input b;
  b.dx = -1;
  q.Push(a);
  q.Push(b);
  EXPECT_EQ(q.size(), 2u);

  std::vector<packet_input> out;
  EXPECT_EQ(q.Drain(&out), 2u);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_FLOAT_EQ(out[0].dx, 1.0f);
  EXPECT_FLOAT_EQ(out[1].dx, -1.0f);
  EXPECT_EQ(q.size(), 0u);
  EXPECT_EQ(q.Drain(&out), 0u);
}

TEST(InputQueueTest, ConcurrentProducer) {
  InputQueue q;
  std::thread producer([&q]() {
    for (int i = 0; i < 10000; ++i) {
      packet_input in;
      in.dx = static_cast<float>(i);
      q.Push(in);
    }
  });

  std::vector<packet_input> out;
  while (out.size() < 10000) {
    q.Drain(&out);
  }
  producer.join();

  for (size_t i = 0; i < out.size(); ++i) {
    ASSERT_FLOAT_EQ(out[i].dx, static_cast<float>(i));
  }
}

TEST(IdentityRegistryTest, RemembersLastId) {
  IdentityRegistry ids;
  EXPECT_EQ(ids.Lookup("alice"), 0u);
  ids.Assign("alice", 3);
  EXPECT_EQ(ids.Lookup("alice"), 3u);
  ids.Assign("alice", 8);
  EXPECT_EQ(ids.Lookup("alice"), 8u);
  EXPECT_EQ(ids.size(), 1u);
}

TEST(SessionRegistryTest, IdsStartAtOne) {
  IdentityRegistry ids;
  SessionRegistry reg(ids, 5);
  EXPECT_EQ(reg.Join(JoinAs("a"), nullptr), 1u);
  EXPECT_EQ(reg.Join(JoinAs("b"), nullptr), 2u);
  EXPECT_EQ(reg.Count(), 2u);
}

TEST(SessionRegistryTest, SameNameGetsSameIdBack) {
  IdentityRegistry ids;
  SessionRegistry reg(ids, 5);

  const player_id_t first = reg.Join(JoinAs("alice"), nullptr);
  reg.Join(JoinAs("bob"), nullptr);
  reg.Leave(first);
  EXPECT_FALSE(reg.IsActive(first));

  EXPECT_EQ(reg.Join(JoinAs("alice"), nullptr), first);
  EXPECT_TRUE(reg.IsActive(first));
}

TEST(SessionRegistryTest, SameNameWhileActiveGetsNewId) {
  IdentityRegistry ids;
  SessionRegistry reg(ids, 5);

  const player_id_t first = reg.Join(JoinAs("alice"), nullptr);
  const player_id_t second = reg.Join(JoinAs("alice"), nullptr);
  EXPECT_NE(first, second);
  EXPECT_EQ(ids.Lookup("alice"), second);
}

TEST(SessionRegistryTest, DefaultNameCountsSessions) {
  IdentityRegistry ids;
  SessionRegistry reg(ids, 5);

  reg.Join(JoinAs("x"), nullptr);
  const player_id_t id = reg.Join(packet_join(), nullptr);
  EXPECT_EQ(reg.Find(id)->name, "Player2");
}

TEST(SessionRegistryTest, ExplicitEmptyNameIsKept) {
  IdentityRegistry ids;
  SessionRegistry reg(ids, 5);

  const player_id_t id = reg.Join(JoinAs(""), nullptr);
  ASSERT_NE(id, 0u);
  EXPECT_EQ(reg.Find(id)->name, "");
  EXPECT_EQ(ids.Lookup(""), id);
}

TEST(SessionRegistryTest, FullRegistryRefuses) {
  IdentityRegistry ids;
  SessionRegistry reg(ids, 2);

  EXPECT_NE(reg.Join(JoinAs("a"), nullptr), 0u);
  EXPECT_FALSE(reg.IsFull());
  EXPECT_NE(reg.Join(JoinAs("b"), nullptr), 0u);
  EXPECT_TRUE(reg.IsFull());
  EXPECT_EQ(reg.Join(JoinAs("c"), nullptr), 0u);
  EXPECT_EQ(reg.Count(), 2u);
  EXPECT_EQ(ids.Lookup("c"), 0u);
}

TEST(SessionRegistryTest, EventsCarrySpawnDetails) {
  IdentityRegistry ids;
  SessionRegistry reg(ids, 5);

  packet_join req = JoinAs("alice");
  req.color = "#00ff00";
  req.reconnect = true;
  req.last_score = 130;
  req.last_length = 12;
  const player_id_t id = reg.Join(req, nullptr);
  reg.Leave(id);
  reg.Leave(id);

  std::vector<SessionEvent> events;
  reg.TakeEvents(&events);
  ASSERT_EQ(events.size(), 2u);

  EXPECT_EQ(events[0].kind, SessionEvent::joined);
  EXPECT_EQ(events[0].spawn.id, id);
  EXPECT_EQ(events[0].spawn.name, "alice");
  EXPECT_EQ(events[0].spawn.color, "#00ff00");
  EXPECT_TRUE(events[0].spawn.reconnect);
  EXPECT_EQ(events[0].spawn.last_score, 130u);
  EXPECT_EQ(events[0].spawn.last_length, 12);

  EXPECT_EQ(events[1].kind, SessionEvent::left);
  EXPECT_EQ(events[1].spawn.id, id);

  events.clear();
  reg.TakeEvents(&events);
  EXPECT_TRUE(events.empty());
}

TEST(SessionRegistryTest, SnapshotSurvivesLeave) {
  IdentityRegistry ids;
  SessionRegistry reg(ids, 5);

  const player_id_t id = reg.Join(JoinAs("a"), nullptr);
  const std::vector<Session::Ptr> snap = reg.Snapshot();
  reg.Leave(id);

  ASSERT_EQ(snap.size(), 1u);
  EXPECT_EQ(snap[0]->player_id, id);
  EXPECT_EQ(reg.Find(id), nullptr);
}
