#include "server/session.h"

SessionRegistry::SessionRegistry(IdentityRegistry &in_identities, size_t in_max_players)
    : identities(in_identities), max_players(in_max_players) {}

player_id_t SessionRegistry::Join(const packet_join &req, Connection::Ptr conn) {
  std::lock_guard<std::mutex> lock(mutex);

  if (sessions.size() >= max_players) {
    return 0;
  }

  const std::string name =
      req.has_name ? req.name : "Player" + std::to_string(sessions.size() + 1);

  // Same name and the old id is free: the player gets it back.
  player_id_t id = identities.Lookup(name);
  if (id == 0 || sessions.count(id) > 0) {
    id = next_player_id++;
  }
  identities.Assign(name, id);

  sessions[id] = std::make_shared<Session>(id, name, conn);

  SessionEvent ev;
  ev.kind = SessionEvent::joined;
  ev.spawn.id = id;
  ev.spawn.name = name;
  ev.spawn.color = req.color;
  ev.spawn.reconnect = req.reconnect;
  ev.spawn.last_score = req.last_score;
  ev.spawn.last_length = req.last_length;
  events.push_back(ev);

  return id;
}

void SessionRegistry::Leave(player_id_t id) {
  std::lock_guard<std::mutex> lock(mutex);

  if (sessions.erase(id) == 0) {
    return;
  }

  SessionEvent ev;
  ev.kind = SessionEvent::left;
  ev.spawn.id = id;
  events.push_back(ev);
}

bool SessionRegistry::IsActive(player_id_t id) const {
  std::lock_guard<std::mutex> lock(mutex);
  return sessions.count(id) > 0;
}

bool SessionRegistry::IsFull() const {
  std::lock_guard<std::mutex> lock(mutex);
  return sessions.size() >= max_players;
}

size_t SessionRegistry::Count() const {
  std::lock_guard<std::mutex> lock(mutex);
  return sessions.size();
}

Session::Ptr SessionRegistry::Find(player_id_t id) const {
  std::lock_guard<std::mutex> lock(mutex);
  const auto it = sessions.find(id);
  return it == sessions.end() ? Session::Ptr() : it->second;
}

std::vector<Session::Ptr> SessionRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex);
  std::vector<Session::Ptr> out;
  out.reserve(sessions.size());
  for (const auto &pair : sessions) {
    out.push_back(pair.second);
  }
  return out;
}

void SessionRegistry::TakeEvents(std::vector<SessionEvent> *out) {
  std::lock_guard<std::mutex> lock(mutex);
  out->insert(out->end(), events.begin(), events.end());
  events.clear();
}
