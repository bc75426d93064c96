#ifndef SRC_SERVER_SESSION_H_
#define SRC_SERVER_SESSION_H_

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "game/world.h"
#include "server/connection.h"
#include "server/identity_registry.h"
#include "server/input_queue.h"

struct Session {
  typedef std::shared_ptr<Session> Ptr;

  Session(player_id_t id, const std::string &in_name, Connection::Ptr conn)
      : player_id(id), name(in_name), connection(conn), ready(false) {}

  player_id_t player_id;
  std::string name;
  Connection::Ptr connection;  // null in tests
  InputQueue inputs;

  // Set once join_ack is out; broadcasts skip sessions that are not ready.
  std::atomic<bool> ready;
};

// Join/leave notices for the driver thread, the only one that touches the world.
struct SessionEvent {
  enum kind_t : uint8_t { joined, left };

  kind_t kind;
  SpawnRequest spawn;  // spawn.id is set for both kinds
};

class SessionRegistry {
 public:
  SessionRegistry(IdentityRegistry &in_identities, size_t in_max_players);

  // Allocates (or reuses) an id for the name and registers the session.
  // Returns 0 when the server is full.
  player_id_t Join(const packet_join &req, Connection::Ptr conn);

  // Drops the session at once; the driver removes the snake on its next step.
  void Leave(player_id_t id);

  bool IsActive(player_id_t id) const;
  bool IsFull() const;
  size_t Count() const;

  Session::Ptr Find(player_id_t id) const;

  // Copy of the live sessions, safe to iterate while others join or leave.
  std::vector<Session::Ptr> Snapshot() const;

  // Moves queued join/leave events into `out`, oldest first.
  void TakeEvents(std::vector<SessionEvent> *out);

  size_t get_max_players() const { return max_players; }

 private:
  mutable std::mutex mutex;

  IdentityRegistry &identities;
  std::map<player_id_t, Session::Ptr> sessions;
  std::vector<SessionEvent> events;

  player_id_t next_player_id = 1;
  size_t max_players;
};

#endif  // SRC_SERVER_SESSION_H_
