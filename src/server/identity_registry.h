#ifndef SRC_SERVER_IDENTITY_REGISTRY_H_
#define SRC_SERVER_IDENTITY_REGISTRY_H_

#include <string>
#include <unordered_map>

#include "game/config.h"

// Display name -> last id handed out under that name. Entries live as long
// as the process and are only ever overwritten. Not synchronized, the
// owning SessionRegistry serializes access.
class IdentityRegistry {
 public:
  // 0 when the name was never seen.
  player_id_t Lookup(const std::string &name) const;
  void Assign(const std::string &name, player_id_t id);

  size_t size() const { return ids.size(); }

 private:
  std::unordered_map<std::string, player_id_t> ids;
};

#endif  // SRC_SERVER_IDENTITY_REGISTRY_H_
