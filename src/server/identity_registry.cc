#include "server/identity_registry.h"

player_id_t IdentityRegistry::Lookup(const std::string &name) const {
  const auto it = ids.find(name);
  return it == ids.end() ? 0 : it->second;
}

void IdentityRegistry::Assign(const std::string &name, player_id_t id) {
  ids[name] = id;
}
