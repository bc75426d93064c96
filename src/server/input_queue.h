#ifndef SRC_SERVER_INPUT_QUEUE_H_
#define SRC_SERVER_INPUT_QUEUE_H_

#include <deque>
#include <mutex>
#include <vector>

#include "packet/p_in.h"

// Direction events of one player. The connection thread pushes, the driver
// thread drains everything once per tick.
class InputQueue {
 public:
  void Push(const packet_input &in);

  // Moves all pending events into `out` (appended, oldest first).
  size_t Drain(std::vector<packet_input> *out);

  size_t size() const;

 private:
  mutable std::mutex mutex;
  std::deque<packet_input> events;
};

#endif  // SRC_SERVER_INPUT_QUEUE_H_
