#include "server/input_queue.h"

void InputQueue::Push(const packet_input &in) {
  std::lock_guard<std::mutex> lock(mutex);
  events.push_back(in);
}

size_t InputQueue::Drain(std::vector<packet_input> *out) {
  std::deque<packet_input> taken;
  {
    std::lock_guard<std::mutex> lock(mutex);
    taken.swap(events);
  }
  out->insert(out->end(), taken.begin(), taken.end());
  return taken.size();
}

size_t InputQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex);
  return events.size();
}
