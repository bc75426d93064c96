#ifndef SRC_PACKET_FRAME_READER_H_
#define SRC_PACKET_FRAME_READER_H_

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

// Reassembles newline-terminated frames from a byte stream.
//
// Bytes are buffered until a newline shows up. A line carrying several JSON
// objects glued together ("{...}{...}") is split on balanced braces, quotes
// and escapes respected. Writers always send one object per line, the split
// only covers peers that do not.
class FrameReader {
 public:
  explicit FrameReader(size_t in_max_frame = default_max_frame) : max_frame(in_max_frame) {}

  // Throws protocol_error when an unterminated line exceeds max_frame.
  void Feed(const char *data, size_t len);

  bool Next(std::string *frame);

  size_t buffered() const { return buffer.size(); }

  static std::vector<std::string> SplitObjects(const std::string &line);

  static const size_t default_max_frame = 64 * 1024;

 private:
  std::string buffer;
  std::deque<std::string> ready;
  size_t max_frame;
};

#endif  // SRC_PACKET_FRAME_READER_H_
