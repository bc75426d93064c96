#include "packet/frame_reader.h"

#include <cctype>

#include "packet/p_base.h"

const size_t FrameReader::default_max_frame;

void FrameReader::Feed(const char *data, size_t len) {
  buffer.append(data, len);

  size_t pos;
  while ((pos = buffer.find('\n')) != std::string::npos) {
    std::string line = buffer.substr(0, pos);
    buffer.erase(0, pos + 1);

    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    for (std::string &obj : SplitObjects(line)) {
      ready.push_back(std::move(obj));
    }
  }

  if (buffer.size() > max_frame) {
    buffer.clear();
    throw protocol_error("frame exceeds " + std::to_string(max_frame) + " bytes");
  }
}

bool FrameReader::Next(std::string *frame) {
  if (ready.empty()) {
    return false;
  }
  *frame = std::move(ready.front());
  ready.pop_front();
  return true;
}

std::vector<std::string> FrameReader::SplitObjects(const std::string &line) {
  std::vector<std::string> out;

  size_t start = std::string::npos;
  int depth = 0;
  bool in_string = false;
  bool escape = false;

  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];

    if (in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }

    if (c == '{') {
      if (depth == 0) {
        start = i;
      }
      depth++;
    } else if (c == '}' && depth > 0) {
      if (--depth == 0) {
        out.push_back(line.substr(start, i - start + 1));
        start = std::string::npos;
      }
    } else if (c == '"') {
      in_string = true;
      if (start == std::string::npos) {
        start = i;
      }
    } else if (start == std::string::npos &&
               !std::isspace(static_cast<unsigned char>(c))) {
      start = i;
    }
  }

  // unbalanced or stray text, left for the decoder to reject
  if (start != std::string::npos) {
    out.push_back(line.substr(start));
  }

  return out;
}
