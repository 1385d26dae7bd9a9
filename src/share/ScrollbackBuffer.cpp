#include "ScrollbackBuffer.hpp"

#include "Compression.hpp"

namespace ts {
void ScrollbackBuffer::append(const string& text) {
  size_t start = 0;
  while (true) {
    size_t newline = text.find('\n', start);
    if (newline == string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, newline - start));
    start = newline + 1;
  }
  while (lines.size() > maxLines) {
    lines.pop_front();
  }
}

string ScrollbackBuffer::contents() const {
  string joined;
  for (auto it = lines.begin(); it != lines.end(); ++it) {
    if (it != lines.begin()) {
      joined.push_back('\n');
    }
    joined.append(*it);
  }
  return joined;
}

optional<string> ScrollbackBuffer::snapshot() const {
  if (lines.empty()) {
    return nullopt;
  }
  return gzipCompress(contents());
}
}  // namespace ts
