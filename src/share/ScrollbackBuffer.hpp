#ifndef __TS_SCROLLBACK_BUFFER__
#define __TS_SCROLLBACK_BUFFER__

#include "Headers.hpp"

namespace ts {
/**
 * @brief Bounded history of terminal output lines for late joiners.
 *
 * Each appended chunk is split on '\n' and every piece (including empty ones)
 * becomes a line. Once more than maxLines are held the oldest lines are
 * dropped.
 */
class ScrollbackBuffer {
 public:
  explicit ScrollbackBuffer(size_t _maxLines = SCROLLBACK_MAX_LINES)
      : maxLines(_maxLines) {}

  void append(const string& text);

  /**
   * @brief Gzip of the buffered lines joined with '\n'.
   * @return nullopt when nothing has been buffered.
   */
  optional<string> snapshot() const;

  /** @brief The buffered lines joined with '\n', uncompressed. */
  string contents() const;

  size_t lineCount() const { return lines.size(); }
  bool empty() const { return lines.empty(); }
  void clear() { lines.clear(); }

 protected:
  size_t maxLines;
  deque<string> lines;
};
}  // namespace ts

#endif  // __TS_SCROLLBACK_BUFFER__
