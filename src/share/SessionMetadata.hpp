#ifndef __TS_SESSION_METADATA__
#define __TS_SESSION_METADATA__

#include "Headers.hpp"

namespace ts {
/** @brief Name of the first tool whose pattern matches, if any. */
optional<string> detectTool(const string& output);

/** @brief First absolute path (unix or drive-letter) found in the output. */
optional<string> extractFilePath(const string& output);

/**
 * @brief Maps the last detected tool to an agent status: idle without output
 * since the last tick, writing for Edit/Write, reading for Read/Grep/Glob,
 * otherwise thinking.
 */
string deriveAgentStatus(const optional<string>& tool, bool hasOutput);

/**
 * @brief Accumulates heuristics about a shared session from its output and
 * renders the periodic Metadata frame payload.
 */
class MetadataTracker {
 public:
  MetadataTracker(const optional<string>& _model,
                  const optional<string>& _providerId)
      : model(_model), providerId(_providerId), hasRecentOutput(false) {}

  /** @brief Records an output chunk. */
  void observe(const string& output);

  /**
   * @brief Builds the metadata object for a broadcast and clears the recent
   * output flag.
   */
  json takeSnapshot(int64_t timestampMs);

  const optional<string>& getTool() const { return tool; }
  const optional<string>& getFilePath() const { return filePath; }

 protected:
  optional<string> model;
  optional<string> providerId;
  optional<string> tool;
  optional<string> filePath;
  bool hasRecentOutput;
};
}  // namespace ts

#endif  // __TS_SESSION_METADATA__
