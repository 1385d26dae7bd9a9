#include "SessionMetadata.hpp"

#include <regex>

namespace ts {
namespace {
const vector<pair<string, regex>>& toolPatterns() {
  static const vector<pair<string, regex>> patterns = {
      {"Edit", regex("\\bEdit\\b|\\bediting\\b", regex::icase)},
      {"Bash", regex("\\bBash\\b|\\bRunning\\b|\\bshell\\b", regex::icase)},
      {"Read", regex("\\bRead\\b|\\breading file\\b", regex::icase)},
      {"Write", regex("\\bWrite\\b|\\bwriting\\b", regex::icase)},
      {"Search", regex("\\bSearch\\b|\\bsearching\\b", regex::icase)},
      {"Grep", regex("\\bGrep\\b", regex::icase)},
      {"Glob", regex("\\bGlob\\b", regex::icase)},
      {"WebFetch", regex("\\bWebFetch\\b|\\bfetching\\b", regex::icase)},
      {"Task", regex("\\bTask\\b|\\bsubagent\\b", regex::icase)},
  };
  return patterns;
}

const regex& filePathPattern() {
  static const regex pattern(
      "(?:^|\\s)((?:/[^\\s/]+)+(?:\\.[^\\s]+)?|(?:\\w:[\\\\/][^\\s]+))");
  return pattern;
}
}  // namespace

optional<string> detectTool(const string& output) {
  for (const auto& it : toolPatterns()) {
    if (regex_search(output, it.second)) {
      return it.first;
    }
  }
  return nullopt;
}

optional<string> extractFilePath(const string& output) {
  smatch match;
  if (regex_search(output, match, filePathPattern())) {
    return match[1].str();
  }
  return nullopt;
}

string deriveAgentStatus(const optional<string>& tool, bool hasOutput) {
  if (!hasOutput) {
    return "idle";
  }
  if (tool && (*tool == "Edit" || *tool == "Write")) {
    return "writing";
  }
  if (tool && (*tool == "Read" || *tool == "Grep" || *tool == "Glob")) {
    return "reading";
  }
  return "thinking";
}

void MetadataTracker::observe(const string& output) {
  hasRecentOutput = true;
  auto detected = detectTool(output);
  if (detected) {
    tool = detected;
  }
  auto path = extractFilePath(output);
  if (path) {
    filePath = path;
  }
}

json MetadataTracker::takeSnapshot(int64_t timestampMs) {
  json frame;
  frame["type"] = "metadata";
  frame["timestamp"] = timestampMs;
  if (tool) frame["tool"] = *tool;
  if (filePath) frame["filePath"] = *filePath;
  frame["agentStatus"] = deriveAgentStatus(tool, hasRecentOutput);
  if (model) frame["model"] = *model;
  if (providerId) frame["providerId"] = *providerId;
  hasRecentOutput = false;
  return frame;
}
}  // namespace ts
