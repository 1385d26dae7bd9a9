#pragma once

#include <string>

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace ts {
/**
 * @brief Parses a frame or response body that must hold a JSON object.
 * @return false (leaving @p out untouched) when the text is not valid JSON
 * or is not an object.
 */
inline bool parseJsonObject(const std::string& text, json* out) {
  json parsed = json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return false;
  }
  *out = std::move(parsed);
  return true;
}

/** @brief Reads a string member, falling back when absent or mistyped. */
inline std::string jsonString(const json& object, const char* key,
                              const std::string& fallback = "") {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

/** @brief Reads a boolean member, falling back when absent or mistyped. */
inline bool jsonBool(const json& object, const char* key, bool fallback) {
  if (!object.is_object()) {
    return fallback;
  }
  auto it = object.find(key);
  if (it == object.end() || !it->is_boolean()) {
    return fallback;
  }
  return it->get<bool>();
}
}  // namespace ts
