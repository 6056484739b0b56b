#pragma once

#include "Headers.hpp"
#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace muxcore {
/**
 * @brief Parses a JSON document, rethrowing parse failures as
 * `std::runtime_error` tagged with `what`.
 */
inline json parseJsonOrThrow(const string &text, const string &what) {
  try {
    return json::parse(text);
  } catch (const json::parse_error &pe) {
    throw std::runtime_error("Invalid JSON in " + what + ": " + pe.what());
  }
}
}  // namespace muxcore
