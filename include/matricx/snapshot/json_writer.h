// SPDX-License-Identifier: MIT
// Minimal JSON writer for snapshot serialization

#pragma once

#include <cstdint>
#include <sstream>
#include <string>

namespace matricx::json {

/// Escape a string for JSON output (handles quotes, backslashes, control chars).
std::string escape(const std::string& s);

/// Shortest round-trippable rendering of a double; non-finite values become null.
std::string number(double v);

/// JSON object builder for convenient construction.
class ObjectBuilder {
public:
  void addString(const std::string& key, const std::string& value);

  void addNumber(const std::string& key, double value);
  void addInt(const std::string& key, std::int64_t value);
  void addBool(const std::string& key, bool value);
  void addNull(const std::string& key);

  /// Add a pre-built JSON value (object, array) under key.
  void addRaw(const std::string& key, const std::string& json);

  /// Build the final JSON object string.
  std::string build() const;

private:
  std::ostringstream ss_;
  bool first_ = true;

  void maybeComma();
  void addKey(const std::string& key);
};

/// JSON array builder for convenient construction.
class ArrayBuilder {
public:
  /// Add a raw JSON value (object string, etc.).
  void addRaw(const std::string& json);

  void addNumber(double value);

  /// Build the final JSON array string.
  std::string build() const;

private:
  std::ostringstream ss_;
  bool first_ = true;
};

}  // namespace matricx::json
