// SPDX-License-Identifier: MIT
// Minimal JSON writer implementation

#include <matricx/snapshot/json_writer.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace matricx::json {

std::string escape(const std::string& s) {
  std::string result;
  result.reserve(s.size() + 8);

  for (const char c : s) {
    switch (c) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\b': result += "\\b"; break;
      case '\f': result += "\\f"; break;
      case '\n': result += "\\n"; break;
      case '\r': result += "\\r"; break;
      case '\t': result += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          // Control character: output as \u00XX
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          result += buf;
        } else {
          result += c;
        }
        break;
    }
  }

  return result;
}

std::string number(double v) {
  if (!std::isfinite(v)) return "null";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", v);
  // Prefer the short form when it reads back to the same value.
  char shortBuf[32];
  std::snprintf(shortBuf, sizeof(shortBuf), "%.15g", v);
  return (std::strtod(shortBuf, nullptr) == v) ? shortBuf : buf;
}

void ObjectBuilder::maybeComma() {
  if (!first_) {
    ss_ << ", ";
  }
  first_ = false;
}

void ObjectBuilder::addKey(const std::string& key) {
  maybeComma();
  ss_ << "\"" << escape(key) << "\": ";
}

void ObjectBuilder::addString(const std::string& key, const std::string& value) {
  addKey(key);
  ss_ << "\"" << escape(value) << "\"";
}

void ObjectBuilder::addNumber(const std::string& key, double value) {
  addKey(key);
  ss_ << number(value);
}

void ObjectBuilder::addInt(const std::string& key, std::int64_t value) {
  addKey(key);
  ss_ << value;
}

void ObjectBuilder::addBool(const std::string& key, bool value) {
  addKey(key);
  ss_ << (value ? "true" : "false");
}

void ObjectBuilder::addNull(const std::string& key) {
  addKey(key);
  ss_ << "null";
}

void ObjectBuilder::addRaw(const std::string& key, const std::string& json) {
  addKey(key);
  ss_ << json;
}

std::string ObjectBuilder::build() const {
  return "{" + ss_.str() + "}";
}

void ArrayBuilder::addRaw(const std::string& json) {
  if (!first_) {
    ss_ << ", ";
  }
  first_ = false;
  ss_ << json;
}

void ArrayBuilder::addNumber(double value) {
  addRaw(number(value));
}

std::string ArrayBuilder::build() const {
  return "[" + ss_.str() + "]";
}

}  // namespace matricx::json
