#pragma once

#include <string>
#include <utility>

#include "ports/errors/errors.hpp"

namespace pool_visualizer {

// Typed errors raised by the ingestion engine. Callers match them with
// errors::As() through any number of errors::Wrap() layers.

class EncodingError : public errors::Error {
 public:
  explicit EncodingError(std::string msg) : message(std::move(msg)) {}
  [[nodiscard]] std::string What() const override {
    return "encoding error: " + message;
  }

 private:
  std::string message;
};

class SchemaMismatchError : public errors::Error {
 public:
  explicit SchemaMismatchError(std::string msg) : message(std::move(msg)) {}
  [[nodiscard]] std::string What() const override {
    return "schema mismatch: " + message;
  }

 private:
  std::string message;
};

class TimestampParseError : public errors::Error {
 public:
  TimestampParseError(std::string col, std::string val, size_t ln)
      : column(std::move(col)), value(std::move(val)), line(ln) {}
  [[nodiscard]] std::string What() const override {
    return "cannot parse " + column + " value \"" + value + "\" on line " +
           std::to_string(line) + " (expected YYYY-MM-DDTHH:MM:SS)";
  }

  std::string column;
  std::string value;
  size_t line;
};

class RepeatedDigestError : public errors::Error {
 public:
  explicit RepeatedDigestError(std::string msg) : message(std::move(msg)) {}
  [[nodiscard]] std::string What() const override { return message; }

 private:
  std::string message;
};

class InvalidSelectorError : public errors::Error {
 public:
  InvalidSelectorError(std::string kind, std::string val)
      : selectorKind(std::move(kind)), value(std::move(val)) {}
  [[nodiscard]] std::string What() const override {
    return "invalid " + selectorKind + ": " + value;
  }

  std::string selectorKind;
  std::string value;
};

class DuplicateEntryError : public errors::Error {
 public:
  DuplicateEntryError(std::string t, std::string ts)
      : tag(std::move(t)), timestamp(std::move(ts)) {}
  [[nodiscard]] std::string What() const override {
    return "tag " + tag + " has more than one entry at " + timestamp;
  }

  std::string tag;
  std::string timestamp;
};

}  // namespace pool_visualizer
