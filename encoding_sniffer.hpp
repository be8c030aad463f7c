#pragma once

#include <string>
#include <string_view>
#include <tuple>

#include "ports/errors/errors.hpp"

namespace pool_visualizer {

enum class TextEncoding {
  Utf8,
  Utf16,  // byte order taken from the mark, little-endian hosts write FF FE
  Utf32Be,
  Utf32Le,
  Utf16Be,
  Utf16Le
};

class EncodingSniffer {
 public:
  static constexpr size_t sniffBytes = 64;

  // Picks the encoding from the byte-order mark at the start of the file.
  // Files without a recognised mark are reported as UTF-8.
  static std::tuple<TextEncoding, error> Sniff(const std::string& path);

  // Same rules applied to bytes already in memory.
  static TextEncoding SniffBytes(std::string_view bytes);

  static const char* Name(TextEncoding encoding);

  // Strips the byte-order mark and transcodes to UTF-8.
  static std::tuple<std::string, error> DecodeToUtf8(std::string_view bytes,
                                                     TextEncoding encoding);

  static std::tuple<std::string, error> ReadTextFile(const std::string& path);

 private:
  static std::tuple<std::string, error> decodeUnits(std::string_view bytes,
                                                    size_t unitSize,
                                                    bool bigEndian);
  static void appendUtf8(std::string& out, char32_t codePoint);
};

}  // namespace pool_visualizer
