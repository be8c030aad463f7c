#include "encoding_sniffer.hpp"

#include <array>
#include <fstream>
#include <iterator>
#include <memory>

#include "pool_errors.hpp"

namespace pool_visualizer {

namespace {

struct ByteOrderMark {
  std::string_view bytes;
  TextEncoding encoding;
};

// Priority order matters: equal-length marks resolve to the earlier entry.
constexpr std::array<ByteOrderMark, 6> byteOrderMarks = {{
    {std::string_view("\xEF\xBB\xBF", 3), TextEncoding::Utf8},
    {std::string_view("\xFF\xFE", 2), TextEncoding::Utf16},
    {std::string_view("\x00\x00\xFE\xFF", 4), TextEncoding::Utf32Be},
    {std::string_view("\xFF\xFE\x00\x00", 4), TextEncoding::Utf32Le},
    {std::string_view("\xFE\xFF", 2), TextEncoding::Utf16Be},
    {std::string_view("\xFF\xFE", 2), TextEncoding::Utf16Le},
}};

std::string_view stripMark(std::string_view bytes, TextEncoding encoding) {
  for (const auto& bom : byteOrderMarks) {
    if (bom.encoding == encoding && bytes.starts_with(bom.bytes)) {
      bytes.remove_prefix(bom.bytes.size());
      break;
    }
  }
  return bytes;
}

}  // namespace

std::tuple<TextEncoding, error> EncodingSniffer::Sniff(
    const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return {TextEncoding::Utf8, errors::New("failed to open file: " + path)};
  }

  std::array<char, sniffBytes> buffer{};
  file.read(buffer.data(), buffer.size());
  if (file.bad()) {
    return {TextEncoding::Utf8, errors::New("failed to read file: " + path)};
  }

  return {SniffBytes(std::string_view(buffer.data(),
                                      static_cast<size_t>(file.gcount()))),
          nullptr};
}

TextEncoding EncodingSniffer::SniffBytes(std::string_view bytes) {
  bytes = bytes.substr(0, sniffBytes);

  // A longer mark beats any shorter mark that is its prefix (FF FE 00 00
  // against FF FE).
  const ByteOrderMark* best = nullptr;
  for (const auto& bom : byteOrderMarks) {
    if (!bytes.starts_with(bom.bytes)) continue;
    if (best == nullptr || bom.bytes.size() > best->bytes.size()) {
      best = &bom;
    }
  }
  return best == nullptr ? TextEncoding::Utf8 : best->encoding;
}

const char* EncodingSniffer::Name(TextEncoding encoding) {
  switch (encoding) {
    case TextEncoding::Utf8:
      return "utf-8";
    case TextEncoding::Utf16:
      return "utf-16";
    case TextEncoding::Utf32Be:
      return "utf-32be";
    case TextEncoding::Utf32Le:
      return "utf-32le";
    case TextEncoding::Utf16Be:
      return "utf-16be";
    case TextEncoding::Utf16Le:
      return "utf-16le";
  }
  return "utf-8";
}

std::tuple<std::string, error> EncodingSniffer::DecodeToUtf8(
    std::string_view bytes, TextEncoding encoding) {
  bytes = stripMark(bytes, encoding);

  switch (encoding) {
    case TextEncoding::Utf8:
      return {std::string(bytes), nullptr};
    case TextEncoding::Utf16:
    case TextEncoding::Utf16Le:
      return decodeUnits(bytes, 2, false);
    case TextEncoding::Utf16Be:
      return decodeUnits(bytes, 2, true);
    case TextEncoding::Utf32Le:
      return decodeUnits(bytes, 4, false);
    case TextEncoding::Utf32Be:
      return decodeUnits(bytes, 4, true);
  }
  return {std::string(), errors::New("unknown text encoding")};
}

std::tuple<std::string, error> EncodingSniffer::ReadTextFile(
    const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return {std::string(), errors::New("failed to open file: " + path)};
  }

  std::string bytes((std::istreambuf_iterator<char>(file)),
                    std::istreambuf_iterator<char>());
  if (file.bad()) {
    return {std::string(), errors::New("failed to read file: " + path)};
  }

  auto [text, err] = DecodeToUtf8(bytes, SniffBytes(bytes));
  if (err) {
    return {std::string(), errors::Wrap(err, path)};
  }
  return {std::move(text), nullptr};
}

std::tuple<std::string, error> EncodingSniffer::decodeUnits(
    std::string_view bytes, size_t unitSize, bool bigEndian) {
  if (bytes.size() % unitSize != 0) {
    return {std::string(),
            std::make_shared<EncodingError>(
                "input length " + std::to_string(bytes.size()) +
                " is not a multiple of " + std::to_string(unitSize))};
  }

  auto readUnit = [&](size_t offset) {
    char32_t unit = 0;
    for (size_t i = 0; i < unitSize; ++i) {
      size_t index = bigEndian ? offset + i : offset + unitSize - 1 - i;
      unit = (unit << 8) | static_cast<unsigned char>(bytes[index]);
    }
    return unit;
  };

  std::string out;
  out.reserve(bytes.size() / unitSize);

  for (size_t offset = 0; offset < bytes.size(); offset += unitSize) {
    char32_t unit = readUnit(offset);

    if (unitSize == 2 && unit >= 0xD800 && unit <= 0xDBFF) {
      offset += unitSize;
      if (offset >= bytes.size()) {
        return {std::string(),
                std::make_shared<EncodingError>("truncated surrogate pair")};
      }
      char32_t low = readUnit(offset);
      if (low < 0xDC00 || low > 0xDFFF) {
        return {std::string(),
                std::make_shared<EncodingError>("unpaired high surrogate")};
      }
      unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
    } else if (unit >= 0xD800 && unit <= 0xDFFF) {
      return {std::string(),
              std::make_shared<EncodingError>("unpaired low surrogate")};
    } else if (unit > 0x10FFFF) {
      return {std::string(), std::make_shared<EncodingError>(
                                 "code point out of range at byte " +
                                 std::to_string(offset))};
    }

    appendUtf8(out, unit);
  }

  return {std::move(out), nullptr};
}

void EncodingSniffer::appendUtf8(std::string& out, char32_t codePoint) {
  if (codePoint < 0x80) {
    out += static_cast<char>(codePoint);
  } else if (codePoint < 0x800) {
    out += static_cast<char>(0xC0 | (codePoint >> 6));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else if (codePoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codePoint >> 12));
    out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codePoint >> 18));
    out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  }
}

}  // namespace pool_visualizer
