#include "probe/text_decode.hpp"

#include <array>
#include <cstdint>

namespace netdiag::probe {

namespace {

constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD";

// Code points for CP866 bytes 0x80..0xFF.
constexpr std::array<std::uint16_t, 128> kCp866HighHalf = {
    0x0410, 0x0411, 0x0412, 0x0413, 0x0414, 0x0415, 0x0416, 0x0417,
    0x0418, 0x0419, 0x041A, 0x041B, 0x041C, 0x041D, 0x041E, 0x041F,
    0x0420, 0x0421, 0x0422, 0x0423, 0x0424, 0x0425, 0x0426, 0x0427,
    0x0428, 0x0429, 0x042A, 0x042B, 0x042C, 0x042D, 0x042E, 0x042F,
    0x0430, 0x0431, 0x0432, 0x0433, 0x0434, 0x0435, 0x0436, 0x0437,
    0x0438, 0x0439, 0x043A, 0x043B, 0x043C, 0x043D, 0x043E, 0x043F,
    0x2591, 0x2592, 0x2593, 0x2502, 0x2524, 0x2561, 0x2562, 0x2556,
    0x2555, 0x2563, 0x2551, 0x2557, 0x255D, 0x255C, 0x255B, 0x2510,
    0x2514, 0x2534, 0x252C, 0x251C, 0x2500, 0x253C, 0x255E, 0x255F,
    0x255A, 0x2554, 0x2569, 0x2566, 0x2560, 0x2550, 0x256C, 0x2567,
    0x2568, 0x2564, 0x2565, 0x2559, 0x2558, 0x2552, 0x2553, 0x256B,
    0x256A, 0x2518, 0x250C, 0x2588, 0x2584, 0x258C, 0x2590, 0x2580,
    0x0440, 0x0441, 0x0442, 0x0443, 0x0444, 0x0445, 0x0446, 0x0447,
    0x0448, 0x0449, 0x044A, 0x044B, 0x044C, 0x044D, 0x044E, 0x044F,
    0x0401, 0x0451, 0x0404, 0x0454, 0x0407, 0x0457, 0x040E, 0x045E,
    0x00B0, 0x2219, 0x00B7, 0x221A, 0x2116, 0x00A4, 0x25A0, 0x00A0,
};

bool IsContinuation(const unsigned char byte) {
  return (byte & 0xC0U) == 0x80U;
}

// Length of the well-formed UTF-8 sequence starting at `pos`, or 0.
std::size_t ValidSequenceLength(std::string_view bytes, const std::size_t pos) {
  const auto at = [&](const std::size_t offset) {
    return static_cast<unsigned char>(bytes[pos + offset]);
  };
  const std::size_t remaining = bytes.size() - pos;
  const unsigned char lead = at(0);

  if (lead < 0x80U) {
    return 1;
  }
  if (lead >= 0xC2U && lead <= 0xDFU) {
    return remaining >= 2U && IsContinuation(at(1)) ? 2U : 0U;
  }
  if (lead >= 0xE0U && lead <= 0xEFU) {
    if (remaining < 3U || !IsContinuation(at(1)) || !IsContinuation(at(2))) {
      return 0;
    }
    if (lead == 0xE0U && at(1) < 0xA0U) {
      return 0;
    }
    if (lead == 0xEDU && at(1) > 0x9FU) {
      return 0;
    }
    return 3;
  }
  if (lead >= 0xF0U && lead <= 0xF4U) {
    if (remaining < 4U || !IsContinuation(at(1)) || !IsContinuation(at(2)) ||
        !IsContinuation(at(3))) {
      return 0;
    }
    if (lead == 0xF0U && at(1) < 0x90U) {
      return 0;
    }
    if (lead == 0xF4U && at(1) > 0x8FU) {
      return 0;
    }
    return 4;
  }
  return 0;
}

void AppendUtf8(std::string& out, const std::uint32_t code_point) {
  if (code_point < 0x80U) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
    out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  }
}

std::string DecodeUtf8Lossy(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    const std::size_t length = ValidSequenceLength(bytes, pos);
    if (length == 0U) {
      out.append(kReplacementCharacter);
      ++pos;
      continue;
    }
    out.append(bytes.substr(pos, length));
    pos += length;
  }
  return out;
}

std::string DecodeCp866(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size() * 2U);
  for (const char c : bytes) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte < 0x80U) {
      out.push_back(c);
    } else {
      AppendUtf8(out, kCp866HighHalf[byte - 0x80U]);
    }
  }
  return out;
}

} // namespace

std::string_view ToString(const TextEncoding encoding) {
  switch (encoding) {
  case TextEncoding::kUtf8:
    return "utf-8";
  case TextEncoding::kCp866:
    return "cp866";
  }
  return "utf-8";
}

std::optional<TextEncoding> ParseTextEncoding(const std::string_view raw) {
  if (raw == "utf-8" || raw == "utf8") {
    return TextEncoding::kUtf8;
  }
  if (raw == "cp866" || raw == "ibm866") {
    return TextEncoding::kCp866;
  }
  return std::nullopt;
}

TextEncoding PlatformOutputEncoding() {
#if defined(_WIN32)
  return TextEncoding::kCp866;
#else
  return TextEncoding::kUtf8;
#endif
}

bool IsValidUtf8(const std::string_view bytes) {
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    const std::size_t length = ValidSequenceLength(bytes, pos);
    if (length == 0U) {
      return false;
    }
    pos += length;
  }
  return true;
}

std::string DecodeProcessOutput(const std::string_view bytes, const TextEncoding expected) {
  switch (expected) {
  case TextEncoding::kCp866:
    return DecodeCp866(bytes);
  case TextEncoding::kUtf8:
    break;
  }
  if (IsValidUtf8(bytes)) {
    return std::string(bytes);
  }
  return DecodeUtf8Lossy(bytes);
}

} // namespace netdiag::probe
