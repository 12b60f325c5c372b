#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace netdiag::probe {

// Encoding a diagnostic tool is expected to write. Russian Windows consoles
// emit the CP866 OEM code page; everything else is treated as UTF-8.
enum class TextEncoding {
  kUtf8,
  kCp866,
};

std::string_view ToString(TextEncoding encoding);
std::optional<TextEncoding> ParseTextEncoding(std::string_view raw);

// Encoding the platform's ping/tracert write to a pipe.
TextEncoding PlatformOutputEncoding();

// True when `bytes` is well-formed UTF-8 (no overlongs, no surrogates).
bool IsValidUtf8(std::string_view bytes);

// Converts raw process output to UTF-8. Never throws and never fails:
// malformed UTF-8 sequences become U+FFFD, and every CP866 byte has a mapping.
std::string DecodeProcessOutput(std::string_view bytes, TextEncoding expected);

} // namespace netdiag::probe
