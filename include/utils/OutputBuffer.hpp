#pragma once
#include <cstddef>
#include <string>

namespace code_interpreter {

inline constexpr std::size_t kDefaultOutputLimit = 10000;
inline constexpr const char* kTruncationMarker = "\n... [output truncated]";

// Keeps at most `limit` bytes of captured text, then appends the marker.
// The cut backs off to a UTF-8 lead byte so no character is split.
inline std::string truncate_output(const std::string& raw, std::size_t limit = kDefaultOutputLimit) {
    if (raw.size() <= limit) return raw;
    std::size_t cut = limit;
    for (int back = 0; back < 3 && cut > 0 && (static_cast<unsigned char>(raw[cut]) & 0xC0) == 0x80; ++back) --cut;
    std::string out = raw.substr(0, cut);
    out += kTruncationMarker;
    return out;
}

}
