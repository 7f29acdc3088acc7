#pragma once
#include <cstddef>
#include <string_view>

namespace constants
{
// Both ends must agree on this out-of-band; it is never transmitted.
inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 2048;

// Transport record keys
inline constexpr std::string_view KEY_PART  = "p";
inline constexpr std::string_view KEY_TOTAL = "t";
inline constexpr std::string_view KEY_FILE  = "f";
inline constexpr std::string_view KEY_DATA  = "d";

// Receiver artifacts
inline constexpr std::string_view DRAFT_PREFIX    = "DRAFT_";
inline constexpr std::string_view RESTORED_PREFIX = "RESTORED_";
inline constexpr std::string_view MANIFEST_NAME   = "missing_parts.json";

// used when printing the remediation command
inline constexpr std::string_view SENDER_EXE = "gapcast-send";

}  // namespace constants
