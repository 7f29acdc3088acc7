#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/*
TX:
ChunkSource::next() -> (part, bytes)
  -> Envelope{p, t, f, bytes}
     -> encode(Envelope)   // {"p":3,"t":5,"f":"a.bin","d":"<base64>"}
        -> render(text) -> presenter

RX:
capture() -> decode symbol -> text
  -> decode(text, Envelope&)   // Ok | Malformed | Foreign | ...
     -> Ok ? assembler.feed(...) : ignored
*/

namespace proto
{

struct Envelope
{
    std::uint32_t             part_number{0};  // 1-based
    std::uint32_t             total_parts{0};
    std::string               file_name;
    std::vector<std::uint8_t> payload;
};

enum class DecodeStatus
{
    Ok,
    Malformed,     // not a structured record at all
    Foreign,       // a record, but not one of ours (e.g. some unrelated symbol)
    MissingField,  // some protocol keys present, others not
    BadNumber,     // p/t not a positive integer, or p > t
    BadPayload,    // d is not valid base-64
    BadFileName,   // f empty, not a string, not UTF-8, or carrying a path
};

const char *decode_status_name(DecodeStatus s);

// Serialize to the transport record. Returns an empty string (and logs) when
// the envelope violates 1 <= p <= t or carries an unsafe file name.
std::string encode(const Envelope &e);

// Never throws; `out` is only written on DecodeStatus::Ok.
DecodeStatus decode(std::string_view text, Envelope &out);

// Base-64 (standard alphabet, padded)
std::string to_base64(const std::uint8_t *data, std::size_t len);
bool        from_base64(std::string_view text, std::vector<std::uint8_t> &out);

// A plain base name: valid UTF-8, non-empty, no '/', '\\' or NUL, not "." or "..".
bool is_safe_file_name(std::string_view name);

// ceil(file_size / chunk_size); 0 for an empty file or chunk_size == 0
std::uint32_t total_parts_for(std::uint64_t file_size, std::size_t chunk_size);

}  // namespace proto
