#pragma once
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace proto
{

enum class SourceStatus
{
    Ok,
    Unavailable,  // cannot open/stat the file
    ReadError,    // I/O fault after opening; iteration stopped early
};

struct Part
{
    std::uint32_t             number{0};  // 1-based
    std::vector<std::uint8_t> bytes;
};

// Reads a file in chunk_size pieces numbered 1..N. Single pass: once next()
// has returned false the source is exhausted for good.
class ChunkSource
{
  public:
    ChunkSource(std::string path, std::size_t chunk_size);

    ChunkSource(const ChunkSource &)            = delete;
    ChunkSource &operator=(const ChunkSource &) = delete;

    // false when the file cannot be opened (status() == Unavailable)
    bool open();

    // false at end of file or on a read fault (check status())
    bool next(Part &out);

    SourceStatus       status() const { return status_; }
    std::uint64_t      file_size() const { return size_; }
    std::uint32_t      total_parts() const { return total_; }
    std::size_t        chunk_size() const { return chunk_size_; }
    const std::string &path() const { return path_; }
    // base name of the path, as carried in every envelope
    std::string        file_name() const;

  private:
    std::string   path_;
    std::size_t   chunk_size_;
    std::ifstream in_;
    std::uint64_t size_{0};
    std::uint32_t total_{0};
    std::uint32_t next_number_{1};
    bool          done_{false};
    SourceStatus  status_{SourceStatus::Ok};
};

}  // namespace proto
