#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace store
{

// part number -> raw payload, iterated in ascending part order
using ChunkMap = std::map<std::uint32_t, std::vector<std::uint8_t>>;

// missing_parts.json: {"filename": ..., "total_parts": N, "missing": [..]}
struct Manifest
{
    std::string                file_name;
    std::uint32_t              total_parts{0};
    std::vector<std::uint32_t> missing;  // ascending, unique
};

bool                    write_manifest(const std::string &path, const Manifest &m);
std::optional<Manifest> read_manifest(const std::string &path);

// {1..total} minus the keys of `chunks`, ascending
std::vector<std::uint32_t> missing_parts(const ChunkMap &chunks, std::uint32_t total_parts);

struct SavedDraft
{
    std::string draft_path;
    std::string manifest_path;
    Manifest    manifest;
};

/*
Draft layout (chunk_size = C, total = N):
  [part 1: C][part 2: C] ... [part N-1: C][part N: 1..C]
A missing part 1..N-1 is C zero bytes; a missing part N is simply absent, so
the draft is then exactly (N-1)*C long.
*/
class DraftStore
{
  public:
    DraftStore(std::string dir, std::size_t chunk_size);

    std::string draft_path(const std::string &file_name) const;
    std::string restored_path(const std::string &file_name) const;
    std::string manifest_path() const;

    // Writes the draft and the manifest. nullopt (logged) on a write fault.
    std::optional<SavedDraft> save(const std::string &file_name,
                                   std::uint32_t      total_parts,
                                   const ChunkMap    &chunks) const;

    // Parts recoverable from an earlier draft of `file_name`; empty when there
    // is none or it does not fit `total_parts`. A matching manifest decides
    // presence; without one, all-zero strides are taken as gaps.
    ChunkMap load(const std::string &file_name, std::uint32_t total_parts) const;

    // Concatenate parts 1..total into RESTORED_<file_name>.
    bool write_restored(const std::string &file_name,
                        std::uint32_t      total_parts,
                        const ChunkMap    &chunks) const;

    // Remove the draft, and the manifest if it belongs to `file_name`.
    void discard(const std::string &file_name) const;

    std::size_t chunk_size() const { return chunk_size_; }

  private:
    std::string dir_;
    std::size_t chunk_size_;
};

}  // namespace store
