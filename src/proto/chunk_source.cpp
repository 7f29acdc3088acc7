#include <filesystem>
#include <system_error>
#include <utility>

#include "proto/chunk_source.hpp"
#include "proto/envelope.hpp"
#include "util/log.hpp"

namespace proto
{
namespace fs = std::filesystem;

ChunkSource::ChunkSource(std::string path, std::size_t chunk_size)
    : path_(std::move(path)), chunk_size_(chunk_size)
{
}

std::string ChunkSource::file_name() const
{
    return fs::path(path_).filename().string();
}

bool ChunkSource::open()
{
    if (chunk_size_ == 0)
    {
        LOG_ERROR("open: chunk size must be positive");
        status_ = SourceStatus::Unavailable;
        return false;
    }

    std::error_code ec;
    if (!fs::is_regular_file(path_, ec))
    {
        LOG_ERROR("Source file '%s' not found", path_.c_str());
        status_ = SourceStatus::Unavailable;
        return false;
    }
    const auto sz = fs::file_size(path_, ec);
    if (ec)
    {
        LOG_ERROR("file_size(%s) failed: %s", path_.c_str(), ec.message().c_str());
        status_ = SourceStatus::Unavailable;
        return false;
    }

    in_.open(path_, std::ios::binary);
    if (!in_.is_open())
    {
        LOG_ERROR("Cannot open source file '%s'", path_.c_str());
        status_ = SourceStatus::Unavailable;
        return false;
    }
    size_        = static_cast<std::uint64_t>(sz);
    total_       = total_parts_for(size_, chunk_size_);
    next_number_ = 1;
    done_        = false;
    status_      = SourceStatus::Ok;
    LOG_DEBUG("opened %s: %llu bytes, %u parts of %zu", path_.c_str(),
              static_cast<unsigned long long>(size_), total_, chunk_size_);
    return true;
}

bool ChunkSource::next(Part &out)
{
    if (done_ || !in_.is_open())
        return false;

    std::vector<std::uint8_t> buf(chunk_size_);
    in_.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()));
    const std::streamsize got = in_.gcount();

    if (in_.bad())
    {
        LOG_ERROR("Error reading file '%s' at part %u", path_.c_str(), next_number_);
        status_ = SourceStatus::ReadError;
        done_   = true;
        return false;
    }
    if (got <= 0)
    {
        done_ = true;
        return false;
    }

    buf.resize(static_cast<std::size_t>(got));
    out.number = next_number_++;
    out.bytes  = std::move(buf);
    // short read means EOF was hit
    if (static_cast<std::size_t>(got) < chunk_size_)
        done_ = true;
    return true;
}

}  // namespace proto
