#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>

#include "store/draft_store.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace store
{
namespace fs = std::filesystem;
using nlohmann::json;

static bool all_zero(const std::vector<std::uint8_t> &v)
{
    return std::all_of(v.begin(), v.end(), [](std::uint8_t b) { return b == 0; });
}

bool write_manifest(const std::string &path, const Manifest &m)
{
    nlohmann::ordered_json j;
    j["filename"]    = m.file_name;
    j["total_parts"] = m.total_parts;
    j["missing"]     = m.missing;

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
    {
        LOG_ERROR("Error saving missing parts JSON: cannot open %s", path.c_str());
        return false;
    }
    out << j.dump(2, ' ', false, json::error_handler_t::replace) << '\n';
    out.flush();
    if (!out.good())
    {
        LOG_ERROR("Error saving missing parts JSON: write to %s failed", path.c_str());
        return false;
    }
    return true;
}

std::optional<Manifest> read_manifest(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
        return std::nullopt;
    std::stringstream ss;
    ss << in.rdbuf();

    const json j = json::parse(ss.str(), /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
    {
        LOG_WARN("%s is not a valid manifest", path.c_str());
        return std::nullopt;
    }

    Manifest m;
    auto     f = j.find("filename");
    if (f != j.end() && f->is_string())
        m.file_name = f->get<std::string>();
    auto t = j.find("total_parts");
    if (t != j.end() && t->is_number_unsigned())
        m.total_parts = t->get<std::uint32_t>();

    auto miss = j.find("missing");
    if (miss == j.end() || !miss->is_array())
    {
        LOG_WARN("%s has no 'missing' list", path.c_str());
        return std::nullopt;
    }
    std::set<std::uint32_t> parts;
    for (const auto &v : *miss)
    {
        if (!v.is_number_unsigned() || v.get<std::uint64_t>() == 0 ||
            v.get<std::uint64_t>() > UINT32_MAX)
        {
            LOG_WARN("%s: ignoring invalid part entry %s", path.c_str(), v.dump().c_str());
            continue;
        }
        parts.insert(v.get<std::uint32_t>());
    }
    m.missing.assign(parts.begin(), parts.end());
    return m;
}

std::vector<std::uint32_t> missing_parts(const ChunkMap &chunks, std::uint32_t total_parts)
{
    std::vector<std::uint32_t> out;
    for (std::uint32_t i = 1; i <= total_parts; ++i)
    {
        if (chunks.count(i) == 0)
            out.push_back(i);
    }
    return out;
}

DraftStore::DraftStore(std::string dir, std::size_t chunk_size)
    : dir_(std::move(dir)), chunk_size_(chunk_size)
{
}

std::string DraftStore::draft_path(const std::string &file_name) const
{
    return (fs::path(dir_) / (std::string(constants::DRAFT_PREFIX) + file_name)).string();
}

std::string DraftStore::restored_path(const std::string &file_name) const
{
    return (fs::path(dir_) / (std::string(constants::RESTORED_PREFIX) + file_name)).string();
}

std::string DraftStore::manifest_path() const
{
    return (fs::path(dir_) / std::string(constants::MANIFEST_NAME)).string();
}

std::optional<SavedDraft> DraftStore::save(const std::string &file_name,
                                           std::uint32_t      total_parts,
                                           const ChunkMap    &chunks) const
{
    SavedDraft res;
    res.draft_path           = draft_path(file_name);
    res.manifest_path        = manifest_path();
    res.manifest.file_name   = file_name;
    res.manifest.total_parts = total_parts;
    res.manifest.missing     = missing_parts(chunks, total_parts);

    // draft first: a manifest must never describe a draft that is not there
    LOG_INFO("Saving received parts to '%s'...", res.draft_path.c_str());
    std::ofstream out(res.draft_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        LOG_ERROR("Error saving draft file: cannot open %s", res.draft_path.c_str());
        return std::nullopt;
    }
    const std::vector<char> zeros(chunk_size_, '\0');
    for (std::uint32_t i = 1; i <= total_parts; ++i)
    {
        auto it = chunks.find(i);
        if (it != chunks.end())
        {
            out.write(reinterpret_cast<const char *>(it->second.data()),
                      static_cast<std::streamsize>(it->second.size()));
        }
        else if (i != total_parts)
        {
            out.write(zeros.data(), static_cast<std::streamsize>(zeros.size()));
        }
        // a missing final part is never padded: its length is unknown
    }
    out.flush();
    if (!out.good())
    {
        LOG_ERROR("Error saving draft file: write to %s failed", res.draft_path.c_str());
        return std::nullopt;
    }
    out.close();

    if (!write_manifest(res.manifest_path, res.manifest))
        return std::nullopt;
    LOG_INFO("Successfully saved '%s'.", res.manifest_path.c_str());
    return res;
}

ChunkMap DraftStore::load(const std::string &file_name, std::uint32_t total_parts) const
{
    ChunkMap          out;
    const std::string path = draft_path(file_name);
    std::error_code   ec;
    if (total_parts == 0 || chunk_size_ == 0 || !fs::is_regular_file(path, ec))
        return out;

    const auto          size = static_cast<std::uint64_t>(fs::file_size(path, ec));
    const std::uint64_t head = static_cast<std::uint64_t>(total_parts - 1) * chunk_size_;
    if (ec || size < head || size > head + chunk_size_)
    {
        LOG_WARN("Draft '%s' has %llu bytes, which does not fit %u parts of %zu; ignoring it",
                 path.c_str(), static_cast<unsigned long long>(size), total_parts, chunk_size_);
        return out;
    }

    // a manifest for this very session says which strides are real
    std::optional<std::set<std::uint32_t>> missing;
    if (auto m = read_manifest(manifest_path()))
    {
        if (m->file_name == file_name && m->total_parts == total_parts)
            missing.emplace(m->missing.begin(), m->missing.end());
        else
            LOG_DEBUG("manifest belongs to '%s' (%u parts), not used", m->file_name.c_str(),
                      m->total_parts);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        LOG_WARN("Error reading draft file '%s'", path.c_str());
        return out;
    }
    LOG_INFO("Resuming from existing '%s'.", path.c_str());

    for (std::uint32_t i = 1; i <= total_parts; ++i)
    {
        std::vector<std::uint8_t> buf(chunk_size_);
        in.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()));
        const std::streamsize got = in.gcount();
        if (in.bad())
        {
            LOG_WARN("Error reading draft file '%s' at part %u", path.c_str(), i);
            break;
        }
        if (got <= 0)
            break;
        buf.resize(static_cast<std::size_t>(got));

        bool present;
        if (missing)
            present = missing->count(i) == 0;
        else
            present = !all_zero(buf);
        if (present)
            out.emplace(i, std::move(buf));
    }
    LOG_INFO("Loaded %zu existing parts.", out.size());
    return out;
}

bool DraftStore::write_restored(const std::string &file_name,
                                std::uint32_t      total_parts,
                                const ChunkMap    &chunks) const
{
    const std::string path = restored_path(file_name);
    for (std::uint32_t i = 1; i <= total_parts; ++i)
    {
        if (chunks.count(i) == 0)
        {
            LOG_ERROR("write_restored: part %u is missing", i);
            return false;
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        LOG_ERROR("FATAL ERROR: Could not write file '%s'", path.c_str());
        return false;
    }
    for (std::uint32_t i = 1; i <= total_parts; ++i)
    {
        const auto &bytes = chunks.at(i);
        out.write(reinterpret_cast<const char *>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    }
    out.flush();
    if (!out.good())
    {
        LOG_ERROR("FATAL ERROR: Could not write file '%s'", path.c_str());
        return false;
    }
    return true;
}

void DraftStore::discard(const std::string &file_name) const
{
    std::error_code   ec;
    const std::string draft = draft_path(file_name);
    if (fs::remove(draft, ec))
        LOG_DEBUG("removed %s", draft.c_str());
    else if (ec)
        LOG_WARN("cannot remove %s: %s", draft.c_str(), ec.message().c_str());

    const std::string manifest = manifest_path();
    auto              m        = read_manifest(manifest);
    if (m && m->file_name == file_name)
    {
        if (!fs::remove(manifest, ec) && ec)
            LOG_WARN("cannot remove %s: %s", manifest.c_str(), ec.message().c_str());
    }
}

}  // namespace store
