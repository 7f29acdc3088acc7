#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <sodium.h>

#include "proto/envelope.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace proto
{

using nlohmann::json;

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

static constexpr int B64_VARIANT = sodium_base64_VARIANT_ORIGINAL;

const char *decode_status_name(DecodeStatus s)
{
    switch (s)
    {
        case DecodeStatus::Ok:
            return "ok";
        case DecodeStatus::Malformed:
            return "malformed";
        case DecodeStatus::Foreign:
            return "foreign";
        case DecodeStatus::MissingField:
            return "missing field";
        case DecodeStatus::BadNumber:
            return "bad number";
        case DecodeStatus::BadPayload:
            return "bad payload";
        case DecodeStatus::BadFileName:
            return "bad file name";
    }
    return "?";
}

static bool is_valid_utf8(std::string_view s)
{
    try
    {
        // strict serializer rejects invalid UTF-8 with type_error 316
        (void)json(std::string(s)).dump();
        return true;
    }
    catch (const json::type_error &)
    {
        return false;
    }
}

bool is_safe_file_name(std::string_view name)
{
    if (name.empty() || name == "." || name == "..")
        return false;
    for (char c : name)
    {
        if (c == '/' || c == '\\' || c == '\0')
            return false;
    }
    // the name travels in a JSON string and must come back byte-identical
    return is_valid_utf8(name);
}

std::uint32_t total_parts_for(std::uint64_t file_size, std::size_t chunk_size)
{
    if (chunk_size == 0)
        return 0;
    const std::uint64_t n = (file_size + chunk_size - 1) / chunk_size;
    if (n > std::numeric_limits<std::uint32_t>::max())
        return 0;
    return static_cast<std::uint32_t>(n);
}

std::string to_base64(const std::uint8_t *data, std::size_t len)
{
    const std::size_t enc_len = sodium_base64_ENCODED_LEN(len, B64_VARIANT);  // includes NUL
    std::string       out(enc_len, '\0');
    sodium_bin2base64(out.data(), out.size(), data, len, B64_VARIANT);
    out.resize(enc_len - 1);
    return out;
}

bool from_base64(std::string_view text, std::vector<std::uint8_t> &out)
{
    if (text.empty())
    {
        out.clear();
        return true;
    }
    std::vector<std::uint8_t> bin(text.size() / 4 * 3 + 3);
    std::size_t               bin_len = 0;
    const char               *end     = nullptr;
    if (sodium_base642bin(bin.data(), bin.size(), text.data(), text.size(), /*ignore=*/nullptr,
                          &bin_len, &end, B64_VARIANT) != 0)
        return false;
    // trailing garbage after the padding
    if (end != text.data() + text.size())
        return false;
    bin.resize(bin_len);
    out = std::move(bin);
    return true;
}

std::string encode(const Envelope &e)
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("sodium_init failed");
        return {};
    }
    // validate fields before packing
    if (e.total_parts == 0 || e.part_number == 0 || e.part_number > e.total_parts)
    {
        LOG_ERROR("encode: invalid part numbering (%u/%u)", e.part_number, e.total_parts);
        return {};
    }
    if (!is_safe_file_name(e.file_name))
    {
        LOG_ERROR("encode: invalid file name '%s'", e.file_name.c_str());
        return {};
    }

    // ordered so the record reads p, t, f, d
    nlohmann::ordered_json j;
    j[std::string(constants::KEY_PART)]  = e.part_number;
    j[std::string(constants::KEY_TOTAL)] = e.total_parts;
    j[std::string(constants::KEY_FILE)]  = e.file_name;
    j[std::string(constants::KEY_DATA)]  = to_base64(e.payload.data(), e.payload.size());
    return j.dump();
}

static bool read_count(const json &v, std::uint32_t &out)
{
    if (!v.is_number_integer())
        return false;
    if (v.is_number_unsigned())
    {
        const auto u = v.get<std::uint64_t>();
        if (u == 0 || u > std::numeric_limits<std::uint32_t>::max())
            return false;
        out = static_cast<std::uint32_t>(u);
        return true;
    }
    // signed integer: only positive values are acceptable
    const auto s = v.get<std::int64_t>();
    if (s <= 0 || s > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
        return false;
    out = static_cast<std::uint32_t>(s);
    return true;
}

DecodeStatus decode(std::string_view text, Envelope &out)
{
    const json j = json::parse(text.begin(), text.end(), /*cb=*/nullptr,
                               /*allow_exceptions=*/false);
    if (j.is_discarded())
        return DecodeStatus::Malformed;
    if (!j.is_object())
        return DecodeStatus::Foreign;

    const auto p = j.find(std::string(constants::KEY_PART));
    const auto t = j.find(std::string(constants::KEY_TOTAL));
    const auto f = j.find(std::string(constants::KEY_FILE));
    const auto d = j.find(std::string(constants::KEY_DATA));

    const int present = (p != j.end()) + (t != j.end()) + (f != j.end()) + (d != j.end());
    if (present == 0)
        return DecodeStatus::Foreign;
    if (present != 4)
        return DecodeStatus::MissingField;

    Envelope e;
    if (!read_count(*p, e.part_number) || !read_count(*t, e.total_parts))
        return DecodeStatus::BadNumber;
    if (e.part_number > e.total_parts)
        return DecodeStatus::BadNumber;

    if (!f->is_string())
        return DecodeStatus::BadFileName;
    e.file_name = f->get<std::string>();
    if (!is_safe_file_name(e.file_name))
        return DecodeStatus::BadFileName;

    if (!d->is_string())
        return DecodeStatus::BadPayload;
    if (!from_base64(d->get_ref<const std::string &>(), e.payload))
        return DecodeStatus::BadPayload;

    out = std::move(e);
    return DecodeStatus::Ok;
}

}  // namespace proto
