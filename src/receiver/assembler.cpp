#include <string>
#include <utility>

#include "proto/envelope.hpp"
#include "receiver/assembler.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace receiver
{

const char *state_name(State s)
{
    switch (s)
    {
        case State::AwaitingFirstPart:
            return "AWAITING_FIRST_PART";
        case State::Collecting:
            return "COLLECTING";
        case State::Complete:
            return "COMPLETE";
        case State::Stalled:
            return "STALLED";
        case State::Interrupted:
            return "INTERRUPTED";
    }
    return "?";
}

const char *outcome_name(Outcome o)
{
    switch (o)
    {
        case Outcome::Restored:
            return "restored";
        case Outcome::DraftSaved:
            return "draft saved";
        case Outcome::NothingReceived:
            return "nothing received";
        case Outcome::WriteFailed:
            return "write failed";
    }
    return "?";
}

static std::string join_parts(const std::vector<std::uint32_t> &v)
{
    std::string out = "[";
    for (std::size_t i = 0; i < v.size(); ++i)
    {
        if (i)
            out += ", ";
        out += std::to_string(v[i]);
    }
    out += "]";
    return out;
}

Assembler::Assembler(const util::Config &cfg, const store::DraftStore &store)
    : cfg_(cfg), store_(store)
{
}

bool Assembler::terminal() const
{
    return state_ == State::Complete || state_ == State::Stalled ||
           state_ == State::Interrupted;
}

std::vector<std::uint32_t> Assembler::missing() const
{
    return store::missing_parts(s_.chunks, s_.total_parts);
}

void Assembler::bind_session(std::uint32_t      total_parts,
                             const std::string &file_name,
                             Clock::time_point  now)
{
    s_.total_parts   = total_parts;
    s_.file_name     = file_name;
    s_.last_progress = now;
    state_           = State::Collecting;

    LOG_SYSTEM("--- Found First Part! ---");
    LOG_SYSTEM("Target file: %s", s_.file_name.c_str());
    LOG_SYSTEM("Total parts to find: %u", s_.total_parts);

    s_.chunks = store_.load(s_.file_name, s_.total_parts);
}

void Assembler::check_complete()
{
    if (state_ == State::Collecting && s_.chunks.size() == s_.total_parts)
        state_ = State::Complete;
}

FeedResult Assembler::feed(std::string_view raw, Clock::time_point now)
{
    if (terminal())
        return FeedResult::Ignored;

    proto::Envelope           env;
    const proto::DecodeStatus st = proto::decode(raw, env);
    if (st != proto::DecodeStatus::Ok)
    {
        ++ignored_;
        if (st == proto::DecodeStatus::Foreign || st == proto::DecodeStatus::Malformed)
            LOG_INFO("Found an unrelated symbol. Ignoring...");
        else
            LOG_DEBUG("ignoring envelope: %s", proto::decode_status_name(st));
        return FeedResult::Ignored;
    }

    // Every part but the last is exactly chunk_size; anything else means the
    // sender runs with another chunk size and would corrupt the output.
    const std::size_t len  = env.payload.size();
    const bool        last = (env.part_number == env.total_parts);
    if ((!last && len != cfg_.chunk_size) || (last && (len == 0 || len > cfg_.chunk_size)))
    {
        ++ignored_;
        LOG_WARN("part %u/%u carries %zu bytes, expected chunk size %zu; ignoring",
                 env.part_number, env.total_parts, len, cfg_.chunk_size);
        return FeedResult::Ignored;
    }

    if (state_ == State::AwaitingFirstPart)
    {
        bind_session(env.total_parts, env.file_name, now);
    }
    else if (env.total_parts != s_.total_parts || env.file_name != s_.file_name)
    {
        ++ignored_;
        LOG_INFO("Ignoring part of another transfer (%s, %u parts)", env.file_name.c_str(),
                 env.total_parts);
        return FeedResult::Ignored;
    }

    FeedResult res;
    if (s_.chunks.count(env.part_number))
    {
        ++duplicates_;
        res = FeedResult::Duplicate;
    }
    else
    {
        s_.chunks.emplace(env.part_number, std::move(env.payload));
        s_.last_progress = now;
        LOG_SYSTEM("Captured part %u/%u. Progress: [%zu of %u]", env.part_number,
                   s_.total_parts, s_.chunks.size(), s_.total_parts);
        res = FeedResult::Accepted;
    }
    // a resumed draft may already hold everything
    check_complete();
    return res;
}

bool Assembler::is_stalled(Clock::time_point now) const
{
    if (state_ != State::Collecting)
        return false;
    if (s_.chunks.size() >= s_.total_parts)
        return false;
    return now - s_.last_progress > cfg_.stall_timeout;
}

bool Assembler::check_stall(Clock::time_point now)
{
    if (!is_stalled(now))
        return false;
    state_ = State::Stalled;
    LOG_SYSTEM("Scan timed out (no new parts found in %.1f seconds).",
               cfg_.stall_timeout.count() / 1000.0);
    LOG_SYSTEM("Assuming broadcast is complete.");
    return true;
}

void Assembler::interrupt()
{
    if (terminal())
        return;
    state_ = State::Interrupted;
    LOG_SYSTEM("Scan interrupted.");
}

Outcome Assembler::finish()
{
    if (!terminal())
        interrupt();

    if (state_ == State::Complete)
    {
        LOG_SYSTEM("--- All Parts Found! ---");
        LOG_SYSTEM("Reassembling file...");
        if (!store_.write_restored(s_.file_name, s_.total_parts, s_.chunks))
            return Outcome::WriteFailed;
        LOG_SYSTEM("SUCCESS! File reassembled as '%s'.",
                   store_.restored_path(s_.file_name).c_str());
        store_.discard(s_.file_name);
        return Outcome::Restored;
    }

    LOG_SYSTEM("--- Saving Draft and Exiting ---");
    if (s_.total_parts == 0 || s_.chunks.empty())
    {
        LOG_SYSTEM("No parts were received. Exiting.");
        return Outcome::NothingReceived;
    }

    // not COMPLETE, so at least one part is missing
    const auto miss = missing();
    LOG_SYSTEM("Found %zu of %u parts.", s_.chunks.size(), s_.total_parts);
    LOG_SYSTEM("Missing %zu parts: %s", miss.size(), join_parts(miss).c_str());

    auto saved = store_.save(s_.file_name, s_.total_parts, s_.chunks);
    if (!saved)
        return Outcome::WriteFailed;

    LOG_SYSTEM("Successfully saved draft file '%s'.", saved->draft_path.c_str());
    LOG_SYSTEM("To resume, run the SENDER with the --remediate flag:");
    LOG_SYSTEM("%.*s %s --remediate %s", (int)constants::SENDER_EXE.size(),
               constants::SENDER_EXE.data(), s_.file_name.c_str(),
               saved->manifest_path.c_str());
    LOG_SYSTEM("Then, re-run the receiver to capture the missing parts.");
    return Outcome::DraftSaved;
}

}  // namespace receiver
