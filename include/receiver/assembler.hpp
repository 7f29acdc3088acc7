#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "store/draft_store.hpp"
#include "util/config.hpp"

/*
  AWAITING_FIRST_PART ──(first valid envelope: bind t/f, load draft)──▶ COLLECTING
  COLLECTING ──(all t parts present)──▶ COMPLETE     -> RESTORED_<f>, draft removed
  COLLECTING ──(no new part for stall_timeout)──▶ STALLED      -> DRAFT_<f> + manifest
  any non-terminal ──(interrupt)──▶ INTERRUPTED                  -> DRAFT_<f> + manifest
*/

namespace receiver
{

using Clock = std::chrono::steady_clock;

enum class State
{
    AwaitingFirstPart,
    Collecting,
    Complete,
    Stalled,
    Interrupted,
};

enum class FeedResult
{
    Accepted,   // a new part
    Duplicate,  // already had it
    Ignored,    // undecodable, foreign, or inconsistent with the session
};

enum class Outcome
{
    Restored,
    DraftSaved,
    NothingReceived,
    WriteFailed,  // RESTORED_<f> or the draft could not be written
};

const char *state_name(State s);
const char *outcome_name(Outcome o);

struct Session
{
    store::ChunkMap   chunks;
    std::uint32_t     total_parts{0};
    std::string       file_name;
    Clock::time_point last_progress{};
};

// Sole owner of the reception state. Not thread-safe: one thread feeds it.
class Assembler
{
  public:
    Assembler(const util::Config &cfg, const store::DraftStore &store);

    FeedResult feed(std::string_view raw, Clock::time_point now);

    // true iff collecting, incomplete and idle for longer than stall_timeout
    bool is_stalled(Clock::time_point now) const;
    // moves to STALLED when is_stalled(now); returns whether it did
    bool check_stall(Clock::time_point now);
    void interrupt();

    // Terminal action for COMPLETE / STALLED / INTERRUPTED. A session that is
    // not terminal yet is treated as interrupted.
    Outcome finish();

    State                      state() const { return state_; }
    bool                       terminal() const;
    const Session             &session() const { return s_; }
    std::vector<std::uint32_t> missing() const;

    std::uint64_t ignored() const { return ignored_; }
    std::uint64_t duplicates() const { return duplicates_; }

  private:
    void bind_session(std::uint32_t total_parts, const std::string &file_name,
                      Clock::time_point now);
    void check_complete();

    util::Config             cfg_;
    const store::DraftStore &store_;
    State                    state_{State::AwaitingFirstPart};
    Session                  s_;
    std::uint64_t            ignored_{0};
    std::uint64_t            duplicates_{0};
};

}  // namespace receiver
