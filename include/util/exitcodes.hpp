#pragma once

namespace exitc
{
constexpr int ok           = 0;
constexpr int bad_args     = 2;
constexpr int source_error = 3;  // file missing/unreadable, bad manifest
constexpr int partial      = 4;  // draft + manifest written
constexpr int nothing      = 5;  // session ended with no part received
constexpr int write_failed = 6;
}  // namespace exitc
