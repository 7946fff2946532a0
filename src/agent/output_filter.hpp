#pragma once
#include <string>
#include "agent/errors.hpp"
#include "agent/types.hpp"

namespace ent::agent {

struct FilterResult {
    bool success = false;
    ErrorCode code = ErrorCode::NONE;
    std::string error;
    std::string output;
};

// Line-oriented regex selection over captured output.
//
// An empty pattern returns the output verbatim. Otherwise the output is
// split on '\n' and every line the pattern matches anywhere in is kept.
// Kept lines are concatenated with no separator between them. Patterns use
// RE2 syntax, so inline flags work anywhere: "(?i)warn", "(?i:warn)",
// "disk|(?i)warn".
FilterResult filter_output(const std::string& output, const std::string& pattern);

FilterResult filter_output(const Snapshot& snapshot, const std::string& pattern);

} // namespace ent::agent
