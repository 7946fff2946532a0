#include "agent/output_filter.hpp"
#include <re2/re2.h>

namespace ent::agent {

FilterResult filter_output(const std::string& output, const std::string& pattern) {
    FilterResult result;
    if (pattern.empty()) {
        result.success = true;
        result.output = output;
        return result;
    }

    RE2::Options options;
    options.set_log_errors(false);
    RE2 re(pattern, options);
    if (!re.ok()) {
        result.code = ErrorCode::PATTERN;
        result.error = "invalid regex pattern: " + re.error();
        return result;
    }

    result.success = true;
    size_t start = 0;
    while (true) {
        size_t end = output.find('\n', start);
        size_t len = (end == std::string::npos ? output.size() : end) - start;
        re2::StringPiece line(output.data() + start, len);
        if (RE2::PartialMatch(line, re)) {
            result.output.append(line.data(), line.size());
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }

    return result;
}

FilterResult filter_output(const Snapshot& snapshot, const std::string& pattern) {
    return filter_output(snapshot.output, pattern);
}

} // namespace ent::agent
