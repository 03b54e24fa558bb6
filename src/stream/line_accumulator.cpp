#include "fpb/stream/line_accumulator.hpp"

namespace fpb {
namespace stream {

std::optional<std::string> LineAccumulator::feed(char c) {
    if (c == '\r' || c == '\n') {
        return finalize();
    }
    
    pending_ += c;
    return std::nullopt;
}

std::string LineAccumulator::finalize() {
    std::string line = std::move(pending_);
    pending_.clear();
    history_.push_back(line);
    return line;
}

bool LineAccumulator::endsWith(const std::string& suffix) const {
    if (suffix.size() > pending_.size()) {
        return false;
    }
    return pending_.compare(pending_.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}}
