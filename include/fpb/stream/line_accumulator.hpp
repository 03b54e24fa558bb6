#pragma once

#include <string>
#include <vector>
#include <optional>

namespace fpb {
namespace stream {

class LineAccumulator {
public:
    LineAccumulator() = default;
    
    // Returns the completed line when c is '\r' or '\n'.
    std::optional<std::string> feed(char c);
    
    // Finalizes the in-progress line even without a terminator.
    std::string finalize();
    
    const std::string& pending() const { return pending_; }
    const std::vector<std::string>& history() const { return history_; }
    
    bool endsWith(const std::string& suffix) const;

private:
    std::string pending_;
    std::vector<std::string> history_;
};

}}
