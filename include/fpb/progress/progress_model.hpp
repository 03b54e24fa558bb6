#pragma once

#include "session.hpp"
#include "progress_bar.hpp"
#include <string>
#include <memory>
#include <functional>
#include <optional>
#include <cstdint>

namespace fpb {
namespace progress {

using RendererFactory = std::function<std::unique_ptr<ProgressBarRenderer>(
    const std::string& description, int64_t total, ProgressUnit unit)>;

class ProgressModel {
public:
    ProgressModel(RendererFactory factory, std::string default_description);
    
    // Converts to frames once a frame rate is known. The renderer is created
    // on the first call and keeps its description, total and unit afterwards.
    ProgressSample update(int64_t current_seconds);
    
    // Completes the bar if one was ever shown.
    void finish();
    
    Session& session() { return session_; }
    const Session& session() const { return session_; }
    
    const std::optional<ProgressSample>& lastSample() const { return last_sample_; }
    const ProgressBarRenderer* renderer() const { return renderer_.get(); }

private:
    RendererFactory factory_;
    std::string default_description_;
    
    Session session_;
    std::optional<ProgressSample> last_sample_;
    std::unique_ptr<ProgressBarRenderer> renderer_;
};

}}
