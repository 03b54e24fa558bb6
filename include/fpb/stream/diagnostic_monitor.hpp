#pragma once

#include "line_accumulator.hpp"
#include "../common/config.hpp"
#include "../common/text_style.hpp"
#include "../progress/fact_extractor.hpp"
#include "../progress/progress_model.hpp"
#include "../prompt/prompt_forwarder.hpp"
#include <string>
#include <memory>
#include <ostream>

namespace fpb {
namespace stream {

struct MonitorOptions {
    int input_fd;
    int target_fd;
    progress::WidthProvider width_provider;
    progress::Clock clock;
};

// Consumes the wrapped program's diagnostic stream one byte at a time.
class DiagnosticMonitor {
public:
    DiagnosticMonitor(const common::GlobalConfig& config,
                      std::shared_ptr<const common::TextStyle> style,
                      std::ostream& display, MonitorOptions options);
    
    void processByte(char c);
    void processBytes(const char* data, size_t size);
    
    void close();
    
    const std::string& diagnostics() const { return diagnostics_; }
    const LineAccumulator& accumulator() const { return accumulator_; }
    const progress::ProgressModel& model() const { return model_; }
    prompt::PromptForwarder& forwarder() { return forwarder_; }

private:
    std::string diagnostics_;
    LineAccumulator accumulator_;
    progress::FactExtractor extractor_;
    progress::ProgressModel model_;
    prompt::PromptForwarder forwarder_;
    
    void handleLine(const std::string& line);
};

}}
