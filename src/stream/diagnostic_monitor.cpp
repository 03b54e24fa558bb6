#include "fpb/stream/diagnostic_monitor.hpp"

namespace fpb {
namespace stream {

DiagnosticMonitor::DiagnosticMonitor(const common::GlobalConfig& config,
                                     std::shared_ptr<const common::TextStyle> style,
                                     std::ostream& display, MonitorOptions options)
    : model_(
          [style, &display, render = config.render, options](const std::string& description,
                                                             int64_t total, progress::ProgressUnit unit) {
              progress::RendererOptions renderer_options{render, options.width_provider, options.clock};
              return std::make_unique<progress::ProgressBarRenderer>(
                  description, total, unit, style, display, std::move(renderer_options));
          },
          config.render.default_description),
      forwarder_(config.prompt.suffix, options.input_fd, options.target_fd, style, display) {
}

void DiagnosticMonitor::processByte(char c) {
    diagnostics_ += c;
    
    if (auto line = accumulator_.feed(c)) {
        handleLine(*line);
    } else {
        forwarder_.inspect(accumulator_);
    }
}

void DiagnosticMonitor::processBytes(const char* data, size_t size) {
    for (size_t i = 0; i < size; ++i) {
        processByte(data[i]);
    }
}

void DiagnosticMonitor::close() {
    model_.finish();
}

void DiagnosticMonitor::handleLine(const std::string& line) {
    if (auto position = extractor_.apply(line, model_.session())) {
        model_.update(*position);
    }
}

}}
