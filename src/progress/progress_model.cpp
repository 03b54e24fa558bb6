#include "fpb/progress/progress_model.hpp"
#include "fpb/common/logger.hpp"

namespace fpb {
namespace progress {

ProgressModel::ProgressModel(RendererFactory factory, std::string default_description)
    : factory_(std::move(factory)),
      default_description_(std::move(default_description)) {
}

ProgressSample ProgressModel::update(int64_t current_seconds) {
    ProgressSample sample;
    sample.current = current_seconds;
    sample.total = session_.total_duration_seconds;
    sample.unit = ProgressUnit::SECONDS;
    
    if (session_.frame_rate > 0) {
        sample.unit = ProgressUnit::FRAMES;
        sample.current *= session_.frame_rate;
        if (sample.total > 0) {
            sample.total *= session_.frame_rate;
        }
    }
    
    if (!renderer_ && factory_) {
        const std::string& description = session_.source_name.empty()
            ? default_description_
            : session_.source_name;
        
        renderer_ = factory_(description, sample.total, sample.unit);
        if (renderer_) {
            session_.start_time = renderer_->startTime();
        }
        
        common::Logger::instance().debug("[Progress] Renderer created | desc={} | total={} | unit={}",
                                         description, sample.total, unitToString(sample.unit));
    }
    
    last_sample_ = sample;
    
    if (renderer_) {
        renderer_->update(sample.current);
    }
    
    return sample;
}

void ProgressModel::finish() {
    if (renderer_) {
        renderer_->finish();
    }
}

}}
