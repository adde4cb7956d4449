/// @file batch_processor.cpp
/// @brief BatchProcessor implementation.

#include "cdp/pipeline/batch_processor.hpp"

#include <string>

#include "cdp/foundation/game_logger.hpp"

namespace cdp::pipeline {

using foundation::LogCategory;
using foundation::LogContext;

namespace {

LogContext requestContext(const combat::DamageRequest& request, uint64_t tick) {
    LogContext ctx;
    ctx.entityId = request.target;
    ctx.sourceId = request.source;
    ctx.tick = tick;
    return ctx;
}

}  // namespace

BatchProcessor::BatchProcessor(EventIntakeAdapter& intake,
                               combat::EntityRegistry& registry,
                               combat::DamageResolver& resolver,
                               std::size_t maxPerTick)
    : intake_(intake), registry_(registry), resolver_(resolver), maxPerTick_(maxPerTick) {}

std::size_t BatchProcessor::ProcessTick() {
    intake_.FlushOverflowWarning();

    std::size_t count = 0;
    while (count < maxPerTick_) {
        auto* request = intake_.TryDequeue();
        if (request == nullptr) {
            break;
        }
        ++count;
        ++counters_.processed;
        if (processOne(*request)) {
            ++counters_.resolved;
        }
        intake_.Recycle(request);
    }
    ++tick_;
    return count;
}

bool BatchProcessor::processOne(const combat::DamageRequest& request) {
    auto& logger = foundation::GameLogger::instance();

    if (!registry_.Contains(request.source)) {
        ++counters_.unknownSource;
        logger.logWithContext(foundation::LogLevel::Warning, LogCategory::Combat,
                              "discarding damage request " + std::to_string(request.sequence) +
                                  ": unknown source",
                              requestContext(request, tick_));
        return false;
    }

    const auto* target = registry_.Get(request.target);
    if (target == nullptr) {
        ++counters_.unknownTarget;
        logger.logWithContext(foundation::LogLevel::Warning, LogCategory::Combat,
                              "discarding damage request " + std::to_string(request.sequence) +
                                  ": unknown target",
                              requestContext(request, tick_));
        return false;
    }
    if (!target->alive) {
        ++counters_.deadTarget;
        logger.logWithContext(foundation::LogLevel::Warning, LogCategory::Combat,
                              "discarding damage request " + std::to_string(request.sequence) +
                                  ": target already dead",
                              requestContext(request, tick_));
        return false;
    }

    const auto result = resolver_.Resolve(request, tick_);
    onDamageResult_.emit(result);
    return true;
}

PipelineStats BatchProcessor::Stats() const {
    PipelineStats stats;
    stats.intake = intake_.Counters();
    stats.batch = counters_;
    stats.tick = tick_;
    stats.queueDepth = intake_.QueueDepth();
    stats.queueCapacity = intake_.QueueCapacity();
    stats.requestPoolOverflows = intake_.RequestPool().SoftOverflowCount();
    stats.tagPoolOverflows = intake_.TagPool().SoftOverflowCount();
    stats.requestsInUse = intake_.RequestPool().InUse();
    stats.tagListsInUse = intake_.TagPool().InUse();
    return stats;
}

}  // namespace cdp::pipeline
