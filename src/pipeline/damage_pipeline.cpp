/// @file damage_pipeline.cpp
/// @brief DamagePipeline implementation.

#include "cdp/pipeline/damage_pipeline.hpp"

#include <utility>

namespace cdp::pipeline {

DamagePipeline::DamagePipeline(const PipelineConfig& config,
                               combat::EntityRegistry& registry,
                               WarningThrottle::Clock clock)
    : config_(config),
      registry_(registry),
      random_(config_.seed),
      resolver_(registry_, random_, config_.resolver),
      intake_(config_.intake, std::move(clock)),
      processor_(intake_, registry_, resolver_, config_.maxPerTick) {}

void DamagePipeline::PublishMetrics(foundation::GameMetrics& metrics) const {
    const auto stats = Stats();
    auto gauge = [&metrics](std::string_view name, auto value) {
        metrics.setGauge(name, static_cast<double>(value));
    };

    gauge("cdp_requests_enqueued", stats.intake.enqueued);
    gauge("cdp_requests_dropped_overflow", stats.intake.droppedOverflow);
    gauge("cdp_requests_hard_dropped", stats.intake.hardDropped);
    gauge("cdp_tags_truncated", stats.intake.truncatedTags);
    gauge("cdp_queue_max_watermark", stats.intake.maxWatermark);
    gauge("cdp_queue_depth", stats.queueDepth);
    gauge("cdp_queue_capacity", stats.queueCapacity);

    gauge("cdp_requests_processed", stats.batch.processed);
    gauge("cdp_requests_resolved", stats.batch.resolved);
    gauge("cdp_requests_unknown_source", stats.batch.unknownSource);
    gauge("cdp_requests_unknown_target", stats.batch.unknownTarget);
    gauge("cdp_requests_dead_target", stats.batch.deadTarget);
    gauge("cdp_tick", stats.tick);

    gauge("cdp_pool_request_soft_overflows", stats.requestPoolOverflows);
    gauge("cdp_pool_tag_soft_overflows", stats.tagPoolOverflows);
    gauge("cdp_pool_requests_in_use", stats.requestsInUse);
    gauge("cdp_pool_tag_lists_in_use", stats.tagListsInUse);

    gauge("cdp_registry_entities", registry_.Count());
}

}  // namespace cdp::pipeline
