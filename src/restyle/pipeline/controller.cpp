//
//  controller.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/pipeline.h"

#include "restyle/audio_io.h"
#include "restyle/conditioner.h"
#include "restyle/logging.hpp"
#include "restyle/reassembler.h"
#include "restyle/segmenter.h"

#include <cmath>
#include <sstream>
#include <utility>

namespace restyle {
namespace {

std::string join_indices(const std::vector<std::size_t>& indices) {
    std::ostringstream out;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << indices[i];
    }
    return out.str();
}

} // namespace

const char* pipeline_state_name(PipelineState state) {
    switch (state) {
        case PipelineState::Idle:
            return "idle";
        case PipelineState::Segmented:
            return "segmented";
        case PipelineState::Generating:
            return "generating";
        case PipelineState::Completed:
            return "completed";
        case PipelineState::PartiallyFailed:
            return "partially-failed";
        case PipelineState::Failed:
            return "failed";
        case PipelineState::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

PipelineController::PipelineController(const RestyleConfig& config)
    : config_(config) {}

PipelineController::PipelineController(const RestyleConfig& config,
                                       std::unique_ptr<GenerationOrchestrator> orchestrator)
    : config_(config),
      orchestrator_(std::move(orchestrator)) {}

PipelineController::~PipelineController() = default;

void PipelineController::cancel() {
    cancel_.store(true, std::memory_order_release);
}

bool PipelineController::cancelled() const {
    return cancel_.load(std::memory_order_acquire);
}

bool PipelineController::run(const SourceTrack& source, PipelineResult* result) {
    StyleDescriptor style;
    style.text = config_.style_text;
    style.preserve_melody = config_.preserve_melody;
    return run(source, style, result);
}

bool PipelineController::fail(ErrorKind kind,
                              const std::string& message,
                              PipelineResult* result) {
    state_ = PipelineState::Failed;
    RESTYLE_LOG_ERROR("Pipeline failed (" << error_kind_name(kind) << "): " << message);
    if (result) {
        result->state = state_;
        result->has_output = false;
        result->error.kind = kind;
        result->error.message = message;
    }
    return false;
}

bool PipelineController::run(const SourceTrack& source,
                             const StyleDescriptor& style,
                             PipelineResult* result) {
    if (!result) {
        RESTYLE_LOG_ERROR("Pipeline: missing result output.");
        return false;
    }
    *result = PipelineResult{};
    result->policy = config_.failure_policy;

    if (state_ != PipelineState::Idle) {
        result->state = state_;
        result->error.kind = ErrorKind::InvalidParameter;
        result->error.message = "Pipeline controller already ran; construct a new one.";
        RESTYLE_LOG_ERROR("Pipeline: " << result->error.message);
        return false;
    }

    Error error;
    if (!validate_source_track(source,
                               config_.expected_sample_rate,
                               config_.expected_channels,
                               &error)) {
        return fail(error.kind, error.message, result);
    }

    SegmentPlan plan;
    if (!SegmentPlan::create(source, config_.window_seconds, &plan, &error)) {
        return fail(error.kind, error.message, result);
    }
    state_ = PipelineState::Segmented;
    result->segment_count = plan.size();

    std::vector<Segment> segments;
    std::vector<GenerationRequest> requests;
    segments.reserve(plan.size());
    requests.reserve(plan.size());
    for (std::size_t i = 0; i < plan.size(); ++i) {
        segments.push_back(plan.at(i));
        GenerationRequest request;
        if (!condition(segments.back(), style, &request, &error)) {
            return fail(error.kind, error.message, result);
        }
        requests.push_back(std::move(request));
    }
    RESTYLE_LOG_INFO("Pipeline: " << plan.size() << " segment(s) of " << config_.window_seconds
                     << " s from " << source.duration_seconds() << " s, policy "
                     << failure_policy_name(config_.failure_policy));

    if (!orchestrator_) {
        orchestrator_ = GenerationOrchestrator::create(config_, &error);
        if (!orchestrator_) {
            return fail(error.kind, error.message, result);
        }
    }

    if (!config_.output_dir.empty()) {
        write_artifacts(&segments, nullptr, result);
    }
    // Raw segments are no longer needed once the requests own their copies.
    segments.clear();

    state_ = PipelineState::Generating;
    segment_results_ = orchestrator_->generate(requests, &cancel_);
    if (config_.generation_retries > 0) {
        retry_failed(requests);
    }

    std::vector<std::size_t> failed;
    std::vector<std::size_t> not_started;
    for (const auto& segment_result : segment_results_) {
        if (segment_result.ok()) {
            continue;
        }
        failed.push_back(segment_result.index);
        result->segment_errors.push_back(segment_result.error);
        if (segment_result.error.kind == ErrorKind::Cancelled) {
            not_started.push_back(segment_result.index);
        }
    }

    if (!not_started.empty()) {
        state_ = PipelineState::Cancelled;
        result->state = state_;
        result->error.kind = ErrorKind::Cancelled;
        result->error.message = "Run cancelled with " + std::to_string(not_started.size()) +
                                " segment(s) not generated.";
        result->error.failed_indices = failed;
        result->error.errors = result->segment_errors;
        RESTYLE_LOG_WARN("Pipeline: " << result->error.message);
        // Finished segments stay on disk so the run can be resumed by hand.
        write_generated_artifacts(result);
        return false;
    }

    if (!failed.empty()) {
        state_ = PipelineState::PartiallyFailed;
        result->state = state_;
        if (config_.failure_policy == FailurePolicy::Abort ||
            failed.size() == segment_results_.size()) {
            result->error.kind = ErrorKind::GenerationFailed;
            result->error.message = "Generation failed for segment(s) " + join_indices(failed) +
                                    "; no output written.";
            result->error.failed_indices = failed;
            result->error.errors = result->segment_errors;
            RESTYLE_LOG_ERROR("Pipeline: " << result->error.message);
            return false;
        }
        RESTYLE_LOG_WARN("Pipeline: dropping failed segment(s) " << join_indices(failed));
    }

    write_generated_artifacts(result);

    OutputTrack output;
    if (!reassemble(segment_results_, &output, &error)) {
        return fail(error.kind, error.message, result);
    }

    if (failed.empty()) {
        // Generated lengths were conformed to the source boundaries, so any
        // difference beyond one sample means the rates were inconsistent.
        const double expected = source.duration_seconds();
        const double produced = output.duration_seconds();
        const double tolerance = 1.0 / static_cast<double>(output.sample_rate);
        if (std::fabs(expected - produced) > tolerance + 1e-12) {
            std::ostringstream message;
            message << "Output duration " << produced << " s does not match input "
                    << expected << " s.";
            return fail(ErrorKind::GenerationFailed, message.str(), result);
        }
        state_ = PipelineState::Completed;
        result->state = state_;
    }

    result->dropped_indices = output.dropped_indices;
    result->output = std::move(output);
    result->has_output = true;

    if (!config_.output_dir.empty()) {
        write_artifacts(nullptr, &result->output, result);
    }

    RESTYLE_LOG_INFO("Pipeline: " << pipeline_state_name(state_) << ", output "
                     << result->output.duration_seconds() << " s from "
                     << result->output.included_indices.size() << " segment(s)");
    return true;
}

void PipelineController::retry_failed(const std::vector<GenerationRequest>& requests) {
    for (std::size_t round = 1; round <= config_.generation_retries; ++round) {
        if (cancelled()) {
            return;
        }
        std::vector<std::size_t> positions;
        std::vector<GenerationRequest> retry;
        for (std::size_t i = 0; i < segment_results_.size(); ++i) {
            // Parameter errors are deterministic; only model failures are retried.
            if (!segment_results_[i].ok() &&
                segment_results_[i].error.kind == ErrorKind::GenerationFailed) {
                positions.push_back(i);
                retry.push_back(requests[i]);
            }
        }
        if (retry.empty()) {
            return;
        }

        RESTYLE_LOG_INFO("Pipeline: retry round " << round << " for " << retry.size()
                         << " segment(s)");
        std::vector<SegmentResult> retried = orchestrator_->generate(retry, &cancel_);
        for (std::size_t i = 0; i < positions.size(); ++i) {
            // A cancelled retry keeps the original failure.
            if (retried[i].error.kind == ErrorKind::Cancelled) {
                continue;
            }
            segment_results_[positions[i]] = std::move(retried[i]);
        }
    }
}

void PipelineController::write_generated_artifacts(PipelineResult* result) const {
    if (config_.output_dir.empty()) {
        return;
    }
    Error error;
    if (!write_generated_segments(config_.output_dir, segment_results_, &error)) {
        RESTYLE_LOG_ERROR("Pipeline: writing styled segments failed: " << error.message);
        if (result && result->artifact_error.ok()) {
            result->artifact_error = error;
        }
    }
}

void PipelineController::write_artifacts(const std::vector<Segment>* segments,
                                         const OutputTrack* output,
                                         PipelineResult* result) const {
    Error error;
    bool ok = true;
    if (segments) {
        ok = write_source_segments(config_.output_dir, *segments, &error);
    }
    if (ok && output) {
        ok = write_output_track(config_.output_dir, *output, &error);
    }
    if (!ok) {
        RESTYLE_LOG_ERROR("Pipeline: writing run artifacts failed: " << error.message);
        if (result && result->artifact_error.ok()) {
            result->artifact_error = error;
        }
    }
}

} // namespace restyle
