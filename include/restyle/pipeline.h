//
//  pipeline.h
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "restyle/config.h"
#include "restyle/error.h"
#include "restyle/orchestrator.h"
#include "restyle/track.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

namespace restyle {

enum class PipelineState {
    Idle,
    Segmented,
    Generating,
    Completed,
    PartiallyFailed,
    Failed,
    Cancelled,
};

const char* pipeline_state_name(PipelineState state);

struct PipelineResult {
    PipelineState state = PipelineState::Idle;
    FailurePolicy policy = FailurePolicy::SkipAndContinue;
    bool has_output = false;
    OutputTrack output;
    std::size_t segment_count = 0;
    // Indices left out of `output` under skip-and-continue.
    std::vector<std::size_t> dropped_indices;
    // Every per-segment failure of the run, in index order.
    std::vector<GenerationError> segment_errors;
    // Set whenever the run ends without output.
    PipelineError error;
    // Writing run artifacts failed; the in-memory output is still valid.
    Error artifact_error;
};

/// @brief Drives segmentation, conditioning, generation and reassembly for one run.
///
/// A controller runs exactly once; construct a new one for another track.
/// `cancel()` may be called from any thread and takes effect before the next
/// generation call. Results of segments finished before that stay available
/// through `segment_results()`.
class PipelineController {
public:
    /// @brief The model is loaded on first use, after the input was validated.
    explicit PipelineController(const RestyleConfig& config);
    PipelineController(const RestyleConfig& config,
                       std::unique_ptr<GenerationOrchestrator> orchestrator);
    ~PipelineController();

    PipelineController(const PipelineController&) = delete;
    PipelineController& operator=(const PipelineController&) = delete;

    /// @brief Run with the style described by the configuration.
    bool run(const SourceTrack& source, PipelineResult* result);

    /// @brief Returns true when `result` carries an output track.
    bool run(const SourceTrack& source, const StyleDescriptor& style, PipelineResult* result);

    void cancel();
    bool cancelled() const;

    PipelineState state() const { return state_; }
    const std::vector<SegmentResult>& segment_results() const { return segment_results_; }

private:
    bool fail(ErrorKind kind, const std::string& message, PipelineResult* result);
    void retry_failed(const std::vector<GenerationRequest>& requests);
    void write_artifacts(const std::vector<Segment>* segments,
                         const OutputTrack* output,
                         PipelineResult* result) const;
    void write_generated_artifacts(PipelineResult* result) const;

    RestyleConfig config_;
    std::unique_ptr<GenerationOrchestrator> orchestrator_;
    std::atomic<bool> cancel_{false};
    PipelineState state_ = PipelineState::Idle;
    std::vector<SegmentResult> segment_results_;
};

} // namespace restyle
