//
//  orchestrator.h
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "restyle/config.h"
#include "restyle/error.h"
#include "restyle/track.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace restyle {
namespace detail {
class GenerationBackend;
}

/// @brief Outcome of one generation request; exactly one of segment/error is set.
struct SegmentResult {
    std::size_t index = 0;
    std::optional<GeneratedSegment> segment;
    GenerationError error;
    double generate_ms = 0.0;

    bool ok() const { return segment.has_value(); }
};

/// @brief Frame count a generated segment must have at `output_sample_rate`.
///
/// Derived from the segment's source boundaries rather than its length alone,
/// so per-segment rounding never accumulates across a track.
std::size_t target_frame_count(const Segment& segment, std::size_t output_sample_rate);

/// @brief Runs generation requests on the loaded model(s), one result per request.
///
/// Owns the device/model state for its whole lifetime. With one worker all
/// requests run strictly in order on the calling thread. With several workers
/// (one per device) each takes a disjoint contiguous index range; results are
/// still returned in request order.
class GenerationOrchestrator {
public:
    /// @brief Select devices and load the model once. Returns nullptr on failure.
    static std::unique_ptr<GenerationOrchestrator> create(const RestyleConfig& config,
                                                          Error* error);

    explicit GenerationOrchestrator(
        std::vector<std::unique_ptr<detail::GenerationBackend>> workers);
    ~GenerationOrchestrator();

    GenerationOrchestrator(const GenerationOrchestrator&) = delete;
    GenerationOrchestrator& operator=(const GenerationOrchestrator&) = delete;

    std::size_t worker_count() const { return workers_.size(); }
    std::vector<std::string> device_names() const;

    /// @brief Generate every request. Failures are recorded per index and never
    /// stop the run. `cancel` is polled before each generation call; requests
    /// not started get a `Cancelled` error.
    std::vector<SegmentResult> generate(const std::vector<GenerationRequest>& requests,
                                        const std::atomic<bool>* cancel = nullptr);

private:
    void run_range(detail::GenerationBackend& backend,
                   const std::vector<GenerationRequest>& requests,
                   std::size_t begin,
                   std::size_t end,
                   const std::atomic<bool>* cancel,
                   std::vector<SegmentResult>* results);

    std::vector<std::unique_ptr<detail::GenerationBackend>> workers_;
};

} // namespace restyle
