//
//  segmenter.h
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "restyle/error.h"
#include "restyle/track.h"

#include <cstddef>
#include <vector>

namespace restyle {

/// @brief Check the entry preconditions of a source track.
///
/// A zero `expected_sample_rate` or `expected_channels` skips that check.
bool validate_source_track(const SourceTrack& source,
                           std::size_t expected_sample_rate,
                           std::size_t expected_channels,
                           Error* error);

/// @brief Lazy, restartable cut of a source track into fixed-length windows.
///
/// The plan only stores boundaries; `at()` copies the samples of one window.
/// The source must outlive the plan. The last window carries the remainder and
/// may be shorter than `window_frames()`, never empty.
class SegmentPlan {
public:
    static bool create(const SourceTrack& source,
                       double window_seconds,
                       SegmentPlan* plan,
                       Error* error);

    std::size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    std::size_t window_frames() const { return window_frames_; }

    Segment at(std::size_t index) const;

private:
    const SourceTrack* source_ = nullptr;
    std::size_t window_frames_ = 0;
    std::size_t count_ = 0;
};

/// @brief Materialize every segment of `source` in index order.
bool segment_track(const SourceTrack& source,
                   double window_seconds,
                   std::vector<Segment>* segments,
                   Error* error);

/// @brief Concatenate raw segments back into one interleaved waveform.
std::vector<float> concatenate_segments(const std::vector<Segment>& segments);

} // namespace restyle
