//
//  segmenter.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/segmenter.h"

#include "restyle/logging.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace restyle {

bool Segment::operator==(const Segment& other) const {
    return index == other.index && start_frame == other.start_frame &&
           frame_count == other.frame_count && sample_rate == other.sample_rate &&
           channels == other.channels && samples == other.samples;
}

bool validate_source_track(const SourceTrack& source,
                           std::size_t expected_sample_rate,
                           std::size_t expected_channels,
                           Error* error) {
    if (source.sample_rate == 0 || source.channels == 0) {
        set_error(error, ErrorKind::InvalidInput, "Source track has no sample rate or channels.");
        return false;
    }
    if (source.samples.empty()) {
        set_error(error, ErrorKind::InvalidInput, "Source track is empty.");
        return false;
    }
    if (source.samples.size() % source.channels != 0) {
        set_error(error,
                  ErrorKind::InvalidInput,
                  "Source sample count is not a multiple of the channel count.");
        return false;
    }
    if (expected_sample_rate > 0 && source.sample_rate != expected_sample_rate) {
        std::ostringstream message;
        message << "Source sample rate " << source.sample_rate << " Hz, expected "
                << expected_sample_rate << " Hz.";
        set_error(error, ErrorKind::InvalidInput, message.str());
        return false;
    }
    if (expected_channels > 0 && source.channels != expected_channels) {
        std::ostringstream message;
        message << "Source has " << source.channels << " channel(s), expected "
                << expected_channels << ".";
        set_error(error, ErrorKind::InvalidInput, message.str());
        return false;
    }
    return true;
}

bool SegmentPlan::create(const SourceTrack& source,
                         double window_seconds,
                         SegmentPlan* plan,
                         Error* error) {
    if (!plan) {
        set_error(error, ErrorKind::InvalidParameter, "Missing segment plan output.");
        return false;
    }
    if (!std::isfinite(window_seconds) || window_seconds <= 0.0) {
        std::ostringstream message;
        message << "Window length must be positive, got " << window_seconds << " s.";
        set_error(error, ErrorKind::InvalidParameter, message.str());
        return false;
    }
    if (!validate_source_track(source, 0, 0, error)) {
        return false;
    }

    const double window_frames_d =
        std::round(window_seconds * static_cast<double>(source.sample_rate));
    if (window_frames_d < 1.0) {
        std::ostringstream message;
        message << "Window length " << window_seconds << " s is shorter than one frame at "
                << source.sample_rate << " Hz.";
        set_error(error, ErrorKind::InvalidParameter, message.str());
        return false;
    }

    const std::size_t total = source.frame_count();
    // A window at least as long as the track covers it in one segment.
    const std::size_t window = window_frames_d >= static_cast<double>(total)
                                   ? total
                                   : static_cast<std::size_t>(window_frames_d);
    const std::size_t full = total / window;
    const std::size_t remainder = total % window;

    plan->source_ = &source;
    plan->window_frames_ = window;
    plan->count_ = full + (remainder > 0 ? 1 : 0);

    RESTYLE_LOG_DEBUG("Segmenter: " << total << " frames, window=" << window
                      << " frames, segments=" << plan->count_
                      << ", tail=" << (remainder > 0 ? remainder : window) << " frames");
    return true;
}

Segment SegmentPlan::at(std::size_t index) const {
    Segment segment;
    if (!source_ || index >= count_) {
        return segment;
    }

    const std::size_t total = source_->frame_count();
    const std::size_t channels = source_->channels;
    const std::size_t start = index * window_frames_;
    const std::size_t end = std::min(total, start + window_frames_);

    segment.index = index;
    segment.start_frame = start;
    segment.frame_count = end - start;
    segment.sample_rate = source_->sample_rate;
    segment.channels = channels;
    segment.samples.assign(source_->samples.begin() + static_cast<long>(start * channels),
                           source_->samples.begin() + static_cast<long>(end * channels));
    return segment;
}

bool segment_track(const SourceTrack& source,
                   double window_seconds,
                   std::vector<Segment>* segments,
                   Error* error) {
    if (!segments) {
        set_error(error, ErrorKind::InvalidParameter, "Missing segment output.");
        return false;
    }

    SegmentPlan plan;
    if (!SegmentPlan::create(source, window_seconds, &plan, error)) {
        return false;
    }

    segments->clear();
    segments->reserve(plan.size());
    for (std::size_t i = 0; i < plan.size(); ++i) {
        segments->push_back(plan.at(i));
    }
    return true;
}

std::vector<float> concatenate_segments(const std::vector<Segment>& segments) {
    std::size_t total = 0;
    for (const auto& segment : segments) {
        total += segment.samples.size();
    }
    std::vector<float> out;
    out.reserve(total);
    for (const auto& segment : segments) {
        out.insert(out.end(), segment.samples.begin(), segment.samples.end());
    }
    return out;
}

} // namespace restyle
