//
//  track.h
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace restyle {

// All waveforms are interleaved float samples; one frame holds one sample per channel.

struct SourceTrack {
    std::vector<float> samples;
    std::size_t sample_rate = 0;
    std::size_t channels = 1;

    std::size_t frame_count() const {
        return channels > 0 ? samples.size() / channels : 0;
    }
    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(frame_count()) /
                                     static_cast<double>(sample_rate)
                               : 0.0;
    }
};

struct Segment {
    std::size_t index = 0;
    std::size_t start_frame = 0;
    std::size_t frame_count = 0;
    std::size_t sample_rate = 0;
    std::size_t channels = 1;
    std::vector<float> samples;

    std::size_t end_frame() const { return start_frame + frame_count; }
    double start_seconds() const {
        return static_cast<double>(start_frame) / static_cast<double>(sample_rate);
    }
    double length_seconds() const {
        return static_cast<double>(frame_count) / static_cast<double>(sample_rate);
    }

    bool operator==(const Segment& other) const;
    bool operator!=(const Segment& other) const { return !(*this == other); }
};

struct StyleDescriptor {
    std::string text;
    bool preserve_melody = true;

    bool operator==(const StyleDescriptor& other) const {
        return text == other.text && preserve_melody == other.preserve_melody;
    }
};

struct GenerationRequest {
    Segment segment;
    StyleDescriptor style;
    // Text handed to the model, including the melody retention instruction.
    std::string conditioning_text;
    double target_duration_seconds = 0.0;

    bool operator==(const GenerationRequest& other) const;
    bool operator!=(const GenerationRequest& other) const { return !(*this == other); }
};

struct GeneratedSegment {
    std::size_t index = 0;
    std::vector<float> samples;
    std::size_t sample_rate = 0;
    std::size_t channels = 1;

    std::size_t frame_count() const {
        return channels > 0 ? samples.size() / channels : 0;
    }
};

struct OutputTrack {
    std::vector<float> samples;
    std::size_t sample_rate = 0;
    std::size_t channels = 1;
    // Segment indices, in output order, that make up `samples`.
    std::vector<std::size_t> included_indices;
    // Segment indices whose generation failed and were left out.
    std::vector<std::size_t> dropped_indices;

    std::size_t frame_count() const {
        return channels > 0 ? samples.size() / channels : 0;
    }
    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(frame_count()) /
                                     static_cast<double>(sample_rate)
                               : 0.0;
    }
};

} // namespace restyle
