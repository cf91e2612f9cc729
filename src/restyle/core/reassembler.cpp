//
//  reassembler.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/reassembler.h"

#include "restyle/logging.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace restyle {

bool reassemble(const std::vector<SegmentResult>& results,
                OutputTrack* output,
                Error* error) {
    if (!output) {
        set_error(error, ErrorKind::InvalidParameter, "Missing output track.");
        return false;
    }

    std::vector<const SegmentResult*> ordered;
    ordered.reserve(results.size());
    for (const auto& result : results) {
        ordered.push_back(&result);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const SegmentResult* a,
                                                        const SegmentResult* b) {
        return a->index < b->index;
    });
    for (std::size_t i = 1; i < ordered.size(); ++i) {
        if (ordered[i]->index == ordered[i - 1]->index) {
            std::ostringstream message;
            message << "Segment index " << ordered[i]->index << " appears more than once.";
            set_error(error, ErrorKind::InvalidInput, message.str());
            return false;
        }
    }

    OutputTrack track;
    std::size_t total = 0;
    for (const SegmentResult* result : ordered) {
        if (!result->ok()) {
            track.dropped_indices.push_back(result->index);
            continue;
        }
        const GeneratedSegment& segment = *result->segment;
        if (track.sample_rate == 0) {
            track.sample_rate = segment.sample_rate;
            track.channels = segment.channels;
        } else if (segment.sample_rate != track.sample_rate ||
                   segment.channels != track.channels) {
            std::ostringstream message;
            message << "Segment " << segment.index << " has format " << segment.sample_rate
                    << " Hz/" << segment.channels << " ch, expected " << track.sample_rate
                    << " Hz/" << track.channels << " ch.";
            set_error(error, ErrorKind::InvalidInput, message.str());
            return false;
        }
        track.included_indices.push_back(segment.index);
        total += segment.samples.size();
    }

    track.samples.reserve(total);
    for (const SegmentResult* result : ordered) {
        if (result->ok()) {
            const auto& samples = result->segment->samples;
            track.samples.insert(track.samples.end(), samples.begin(), samples.end());
        }
    }

    RESTYLE_LOG_DEBUG("Reassembler: " << track.included_indices.size() << " segment(s), "
                      << track.frame_count() << " frames, dropped "
                      << track.dropped_indices.size());
    *output = std::move(track);
    return true;
}

} // namespace restyle
