//
//  audio_io.h
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "restyle/error.h"
#include "restyle/orchestrator.h"
#include "restyle/track.h"

#include <cstddef>
#include <string>
#include <vector>

namespace restyle {

inline constexpr const char* kSourceSegmentDir = "segments";
inline constexpr const char* kSourceSegmentPrefix = "part_";
inline constexpr const char* kStyledSegmentDir = "styled_segments";
inline constexpr const char* kStyledSegmentPrefix = "styled_";
inline constexpr const char* kConcatListName = "segments.txt";
inline constexpr const char* kFullTrackName = "restyled_full.wav";

/// @brief Decode an audio file (WAV, FLAC, AIFF, ...) into interleaved float frames.
///
/// No resampling or downmixing happens here.
bool load_source_track(const std::string& path, SourceTrack* track, Error* error);

/// @brief Write interleaved float frames as 16-bit PCM WAV, clamped to [-1, 1].
bool write_wav_pcm16(const std::string& path,
                     const std::vector<float>& samples,
                     std::size_t channels,
                     std::size_t sample_rate,
                     Error* error);

/// @brief `prefix` followed by the zero-padded index, e.g. `part_007.wav`.
std::string segment_file_name(const char* prefix, std::size_t index);

/// @brief Write `<dir>/segments/part_NNN.wav` for every source segment.
bool write_source_segments(const std::string& dir,
                           const std::vector<Segment>& segments,
                           Error* error);

/// @brief Write `<dir>/styled_segments/styled_NNN.wav` for every successful
/// result, plus an ffmpeg concat list of those files in index order.
bool write_generated_segments(const std::string& dir,
                              const std::vector<SegmentResult>& results,
                              Error* error);

/// @brief Write `<dir>/restyled_full.wav`.
bool write_output_track(const std::string& dir, const OutputTrack& output, Error* error);

} // namespace restyle
