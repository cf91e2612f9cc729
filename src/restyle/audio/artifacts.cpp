//
//  artifacts.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/audio_io.h"

#include "restyle/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace restyle {
namespace {

bool ensure_directory(const std::filesystem::path& dir, Error* error) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        set_error(error,
                  ErrorKind::IoError,
                  "Failed to create " + dir.string() + ": " + ec.message());
        return false;
    }
    return true;
}

// ffmpeg concat entries are single-quoted; an embedded quote becomes '\''.
std::string concat_list_quote(const std::string& path) {
    std::string quoted = "'";
    for (char c : path) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace

std::string segment_file_name(const char* prefix, std::size_t index) {
    std::ostringstream name;
    name << (prefix ? prefix : "") << std::setw(3) << std::setfill('0') << index << ".wav";
    return name.str();
}

bool write_source_segments(const std::string& dir,
                           const std::vector<Segment>& segments,
                           Error* error) {
    const std::filesystem::path segment_dir = std::filesystem::path(dir) / kSourceSegmentDir;
    if (!ensure_directory(segment_dir, error)) {
        return false;
    }
    for (const auto& segment : segments) {
        const std::filesystem::path path =
            segment_dir / segment_file_name(kSourceSegmentPrefix, segment.index);
        if (!write_wav_pcm16(path.string(),
                             segment.samples,
                             segment.channels,
                             segment.sample_rate,
                             error)) {
            return false;
        }
    }
    RESTYLE_LOG_DEBUG("Artifacts: wrote " << segments.size() << " source segment(s) to "
                      << segment_dir.string());
    return true;
}

bool write_generated_segments(const std::string& dir,
                              const std::vector<SegmentResult>& results,
                              Error* error) {
    const std::filesystem::path segment_dir = std::filesystem::path(dir) / kStyledSegmentDir;
    if (!ensure_directory(segment_dir, error)) {
        return false;
    }

    std::vector<const GeneratedSegment*> generated;
    for (const auto& result : results) {
        if (result.ok()) {
            generated.push_back(&*result.segment);
        }
    }
    std::sort(generated.begin(), generated.end(), [](const GeneratedSegment* a,
                                                     const GeneratedSegment* b) {
        return a->index < b->index;
    });

    const std::filesystem::path list_path = segment_dir / kConcatListName;
    std::ofstream list(list_path);
    if (!list.is_open()) {
        set_error(error, ErrorKind::IoError, "Failed to open " + list_path.string() + ".");
        return false;
    }

    for (const GeneratedSegment* segment : generated) {
        const std::filesystem::path path =
            segment_dir / segment_file_name(kStyledSegmentPrefix, segment->index);
        if (!write_wav_pcm16(path.string(),
                             segment->samples,
                             segment->channels,
                             segment->sample_rate,
                             error)) {
            return false;
        }
        std::error_code ec;
        const std::filesystem::path absolute = std::filesystem::absolute(path, ec);
        if (ec) {
            set_error(error,
                      ErrorKind::IoError,
                      "Failed to resolve " + path.string() + ": " + ec.message());
            return false;
        }
        list << "file " << concat_list_quote(absolute.string()) << "\n";
    }

    if (!list.good()) {
        set_error(error, ErrorKind::IoError, "Failed to write " + list_path.string() + ".");
        return false;
    }
    RESTYLE_LOG_DEBUG("Artifacts: wrote " << generated.size() << " styled segment(s) to "
                      << segment_dir.string());
    return true;
}

bool write_output_track(const std::string& dir, const OutputTrack& output, Error* error) {
    if (!ensure_directory(dir, error)) {
        return false;
    }
    const std::filesystem::path path = std::filesystem::path(dir) / kFullTrackName;
    return write_wav_pcm16(path.string(), output.samples, output.channels, output.sample_rate,
                           error);
}

} // namespace restyle
