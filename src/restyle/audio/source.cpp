//
//  source.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/audio_io.h"

#include "restyle/logging.hpp"

#include <sstream>
#include <utility>

#include <sndfile.hh>

namespace restyle {

bool load_source_track(const std::string& path, SourceTrack* track, Error* error) {
    if (!track) {
        set_error(error, ErrorKind::InvalidParameter, "Missing source track output.");
        return false;
    }

    SndfileHandle file(path);
    if (file.error() != SF_ERR_NO_ERROR) {
        set_error(error,
                  ErrorKind::IoError,
                  "Failed to open " + path + ": " + file.strError());
        return false;
    }
    if (file.frames() <= 0 || file.channels() <= 0 || file.samplerate() <= 0) {
        set_error(error, ErrorKind::InvalidInput, "Audio file " + path + " holds no audio.");
        return false;
    }

    const std::size_t channels = static_cast<std::size_t>(file.channels());
    const std::size_t frames = static_cast<std::size_t>(file.frames());
    SourceTrack loaded;
    loaded.sample_rate = static_cast<std::size_t>(file.samplerate());
    loaded.channels = channels;
    loaded.samples.resize(frames * channels);

    const sf_count_t read = file.readf(loaded.samples.data(), static_cast<sf_count_t>(frames));
    if (read != static_cast<sf_count_t>(frames)) {
        std::ostringstream message;
        message << "Short read from " << path << ": " << read << " of " << frames << " frames.";
        set_error(error, ErrorKind::IoError, message.str());
        return false;
    }

    RESTYLE_LOG_DEBUG("Loaded " << path << ": " << frames << " frames, " << channels
                      << " ch, " << loaded.sample_rate << " Hz");
    *track = std::move(loaded);
    return true;
}

} // namespace restyle
