//
//  conditioner.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/conditioner.h"

#include <algorithm>
#include <cctype>

namespace restyle {

bool GenerationRequest::operator==(const GenerationRequest& other) const {
    return segment == other.segment && style == other.style &&
           conditioning_text == other.conditioning_text &&
           target_duration_seconds == other.target_duration_seconds;
}

std::string conditioning_text(const StyleDescriptor& style) {
    if (!style.preserve_melody) {
        return style.text;
    }
    return style.text + kPreserveMelodyInstruction;
}

bool condition(const Segment& segment,
               const StyleDescriptor& style,
               GenerationRequest* request,
               Error* error) {
    if (!request) {
        set_error(error, ErrorKind::InvalidParameter, "Missing generation request output.");
        return false;
    }
    const bool blank = std::all_of(style.text.begin(), style.text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (blank) {
        set_error(error, ErrorKind::InvalidParameter, "Style text is empty.");
        return false;
    }
    if (segment.frame_count == 0 || segment.sample_rate == 0) {
        set_error(error, ErrorKind::InvalidParameter, "Segment has no duration.");
        return false;
    }

    request->segment = segment;
    request->style = style;
    request->conditioning_text = conditioning_text(style);
    request->target_duration_seconds = segment.length_seconds();
    return true;
}

} // namespace restyle
