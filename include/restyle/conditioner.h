//
//  conditioner.h
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "restyle/error.h"
#include "restyle/track.h"

#include <string>

namespace restyle {

/// @brief Instruction appended to the style text when melody preservation is on.
///
/// The model was prompted with exactly this suffix; changing it changes what
/// gets generated.
inline constexpr const char* kPreserveMelodyInstruction =
    ", keep original melody and chord progression";

/// @brief Build the text prompt handed to the model for `style`.
std::string conditioning_text(const StyleDescriptor& style);

/// @brief Package one segment with the shared style into a generation request.
///
/// Pure; the target duration always comes from the segment itself.
bool condition(const Segment& segment,
               const StyleDescriptor& style,
               GenerationRequest* request,
               Error* error);

} // namespace restyle
