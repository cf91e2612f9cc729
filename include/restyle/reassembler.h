//
//  reassembler.h
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "restyle/error.h"
#include "restyle/orchestrator.h"
#include "restyle/track.h"

#include <vector>

namespace restyle {

/// @brief Concatenate the successful results in segment index order.
///
/// Failed results are left out and listed in `dropped_indices`. All generated
/// segments must share one sample rate and channel count.
bool reassemble(const std::vector<SegmentResult>& results,
                OutputTrack* output,
                Error* error);

} // namespace restyle
