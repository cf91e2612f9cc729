//
//  version.h
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace restyle {

/// @brief Return the Restyle version display string.
///
/// Mirrors CLI version output (for example: `v0.2.0` or `v0.2.0+abcd123`).
std::string version_string();

} // namespace restyle
