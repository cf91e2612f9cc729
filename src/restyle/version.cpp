//
//  version.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/version.h"
#include "restyle_version.hpp"

namespace restyle {

std::string version_string() {
    return RESTYLE_VERSION_DISPLAY;
}

} // namespace restyle
