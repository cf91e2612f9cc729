//
//  preset.h
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "restyle/config.h"

#include <memory>
#include <string>
#include <vector>

namespace restyle {

class RestylePreset {
public:
    virtual ~RestylePreset() = default;
    virtual const char* name() const = 0;
    virtual void apply(RestyleConfig& config) const = 0;
};

std::unique_ptr<RestylePreset> make_restyle_preset(const std::string& name);
std::vector<std::string> restyle_preset_names();

} // namespace restyle
