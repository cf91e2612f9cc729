//
//  preset.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/preset.h"

#include <algorithm>
#include <cctype>

namespace restyle {
namespace {

class LofiPreset : public RestylePreset {
public:
    const char* name() const override {
        return "lofi";
    }

    void apply(RestyleConfig& config) const override {
        config.style_text = kDefaultStyleText;
        config.window_seconds = 30.0;
        config.preserve_melody = true;
        config.expected_sample_rate = 32000;
        config.expected_channels = 1;
        config.model_sample_rate = 32000;
    }
};

// Short windows on the CPU for quick previews.
class DraftPreset : public RestylePreset {
public:
    const char* name() const override {
        return "draft";
    }

    void apply(RestyleConfig& config) const override {
        config.window_seconds = 10.0;
        config.device = DevicePreference::Cpu;
        config.failure_policy = FailurePolicy::SkipAndContinue;
        config.generation_retries = 0;
        config.max_workers = 1;
    }
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

std::unique_ptr<RestylePreset> make_restyle_preset(const std::string& name) {
    const std::string key = to_lower(name);
    if (key == "lofi") {
        return std::make_unique<LofiPreset>();
    }
    if (key == "draft") {
        return std::make_unique<DraftPreset>();
    }
    return nullptr;
}

std::vector<std::string> restyle_preset_names() {
    return {"lofi", "draft"};
}

} // namespace restyle
