//
//  config.h
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>

namespace restyle {

inline constexpr const char* kDefaultStyleText =
    "lofi hip hop with mellow piano and vinyl crackle";

/// @brief How a run treats segments whose generation failed.
enum class FailurePolicy {
    /// @brief Drop failed segments and reassemble the rest, reporting the drops.
    SkipAndContinue,
    /// @brief Emit no output and surface a pipeline error naming the failures.
    Abort,
};

/// @brief Compute device preference for the generative model.
enum class DevicePreference {
    /// @brief Use an accelerator when one is available, CPU otherwise.
    Auto,
    /// @brief Always run on the CPU.
    Cpu,
};

struct RestyleConfig {
    double window_seconds = 30.0;
    std::string style_text = kDefaultStyleText;
    bool preserve_melody = true;
    FailurePolicy failure_policy = FailurePolicy::SkipAndContinue;
    DevicePreference device = DevicePreference::Auto;
    // Extra rounds in which only failed segments are resubmitted.
    std::size_t generation_retries = 0;
    // Upper bound of concurrent workers; only honoured with several accelerators.
    std::size_t max_workers = 1;
    // 0 disables the respective input check.
    std::size_t expected_sample_rate = 32000;
    std::size_t expected_channels = 1;
    std::string model_path = "models/musicgen_melody.ts";
    // Sample rate reported when the model module carries no `sample_rate` attribute.
    std::size_t model_sample_rate = 32000;
    // Run artifacts are only written when set.
    std::string output_dir;
    bool verbose = false;
    bool profile = false;
};

const char* failure_policy_name(FailurePolicy policy);
bool parse_failure_policy(const std::string& value, FailurePolicy* policy);

const char* device_preference_name(DevicePreference device);
bool parse_device_preference(const std::string& value, DevicePreference* device);

} // namespace restyle
