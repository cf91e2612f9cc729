//
//  config.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/config.h"
#include "restyle/error.h"

#include <algorithm>
#include <cctype>

namespace restyle {
namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

const char* failure_policy_name(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::Abort:
            return "abort";
        case FailurePolicy::SkipAndContinue:
            return "skip-and-continue";
    }
    return "unknown";
}

bool parse_failure_policy(const std::string& value, FailurePolicy* policy) {
    if (!policy) {
        return false;
    }
    const std::string key = to_lower(value);
    if (key == "abort") {
        *policy = FailurePolicy::Abort;
        return true;
    }
    if (key == "skip-and-continue" || key == "skip") {
        *policy = FailurePolicy::SkipAndContinue;
        return true;
    }
    return false;
}

const char* device_preference_name(DevicePreference device) {
    switch (device) {
        case DevicePreference::Auto:
            return "auto";
        case DevicePreference::Cpu:
            return "cpu";
    }
    return "unknown";
}

bool parse_device_preference(const std::string& value, DevicePreference* device) {
    if (!device) {
        return false;
    }
    const std::string key = to_lower(value);
    if (key == "auto") {
        *device = DevicePreference::Auto;
        return true;
    }
    if (key == "cpu") {
        *device = DevicePreference::Cpu;
        return true;
    }
    return false;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::InvalidParameter:
            return "invalid-parameter";
        case ErrorKind::InvalidInput:
            return "invalid-input";
        case ErrorKind::GenerationFailed:
            return "generation-failed";
        case ErrorKind::BackendUnavailable:
            return "backend-unavailable";
        case ErrorKind::Cancelled:
            return "cancelled";
        case ErrorKind::IoError:
            return "io-error";
    }
    return "unknown";
}

} // namespace restyle
