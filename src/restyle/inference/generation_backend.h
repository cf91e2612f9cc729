//
//  generation_backend.h
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "restyle/config.h"
#include "restyle/error.h"
#include "restyle/track.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace restyle {
namespace detail {

struct GenerationTiming {
    double melody_upload_ms = 0.0;
    double torch_generate_ms = 0.0;
};

enum class DeviceKind {
    Accelerator,
    Cpu,
};

struct DeviceInfo {
    DeviceKind kind = DeviceKind::Cpu;
    std::string name = "cpu";
};

/// @brief One loaded model bound to one compute device.
///
/// Instances are not safe for concurrent use; each worker owns its own.
class GenerationBackend {
public:
    virtual ~GenerationBackend() = default;

    virtual const DeviceInfo& device() const = 0;

    /// @brief Run the model once for `request`.
    ///
    /// On success `samples` holds interleaved frames at the model's native
    /// `sample_rate` with `channels` channels. On failure `error` says why.
    virtual bool generate(const GenerationRequest& request,
                          std::vector<float>* samples,
                          std::size_t* sample_rate,
                          std::size_t* channels,
                          GenerationTiming* timing,
                          std::string* error) = 0;
};

/// @brief Select the compute devices and load one model per device.
///
/// Device selection happens here, once: `DevicePreference::Cpu` forces the
/// CPU, otherwise CUDA devices (up to `max_workers`) are preferred, then MPS,
/// then the CPU. Returns an empty vector and fills `error` when no backend
/// could be brought up.
std::vector<std::unique_ptr<GenerationBackend>> make_generation_backends(
    const RestyleConfig& config,
    Error* error);

} // namespace detail
} // namespace restyle
