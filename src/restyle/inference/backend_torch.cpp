//
//  backend_torch.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/inference/generation_backend.h"

#include "restyle/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <utility>
#include <vector>

#include <c10/core/InferenceMode.h>
#include <torch/cuda.h>
#include <torch/mps.h>
#include <torch/script.h>

namespace restyle {
namespace detail {
namespace {

// The exported module wraps MusicGen-Melody and exposes
//   generate(description: str, duration: float,
//            melody: Optional[Tensor], melody_sample_rate: int) -> Tensor
// returning [batch, channels, samples] at the `sample_rate` attribute.
inline constexpr const char* kGenerateMethod = "generate";
inline constexpr const char* kSampleRateAttribute = "sample_rate";

std::string first_line(const std::string& message) {
    const std::size_t newline = message.find('\n');
    return newline == std::string::npos ? message : message.substr(0, newline);
}

struct DeviceDecision {
    DeviceKind kind = DeviceKind::Cpu;
    std::vector<torch::Device> devices;
};

DeviceDecision select_devices(const RestyleConfig& config) {
    DeviceDecision decision;
    if (config.device == DevicePreference::Cpu) {
        decision.devices.emplace_back(torch::kCPU);
        RESTYLE_LOG_DEBUG("Torch backend: cpu forced by configuration.");
        return decision;
    }

    if (torch::cuda::is_available()) {
        const std::size_t available = torch::cuda::device_count();
        const std::size_t wanted = std::max<std::size_t>(1, config.max_workers);
        const std::size_t count = std::min(available, wanted);
        decision.kind = DeviceKind::Accelerator;
        for (std::size_t i = 0; i < count; ++i) {
            decision.devices.emplace_back(torch::kCUDA, static_cast<c10::DeviceIndex>(i));
        }
        RESTYLE_LOG_DEBUG("Torch backend: " << available << " cuda device(s) available, using "
                          << count);
        return decision;
    }

    if (torch::mps::is_available()) {
        decision.kind = DeviceKind::Accelerator;
        decision.devices.emplace_back(torch::kMPS);
        return decision;
    }

    RESTYLE_LOG_WARN("Torch backend: no accelerator available, generating on cpu.");
    decision.devices.emplace_back(torch::kCPU);
    return decision;
}

torch::Tensor melody_tensor(const Segment& segment, const torch::Device& device) {
    const auto frames = static_cast<std::int64_t>(segment.frame_count);
    const auto channels = static_cast<std::int64_t>(segment.channels);
    // Interleaved [frames, channels] to the model's [1, channels, frames].
    torch::Tensor interleaved =
        torch::from_blob(const_cast<float*>(segment.samples.data()),
                         {frames, channels},
                         torch::kFloat32);
    return interleaved.transpose(0, 1).unsqueeze(0).contiguous().to(device).clone();
}

class TorchGenerationBackend final : public GenerationBackend {
public:
    TorchGenerationBackend(torch::jit::script::Module module,
                           torch::Device device,
                           DeviceKind kind,
                           std::size_t sample_rate)
        : module_(std::move(module)),
          device_(device),
          sample_rate_(sample_rate) {
        info_.kind = kind;
        info_.name = device.str();
    }

    const DeviceInfo& device() const override {
        return info_;
    }

    bool generate(const GenerationRequest& request,
                  std::vector<float>* samples,
                  std::size_t* sample_rate,
                  std::size_t* channels,
                  GenerationTiming* timing,
                  std::string* error) override {
        if (!samples || !sample_rate || !channels) {
            if (error) {
                *error = "Invalid output buffers.";
            }
            return false;
        }

        torch::Tensor output;
        try {
            c10::InferenceMode inference_guard(true);

            torch::IValue melody;
            if (request.style.preserve_melody) {
                const auto upload_start = std::chrono::steady_clock::now();
                melody = melody_tensor(request.segment, device_);
                const auto upload_end = std::chrono::steady_clock::now();
                if (timing) {
                    timing->melody_upload_ms +=
                        std::chrono::duration<double, std::milli>(upload_end - upload_start)
                            .count();
                }
            }

            std::vector<torch::IValue> inputs;
            inputs.reserve(4);
            inputs.emplace_back(request.conditioning_text);
            inputs.emplace_back(request.target_duration_seconds);
            inputs.emplace_back(melody);
            inputs.emplace_back(static_cast<std::int64_t>(request.segment.sample_rate));

            const auto generate_start = std::chrono::steady_clock::now();
            torch::IValue result = module_.get_method(kGenerateMethod)(inputs);
            const auto generate_end = std::chrono::steady_clock::now();
            if (timing) {
                timing->torch_generate_ms +=
                    std::chrono::duration<double, std::milli>(generate_end - generate_start)
                        .count();
            }

            if (result.isTuple()) {
                const auto& elements = result.toTuple()->elements();
                if (!elements.empty() && elements[0].isTensor()) {
                    output = elements[0].toTensor();
                }
            } else if (result.isTensor()) {
                output = result.toTensor();
            }
            if (!output.defined()) {
                if (error) {
                    *error = "Unexpected output signature.";
                }
                return false;
            }
            output = output.to(torch::kCPU, torch::kFloat32);

            // Accept [B, C, T], [C, T] or [T]; only the first batch entry is used.
            if (output.dim() == 3 && output.size(0) > 0) {
                output = output[0];
            } else if (output.dim() == 1) {
                output = output.unsqueeze(0);
            }
            if (output.dim() != 2 || output.size(0) <= 0 || output.size(1) <= 0) {
                if (error) {
                    std::ostringstream message;
                    message << "Unexpected waveform shape " << output.sizes() << ".";
                    *error = message.str();
                }
                return false;
            }

            // [C, T] to interleaved [T, C].
            const torch::Tensor interleaved = output.transpose(0, 1).contiguous();
            const auto count = static_cast<std::size_t>(interleaved.numel());
            const float* data = interleaved.data_ptr<float>();
            samples->assign(data, data + count);
            *channels = static_cast<std::size_t>(output.size(0));
            *sample_rate = sample_rate_;
            return true;
        } catch (const c10::Error& err) {
            if (error) {
                *error = first_line(err.what());
            }
            return false;
        } catch (const std::exception& err) {
            if (error) {
                *error = err.what();
            }
            return false;
        }
    }

private:
    torch::jit::script::Module module_;
    torch::Device device_;
    std::size_t sample_rate_ = 0;
    DeviceInfo info_;
};

std::unique_ptr<GenerationBackend> load_backend(const RestyleConfig& config,
                                                const torch::Device& device,
                                                DeviceKind kind,
                                                Error* error) {
    try {
        torch::jit::script::Module module = torch::jit::load(config.model_path, torch::kCPU);
        module.to(torch::kFloat32);
        if (device.type() != torch::kCPU) {
            module.to(device);
        }
        module.eval();

        if (!module.find_method(kGenerateMethod)) {
            std::ostringstream message;
            message << "Model " << config.model_path << " has no `" << kGenerateMethod
                    << "` method.";
            set_error(error, ErrorKind::BackendUnavailable, message.str());
            return nullptr;
        }

        std::size_t sample_rate = config.model_sample_rate;
        if (module.hasattr(kSampleRateAttribute)) {
            sample_rate = static_cast<std::size_t>(module.attr(kSampleRateAttribute).toInt());
        }
        if (sample_rate == 0) {
            set_error(error, ErrorKind::BackendUnavailable, "Model reports no sample rate.");
            return nullptr;
        }

        RESTYLE_LOG_DEBUG("Torch backend: loaded " << config.model_path << " on "
                          << device.str() << ", native rate " << sample_rate << " Hz");
        return std::make_unique<TorchGenerationBackend>(std::move(module),
                                                        device,
                                                        kind,
                                                        sample_rate);
    } catch (const c10::Error& err) {
        std::ostringstream message;
        message << "Failed to load model on " << device.str() << ": " << first_line(err.what());
        set_error(error, ErrorKind::BackendUnavailable, message.str());
        return nullptr;
    } catch (const std::exception& err) {
        std::ostringstream message;
        message << "Failed to load model on " << device.str() << ": " << err.what();
        set_error(error, ErrorKind::BackendUnavailable, message.str());
        return nullptr;
    }
}

} // namespace

std::vector<std::unique_ptr<GenerationBackend>> make_generation_backends(
    const RestyleConfig& config,
    Error* error) {
    std::vector<std::unique_ptr<GenerationBackend>> backends;
    if (config.model_path.empty()) {
        set_error(error, ErrorKind::BackendUnavailable, "Missing model path.");
        return backends;
    }

    const DeviceDecision decision = select_devices(config);
    for (const auto& device : decision.devices) {
        auto backend = load_backend(config, device, decision.kind, error);
        if (!backend) {
            backends.clear();
            return backends;
        }
        backends.push_back(std::move(backend));
    }
    return backends;
}

} // namespace detail
} // namespace restyle
