//
//  scripted_generation_backend.h
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "restyle/inference/generation_backend.h"

#include <atomic>
#include <cmath>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace restyle::tests {

/// @brief Shared record of which segment indices reached a backend, in call order.
struct CallLog {
    std::mutex mutex;
    std::vector<std::pair<std::string, std::size_t>> calls;

    void record(const std::string& device, std::size_t index) {
        std::lock_guard<std::mutex> lock(mutex);
        calls.emplace_back(device, index);
    }

    std::vector<std::size_t> indices() {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::size_t> out;
        for (const auto& call : calls) {
            out.push_back(call.second);
        }
        return out;
    }
};

struct ScriptedBehavior {
    std::string device_name = "scripted:0";
    // 0 keeps the segment's own rate.
    std::size_t output_sample_rate = 0;
    std::size_t output_channels = 1;
    // Frames added to (or, when negative, removed from) every generated waveform.
    long long length_error_frames = 0;
    // Segment indices that fail on every attempt.
    std::set<std::size_t> failing_indices;
    // Segment indices whose generation throws instead of reporting an error.
    std::set<std::size_t> throwing_indices;
    // Segment indices that fail only on their first attempt.
    std::set<std::size_t> flaky_indices;
    // Set after this many calls; 0 never sets it.
    std::size_t cancel_after_calls = 0;
    std::atomic<bool>* cancel_flag = nullptr;
    std::function<void()> on_call;
};

/// @brief In-process stand-in for a loaded model.
///
/// The output of segment k is a constant waveform of value `value_for_index(k)`.
class ScriptedGenerationBackend final : public detail::GenerationBackend {
public:
    ScriptedGenerationBackend(ScriptedBehavior behavior, std::shared_ptr<CallLog> log)
        : behavior_(std::move(behavior)),
          log_(std::move(log)) {
        info_.kind = detail::DeviceKind::Cpu;
        info_.name = behavior_.device_name;
    }

    static float value_for_index(std::size_t index) {
        return 0.01f * static_cast<float>(index + 1);
    }

    const detail::DeviceInfo& device() const override {
        return info_;
    }

    bool generate(const GenerationRequest& request,
                  std::vector<float>* samples,
                  std::size_t* sample_rate,
                  std::size_t* channels,
                  detail::GenerationTiming*,
                  std::string* error) override {
        const std::size_t index = request.segment.index;
        ++calls_;
        if (log_) {
            log_->record(info_.name, index);
        }
        if (behavior_.on_call) {
            behavior_.on_call();
        }
        if (behavior_.cancel_flag && behavior_.cancel_after_calls > 0 &&
            calls_ >= behavior_.cancel_after_calls) {
            behavior_.cancel_flag->store(true);
        }

        if (behavior_.throwing_indices.count(index) > 0) {
            throw std::runtime_error("index out of range (scripted)");
        }
        if (behavior_.failing_indices.count(index) > 0) {
            if (error) {
                *error = "CUDA out of memory (scripted)";
            }
            return false;
        }
        if (behavior_.flaky_indices.count(index) > 0 && flaked_.insert(index).second) {
            if (error) {
                *error = "transient runtime fault (scripted)";
            }
            return false;
        }

        const std::size_t rate = behavior_.output_sample_rate > 0
                                     ? behavior_.output_sample_rate
                                     : request.segment.sample_rate;
        long long frames = std::llround(request.target_duration_seconds *
                                        static_cast<double>(rate)) +
                           behavior_.length_error_frames;
        if (frames < 1) {
            frames = 1;
        }
        samples->assign(static_cast<std::size_t>(frames) * behavior_.output_channels,
                        value_for_index(index));
        *sample_rate = rate;
        *channels = behavior_.output_channels;
        return true;
    }

    std::size_t calls() const { return calls_; }

private:
    ScriptedBehavior behavior_;
    std::shared_ptr<CallLog> log_;
    detail::DeviceInfo info_;
    std::size_t calls_ = 0;
    std::set<std::size_t> flaked_;
};

inline std::vector<std::unique_ptr<detail::GenerationBackend>> make_scripted_workers(
    const std::vector<ScriptedBehavior>& behaviors,
    const std::shared_ptr<CallLog>& log) {
    std::vector<std::unique_ptr<detail::GenerationBackend>> workers;
    for (const auto& behavior : behaviors) {
        workers.push_back(std::make_unique<ScriptedGenerationBackend>(behavior, log));
    }
    return workers;
}

} // namespace restyle::tests
