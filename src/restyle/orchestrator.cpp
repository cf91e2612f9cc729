//
//  orchestrator.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/orchestrator.h"

#include "restyle/inference/generation_backend.h"
#include "restyle/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <thread>
#include <utility>

namespace restyle {
namespace {

std::uint64_t rescale_frame(std::size_t frame, std::size_t from_rate, std::size_t to_rate) {
    const std::uint64_t numerator =
        static_cast<std::uint64_t>(frame) * static_cast<std::uint64_t>(to_rate) +
        static_cast<std::uint64_t>(from_rate) / 2;
    return numerator / static_cast<std::uint64_t>(from_rate);
}

SegmentResult failed_result(std::size_t index, ErrorKind kind, std::string message) {
    SegmentResult result;
    result.index = index;
    result.error.index = index;
    result.error.kind = kind;
    result.error.message = std::move(message);
    return result;
}

SegmentResult generate_one(detail::GenerationBackend& backend,
                           const GenerationRequest& request) {
    const Segment& segment = request.segment;
    if (!std::isfinite(request.target_duration_seconds) ||
        request.target_duration_seconds <= 0.0) {
        return failed_result(segment.index,
                             ErrorKind::InvalidParameter,
                             "Target duration must be positive.");
    }

    std::vector<float> samples;
    std::size_t sample_rate = 0;
    std::size_t channels = 0;
    detail::GenerationTiming timing;
    std::string message;

    const auto start = std::chrono::steady_clock::now();
    bool ok = false;
    try {
        ok = backend.generate(request, &samples, &sample_rate, &channels, &timing, &message);
    } catch (const std::exception& err) {
        RESTYLE_LOG_WARN("Orchestrator: segment " << segment.index << " on "
                         << backend.device().name << " threw: " << err.what());
        message = err.what();
    }
    const auto end = std::chrono::steady_clock::now();
    const double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

    if (!ok) {
        SegmentResult result =
            failed_result(segment.index, ErrorKind::GenerationFailed, std::move(message));
        result.generate_ms = elapsed_ms;
        return result;
    }
    if (sample_rate == 0 || channels == 0 || samples.empty() || samples.size() % channels != 0) {
        SegmentResult result = failed_result(segment.index,
                                             ErrorKind::GenerationFailed,
                                             "Model returned an empty or malformed waveform.");
        result.generate_ms = elapsed_ms;
        return result;
    }

    const std::size_t produced = samples.size() / channels;
    const std::size_t wanted = target_frame_count(segment, sample_rate);
    if (produced != wanted) {
        RESTYLE_LOG_DEBUG("Orchestrator: segment " << segment.index << " produced " << produced
                          << " frames, conforming to " << wanted);
        samples.resize(wanted * channels, 0.0f);
    }

    RESTYLE_LOG_INFO("Orchestrator: segment " << segment.index << " on "
                     << backend.device().name << " generate=" << timing.torch_generate_ms
                     << "ms upload=" << timing.melody_upload_ms << "ms total=" << elapsed_ms
                     << "ms");

    SegmentResult result;
    result.index = segment.index;
    result.generate_ms = elapsed_ms;
    GeneratedSegment generated;
    generated.index = segment.index;
    generated.samples = std::move(samples);
    generated.sample_rate = sample_rate;
    generated.channels = channels;
    result.segment = std::move(generated);
    return result;
}

} // namespace

std::size_t target_frame_count(const Segment& segment, std::size_t output_sample_rate) {
    if (segment.sample_rate == 0) {
        return 0;
    }
    if (segment.sample_rate == output_sample_rate) {
        return segment.frame_count;
    }
    const std::uint64_t begin =
        rescale_frame(segment.start_frame, segment.sample_rate, output_sample_rate);
    const std::uint64_t end =
        rescale_frame(segment.end_frame(), segment.sample_rate, output_sample_rate);
    return static_cast<std::size_t>(end - begin);
}

std::unique_ptr<GenerationOrchestrator> GenerationOrchestrator::create(
    const RestyleConfig& config,
    Error* error) {
    auto workers = detail::make_generation_backends(config, error);
    if (workers.empty()) {
        if (error && error->ok()) {
            set_error(error, ErrorKind::BackendUnavailable, "No generation backend available.");
        }
        return nullptr;
    }
    return std::make_unique<GenerationOrchestrator>(std::move(workers));
}

GenerationOrchestrator::GenerationOrchestrator(
    std::vector<std::unique_ptr<detail::GenerationBackend>> workers)
    : workers_(std::move(workers)) {
    workers_.erase(std::remove(workers_.begin(), workers_.end(), nullptr), workers_.end());
    for (const auto& worker : workers_) {
        RESTYLE_LOG_DEBUG("Orchestrator: worker bound to " << worker->device().name);
    }
}

GenerationOrchestrator::~GenerationOrchestrator() = default;

std::vector<std::string> GenerationOrchestrator::device_names() const {
    std::vector<std::string> names;
    names.reserve(workers_.size());
    for (const auto& worker : workers_) {
        names.push_back(worker->device().name);
    }
    return names;
}

void GenerationOrchestrator::run_range(detail::GenerationBackend& backend,
                                       const std::vector<GenerationRequest>& requests,
                                       std::size_t begin,
                                       std::size_t end,
                                       const std::atomic<bool>* cancel,
                                       std::vector<SegmentResult>* results) {
    for (std::size_t i = begin; i < end; ++i) {
        const std::size_t index = requests[i].segment.index;
        if (cancel && cancel->load(std::memory_order_acquire)) {
            (*results)[i] = failed_result(index, ErrorKind::Cancelled, "Cancelled before start.");
            continue;
        }
        (*results)[i] = generate_one(backend, requests[i]);
        if (!(*results)[i].ok()) {
            RESTYLE_LOG_WARN("Orchestrator: segment " << index << " failed ("
                             << error_kind_name((*results)[i].error.kind)
                             << "): " << (*results)[i].error.message);
        }
    }
}

std::vector<SegmentResult> GenerationOrchestrator::generate(
    const std::vector<GenerationRequest>& requests,
    const std::atomic<bool>* cancel) {
    std::vector<SegmentResult> results(requests.size());
    if (requests.empty()) {
        return results;
    }
    if (workers_.empty()) {
        for (std::size_t i = 0; i < requests.size(); ++i) {
            results[i] = failed_result(requests[i].segment.index,
                                       ErrorKind::BackendUnavailable,
                                       "No generation backend available.");
        }
        return results;
    }

    const std::size_t worker_count = std::min(workers_.size(), requests.size());
    if (worker_count == 1) {
        run_range(*workers_.front(), requests, 0, requests.size(), cancel, &results);
        return results;
    }

    // Disjoint contiguous ranges, one per device; every worker writes only its own slots.
    const std::size_t chunk = (requests.size() + worker_count - 1) / worker_count;
    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    for (std::size_t w = 0; w < worker_count; ++w) {
        const std::size_t begin = w * chunk;
        const std::size_t end = std::min(requests.size(), begin + chunk);
        if (begin >= end) {
            break;
        }
        detail::GenerationBackend& backend = *workers_[w];
        threads.emplace_back([this, &backend, &requests, begin, end, cancel, &results]() {
            run_range(backend, requests, begin, end, cancel, &results);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    return results;
}

} // namespace restyle
