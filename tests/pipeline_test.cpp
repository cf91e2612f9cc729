//
//  pipeline_test.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/pipeline.h"
#include "scripted_generation_backend.h"
#include "synthetic_audio_test_utils.h"

#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

using restyle::tests::CallLog;
using restyle::tests::ScriptedBehavior;
using restyle::tests::ScriptedGenerationBackend;
using restyle::tests::make_scripted_workers;
using restyle::tests::synthetic_audio::make_sine_track;

restyle::RestyleConfig make_config(restyle::FailurePolicy policy =
                                       restyle::FailurePolicy::SkipAndContinue) {
    restyle::RestyleConfig config;
    config.window_seconds = 30.0;
    config.failure_policy = policy;
    config.expected_sample_rate = 32000;
    config.expected_channels = 1;
    return config;
}

std::unique_ptr<restyle::GenerationOrchestrator> make_orchestrator(
    const ScriptedBehavior& behavior,
    const std::shared_ptr<CallLog>& log) {
    return std::make_unique<restyle::GenerationOrchestrator>(
        make_scripted_workers({behavior}, log));
}

bool test_full_run_preserves_duration() {
    const auto source = make_sine_track(32000, 95.0);
    auto log = std::make_shared<CallLog>();
    restyle::PipelineController controller(make_config(), make_orchestrator({}, log));

    restyle::PipelineResult result;
    if (!controller.run(source, &result)) {
        std::cerr << "Pipeline test failed: " << result.error.message << "\n";
        return false;
    }
    if (result.state != restyle::PipelineState::Completed ||
        controller.state() != restyle::PipelineState::Completed) {
        std::cerr << "Pipeline test failed: run ended in state "
                  << restyle::pipeline_state_name(result.state) << ".\n";
        return false;
    }
    if (!result.has_output || result.segment_count != 4 || !result.dropped_indices.empty()) {
        std::cerr << "Pipeline test failed: unexpected result bookkeeping.\n";
        return false;
    }
    if (std::fabs(result.output.duration_seconds() - 95.0) > 1.0 / 32000.0) {
        std::cerr << "Pipeline test failed: output lasts " << result.output.duration_seconds()
                  << " s instead of 95 s.\n";
        return false;
    }
    // The tail segment lands at 90 s.
    const float tail = result.output.samples[90 * 32000];
    if (tail != ScriptedGenerationBackend::value_for_index(3)) {
        std::cerr << "Pipeline test failed: segment 3 is not at 90 s.\n";
        return false;
    }
    if (log->indices() != std::vector<std::size_t>{0, 1, 2, 3}) {
        std::cerr << "Pipeline test failed: segments were not generated in order.\n";
        return false;
    }
    return true;
}

bool test_conditioning_reaches_the_model() {
    const auto source = make_sine_track(32000, 40.0);
    std::vector<std::string> prompts;
    restyle::RestyleConfig config = make_config();
    config.style_text = "chillwave";
    config.preserve_melody = false;

    // Records the prompt of every request it receives.
    class PromptRecorder final : public restyle::detail::GenerationBackend {
    public:
        explicit PromptRecorder(std::vector<std::string>* prompts)
            : prompts_(prompts) {}
        const restyle::detail::DeviceInfo& device() const override { return info_; }
        bool generate(const restyle::GenerationRequest& request,
                      std::vector<float>* samples,
                      std::size_t* sample_rate,
                      std::size_t* channels,
                      restyle::detail::GenerationTiming*,
                      std::string*) override {
            prompts_->push_back(request.conditioning_text);
            samples->assign(request.segment.frame_count, 0.25f);
            *sample_rate = request.segment.sample_rate;
            *channels = 1;
            return true;
        }

    private:
        std::vector<std::string>* prompts_;
        restyle::detail::DeviceInfo info_;
    };

    std::vector<std::unique_ptr<restyle::detail::GenerationBackend>> workers;
    workers.push_back(std::make_unique<PromptRecorder>(&prompts));
    restyle::PipelineController controller(
        config, std::make_unique<restyle::GenerationOrchestrator>(std::move(workers)));
    restyle::PipelineResult result;
    if (!controller.run(source, &result)) {
        std::cerr << "Pipeline test failed: " << result.error.message << "\n";
        return false;
    }
    if (prompts != std::vector<std::string>{"chillwave", "chillwave"}) {
        std::cerr << "Pipeline test failed: configured style did not reach the model.\n";
        return false;
    }
    return true;
}

bool test_skip_policy_drops_failed_segment() {
    const auto source = make_sine_track(32000, 95.0);
    ScriptedBehavior behavior;
    behavior.failing_indices = {2};
    auto log = std::make_shared<CallLog>();
    restyle::PipelineController controller(make_config(), make_orchestrator(behavior, log));

    restyle::PipelineResult result;
    if (!controller.run(source, &result)) {
        std::cerr << "Pipeline test failed: skip policy should still produce output.\n";
        return false;
    }
    if (result.state != restyle::PipelineState::PartiallyFailed || !result.has_output) {
        std::cerr << "Pipeline test failed: expected a partially failed run with output.\n";
        return false;
    }
    if (result.dropped_indices != std::vector<std::size_t>{2}) {
        std::cerr << "Pipeline test failed: segment 2 should be reported as dropped.\n";
        return false;
    }
    if (std::fabs(result.output.duration_seconds() - 65.0) > 1.0 / 32000.0) {
        std::cerr << "Pipeline test failed: output lasts " << result.output.duration_seconds()
                  << " s instead of 65 s.\n";
        return false;
    }
    if (result.segment_errors.size() != 1 || result.segment_errors[0].index != 2) {
        std::cerr << "Pipeline test failed: segment error not recorded.\n";
        return false;
    }
    if (result.output.samples[60 * 32000] != ScriptedGenerationBackend::value_for_index(3)) {
        std::cerr << "Pipeline test failed: segment 3 should follow segment 1.\n";
        return false;
    }
    return true;
}

bool test_throwing_segment_is_dropped() {
    const auto source = make_sine_track(32000, 95.0);
    ScriptedBehavior behavior;
    behavior.throwing_indices = {2};
    restyle::PipelineController controller(make_config(), make_orchestrator(behavior, nullptr));

    restyle::PipelineResult result;
    if (!controller.run(source, &result)) {
        std::cerr << "Pipeline test failed: a throwing segment ended the run: "
                  << result.error.message << "\n";
        return false;
    }
    if (result.state != restyle::PipelineState::PartiallyFailed ||
        result.dropped_indices != std::vector<std::size_t>{2} ||
        controller.segment_results().size() != 4) {
        std::cerr << "Pipeline test failed: throwing segment should be dropped alone.\n";
        return false;
    }
    return true;
}

bool test_abort_policy_emits_no_output() {
    const auto source = make_sine_track(32000, 95.0);
    ScriptedBehavior behavior;
    behavior.failing_indices = {2};
    auto log = std::make_shared<CallLog>();
    restyle::PipelineController controller(make_config(restyle::FailurePolicy::Abort),
                                           make_orchestrator(behavior, log));

    restyle::PipelineResult result;
    if (controller.run(source, &result)) {
        std::cerr << "Pipeline test failed: abort policy returned output.\n";
        return false;
    }
    if (result.has_output || !result.output.samples.empty()) {
        std::cerr << "Pipeline test failed: abort policy must not expose audio.\n";
        return false;
    }
    if (result.error.kind != restyle::ErrorKind::GenerationFailed ||
        result.error.failed_indices != std::vector<std::size_t>{2} ||
        result.error.errors.size() != 1) {
        std::cerr << "Pipeline test failed: pipeline error does not name segment 2.\n";
        return false;
    }
    if (result.policy != restyle::FailurePolicy::Abort) {
        std::cerr << "Pipeline test failed: result does not report its policy.\n";
        return false;
    }
    return true;
}

bool test_all_segments_failing_yields_no_output() {
    const auto source = make_sine_track(32000, 50.0);
    ScriptedBehavior behavior;
    behavior.failing_indices = {0, 1};
    restyle::PipelineController controller(make_config(), make_orchestrator(behavior, nullptr));

    restyle::PipelineResult result;
    if (controller.run(source, &result) || result.has_output) {
        std::cerr << "Pipeline test failed: a run without any generated segment produced output.\n";
        return false;
    }
    if (result.error.failed_indices != std::vector<std::size_t>{0, 1}) {
        std::cerr << "Pipeline test failed: every failed index should be reported.\n";
        return false;
    }
    return true;
}

bool test_retries_recover_transient_failures() {
    const auto source = make_sine_track(32000, 95.0);
    ScriptedBehavior behavior;
    behavior.flaky_indices = {1, 3};
    auto log = std::make_shared<CallLog>();
    restyle::RestyleConfig config = make_config(restyle::FailurePolicy::Abort);
    config.generation_retries = 1;
    restyle::PipelineController controller(config, make_orchestrator(behavior, log));

    restyle::PipelineResult result;
    if (!controller.run(source, &result)) {
        std::cerr << "Pipeline test failed: retry did not recover: " << result.error.message
                  << "\n";
        return false;
    }
    if (result.state != restyle::PipelineState::Completed) {
        std::cerr << "Pipeline test failed: recovered run should complete.\n";
        return false;
    }
    if (log->indices() != std::vector<std::size_t>{0, 1, 2, 3, 1, 3}) {
        std::cerr << "Pipeline test failed: only failed segments should be resubmitted.\n";
        return false;
    }
    return true;
}

bool test_invalid_input_never_reaches_the_model() {
    auto log = std::make_shared<CallLog>();
    restyle::PipelineController controller(make_config(), make_orchestrator({}, log));
    const auto stereo = make_sine_track(44100, 10.0, 2);

    restyle::PipelineResult result;
    if (controller.run(stereo, &result)) {
        std::cerr << "Pipeline test failed: mismatched input was accepted.\n";
        return false;
    }
    if (result.state != restyle::PipelineState::Failed ||
        result.error.kind != restyle::ErrorKind::InvalidInput) {
        std::cerr << "Pipeline test failed: expected an invalid input failure.\n";
        return false;
    }
    if (!log->indices().empty()) {
        std::cerr << "Pipeline test failed: the model ran on invalid input.\n";
        return false;
    }

    restyle::RestyleConfig bad_window = make_config();
    bad_window.window_seconds = 0.0;
    restyle::PipelineController second(bad_window, make_orchestrator({}, log));
    if (second.run(make_sine_track(32000, 10.0), &result) ||
        result.error.kind != restyle::ErrorKind::InvalidParameter) {
        std::cerr << "Pipeline test failed: zero window should be an invalid parameter.\n";
        return false;
    }
    if (!log->indices().empty()) {
        std::cerr << "Pipeline test failed: the model ran with an invalid window.\n";
        return false;
    }
    return true;
}

bool test_controller_runs_once() {
    const auto source = make_sine_track(32000, 20.0);
    restyle::PipelineController controller(make_config(), make_orchestrator({}, nullptr));
    restyle::PipelineResult first;
    if (!controller.run(source, &first)) {
        std::cerr << "Pipeline test failed: " << first.error.message << "\n";
        return false;
    }
    restyle::PipelineResult second;
    if (controller.run(source, &second) ||
        second.error.kind != restyle::ErrorKind::InvalidParameter) {
        std::cerr << "Pipeline test failed: a second run on one controller was accepted.\n";
        return false;
    }
    if (controller.state() != restyle::PipelineState::Completed) {
        std::cerr << "Pipeline test failed: rejected rerun changed the controller state.\n";
        return false;
    }
    return true;
}

bool test_cancel_keeps_finished_segments() {
    const auto source = make_sine_track(32000, 95.0);
    restyle::PipelineController* target = nullptr;
    std::size_t calls = 0;
    ScriptedBehavior behavior;
    behavior.on_call = [&target, &calls]() {
        if (++calls == 2 && target) {
            target->cancel();
        }
    };
    auto log = std::make_shared<CallLog>();
    restyle::PipelineController controller(make_config(), make_orchestrator(behavior, log));
    target = &controller;

    restyle::PipelineResult result;
    if (controller.run(source, &result)) {
        std::cerr << "Pipeline test failed: cancelled run reported success.\n";
        return false;
    }
    if (result.state != restyle::PipelineState::Cancelled ||
        result.error.kind != restyle::ErrorKind::Cancelled || result.has_output) {
        std::cerr << "Pipeline test failed: expected a cancelled run without output.\n";
        return false;
    }
    if (log->indices() != std::vector<std::size_t>{0, 1}) {
        std::cerr << "Pipeline test failed: generation continued after cancel.\n";
        return false;
    }
    const auto& partial = controller.segment_results();
    if (partial.size() != 4 || !partial[0].ok() || !partial[1].ok() || partial[2].ok() ||
        partial[3].ok()) {
        std::cerr << "Pipeline test failed: finished segments were not kept.\n";
        return false;
    }
    if (result.error.failed_indices != std::vector<std::size_t>{2, 3}) {
        std::cerr << "Pipeline test failed: unstarted segments not reported.\n";
        return false;
    }
    return true;
}

bool test_missing_model_is_reported_after_validation() {
    restyle::RestyleConfig config = make_config();
    config.device = restyle::DevicePreference::Cpu;
    config.model_path = "does/not/exist/musicgen_melody.ts";

    // Input problems surface before any model is touched.
    restyle::PipelineController invalid(config);
    restyle::PipelineResult result;
    if (invalid.run(make_sine_track(44100, 1.0), &result) ||
        result.error.kind != restyle::ErrorKind::InvalidInput) {
        std::cerr << "Pipeline test failed: input should be validated before loading.\n";
        return false;
    }

    restyle::PipelineController controller(config);
    if (controller.run(make_sine_track(32000, 1.0), &result)) {
        std::cerr << "Pipeline test failed: run without a model succeeded.\n";
        return false;
    }
    if (result.state != restyle::PipelineState::Failed ||
        result.error.kind != restyle::ErrorKind::BackendUnavailable || result.has_output) {
        std::cerr << "Pipeline test failed: missing model should be a backend error.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_full_run_preserves_duration()) {
        return 1;
    }
    if (!test_conditioning_reaches_the_model()) {
        return 1;
    }
    if (!test_skip_policy_drops_failed_segment()) {
        return 1;
    }
    if (!test_throwing_segment_is_dropped()) {
        return 1;
    }
    if (!test_abort_policy_emits_no_output()) {
        return 1;
    }
    if (!test_all_segments_failing_yields_no_output()) {
        return 1;
    }
    if (!test_retries_recover_transient_failures()) {
        return 1;
    }
    if (!test_invalid_input_never_reaches_the_model()) {
        return 1;
    }
    if (!test_controller_runs_once()) {
        return 1;
    }
    if (!test_cancel_keeps_finished_segments()) {
        return 1;
    }
    if (!test_missing_model_is_reported_after_validation()) {
        return 1;
    }

    std::cout << "Pipeline test passed.\n";
    return 0;
}
