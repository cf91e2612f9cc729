//
//  main.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/audio_io.h"
#include "restyle/config.h"
#include "restyle/logging.hpp"
#include "restyle/pipeline.h"
#include "restyle/preset.h"
#include "restyle/version.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <getopt.h>

namespace {

std::atomic<restyle::PipelineController*> g_active_controller{nullptr};

void handle_interrupt(int) {
    restyle::PipelineController* controller = g_active_controller.load();
    if (controller) {
        controller->cancel();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] --input FILE\n\n";
    std::cout << "Regenerates FILE window by window in a new style and stitches the result.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -i, --input FILE        Source audio (decoded by libsndfile)\n";
    std::cout << "  -o, --output-dir DIR    Run artifacts directory (default: outputs)\n";
    std::cout << "  -s, --style TEXT        Style prompt (default: lofi hip hop ...)\n";
    std::cout << "  -p, --preset NAME       Apply a preset first (lofi, draft)\n";
    std::cout << "  -w, --segment SECONDS   Window length in seconds (default: 30)\n";
    std::cout << "      --no-melody         Do not condition on the source melody\n";
    std::cout << "      --policy POLICY     abort | skip-and-continue (default)\n";
    std::cout << "      --device DEVICE     auto (default) | cpu\n";
    std::cout << "  -m, --model PATH        TorchScript generation model\n";
    std::cout << "      --retries N         Resubmit failed segments up to N times\n";
    std::cout << "      --workers N         Use up to N accelerators in parallel\n";
    std::cout << "      --sample-rate HZ    Expected input rate, 0 to accept any (default 32000)\n";
    std::cout << "      --channels N        Expected input channels, 0 to accept any (default 1)\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "      --profile           Per-segment timing\n";
    std::cout << "      --version           Print version and exit\n";
    std::cout << "  -h, --help              Show this help message\n";
}

bool parse_size(const char* text, std::size_t* value) {
    if (!text || !value) {
        return false;
    }
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0') {
        return false;
    }
    *value = static_cast<std::size_t>(parsed);
    return true;
}

bool parse_seconds(const char* text, double* value) {
    if (!text || !value) {
        return false;
    }
    char* end = nullptr;
    const double parsed = std::strtod(text, &end);
    if (end == text || *end != '\0') {
        return false;
    }
    *value = parsed;
    return true;
}

enum LongOnlyOption {
    kOptNoMelody = 256,
    kOptPolicy,
    kOptDevice,
    kOptRetries,
    kOptWorkers,
    kOptSampleRate,
    kOptChannels,
    kOptProfile,
    kOptVersion,
};

} // namespace

int main(int argc, char* argv[]) {
    restyle::RestyleConfig config;
    config.output_dir = "outputs";
    std::string input_path;

    static struct option long_options[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output-dir", required_argument, nullptr, 'o'},
        {"style", required_argument, nullptr, 's'},
        {"preset", required_argument, nullptr, 'p'},
        {"segment", required_argument, nullptr, 'w'},
        {"no-melody", no_argument, nullptr, kOptNoMelody},
        {"policy", required_argument, nullptr, kOptPolicy},
        {"device", required_argument, nullptr, kOptDevice},
        {"model", required_argument, nullptr, 'm'},
        {"retries", required_argument, nullptr, kOptRetries},
        {"workers", required_argument, nullptr, kOptWorkers},
        {"sample-rate", required_argument, nullptr, kOptSampleRate},
        {"channels", required_argument, nullptr, kOptChannels},
        {"verbose", no_argument, nullptr, 'v'},
        {"profile", no_argument, nullptr, kOptProfile},
        {"version", no_argument, nullptr, kOptVersion},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int opt = 0;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "i:o:s:p:w:m:vh", long_options, &option_index)) !=
           -1) {
        switch (opt) {
            case 'i':
                input_path = optarg;
                break;
            case 'o':
                config.output_dir = optarg;
                break;
            case 's':
                config.style_text = optarg;
                break;
            case 'p': {
                auto preset = restyle::make_restyle_preset(optarg);
                if (!preset) {
                    std::cerr << "Unknown preset '" << optarg << "'. Available:";
                    for (const auto& name : restyle::restyle_preset_names()) {
                        std::cerr << " " << name;
                    }
                    std::cerr << "\n";
                    return 1;
                }
                preset->apply(config);
                break;
            }
            case 'w':
                if (!parse_seconds(optarg, &config.window_seconds)) {
                    std::cerr << "Invalid --segment value '" << optarg << "'.\n";
                    return 1;
                }
                break;
            case kOptNoMelody:
                config.preserve_melody = false;
                break;
            case kOptPolicy:
                if (!restyle::parse_failure_policy(optarg, &config.failure_policy)) {
                    std::cerr << "Invalid --policy '" << optarg
                              << "', expected abort or skip-and-continue.\n";
                    return 1;
                }
                break;
            case kOptDevice:
                if (!restyle::parse_device_preference(optarg, &config.device)) {
                    std::cerr << "Invalid --device '" << optarg << "', expected auto or cpu.\n";
                    return 1;
                }
                break;
            case 'm':
                config.model_path = optarg;
                break;
            case kOptRetries:
                if (!parse_size(optarg, &config.generation_retries)) {
                    std::cerr << "Invalid --retries value '" << optarg << "'.\n";
                    return 1;
                }
                break;
            case kOptWorkers:
                if (!parse_size(optarg, &config.max_workers) || config.max_workers == 0) {
                    std::cerr << "Invalid --workers value '" << optarg << "'.\n";
                    return 1;
                }
                break;
            case kOptSampleRate:
                if (!parse_size(optarg, &config.expected_sample_rate)) {
                    std::cerr << "Invalid --sample-rate value '" << optarg << "'.\n";
                    return 1;
                }
                break;
            case kOptChannels:
                if (!parse_size(optarg, &config.expected_channels)) {
                    std::cerr << "Invalid --channels value '" << optarg << "'.\n";
                    return 1;
                }
                break;
            case 'v':
                config.verbose = true;
                break;
            case kOptProfile:
                config.profile = true;
                break;
            case kOptVersion:
                std::cout << "restyle " << restyle::version_string() << "\n";
                return 0;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }
    if (input_path.empty() && optind < argc) {
        input_path = argv[optind];
    }
    if (input_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    restyle::set_log_verbosity_from_config(config);

    std::cout << "[1/4] Loading " << input_path << "...\n";
    restyle::SourceTrack source;
    restyle::Error error;
    if (!restyle::load_source_track(input_path, &source, &error)) {
        std::cerr << "Error: " << error.message << "\n";
        return 1;
    }

    std::cout << "[2/4] Segmenting " << source.duration_seconds() << " s into "
              << config.window_seconds << " s windows...\n";
    restyle::PipelineController controller(config);
    g_active_controller.store(&controller);
    std::signal(SIGINT, handle_interrupt);

    std::cout << "[3/4] Restyling segments...\n";
    restyle::PipelineResult result;
    const bool ok = controller.run(source, &result);
    g_active_controller.store(nullptr);
    std::signal(SIGINT, SIG_DFL);

    if (!result.artifact_error.ok()) {
        std::cerr << "Warning: " << result.artifact_error.message << "\n";
    }
    if (!ok) {
        std::cerr << "Error (" << restyle::pipeline_state_name(result.state)
                  << "): " << result.error.message << "\n";
        return result.state == restyle::PipelineState::Cancelled ? 130 : 1;
    }

    const std::filesystem::path final_path =
        std::filesystem::path(config.output_dir) / restyle::kFullTrackName;
    std::cout << "[4/4] Done: " << final_path.string() << " ("
              << result.output.duration_seconds() << " s)\n";
    if (!result.dropped_indices.empty()) {
        std::cout << "Dropped segments:";
        for (std::size_t index : result.dropped_indices) {
            std::cout << " " << index;
        }
        std::cout << "\n";
        return 2;
    }
    return 0;
}
