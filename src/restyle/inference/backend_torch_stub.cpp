//
//  backend_torch_stub.cpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "restyle/inference/generation_backend.h"
#include "restyle/logging.hpp"

namespace restyle {
namespace detail {

std::vector<std::unique_ptr<GenerationBackend>> make_generation_backends(
    const RestyleConfig&,
    Error* error) {
    RESTYLE_LOG_ERROR("Torch backend not enabled in this build.");
    set_error(error, ErrorKind::BackendUnavailable, "Torch backend not enabled in this build.");
    return {};
}

} // namespace detail
} // namespace restyle
