//
//  error.h
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace restyle {

enum class ErrorKind {
    None,
    /// @brief Bad window length, duration or style descriptor.
    InvalidParameter,
    /// @brief Source track violates the entry preconditions.
    InvalidInput,
    /// @brief Model invocation for a segment failed.
    GenerationFailed,
    /// @brief No model or compute device could be brought up.
    BackendUnavailable,
    /// @brief Work was stopped before it started.
    Cancelled,
    /// @brief Reading or writing audio files failed.
    IoError,
};

const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }
};

/// @brief Failure of a single segment's generation. Never propagates to siblings.
struct GenerationError {
    std::size_t index = 0;
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

/// @brief Terminal failure of a whole run.
struct PipelineError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::vector<std::size_t> failed_indices;
    std::vector<GenerationError> errors;
};

inline void set_error(Error* error, ErrorKind kind, std::string message) {
    if (error) {
        error->kind = kind;
        error->message = std::move(message);
    }
}

} // namespace restyle
