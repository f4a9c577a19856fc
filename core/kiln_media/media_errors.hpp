// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_MEDIA_ERRORS_HPP
#define KILN_MEDIA_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace kiln {
namespace media {

/**
 * Base of every failure raised by the ingestion pipeline itself.
 * Object store failures arrive as kiln::storage::StoreError instead.
 */
class PipelineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Request rejected before any staging or store call (empty file, empty name).
 */
class InvalidInput : public PipelineError {
public:
  using PipelineError::PipelineError;
};

/**
 * Local filesystem, decode/encode or process spawn failure.
 */
class IOFailure : public PipelineError {
public:
  using PipelineError::PipelineError;
};

/**
 * The transcoder ran but did not succeed. exit_code is -1 on timeout.
 */
class TranscodeFailure : public PipelineError {
public:
  TranscodeFailure(int exit_code, const std::string& detail)
      : PipelineError(
          "Transcoder failed with exit code " + std::to_string(exit_code) +
          (detail.empty() ? std::string() : ": " + detail)
        )
      , exit_code_(exit_code) {}

  int exit_code() const {
    return exit_code_;
  }

private:
  int exit_code_;
};

}  // namespace media
}  // namespace kiln

#endif  // KILN_MEDIA_ERRORS_HPP
