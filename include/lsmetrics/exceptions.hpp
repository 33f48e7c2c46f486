// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * exceptions.hpp
 *
 * Errors raised at the input boundary of the metrics engine.
 *
 * Only structural problems with the input raster are thrown. Degenerate
 * classes and numerical edge cases are encoded as NaN in the output.
 */

#ifndef LSMETRICS_EXCEPTIONS_HPP
#define LSMETRICS_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace lsmetrics {

/**
 * @brief Input raster cannot be analysed.
 *
 * Raised for zero-size grids, mask/grid shape mismatch, non-square cells and
 * invalid cell size or area scale.
 */
class InvalidGridError : public std::invalid_argument {
 public:
  explicit InvalidGridError(const std::string& message)
      : std::invalid_argument("[LandscapeGrid] " + message),
        message_(message) {}

  const std::string& getMessage() const { return message_; }

 private:
  std::string message_;
};

}  // namespace lsmetrics

#endif  // LSMETRICS_EXCEPTIONS_HPP
