/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "outcome/outcome.hpp"

namespace lightbabe::primitives {

  enum class ArithmeticError : uint8_t {
    /// Underflow.
    Underflow = 1,
    /// Overflow.
    Overflow,
    /// Division by zero.
    DivisionByZero,
  };

}  // namespace lightbabe::primitives

OUTCOME_HPP_DECLARE_ERROR(lightbabe::primitives, ArithmeticError);
