/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "LedgerError.hpp"

#include <source_location>

//-------------------------------------------------------------------------

namespace uniledger::accounting
{

// Amount must be finite, carry at most two decimals and, unless allowZero, be > 0.
[[nodiscard]] Expected<decimal_t> validateAmount(
    decimal_t amount, std::string_view what, bool allowZero = false);

// Same precision rule, any sign.
[[nodiscard]] Expected<decimal_t> validateMoney(decimal_t value, std::string_view what);

[[nodiscard]] Expected<std::string> validateDescription(
    std::string_view description, size_t minLength, std::string_view what = "description");

}  // namespace uniledger::accounting

//-------------------------------------------------------------------------
