/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <date/date.h>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

using Timestamp = std::chrono::sys_seconds;
using Date = date::sys_days;

using Clock = std::function<Timestamp()>;

//-------------------------------------------------------------------------

namespace uniledger::util
{

[[nodiscard]] Timestamp systemNow() noexcept;

[[nodiscard]] inline Date toDate(Timestamp ts) noexcept
{
    return date::floor<date::days>(ts);
}

// ISO 8601 calendar date, "2026-10-19".
[[nodiscard]] std::string formatDate(Date d);
[[nodiscard]] std::optional<Date> parseDate(std::string_view str);

// ISO 8601 UTC timestamp, "2026-10-19T08:30:00Z".
[[nodiscard]] std::string formatTimestamp(Timestamp ts);
[[nodiscard]] std::optional<Timestamp> parseTimestamp(std::string_view str);

}  // namespace uniledger::util

//-------------------------------------------------------------------------
