/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Timestamp.hpp"

#include <sstream>

//-------------------------------------------------------------------------

namespace uniledger::util
{

//-------------------------------------------------------------------------

Timestamp systemNow() noexcept
{
    return date::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

//-------------------------------------------------------------------------

std::string formatDate(Date d)
{
    return date::format("%F", d);
}

//-------------------------------------------------------------------------

std::optional<Date> parseDate(std::string_view str)
{
    std::istringstream iss{std::string{str}};
    Date d;
    iss >> date::parse("%F", d);
    if (iss.fail() || iss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    return d;
}

//-------------------------------------------------------------------------

std::string formatTimestamp(Timestamp ts)
{
    return date::format("%FT%TZ", ts);
}

//-------------------------------------------------------------------------

std::optional<Timestamp> parseTimestamp(std::string_view str)
{
    std::istringstream iss{std::string{str}};
    Timestamp ts;
    iss >> date::parse("%FT%TZ", ts);
    if (iss.fail()) {
        return std::nullopt;
    }
    return ts;
}

//-------------------------------------------------------------------------

}  // namespace uniledger::util

//-------------------------------------------------------------------------
