/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "BalanceAccountStore.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace uniledger::accounting
{

//-------------------------------------------------------------------------

// Appends every balance movement of the store as a CSV line.
class BalanceEntryLogger
{
public:
    BalanceEntryLogger(
        const fs::path& filepath, decltype(AccountSignals::entry)& signal) noexcept;

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    void log(const BalanceEntry& entry) const;

private:
    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    bs2::scoped_connection m_feed;
};

//-------------------------------------------------------------------------

}  // namespace uniledger::accounting

//-------------------------------------------------------------------------
