/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "AdjustmentEngine.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace uniledger::ledger
{

//-------------------------------------------------------------------------

class AdjustmentLogger
{
public:
    AdjustmentLogger(
        const fs::path& filepath, decltype(AdjustmentSignals::recorded)& signal) noexcept;

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    void log(const AdjustmentRecord& record) const;

private:
    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    bs2::scoped_connection m_feed;
};

//-------------------------------------------------------------------------

}  // namespace uniledger::ledger

//-------------------------------------------------------------------------
