/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "BalanceEntryLogger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace uniledger::accounting
{

//-------------------------------------------------------------------------

BalanceEntryLogger::BalanceEntryLogger(
    const fs::path& filepath, decltype(AccountSignals::entry)& signal) noexcept
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "BalanceEntryLogger", std::make_unique<spdlog::sinks::basic_file_sink_mt>(m_filepath));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    m_feed = signal.connect([this](const BalanceEntry& entry) { log(entry); });

    m_logger->trace("time,entryId,accountId,kind,amount,balanceAfter,reference");
    m_logger->flush();
}

//-------------------------------------------------------------------------

void BalanceEntryLogger::log(const BalanceEntry& entry) const
{
    m_logger->trace(
        "{},{},{},{},{},{},{}",
        util::formatTimestamp(entry.createdAt),
        entry.id,
        entry.accountId,
        enumToString(entry.kind),
        entry.amount,
        entry.balanceAfter,
        entry.reference);
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace uniledger::accounting

//-------------------------------------------------------------------------
