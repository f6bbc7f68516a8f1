/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "AdjustmentLogger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace uniledger::ledger
{

//-------------------------------------------------------------------------

AdjustmentLogger::AdjustmentLogger(
    const fs::path& filepath, decltype(AdjustmentSignals::recorded)& signal) noexcept
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "AdjustmentLogger", std::make_unique<spdlog::sinks::basic_file_sink_mt>(m_filepath));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    m_feed = signal.connect([this](const AdjustmentRecord& record) { log(record); });

    m_logger->trace(
        "time,adjustmentId,expenseId,reason,previousAmount,newAmount,delta,"
        "previousAccountId,newAccountId,adjustedBy");
    m_logger->flush();
}

//-------------------------------------------------------------------------

void AdjustmentLogger::log(const AdjustmentRecord& record) const
{
    auto accountField = [](std::optional<AccountId> accountId) {
        return accountId.transform([](AccountId id) { return std::to_string(id); })
            .value_or(std::string{});
    };
    m_logger->trace(
        "{},{},{},{},{},{},{},{},{},{}",
        util::formatTimestamp(record.adjustedAt),
        record.id,
        record.expenseId,
        enumToString(record.reason),
        record.previousAmount,
        record.newAmount,
        record.adjustmentDelta,
        accountField(record.previousAccountId),
        accountField(record.newAccountId),
        record.adjustedBy);
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace uniledger::ledger

//-------------------------------------------------------------------------
