/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "DebtLedger.hpp"

#include <boost/algorithm/string/trim.hpp>

//-------------------------------------------------------------------------

namespace uniledger::debt
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::string_view label(DebtKind kind) noexcept
{
    return kind == DebtKind::RECEIVABLE ? "Receivable" : "Payable";
}

[[nodiscard]] LedgerError debtNotFound(DebtKind kind, DebtId debtId)
{
    return LedgerError::notFound(fmt::format("{} #{} does not exist", label(kind), debtId));
}

}  // namespace

//-------------------------------------------------------------------------

DebtLedger::DebtLedger(
    accounting::BalanceAccountStore* accounts,
    std::chrono::milliseconds lockTimeout,
    Clock clock) noexcept
    : m_debts{"Debt", lockTimeout}, m_accounts{accounts}, m_clock{std::move(clock)}
{}

//-------------------------------------------------------------------------

Expected<DebtStatement> DebtLedger::create(DebtKind kind, DebtRequest request)
{
    auto description = accounting::validateDescription(request.description, 1);
    if (!description) {
        return std::unexpected{std::move(description).error()};
    }
    if (auto valid = accounting::validateAmount(request.amount, "Debt amount"); !valid) {
        return std::unexpected{std::move(valid).error()};
    }
    auto counterparty = boost::algorithm::trim_copy(request.counterparty);
    if (counterparty.empty()) {
        return std::unexpected{LedgerError::validation(
            fmt::format("{} requires a counterparty", label(kind)))};
    }

    Debt debt;
    debt.id = m_idCounter++;
    debt.kind = kind;
    debt.description = std::move(description).value();
    debt.amount = request.amount;
    debt.createdAt = m_clock();
    debt.invoiceDate = request.invoiceDate.value_or(util::toDate(debt.createdAt));
    debt.dueDate = request.dueDate;
    debt.counterparty = std::move(counterparty);
    debt.invoiceNumber = boost::algorithm::trim_copy(request.invoiceNumber);
    debt.notes = std::move(request.notes);
    if (debt.dueDate.has_value() && debt.dueDate.value() < debt.invoiceDate) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "Due date {} precedes invoice date {}",
            util::formatDate(debt.dueDate.value()), util::formatDate(debt.invoiceDate)))};
    }

    m_debts.insert(debt.id, debt);
    return DebtStatement{std::move(debt), today()};
}

//-------------------------------------------------------------------------

Expected<DebtStatement> DebtLedger::get(DebtKind kind, DebtId debtId) const
{
    auto debt = m_debts.get(debtId);
    if (!debt) {
        if (debt.error().code == LedgerErrorCode::NOT_FOUND) {
            return std::unexpected{debtNotFound(kind, debtId)};
        }
        return std::unexpected{std::move(debt).error()};
    }
    if (debt->kind != kind) {
        return std::unexpected{debtNotFound(kind, debtId)};
    }
    return DebtStatement{std::move(debt).value(), today()};
}

//-------------------------------------------------------------------------

Expected<std::vector<DebtStatement>> DebtLedger::list(DebtKind kind, bool pendingOnly) const
{
    const Date asOf = today();
    return debtsOfKind(kind).transform([&](std::vector<Debt> debts) {
        if (pendingOnly) {
            std::erase_if(debts, [](const Debt& debt) { return debt.isPaid(); });
        }
        ranges::stable_sort(debts, [](const Debt& lhs, const Debt& rhs) {
            if (!lhs.dueDate || !rhs.dueDate) {
                return lhs.dueDate.has_value() && !rhs.dueDate.has_value();
            }
            return lhs.dueDate.value() < rhs.dueDate.value();
        });
        return debts
            | views::transform([asOf](const Debt& debt) {
                return DebtStatement{debt, asOf};
            })
            | ranges::to<std::vector>;
    });
}

//-------------------------------------------------------------------------

Expected<DebtTotals> DebtLedger::totals(DebtKind kind) const
{
    const Date asOf = today();
    return debtsOfKind(kind).transform([&](const std::vector<Debt>& debts) {
        DebtTotals totals;
        totals.kind = kind;
        for (const auto& debt : debts) {
            if (debt.isPaid()) {
                ++totals.paidCount;
                continue;
            }
            totals.pendingTotal += debt.balance();
            ++totals.pendingCount;
            if (debt.isOverdue(asOf)) {
                totals.overdueTotal += debt.balance();
                ++totals.overdueCount;
            }
        }
        return totals;
    });
}

//-------------------------------------------------------------------------

Expected<DebtStatement> DebtLedger::recordPayment(
    DebtKind kind, DebtId debtId, DebtPayment payment)
{
    if (auto valid = accounting::validateAmount(payment.amount, "Payment amount"); !valid) {
        return std::unexpected{std::move(valid).error()};
    }

    auto handle = m_debts.acquire(debtId);
    if (!handle) {
        if (handle.error().code == LedgerErrorCode::NOT_FOUND) {
            return std::unexpected{debtNotFound(kind, debtId)};
        }
        return std::unexpected{std::move(handle).error()};
    }
    Debt& debt = **handle;

    if (debt.kind != kind) {
        return std::unexpected{debtNotFound(kind, debtId)};
    }
    if (debt.isPaid()) {
        return std::unexpected{LedgerError::validation(
            fmt::format("{} #{} is already fully paid", label(kind), debtId))};
    }
    if (payment.amount > debt.balance()) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "Payment {} exceeds the outstanding balance {} of {} #{}",
            payment.amount, debt.balance(), label(kind), debtId))};
    }

    if (payment.accountId.has_value()) {
        auto account = m_accounts->getAccount(payment.accountId.value());
        if (!account) {
            return std::unexpected{std::move(account).error()};
        }
        if (!account->isLiquid()) {
            return std::unexpected{LedgerError::validation(fmt::format(
                "Account '{}' cannot take part in payments", account->name()))};
        }
        auto entry = kind == DebtKind::RECEIVABLE
            ? m_accounts->credit(
                payment.accountId.value(),
                payment.amount,
                fmt::format("Collection from {}: {}", debt.counterparty, debt.description),
                fmt::format("AR-{}", debtId))
            : m_accounts->debit(
                payment.accountId.value(),
                payment.amount,
                fmt::format("Payment to {}: {}", debt.counterparty, debt.description),
                fmt::format("AP-{}", debtId));
        if (!entry) {
            return std::unexpected{std::move(entry).error()};
        }
    }

    debt.amountPaid += payment.amount;
    debt.paymentMethod = payment.method;
    if (debt.isPaid()) {
        debt.paidAt = m_clock();
    }
    return DebtStatement{debt, today()};
}

//-------------------------------------------------------------------------

void DebtLedger::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto debts = m_debts.snapshot();
    if (!debts) {
        throw std::runtime_error{fmt::format(
            "{}: Unable to checkpoint debts: {}",
            std::source_location::current().function_name(), debts.error())};
    }
    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("next_id", rapidjson::Value{m_idCounter.load()}, allocator);
        json::serializeArray(json, "debts", debts.value());
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void DebtLedger::restore(const rapidjson::Value& json)
{
    DebtId maxId{};
    for (const auto& debtJson : json["debts"].GetArray()) {
        auto debt = Debt::fromJson(debtJson);
        maxId = std::max(maxId, debt.id);
        m_debts.insert(debt.id, std::move(debt));
    }
    m_idCounter = std::max<DebtId>(
        maxId + 1, static_cast<DebtId>(json::getUint(json["next_id"])));
}

//-------------------------------------------------------------------------

Expected<std::vector<Debt>> DebtLedger::debtsOfKind(DebtKind kind) const
{
    return m_debts.snapshot().transform([kind](std::vector<Debt> debts) {
        std::erase_if(debts, [kind](const Debt& debt) { return debt.kind != kind; });
        return debts;
    });
}

//-------------------------------------------------------------------------

}  // namespace uniledger::debt

//-------------------------------------------------------------------------
