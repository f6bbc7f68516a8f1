/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "AdjustmentEngine.hpp"

//-------------------------------------------------------------------------

namespace uniledger::ledger
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] AdjustmentReason normalizeReason(bool amountChanging, bool accountChanging) noexcept
{
    if (amountChanging && accountChanging) {
        return AdjustmentReason::BOTH_CORRECTION;
    }
    return accountChanging
        ? AdjustmentReason::ACCOUNT_CORRECTION
        : AdjustmentReason::AMOUNT_CORRECTION;
}

[[nodiscard]] AccountId requirePaymentAccount(const Expense& expense)
{
    if (!expense.paymentAccountId.has_value()) {
        throw std::runtime_error{fmt::format(
            "{}: {} has payments but no payment account",
            std::source_location::current().function_name(), expense)};
    }
    return expense.paymentAccountId.value();
}

}  // namespace

//-------------------------------------------------------------------------

AdjustmentEngine::AdjustmentEngine(
    ExpenseLedger* expenses,
    accounting::BalanceAccountStore* accounts,
    size_t minDescriptionLength,
    Clock clock)
    : m_expenses{expenses},
      m_accounts{accounts},
      m_minDescriptionLength{minDescriptionLength},
      m_clock{std::move(clock)},
      m_mtx{std::make_unique<std::shared_mutex>()}
{}

//-------------------------------------------------------------------------

Expected<AdjustmentRecord> AdjustmentEngine::adjust(
    ExpenseId expenseId, AdjustmentRequest request)
{
    auto description = validateDescription(request.description);
    if (!description) {
        return std::unexpected{std::move(description).error()};
    }
    if (request.reason == AdjustmentReason::ERROR_REVERSAL
        || request.reason == AdjustmentReason::PARTIAL_REFUND) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "Reason '{}' has its own operation", enumToString(request.reason.value())))};
    }
    if (request.newAmount.has_value()) {
        auto valid = accounting::validateAmount(request.newAmount.value(), "New amount");
        if (!valid) {
            return std::unexpected{std::move(valid).error()};
        }
    }

    auto handle = m_expenses->m_expenses.acquire(expenseId);
    if (!handle) {
        return std::unexpected{std::move(handle).error()};
    }
    Expense& expense = **handle;

    if (expense.amountPaid == 0_dec) {
        return std::unexpected{LedgerError::validation(
            fmt::format("EXP-{} has no recorded payment to adjust", expenseId))};
    }
    const AccountId previousAccountId = requirePaymentAccount(expense);
    const bool amountChanging =
        request.newAmount.has_value() && request.newAmount.value() != expense.amount;
    const bool accountChanging =
        request.newAccountId.has_value() && request.newAccountId.value() != previousAccountId;
    if (!amountChanging && !accountChanging) {
        return std::unexpected{LedgerError::noChange(fmt::format(
            "Adjustment of EXP-{} changes neither the amount nor the account", expenseId))};
    }

    const AccountId newAccountId =
        accountChanging ? request.newAccountId.value() : previousAccountId;
    auto newAccount = m_accounts->getAccount(newAccountId);
    if (!newAccount) {
        return std::unexpected{std::move(newAccount).error()};
    }
    if (!newAccount->isLiquid()) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "Account '{}' cannot fund payments", newAccount->name()))};
    }

    const decimal_t previousAmountPaid = expense.amountPaid;
    const decimal_t newAmount = amountChanging ? request.newAmount.value() : expense.amount;
    // A fully paid expense stays fully paid; a partial payment only shrinks
    // when the new amount falls below it.
    const decimal_t newAmountPaid = [&] {
        if (!amountChanging) return previousAmountPaid;
        if (expense.isPaid()) return newAmount;
        return std::min(previousAmountPaid, newAmount);
    }();

    const auto reference = fmt::format("ADJ-{}", expenseId);
    const auto movementDescription =
        fmt::format("Adjustment of EXP-{}: {}", expenseId, description.value());
    std::vector<accounting::Movement> movements;
    if (accountChanging) {
        movements.push_back({
            .accountId = previousAccountId,
            .kind = accounting::EntryKind::CREDIT,
            .amount = previousAmountPaid,
            .description = movementDescription,
            .reference = reference
        });
        movements.push_back({
            .accountId = newAccountId,
            .kind = accounting::EntryKind::DEBIT,
            .amount = newAmountPaid,
            .description = movementDescription,
            .reference = reference
        });
    } else if (const decimal_t delta = newAmountPaid - previousAmountPaid; delta != 0_dec) {
        movements.push_back({
            .accountId = previousAccountId,
            .kind = delta > 0_dec ? accounting::EntryKind::DEBIT : accounting::EntryKind::CREDIT,
            .amount = util::abs(delta),
            .description = movementDescription,
            .reference = reference
        });
    }
    if (!movements.empty()) {
        if (auto applied = m_accounts->apply(std::move(movements)); !applied) {
            return std::unexpected{std::move(applied).error()};
        }
    }

    AdjustmentRecord record;
    record.expenseId = expenseId;
    record.reason = normalizeReason(amountChanging, accountChanging);
    record.previousAmount = expense.amount;
    record.newAmount = newAmount;
    record.adjustmentDelta = newAmount - expense.amount;
    record.previousAmountPaid = previousAmountPaid;
    record.newAmountPaid = newAmountPaid;
    record.previousAccountId = previousAccountId;
    record.newAccountId = newAccountId;
    record.previousPaymentMethod = expense.paymentMethod;
    record.newPaymentMethod = request.newMethod.has_value()
        ? request.newMethod
        : accountChanging ? std::make_optional(defaultMethodFor(newAccount->kind()))
                          : expense.paymentMethod;
    record.description = std::move(description).value();
    record.adjustedBy = std::move(request.adjustedBy);
    record.adjustedAt = m_clock();

    expense.amount = newAmount;
    expense.amountPaid = newAmountPaid;
    expense.paymentAccountId = newAccountId;
    expense.paymentMethod = record.newPaymentMethod;
    if (!expense.isPaid()) {
        expense.paidAt.reset();
    } else if (!expense.paidAt.has_value()) {
        expense.paidAt = record.adjustedAt;
    }

    return append(std::move(record));
}

//-------------------------------------------------------------------------

Expected<AdjustmentRecord> AdjustmentEngine::revert(
    ExpenseId expenseId, std::string description, UserId adjustedBy)
{
    auto validDescription = validateDescription(description);
    if (!validDescription) {
        return std::unexpected{std::move(validDescription).error()};
    }

    auto handle = m_expenses->m_expenses.acquire(expenseId);
    if (!handle) {
        return std::unexpected{std::move(handle).error()};
    }
    Expense& expense = **handle;

    if (expense.amountPaid == 0_dec) {
        return std::unexpected{LedgerError::validation(
            fmt::format("EXP-{} has no recorded payment to revert", expenseId))};
    }
    const AccountId accountId = requirePaymentAccount(expense);

    auto entry = m_accounts->credit(
        accountId,
        expense.amountPaid,
        fmt::format("Reversal of EXP-{}: {}", expenseId, validDescription.value()),
        fmt::format("REV-{}", expenseId));
    if (!entry) {
        return std::unexpected{std::move(entry).error()};
    }

    AdjustmentRecord record;
    record.expenseId = expenseId;
    record.reason = AdjustmentReason::ERROR_REVERSAL;
    record.previousAmount = expense.amount;
    record.newAmount = 0_dec;
    record.adjustmentDelta = -expense.amountPaid;
    record.previousAmountPaid = expense.amountPaid;
    record.newAmountPaid = 0_dec;
    record.previousAccountId = accountId;
    record.previousPaymentMethod = expense.paymentMethod;
    record.description = std::move(validDescription).value();
    record.adjustedBy = std::move(adjustedBy);
    record.adjustedAt = m_clock();

    expense.amountPaid = 0_dec;
    expense.paymentAccountId.reset();
    expense.paymentMethod.reset();
    expense.paidAt.reset();

    return append(std::move(record));
}

//-------------------------------------------------------------------------

Expected<AdjustmentRecord> AdjustmentEngine::partialRefund(
    ExpenseId expenseId, decimal_t amount, std::string description, UserId adjustedBy)
{
    auto validDescription = validateDescription(description);
    if (!validDescription) {
        return std::unexpected{std::move(validDescription).error()};
    }
    if (auto valid = accounting::validateAmount(amount, "Refund amount"); !valid) {
        return std::unexpected{std::move(valid).error()};
    }

    auto handle = m_expenses->m_expenses.acquire(expenseId);
    if (!handle) {
        return std::unexpected{std::move(handle).error()};
    }
    Expense& expense = **handle;

    if (expense.amountPaid == 0_dec) {
        return std::unexpected{LedgerError::validation(
            fmt::format("EXP-{} has no recorded payment to refund", expenseId))};
    }
    // A paid expense only leaves the paid state through revert.
    if (expense.isPaid()) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "EXP-{} is fully paid; lower its amount through an adjustment instead",
            expenseId))};
    }
    if (amount > expense.amountPaid) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "Refund {} exceeds the {} paid on EXP-{}", amount, expense.amountPaid, expenseId))};
    }
    const AccountId accountId = requirePaymentAccount(expense);

    auto entry = m_accounts->credit(
        accountId,
        amount,
        fmt::format("Refund on EXP-{}: {}", expenseId, validDescription.value()),
        fmt::format("REF-{}", expenseId));
    if (!entry) {
        return std::unexpected{std::move(entry).error()};
    }

    AdjustmentRecord record;
    record.expenseId = expenseId;
    record.reason = AdjustmentReason::PARTIAL_REFUND;
    record.previousAmount = expense.amount;
    record.newAmount = expense.amount;
    record.adjustmentDelta = -amount;
    record.previousAmountPaid = expense.amountPaid;
    record.newAmountPaid = expense.amountPaid - amount;
    record.previousAccountId = accountId;
    record.newAccountId = accountId;
    record.previousPaymentMethod = expense.paymentMethod;
    record.newPaymentMethod = expense.paymentMethod;
    record.description = std::move(validDescription).value();
    record.adjustedBy = std::move(adjustedBy);
    record.adjustedAt = m_clock();

    expense.amountPaid = record.newAmountPaid;
    if (expense.amountPaid == 0_dec) {
        expense.paymentAccountId.reset();
        expense.paymentMethod.reset();
    }

    return append(std::move(record));
}

//-------------------------------------------------------------------------

Expected<std::vector<AdjustmentRecord>> AdjustmentEngine::history(ExpenseId expenseId) const
{
    if (!m_expenses->m_expenses.contains(expenseId)) {
        return std::unexpected{
            LedgerError::notFound(fmt::format("Expense #{} does not exist", expenseId))};
    }
    std::shared_lock lock{*m_mtx};
    return m_records
        | views::filter([expenseId](const auto& record) { return record.expenseId == expenseId; })
        | ranges::to<std::vector>;
}

//-------------------------------------------------------------------------

Expected<AdjustmentPage> AdjustmentEngine::historyBetween(const AdjustmentQuery& query) const
{
    if (query.from && query.to && query.from.value() > query.to.value()) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "Start date {} is after end date {}",
            util::formatDate(query.from.value()), util::formatDate(query.to.value())))};
    }
    std::shared_lock lock{*m_mtx};
    auto matches = m_records
        | views::reverse
        | views::filter([&](const AdjustmentRecord& record) {
            const Date day = util::toDate(record.adjustedAt);
            return (!query.from || day >= query.from.value())
                && (!query.to || day <= query.to.value())
                && (!query.reason || record.reason == query.reason.value());
        })
        | ranges::to<std::vector>;
    AdjustmentPage page{.items = {}, .total = matches.size()};
    page.items = matches
        | views::drop(static_cast<std::ptrdiff_t>(query.offset))
        | views::take(static_cast<std::ptrdiff_t>(query.limit))
        | ranges::to<std::vector>;
    return page;
}

//-------------------------------------------------------------------------

void AdjustmentEngine::checkpointSerialize(
    rapidjson::Document& json, const std::string& key) const
{
    std::shared_lock lock{*m_mtx};
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("next_id", rapidjson::Value{m_idCounter}, allocator);
        json::serializeArray(json, "records", m_records);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void AdjustmentEngine::restore(const rapidjson::Value& json)
{
    std::unique_lock lock{*m_mtx};
    m_records.clear();
    AdjustmentId maxId{};
    for (const auto& recordJson : json["records"].GetArray()) {
        m_records.push_back(AdjustmentRecord::fromJson(recordJson));
        maxId = std::max(maxId, m_records.back().id);
    }
    m_idCounter = std::max<AdjustmentId>(
        maxId + 1, static_cast<AdjustmentId>(json::getUint(json["next_id"])));
}

//-------------------------------------------------------------------------

Expected<std::string> AdjustmentEngine::validateDescription(std::string_view description) const
{
    return accounting::validateDescription(
        description, m_minDescriptionLength, "Adjustment description");
}

//-------------------------------------------------------------------------

AdjustmentRecord AdjustmentEngine::append(AdjustmentRecord record)
{
    {
        std::unique_lock lock{*m_mtx};
        record.id = m_idCounter++;
        m_records.push_back(record);
    }
    m_signals.recorded(record);
    return record;
}

//-------------------------------------------------------------------------

}  // namespace uniledger::ledger

//-------------------------------------------------------------------------
