/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ExpenseLedger.hpp"

#include <boost/algorithm/string/trim.hpp>

//-------------------------------------------------------------------------

namespace uniledger::ledger
{

//-------------------------------------------------------------------------

ExpenseLedger::ExpenseLedger(
    accounting::BalanceAccountStore* accounts,
    const CashFallbackResolver* resolver,
    std::chrono::milliseconds lockTimeout,
    Clock clock) noexcept
    : m_expenses{"Expense", lockTimeout},
      m_accounts{accounts},
      m_resolver{resolver},
      m_clock{std::move(clock)}
{}

//-------------------------------------------------------------------------

Expected<Expense> ExpenseLedger::createExpense(ExpenseRequest request)
{
    auto description = accounting::validateDescription(request.description, 1);
    if (!description) {
        return std::unexpected{std::move(description).error()};
    }
    if (auto valid = accounting::validateAmount(request.amount, "Expense amount"); !valid) {
        return std::unexpected{std::move(valid).error()};
    }

    Expense expense;
    expense.id = m_idCounter++;
    expense.category = request.category;
    expense.description = std::move(description).value();
    expense.amount = request.amount;
    expense.dueDate = request.dueDate;
    expense.createdAt = m_clock();
    expense.expenseDate = request.expenseDate.value_or(util::toDate(expense.createdAt));
    expense.vendor = boost::algorithm::trim_copy(request.vendor);
    expense.receiptNumber = boost::algorithm::trim_copy(request.receiptNumber);
    expense.notes = std::move(request.notes);

    m_expenses.insert(expense.id, expense);
    return expense;
}

//-------------------------------------------------------------------------

Expected<Expense> ExpenseLedger::updateExpense(ExpenseId expenseId, ExpensePatch patch)
{
    if (patch.empty()) {
        return std::unexpected{LedgerError::noChange("Expense update carries no fields")};
    }
    std::optional<std::string> description;
    if (patch.description.has_value()) {
        auto valid = accounting::validateDescription(patch.description.value(), 1);
        if (!valid) {
            return std::unexpected{std::move(valid).error()};
        }
        description = std::move(valid).value();
    }
    if (patch.amount.has_value()) {
        if (auto valid = accounting::validateAmount(*patch.amount, "Expense amount"); !valid) {
            return std::unexpected{std::move(valid).error()};
        }
    }

    auto handle = m_expenses.acquire(expenseId);
    if (!handle) {
        return std::unexpected{std::move(handle).error()};
    }
    Expense& expense = **handle;

    if (patch.amount.has_value() && patch.amount.value() != expense.amount) {
        if (expense.isPaid()) {
            return std::unexpected{LedgerError::validation(fmt::format(
                "EXP-{} is paid; its amount can only change through an adjustment",
                expenseId))};
        }
        if (patch.amount.value() < expense.amountPaid) {
            return std::unexpected{LedgerError::validation(fmt::format(
                "Amount {} is below the {} already paid on EXP-{}",
                patch.amount.value(), expense.amountPaid, expenseId))};
        }
        expense.amount = patch.amount.value();
        if (expense.isPaid()) {
            expense.paidAt = m_clock();
        }
    }
    if (patch.category) expense.category = patch.category.value();
    if (description) expense.description = std::move(description).value();
    if (patch.dueDate) expense.dueDate = patch.dueDate.value();
    if (patch.expenseDate) expense.expenseDate = patch.expenseDate.value();
    if (patch.vendor) expense.vendor = boost::algorithm::trim_copy(patch.vendor.value());
    if (patch.receiptNumber) {
        expense.receiptNumber = boost::algorithm::trim_copy(patch.receiptNumber.value());
    }
    if (patch.notes) expense.notes = std::move(patch.notes).value();

    return expense;
}

//-------------------------------------------------------------------------

Expected<Expense> ExpenseLedger::payExpense(ExpenseId expenseId, const PaymentRequest& payment)
{
    if (auto valid = accounting::validateAmount(payment.amount, "Payment amount"); !valid) {
        return std::unexpected{std::move(valid).error()};
    }

    auto handle = m_expenses.acquire(expenseId);
    if (!handle) {
        return std::unexpected{std::move(handle).error()};
    }
    Expense& expense = **handle;

    if (payment.amount > expense.balance()) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "Payment {} exceeds the outstanding balance {} of EXP-{}",
            payment.amount, expense.balance(), expenseId))};
    }

    auto accountId = resolvePaymentAccount(expense, payment);
    if (!accountId) {
        return std::unexpected{std::move(accountId).error()};
    }
    // Reversals credit the whole amount paid to one account, so every
    // partial payment of an expense must come from the same account.
    if (expense.paymentAccountId.has_value()
        && expense.paymentAccountId.value() != accountId.value()) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "EXP-{} is being paid from account #{}; pay the rest from it or "
            "correct the account through an adjustment",
            expenseId, expense.paymentAccountId.value()))};
    }
    auto account = m_accounts->getAccount(accountId.value());
    if (!account) {
        return std::unexpected{std::move(account).error()};
    }

    auto entry = m_accounts->debit(
        accountId.value(),
        payment.amount,
        fmt::format("Expense payment: {}", expense.description),
        fmt::format("EXP-{}", expenseId));
    if (!entry) {
        return std::unexpected{std::move(entry).error()};
    }

    expense.amountPaid += payment.amount;
    expense.paymentAccountId = accountId.value();
    expense.paymentMethod = payment.method.value_or(defaultMethodFor(account->kind()));
    if (expense.isPaid()) {
        expense.paidAt = m_clock();
    }
    if (expense.amountPaid > expense.amount) {
        throw std::runtime_error{fmt::format(
            "{}: {} overpaid", std::source_location::current().function_name(), expense)};
    }
    return expense;
}

//-------------------------------------------------------------------------

Expected<Expense> ExpenseLedger::getExpense(ExpenseId expenseId) const
{
    return m_expenses.get(expenseId);
}

//-------------------------------------------------------------------------

Expected<ExpensePage> ExpenseLedger::listExpenses(const ExpenseFilter& filter) const
{
    return m_expenses.snapshot().transform([&](std::vector<Expense> expenses) {
        std::erase_if(expenses, [&](const Expense& expense) {
            return (filter.category && expense.category != filter.category.value())
                || (filter.isPaid && expense.isPaid() != filter.isPaid.value());
        });
        ranges::sort(expenses, [](const Expense& lhs, const Expense& rhs) {
            return std::tie(rhs.expenseDate, rhs.id) < std::tie(lhs.expenseDate, lhs.id);
        });
        ExpensePage page{.items = {}, .total = expenses.size()};
        page.items = expenses
            | views::drop(static_cast<std::ptrdiff_t>(filter.offset))
            | views::take(static_cast<std::ptrdiff_t>(filter.limit))
            | ranges::to<std::vector>;
        return page;
    });
}

//-------------------------------------------------------------------------

Expected<std::vector<Expense>> ExpenseLedger::pendingExpenses() const
{
    return m_expenses.snapshot().transform([](std::vector<Expense> expenses) {
        std::erase_if(expenses, [](const Expense& expense) { return expense.isPaid(); });
        ranges::stable_sort(expenses, [](const Expense& lhs, const Expense& rhs) {
            if (!lhs.dueDate || !rhs.dueDate) {
                return lhs.dueDate.has_value() && !rhs.dueDate.has_value();
            }
            return lhs.dueDate.value() < rhs.dueDate.value();
        });
        return expenses;
    });
}

//-------------------------------------------------------------------------

Expected<decimal_t> ExpenseLedger::pendingTotal() const
{
    return pendingExpenses().transform([](const std::vector<Expense>& expenses) {
        return ranges::accumulate(
            expenses | views::transform(&Expense::balance), decimal_t{});
    });
}

//-------------------------------------------------------------------------

Expected<std::vector<CategorySummary>> ExpenseLedger::summaryByCategory(
    std::optional<Date> from, std::optional<Date> to) const
{
    if (from && to && from.value() > to.value()) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "Start date {} is after end date {}",
            util::formatDate(from.value()), util::formatDate(to.value())))};
    }
    return m_expenses.snapshot().transform([&](const std::vector<Expense>& expenses) {
        std::map<ExpenseCategory, CategorySummary> byCategory;
        decimal_t grandTotal{};
        for (const auto& expense : expenses) {
            if ((from && expense.expenseDate < from.value())
                || (to && expense.expenseDate > to.value())) {
                continue;
            }
            auto& summary = byCategory[expense.category];
            summary.category = expense.category;
            summary.total += expense.amount;
            summary.paid += expense.amountPaid;
            summary.pending += expense.balance();
            ++summary.count;
            grandTotal += expense.amount;
        }
        auto summaries = byCategory | views::values | ranges::to<std::vector>;
        for (auto& summary : summaries) {
            summary.percentage = grandTotal > 0_dec
                ? util::round(summary.total / grandTotal * 100_dec)
                : decimal_t{};
        }
        return summaries;
    });
}

//-------------------------------------------------------------------------

void ExpenseLedger::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto expenses = m_expenses.snapshot();
    if (!expenses) {
        throw std::runtime_error{fmt::format(
            "{}: Unable to checkpoint expenses: {}",
            std::source_location::current().function_name(), expenses.error())};
    }
    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("next_id", rapidjson::Value{m_idCounter.load()}, allocator);
        json::serializeArray(json, "expenses", expenses.value());
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void ExpenseLedger::restore(const rapidjson::Value& json)
{
    ExpenseId maxId{};
    for (const auto& expenseJson : json["expenses"].GetArray()) {
        auto expense = Expense::fromJson(expenseJson);
        maxId = std::max(maxId, expense.id);
        m_expenses.insert(expense.id, std::move(expense));
    }
    m_idCounter = std::max<ExpenseId>(
        maxId + 1, static_cast<ExpenseId>(json::getUint(json["next_id"])));
}

//-------------------------------------------------------------------------

Expected<AccountId> ExpenseLedger::resolvePaymentAccount(
    const Expense& expense, const PaymentRequest& payment) const
{
    auto account = m_accounts->getAccount(payment.accountId);
    if (!account) {
        return std::unexpected{std::move(account).error()};
    }
    if (!account->isLiquid()) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "Account '{}' cannot fund payments", account->name()))};
    }
    if (!account->isCash()) {
        return payment.accountId;
    }

    if (payment.useFallback) {
        // Consent given: a primary with a configured fallback is paid from the fallback.
        return m_resolver->fallbackFor(payment.accountId).value_or(payment.accountId);
    }

    auto check = m_resolver->check(payment.amount, payment.accountId);
    if (!check) {
        return std::unexpected{std::move(check).error()};
    }
    if (check->canPay) {
        return payment.accountId;
    }
    if (check->fallbackAvailable) {
        return std::unexpected{LedgerError::needsFallback(
            fmt::format(
                "'{}' cannot cover {} for EXP-{}; confirm payment from the fallback account",
                account->name(), payment.amount, expense.id),
            check->fundsInfo())};
    }
    return std::unexpected{LedgerError::insufficientFunds(
        fmt::format(
            "'{}'{} cannot cover {} for EXP-{}",
            account->name(),
            check->fallbackAccountId ? " and its fallback" : "",
            payment.amount,
            expense.id),
        check->fundsInfo())};
}

//-------------------------------------------------------------------------

}  // namespace uniledger::ledger

//-------------------------------------------------------------------------
