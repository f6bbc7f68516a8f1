/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "LedgerApi.hpp"

#include <spdlog/spdlog.h>

#include <charconv>

//-------------------------------------------------------------------------

namespace uniledger::api
{

//-------------------------------------------------------------------------

namespace
{

constexpr uint32_t kCreated = 201;
constexpr std::string_view kDefaultUser = "api";

//-------------------------------------------------------------------------

std::string errorBody(
    std::string_view code, std::string_view message, const LedgerError* err = nullptr)
{
    rapidjson::Document json;
    json.SetObject();
    auto& allocator = json.GetAllocator();
    json::setStringMember(json, "error", code);
    json::setStringMember(json, "message", message);
    if (err == nullptr) {
        return json::json2str(json);
    }
    json.AddMember("recoverable", rapidjson::Value{err->isRecoverable()}, allocator);
    json.AddMember("retryable", rapidjson::Value{err->isRetryable()}, allocator);
    if (const auto& funds = err->funds; funds.has_value()) {
        const auto& f = funds.value();
        json.AddMember("source_account_id", rapidjson::Value{f.accountId}, allocator);
        json::setDecimalMember(json, "source_balance", f.balance);
        json::setDecimalMember(json, "amount", f.requested);
        json::setDecimalMember(
            json, "shortfall", std::max(f.requested - f.balance, decimal_t{}));
        json::setOptionalMember(json, "fallback_account_id", f.fallbackAccountId);
        json::setOptionalMember(json, "fallback_balance", f.fallbackBalance);
    }
    return json::json2str(json);
}

ApiResponse ok(const auto& serializable, uint32_t status = 200)
{
    rapidjson::Document json;
    serializable.jsonSerialize(json);
    return {status, json::json2str(json)};
}

ApiResponse okArray(const auto& range)
{
    rapidjson::Document json;
    json::serializeArray(json, {}, range);
    return {200, json::json2str(json)};
}

ApiResponse okPage(const auto& items, size_t total, size_t offset, size_t limit)
{
    rapidjson::Document json;
    json.SetObject();
    auto& allocator = json.GetAllocator();
    json::serializeArray(json, "items", items);
    json.AddMember("total", rapidjson::Value{static_cast<uint64_t>(total)}, allocator);
    json.AddMember("offset", rapidjson::Value{static_cast<uint64_t>(offset)}, allocator);
    json.AddMember("limit", rapidjson::Value{static_cast<uint64_t>(limit)}, allocator);
    return {200, json::json2str(json)};
}

template<typename T, typename F>
ApiResponse renderWith(Expected<T> result, F&& onSuccess)
{
    if (!result) {
        return errorResponse(result.error());
    }
    return std::forward<F>(onSuccess)(result.value());
}

template<typename T>
ApiResponse render(Expected<T> result, uint32_t status = 200)
{
    return renderWith(std::move(result), [status](const T& value) { return ok(value, status); });
}

template<typename T>
ApiResponse renderArray(Expected<T> result)
{
    return renderWith(std::move(result), [](const T& values) { return okArray(values); });
}

size_t pageLimit(const RequestTarget& target, size_t fallback)
{
    static constexpr size_t maxLimit = 1000;
    const auto limit = target.uintParam("limit").value_or(fallback);
    if (limit == 0 || limit > maxLimit) {
        throw RequestError{fmt::format("'limit' must be between 1 and {}", maxLimit)};
    }
    return limit;
}

}  // namespace

//-------------------------------------------------------------------------

uint32_t httpStatusOf(LedgerErrorCode code) noexcept
{
    switch (code) {
        case LedgerErrorCode::VALIDATION_ERROR:
        case LedgerErrorCode::NO_CHANGE_REQUESTED:
            return 422;
        case LedgerErrorCode::NOT_FOUND:
            return 404;
        case LedgerErrorCode::INSUFFICIENT_FUNDS:
        case LedgerErrorCode::NEEDS_FALLBACK_CONFIRMATION:
            return 409;
        case LedgerErrorCode::CONCURRENCY_CONFLICT:
            return 503;
    }
    return 500;
}

//-------------------------------------------------------------------------

ApiResponse errorResponse(const LedgerError& err)
{
    return {httpStatusOf(err.code), errorBody(enumToString(err.code), err.message, &err)};
}

//-------------------------------------------------------------------------

RequestBody LedgerApi::Request::body() const
{
    if (json == nullptr) {
        throw RequestError{"Request body is required"};
    }
    return RequestBody{*json};
}

//-------------------------------------------------------------------------

LedgerApi::LedgerApi(Ledger* ledger)
    : m_ledger{ledger}
{
    if (m_ledger == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: Ledger must not be null", std::source_location::current().function_name())};
    }
    registerRoutes();
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::handle(
    std::string_view method, std::string_view target, const std::string& body) const
{
    try {
        const RequestTarget parsed{target};
        auto response = dispatch(method, parsed, body);
        spdlog::debug("{} {} -> {}", method, target, response.status);
        return response;
    }
    catch (const RequestError& e) {
        spdlog::debug("{} {} -> rejected: {}", method, target, e.what());
        return errorResponse(LedgerError::validation(e.what()));
    }
    catch (const std::exception& e) {
        spdlog::error("{} {} failed: {}", method, target, e.what());
        return {500, errorBody("internal_error", e.what())};
    }
}

//-------------------------------------------------------------------------

void LedgerApi::route(std::string method, const std::string& pattern, Handler handler)
{
    m_routes.push_back(Route{
        .method = std::move(method),
        .pattern = std::regex{pattern},
        .handler = std::move(handler)
    });
}

//-------------------------------------------------------------------------

void LedgerApi::registerRoutes()
{
    using debt::DebtKind;

    route("GET", R"(/health)", [](const Request&) {
        return ApiResponse{200, R"({"status":"ok"})"};
    });

    route("GET", R"(/accounts)", std::bind_front(&LedgerApi::listAccounts, this));
    route("GET", R"(/accounts/(\d+))", std::bind_front(&LedgerApi::getAccount, this));
    route("GET", R"(/accounts/(\d+)/entries)", std::bind_front(&LedgerApi::accountEntries, this));
    route("POST", R"(/accounts/(\d+)/set-balance)", std::bind_front(&LedgerApi::setBalance, this));
    route("GET", R"(/cash-balances)", std::bind_front(&LedgerApi::cashBalances, this));
    route("POST", R"(/fixed-assets)", std::bind_front(&LedgerApi::createFixedAsset, this));
    route("POST", R"(/debts)", std::bind_front(&LedgerApi::createDebtAccount, this));

    route("POST", R"(/expenses)", std::bind_front(&LedgerApi::createExpense, this));
    route("GET", R"(/expenses)", std::bind_front(&LedgerApi::listExpenses, this));
    route("GET", R"(/expenses/pending)", std::bind_front(&LedgerApi::pendingExpenses, this));
    route(
        "GET",
        R"(/expenses/summary-by-category)",
        std::bind_front(&LedgerApi::summaryByCategory, this));
    route("POST", R"(/expenses/check-balance)", std::bind_front(&LedgerApi::checkBalance, this));
    route("GET", R"(/expenses/(\d+))", std::bind_front(&LedgerApi::getExpense, this));
    route("PATCH", R"(/expenses/(\d+))", std::bind_front(&LedgerApi::updateExpense, this));
    route("POST", R"(/expenses/(\d+)/pay)", std::bind_front(&LedgerApi::payExpense, this));
    route("POST", R"(/expenses/(\d+)/adjust)", std::bind_front(&LedgerApi::adjustExpense, this));
    route("POST", R"(/expenses/(\d+)/revert)", std::bind_front(&LedgerApi::revertExpense, this));
    route("POST", R"(/expenses/(\d+)/refund)", std::bind_front(&LedgerApi::refundExpense, this));
    route(
        "GET",
        R"(/expenses/(\d+)/adjustments)",
        std::bind_front(&LedgerApi::expenseAdjustments, this));
    route("GET", R"(/adjustments)", std::bind_front(&LedgerApi::listAdjustments, this));

    for (DebtKind kind : {DebtKind::RECEIVABLE, DebtKind::PAYABLE}) {
        const auto base = fmt::format("/{}s", enumToString(kind));
        route("GET", base, std::bind_front(&LedgerApi::listDebts, this, kind));
        route("POST", base, std::bind_front(&LedgerApi::createDebt, this, kind));
        route("GET", base + "/totals", std::bind_front(&LedgerApi::debtTotals, this, kind));
        route("GET", base + R"(/(\d+))", std::bind_front(&LedgerApi::getDebt, this, kind));
        route("POST", base + R"(/(\d+)/pay)", std::bind_front(&LedgerApi::payDebt, this, kind));
    }

    route("GET", R"(/inventory)", std::bind_front(&LedgerApi::inventory, this));
    route("GET", R"(/patrimony)", std::bind_front(&LedgerApi::patrimony, this));
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::dispatch(
    std::string_view method, const RequestTarget& target, const std::string& body) const
{
    bool pathKnown = false;
    std::smatch match;
    for (const auto& route : m_routes) {
        if (!std::regex_match(target.path(), match, route.pattern)) continue;
        pathKnown = true;
        if (route.method != method) continue;

        std::vector<uint32_t> ids;
        for (size_t i = 1; i < match.size(); ++i) {
            const auto str = match[i].str();
            uint32_t id{};
            const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), id);
            if (ec != std::errc{} || ptr != str.data() + str.size()) {
                return errorResponse(LedgerError::notFound(fmt::format("No resource '{}'", str)));
            }
            ids.push_back(id);
        }

        rapidjson::Document json;
        const bool hasBody = body.find_first_not_of(" \t\r\n") != std::string::npos;
        if (hasBody) {
            try {
                json = json::str2json(body);
            }
            catch (const std::invalid_argument& e) {
                return {400, errorBody("bad_request", e.what())};
            }
        }
        return route.handler(Request{
            .target = target,
            .ids = std::move(ids),
            .json = hasBody ? &json : nullptr
        });
    }
    if (pathKnown) {
        return {405, errorBody("method_not_allowed",
            fmt::format("{} is not supported on {}", method, target.path()))};
    }
    return {404, errorBody("not_found", fmt::format("No route for {}", target.path()))};
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::listAccounts(const Request& req) const
{
    return renderArray(m_ledger->accounts().listAccounts(
        req.target.enumParam<accounting::AccountKind>("kind")));
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::getAccount(const Request& req) const
{
    return render(m_ledger->accounts().getAccount(req.ids.at(0)));
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::accountEntries(const Request& req) const
{
    return renderArray(m_ledger->accounts().entries(req.ids.at(0)));
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::setBalance(const Request& req) const
{
    const auto body = req.body();
    const AccountId accountId = req.ids.at(0);
    const auto newBalance = body.decimal("new_balance");
    return renderWith(
        m_ledger->accounts().setBalance(
            accountId, newBalance, body.optionalString("reason").value_or("")),
        [&](const std::optional<accounting::BalanceEntry>& entry) {
            rapidjson::Document json;
            json.SetObject();
            auto& allocator = json.GetAllocator();
            json.AddMember("account_id", rapidjson::Value{accountId}, allocator);
            json::setDecimalMember(json, "new_balance", newBalance);
            json.AddMember("changed", rapidjson::Value{entry.has_value()}, allocator);
            if (entry.has_value()) {
                entry->jsonSerialize(json, "entry");
            } else {
                json.AddMember("entry", rapidjson::Value{}.SetNull(), allocator);
            }
            return ApiResponse{200, json::json2str(json)};
        });
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::cashBalances(const Request&) const
{
    return render(m_ledger->accounts().cashBalances());
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::createFixedAsset(const Request& req) const
{
    const auto body = req.body();
    accounting::FixedAssetRequest request{
        .name = body.string("name"),
        .code = body.optionalString("code").value_or(""),
        .value = body.decimal("value"),
        .accumulatedDepreciation =
            body.optionalDecimal("accumulated_depreciation").value_or(decimal_t{}),
        .description = body.optionalString("description").value_or("")
    };
    return render(m_ledger->accounts().createFixedAsset(request), kCreated);
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::createDebtAccount(const Request& req) const
{
    const auto body = req.body();
    accounting::DebtAccountRequest request{
        .name = body.string("name"),
        .code = body.optionalString("code").value_or(""),
        .amount = body.decimal("amount"),
        .creditor = body.optionalString("creditor").value_or(""),
        .longTerm = body.flag("is_long_term"),
        .description = body.optionalString("description").value_or("")
    };
    return render(m_ledger->accounts().createDebt(request), kCreated);
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::createExpense(const Request& req) const
{
    const auto body = req.body();
    ledger::ExpenseRequest request{
        .category = body.optionalEnumeration<ledger::ExpenseCategory>("category")
            .value_or(ledger::ExpenseCategory::OTHER),
        .description = body.string("description"),
        .amount = body.decimal("amount"),
        .dueDate = body.optionalDate("due_date"),
        .expenseDate = body.optionalDate("expense_date"),
        .vendor = body.optionalString("vendor").value_or(""),
        .receiptNumber = body.optionalString("receipt_number").value_or(""),
        .notes = body.optionalString("notes").value_or("")
    };
    return render(m_ledger->expenses().createExpense(std::move(request)), kCreated);
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::listExpenses(const Request& req) const
{
    const ledger::ExpenseFilter filter{
        .category = req.target.enumParam<ledger::ExpenseCategory>("category"),
        .isPaid = req.target.boolParam("is_paid"),
        .offset = req.target.uintParam("offset").value_or(0),
        .limit = pageLimit(req.target, ledger::ExpenseFilter{}.limit)
    };
    return renderWith(
        m_ledger->expenses().listExpenses(filter),
        [&](const ledger::ExpensePage& page) {
            return okPage(page.items, page.total, filter.offset, filter.limit);
        });
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::pendingExpenses(const Request&) const
{
    return renderArray(m_ledger->expenses().pendingExpenses());
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::summaryByCategory(const Request& req) const
{
    return renderArray(m_ledger->expenses().summaryByCategory(
        req.target.dateParam("start_date"), req.target.dateParam("end_date")));
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::checkBalance(const Request& req) const
{
    const auto body = req.body();
    const auto amount = body.decimal("amount");
    if (auto accountId = body.optionalId("account_id")) {
        return render(m_ledger->resolver().check(amount, accountId.value()));
    }
    if (auto method = body.optionalEnumeration<ledger::PaymentMethod>("payment_method")) {
        return render(m_ledger->resolver().checkForMethod(amount, method.value()));
    }
    throw RequestError{"Either 'account_id' or 'payment_method' is required"};
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::getExpense(const Request& req) const
{
    return render(m_ledger->expenses().getExpense(req.ids.at(0)));
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::updateExpense(const Request& req) const
{
    const auto body = req.body();
    ledger::ExpensePatch patch{
        .category = body.optionalEnumeration<ledger::ExpenseCategory>("category"),
        .description = body.optionalString("description"),
        .amount = body.optionalDecimal("amount"),
        .dueDate = {},
        .expenseDate = body.optionalDate("expense_date"),
        .vendor = body.optionalString("vendor"),
        .receiptNumber = body.optionalString("receipt_number"),
        .notes = body.optionalString("notes")
    };
    if (body.isNull("due_date")) {
        patch.dueDate.emplace(std::nullopt);
    } else if (body.has("due_date")) {
        patch.dueDate.emplace(body.optionalDate("due_date"));
    }
    return render(m_ledger->expenses().updateExpense(req.ids.at(0), std::move(patch)));
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::payExpense(const Request& req) const
{
    const auto body = req.body();
    const auto method = body.optionalEnumeration<ledger::PaymentMethod>("method");
    auto accountId = body.optionalId("account_id");
    if (!accountId.has_value() && method.has_value()) {
        accountId = m_ledger->resolver().accountFor(method.value());
    }
    if (!accountId.has_value()) {
        throw RequestError{"'account_id' is required"};
    }
    const ledger::PaymentRequest payment{
        .amount = body.decimal("amount"),
        .accountId = accountId.value(),
        .method = method,
        .useFallback = body.flag("use_fallback")
    };
    return render(m_ledger->expenses().payExpense(req.ids.at(0), payment));
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::adjustExpense(const Request& req) const
{
    const auto body = req.body();
    ledger::AdjustmentRequest request{
        .newAmount = body.optionalDecimal("new_amount"),
        .newAccountId = body.optionalId("new_payment_account_id"),
        .newMethod = body.optionalEnumeration<ledger::PaymentMethod>("new_payment_method"),
        .reason = body.optionalEnumeration<ledger::AdjustmentReason>("reason"),
        .description = body.string("description"),
        .adjustedBy = body.optionalString("adjusted_by").value_or(std::string{kDefaultUser})
    };
    return render(
        m_ledger->adjustments().adjust(req.ids.at(0), std::move(request)), kCreated);
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::revertExpense(const Request& req) const
{
    const auto body = req.body();
    return render(
        m_ledger->adjustments().revert(
            req.ids.at(0),
            body.string("description"),
            body.optionalString("adjusted_by").value_or(std::string{kDefaultUser})),
        kCreated);
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::refundExpense(const Request& req) const
{
    const auto body = req.body();
    return render(
        m_ledger->adjustments().partialRefund(
            req.ids.at(0),
            body.decimal("amount"),
            body.string("description"),
            body.optionalString("adjusted_by").value_or(std::string{kDefaultUser})),
        kCreated);
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::expenseAdjustments(const Request& req) const
{
    return renderArray(m_ledger->adjustments().history(req.ids.at(0)));
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::listAdjustments(const Request& req) const
{
    const ledger::AdjustmentQuery query{
        .from = req.target.dateParam("start_date"),
        .to = req.target.dateParam("end_date"),
        .reason = req.target.enumParam<ledger::AdjustmentReason>("reason"),
        .offset = req.target.uintParam("offset").value_or(0),
        .limit = pageLimit(req.target, ledger::AdjustmentQuery{}.limit)
    };
    return renderWith(
        m_ledger->adjustments().historyBetween(query),
        [&](const ledger::AdjustmentPage& page) {
            return okPage(page.items, page.total, query.offset, query.limit);
        });
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::listDebts(debt::DebtKind kind, const Request& req) const
{
    return renderArray(
        m_ledger->debts().list(kind, req.target.boolParam("pending_only").value_or(false)));
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::createDebt(debt::DebtKind kind, const Request& req) const
{
    const auto body = req.body();
    debt::DebtRequest request{
        .description = body.string("description"),
        .amount = body.decimal("amount"),
        .invoiceDate = body.optionalDate("invoice_date"),
        .dueDate = body.optionalDate("due_date"),
        .counterparty = body.optionalString("counterparty").value_or(""),
        .invoiceNumber = body.optionalString("invoice_number").value_or(""),
        .notes = body.optionalString("notes").value_or("")
    };
    return render(m_ledger->debts().create(kind, std::move(request)), kCreated);
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::getDebt(debt::DebtKind kind, const Request& req) const
{
    return render(m_ledger->debts().get(kind, req.ids.at(0)));
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::payDebt(debt::DebtKind kind, const Request& req) const
{
    const auto body = req.body();
    const debt::DebtPayment payment{
        .amount = body.decimal("amount"),
        .method = body.optionalEnumeration<ledger::PaymentMethod>("method")
            .value_or(ledger::PaymentMethod::CASH),
        .accountId = body.optionalId("account_id")
    };
    return render(m_ledger->debts().recordPayment(kind, req.ids.at(0), payment));
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::debtTotals(debt::DebtKind kind, const Request&) const
{
    return render(m_ledger->debts().totals(kind));
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::inventory(const Request&) const
{
    return ok(m_ledger->inventory().value());
}

//-------------------------------------------------------------------------

ApiResponse LedgerApi::patrimony(const Request&) const
{
    return render(m_ledger->patrimony().snapshot());
}

//-------------------------------------------------------------------------

}  // namespace uniledger::api

//-------------------------------------------------------------------------
