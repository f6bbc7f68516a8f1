/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Ledger.hpp"
#include "request.hpp"

#include <regex>

//-------------------------------------------------------------------------

namespace uniledger::api
{

//-------------------------------------------------------------------------

struct ApiResponse
{
    uint32_t status{200};
    std::string body;
};

//-------------------------------------------------------------------------

[[nodiscard]] uint32_t httpStatusOf(LedgerErrorCode code) noexcept;
[[nodiscard]] ApiResponse errorResponse(const LedgerError& err);

//-------------------------------------------------------------------------

// Json boundary of the ledger: routes (method, target, body) to an operation
// and renders its outcome. Safe to call from several server threads.
class LedgerApi
{
public:
    explicit LedgerApi(Ledger* ledger);

    [[nodiscard]] ApiResponse handle(
        std::string_view method, std::string_view target, const std::string& body) const;

private:
    struct Request
    {
        const RequestTarget& target;
        std::vector<uint32_t> ids;
        const rapidjson::Value* json;

        [[nodiscard]] RequestBody body() const;
    };

    using Handler = std::function<ApiResponse(const Request&)>;

    struct Route
    {
        std::string method;
        std::regex pattern;
        Handler handler;
    };

    void route(std::string method, const std::string& pattern, Handler handler);
    void registerRoutes();

    ApiResponse dispatch(
        std::string_view method, const RequestTarget& target, const std::string& body) const;

    ApiResponse listAccounts(const Request& req) const;
    ApiResponse getAccount(const Request& req) const;
    ApiResponse accountEntries(const Request& req) const;
    ApiResponse setBalance(const Request& req) const;
    ApiResponse cashBalances(const Request& req) const;
    ApiResponse createFixedAsset(const Request& req) const;
    ApiResponse createDebtAccount(const Request& req) const;

    ApiResponse createExpense(const Request& req) const;
    ApiResponse listExpenses(const Request& req) const;
    ApiResponse pendingExpenses(const Request& req) const;
    ApiResponse summaryByCategory(const Request& req) const;
    ApiResponse checkBalance(const Request& req) const;
    ApiResponse getExpense(const Request& req) const;
    ApiResponse updateExpense(const Request& req) const;
    ApiResponse payExpense(const Request& req) const;

    ApiResponse adjustExpense(const Request& req) const;
    ApiResponse revertExpense(const Request& req) const;
    ApiResponse refundExpense(const Request& req) const;
    ApiResponse expenseAdjustments(const Request& req) const;
    ApiResponse listAdjustments(const Request& req) const;

    ApiResponse listDebts(debt::DebtKind kind, const Request& req) const;
    ApiResponse createDebt(debt::DebtKind kind, const Request& req) const;
    ApiResponse getDebt(debt::DebtKind kind, const Request& req) const;
    ApiResponse payDebt(debt::DebtKind kind, const Request& req) const;
    ApiResponse debtTotals(debt::DebtKind kind, const Request& req) const;

    ApiResponse inventory(const Request& req) const;
    ApiResponse patrimony(const Request& req) const;

    Ledger* m_ledger;
    std::vector<Route> m_routes;
};

//-------------------------------------------------------------------------

}  // namespace uniledger::api

//-------------------------------------------------------------------------
