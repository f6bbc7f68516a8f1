/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "LedgerApi.hpp"
#include "test-common/fixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace uniledger;
using namespace uniledger::api;
using namespace uniledger::literals;
using namespace uniledger::test;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::string_view str(const rapidjson::Value& json)
{
    return {json.GetString(), json.GetStringLength()};
}

}  // namespace

//-------------------------------------------------------------------------

struct LedgerApiTest : Test
{
    ApiResponse call(std::string_view method, std::string_view target, const std::string& body = {})
    {
        return api.handle(method, target, body);
    }

    static rapidjson::Document parse(const ApiResponse& response)
    {
        return json::str2json(response.body);
    }

    ExpenseId createExpense(std::string_view amount)
    {
        const auto response = call(
            "POST",
            "/expenses",
            fmt::format(R"({{"description": "Compra de tela", "amount": "{}"}})", amount));
        EXPECT_EQ(response.status, 201) << response.body;
        return static_cast<ExpenseId>(json::getUint(parse(response)["id"]));
    }

    decimal_t balanceOf(AccountId accountId)
    {
        const auto response = call("GET", fmt::format("/accounts/{}", accountId));
        EXPECT_EQ(response.status, 200) << response.body;
        return json::getDecimal(parse(response)["balance"]);
    }

    ManualClock clock{at("2026-03-01T10:00:00Z")};
    Ledger ledger{makeShopConfig(), clock};
    LedgerApi api{&ledger};
};

//-------------------------------------------------------------------------

TEST_F(LedgerApiTest, Health)
{
    const auto response = call("GET", "/health");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(str(parse(response)["status"]), "ok");
}

TEST_F(LedgerApiTest, RoutingErrors)
{
    const auto unknown = call("GET", "/ledger");
    EXPECT_EQ(unknown.status, 404);
    EXPECT_EQ(str(parse(unknown)["error"]), "not_found");

    const auto wrongMethod = call("DELETE", "/expenses");
    EXPECT_EQ(wrongMethod.status, 405);
    EXPECT_EQ(str(parse(wrongMethod)["error"]), "method_not_allowed");

    const auto badJson = call("POST", "/expenses", R"({"amount": )");
    EXPECT_EQ(badJson.status, 400);
    EXPECT_EQ(str(parse(badJson)["error"]), "bad_request");

    const auto noBody = call("POST", "/expenses");
    EXPECT_EQ(noBody.status, 422);
    EXPECT_EQ(str(parse(noBody)["error"]), "validation_error");

    const auto notObject = call("POST", "/expenses", "[1, 2]");
    EXPECT_EQ(notObject.status, 422);

    EXPECT_EQ(call("GET", "/expenses/99999999999").status, 404);
    EXPECT_EQ(call("GET", "/health/").status, 200);
}

//-------------------------------------------------------------------------

struct StatusMappingTestParams
{
    LedgerErrorCode code;
    uint32_t status;
    bool recoverable{};
    bool retryable{};
};

void PrintTo(const StatusMappingTestParams& params, std::ostream* os)
{
    *os << enumToString(params.code) << " -> " << params.status;
}

struct StatusMappingTest : TestWithParam<StatusMappingTestParams> {};

TEST_P(StatusMappingTest, MapsErrorCode)
{
    const auto& params = GetParam();
    EXPECT_EQ(httpStatusOf(params.code), params.status);

    const auto response = errorResponse(LedgerError{params.code, "failure", std::nullopt});
    EXPECT_EQ(response.status, params.status);
    const auto json = json::str2json(response.body);
    EXPECT_EQ(str(json["error"]), enumToString(params.code));
    EXPECT_EQ(str(json["message"]), "failure");
    EXPECT_EQ(json["recoverable"].GetBool(), params.recoverable);
    EXPECT_EQ(json["retryable"].GetBool(), params.retryable);
    EXPECT_FALSE(json.HasMember("source_balance"));
}

INSTANTIATE_TEST_SUITE_P(
    LedgerApiTest,
    StatusMappingTest,
    Values(
        StatusMappingTestParams{.code = LedgerErrorCode::VALIDATION_ERROR, .status = 422},
        StatusMappingTestParams{.code = LedgerErrorCode::NO_CHANGE_REQUESTED, .status = 422},
        StatusMappingTestParams{.code = LedgerErrorCode::NOT_FOUND, .status = 404},
        StatusMappingTestParams{
            .code = LedgerErrorCode::INSUFFICIENT_FUNDS, .status = 409, .recoverable = true},
        StatusMappingTestParams{
            .code = LedgerErrorCode::NEEDS_FALLBACK_CONFIRMATION,
            .status = 409,
            .recoverable = true},
        StatusMappingTestParams{
            .code = LedgerErrorCode::CONCURRENCY_CONFLICT,
            .status = 503,
            .recoverable = true,
            .retryable = true}));

//-------------------------------------------------------------------------

TEST_F(LedgerApiTest, FallbackConfirmationFlow)
{
    const auto expenseId = createExpense("80000");
    const auto payTarget = fmt::format("/expenses/{}/pay", expenseId);

    const auto refused = call("POST", payTarget, R"({"amount": "80000", "account_id": 1})");
    ASSERT_EQ(refused.status, 409) << refused.body;
    const auto error = parse(refused);
    EXPECT_EQ(str(error["error"]), "needs_fallback_confirmation");
    EXPECT_EQ(json::getUint(error["source_account_id"]), kPettyCash);
    EXPECT_EQ(json::getDecimal(error["source_balance"]), 50'000_dec);
    EXPECT_EQ(json::getDecimal(error["amount"]), 80'000_dec);
    EXPECT_EQ(json::getDecimal(error["shortfall"]), 30'000_dec);
    EXPECT_EQ(json::getUint(error["fallback_account_id"]), kVaultCash);
    EXPECT_EQ(json::getDecimal(error["fallback_balance"]), 200'000_dec);
    EXPECT_EQ(balanceOf(kPettyCash), 50'000_dec);

    const auto paid = call(
        "POST", payTarget, R"({"amount": "80000", "account_id": 1, "use_fallback": true})");
    ASSERT_EQ(paid.status, 200) << paid.body;
    const auto expense = parse(paid);
    EXPECT_TRUE(expense["is_paid"].GetBool());
    EXPECT_EQ(str(expense["status"]), "paid");
    EXPECT_EQ(json::getUint(expense["payment_account_id"]), kVaultCash);
    EXPECT_EQ(str(expense["payment_method"]), "cash");
    EXPECT_EQ(balanceOf(kVaultCash), 120'000_dec);
}

TEST_F(LedgerApiTest, PayByMethodResolvesAccount)
{
    const auto expenseId = createExpense("25000.50");
    const auto paid = call(
        "POST",
        fmt::format("/expenses/{}/pay", expenseId),
        R"({"amount": "25000.50", "method": "transfer"})");
    ASSERT_EQ(paid.status, 200) << paid.body;
    EXPECT_EQ(json::getUint(parse(paid)["payment_account_id"]), kBank);
    EXPECT_EQ(balanceOf(kBank), DEC(974999.50));

    const auto missing = call(
        "POST", fmt::format("/expenses/{}/pay", expenseId), R"({"amount": "1"})");
    EXPECT_EQ(missing.status, 422);
}

TEST_F(LedgerApiTest, RejectsSubCentAmounts)
{
    const auto response = call(
        "POST", "/expenses", R"({"description": "Botones", "amount": "10.001"})");
    EXPECT_EQ(response.status, 422);
    EXPECT_EQ(str(parse(response)["error"]), "validation_error");
}

TEST_F(LedgerApiTest, CheckBalance)
{
    const auto byMethod = call(
        "POST", "/expenses/check-balance", R"({"amount": "80000", "payment_method": "cash"})");
    ASSERT_EQ(byMethod.status, 200) << byMethod.body;
    const auto check = parse(byMethod);
    EXPECT_FALSE(check["can_pay"].GetBool());
    EXPECT_TRUE(check["fallback_available"].GetBool());
    EXPECT_EQ(json::getDecimal(check["shortfall"]), 30'000_dec);

    EXPECT_EQ(call("POST", "/expenses/check-balance", R"({"amount": "1"})").status, 422);
    EXPECT_EQ(
        call("POST", "/expenses/check-balance", R"({"amount": "1", "account_id": 99})").status,
        404);
}

//-------------------------------------------------------------------------

TEST_F(LedgerApiTest, ListsAccountsByKind)
{
    const auto banks = call("GET", "/accounts?kind=bank");
    ASSERT_EQ(banks.status, 200) << banks.body;
    const auto json = parse(banks);
    ASSERT_TRUE(json.IsArray());
    ASSERT_EQ(json.Size(), 1);
    EXPECT_EQ(str(json[0]["name"]), "Banco");

    EXPECT_EQ(parse(call("GET", "/accounts")).Size(), 7);
    EXPECT_EQ(call("GET", "/accounts?kind=vault").status, 422);
    EXPECT_EQ(call("GET", "/accounts/42").status, 404);
}

TEST_F(LedgerApiTest, SetBalance)
{
    const auto changed = call(
        "POST", "/accounts/1/set-balance", R"({"new_balance": "65000", "reason": "Arqueo"})");
    ASSERT_EQ(changed.status, 200) << changed.body;
    auto json = parse(changed);
    EXPECT_TRUE(json["changed"].GetBool());
    EXPECT_EQ(str(json["entry"]["kind"]), "manual_set");
    EXPECT_EQ(balanceOf(kPettyCash), 65'000_dec);

    const auto unchanged = call("POST", "/accounts/1/set-balance", R"({"new_balance": "65000"})");
    ASSERT_EQ(unchanged.status, 200);
    json = parse(unchanged);
    EXPECT_FALSE(json["changed"].GetBool());
    EXPECT_TRUE(json["entry"].IsNull());

    const auto entries = parse(call("GET", "/accounts/1/entries"));
    EXPECT_EQ(entries.Size(), 1);
}

TEST_F(LedgerApiTest, CreatesFixedAssetsAndDebtAccounts)
{
    const auto asset = call(
        "POST",
        "/fixed-assets",
        R"({"name": "Fileteadora", "value": "2500000", "accumulated_depreciation": "500000"})");
    ASSERT_EQ(asset.status, 201) << asset.body;
    EXPECT_EQ(json::getDecimal(parse(asset)["net_value"]), 2'000'000_dec);

    const auto debt = call(
        "POST",
        "/debts",
        R"({"name": "Credito", "amount": "1000000", "creditor": "Banco", "is_long_term": true})");
    ASSERT_EQ(debt.status, 201) << debt.body;
    EXPECT_EQ(str(parse(debt)["kind"]), "liability_long");

    EXPECT_EQ(
        call("POST", "/fixed-assets", R"({"name": "X", "value": "10", "accumulated_depreciation": "20"})")
            .status,
        422);
}

//-------------------------------------------------------------------------

TEST_F(LedgerApiTest, ListsExpensesInPages)
{
    createExpense("100");
    createExpense("200");
    createExpense("300");

    const auto page = call("GET", "/expenses?limit=2&offset=1");
    ASSERT_EQ(page.status, 200) << page.body;
    const auto json = parse(page);
    EXPECT_EQ(json::getUint(json["total"]), 3);
    EXPECT_EQ(json::getUint(json["offset"]), 1);
    EXPECT_EQ(json::getUint(json["limit"]), 2);
    ASSERT_EQ(json["items"].Size(), 2);

    EXPECT_EQ(call("GET", "/expenses?limit=0").status, 422);
    EXPECT_EQ(call("GET", "/expenses?limit=abc").status, 422);
    EXPECT_EQ(call("GET", "/expenses?is_paid=maybe").status, 422);
    EXPECT_EQ(parse(call("GET", "/expenses?is_paid=true"))["items"].Size(), 0);
    EXPECT_EQ(parse(call("GET", "/expenses/pending")).Size(), 3);
}

TEST_F(LedgerApiTest, PatchClearsDueDate)
{
    const auto created = call(
        "POST",
        "/expenses",
        R"({"description": "Arriendo", "amount": "900000", "category": "rent", "due_date": "2026-03-05"})");
    ASSERT_EQ(created.status, 201) << created.body;
    EXPECT_EQ(str(parse(created)["due_date"]), "2026-03-05");

    const auto patched = call("PATCH", "/expenses/1", R"({"due_date": null, "vendor": "Inmobiliaria"})");
    ASSERT_EQ(patched.status, 200) << patched.body;
    const auto json = parse(patched);
    EXPECT_TRUE(json["due_date"].IsNull());
    EXPECT_EQ(str(json["vendor"]), "Inmobiliaria");

    EXPECT_EQ(call("PATCH", "/expenses/1", "{}").status, 422);
    EXPECT_EQ(call("PATCH", "/expenses/1", R"({"due_date": "05/03/2026"})").status, 422);
}

TEST_F(LedgerApiTest, AdjustmentRoutes)
{
    const auto expenseId = createExpense("100000");
    ASSERT_EQ(
        call("POST", fmt::format("/expenses/{}/pay", expenseId), R"({"amount": "60000", "account_id": 4})")
            .status,
        200);

    const auto adjusted = call(
        "POST",
        fmt::format("/expenses/{}/adjust", expenseId),
        R"({"new_amount": "90000", "description": "Descuento aplicado por el proveedor"})");
    ASSERT_EQ(adjusted.status, 201) << adjusted.body;
    const auto record = parse(adjusted);
    EXPECT_EQ(str(record["reason"]), "amount_correction");
    EXPECT_EQ(json::getDecimal(record["adjustment_delta"]), -10'000_dec);
    EXPECT_EQ(str(record["adjusted_by"]), "api");
    EXPECT_EQ(json::getDecimal(record["new_amount_paid"]), 60'000_dec);
    EXPECT_EQ(balanceOf(kBank), 940'000_dec);

    const auto noChange = call(
        "POST",
        fmt::format("/expenses/{}/adjust", expenseId),
        R"({"new_amount": "90000", "description": "Descuento aplicado por el proveedor"})");
    EXPECT_EQ(noChange.status, 422);
    EXPECT_EQ(str(parse(noChange)["error"]), "no_change_requested");

    const auto refund = call(
        "POST",
        fmt::format("/expenses/{}/refund", expenseId),
        R"({"amount": "5000", "description": "Devolucion de una prenda", "adjusted_by": "maria"})");
    ASSERT_EQ(refund.status, 201) << refund.body;
    EXPECT_EQ(balanceOf(kBank), 945'000_dec);

    const auto history = parse(call("GET", fmt::format("/expenses/{}/adjustments", expenseId)));
    ASSERT_EQ(history.Size(), 2);
    EXPECT_EQ(str(history[1]["adjusted_by"]), "maria");

    const auto all = parse(call("GET", "/adjustments?reason=partial_refund"));
    EXPECT_EQ(json::getUint(all["total"]), 1);

    const auto reverted = call(
        "POST",
        fmt::format("/expenses/{}/revert", expenseId),
        R"({"description": "Pago registrado por error"})");
    ASSERT_EQ(reverted.status, 201) << reverted.body;
    EXPECT_EQ(balanceOf(kBank), 1'000'000_dec);
    EXPECT_EQ(call("GET", "/expenses/77/adjustments").status, 404);
}

//-------------------------------------------------------------------------

TEST_F(LedgerApiTest, DebtRoutes)
{
    const auto created = call(
        "POST",
        "/receivables",
        R"({"description": "Uniformes colegio", "amount": "450000", "counterparty": "Colegio San Jose", "due_date": "2026-02-20", "invoice_date": "2026-02-01"})");
    ASSERT_EQ(created.status, 201) << created.body;
    const auto debt = parse(created);
    EXPECT_TRUE(debt["is_overdue"].GetBool());
    EXPECT_EQ(json::getUint(debt["days_overdue"]), 9);

    EXPECT_EQ(call("GET", "/receivables/1").status, 200);
    EXPECT_EQ(call("GET", "/payables/1").status, 404);
    EXPECT_EQ(
        call("POST", "/payables", R"({"description": "Tela", "amount": "1000"})").status, 422);

    const auto paid = call("POST", "/receivables/1/pay", R"({"amount": "50000", "account_id": 4})");
    ASSERT_EQ(paid.status, 200) << paid.body;
    EXPECT_EQ(json::getDecimal(parse(paid)["balance"]), 400'000_dec);
    EXPECT_EQ(balanceOf(kBank), 1'050'000_dec);

    const auto totals = parse(call("GET", "/receivables/totals"));
    EXPECT_EQ(json::getDecimal(totals["pending_total"]), 400'000_dec);
    EXPECT_EQ(json::getDecimal(totals["overdue_total"]), 400'000_dec);

    EXPECT_EQ(parse(call("GET", "/receivables?pending_only=true")).Size(), 1);
}

TEST_F(LedgerApiTest, PatrimonyAndInventory)
{
    const auto inventory = call("GET", "/inventory");
    ASSERT_EQ(inventory.status, 200);
    EXPECT_EQ(json::getDecimal(parse(inventory)["total_value"]), 18'000_dec);

    const auto patrimony = call("GET", "/patrimony");
    ASSERT_EQ(patrimony.status, 200) << patrimony.body;
    const auto json = parse(patrimony);
    EXPECT_EQ(json::getDecimal(json["summary"]["net_patrimony"]), 5'498'000_dec);
    EXPECT_TRUE(json["summary"]["is_positive"].GetBool());
    EXPECT_EQ(json::getDecimal(json["assets"]["cash_and_bank"]["total_liquid"]), 1'280'000_dec);
    EXPECT_EQ(json["equity_accounts"].Size(), 1);

    const auto cash = parse(call("GET", "/cash-balances"));
    EXPECT_EQ(json::getDecimal(cash["total_cash"]), 250'000_dec);
}

//-------------------------------------------------------------------------
