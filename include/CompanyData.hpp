#pragma once

#include "ValuationTypes.hpp"
#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// Данные компании для локальных источников
// ═══════════════════════════════════════════════════════════════════════════════

struct CompanyData {
    std::string ticker;
    std::string name;
    MarketSnapshot snapshot;

    // От нового периода к старому
    std::vector<RawStatementPeriod> statements;

    // Метка сегмента -> выручка по периодам (от нового к старому)
    std::map<std::string, std::vector<SegmentRevenuePoint>> segments;
};

// Упорядочить ряды от нового периода к старому по метке периода.
// Метки сравниваются как строки (ISO-даты и годы сортируются корректно).
inline void sortNewestFirst(CompanyData& company) {
    std::sort(company.statements.begin(), company.statements.end(),
              [](const auto& a, const auto& b) { return a.periodLabel > b.periodLabel; });

    for (auto& [label, points] : company.segments) {
        std::sort(points.begin(), points.end(),
                  [](const auto& a, const auto& b) { return a.periodLabel > b.periodLabel; });
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Числовые поля отчетности (общие для JSON и SQLite)
// ═══════════════════════════════════════════════════════════════════════════════

struct StatementField {
    const char* name;
    double RawStatementPeriod::*member;
};

inline constexpr StatementField kStatementFields[] = {
    {"revenue", &RawStatementPeriod::revenue},
    {"gross_profit", &RawStatementPeriod::grossProfit},
    {"operating_income", &RawStatementPeriod::operatingIncome},
    {"net_income", &RawStatementPeriod::netIncome},
    {"research_and_development", &RawStatementPeriod::researchAndDevelopment},
    {"income_tax_expense", &RawStatementPeriod::incomeTaxExpense},
    {"interest_expense", &RawStatementPeriod::interestExpense},
    {"total_debt", &RawStatementPeriod::totalDebt},
    {"total_assets", &RawStatementPeriod::totalAssets},
    {"total_liabilities", &RawStatementPeriod::totalLiabilities},
    {"shareholders_equity", &RawStatementPeriod::shareholdersEquity},
    {"current_assets", &RawStatementPeriod::currentAssets},
    {"current_liabilities", &RawStatementPeriod::currentLiabilities},
    {"cash_and_equivalents", &RawStatementPeriod::cashAndEquivalents},
    {"receivables", &RawStatementPeriod::receivables},
    {"operating_cash_flow", &RawStatementPeriod::operatingCashFlow},
    {"capital_expenditure", &RawStatementPeriod::capitalExpenditure},
    {"shares_outstanding", &RawStatementPeriod::sharesOutstanding},
};

}  // namespace ipvalue
