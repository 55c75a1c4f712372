#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <sitebook/ledger/types.hpp>

namespace sitebook::ledger {

    // ===========================================
    // Balance roll-ups over transaction rows
    // ===========================================
    //
    // All amounts are base currency. The legacy invoice link plays no part here.

    /// Per-type base totals from a single pass
    struct TypeTotals {
        Money invoice_out = 0;
        Money invoice_in = 0;
        Money payment_in = 0;
        Money payment_out = 0;
        Money allocated_payment_in = 0;
        Money allocated_payment_out = 0;
        Money independent_payment_in = 0;  // unallocated remainder of each incoming payment
        Money independent_payment_out = 0; // unallocated remainder of each outgoing payment
    };

    struct CompanyLedger {
        Money receivable = 0;
        Money payable = 0;
        Money balance = 0;
    };

    struct ProjectLedger {
        Money total_invoice_out = 0;
        Money total_invoice_in = 0;
        Money total_payment_in = 0;
        Money total_payment_out = 0;
        Money independent_payment_in = 0;
        Money independent_payment_out = 0;
        Money total_income = 0;
        Money total_expense = 0;
        Money profit = 0;
        Money project_debt = 0;
        Money client_receivable = 0;
        std::optional<double> budget_used_percent;
        std::optional<Money> estimated_profit;
        Ownership ownership = Ownership::Own;
    };

    struct DashboardTotals {
        Money income = 0;
        Money expense = 0;
        Money net_profit = 0;
        Money collected = 0;
        Money paid = 0;
    };

    struct TransactionTotals {
        Money total_income = 0;
        Money total_expense = 0;
        Money net_profit = 0;
        Money net_cash_flow = 0;
        Money net_balance = 0;
    };

    /// Company list row: totals over every transaction naming the company, any scope
    struct CompanyBalance {
        Company company;
        TypeTotals totals;
        CompanyLedger ledger;
        std::int64_t transaction_count = 0;
    };

    struct ProjectSummary {
        Project project;
        std::string client_name; // empty for own projects
        ProjectLedger ledger;
        std::int64_t transaction_count = 0;
    };

    TypeTotals accumulate(const std::vector<Transaction> &txs);

    /// Full-payment view of what a company owes and is owed
    CompanyLedger calculateCompanyLedger(const std::vector<Transaction> &txs);

    /// Profit view of a project. Only unallocated payment amounts count as
    /// income or expense on top of the invoices.
    ProjectLedger calculateProjectLedger(const std::vector<Transaction> &txs, Ownership ownership,
                                         std::optional<Money> estimated_budget);

    DashboardTotals calculateDashboardTotals(const std::vector<Transaction> &txs);

    TransactionTotals calculateTransactionTotals(const std::vector<Transaction> &txs);

} // namespace sitebook::ledger
