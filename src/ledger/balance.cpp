#include <sitebook/ledger/balance.hpp>

#include <algorithm>

namespace sitebook::ledger {

    TypeTotals accumulate(const std::vector<Transaction> &txs) {
        TypeTotals t;
        for (const auto &tx : txs) {
            const TxTypeTraits &kind = traits(tx.type);
            const bool inbound = kind.sign > 0;
            Money base = tx.amount_in_base;

            if (kind.role == TxRole::Invoice) {
                (inbound ? t.invoice_out : t.invoice_in) += base;
                continue;
            }

            Money allocated = std::min(tx.allocated_amount, base);
            Money independent = std::max<Money>(0, base - allocated);
            if (inbound) {
                t.payment_in += base;
                t.allocated_payment_in += allocated;
                t.independent_payment_in += independent;
            } else {
                t.payment_out += base;
                t.allocated_payment_out += allocated;
                t.independent_payment_out += independent;
            }
        }
        return t;
    }

    CompanyLedger calculateCompanyLedger(const std::vector<Transaction> &txs) {
        TypeTotals t = accumulate(txs);
        CompanyLedger out;
        out.receivable = t.invoice_out - t.payment_in;
        out.payable = t.invoice_in - t.payment_out;
        out.balance = out.receivable - out.payable;
        return out;
    }

    ProjectLedger calculateProjectLedger(const std::vector<Transaction> &txs, Ownership ownership,
                                         std::optional<Money> estimated_budget) {
        TypeTotals t = accumulate(txs);
        ProjectLedger out;
        out.ownership = ownership;
        out.total_invoice_out = t.invoice_out;
        out.total_invoice_in = t.invoice_in;
        out.total_payment_in = t.payment_in;
        out.total_payment_out = t.payment_out;
        out.independent_payment_in = t.independent_payment_in;
        out.independent_payment_out = t.independent_payment_out;
        out.total_income = t.invoice_out + t.independent_payment_in;
        out.total_expense = t.invoice_in + t.independent_payment_out;
        out.profit = out.total_income - out.total_expense;
        out.project_debt = std::max<Money>(0, t.invoice_in - t.allocated_payment_out);
        out.client_receivable = std::max<Money>(0, t.invoice_out - t.allocated_payment_in);

        if (estimated_budget) {
            if (*estimated_budget > 0)
                out.budget_used_percent =
                    static_cast<double>(out.total_expense) / static_cast<double>(*estimated_budget) * 100.0;
            out.estimated_profit = *estimated_budget - out.total_expense;
        }
        return out;
    }

    DashboardTotals calculateDashboardTotals(const std::vector<Transaction> &txs) {
        TypeTotals t = accumulate(txs);
        DashboardTotals out;
        out.income = t.invoice_out;
        out.expense = t.invoice_in;
        out.net_profit = out.income - out.expense;
        out.collected = t.payment_in;
        out.paid = t.payment_out;
        return out;
    }

    TransactionTotals calculateTransactionTotals(const std::vector<Transaction> &txs) {
        TypeTotals t = accumulate(txs);
        TransactionTotals out;
        out.total_income = t.invoice_out + t.payment_in;
        out.total_expense = t.invoice_in + t.payment_out;
        out.net_profit = t.invoice_out - t.invoice_in;
        out.net_cash_flow = t.payment_in - t.payment_out;
        out.net_balance = out.total_income - out.total_expense;
        return out;
    }

} // namespace sitebook::ledger
