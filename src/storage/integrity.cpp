#include <sitebook/storage/ledger_store.hpp>

namespace sitebook::storage {

    namespace {

        template <typename T> using Res = dp::Result<T, dp::Error>;

        /// Run a query whose rows are (record id, detail) and append one violation per row
        dp::Result<void, dp::Error> collectRule(SqliteStore &db, const std::string &rule, const std::string &sql,
                                                std::vector<IntegrityViolation> &out) {
            SqliteStore::Statement stmt(db, sql);
            if (!stmt.ok())
                return Res<void>::err(stmt.error());
            while (true) {
                auto row = stmt.step();
                if (row.is_err())
                    return Res<void>::err(row.error());
                if (!row.value())
                    break;
                out.push_back(IntegrityViolation{rule, stmt.int64(0), stmt.text(1)});
            }
            return Res<void>::ok();
        }

    } // namespace

    // ===========================================
    // Read-only invariant scan
    // ===========================================

    dp::Result<std::vector<IntegrityViolation>, dp::Error> LedgerStore::scanInvariants() {
        std::vector<IntegrityViolation> out;

        struct Rule {
            const char *name;
            const char *sql;
        };

        static const Rule kRules[] = {
            {"amount_positive",
             "SELECT id, 'amount ' || amount || ', rate ' || exchange_rate || ', base ' || amount_in_base "
             "FROM transactions WHERE amount <= 0 OR exchange_rate <= 0 OR amount_in_base <= 0"},
            {"invoice_over_allocated",
             "SELECT t.id, 'allocated ' || SUM(a.amount) || ' of ' || t.amount_in_base FROM transactions t "
             "JOIN payment_allocations a ON a.invoice_id = t.id "
             "WHERE t.type IN ('invoice_out', 'invoice_in') GROUP BY t.id HAVING SUM(a.amount) > t.amount_in_base"},
            {"payment_over_allocated",
             "SELECT t.id, 'allocated ' || SUM(a.amount) || ' of ' || t.amount_in_base FROM transactions t "
             "JOIN payment_allocations a ON a.payment_id = t.id "
             "WHERE t.type IN ('payment_in', 'payment_out') GROUP BY t.id HAVING SUM(a.amount) > t.amount_in_base"},
            {"scope_reference",
             "SELECT id, 'scope ' || scope || ' with company ' || IFNULL(company_id, '-') || ', project ' || "
             "IFNULL(project_id, '-') FROM transactions "
             "WHERE (scope = 'project' AND project_id IS NULL) OR (scope = 'cari' AND company_id IS NULL) "
             "OR (scope = 'company' AND project_id IS NOT NULL)"},
            {"allocation_direction",
             "SELECT a.id, p.type || ' ' || p.id || ' allocated to ' || i.type || ' ' || i.id "
             "FROM payment_allocations a JOIN transactions p ON p.id = a.payment_id "
             "JOIN transactions i ON i.id = a.invoice_id "
             "WHERE NOT ((p.type = 'payment_in' AND i.type = 'invoice_out') "
             "OR (p.type = 'payment_out' AND i.type = 'invoice_in')) OR a.amount <= 0"},
            {"client_project_company",
             "SELECT id, 'ownership ' || ownership || ' with client ' || IFNULL(client_company_id, '-') "
             "FROM projects WHERE (ownership = 'client') <> (client_company_id IS NOT NULL)"},
        };

        for (const auto &rule : kRules) {
            auto scanned = collectRule(db_, rule.name, rule.sql, out);
            if (scanned.is_err())
                return Res<std::vector<IntegrityViolation>>::err(scanned.error());
        }

        // Stored base amounts must match the rounding rule
        SqliteStore::Statement stmt(db_, "SELECT id, amount, exchange_rate, amount_in_base FROM transactions");
        if (!stmt.ok())
            return Res<std::vector<IntegrityViolation>>::err(stmt.error());
        while (true) {
            auto row = stmt.step();
            if (row.is_err())
                return Res<std::vector<IntegrityViolation>>::err(row.error());
            if (!row.value())
                break;
            Money expected = toBase(stmt.int64(1), stmt.int64(2));
            Money stored = stmt.int64(3);
            if (expected != stored) {
                out.push_back(IntegrityViolation{"amount_in_base_current", stmt.int64(0),
                                                 "stored " + std::to_string(stored) + ", expected " +
                                                     std::to_string(expected)});
            }
        }

        return Res<std::vector<IntegrityViolation>>::ok(std::move(out));
    }

} // namespace sitebook::storage
