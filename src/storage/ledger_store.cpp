#include <sitebook/storage/ledger_store.hpp>

#include <cstdio>
#include <iostream>

namespace sitebook::storage {

    namespace {

        template <typename T> using Res = dp::Result<T, dp::Error>;

        std::string trimmed(const std::string &s) {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        bool validOptionalDate(const std::string &s) { return s.empty() || isIsoDate(s); }

        constexpr const char *kCompanyColumns =
            "id, kind, role, name, national_id, tax_office, tax_number, contact_person, phone, email, address, "
            "bank_name, iban, notes, is_active, created_at, updated_at";

        constexpr const char *kProjectColumns =
            "id, code, name, ownership, client_company_id, status, estimated_budget, location, description, "
            "planned_start, planned_end, actual_start, actual_end, is_active, created_at, updated_at";

        constexpr const char *kTransactionSelect =
            "SELECT t.id, t.scope, t.company_id, t.project_id, t.type, t.category_id, t.date, t.description, "
            "t.amount, t.currency, t.exchange_rate, t.amount_in_base, t.document_no, t.notes, t.linked_invoice_id, "
            "t.created_at, t.updated_at, COALESCE(c.name, ''), "
            "CASE WHEN t.type IN ('payment_in', 'payment_out') "
            "THEN (SELECT COALESCE(SUM(a.amount), 0) FROM payment_allocations a WHERE a.payment_id = t.id) "
            "ELSE (SELECT COALESCE(SUM(a.amount), 0) FROM payment_allocations a WHERE a.invoice_id = t.id) END "
            "FROM transactions t LEFT JOIN companies c ON c.id = t.company_id";

        Company readCompany(SqliteStore::Statement &stmt) {
            Company c;
            c.id = stmt.int64(0);
            c.kind = parseCompanyKind(stmt.text(1)).value_or(CompanyKind::Organization);
            c.role = parseCompanyRole(stmt.text(2)).value_or(CompanyRole::Customer);
            c.name = stmt.text(3);
            c.national_id = stmt.text(4);
            c.tax_office = stmt.text(5);
            c.tax_number = stmt.text(6);
            c.contact_person = stmt.text(7);
            c.phone = stmt.text(8);
            c.email = stmt.text(9);
            c.address = stmt.text(10);
            c.bank_name = stmt.text(11);
            c.iban = stmt.text(12);
            c.notes = stmt.text(13);
            c.is_active = stmt.int64(14) != 0;
            c.created_at = stmt.int64(15);
            c.updated_at = stmt.int64(16);
            return c;
        }

        Project readProject(SqliteStore::Statement &stmt) {
            Project p;
            p.id = stmt.int64(0);
            p.code = stmt.text(1);
            p.name = stmt.text(2);
            p.ownership = parseOwnership(stmt.text(3)).value_or(Ownership::Own);
            p.client_company_id = stmt.optInt64(4);
            p.status = parseProjectStatus(stmt.text(5)).value_or(ProjectStatus::Planned);
            p.estimated_budget = stmt.optInt64(6);
            p.location = stmt.text(7);
            p.description = stmt.text(8);
            p.planned_start = stmt.text(9);
            p.planned_end = stmt.text(10);
            p.actual_start = stmt.text(11);
            p.actual_end = stmt.text(12);
            p.is_active = stmt.int64(13) != 0;
            p.created_at = stmt.int64(14);
            p.updated_at = stmt.int64(15);
            return p;
        }

        Transaction readTransaction(SqliteStore::Statement &stmt) {
            Transaction t;
            t.id = stmt.int64(0);
            t.scope = parseScope(stmt.text(1)).value_or(Scope::Cari);
            t.company_id = stmt.optInt64(2);
            t.project_id = stmt.optInt64(3);
            t.type = parseTxType(stmt.text(4)).value_or(TxType::InvoiceOut);
            t.category_id = stmt.optInt64(5);
            t.date = stmt.text(6);
            t.description = stmt.text(7);
            t.amount = stmt.int64(8);
            t.currency = parseCurrency(stmt.text(9)).value_or(Currency::Base);
            t.exchange_rate = stmt.int64(10);
            t.amount_in_base = stmt.int64(11);
            t.document_no = stmt.text(12);
            t.notes = stmt.text(13);
            t.legacy_invoice_id = stmt.optInt64(14);
            t.created_at = stmt.int64(15);
            t.updated_at = stmt.int64(16);
            t.company_name = stmt.text(17);
            t.allocated_amount = stmt.int64(18);
            return t;
        }

        Category readCategory(SqliteStore::Statement &stmt) {
            Category c;
            c.id = stmt.int64(0);
            c.name = stmt.text(1);
            c.type = parseCategoryType(stmt.text(2)).value_or(CategoryType::Payment);
            c.color = stmt.text(3);
            c.is_default = stmt.int64(4) != 0;
            return c;
        }

        // Collect every row of a prepared query through a reader
        template <typename T, typename Reader> Res<std::vector<T>> collect(SqliteStore::Statement &stmt, Reader read) {
            std::vector<T> out;
            while (true) {
                auto row = stmt.step();
                if (row.is_err())
                    return Res<std::vector<T>>::err(row.error());
                if (!row.value())
                    break;
                out.push_back(read(stmt));
            }
            return Res<std::vector<T>>::ok(std::move(out));
        }

        struct Param {
            bool is_text = false;
            int64_t number = 0;
            std::string text;
        };

        struct DefaultCategory {
            const char *name;
            const char *type;
            const char *color;
        };

        constexpr DefaultCategory kDefaultCategories[] = {
            {"Unit Sales", "invoice_out", "#22c55e"},
            {"Shop/Office Sales", "invoice_out", "#10b981"},
            {"Land Sales", "invoice_out", "#14b8a6"},
            {"Rental Income", "invoice_out", "#06b6d4"},
            {"Progress Billing", "invoice_out", "#3b82f6"},
            {"Service Income", "invoice_out", "#6366f1"},
            {"Other Income", "invoice_out", "#84cc16"},
            {"Land Cost", "invoice_in", "#ef4444"},
            {"Excavation", "invoice_in", "#f97316"},
            {"Concrete", "invoice_in", "#84cc16"},
            {"Rebar/Steel", "invoice_in", "#64748b"},
            {"Labour", "invoice_in", "#8b5cf6"},
            {"Formwork/Scaffolding", "invoice_in", "#a855f7"},
            {"Electrical Materials", "invoice_in", "#eab308"},
            {"Plumbing", "invoice_in", "#06b6d4"},
            {"Paint/Coating", "invoice_in", "#ec4899"},
            {"Tiling", "invoice_in", "#14b8a6"},
            {"Doors/Windows", "invoice_in", "#f59e0b"},
            {"Roofing/Insulation", "invoice_in", "#78716c"},
            {"Landscaping", "invoice_in", "#22c55e"},
            {"Design/Permits", "invoice_in", "#6366f1"},
            {"Subcontractor Invoice", "invoice_in", "#0ea5e9"},
            {"Transport", "invoice_in", "#f43f5e"},
            {"Office Rent", "invoice_in", "#ef4444"},
            {"Utilities", "invoice_in", "#f97316"},
            {"Payroll", "invoice_in", "#8b5cf6"},
            {"Social Security", "invoice_in", "#a855f7"},
            {"Tax", "invoice_in", "#ef4444"},
            {"Accounting/Consulting", "invoice_in", "#6366f1"},
            {"Vehicle Expenses", "invoice_in", "#64748b"},
            {"Other Expense", "invoice_in", "#71717a"},
            {"Cash", "payment", "#22c55e"},
            {"Bank Transfer", "payment", "#3b82f6"},
            {"Cheque", "payment", "#f59e0b"},
            {"Promissory Note", "payment", "#f97316"},
            {"Credit Card", "payment", "#8b5cf6"},
            {"Offset", "payment", "#64748b"},
        };

    } // namespace

    LedgerStore::LedgerStore(SqliteStore &db, LedgerConfig config) : db_(db), config_(std::move(config)) {}

    // ===========================================
    // Schema
    // ===========================================

    std::vector<Migration> LedgerStore::schemaMigrations(const LedgerConfig &config) {
        std::vector<Migration> migrations;

        migrations.push_back(Migration{1,
                                       "create_core_tables",
                                       {R"(
            CREATE TABLE IF NOT EXISTS companies (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                kind TEXT NOT NULL CHECK(kind IN ('person', 'company')),
                role TEXT NOT NULL CHECK(role IN ('customer', 'supplier', 'subcontractor', 'investor')),
                name TEXT NOT NULL CHECK(length(name) > 0),
                national_id TEXT NOT NULL DEFAULT '',
                tax_office TEXT NOT NULL DEFAULT '',
                tax_number TEXT NOT NULL DEFAULT '',
                contact_person TEXT NOT NULL DEFAULT '',
                phone TEXT NOT NULL DEFAULT '',
                email TEXT NOT NULL DEFAULT '',
                address TEXT NOT NULL DEFAULT '',
                bank_name TEXT NOT NULL DEFAULT '',
                iban TEXT NOT NULL DEFAULT '',
                notes TEXT NOT NULL DEFAULT '',
                is_active INTEGER NOT NULL DEFAULT 1,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )",
                                        R"(
            CREATE TABLE IF NOT EXISTS projects (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                code TEXT NOT NULL UNIQUE,
                name TEXT NOT NULL CHECK(length(name) > 0),
                ownership TEXT NOT NULL CHECK(ownership IN ('own', 'client')),
                client_company_id INTEGER REFERENCES companies(id),
                status TEXT NOT NULL DEFAULT 'planned'
                    CHECK(status IN ('planned', 'active', 'completed', 'cancelled')),
                estimated_budget INTEGER CHECK(estimated_budget IS NULL OR estimated_budget >= 0),
                location TEXT NOT NULL DEFAULT '',
                description TEXT NOT NULL DEFAULT '',
                planned_start TEXT NOT NULL DEFAULT '',
                planned_end TEXT NOT NULL DEFAULT '',
                actual_start TEXT NOT NULL DEFAULT '',
                actual_end TEXT NOT NULL DEFAULT '',
                is_active INTEGER NOT NULL DEFAULT 1,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                CHECK((ownership = 'client') = (client_company_id IS NOT NULL))
            )
        )",
                                        R"(
            CREATE TABLE IF NOT EXISTS categories (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL,
                type TEXT NOT NULL CHECK(type IN ('invoice_out', 'invoice_in', 'payment')),
                color TEXT NOT NULL DEFAULT '#6366f1',
                is_default INTEGER NOT NULL DEFAULT 0,
                created_at INTEGER NOT NULL DEFAULT 0
            )
        )",
                                        R"(
            CREATE TABLE IF NOT EXISTS transactions (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                scope TEXT NOT NULL CHECK(scope IN ('cari', 'project', 'company')),
                company_id INTEGER REFERENCES companies(id),
                project_id INTEGER REFERENCES projects(id),
                type TEXT NOT NULL CHECK(type IN ('invoice_out', 'payment_in', 'invoice_in', 'payment_out')),
                category_id INTEGER REFERENCES categories(id) ON DELETE SET NULL,
                date TEXT NOT NULL,
                description TEXT NOT NULL,
                amount INTEGER NOT NULL CHECK(amount > 0),
                currency TEXT NOT NULL DEFAULT 'base' CHECK(currency IN ('base', 'alt1', 'alt2')),
                exchange_rate INTEGER NOT NULL DEFAULT 1000000 CHECK(exchange_rate > 0),
                amount_in_base INTEGER NOT NULL CHECK(amount_in_base > 0),
                document_no TEXT NOT NULL DEFAULT '',
                notes TEXT NOT NULL DEFAULT '',
                linked_invoice_id INTEGER REFERENCES transactions(id) ON DELETE SET NULL,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                CHECK(scope <> 'project' OR project_id IS NOT NULL),
                CHECK(scope <> 'cari' OR company_id IS NOT NULL),
                CHECK(scope <> 'company' OR project_id IS NULL)
            )
        )",
                                        R"(
            CREATE TABLE IF NOT EXISTS trash (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                kind TEXT NOT NULL CHECK(kind IN ('company', 'project', 'transaction')),
                label TEXT NOT NULL,
                snapshot BLOB NOT NULL,
                digest TEXT NOT NULL,
                deleted_at INTEGER NOT NULL
            )
        )",
                                        "CREATE INDEX IF NOT EXISTS idx_transactions_company ON transactions(company_id)",
                                        "CREATE INDEX IF NOT EXISTS idx_transactions_project ON transactions(project_id)",
                                        "CREATE INDEX IF NOT EXISTS idx_transactions_date ON transactions(date)",
                                        "CREATE INDEX IF NOT EXISTS idx_transactions_type ON transactions(type)",
                                        "CREATE INDEX IF NOT EXISTS idx_transactions_category ON transactions(category_id)",
                                        "CREATE INDEX IF NOT EXISTS idx_transactions_linked ON transactions(linked_invoice_id)",
                                        "CREATE INDEX IF NOT EXISTS idx_projects_client ON projects(client_company_id)",
                                        "CREATE INDEX IF NOT EXISTS idx_companies_name ON companies(name)"}});

        migrations.push_back(Migration{2,
                                       "create_payment_allocations",
                                       {R"(
            CREATE TABLE IF NOT EXISTS payment_allocations (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                payment_id INTEGER NOT NULL REFERENCES transactions(id) ON DELETE CASCADE,
                invoice_id INTEGER NOT NULL REFERENCES transactions(id) ON DELETE CASCADE,
                amount INTEGER NOT NULL CHECK(amount > 0),
                created_at INTEGER NOT NULL,
                UNIQUE(payment_id, invoice_id)
            )
        )",
                                        "CREATE INDEX IF NOT EXISTS idx_allocations_payment ON payment_allocations(payment_id)",
                                        "CREATE INDEX IF NOT EXISTS idx_allocations_invoice ON payment_allocations(invoice_id)",
                                        // Legacy single-invoice links become allocation rows
                                        R"(
            INSERT OR IGNORE INTO payment_allocations (payment_id, invoice_id, amount, created_at)
            SELECT p.id, p.linked_invoice_id, MIN(p.amount_in_base, i.amount_in_base), p.created_at
            FROM transactions p
            JOIN transactions i ON i.id = p.linked_invoice_id
            WHERE p.type IN ('payment_in', 'payment_out')
              AND ((p.type = 'payment_in' AND i.type = 'invoice_out')
                OR (p.type = 'payment_out' AND i.type = 'invoice_in'))
        )"}});

        Migration seed{3, "seed_default_categories", {}};
        if (config.seed_default_categories) {
            std::string values;
            for (const auto &cat : kDefaultCategories) {
                if (!values.empty())
                    values += ", ";
                values += std::string("('") + cat.name + "', '" + cat.type + "', '" + cat.color + "')";
            }
            seed.statements.push_back("INSERT INTO categories (name, type, color, is_default, created_at) "
                                      "SELECT column1, column2, column3, 1, CAST(strftime('%s', 'now') AS INTEGER) "
                                      "FROM (VALUES " +
                                      values + ") WHERE NOT EXISTS (SELECT 1 FROM categories)");
        }
        migrations.push_back(std::move(seed));

        return migrations;
    }

    dp::Result<void, dp::Error> LedgerStore::initializeSchema() { return db_.migrate(schemaMigrations(config_)); }

    // ===========================================
    // Generic row queries
    // ===========================================

    dp::Result<std::vector<Company>, dp::Error> LedgerStore::queryCompanies(const std::string &where,
                                                                            const std::vector<int64_t> &params) {
        SqliteStore::Statement stmt(db_, std::string("SELECT ") + kCompanyColumns + " FROM companies WHERE " + where +
                                             " ORDER BY name COLLATE NOCASE, id");
        if (!stmt.ok())
            return Res<std::vector<Company>>::err(stmt.error());
        for (size_t i = 0; i < params.size(); ++i)
            stmt.bind(static_cast<int>(i + 1), params[i]);
        return collect<Company>(stmt, readCompany);
    }

    dp::Result<std::vector<Project>, dp::Error> LedgerStore::queryProjects(const std::string &where,
                                                                           const std::vector<int64_t> &params) {
        SqliteStore::Statement stmt(db_, std::string("SELECT ") + kProjectColumns + " FROM projects WHERE " + where +
                                             " ORDER BY code, id");
        if (!stmt.ok())
            return Res<std::vector<Project>>::err(stmt.error());
        for (size_t i = 0; i < params.size(); ++i)
            stmt.bind(static_cast<int>(i + 1), params[i]);
        return collect<Project>(stmt, readProject);
    }

    dp::Result<std::vector<Transaction>, dp::Error> LedgerStore::queryTransactions(const std::string &where,
                                                                                   const std::vector<int64_t> &params) {
        SqliteStore::Statement stmt(db_, std::string(kTransactionSelect) + " WHERE " + where + " ORDER BY t.date, t.id");
        if (!stmt.ok())
            return Res<std::vector<Transaction>>::err(stmt.error());
        for (size_t i = 0; i < params.size(); ++i)
            stmt.bind(static_cast<int>(i + 1), params[i]);
        return collect<Transaction>(stmt, readTransaction);
    }

    // ===========================================
    // Companies
    // ===========================================

    dp::Result<void, dp::Error> LedgerStore::insertCompanyRow(const Company &c) {
        SqliteStore::Statement stmt(db_, std::string("INSERT INTO companies (") + kCompanyColumns +
                                             ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!stmt.ok())
            return Res<void>::err(stmt.error());
        if (c.id > 0)
            stmt.bind(1, c.id);
        else
            stmt.bindNull(1);
        stmt.bind(2, toString(c.kind))
            .bind(3, toString(c.role))
            .bind(4, c.name)
            .bind(5, c.national_id)
            .bind(6, c.tax_office)
            .bind(7, c.tax_number)
            .bind(8, c.contact_person)
            .bind(9, c.phone)
            .bind(10, c.email)
            .bind(11, c.address)
            .bind(12, c.bank_name)
            .bind(13, c.iban)
            .bind(14, c.notes)
            .bind(15, static_cast<int64_t>(c.is_active ? 1 : 0))
            .bind(16, c.created_at)
            .bind(17, c.updated_at);
        return stmt.run();
    }

    dp::Result<Company, dp::Error> LedgerStore::createCompany(const CompanyInput &input) {
        Company c;
        c.kind = input.kind;
        c.role = input.role;
        c.name = trimmed(input.name);
        c.national_id = input.national_id;
        c.tax_office = input.tax_office;
        c.tax_number = input.tax_number;
        c.contact_person = input.contact_person;
        c.phone = input.phone;
        c.email = input.email;
        c.address = input.address;
        c.bank_name = input.bank_name;
        c.iban = input.iban;
        c.notes = input.notes;
        c.created_at = c.updated_at = currentTimestamp();

        if (c.name.empty())
            return Res<Company>::err(validation_error("Company name is required"));

        SqliteStore::Savepoint sp(db_);
        if (!sp.ok())
            return Res<Company>::err(storage_error("Cannot open savepoint"));
        auto inserted = insertCompanyRow(c);
        if (inserted.is_err())
            return Res<Company>::err(inserted.error());
        Id id = db_.lastInsertId();
        auto released = sp.release();
        if (released.is_err())
            return Res<Company>::err(released.error());

        markDirty();
        return getCompany(id);
    }

    dp::Result<Company, dp::Error> LedgerStore::updateCompany(Id id, const CompanyPatch &patch) {
        auto existing = getCompany(id);
        if (existing.is_err())
            return existing;

        Company c = existing.value();
        if (patch.kind)
            c.kind = *patch.kind;
        if (patch.role)
            c.role = *patch.role;
        if (patch.name)
            c.name = trimmed(*patch.name);
        if (patch.national_id)
            c.national_id = *patch.national_id;
        if (patch.tax_office)
            c.tax_office = *patch.tax_office;
        if (patch.tax_number)
            c.tax_number = *patch.tax_number;
        if (patch.contact_person)
            c.contact_person = *patch.contact_person;
        if (patch.phone)
            c.phone = *patch.phone;
        if (patch.email)
            c.email = *patch.email;
        if (patch.address)
            c.address = *patch.address;
        if (patch.bank_name)
            c.bank_name = *patch.bank_name;
        if (patch.iban)
            c.iban = *patch.iban;
        if (patch.notes)
            c.notes = *patch.notes;
        if (patch.is_active)
            c.is_active = *patch.is_active;

        if (c.name.empty())
            return Res<Company>::err(validation_error("Company name is required"));

        SqliteStore::Savepoint sp(db_);
        if (!sp.ok())
            return Res<Company>::err(storage_error("Cannot open savepoint"));

        SqliteStore::Statement stmt(db_, "UPDATE companies SET kind = ?, role = ?, name = ?, national_id = ?, "
                                         "tax_office = ?, tax_number = ?, contact_person = ?, phone = ?, email = ?, "
                                         "address = ?, bank_name = ?, iban = ?, notes = ?, is_active = ?, "
                                         "updated_at = ? WHERE id = ?");
        if (!stmt.ok())
            return Res<Company>::err(stmt.error());
        stmt.bind(1, toString(c.kind))
            .bind(2, toString(c.role))
            .bind(3, c.name)
            .bind(4, c.national_id)
            .bind(5, c.tax_office)
            .bind(6, c.tax_number)
            .bind(7, c.contact_person)
            .bind(8, c.phone)
            .bind(9, c.email)
            .bind(10, c.address)
            .bind(11, c.bank_name)
            .bind(12, c.iban)
            .bind(13, c.notes)
            .bind(14, static_cast<int64_t>(c.is_active ? 1 : 0))
            .bind(15, currentTimestamp())
            .bind(16, id);
        auto updated = stmt.run();
        if (updated.is_err())
            return Res<Company>::err(updated.error());
        auto released = sp.release();
        if (released.is_err())
            return Res<Company>::err(released.error());

        markDirty();
        return getCompany(id);
    }

    dp::Result<Company, dp::Error> LedgerStore::getCompany(Id id) {
        auto rows = queryCompanies("id = ?", {id});
        if (rows.is_err())
            return Res<Company>::err(rows.error());
        if (rows.value().empty())
            return Res<Company>::err(not_found_error("Company " + std::to_string(id) + " not found"));
        return Res<Company>::ok(rows.value().front());
    }

    dp::Result<std::vector<Company>, dp::Error> LedgerStore::listCompanies(bool include_inactive) {
        return queryCompanies(include_inactive ? "1 = 1" : "is_active = 1", {});
    }

    dp::Result<RelatedCounts, dp::Error> LedgerStore::relatedCounts(Id company_id) {
        auto company = getCompany(company_id);
        if (company.is_err())
            return Res<RelatedCounts>::err(company.error());

        RelatedCounts counts;
        SqliteStore::Statement tx(db_, "SELECT COUNT(*) FROM transactions WHERE company_id = ?");
        SqliteStore::Statement pr(db_, "SELECT COUNT(*) FROM projects WHERE client_company_id = ? AND is_active = 1");
        if (!tx.ok())
            return Res<RelatedCounts>::err(tx.error());
        if (!pr.ok())
            return Res<RelatedCounts>::err(pr.error());
        tx.bind(1, company_id);
        pr.bind(1, company_id);
        auto r1 = tx.step();
        auto r2 = pr.step();
        if (r1.is_err())
            return Res<RelatedCounts>::err(r1.error());
        if (r2.is_err())
            return Res<RelatedCounts>::err(r2.error());
        counts.transactions = tx.int64(0);
        counts.client_projects = pr.int64(0);
        return Res<RelatedCounts>::ok(counts);
    }

    dp::Result<void, dp::Error> LedgerStore::checkActiveCompany(Id id) {
        auto company = getCompany(id);
        if (company.is_err())
            return Res<void>::err(company.error());
        if (!company.value().is_active)
            return Res<void>::err(constraint_violation("Referenced company " + company.value().name + " is inactive"));
        return Res<void>::ok();
    }

    // ===========================================
    // Projects
    // ===========================================

    dp::Result<std::string, dp::Error> LedgerStore::generateProjectCode() {
        auto year = db_.queryInt64("SELECT CAST(strftime('%Y', 'now') AS INTEGER)");
        if (year.is_err())
            return Res<std::string>::err(year.error());

        std::string prefix = config_.project_code_prefix + "-" + std::to_string(year.value()) + "-";
        SqliteStore::Statement stmt(db_, "SELECT code FROM projects WHERE code LIKE ? ORDER BY code DESC LIMIT 1");
        if (!stmt.ok())
            return Res<std::string>::err(stmt.error());
        stmt.bind(1, prefix + "%");
        auto row = stmt.step();
        if (row.is_err())
            return Res<std::string>::err(row.error());

        long next = 1;
        if (row.value()) {
            std::string last = stmt.text(0).substr(prefix.size());
            try {
                next = std::stol(last) + 1;
            } catch (const std::exception &) {
                next = 1;
            }
        }
        char digits[16];
        std::snprintf(digits, sizeof(digits), "%03ld", next);
        return Res<std::string>::ok(prefix + digits);
    }

    dp::Result<void, dp::Error> LedgerStore::validateProject(const Project &p, std::optional<Id> self_id) {
        if (p.name.empty())
            return Res<void>::err(validation_error("Project name is required"));
        if (p.code.empty())
            return Res<void>::err(validation_error("Project code is required"));
        if (p.estimated_budget && *p.estimated_budget < 0)
            return Res<void>::err(validation_error("Estimated budget cannot be negative"));
        for (const auto *date : {&p.planned_start, &p.planned_end, &p.actual_start, &p.actual_end}) {
            if (!validOptionalDate(*date))
                return Res<void>::err(validation_error("Project dates must be YYYY-MM-DD"));
        }

        if (p.ownership == Ownership::Client) {
            if (!p.client_company_id)
                return Res<void>::err(constraint_violation("A client project requires a client company"));
            auto company = getCompany(*p.client_company_id);
            if (company.is_err())
                return Res<void>::err(company.error());
        } else if (p.client_company_id) {
            return Res<void>::err(constraint_violation("An own project cannot have a client company"));
        }

        SqliteStore::Statement stmt(db_, "SELECT id FROM projects WHERE code = ? AND id <> ?");
        if (!stmt.ok())
            return Res<void>::err(stmt.error());
        stmt.bind(1, p.code).bind(2, self_id.value_or(0));
        auto row = stmt.step();
        if (row.is_err())
            return Res<void>::err(row.error());
        if (row.value())
            return Res<void>::err(constraint_violation("Project code " + p.code + " is already in use"));
        return Res<void>::ok();
    }

    dp::Result<void, dp::Error> LedgerStore::insertProjectRow(const Project &p) {
        SqliteStore::Statement stmt(db_, std::string("INSERT INTO projects (") + kProjectColumns +
                                             ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!stmt.ok())
            return Res<void>::err(stmt.error());
        if (p.id > 0)
            stmt.bind(1, p.id);
        else
            stmt.bindNull(1);
        stmt.bind(2, p.code)
            .bind(3, p.name)
            .bind(4, toString(p.ownership))
            .bind(5, p.client_company_id)
            .bind(6, toString(p.status))
            .bind(7, p.estimated_budget)
            .bind(8, p.location)
            .bind(9, p.description)
            .bind(10, p.planned_start)
            .bind(11, p.planned_end)
            .bind(12, p.actual_start)
            .bind(13, p.actual_end)
            .bind(14, static_cast<int64_t>(p.is_active ? 1 : 0))
            .bind(15, p.created_at)
            .bind(16, p.updated_at);
        return stmt.run();
    }

    dp::Result<Project, dp::Error> LedgerStore::createProject(const ProjectInput &input) {
        Project p;
        p.code = trimmed(input.code);
        p.name = trimmed(input.name);
        p.ownership = input.ownership;
        p.client_company_id = input.client_company_id;
        p.status = input.status;
        p.estimated_budget = input.estimated_budget;
        p.location = input.location;
        p.description = input.description;
        p.planned_start = input.planned_start;
        p.planned_end = input.planned_end;
        p.actual_start = input.actual_start;
        p.actual_end = input.actual_end;
        p.created_at = p.updated_at = currentTimestamp();

        if (p.code.empty()) {
            auto code = generateProjectCode();
            if (code.is_err())
                return Res<Project>::err(code.error());
            p.code = code.value();
        }

        auto valid = validateProject(p, std::nullopt);
        if (valid.is_err())
            return Res<Project>::err(valid.error());

        SqliteStore::Savepoint sp(db_);
        if (!sp.ok())
            return Res<Project>::err(storage_error("Cannot open savepoint"));
        auto inserted = insertProjectRow(p);
        if (inserted.is_err())
            return Res<Project>::err(inserted.error());
        Id id = db_.lastInsertId();
        auto released = sp.release();
        if (released.is_err())
            return Res<Project>::err(released.error());

        markDirty();
        return getProject(id);
    }

    dp::Result<Project, dp::Error> LedgerStore::updateProject(Id id, const ProjectPatch &patch) {
        auto existing = getProject(id);
        if (existing.is_err())
            return existing;

        Project p = existing.value();
        if (patch.code)
            p.code = trimmed(*patch.code);
        if (patch.name)
            p.name = trimmed(*patch.name);
        if (patch.ownership) {
            p.ownership = *patch.ownership;
            if (p.ownership == Ownership::Own && !patch.client_company_id)
                p.client_company_id.reset();
        }
        if (patch.client_company_id)
            p.client_company_id = *patch.client_company_id;
        if (patch.status)
            p.status = *patch.status;
        if (patch.estimated_budget)
            p.estimated_budget = *patch.estimated_budget;
        if (patch.location)
            p.location = *patch.location;
        if (patch.description)
            p.description = *patch.description;
        if (patch.planned_start)
            p.planned_start = *patch.planned_start;
        if (patch.planned_end)
            p.planned_end = *patch.planned_end;
        if (patch.actual_start)
            p.actual_start = *patch.actual_start;
        if (patch.actual_end)
            p.actual_end = *patch.actual_end;
        if (patch.is_active)
            p.is_active = *patch.is_active;

        auto valid = validateProject(p, id);
        if (valid.is_err())
            return Res<Project>::err(valid.error());

        SqliteStore::Savepoint sp(db_);
        if (!sp.ok())
            return Res<Project>::err(storage_error("Cannot open savepoint"));

        SqliteStore::Statement stmt(db_, "UPDATE projects SET code = ?, name = ?, ownership = ?, client_company_id = ?, "
                                         "status = ?, estimated_budget = ?, location = ?, description = ?, "
                                         "planned_start = ?, planned_end = ?, actual_start = ?, actual_end = ?, "
                                         "is_active = ?, updated_at = ? WHERE id = ?");
        if (!stmt.ok())
            return Res<Project>::err(stmt.error());
        stmt.bind(1, p.code)
            .bind(2, p.name)
            .bind(3, toString(p.ownership))
            .bind(4, p.client_company_id)
            .bind(5, toString(p.status))
            .bind(6, p.estimated_budget)
            .bind(7, p.location)
            .bind(8, p.description)
            .bind(9, p.planned_start)
            .bind(10, p.planned_end)
            .bind(11, p.actual_start)
            .bind(12, p.actual_end)
            .bind(13, static_cast<int64_t>(p.is_active ? 1 : 0))
            .bind(14, currentTimestamp())
            .bind(15, id);
        auto updated = stmt.run();
        if (updated.is_err())
            return Res<Project>::err(updated.error());
        auto released = sp.release();
        if (released.is_err())
            return Res<Project>::err(released.error());

        markDirty();
        return getProject(id);
    }

    dp::Result<Project, dp::Error> LedgerStore::getProject(Id id) {
        auto rows = queryProjects("id = ?", {id});
        if (rows.is_err())
            return Res<Project>::err(rows.error());
        if (rows.value().empty())
            return Res<Project>::err(not_found_error("Project " + std::to_string(id) + " not found"));
        return Res<Project>::ok(rows.value().front());
    }

    dp::Result<std::vector<Project>, dp::Error> LedgerStore::listProjects(bool include_inactive) {
        return queryProjects(include_inactive ? "1 = 1" : "is_active = 1", {});
    }

    dp::Result<void, dp::Error> LedgerStore::checkActiveProject(Id id) {
        auto project = getProject(id);
        if (project.is_err())
            return Res<void>::err(project.error());
        if (!project.value().is_active)
            return Res<void>::err(constraint_violation("Referenced project " + project.value().code + " is inactive"));
        return Res<void>::ok();
    }

    // ===========================================
    // Categories
    // ===========================================

    dp::Result<Category, dp::Error> LedgerStore::createCategory(const CategoryInput &input) {
        std::string name = trimmed(input.name);
        if (name.empty())
            return Res<Category>::err(validation_error("Category name is required"));

        SqliteStore::Statement stmt(db_, "INSERT INTO categories (name, type, color, is_default, created_at) "
                                         "VALUES (?, ?, ?, 0, ?)");
        if (!stmt.ok())
            return Res<Category>::err(stmt.error());
        stmt.bind(1, name).bind(2, toString(input.type)).bind(3, input.color).bind(4, currentTimestamp());
        auto inserted = stmt.run();
        if (inserted.is_err())
            return Res<Category>::err(inserted.error());

        markDirty();
        return getCategory(db_.lastInsertId());
    }

    dp::Result<Category, dp::Error> LedgerStore::updateCategory(Id id, const CategoryPatch &patch) {
        auto existing = getCategory(id);
        if (existing.is_err())
            return existing;
        if (existing.value().is_default)
            return Res<Category>::err(constraint_violation("Default categories cannot be modified"));

        Category c = existing.value();
        if (patch.name)
            c.name = trimmed(*patch.name);
        if (patch.color)
            c.color = *patch.color;
        if (c.name.empty())
            return Res<Category>::err(validation_error("Category name is required"));

        SqliteStore::Statement stmt(db_, "UPDATE categories SET name = ?, color = ? WHERE id = ?");
        if (!stmt.ok())
            return Res<Category>::err(stmt.error());
        stmt.bind(1, c.name).bind(2, c.color).bind(3, id);
        auto updated = stmt.run();
        if (updated.is_err())
            return Res<Category>::err(updated.error());

        markDirty();
        return getCategory(id);
    }

    dp::Result<Category, dp::Error> LedgerStore::getCategory(Id id) {
        SqliteStore::Statement stmt(db_, "SELECT id, name, type, color, is_default FROM categories WHERE id = ?");
        if (!stmt.ok())
            return Res<Category>::err(stmt.error());
        stmt.bind(1, id);
        auto row = stmt.step();
        if (row.is_err())
            return Res<Category>::err(row.error());
        if (!row.value())
            return Res<Category>::err(not_found_error("Category " + std::to_string(id) + " not found"));
        return Res<Category>::ok(readCategory(stmt));
    }

    dp::Result<std::vector<Category>, dp::Error> LedgerStore::listCategories(std::optional<CategoryType> type) {
        std::string sql = "SELECT id, name, type, color, is_default FROM categories";
        if (type)
            sql += " WHERE type = ?";
        sql += " ORDER BY type, name";
        SqliteStore::Statement stmt(db_, sql);
        if (!stmt.ok())
            return Res<std::vector<Category>>::err(stmt.error());
        if (type)
            stmt.bind(1, toString(*type));
        return collect<Category>(stmt, readCategory);
    }

    dp::Result<void, dp::Error> LedgerStore::deleteCategory(Id id) {
        auto existing = getCategory(id);
        if (existing.is_err())
            return Res<void>::err(existing.error());
        if (existing.value().is_default)
            return Res<void>::err(constraint_violation("Default categories cannot be deleted"));

        SqliteStore::Savepoint sp(db_);
        if (!sp.ok())
            return Res<void>::err(storage_error("Cannot open savepoint"));

        SqliteStore::Statement detach(db_, "UPDATE transactions SET category_id = NULL WHERE category_id = ?");
        SqliteStore::Statement remove(db_, "DELETE FROM categories WHERE id = ?");
        if (!detach.ok())
            return Res<void>::err(detach.error());
        if (!remove.ok())
            return Res<void>::err(remove.error());
        detach.bind(1, id);
        remove.bind(1, id);
        auto r1 = detach.run();
        if (r1.is_err())
            return r1;
        auto r2 = remove.run();
        if (r2.is_err())
            return r2;
        auto released = sp.release();
        if (released.is_err())
            return released;

        markDirty();
        return Res<void>::ok();
    }

    // ===========================================
    // Transactions
    // ===========================================

    dp::Result<void, dp::Error> LedgerStore::validateTransaction(const Transaction &tx) {
        if (tx.amount <= 0)
            return Res<void>::err(validation_error("Amount must be positive"));
        if (tx.exchange_rate <= 0)
            return Res<void>::err(validation_error("Exchange rate must be positive"));
        if (tx.amount_in_base <= 0)
            return Res<void>::err(validation_error("Amount in base currency rounds to zero"));
        if (tx.description.empty())
            return Res<void>::err(validation_error("Description is required"));
        if (!isIsoDate(tx.date))
            return Res<void>::err(validation_error("Date must be YYYY-MM-DD"));

        switch (tx.scope) {
        case Scope::Project:
            if (!tx.project_id)
                return Res<void>::err(constraint_violation("Project-scope transactions require a project"));
            break;
        case Scope::Cari:
            if (!tx.company_id)
                return Res<void>::err(constraint_violation("Cari transactions require a company"));
            break;
        case Scope::Company:
            if (tx.project_id)
                return Res<void>::err(constraint_violation("Company-scope transactions cannot reference a project"));
            break;
        }

        if (tx.company_id) {
            auto active = checkActiveCompany(*tx.company_id);
            if (active.is_err())
                return active;
        }
        if (tx.project_id) {
            auto active = checkActiveProject(*tx.project_id);
            if (active.is_err())
                return active;
        }
        if (tx.category_id) {
            auto category = getCategory(*tx.category_id);
            if (category.is_err())
                return Res<void>::err(category.error());
            if (category.value().type != traits(tx.type).category)
                return Res<void>::err(constraint_violation("Category does not match the transaction type"));
        }
        return Res<void>::ok();
    }

    dp::Result<void, dp::Error> LedgerStore::insertTransactionRow(const Transaction &t) {
        SqliteStore::Statement stmt(db_, "INSERT INTO transactions (id, scope, company_id, project_id, type, "
                                         "category_id, date, description, amount, currency, exchange_rate, "
                                         "amount_in_base, document_no, notes, linked_invoice_id, created_at, "
                                         "updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!stmt.ok())
            return Res<void>::err(stmt.error());
        if (t.id > 0)
            stmt.bind(1, t.id);
        else
            stmt.bindNull(1);
        stmt.bind(2, toString(t.scope))
            .bind(3, t.company_id)
            .bind(4, t.project_id)
            .bind(5, toString(t.type))
            .bind(6, t.category_id)
            .bind(7, t.date)
            .bind(8, t.description)
            .bind(9, t.amount)
            .bind(10, toString(t.currency))
            .bind(11, t.exchange_rate)
            .bind(12, t.amount_in_base)
            .bind(13, t.document_no)
            .bind(14, t.notes)
            .bind(15, t.legacy_invoice_id)
            .bind(16, t.created_at)
            .bind(17, t.updated_at);
        return stmt.run();
    }

    dp::Result<Transaction, dp::Error> LedgerStore::createTransaction(const TransactionInput &input) {
        Transaction t;
        t.scope = input.scope;
        t.company_id = input.company_id;
        t.project_id = input.project_id;
        t.type = input.type;
        t.category_id = input.category_id;
        t.date = input.date;
        t.description = trimmed(input.description);
        t.amount = input.amount;
        t.currency = input.currency;
        t.exchange_rate = input.currency == Currency::Base ? kRateScale : input.exchange_rate.value_or(kRateScale);
        t.amount_in_base = toBase(t.amount, t.exchange_rate);
        t.document_no = input.document_no;
        t.notes = input.notes;
        t.created_at = t.updated_at = currentTimestamp();

        auto valid = validateTransaction(t);
        if (valid.is_err())
            return Res<Transaction>::err(valid.error());

        SqliteStore::Savepoint sp(db_);
        if (!sp.ok())
            return Res<Transaction>::err(storage_error("Cannot open savepoint"));
        auto inserted = insertTransactionRow(t);
        if (inserted.is_err())
            return Res<Transaction>::err(inserted.error());
        Id id = db_.lastInsertId();
        auto released = sp.release();
        if (released.is_err())
            return Res<Transaction>::err(released.error());

        markDirty();
        return getTransaction(id);
    }

    dp::Result<Transaction, dp::Error> LedgerStore::updateTransaction(Id id, const TransactionPatch &patch) {
        auto existing = getTransaction(id);
        if (existing.is_err())
            return existing;

        const Transaction &before = existing.value();
        Transaction t = before;
        if (patch.scope)
            t.scope = *patch.scope;
        if (patch.company_id)
            t.company_id = *patch.company_id;
        if (patch.project_id)
            t.project_id = *patch.project_id;
        if (patch.type)
            t.type = *patch.type;
        if (patch.category_id)
            t.category_id = *patch.category_id;
        if (patch.date)
            t.date = *patch.date;
        if (patch.description)
            t.description = trimmed(*patch.description);
        if (patch.amount)
            t.amount = *patch.amount;
        if (patch.currency)
            t.currency = *patch.currency;
        if (patch.exchange_rate)
            t.exchange_rate = *patch.exchange_rate;
        if (t.currency == Currency::Base)
            t.exchange_rate = kRateScale;
        t.amount_in_base = toBase(t.amount, t.exchange_rate);

        auto valid = validateTransaction(t);
        if (valid.is_err())
            return Res<Transaction>::err(valid.error());

        // Existing allocations must stay valid under the new values
        if (before.allocated_amount > 0) {
            if (t.type != before.type)
                return Res<Transaction>::err(
                    constraint_violation("Transaction type cannot change while allocations exist"));
            if (t.amount_in_base < before.allocated_amount) {
                return Res<Transaction>::err(constraint_violation(
                    isPayment(t.type) ? "Allocation exceeds payment amount"
                                      : "Allocation exceeds invoice remaining balance"));
            }
        }

        SqliteStore::Savepoint sp(db_);
        if (!sp.ok())
            return Res<Transaction>::err(storage_error("Cannot open savepoint"));

        SqliteStore::Statement stmt(db_, "UPDATE transactions SET scope = ?, company_id = ?, project_id = ?, "
                                         "type = ?, category_id = ?, date = ?, description = ?, amount = ?, "
                                         "currency = ?, exchange_rate = ?, amount_in_base = ?, document_no = ?, "
                                         "notes = ?, updated_at = ? WHERE id = ?");
        if (!stmt.ok())
            return Res<Transaction>::err(stmt.error());
        stmt.bind(1, toString(t.scope))
            .bind(2, t.company_id)
            .bind(3, t.project_id)
            .bind(4, toString(t.type))
            .bind(5, t.category_id)
            .bind(6, t.date)
            .bind(7, t.description)
            .bind(8, t.amount)
            .bind(9, toString(t.currency))
            .bind(10, t.exchange_rate)
            .bind(11, t.amount_in_base)
            .bind(12, t.document_no)
            .bind(13, t.notes)
            .bind(14, currentTimestamp())
            .bind(15, id);
        auto updated = stmt.run();
        if (updated.is_err())
            return Res<Transaction>::err(updated.error());
        auto released = sp.release();
        if (released.is_err())
            return Res<Transaction>::err(released.error());

        markDirty();
        return getTransaction(id);
    }

    dp::Result<Transaction, dp::Error> LedgerStore::getTransaction(Id id) {
        auto rows = queryTransactions("t.id = ?", {id});
        if (rows.is_err())
            return Res<Transaction>::err(rows.error());
        if (rows.value().empty())
            return Res<Transaction>::err(not_found_error("Transaction " + std::to_string(id) + " not found"));
        return Res<Transaction>::ok(rows.value().front());
    }

    dp::Result<std::vector<Transaction>, dp::Error> LedgerStore::listTransactions(const TransactionFilter &filter) {
        std::string sql = std::string(kTransactionSelect) + " WHERE 1 = 1";
        std::vector<Param> params;
        auto number = [&params](int64_t v) {
            Param p;
            p.number = v;
            params.push_back(p);
        };
        auto text = [&params](const std::string &v) {
            Param p;
            p.is_text = true;
            p.text = v;
            params.push_back(p);
        };

        if (filter.scope) {
            sql += " AND t.scope = ?";
            text(toString(*filter.scope));
        }
        if (filter.type) {
            sql += " AND t.type = ?";
            text(toString(*filter.type));
        }
        if (filter.company_id) {
            sql += " AND t.company_id = ?";
            number(*filter.company_id);
        }
        if (filter.project_id) {
            sql += " AND t.project_id = ?";
            number(*filter.project_id);
        }
        if (filter.start_date) {
            sql += " AND t.date >= ?";
            text(*filter.start_date);
        }
        if (filter.end_date) {
            sql += " AND t.date <= ?";
            text(*filter.end_date);
        }
        if (filter.search && !filter.search->empty()) {
            sql += " AND (t.description LIKE ? OR t.document_no LIKE ? OR c.name LIKE ?)";
            std::string pattern = "%" + *filter.search + "%";
            text(pattern);
            text(pattern);
            text(pattern);
        }
        sql += " ORDER BY t.date DESC, t.id DESC";
        if (filter.limit && *filter.limit > 0)
            sql += " LIMIT " + std::to_string(*filter.limit);

        SqliteStore::Statement stmt(db_, sql);
        if (!stmt.ok())
            return Res<std::vector<Transaction>>::err(stmt.error());
        for (size_t i = 0; i < params.size(); ++i) {
            int idx = static_cast<int>(i + 1);
            if (params[i].is_text)
                stmt.bind(idx, params[i].text);
            else
                stmt.bind(idx, params[i].number);
        }
        return collect<Transaction>(stmt, readTransaction);
    }

    // ===========================================
    // Allocation rows
    // ===========================================

    dp::Result<std::vector<OpenInvoice>, dp::Error> LedgerStore::openInvoices(Id entity_id, EntityKind entity,
                                                                              TxType invoice_type,
                                                                              std::optional<Id> exclude_payment) {
        if (!isInvoice(invoice_type))
            return Res<std::vector<OpenInvoice>>::err(validation_error("Open balances are kept for invoices only"));

        std::string column = entity == EntityKind::Project ? "t.project_id" : "t.company_id";
        SqliteStore::Statement stmt(
            db_, "SELECT * FROM (SELECT t.id, t.type, t.date, t.description, t.document_no, COALESCE(c.name, ''), "
                 "t.amount_in_base, "
                 "(SELECT COALESCE(SUM(a.amount), 0) FROM payment_allocations a "
                 " WHERE a.invoice_id = t.id AND (?1 IS NULL OR a.payment_id <> ?1)) AS allocated "
                 "FROM transactions t LEFT JOIN companies c ON c.id = t.company_id "
                 "WHERE " +
                     column + " = ?2 AND t.type = ?3) "
                              "WHERE amount_in_base - allocated > 0 ORDER BY date ASC, id ASC");
        if (!stmt.ok())
            return Res<std::vector<OpenInvoice>>::err(stmt.error());
        stmt.bind(1, exclude_payment).bind(2, entity_id).bind(3, toString(invoice_type));

        return collect<OpenInvoice>(stmt, [](SqliteStore::Statement &s) {
            OpenInvoice inv;
            inv.id = s.int64(0);
            inv.type = parseTxType(s.text(1)).value_or(TxType::InvoiceOut);
            inv.date = s.text(2);
            inv.description = s.text(3);
            inv.document_no = s.text(4);
            inv.company_name = s.text(5);
            inv.amount_in_base = s.int64(6);
            inv.allocated = s.int64(7);
            inv.remaining = inv.amount_in_base - inv.allocated;
            return inv;
        });
    }

    dp::Result<std::vector<PaymentAllocation>, dp::Error> LedgerStore::allocationRowsForPayment(Id payment_id) {
        return allocationsTouching({payment_id});
    }

    dp::Result<std::vector<PaymentAllocation>, dp::Error>
    LedgerStore::allocationsTouching(const std::vector<int64_t> &tx_ids) {
        if (tx_ids.empty())
            return Res<std::vector<PaymentAllocation>>::ok({});

        std::string list;
        for (auto id : tx_ids) {
            if (!list.empty())
                list += ", ";
            list += std::to_string(id);
        }
        SqliteStore::Statement stmt(db_, "SELECT id, payment_id, invoice_id, amount, created_at FROM payment_allocations "
                                         "WHERE payment_id IN (" +
                                             list + ") OR invoice_id IN (" + list + ") ORDER BY id");
        if (!stmt.ok())
            return Res<std::vector<PaymentAllocation>>::err(stmt.error());
        return collect<PaymentAllocation>(stmt, [](SqliteStore::Statement &s) {
            PaymentAllocation a;
            a.id = s.int64(0);
            a.payment_id = s.int64(1);
            a.invoice_id = s.int64(2);
            a.amount = s.int64(3);
            a.created_at = s.int64(4);
            return a;
        });
    }

    dp::Result<Money, dp::Error> LedgerStore::allocatedToInvoice(Id invoice_id, std::optional<Id> exclude_payment) {
        SqliteStore::Statement stmt(db_, "SELECT COALESCE(SUM(amount), 0) FROM payment_allocations "
                                         "WHERE invoice_id = ?1 AND (?2 IS NULL OR payment_id <> ?2)");
        if (!stmt.ok())
            return Res<Money>::err(stmt.error());
        stmt.bind(1, invoice_id).bind(2, exclude_payment);
        auto row = stmt.step();
        if (row.is_err())
            return Res<Money>::err(row.error());
        return Res<Money>::ok(stmt.int64(0));
    }

    dp::Result<Money, dp::Error> LedgerStore::allocatedFromPayment(Id payment_id) {
        SqliteStore::Statement stmt(db_, "SELECT COALESCE(SUM(amount), 0) FROM payment_allocations WHERE payment_id = ?");
        if (!stmt.ok())
            return Res<Money>::err(stmt.error());
        stmt.bind(1, payment_id);
        auto row = stmt.step();
        if (row.is_err())
            return Res<Money>::err(row.error());
        return Res<Money>::ok(stmt.int64(0));
    }

    dp::Result<void, dp::Error> LedgerStore::replaceAllocations(Id payment_id,
                                                                const std::vector<AllocationRequest> &rows) {
        SqliteStore::Statement remove(db_, "DELETE FROM payment_allocations WHERE payment_id = ?");
        if (!remove.ok())
            return Res<void>::err(remove.error());
        remove.bind(1, payment_id);
        auto removed = remove.run();
        if (removed.is_err())
            return removed;

        int64_t now = currentTimestamp();
        for (const auto &row : rows) {
            SqliteStore::Statement insert(db_, "INSERT INTO payment_allocations (payment_id, invoice_id, amount, "
                                               "created_at) VALUES (?, ?, ?, ?)");
            if (!insert.ok())
                return Res<void>::err(insert.error());
            insert.bind(1, payment_id).bind(2, row.invoice_id).bind(3, row.amount).bind(4, now);
            auto inserted = insert.run();
            if (inserted.is_err())
                return inserted;
        }
        return Res<void>::ok();
    }

    // ===========================================
    // Statistics
    // ===========================================

    dp::Result<LedgerStats, dp::Error> LedgerStore::stats() {
        LedgerStats out;
        for (const char *table : {"companies", "projects", "categories", "transactions", "payment_allocations", "trash"}) {
            auto count = db_.queryInt64(std::string("SELECT COUNT(*) FROM ") + table);
            if (count.is_err())
                return Res<LedgerStats>::err(count.error());
            out.tables.push_back(TableCount{table, count.value()});
        }
        out.size_bytes = db_.sizeBytes();
        out.schema_version = db_.schemaVersion();
        return Res<LedgerStats>::ok(std::move(out));
    }

} // namespace sitebook::storage
