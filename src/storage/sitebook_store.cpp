#include <sitebook/storage/sitebook_store.hpp>

#include <algorithm>
#include <unordered_map>

namespace sitebook {

    using storage::LedgerConfig;

    namespace {
        template <typename T> using Res = dp::Result<T, dp::Error>;
    }

    Sitebook::Sitebook() = default;

    Sitebook::~Sitebook() { close(); }

    dp::Result<void, dp::Error> Sitebook::open(const std::string &path, const LedgerConfig &config) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        close();
        db_ = std::make_unique<storage::SqliteStore>();
        auto opened = db_->open(path, config.storage);
        if (opened.is_err()) {
            db_.reset();
            return opened;
        }
        return attach(config);
    }

    dp::Result<void, dp::Error> Sitebook::openInMemory(const LedgerConfig &config) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        close();
        db_ = std::make_unique<storage::SqliteStore>();
        auto opened = db_->openInMemory(config.storage);
        if (opened.is_err()) {
            db_.reset();
            return opened;
        }
        return attach(config);
    }

    dp::Result<void, dp::Error> Sitebook::attach(const LedgerConfig &config) {
        ledger_ = std::make_unique<storage::LedgerStore>(*db_, config);
        auto migrated = ledger_->initializeSchema();
        if (migrated.is_err()) {
            std::cerr << "Schema setup failed: " << message_of(migrated.error()) << std::endl;
            ledger_.reset();
            db_.reset();
            return migrated;
        }
        engine_ = std::make_unique<ledger::AllocationEngine>(*ledger_);
        return Res<void>::ok();
    }

    void Sitebook::close() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        engine_.reset();
        ledger_.reset();
        if (db_)
            db_->close();
        db_.reset();
    }

    bool Sitebook::isOpen() const { return db_ && ledger_ && db_->isOpen(); }

    void Sitebook::abortTransaction(bool was_dirty, const std::string &reason) {
        auto rolled = db_->rollback();
        if (rolled.is_err())
            std::cerr << "Rollback failed: " << message_of(rolled.error()) << std::endl;
        ledger_->setDirty(was_dirty);
        std::cerr << "Transaction rolled back: " << reason << std::endl;
    }

    // ===========================================
    // Backup support
    // ===========================================

    bool Sitebook::isDirty() const { return ledger_ && ledger_->isDirty(); }

    void Sitebook::clearDirty() {
        if (ledger_)
            ledger_->clearDirty();
    }

    dp::Result<std::vector<uint8_t>, dp::Error> Sitebook::exportSnapshot() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!isOpen())
            return Res<std::vector<uint8_t>>::err(storage_error("Ledger is not open"));
        std::lock_guard<std::recursive_mutex> connection(db_->connectionMutex());
        if (db_->inAnyTransaction())
            return Res<std::vector<uint8_t>>::err(transaction_state_error("Cannot export a snapshot mid-transaction"));
        return db_->serialize();
    }

    dp::Result<void, dp::Error> Sitebook::loadFromSnapshot(const std::vector<uint8_t> &image) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!isOpen())
            return Res<void>::err(storage_error("Ledger is not open"));
        std::lock_guard<std::recursive_mutex> connection(db_->connectionMutex());
        if (db_->inAnyTransaction())
            return Res<void>::err(transaction_state_error("Cannot load a snapshot mid-transaction"));

        auto loaded = db_->deserialize(image);
        if (loaded.is_err()) {
            std::cerr << "Snapshot rejected: " << message_of(loaded.error()) << std::endl;
            return loaded;
        }
        // The database now matches a stored backup
        ledger_->clearDirty();
        return Res<void>::ok();
    }

    dp::Result<std::string, dp::Error> Sitebook::snapshotDigest(const std::vector<uint8_t> &image) {
        auto hash = storage::computeSHA256(image);
        if (hash.is_err())
            return Res<std::string>::err(hash.error());
        return Res<std::string>::ok(storage::hashToHex(hash.value()));
    }

    // ===========================================
    // Diagnostics
    // ===========================================

    dp::Result<IntegrityReport, dp::Error> Sitebook::checkIntegrity() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!isOpen())
            return Res<IntegrityReport>::err(storage_error("Ledger is not open"));

        IntegrityReport report;
        auto sqlite_check = db_->integrityCheck();
        if (sqlite_check.is_err())
            return Res<IntegrityReport>::err(sqlite_check.error());
        report.sqlite_errors = sqlite_check.value();

        auto scan = ledger_->scanInvariants();
        if (scan.is_err())
            return Res<IntegrityReport>::err(scan.error());
        report.violations = scan.value();

        for (const auto &v : report.violations)
            std::cerr << "Integrity: " << v.rule << " on " << v.record_id << ": " << v.detail << std::endl;
        return Res<IntegrityReport>::ok(std::move(report));
    }

    dp::Result<std::vector<storage::ForeignKeyViolation>, dp::Error> Sitebook::checkForeignKeys() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!isOpen())
            return Res<std::vector<storage::ForeignKeyViolation>>::err(storage_error("Ledger is not open"));
        return db_->foreignKeyCheck();
    }

    int32_t Sitebook::schemaVersion() { return isOpen() ? db_->schemaVersion() : 0; }

    std::vector<storage::MigrationInfo> Sitebook::appliedMigrations() {
        if (!isOpen())
            return {};
        return db_->appliedMigrations();
    }

    dp::Result<ledger::LedgerStats, dp::Error> Sitebook::stats() {
        if (!isOpen())
            return Res<ledger::LedgerStats>::err(storage_error("Ledger is not open"));
        return ledger_->stats();
    }

    // ===========================================
    // Balance views
    // ===========================================

    dp::Result<ledger::CompanyLedger, dp::Error> Sitebook::companyLedger(ledger::Id company_id) {
        if (!isOpen())
            return Res<ledger::CompanyLedger>::err(storage_error("Ledger is not open"));
        auto company = ledger_->getCompany(company_id);
        if (company.is_err())
            return Res<ledger::CompanyLedger>::err(company.error());

        ledger::TransactionFilter filter;
        filter.scope = ledger::Scope::Cari;
        filter.company_id = company_id;
        auto txs = ledger_->listTransactions(filter);
        if (txs.is_err())
            return Res<ledger::CompanyLedger>::err(txs.error());
        return Res<ledger::CompanyLedger>::ok(ledger::calculateCompanyLedger(txs.value()));
    }

    dp::Result<ledger::ProjectLedger, dp::Error> Sitebook::projectLedger(ledger::Id project_id) {
        if (!isOpen())
            return Res<ledger::ProjectLedger>::err(storage_error("Ledger is not open"));
        auto project = ledger_->getProject(project_id);
        if (project.is_err())
            return Res<ledger::ProjectLedger>::err(project.error());

        ledger::TransactionFilter filter;
        filter.scope = ledger::Scope::Project;
        filter.project_id = project_id;
        auto txs = ledger_->listTransactions(filter);
        if (txs.is_err())
            return Res<ledger::ProjectLedger>::err(txs.error());
        return Res<ledger::ProjectLedger>::ok(ledger::calculateProjectLedger(
            txs.value(), project.value().ownership, project.value().estimated_budget));
    }

    dp::Result<ledger::DashboardTotals, dp::Error> Sitebook::dashboardTotals() {
        if (!isOpen())
            return Res<ledger::DashboardTotals>::err(storage_error("Ledger is not open"));
        auto txs = ledger_->listTransactions();
        if (txs.is_err())
            return Res<ledger::DashboardTotals>::err(txs.error());
        return Res<ledger::DashboardTotals>::ok(ledger::calculateDashboardTotals(txs.value()));
    }

    dp::Result<std::vector<ledger::CompanyBalance>, dp::Error> Sitebook::listCompaniesWithBalance() {
        using Out = std::vector<ledger::CompanyBalance>;
        if (!isOpen())
            return Res<Out>::err(storage_error("Ledger is not open"));
        auto companies = ledger_->listCompanies(false);
        if (companies.is_err())
            return Res<Out>::err(companies.error());
        auto txs = ledger_->listTransactions();
        if (txs.is_err())
            return Res<Out>::err(txs.error());

        std::unordered_map<ledger::Id, std::vector<ledger::Transaction>> by_company;
        for (const auto &tx : txs.value())
            if (tx.company_id)
                by_company[*tx.company_id].push_back(tx);

        Out out;
        out.reserve(companies.value().size());
        for (const auto &c : companies.value()) {
            ledger::CompanyBalance row;
            row.company = c;
            auto it = by_company.find(c.id);
            if (it != by_company.end()) {
                row.totals = ledger::accumulate(it->second);
                row.ledger = ledger::calculateCompanyLedger(it->second);
                row.transaction_count = static_cast<std::int64_t>(it->second.size());
            }
            out.push_back(std::move(row));
        }
        return Res<Out>::ok(std::move(out));
    }

    dp::Result<std::vector<ledger::ProjectSummary>, dp::Error> Sitebook::listProjectsWithSummary() {
        using Out = std::vector<ledger::ProjectSummary>;
        if (!isOpen())
            return Res<Out>::err(storage_error("Ledger is not open"));
        auto projects = ledger_->listProjects(false);
        if (projects.is_err())
            return Res<Out>::err(projects.error());
        auto companies = ledger_->listCompanies(true);
        if (companies.is_err())
            return Res<Out>::err(companies.error());
        auto txs = ledger_->listTransactions();
        if (txs.is_err())
            return Res<Out>::err(txs.error());

        std::unordered_map<ledger::Id, std::string> names;
        for (const auto &c : companies.value())
            names[c.id] = c.name;
        std::unordered_map<ledger::Id, std::vector<ledger::Transaction>> by_project;
        for (const auto &tx : txs.value())
            if (tx.project_id)
                by_project[*tx.project_id].push_back(tx);

        std::vector<ledger::Project> ordered = projects.value();
        std::sort(ordered.begin(), ordered.end(), [](const ledger::Project &a, const ledger::Project &b) {
            if (a.created_at != b.created_at)
                return a.created_at > b.created_at;
            return a.id > b.id;
        });

        Out out;
        out.reserve(ordered.size());
        static const std::vector<ledger::Transaction> kNone;
        for (const auto &p : ordered) {
            ledger::ProjectSummary row;
            row.project = p;
            if (p.client_company_id) {
                auto name = names.find(*p.client_company_id);
                if (name != names.end())
                    row.client_name = name->second;
            }
            auto it = by_project.find(p.id);
            const auto &rows = it != by_project.end() ? it->second : kNone;
            row.ledger = ledger::calculateProjectLedger(rows, p.ownership, p.estimated_budget);
            row.transaction_count = static_cast<std::int64_t>(rows.size());
            out.push_back(std::move(row));
        }
        return Res<Out>::ok(std::move(out));
    }

} // namespace sitebook
