#pragma once

#include <datapod/datapod.hpp>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <sitebook/common/error.hpp>
#include <sitebook/ledger/allocation.hpp>
#include <sitebook/ledger/balance.hpp>
#include <sitebook/storage/ledger_store.hpp>
#include <sitebook/storage/sqlite_store.hpp>

namespace sitebook {

    /// Result of the read-only consistency scan. Nothing is corrected.
    struct IntegrityReport {
        std::vector<std::string> sqlite_errors;
        std::vector<storage::IntegrityViolation> violations;

        bool ok() const { return sqlite_errors.empty() && violations.empty(); }
    };

    // ===========================================
    // Sitebook - ledger database facade
    // ===========================================

    /// Owns the connection, the ledger tables and the allocation engine.
    /// All writes, snapshot export and snapshot load go through one connection mutex,
    /// so a backup thread polling isDirty() always reads a committed state.
    class Sitebook {
      public:
        Sitebook();
        ~Sitebook();

        Sitebook(const Sitebook &) = delete;
        Sitebook &operator=(const Sitebook &) = delete;

        /// Open (or create) a ledger database file and bring its schema up to date
        /// @param path Database file path
        /// @param config Ledger and SQLite settings
        dp::Result<void, dp::Error> open(const std::string &path,
                                         const storage::LedgerConfig &config = storage::LedgerConfig{});

        dp::Result<void, dp::Error> openInMemory(const storage::LedgerConfig &config = storage::LedgerConfig{});

        void close();
        bool isOpen() const;

        storage::LedgerStore &ledger() { return *ledger_; }
        ledger::AllocationEngine &allocations() { return *engine_; }
        storage::SqliteStore &database() { return *db_; }

        // ===========================================
        // Transaction boundary
        // ===========================================

        /// Run fn inside one database transaction.
        /// fn receives this Sitebook and returns a dp::Result. An error result or an
        /// exception rolls everything back and restores the dirty flag; exceptions are
        /// rethrown. Calling withTransaction from inside fn fails with a transaction
        /// state error.
        template <typename Fn> auto withTransaction(Fn &&fn) -> decltype(fn(std::declval<Sitebook &>())) {
            using R = decltype(fn(std::declval<Sitebook &>()));
            std::lock_guard<std::recursive_mutex> lock(mutex_);

            if (!isOpen())
                return R::err(storage_error("Ledger is not open"));
            std::lock_guard<std::recursive_mutex> connection(db_->connectionMutex());
            bool was_dirty = ledger_->isDirty();
            auto begun = db_->begin();
            if (begun.is_err())
                return R::err(begun.error());

            try {
                R result = fn(*this);
                if (result.is_err()) {
                    abortTransaction(was_dirty, message_of(result.error()));
                    return result;
                }
                auto committed = db_->commit();
                if (committed.is_err()) {
                    ledger_->setDirty(was_dirty);
                    std::cerr << "Commit failed: " << message_of(committed.error()) << std::endl;
                    return R::err(committed.error());
                }
                ledger_->markDirty();
                return result;
            } catch (const std::exception &e) {
                abortTransaction(was_dirty, e.what());
                throw;
            } catch (...) {
                abortTransaction(was_dirty, "non-standard exception");
                throw;
            }
        }

        // ===========================================
        // Backup support
        // ===========================================

        bool isDirty() const;
        void clearDirty();

        /// Complete database image, refused while a transaction or savepoint is open.
        /// Waits for mutations running on other threads to finish.
        dp::Result<std::vector<uint8_t>, dp::Error> exportSnapshot();

        /// Replace the whole database with a snapshot image.
        /// Pending migrations are applied to the image; the current data stays if anything fails.
        dp::Result<void, dp::Error> loadFromSnapshot(const std::vector<uint8_t> &image);

        /// SHA-256 hex of a snapshot, for skipping identical backups
        static dp::Result<std::string, dp::Error> snapshotDigest(const std::vector<uint8_t> &image);

        // ===========================================
        // Diagnostics
        // ===========================================

        dp::Result<IntegrityReport, dp::Error> checkIntegrity();
        dp::Result<std::vector<storage::ForeignKeyViolation>, dp::Error> checkForeignKeys();

        int32_t schemaVersion();
        std::vector<storage::MigrationInfo> appliedMigrations();
        dp::Result<ledger::LedgerStats, dp::Error> stats();

        // ===========================================
        // Balance views
        // ===========================================

        /// Running account of a company over its cari-scope transactions
        dp::Result<ledger::CompanyLedger, dp::Error> companyLedger(ledger::Id company_id);

        /// Profit and debt view of a project over its project-scope transactions
        dp::Result<ledger::ProjectLedger, dp::Error> projectLedger(ledger::Id project_id);

        /// Firm-wide totals over every transaction
        dp::Result<ledger::DashboardTotals, dp::Error> dashboardTotals();

        /// Active companies by name, each with totals over its transactions in any scope
        dp::Result<std::vector<ledger::CompanyBalance>, dp::Error> listCompaniesWithBalance();

        /// Active projects, newest first, each with its ledger and client name
        dp::Result<std::vector<ledger::ProjectSummary>, dp::Error> listProjectsWithSummary();

      private:
        std::unique_ptr<storage::SqliteStore> db_;
        std::unique_ptr<storage::LedgerStore> ledger_;
        std::unique_ptr<ledger::AllocationEngine> engine_;
        std::recursive_mutex mutex_;

        dp::Result<void, dp::Error> attach(const storage::LedgerConfig &config);
        void abortTransaction(bool was_dirty, const std::string &reason);
    };

} // namespace sitebook
