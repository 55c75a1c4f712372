#pragma once

#include <atomic>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include <sitebook/common/error.hpp>
#include <sitebook/ledger/types.hpp>
#include <sitebook/storage/records.hpp>
#include <sitebook/storage/sqlite_store.hpp>

namespace sitebook::ledger {
    class AllocationEngine;
}

namespace sitebook::storage {

    using namespace ledger;

    /// Ledger-level settings on top of the SQLite options
    struct LedgerConfig {
        OpenOptions storage;
        std::string project_code_prefix = "PRJ";
        bool seed_default_categories = true;
        std::string base_currency = "TRY";
        std::string alt1_currency = "USD";
        std::string alt2_currency = "EUR";

        LedgerConfig() = default;

        /// Display code for a stored currency slot
        inline const std::string &currencyCode(Currency c) const {
            switch (c) {
            case Currency::Alt1:
                return alt1_currency;
            case Currency::Alt2:
                return alt2_currency;
            default:
                return base_currency;
            }
        }
    };

    /// One broken invariant found by the read-only integrity scan
    struct IntegrityViolation {
        std::string rule;
        Id record_id = 0;
        std::string detail;
    };

    // ===========================================
    // LedgerStore - entities, invariants and trash
    // ===========================================

    /// Typed access to the ledger tables. Every mutation runs in its own savepoint,
    /// checks the cross-entity invariants, and marks the store dirty on success.
    class LedgerStore {
      public:
        LedgerStore(SqliteStore &db, LedgerConfig config = LedgerConfig{});

        LedgerStore(const LedgerStore &) = delete;
        LedgerStore &operator=(const LedgerStore &) = delete;

        /// Forward-only schema history for the ledger database
        static std::vector<Migration> schemaMigrations(const LedgerConfig &config);

        /// Create or upgrade the schema
        dp::Result<void, dp::Error> initializeSchema();

        const LedgerConfig &config() const { return config_; }
        SqliteStore &database() { return db_; }

        // ===========================================
        // Dirty tracking
        // ===========================================

        bool isDirty() const { return dirty_.load(); }
        void clearDirty() { dirty_.store(false); }
        void markDirty() { dirty_.store(true); }
        void setDirty(bool value) { dirty_.store(value); }

        // ===========================================
        // Companies
        // ===========================================

        dp::Result<Company, dp::Error> createCompany(const CompanyInput &input);
        dp::Result<Company, dp::Error> updateCompany(Id id, const CompanyPatch &patch);
        dp::Result<Company, dp::Error> getCompany(Id id);
        dp::Result<std::vector<Company>, dp::Error> listCompanies(bool include_inactive = false);

        /// Move a company, its client projects, every transaction booked against either,
        /// and every allocation touching those transactions into one trash entry
        /// @return Trash entry id
        dp::Result<Id, dp::Error> deleteCompany(Id id);

        /// Counts shown before a company delete
        dp::Result<RelatedCounts, dp::Error> relatedCounts(Id company_id);

        // ===========================================
        // Projects
        // ===========================================

        dp::Result<Project, dp::Error> createProject(const ProjectInput &input);
        dp::Result<Project, dp::Error> updateProject(Id id, const ProjectPatch &patch);
        dp::Result<Project, dp::Error> getProject(Id id);
        dp::Result<std::vector<Project>, dp::Error> listProjects(bool include_inactive = false);
        dp::Result<Id, dp::Error> deleteProject(Id id);

        /// Next free code of the form PREFIX-YYYY-NNN
        dp::Result<std::string, dp::Error> generateProjectCode();

        // ===========================================
        // Categories
        // ===========================================

        dp::Result<Category, dp::Error> createCategory(const CategoryInput &input);
        dp::Result<Category, dp::Error> updateCategory(Id id, const CategoryPatch &patch);
        dp::Result<Category, dp::Error> getCategory(Id id);
        dp::Result<std::vector<Category>, dp::Error> listCategories(std::optional<CategoryType> type = std::nullopt);
        dp::Result<void, dp::Error> deleteCategory(Id id);

        // ===========================================
        // Transactions
        // ===========================================

        dp::Result<Transaction, dp::Error> createTransaction(const TransactionInput &input);
        dp::Result<Transaction, dp::Error> updateTransaction(Id id, const TransactionPatch &patch);
        dp::Result<Transaction, dp::Error> getTransaction(Id id);

        /// Filtered listing, newest first
        dp::Result<std::vector<Transaction>, dp::Error> listTransactions(const TransactionFilter &filter = {});

        /// Delete a transaction and every allocation it takes part in
        /// @return Trash entry id
        dp::Result<Id, dp::Error> deleteTransaction(Id id);

        // ===========================================
        // Allocation reads
        // ===========================================

        /// Invoices of one type for a company or project that still have a remaining balance.
        /// Allocations held by exclude_payment are not counted against the invoice.
        dp::Result<std::vector<OpenInvoice>, dp::Error> openInvoices(Id entity_id, EntityKind entity, TxType invoice_type,
                                                                     std::optional<Id> exclude_payment = std::nullopt);

        dp::Result<std::vector<PaymentAllocation>, dp::Error> allocationRowsForPayment(Id payment_id);

        /// Sum allocated against an invoice, optionally ignoring one payment's share
        dp::Result<Money, dp::Error> allocatedToInvoice(Id invoice_id, std::optional<Id> exclude_payment = std::nullopt);

        dp::Result<Money, dp::Error> allocatedFromPayment(Id payment_id);

        // ===========================================
        // Trash
        // ===========================================

        dp::Result<std::vector<TrashEntry>, dp::Error> listTrash();

        /// Re-insert every row of a trash entry with its original id, then drop the entry
        dp::Result<void, dp::Error> restoreTrash(Id trash_id);

        dp::Result<void, dp::Error> purgeTrash(Id trash_id);

        /// @return Number of entries removed
        dp::Result<int64_t, dp::Error> emptyTrash();

        // ===========================================
        // Diagnostics
        // ===========================================

        /// Read-only scan of the ledger invariants
        dp::Result<std::vector<IntegrityViolation>, dp::Error> scanInvariants();

        dp::Result<LedgerStats, dp::Error> stats();

      private:
        friend class ledger::AllocationEngine;

        SqliteStore &db_;
        LedgerConfig config_;
        std::atomic<bool> dirty_{false};

        /// Delete the payment's allocations and insert the given set. Caller validates and
        /// owns the savepoint.
        dp::Result<void, dp::Error> replaceAllocations(Id payment_id, const std::vector<AllocationRequest> &rows);

        dp::Result<void, dp::Error> validateTransaction(const Transaction &tx);
        dp::Result<void, dp::Error> checkActiveCompany(Id id);
        dp::Result<void, dp::Error> checkActiveProject(Id id);
        dp::Result<void, dp::Error> validateProject(const Project &p, std::optional<Id> self_id);

        dp::Result<std::vector<Company>, dp::Error> queryCompanies(const std::string &where,
                                                                   const std::vector<int64_t> &params);
        dp::Result<std::vector<Project>, dp::Error> queryProjects(const std::string &where,
                                                                  const std::vector<int64_t> &params);
        dp::Result<std::vector<Transaction>, dp::Error> queryTransactions(const std::string &where,
                                                                          const std::vector<int64_t> &params);
        dp::Result<std::vector<PaymentAllocation>, dp::Error> allocationsTouching(const std::vector<int64_t> &tx_ids);

        dp::Result<Id, dp::Error> moveToTrash(const TrashBundle &bundle, const std::string &label);
        dp::Result<void, dp::Error> insertCompanyRow(const Company &c);
        dp::Result<void, dp::Error> insertProjectRow(const Project &p);
        dp::Result<void, dp::Error> insertTransactionRow(const Transaction &t);
        dp::Result<void, dp::Error> deleteRowsById(const std::string &table, const std::vector<int64_t> &ids);
    };

} // namespace sitebook::storage
