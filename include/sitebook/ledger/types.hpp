#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <sitebook/common/money.hpp>

namespace sitebook::ledger {

    using Id = std::int64_t;

    // ===========================================
    // Enumerations
    // ===========================================

    enum class CompanyKind : std::uint8_t { Person = 0, Organization = 1 };

    enum class CompanyRole : std::uint8_t { Customer = 0, Supplier = 1, Subcontractor = 2, Investor = 3 };

    enum class Ownership : std::uint8_t { Own = 0, Client = 1 };

    enum class ProjectStatus : std::uint8_t { Planned = 0, Active = 1, Completed = 2, Cancelled = 3 };

    enum class CategoryType : std::uint8_t { InvoiceOut = 0, InvoiceIn = 1, Payment = 2 };

    /// Ledger view a transaction is booked into
    enum class Scope : std::uint8_t { Cari = 0, Project = 1, Company = 2 };

    enum class TxType : std::uint8_t { InvoiceOut = 0, PaymentIn = 1, InvoiceIn = 2, PaymentOut = 3 };

    enum class Currency : std::uint8_t { Base = 0, Alt1 = 1, Alt2 = 2 };

    enum class EntityKind : std::uint8_t { Company = 0, Project = 1 };

    enum class TrashKind : std::uint8_t { Company = 0, Project = 1, Transaction = 2 };

    enum class TxRole : std::uint8_t { Invoice = 0, Payment = 1 };

    // ===========================================
    // Transaction type dispatch table
    // ===========================================

    /// Everything the ledger needs to know about one transaction type.
    /// sign is +1 for money owed to or received by the firm, -1 otherwise.
    struct TxTypeTraits {
        TxType type;
        int sign;
        TxRole role;
        CategoryType category;
        TxType counterpart;
    };

    constexpr std::array<TxTypeTraits, 4> kTxTypeTable = {{
        {TxType::InvoiceOut, +1, TxRole::Invoice, CategoryType::InvoiceOut, TxType::PaymentIn},
        {TxType::PaymentIn, +1, TxRole::Payment, CategoryType::Payment, TxType::InvoiceOut},
        {TxType::InvoiceIn, -1, TxRole::Invoice, CategoryType::InvoiceIn, TxType::PaymentOut},
        {TxType::PaymentOut, -1, TxRole::Payment, CategoryType::Payment, TxType::InvoiceIn},
    }};

    constexpr const TxTypeTraits &traits(TxType type) { return kTxTypeTable[static_cast<std::size_t>(type)]; }

    constexpr bool isInvoice(TxType type) { return traits(type).role == TxRole::Invoice; }

    constexpr bool isPayment(TxType type) { return traits(type).role == TxRole::Payment; }

    /// Invoice type a payment settles, or payment type that settles an invoice
    constexpr TxType counterpartOf(TxType type) { return traits(type).counterpart; }

    // ===========================================
    // String conversion (storage encoding)
    // ===========================================

    const char *toString(CompanyKind v);
    const char *toString(CompanyRole v);
    const char *toString(Ownership v);
    const char *toString(ProjectStatus v);
    const char *toString(CategoryType v);
    const char *toString(Scope v);
    const char *toString(TxType v);
    const char *toString(Currency v);
    const char *toString(TrashKind v);

    std::optional<CompanyKind> parseCompanyKind(const std::string &s);
    std::optional<CompanyRole> parseCompanyRole(const std::string &s);
    std::optional<Ownership> parseOwnership(const std::string &s);
    std::optional<ProjectStatus> parseProjectStatus(const std::string &s);
    std::optional<CategoryType> parseCategoryType(const std::string &s);
    std::optional<Scope> parseScope(const std::string &s);
    std::optional<TxType> parseTxType(const std::string &s);
    std::optional<Currency> parseCurrency(const std::string &s);
    std::optional<TrashKind> parseTrashKind(const std::string &s);

    /// True for a YYYY-MM-DD calendar date
    bool isIsoDate(const std::string &s);

    // ===========================================
    // Entities
    // ===========================================

    struct Company {
        Id id = 0;
        CompanyKind kind = CompanyKind::Organization;
        CompanyRole role = CompanyRole::Customer;
        std::string name;
        std::string national_id;
        std::string tax_office;
        std::string tax_number;
        std::string contact_person;
        std::string phone;
        std::string email;
        std::string address;
        std::string bank_name;
        std::string iban;
        std::string notes;
        bool is_active = true;
        std::int64_t created_at = 0;
        std::int64_t updated_at = 0;
    };

    struct Project {
        Id id = 0;
        std::string code;
        std::string name;
        Ownership ownership = Ownership::Own;
        std::optional<Id> client_company_id;
        ProjectStatus status = ProjectStatus::Planned;
        std::optional<Money> estimated_budget;
        std::string location;
        std::string description;
        std::string planned_start;
        std::string planned_end;
        std::string actual_start;
        std::string actual_end;
        bool is_active = true;
        std::int64_t created_at = 0;
        std::int64_t updated_at = 0;
    };

    struct Category {
        Id id = 0;
        std::string name;
        CategoryType type = CategoryType::Payment;
        std::string color;
        bool is_default = false;
    };

    struct Transaction {
        Id id = 0;
        Scope scope = Scope::Cari;
        std::optional<Id> company_id;
        std::optional<Id> project_id;
        TxType type = TxType::InvoiceOut;
        std::optional<Id> category_id;
        std::string date;
        std::string description;
        Money amount = 0;
        Currency currency = Currency::Base;
        std::int64_t exchange_rate = kRateScale;
        Money amount_in_base = 0;
        std::string document_no;
        std::string notes;
        std::optional<Id> legacy_invoice_id; // read-only, pre-allocation data
        std::int64_t created_at = 0;
        std::int64_t updated_at = 0;

        // Derived on read
        Money allocated_amount = 0;
        std::string company_name;
    };

    struct PaymentAllocation {
        Id id = 0;
        Id payment_id = 0;
        Id invoice_id = 0;
        Money amount = 0;
        std::int64_t created_at = 0;
    };

    /// Allocation joined with the transaction on the other side of it
    struct AllocationDetail {
        Id id = 0;
        Id payment_id = 0;
        Id invoice_id = 0;
        Money amount = 0;
        Id counterpart_id = 0;
        TxType counterpart_type = TxType::InvoiceOut;
        std::string description;
        std::string date;
        std::string document_no;
        Money counterpart_amount = 0;
        Currency counterpart_currency = Currency::Base;
        Money counterpart_base = 0;
    };

    struct TrashEntry {
        Id id = 0;
        TrashKind kind = TrashKind::Transaction;
        std::string label;
        std::string digest;
        std::size_t snapshot_size = 0;
        std::int64_t deleted_at = 0;
    };

    struct RelatedCounts {
        std::int64_t transactions = 0;
        std::int64_t client_projects = 0;
    };

    /// Invoice with the part of its base amount not yet covered by allocations
    struct OpenInvoice {
        Id id = 0;
        TxType type = TxType::InvoiceOut;
        std::string date;
        std::string description;
        std::string document_no;
        std::string company_name;
        Money amount_in_base = 0;
        Money allocated = 0;
        Money remaining = 0;
    };

    /// One line of an allocation set: this much of the payment goes to this invoice
    struct AllocationRequest {
        Id invoice_id = 0;
        Money amount = 0;

        bool operator==(const AllocationRequest &other) const {
            return invoice_id == other.invoice_id && amount == other.amount;
        }
        bool operator!=(const AllocationRequest &other) const { return !(*this == other); }
    };

    struct TableCount {
        std::string table;
        std::int64_t rows = 0;
    };

    struct LedgerStats {
        std::vector<TableCount> tables;
        std::int64_t size_bytes = 0;
        std::int32_t schema_version = 0;
    };

    // ===========================================
    // Inputs and partial updates
    // ===========================================

    struct CompanyInput {
        CompanyKind kind = CompanyKind::Organization;
        CompanyRole role = CompanyRole::Customer;
        std::string name;
        std::string national_id;
        std::string tax_office;
        std::string tax_number;
        std::string contact_person;
        std::string phone;
        std::string email;
        std::string address;
        std::string bank_name;
        std::string iban;
        std::string notes;
    };

    struct CompanyPatch {
        std::optional<CompanyKind> kind;
        std::optional<CompanyRole> role;
        std::optional<std::string> name;
        std::optional<std::string> national_id;
        std::optional<std::string> tax_office;
        std::optional<std::string> tax_number;
        std::optional<std::string> contact_person;
        std::optional<std::string> phone;
        std::optional<std::string> email;
        std::optional<std::string> address;
        std::optional<std::string> bank_name;
        std::optional<std::string> iban;
        std::optional<std::string> notes;
        std::optional<bool> is_active;
    };

    struct ProjectInput {
        std::string code; // generated when empty
        std::string name;
        Ownership ownership = Ownership::Own;
        std::optional<Id> client_company_id;
        ProjectStatus status = ProjectStatus::Planned;
        std::optional<Money> estimated_budget;
        std::string location;
        std::string description;
        std::string planned_start;
        std::string planned_end;
        std::string actual_start;
        std::string actual_end;
    };

    /// Nested optionals: outer = "field present in patch", inner = value or explicit null
    struct ProjectPatch {
        std::optional<std::string> code;
        std::optional<std::string> name;
        std::optional<Ownership> ownership;
        std::optional<std::optional<Id>> client_company_id;
        std::optional<ProjectStatus> status;
        std::optional<std::optional<Money>> estimated_budget;
        std::optional<std::string> location;
        std::optional<std::string> description;
        std::optional<std::string> planned_start;
        std::optional<std::string> planned_end;
        std::optional<std::string> actual_start;
        std::optional<std::string> actual_end;
        std::optional<bool> is_active;
    };

    struct CategoryInput {
        std::string name;
        CategoryType type = CategoryType::Payment;
        std::string color = "#6366f1";
    };

    struct CategoryPatch {
        std::optional<std::string> name;
        std::optional<std::string> color;
    };

    struct TransactionInput {
        Scope scope = Scope::Cari;
        std::optional<Id> company_id;
        std::optional<Id> project_id;
        TxType type = TxType::InvoiceOut;
        std::optional<Id> category_id;
        std::string date;
        std::string description;
        Money amount = 0;
        Currency currency = Currency::Base;
        std::optional<std::int64_t> exchange_rate; // forced to 1.0 for base currency
        std::string document_no;
        std::string notes;
    };

    struct TransactionPatch {
        std::optional<Scope> scope;
        std::optional<std::optional<Id>> company_id;
        std::optional<std::optional<Id>> project_id;
        std::optional<TxType> type;
        std::optional<std::optional<Id>> category_id;
        std::optional<std::string> date;
        std::optional<std::string> description;
        std::optional<Money> amount;
        std::optional<Currency> currency;
        std::optional<std::int64_t> exchange_rate;
        std::optional<std::string> document_no;
        std::optional<std::string> notes;
    };

    struct TransactionFilter {
        std::optional<Scope> scope;
        std::optional<TxType> type;
        std::optional<Id> company_id;
        std::optional<Id> project_id;
        std::optional<std::string> start_date;
        std::optional<std::string> end_date;
        std::optional<std::string> search;
        std::optional<std::int32_t> limit;
    };

} // namespace sitebook::ledger
