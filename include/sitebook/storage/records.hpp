#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include <sitebook/ledger/types.hpp>

namespace sitebook::storage {

    // ===========================================
    // Serializable row images kept in the trash
    // ===========================================
    //
    // Nullable references are stored as 0 (ids start at 1).

    inline dp::String toDp(const std::string &s) { return dp::String(s.c_str()); }
    inline std::string fromDp(const dp::String &s) { return std::string(s.c_str()); }

    inline dp::i64 refOf(const std::optional<ledger::Id> &id) { return id ? *id : 0; }
    inline std::optional<ledger::Id> refFrom(dp::i64 id) {
        if (id == 0)
            return std::nullopt;
        return id;
    }

    struct CompanyRecord {
        dp::i64 id{0};
        dp::u8 kind{0};
        dp::u8 role{0};
        dp::String name;
        dp::String national_id;
        dp::String tax_office;
        dp::String tax_number;
        dp::String contact_person;
        dp::String phone;
        dp::String email;
        dp::String address;
        dp::String bank_name;
        dp::String iban;
        dp::String notes;
        dp::u8 is_active{1};
        dp::i64 created_at{0};
        dp::i64 updated_at{0};

        CompanyRecord() = default;

        inline explicit CompanyRecord(const ledger::Company &c)
            : id(c.id), kind(static_cast<dp::u8>(c.kind)), role(static_cast<dp::u8>(c.role)), name(toDp(c.name)),
              national_id(toDp(c.national_id)), tax_office(toDp(c.tax_office)), tax_number(toDp(c.tax_number)),
              contact_person(toDp(c.contact_person)), phone(toDp(c.phone)), email(toDp(c.email)),
              address(toDp(c.address)), bank_name(toDp(c.bank_name)), iban(toDp(c.iban)), notes(toDp(c.notes)),
              is_active(c.is_active ? 1 : 0), created_at(c.created_at), updated_at(c.updated_at) {}

        inline ledger::Company toCompany() const {
            ledger::Company c;
            c.id = id;
            c.kind = static_cast<ledger::CompanyKind>(kind);
            c.role = static_cast<ledger::CompanyRole>(role);
            c.name = fromDp(name);
            c.national_id = fromDp(national_id);
            c.tax_office = fromDp(tax_office);
            c.tax_number = fromDp(tax_number);
            c.contact_person = fromDp(contact_person);
            c.phone = fromDp(phone);
            c.email = fromDp(email);
            c.address = fromDp(address);
            c.bank_name = fromDp(bank_name);
            c.iban = fromDp(iban);
            c.notes = fromDp(notes);
            c.is_active = is_active != 0;
            c.created_at = created_at;
            c.updated_at = updated_at;
            return c;
        }

        auto members() {
            return std::tie(id, kind, role, name, national_id, tax_office, tax_number, contact_person, phone, email,
                            address, bank_name, iban, notes, is_active, created_at, updated_at);
        }
        auto members() const {
            return std::tie(id, kind, role, name, national_id, tax_office, tax_number, contact_person, phone, email,
                            address, bank_name, iban, notes, is_active, created_at, updated_at);
        }
    };

    struct ProjectRecord {
        dp::i64 id{0};
        dp::String code;
        dp::String name;
        dp::u8 ownership{0};
        dp::i64 client_company_id{0};
        dp::u8 status{0};
        dp::u8 has_budget{0};
        dp::i64 estimated_budget{0};
        dp::String location;
        dp::String description;
        dp::String planned_start;
        dp::String planned_end;
        dp::String actual_start;
        dp::String actual_end;
        dp::u8 is_active{1};
        dp::i64 created_at{0};
        dp::i64 updated_at{0};

        ProjectRecord() = default;

        inline explicit ProjectRecord(const ledger::Project &p)
            : id(p.id), code(toDp(p.code)), name(toDp(p.name)), ownership(static_cast<dp::u8>(p.ownership)),
              client_company_id(refOf(p.client_company_id)), status(static_cast<dp::u8>(p.status)),
              has_budget(p.estimated_budget ? 1 : 0), estimated_budget(p.estimated_budget.value_or(0)),
              location(toDp(p.location)), description(toDp(p.description)), planned_start(toDp(p.planned_start)),
              planned_end(toDp(p.planned_end)), actual_start(toDp(p.actual_start)), actual_end(toDp(p.actual_end)),
              is_active(p.is_active ? 1 : 0), created_at(p.created_at), updated_at(p.updated_at) {}

        inline ledger::Project toProject() const {
            ledger::Project p;
            p.id = id;
            p.code = fromDp(code);
            p.name = fromDp(name);
            p.ownership = static_cast<ledger::Ownership>(ownership);
            p.client_company_id = refFrom(client_company_id);
            p.status = static_cast<ledger::ProjectStatus>(status);
            if (has_budget)
                p.estimated_budget = estimated_budget;
            p.location = fromDp(location);
            p.description = fromDp(description);
            p.planned_start = fromDp(planned_start);
            p.planned_end = fromDp(planned_end);
            p.actual_start = fromDp(actual_start);
            p.actual_end = fromDp(actual_end);
            p.is_active = is_active != 0;
            p.created_at = created_at;
            p.updated_at = updated_at;
            return p;
        }

        auto members() {
            return std::tie(id, code, name, ownership, client_company_id, status, has_budget, estimated_budget,
                            location, description, planned_start, planned_end, actual_start, actual_end, is_active,
                            created_at, updated_at);
        }
        auto members() const {
            return std::tie(id, code, name, ownership, client_company_id, status, has_budget, estimated_budget,
                            location, description, planned_start, planned_end, actual_start, actual_end, is_active,
                            created_at, updated_at);
        }
    };

    struct TransactionRecord {
        dp::i64 id{0};
        dp::u8 scope{0};
        dp::i64 company_id{0};
        dp::i64 project_id{0};
        dp::u8 type{0};
        dp::i64 category_id{0};
        dp::String date;
        dp::String description;
        dp::i64 amount{0};
        dp::u8 currency{0};
        dp::i64 exchange_rate{0};
        dp::i64 amount_in_base{0};
        dp::String document_no;
        dp::String notes;
        dp::i64 legacy_invoice_id{0};
        dp::i64 created_at{0};
        dp::i64 updated_at{0};

        TransactionRecord() = default;

        inline explicit TransactionRecord(const ledger::Transaction &t)
            : id(t.id), scope(static_cast<dp::u8>(t.scope)), company_id(refOf(t.company_id)),
              project_id(refOf(t.project_id)), type(static_cast<dp::u8>(t.type)), category_id(refOf(t.category_id)),
              date(toDp(t.date)), description(toDp(t.description)), amount(t.amount),
              currency(static_cast<dp::u8>(t.currency)), exchange_rate(t.exchange_rate),
              amount_in_base(t.amount_in_base), document_no(toDp(t.document_no)), notes(toDp(t.notes)),
              legacy_invoice_id(refOf(t.legacy_invoice_id)), created_at(t.created_at), updated_at(t.updated_at) {}

        inline ledger::Transaction toTransaction() const {
            ledger::Transaction t;
            t.id = id;
            t.scope = static_cast<ledger::Scope>(scope);
            t.company_id = refFrom(company_id);
            t.project_id = refFrom(project_id);
            t.type = static_cast<ledger::TxType>(type);
            t.category_id = refFrom(category_id);
            t.date = fromDp(date);
            t.description = fromDp(description);
            t.amount = amount;
            t.currency = static_cast<ledger::Currency>(currency);
            t.exchange_rate = exchange_rate;
            t.amount_in_base = amount_in_base;
            t.document_no = fromDp(document_no);
            t.notes = fromDp(notes);
            t.legacy_invoice_id = refFrom(legacy_invoice_id);
            t.created_at = created_at;
            t.updated_at = updated_at;
            return t;
        }

        auto members() {
            return std::tie(id, scope, company_id, project_id, type, category_id, date, description, amount, currency,
                            exchange_rate, amount_in_base, document_no, notes, legacy_invoice_id, created_at,
                            updated_at);
        }
        auto members() const {
            return std::tie(id, scope, company_id, project_id, type, category_id, date, description, amount, currency,
                            exchange_rate, amount_in_base, document_no, notes, legacy_invoice_id, created_at,
                            updated_at);
        }
    };

    struct AllocationRecord {
        dp::i64 id{0};
        dp::i64 payment_id{0};
        dp::i64 invoice_id{0};
        dp::i64 amount{0};
        dp::i64 created_at{0};

        AllocationRecord() = default;

        inline explicit AllocationRecord(const ledger::PaymentAllocation &a)
            : id(a.id), payment_id(a.payment_id), invoice_id(a.invoice_id), amount(a.amount),
              created_at(a.created_at) {}

        inline ledger::PaymentAllocation toAllocation() const {
            ledger::PaymentAllocation a;
            a.id = id;
            a.payment_id = payment_id;
            a.invoice_id = invoice_id;
            a.amount = amount;
            a.created_at = created_at;
            return a;
        }

        auto members() { return std::tie(id, payment_id, invoice_id, amount, created_at); }
        auto members() const { return std::tie(id, payment_id, invoice_id, amount, created_at); }
    };

    /// Everything one delete call removed, restorable as a unit
    struct TrashBundle {
        dp::u8 kind{0}; // ledger::TrashKind
        dp::Vector<CompanyRecord> companies;
        dp::Vector<ProjectRecord> projects;
        dp::Vector<TransactionRecord> transactions;
        dp::Vector<AllocationRecord> allocations;

        inline ledger::TrashKind getKind() const { return static_cast<ledger::TrashKind>(kind); }

        /// Serialize to bytes
        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<TrashBundle &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        /// Deserialize from bytes
        inline static dp::Result<TrashBundle, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, TrashBundle>(buf);
                return dp::Result<TrashBundle, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<TrashBundle, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        auto members() { return std::tie(kind, companies, projects, transactions, allocations); }
        auto members() const { return std::tie(kind, companies, projects, transactions, allocations); }
    };

} // namespace sitebook::storage
