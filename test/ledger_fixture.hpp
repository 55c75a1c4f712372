#pragma once

#include <doctest/doctest.h>

#include <algorithm>
#include <optional>
#include <string>

#include <sitebook.hpp>

using namespace sitebook;
using namespace sitebook::ledger;

// Test helper: in-memory ledger with shortcuts for common rows
struct LedgerFixture {
    Sitebook book;

    explicit LedgerFixture(const storage::LedgerConfig &config = storage::LedgerConfig{}) {
        auto opened = book.openInMemory(config);
        REQUIRE(opened.is_ok());
    }

    storage::LedgerStore &store() { return book.ledger(); }
    AllocationEngine &engine() { return book.allocations(); }

    Id company(const std::string &name = "Acme Yapi", CompanyRole role = CompanyRole::Customer) {
        CompanyInput in;
        in.name = name;
        in.role = role;
        auto created = store().createCompany(in);
        REQUIRE(created.is_ok());
        return created.value().id;
    }

    Id project(const std::string &name = "Tower A", std::optional<Id> client = std::nullopt,
               std::optional<Money> budget = std::nullopt) {
        ProjectInput in;
        in.name = name;
        in.ownership = client ? Ownership::Client : Ownership::Own;
        in.client_company_id = client;
        in.estimated_budget = budget;
        auto created = store().createProject(in);
        REQUIRE(created.is_ok());
        return created.value().id;
    }

    /// Cari-scope transaction in base currency
    Id cari(Id company_id, TxType type, Money amount, const std::string &date = "2024-01-15") {
        TransactionInput in;
        in.scope = Scope::Cari;
        in.company_id = company_id;
        in.type = type;
        in.amount = amount;
        in.date = date;
        in.description = std::string(toString(type)) + " " + date;
        auto created = store().createTransaction(in);
        REQUIRE(created.is_ok());
        return created.value().id;
    }

    /// Project-scope transaction in base currency
    Id onProject(Id project_id, TxType type, Money amount, const std::string &date = "2024-01-15",
                 std::optional<Id> company_id = std::nullopt) {
        TransactionInput in;
        in.scope = Scope::Project;
        in.project_id = project_id;
        in.company_id = company_id;
        in.type = type;
        in.amount = amount;
        in.date = date;
        in.description = std::string(toString(type)) + " " + date;
        auto created = store().createTransaction(in);
        REQUIRE(created.is_ok());
        return created.value().id;
    }

    Money allocatedTo(Id invoice_id) {
        auto sum = store().allocatedToInvoice(invoice_id);
        REQUIRE(sum.is_ok());
        return sum.value();
    }

    Money allocatedFrom(Id payment_id) {
        auto sum = store().allocatedFromPayment(payment_id);
        REQUIRE(sum.is_ok());
        return sum.value();
    }
};
