#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "ledger_fixture.hpp"

static int64_t countRows(Sitebook &book, const std::string &sql) {
    auto n = book.database().queryInt64(sql);
    REQUIRE(n.is_ok());
    return n.value();
}

TEST_CASE("Deleting into the trash") {
    LedgerFixture fx;
    Id client = fx.company("Client Holding");
    Id project = fx.project("Client Tower", client);
    Id inv = fx.cari(client, TxType::InvoiceOut, 1000, "2024-01-01");
    Id pay = fx.cari(client, TxType::PaymentIn, 600, "2024-01-02");
    fx.onProject(project, TxType::InvoiceIn, 300, "2024-01-03");
    REQUIRE(fx.engine().setAllocationsForPayment(pay, {{inv, 600}}).is_ok());

    SUBCASE("Company cascade is one entry") {
        auto trash_id = fx.store().deleteCompany(client);
        REQUIRE(trash_id.is_ok());

        CHECK(countRows(fx.book, "SELECT COUNT(*) FROM companies") == 0);
        CHECK(countRows(fx.book, "SELECT COUNT(*) FROM projects") == 0);
        CHECK(countRows(fx.book, "SELECT COUNT(*) FROM transactions") == 0);
        CHECK(countRows(fx.book, "SELECT COUNT(*) FROM payment_allocations") == 0);

        auto entries = fx.store().listTrash();
        REQUIRE(entries.is_ok());
        REQUIRE(entries.value().size() == 1);
        const auto &e = entries.value()[0];
        CHECK(e.id == trash_id.value());
        CHECK(e.kind == TrashKind::Company);
        CHECK(e.label.find("Client Holding") != std::string::npos);
        CHECK(e.digest.size() == 64);
        CHECK(e.snapshot_size > 0);
    }

    SUBCASE("Restore brings back ids and allocations") {
        auto trash_id = fx.store().deleteCompany(client);
        REQUIRE(trash_id.is_ok());
        REQUIRE(fx.store().restoreTrash(trash_id.value()).is_ok());

        auto restored = fx.store().getCompany(client);
        REQUIRE(restored.is_ok());
        CHECK(restored.value().name == "Client Holding");
        CHECK(fx.store().getProject(project).is_ok());
        CHECK(fx.allocatedTo(inv) == 600);
        CHECK(fx.allocatedFrom(pay) == 600);

        auto entries = fx.store().listTrash();
        REQUIRE(entries.is_ok());
        CHECK(entries.value().empty());
    }

    SUBCASE("Single transaction takes its allocations along") {
        auto trash_id = fx.store().deleteTransaction(inv);
        REQUIRE(trash_id.is_ok());
        CHECK(fx.allocatedFrom(pay) == 0);
        CHECK(fx.store().getTransaction(inv).is_err());

        REQUIRE(fx.store().restoreTrash(trash_id.value()).is_ok());
        CHECK(fx.allocatedFrom(pay) == 600);
    }

    SUBCASE("Project removal keeps the client") {
        auto trash_id = fx.store().deleteProject(project);
        REQUIRE(trash_id.is_ok());
        CHECK(fx.store().getCompany(client).is_ok());
        CHECK(countRows(fx.book, "SELECT COUNT(*) FROM transactions WHERE scope = 'project'") == 0);
        CHECK(countRows(fx.book, "SELECT COUNT(*) FROM transactions WHERE scope = 'cari'") == 2);
    }

    SUBCASE("Unknown ids") {
        auto missing = fx.store().deleteTransaction(9999);
        REQUIRE(missing.is_err());
        CHECK(missing.error().code == ERR_NOT_FOUND);

        auto restore = fx.store().restoreTrash(9999);
        REQUIRE(restore.is_err());
        CHECK(restore.error().code == ERR_NOT_FOUND);
    }
}

TEST_CASE("Restore refuses damaged or conflicting entries") {
    LedgerFixture fx;
    Id c = fx.company();
    Id inv = fx.cari(c, TxType::InvoiceOut, 1000, "2024-01-01");
    Id pay = fx.cari(c, TxType::PaymentIn, 1000, "2024-01-02");
    REQUIRE(fx.engine().setAllocationsForPayment(pay, {{inv, 800}}).is_ok());

    SUBCASE("Tampered snapshot fails the digest check") {
        auto trash_id = fx.store().deleteTransaction(inv);
        REQUIRE(trash_id.is_ok());
        REQUIRE(fx.book.database()
                    .execute("UPDATE trash SET snapshot = X'00010203' WHERE id = " + std::to_string(trash_id.value()))
                    .is_ok());

        auto restored = fx.store().restoreTrash(trash_id.value());
        REQUIRE(restored.is_err());
        CHECK(restored.error().code == ERR_INTEGRITY);
        CHECK(fx.store().getTransaction(inv).is_err());
    }

    SUBCASE("Payment that moved on leaves no room") {
        auto trash_id = fx.store().deleteTransaction(inv);
        REQUIRE(trash_id.is_ok());

        // The payment is fully spent elsewhere while the invoice sits in the trash
        Id other = fx.cari(c, TxType::InvoiceOut, 1000, "2024-01-05");
        REQUIRE(fx.engine().setAllocationsForPayment(pay, {{other, 1000}}).is_ok());

        auto restored = fx.store().restoreTrash(trash_id.value());
        REQUIRE(restored.is_err());
        CHECK(restored.error().code == ERR_CONSTRAINT_VIOLATION);
        CHECK(fx.store().getTransaction(inv).is_err());
        CHECK(fx.allocatedFrom(pay) == 1000);
    }

    SUBCASE("Missing owner blocks a transaction restore") {
        auto tx_entry = fx.store().deleteTransaction(inv);
        REQUIRE(tx_entry.is_ok());
        auto company_entry = fx.store().deleteCompany(c);
        REQUIRE(company_entry.is_ok());

        auto restored = fx.store().restoreTrash(tx_entry.value());
        REQUIRE(restored.is_err());
        CHECK(restored.error().code == ERR_CONSTRAINT_VIOLATION);

        // Restoring the company first makes room for it
        REQUIRE(fx.store().restoreTrash(company_entry.value()).is_ok());
        REQUIRE(fx.store().restoreTrash(tx_entry.value()).is_ok());
        CHECK(fx.allocatedTo(inv) == 800);
    }
}

TEST_CASE("Purging the trash") {
    LedgerFixture fx;
    Id c = fx.company();
    Id a = fx.cari(c, TxType::InvoiceOut, 100);
    Id b = fx.cari(c, TxType::InvoiceOut, 200);
    Id d = fx.cari(c, TxType::InvoiceOut, 300);

    auto first = fx.store().deleteTransaction(a);
    REQUIRE(first.is_ok());
    REQUIRE(fx.store().deleteTransaction(b).is_ok());
    REQUIRE(fx.store().deleteTransaction(d).is_ok());

    REQUIRE(fx.store().purgeTrash(first.value()).is_ok());
    auto again = fx.store().purgeTrash(first.value());
    REQUIRE(again.is_err());
    CHECK(again.error().code == ERR_NOT_FOUND);

    auto emptied = fx.store().emptyTrash();
    REQUIRE(emptied.is_ok());
    CHECK(emptied.value() == 2);

    auto entries = fx.store().listTrash();
    REQUIRE(entries.is_ok());
    CHECK(entries.value().empty());
}
