#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "ledger_fixture.hpp"

static bool hasRule(const IntegrityReport &report, const std::string &rule, Id record_id) {
    for (const auto &v : report.violations) {
        if (v.rule == rule && v.record_id == record_id)
            return true;
    }
    return false;
}

TEST_CASE("Healthy ledger passes the scan") {
    LedgerFixture fx;
    Id client = fx.company("Client Holding");
    Id project = fx.project("Client Tower", client, 100000);
    Id inv = fx.onProject(project, TxType::InvoiceOut, 5000, "2024-01-01", client);
    Id pay = fx.onProject(project, TxType::PaymentIn, 3000, "2024-01-02", client);
    REQUIRE(fx.engine().setAllocationsForPayment(pay, {{inv, 3000}}).is_ok());

    TransactionInput fx_row;
    fx_row.scope = Scope::Cari;
    fx_row.company_id = client;
    fx_row.type = TxType::InvoiceIn;
    fx_row.date = "2024-01-03";
    fx_row.description = "Imported steel";
    fx_row.amount = 1999;
    fx_row.currency = Currency::Alt1;
    fx_row.exchange_rate = rateOf(32.4517);
    REQUIRE(fx.store().createTransaction(fx_row).is_ok());

    auto report = fx.book.checkIntegrity();
    REQUIRE(report.is_ok());
    CHECK(report.value().ok());

    auto fk = fx.book.checkForeignKeys();
    REQUIRE(fk.is_ok());
    CHECK(fk.value().empty());
}

TEST_CASE("Scan reports what raw edits broke") {
    LedgerFixture fx;
    Id c = fx.company();
    Id inv = fx.cari(c, TxType::InvoiceOut, 1000, "2024-01-01");
    Id pay = fx.cari(c, TxType::PaymentIn, 1000, "2024-01-02");
    REQUIRE(fx.engine().setAllocationsForPayment(pay, {{inv, 900}}).is_ok());
    auto &db = fx.book.database();

    SUBCASE("Invoice shrunk under its allocations") {
        REQUIRE(db.execute("UPDATE transactions SET amount = 500, amount_in_base = 500 WHERE id = " +
                           std::to_string(inv))
                    .is_ok());
        auto report = fx.book.checkIntegrity();
        REQUIRE(report.is_ok());
        CHECK_FALSE(report.value().ok());
        CHECK(hasRule(report.value(), "invoice_over_allocated", inv));
        CHECK_FALSE(hasRule(report.value(), "payment_over_allocated", pay));
    }

    SUBCASE("Stale base amount") {
        REQUIRE(db.execute("UPDATE transactions SET exchange_rate = 2000000 WHERE id = " + std::to_string(pay))
                    .is_ok());
        auto report = fx.book.checkIntegrity();
        REQUIRE(report.is_ok());
        CHECK(hasRule(report.value(), "amount_in_base_current", pay));
    }

    SUBCASE("Allocation pointing the wrong way") {
        Id bill = fx.cari(c, TxType::InvoiceIn, 400, "2024-01-03");
        REQUIRE(db.execute("INSERT INTO payment_allocations (payment_id, invoice_id, amount, created_at) VALUES (" +
                           std::to_string(pay) + ", " + std::to_string(bill) + ", 50, 0)")
                    .is_ok());
        auto report = fx.book.checkIntegrity();
        REQUIRE(report.is_ok());
        REQUIRE(report.value().violations.size() == 1);
        CHECK(report.value().violations[0].rule == "allocation_direction");
    }

    SUBCASE("The scan never corrects anything") {
        REQUIRE(db.execute("UPDATE transactions SET amount = 500, amount_in_base = 500 WHERE id = " +
                           std::to_string(inv))
                    .is_ok());
        fx.book.clearDirty();
        REQUIRE(fx.book.checkIntegrity().is_ok());
        CHECK(fx.allocatedTo(inv) == 900);
        CHECK_FALSE(fx.book.isDirty());
    }
}

TEST_CASE("Foreign key report") {
    LedgerFixture fx;
    Id c = fx.company();
    fx.cari(c, TxType::InvoiceOut, 1000);
    auto &db = fx.book.database();

    REQUIRE(db.execute("PRAGMA foreign_keys = OFF").is_ok());
    REQUIRE(db.execute("INSERT INTO payment_allocations (payment_id, invoice_id, amount, created_at) "
                       "VALUES (4242, 4343, 10, 0)")
                .is_ok());
    REQUIRE(db.execute("PRAGMA foreign_keys = ON").is_ok());

    auto fk = fx.book.checkForeignKeys();
    REQUIRE(fk.is_ok());
    REQUIRE_FALSE(fk.value().empty());
    CHECK(fk.value()[0].table == "payment_allocations");
    CHECK(fk.value()[0].parent == "transactions");
}
