#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "ledger_fixture.hpp"

#include <filesystem>

TEST_CASE("Snapshot round trip") {
    LedgerFixture source;
    Id c = source.company("Round Trip Ltd");
    Id inv = source.cari(c, TxType::InvoiceOut, 2500, "2024-03-01");
    Id pay = source.cari(c, TxType::PaymentIn, 1000, "2024-03-02");
    REQUIRE(source.engine().setAllocationsForPayment(pay, {{inv, 1000}}).is_ok());

    auto image = source.book.exportSnapshot();
    REQUIRE(image.is_ok());
    CHECK_FALSE(image.value().empty());

    LedgerFixture target;
    target.company("Will be replaced");
    REQUIRE(target.book.isDirty());
    REQUIRE(target.book.loadFromSnapshot(image.value()).is_ok());
    CHECK_FALSE(target.book.isDirty());

    auto companies = target.store().listCompanies(true);
    REQUIRE(companies.is_ok());
    REQUIRE(companies.value().size() == 1);
    CHECK(companies.value()[0].name == "Round Trip Ltd");
    CHECK(target.allocatedTo(inv) == 1000);

    auto ledger = target.book.companyLedger(c);
    REQUIRE(ledger.is_ok());
    CHECK(ledger.value().receivable == 1500);

    // The loaded copy keeps working
    Id more = target.cari(c, TxType::InvoiceOut, 100, "2024-03-05");
    CHECK(more > inv);
}

TEST_CASE("Snapshot digest") {
    LedgerFixture fx;
    fx.company();
    auto image = fx.book.exportSnapshot();
    REQUIRE(image.is_ok());

    auto first = Sitebook::snapshotDigest(image.value());
    auto second = Sitebook::snapshotDigest(image.value());
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    CHECK(first.value().size() == 64);
    CHECK(first.value() == second.value());

    auto changed = image.value();
    changed.back() ^= 0xFF;
    auto third = Sitebook::snapshotDigest(changed);
    REQUIRE(third.is_ok());
    CHECK(third.value() != first.value());
}

TEST_CASE("Bad snapshots leave the ledger alone") {
    LedgerFixture fx;
    Id c = fx.company("Keeper");

    SUBCASE("Empty image") {
        auto loaded = fx.book.loadFromSnapshot({});
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == ERR_SNAPSHOT);
    }

    SUBCASE("Garbage bytes") {
        std::vector<uint8_t> junk(4096, 0x5A);
        auto loaded = fx.book.loadFromSnapshot(junk);
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == ERR_SNAPSHOT);
    }

    SUBCASE("Truncated image") {
        auto image = fx.book.exportSnapshot();
        REQUIRE(image.is_ok());
        std::vector<uint8_t> cut(image.value().begin(), image.value().begin() + 100);
        auto loaded = fx.book.loadFromSnapshot(cut);
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == ERR_SNAPSHOT);
    }

    auto kept = fx.store().getCompany(c);
    REQUIRE(kept.is_ok());
    CHECK(kept.value().name == "Keeper");
}

TEST_CASE("Older snapshots are migrated on load") {
    storage::SqliteStore old_db;
    REQUIRE(old_db.openInMemory().is_ok());
    auto migrations = storage::LedgerStore::schemaMigrations(storage::LedgerConfig{});
    REQUIRE(old_db.migrate({migrations[0]}).is_ok());
    REQUIRE(old_db.execute("INSERT INTO companies (id, kind, role, name, created_at, updated_at) "
                           "VALUES (7, 'company', 'supplier', 'Old Supplier', 0, 0)")
                .is_ok());
    auto image = old_db.serialize();
    REQUIRE(image.is_ok());

    LedgerFixture fx;
    REQUIRE(fx.book.loadFromSnapshot(image.value()).is_ok());
    CHECK(fx.book.schemaVersion() == 3);
    CHECK(fx.store().getCompany(7).is_ok());

    auto categories = fx.store().listCategories();
    REQUIRE(categories.is_ok());
    CHECK(categories.value().size() == 37);
}

TEST_CASE("File-backed ledger") {
    const std::string path = "test_snapshot_file.db";
    auto cleanup = [&] {
        for (const auto &suffix : {"", "-wal", "-shm", "-journal"}) {
            if (std::filesystem::exists(path + suffix))
                std::filesystem::remove(path + suffix);
        }
    };
    cleanup();

    std::vector<uint8_t> image;
    {
        Sitebook book;
        REQUIRE(book.open(path).is_ok());
        CompanyInput in;
        in.name = "On Disk";
        REQUIRE(book.ledger().createCompany(in).is_ok());
        auto exported = book.exportSnapshot();
        REQUIRE(exported.is_ok());
        image = exported.value();
        book.close();
        CHECK_FALSE(book.isOpen());
    }

    {
        Sitebook book;
        REQUIRE(book.open(path).is_ok());
        CHECK(book.schemaVersion() == 3);
        auto companies = book.ledger().listCompanies();
        REQUIRE(companies.is_ok());
        REQUIRE(companies.value().size() == 1);
        CHECK(companies.value()[0].name == "On Disk");
    }

    {
        LedgerFixture fx;
        REQUIRE(fx.book.loadFromSnapshot(image).is_ok());
        auto companies = fx.store().listCompanies();
        REQUIRE(companies.is_ok());
        CHECK(companies.value().size() == 1);
    }

    cleanup();
}
