#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "ledger_fixture.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using Res = dp::Result<Id, dp::Error>;

static int64_t countRows(Sitebook &book, const std::string &table) {
    auto n = book.database().queryInt64("SELECT COUNT(*) FROM " + table);
    REQUIRE(n.is_ok());
    return n.value();
}

TEST_CASE("Commit and rollback") {
    LedgerFixture fx;

    SUBCASE("Commit keeps the work and sets the dirty flag") {
        CHECK_FALSE(fx.book.isDirty());
        auto r = fx.book.withTransaction([](Sitebook &b) -> Res {
            CompanyInput in;
            in.name = "Delta";
            auto c = b.ledger().createCompany(in);
            if (c.is_err())
                return Res::err(c.error());
            return Res::ok(c.value().id);
        });
        REQUIRE(r.is_ok());
        CHECK(fx.book.isDirty());
        CHECK(fx.store().getCompany(r.value()).is_ok());
        CHECK(fx.book.database().txState() == storage::TxState::Committed);

        fx.book.clearDirty();
        CHECK_FALSE(fx.book.isDirty());
    }

    SUBCASE("Error result undoes every step") {
        Id c = fx.company();
        Id inv = fx.cari(c, TxType::InvoiceOut, 1000, "2024-01-01");
        fx.book.clearDirty();

        auto r = fx.book.withTransaction([&](Sitebook &b) -> Res {
            TransactionInput in;
            in.scope = Scope::Cari;
            in.company_id = c;
            in.type = TxType::PaymentIn;
            in.date = "2024-01-02";
            in.description = "Payment";
            in.amount = 5000;
            auto pay = b.ledger().createTransaction(in);
            if (pay.is_err())
                return Res::err(pay.error());
            // more than the invoice holds
            auto alloc = b.allocations().setAllocationsForPayment(pay.value().id, {{inv, 2000}});
            if (alloc.is_err())
                return Res::err(alloc.error());
            return Res::ok(pay.value().id);
        });

        REQUIRE(r.is_err());
        CHECK(r.error().code == ERR_CONSTRAINT_VIOLATION);
        CHECK(countRows(fx.book, "transactions") == 1);
        CHECK(countRows(fx.book, "payment_allocations") == 0);
        CHECK_FALSE(fx.book.isDirty());
        CHECK(fx.book.database().txState() == storage::TxState::RolledBack);
    }

    SUBCASE("Exceptions roll back and propagate") {
        fx.book.clearDirty();
        CHECK_THROWS_AS(fx.book.withTransaction([](Sitebook &b) -> Res {
            CompanyInput in;
            in.name = "Thrower";
            auto c = b.ledger().createCompany(in);
            if (c.is_err())
                return Res::err(c.error());
            throw std::runtime_error("network down");
        }),
                        std::runtime_error);

        CHECK(countRows(fx.book, "companies") == 0);
        CHECK_FALSE(fx.book.isDirty());

        // The boundary is usable again afterwards
        auto r = fx.book.withTransaction([](Sitebook &b) -> Res {
            CompanyInput in;
            in.name = "After";
            auto c = b.ledger().createCompany(in);
            if (c.is_err())
                return Res::err(c.error());
            return Res::ok(c.value().id);
        });
        CHECK(r.is_ok());
    }

    SUBCASE("Non-standard exceptions roll back too") {
        fx.book.clearDirty();
        CHECK_THROWS_AS(fx.book.withTransaction([](Sitebook &b) -> Res {
            CompanyInput in;
            in.name = "Half written";
            auto c = b.ledger().createCompany(in);
            if (c.is_err())
                return Res::err(c.error());
            throw 42;
        }),
                        int);

        CHECK(countRows(fx.book, "companies") == 0);
        CHECK_FALSE(fx.book.isDirty());
        CHECK_FALSE(fx.book.database().inAnyTransaction());
        CHECK(fx.book.database().txState() == storage::TxState::RolledBack);

        auto r = fx.book.withTransaction([](Sitebook &b) -> Res {
            CompanyInput in;
            in.name = "Next";
            auto c = b.ledger().createCompany(in);
            if (c.is_err())
                return Res::err(c.error());
            return Res::ok(c.value().id);
        });
        CHECK(r.is_ok());
        CHECK(fx.book.exportSnapshot().is_ok());
    }

    SUBCASE("Earlier dirty state survives a rollback") {
        fx.company();
        REQUIRE(fx.book.isDirty());
        auto r = fx.book.withTransaction(
            [](Sitebook &) -> Res { return Res::err(validation_error("nothing to do")); });
        CHECK(r.is_err());
        CHECK(fx.book.isDirty());
    }
}

TEST_CASE("Failed transaction leaves the database image unchanged") {
    LedgerFixture fx;
    Id c = fx.company();
    Id inv = fx.cari(c, TxType::InvoiceOut, 1000, "2024-01-01");
    Id pay = fx.cari(c, TxType::PaymentIn, 400, "2024-01-03");
    REQUIRE(fx.engine().setAllocationsForPayment(pay, {{inv, 400}}).is_ok());

    auto before = fx.book.exportSnapshot();
    REQUIRE(before.is_ok());

    auto r = fx.book.withTransaction([&](Sitebook &b) -> Res {
        CompanyInput in;
        in.name = "Transient";
        auto extra = b.ledger().createCompany(in);
        if (extra.is_err())
            return Res::err(extra.error());
        auto cleared = b.allocations().setAllocationsForPayment(pay, {});
        if (cleared.is_err())
            return Res::err(cleared.error());
        auto trashed = b.ledger().deleteTransaction(inv);
        if (trashed.is_err())
            return Res::err(trashed.error());
        return Res::err(constraint_violation("abandon"));
    });
    REQUIRE(r.is_err());

    auto after = fx.book.exportSnapshot();
    REQUIRE(after.is_ok());
    CHECK(before.value() == after.value());
}

TEST_CASE("Nesting is refused") {
    LedgerFixture fx;

    auto r = fx.book.withTransaction([](Sitebook &b) -> Res {
        auto inner = b.withTransaction([](Sitebook &) -> Res { return Res::ok(0); });
        if (inner.is_err())
            return Res::err(inner.error());
        return Res::ok(1);
    });
    REQUIRE(r.is_err());
    CHECK(r.error().code == ERR_TRANSACTION_STATE);
}

TEST_CASE("Snapshots are refused mid-transaction") {
    LedgerFixture fx;

    auto r = fx.book.withTransaction([](Sitebook &b) -> Res {
        auto image = b.exportSnapshot();
        if (image.is_err())
            return Res::err(image.error());
        return Res::ok(0);
    });
    REQUIRE(r.is_err());
    CHECK(r.error().code == ERR_TRANSACTION_STATE);
}

TEST_CASE("Backup thread only sees committed states") {
    LedgerFixture fx;
    std::atomic<bool> done{false};
    std::vector<std::vector<uint8_t>> images;

    std::thread backup([&] {
        while (!done.load()) {
            if (fx.book.isDirty()) {
                auto image = fx.book.exportSnapshot();
                if (image.is_ok())
                    images.push_back(image.value());
            }
            std::this_thread::yield();
        }
    });

    for (int i = 0; i < 25; ++i) {
        auto r = fx.book.withTransaction([i](Sitebook &b) -> Res {
            for (int k = 0; k < 2; ++k) {
                CompanyInput in;
                in.name = "Pair " + std::to_string(i) + "/" + std::to_string(k);
                auto c = b.ledger().createCompany(in);
                if (c.is_err())
                    return Res::err(c.error());
            }
            return Res::ok(i);
        });
        REQUIRE(r.is_ok());
    }
    done.store(true);
    backup.join();

    for (const auto &image : images) {
        Sitebook copy;
        REQUIRE(copy.openInMemory().is_ok());
        REQUIRE(copy.loadFromSnapshot(image).is_ok());
        auto companies = copy.ledger().listCompanies(true);
        REQUIRE(companies.is_ok());
        CHECK(companies.value().size() % 2 == 0);
    }
}

TEST_CASE("Backup thread never sees half a cascade") {
    LedgerFixture fx;
    std::atomic<bool> done{false};
    std::vector<std::vector<uint8_t>> images;

    std::thread backup([&] {
        while (!done.load()) {
            auto image = fx.book.exportSnapshot();
            if (image.is_ok())
                images.push_back(image.value());
            std::this_thread::yield();
        }
    });

    // Direct store calls, each cascade runs in its own savepoint
    for (int i = 0; i < 15; ++i) {
        Id client = fx.company("Client " + std::to_string(i));
        Id project = fx.project("Site " + std::to_string(i), client);
        fx.cari(client, TxType::InvoiceOut, 1000 + i, "2024-01-01");
        fx.onProject(project, TxType::InvoiceIn, 500 + i, "2024-01-02");
        REQUIRE(fx.store().deleteCompany(client).is_ok());
    }
    done.store(true);
    backup.join();

    for (const auto &image : images) {
        Sitebook copy;
        REQUIRE(copy.openInMemory().is_ok());
        REQUIRE(copy.loadFromSnapshot(image).is_ok());
        // A company is either live or in the trash, never both
        auto both = copy.database().queryInt64("SELECT COUNT(*) FROM companies c JOIN trash t "
                                               "ON t.label = 'Company: ' || c.name");
        REQUIRE(both.is_ok());
        CHECK(both.value() == 0);
        auto orphans = copy.database().queryInt64("SELECT COUNT(*) FROM projects p WHERE client_company_id "
                                                  "NOT IN (SELECT id FROM companies)");
        REQUIRE(orphans.is_ok());
        CHECK(orphans.value() == 0);
    }
}

TEST_CASE("Open savepoints block snapshots") {
    LedgerFixture fx;
    fx.company();
    {
        storage::SqliteStore::Savepoint sp(fx.book.database());
        REQUIRE(sp.ok());
        CHECK(fx.book.database().inAnyTransaction());
        CHECK_FALSE(fx.book.database().inTransaction());

        auto image = fx.book.exportSnapshot();
        REQUIRE(image.is_err());
        CHECK(image.error().code == ERR_TRANSACTION_STATE);
    }
    CHECK_FALSE(fx.book.database().inAnyTransaction());
    CHECK(fx.book.exportSnapshot().is_ok());
}
