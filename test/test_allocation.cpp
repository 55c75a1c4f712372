#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "ledger_fixture.hpp"

#include <limits>

static OpenInvoice openInvoice(Id id, const std::string &date, Money remaining) {
    OpenInvoice inv;
    inv.id = id;
    inv.date = date;
    inv.amount_in_base = remaining;
    inv.remaining = remaining;
    return inv;
}

// ===========================================
// Pure FIFO distribution
// ===========================================

TEST_CASE("FIFO distribution") {
    SUBCASE("Oldest invoice is paid first") {
        std::vector<OpenInvoice> open = {openInvoice(2, "2024-03-01", 500), openInvoice(1, "2024-01-01", 300),
                                         openInvoice(3, "2024-02-01", 400)};
        auto plan = autoAllocateFIFO(open, 600);
        REQUIRE(plan.size() == 2);
        CHECK(plan[0] == AllocationRequest{1, 300});
        CHECK(plan[1] == AllocationRequest{3, 300});
    }

    SUBCASE("Equal dates keep input order") {
        std::vector<OpenInvoice> open = {openInvoice(7, "2024-01-01", 100), openInvoice(5, "2024-01-01", 100)};
        auto plan = autoAllocateFIFO(open, 150);
        REQUIRE(plan.size() == 2);
        CHECK(plan[0].invoice_id == 7);
        CHECK(plan[1] == AllocationRequest{5, 50});
    }

    SUBCASE("Settled invoices are skipped") {
        std::vector<OpenInvoice> open = {openInvoice(1, "2024-01-01", 0), openInvoice(2, "2024-02-01", 80)};
        auto plan = autoAllocateFIFO(open, 100);
        REQUIRE(plan.size() == 1);
        CHECK(plan[0] == AllocationRequest{2, 80});
    }

    SUBCASE("Payment larger than all invoices leaves a remainder") {
        std::vector<OpenInvoice> open = {openInvoice(1, "2024-01-01", 100), openInvoice(2, "2024-01-02", 100)};
        auto plan = autoAllocateFIFO(open, 1000);
        Money total = 0;
        for (const auto &r : plan)
            total += r.amount;
        CHECK(total == 200);
    }

    SUBCASE("Nothing to distribute") {
        CHECK(autoAllocateFIFO({}, 500).empty());
        CHECK(autoAllocateFIFO({openInvoice(1, "2024-01-01", 100)}, 0).empty());
    }

    SUBCASE("Same input, same plan; shares bounded; no older invoice skipped") {
        std::vector<OpenInvoice> open;
        for (int i = 0; i < 12; ++i) {
            std::string date = "2024-0" + std::to_string(1 + (i * 5) % 9) + "-1" + std::to_string(i % 10);
            open.push_back(openInvoice(i + 1, date, 100 + 37 * i));
        }
        for (Money payment : {0, 1, 250, 999, 5000, 100000}) {
            auto plan = autoAllocateFIFO(open, payment);
            CHECK(plan == autoAllocateFIFO(open, payment));

            Money total = 0;
            for (size_t k = 0; k < plan.size(); ++k) {
                const auto &req = plan[k];
                auto it = std::find_if(open.begin(), open.end(), [&](const OpenInvoice &o) { return o.id == req.invoice_id; });
                REQUIRE(it != open.end());
                CHECK(req.amount > 0);
                CHECK(req.amount <= it->remaining);
                // every invoice before the last one is paid in full
                if (k + 1 < plan.size())
                    CHECK(req.amount == it->remaining);
                total += req.amount;
            }
            CHECK(total <= payment);

            // any invoice older than the newest one touched must be in the plan
            if (!plan.empty()) {
                auto newest = std::find_if(open.begin(), open.end(),
                                           [&](const OpenInvoice &o) { return o.id == plan.back().invoice_id; });
                for (const auto &o : open) {
                    if (o.date < newest->date) {
                        bool present = std::any_of(plan.begin(), plan.end(),
                                                   [&](const AllocationRequest &r) { return r.invoice_id == o.id; });
                        CHECK(present);
                    }
                }
            }
        }
    }
}

// ===========================================
// Stored allocations
// ===========================================

TEST_CASE("Open invoices") {
    LedgerFixture fx;
    Id c = fx.company();
    Id older = fx.cari(c, TxType::InvoiceOut, 1000, "2024-01-01");
    Id newer = fx.cari(c, TxType::InvoiceOut, 2000, "2024-02-01");
    fx.cari(c, TxType::InvoiceIn, 700, "2023-12-01");
    Id pay = fx.cari(c, TxType::PaymentIn, 1000, "2024-02-10");

    SUBCASE("Remaining balance, oldest first") {
        auto open = fx.engine().getOpenInvoices(c, EntityKind::Company, TxType::InvoiceOut);
        REQUIRE(open.is_ok());
        REQUIRE(open.value().size() == 2);
        CHECK(open.value()[0].id == older);
        CHECK(open.value()[0].remaining == 1000);
        CHECK(open.value()[1].id == newer);
    }

    SUBCASE("Fully allocated invoices drop out") {
        REQUIRE(fx.engine().setAllocationsForPayment(pay, {{older, 1000}}).is_ok());
        auto open = fx.engine().getOpenInvoices(c, EntityKind::Company, TxType::InvoiceOut);
        REQUIRE(open.is_ok());
        REQUIRE(open.value().size() == 1);
        CHECK(open.value()[0].id == newer);
    }

    SUBCASE("Only invoice types are accepted") {
        auto r = fx.engine().getOpenInvoices(c, EntityKind::Company, TxType::PaymentIn);
        REQUIRE(r.is_err());
        CHECK(r.error().code == ERR_VALIDATION);
    }

    SUBCASE("Project view") {
        Id p = fx.project();
        Id pinv = fx.onProject(p, TxType::InvoiceIn, 400, "2024-05-01", c);
        auto open = fx.engine().getOpenInvoices(p, EntityKind::Project, TxType::InvoiceIn);
        REQUIRE(open.is_ok());
        REQUIRE(open.value().size() == 1);
        CHECK(open.value()[0].id == pinv);
        CHECK(open.value()[0].company_name == "Acme Yapi");
    }
}

TEST_CASE("Auto allocation across two payments") {
    LedgerFixture fx;
    Id c = fx.company();
    Id inv = fx.cari(c, TxType::InvoiceOut, 10000, "2024-01-01");

    Id first = fx.cari(c, TxType::PaymentIn, 6000, "2024-01-10");
    auto plan = fx.engine().suggestAllocations(first);
    REQUIRE(plan.is_ok());
    REQUIRE(plan.value().size() == 1);
    CHECK(plan.value()[0] == AllocationRequest{inv, 6000});
    REQUIRE(fx.engine().setAllocationsForPayment(first, plan.value()).is_ok());
    CHECK(fx.allocatedTo(inv) == 6000);

    auto open = fx.engine().getOpenInvoices(c, EntityKind::Company, TxType::InvoiceOut);
    REQUIRE(open.is_ok());
    REQUIRE(open.value().size() == 1);
    CHECK(open.value()[0].remaining == 4000);

    Id second = fx.cari(c, TxType::PaymentIn, 5000, "2024-01-20");
    plan = fx.engine().suggestAllocations(second);
    REQUIRE(plan.is_ok());
    REQUIRE(plan.value().size() == 1);
    CHECK(plan.value()[0] == AllocationRequest{inv, 4000});
    REQUIRE(fx.engine().setAllocationsForPayment(second, plan.value()).is_ok());

    CHECK(fx.allocatedTo(inv) == 10000);
    CHECK(fx.allocatedFrom(second) == 4000);

    auto payment = fx.store().getTransaction(second);
    REQUIRE(payment.is_ok());
    CHECK(payment.value().amount_in_base - payment.value().allocated_amount == 1000);

    open = fx.engine().getOpenInvoices(c, EntityKind::Company, TxType::InvoiceOut);
    REQUIRE(open.is_ok());
    CHECK(open.value().empty());
}

TEST_CASE("Suggestions ignore the payment's own shares") {
    LedgerFixture fx;
    Id c = fx.company();
    Id inv = fx.cari(c, TxType::InvoiceIn, 3000, "2024-01-01");
    Id pay = fx.cari(c, TxType::PaymentOut, 2000, "2024-01-05");
    REQUIRE(fx.engine().setAllocationsForPayment(pay, {{inv, 500}}).is_ok());

    auto plan = fx.engine().suggestAllocations(pay);
    REQUIRE(plan.is_ok());
    REQUIRE(plan.value().size() == 1);
    CHECK(plan.value()[0] == AllocationRequest{inv, 2000});

    SUBCASE("Invoices cannot be used as payments") {
        auto r = fx.engine().suggestAllocations(inv);
        REQUIRE(r.is_err());
        CHECK(r.error().code == ERR_VALIDATION);
    }
}

TEST_CASE("Allocation set validation") {
    LedgerFixture fx;
    Id c = fx.company();
    Id inv1 = fx.cari(c, TxType::InvoiceOut, 5000, "2024-01-01");
    Id inv2 = fx.cari(c, TxType::InvoiceOut, 3000, "2024-01-02");
    Id supplier_inv = fx.cari(c, TxType::InvoiceIn, 3000, "2024-01-03");
    Id pay = fx.cari(c, TxType::PaymentIn, 6000, "2024-01-10");
    Id other = fx.cari(c, TxType::PaymentIn, 4000, "2024-01-11");
    REQUIRE(fx.engine().setAllocationsForPayment(other, {{inv1, 3000}}).is_ok());

    SUBCASE("Batch over one invoice's remaining balance is refused and nothing changes") {
        REQUIRE(fx.engine().setAllocationsForPayment(pay, {{inv2, 1000}}).is_ok());

        auto r = fx.engine().setAllocationsForPayment(pay, {{inv1, 1500}, {inv1, 1000}});
        REQUIRE(r.is_err());
        CHECK(r.error().code == ERR_CONSTRAINT_VIOLATION);
        CHECK(message_of(r.error()).find("invoice remaining balance") != std::string::npos);

        CHECK(fx.allocatedTo(inv1) == 3000);
        CHECK(fx.allocatedTo(inv2) == 1000);
        CHECK(fx.allocatedFrom(pay) == 1000);
    }

    SUBCASE("Batch over the payment amount is refused") {
        Id inv3 = fx.cari(c, TxType::InvoiceOut, 5000, "2024-01-04");
        auto r = fx.engine().setAllocationsForPayment(pay, {{inv2, 3000}, {inv3, 3001}});
        REQUIRE(r.is_err());
        CHECK(r.error().code == ERR_CONSTRAINT_VIOLATION);
        CHECK(message_of(r.error()).find("payment amount") != std::string::npos);
        CHECK(fx.allocatedFrom(pay) == 0);

        r = fx.engine().setAllocationsForPayment(pay, {{inv2, 3000}, {inv3, 3000}});
        CHECK(r.is_ok());
        CHECK(fx.allocatedFrom(pay) == 6000);
    }

    SUBCASE("Huge duplicate shares are refused before merging") {
        const Money huge = std::numeric_limits<Money>::max();
        auto r = fx.engine().setAllocationsForPayment(pay, {{inv2, 4000}, {inv2, huge}, {inv2, huge}});
        REQUIRE(r.is_err());
        CHECK(r.error().code == ERR_CONSTRAINT_VIOLATION);
        CHECK(message_of(r.error()).find("payment amount") != std::string::npos);
        CHECK(fx.allocatedFrom(pay) == 0);
    }

    SUBCASE("Duplicates are merged") {
        REQUIRE(fx.engine().setAllocationsForPayment(pay, {{inv2, 1000}, {inv2, 500}}).is_ok());
        auto rows = fx.engine().getAllocationsForPayment(pay);
        REQUIRE(rows.is_ok());
        REQUIRE(rows.value().size() == 1);
        CHECK(rows.value()[0].amount == 1500);
    }

    SUBCASE("Direction must match") {
        auto r = fx.engine().setAllocationsForPayment(pay, {{supplier_inv, 100}});
        REQUIRE(r.is_err());
        CHECK(r.error().code == ERR_CONSTRAINT_VIOLATION);
        CHECK(message_of(r.error()) == "Allocation direction does not match the payment");
        CHECK(message_of(r.error()).find(std::to_string(supplier_inv)) == std::string::npos);

        r = fx.engine().setAllocationsForPayment(pay, {{other, 100}});
        REQUIRE(r.is_err());
        CHECK(r.error().code == ERR_CONSTRAINT_VIOLATION);
    }

    SUBCASE("Amounts must be positive") {
        auto r = fx.engine().setAllocationsForPayment(pay, {{inv2, 0}});
        REQUIRE(r.is_err());
        CHECK(r.error().code == ERR_VALIDATION);
    }

    SUBCASE("Unknown ids") {
        auto r = fx.engine().setAllocationsForPayment(pay, {{9999, 10}});
        REQUIRE(r.is_err());
        CHECK(r.error().code == ERR_NOT_FOUND);

        r = fx.engine().setAllocationsForPayment(9999, {{inv2, 10}});
        REQUIRE(r.is_err());
        CHECK(r.error().code == ERR_NOT_FOUND);
    }

    SUBCASE("Only payments take allocation sets") {
        auto r = fx.engine().setAllocationsForPayment(inv2, {{inv1, 10}});
        REQUIRE(r.is_err());
        CHECK(r.error().code == ERR_VALIDATION);
    }

    SUBCASE("Replacing a set frees the old shares") {
        REQUIRE(fx.engine().setAllocationsForPayment(pay, {{inv1, 2000}}).is_ok());
        CHECK(fx.allocatedTo(inv1) == 5000);
        REQUIRE(fx.engine().setAllocationsForPayment(pay, {{inv2, 2000}}).is_ok());
        CHECK(fx.allocatedTo(inv1) == 3000);
        REQUIRE(fx.engine().setAllocationsForPayment(pay, {}).is_ok());
        CHECK(fx.allocatedFrom(pay) == 0);
    }
}

TEST_CASE("Allocation details") {
    LedgerFixture fx;
    Id c = fx.company();
    Id inv_late = fx.cari(c, TxType::InvoiceOut, 500, "2024-03-01");
    Id inv_early = fx.cari(c, TxType::InvoiceOut, 700, "2024-01-01");
    Id pay_a = fx.cari(c, TxType::PaymentIn, 900, "2024-03-05");
    Id pay_b = fx.cari(c, TxType::PaymentIn, 300, "2024-03-02");
    REQUIRE(fx.engine().setAllocationsForPayment(pay_a, {{inv_late, 200}, {inv_early, 700}}).is_ok());
    REQUIRE(fx.engine().setAllocationsForPayment(pay_b, {{inv_late, 300}}).is_ok());

    SUBCASE("Payment view lists invoices oldest first") {
        auto rows = fx.engine().getAllocationsForPayment(pay_a);
        REQUIRE(rows.is_ok());
        REQUIRE(rows.value().size() == 2);
        CHECK(rows.value()[0].counterpart_id == inv_early);
        CHECK(rows.value()[0].amount == 700);
        CHECK(rows.value()[0].counterpart_type == TxType::InvoiceOut);
        CHECK(rows.value()[0].date == "2024-01-01");
        CHECK(rows.value()[1].counterpart_id == inv_late);
    }

    SUBCASE("Invoice view lists payments oldest first") {
        auto rows = fx.engine().getAllocationsForInvoice(inv_late);
        REQUIRE(rows.is_ok());
        REQUIRE(rows.value().size() == 2);
        CHECK(rows.value()[0].counterpart_id == pay_b);
        CHECK(rows.value()[1].counterpart_id == pay_a);
        CHECK(rows.value()[1].amount == 200);
    }

    SUBCASE("Allocated amount is derived on read") {
        auto invoice = fx.store().getTransaction(inv_late);
        REQUIRE(invoice.is_ok());
        CHECK(invoice.value().allocated_amount == 500);
        auto payment = fx.store().getTransaction(pay_a);
        REQUIRE(payment.is_ok());
        CHECK(payment.value().allocated_amount == 900);
    }
}

// ===========================================
// Legacy links
// ===========================================

TEST_CASE("Legacy invoice links become allocations") {
    storage::SqliteStore db;
    REQUIRE(db.openInMemory().is_ok());
    auto migrations = storage::LedgerStore::schemaMigrations(storage::LedgerConfig{});
    REQUIRE(db.migrate({migrations[0]}).is_ok());

    REQUIRE(db.execute("INSERT INTO companies (id, kind, role, name, created_at, updated_at) "
                       "VALUES (1, 'company', 'customer', 'Old Client', 0, 0)")
                .is_ok());
    REQUIRE(db.execute("INSERT INTO transactions (id, scope, company_id, type, date, description, amount, "
                       "amount_in_base, created_at, updated_at) VALUES "
                       "(1, 'cari', 1, 'invoice_out', '2023-01-01', 'Old invoice', 1000, 1000, 0, 0), "
                       "(2, 'cari', 1, 'invoice_out', '2023-01-02', 'Small invoice', 300, 300, 0, 0)")
                .is_ok());
    REQUIRE(db.execute("INSERT INTO transactions (id, scope, company_id, type, date, description, amount, "
                       "amount_in_base, linked_invoice_id, created_at, updated_at) VALUES "
                       "(3, 'cari', 1, 'payment_in', '2023-02-01', 'Part payment', 400, 400, 1, 0, 0), "
                       "(4, 'cari', 1, 'payment_in', '2023-02-02', 'Overpayment', 500, 500, 2, 0, 0)")
                .is_ok());

    storage::LedgerStore store(db);
    REQUIRE(store.initializeSchema().is_ok());
    CHECK(db.schemaVersion() == 3);

    auto part = store.allocationRowsForPayment(3);
    REQUIRE(part.is_ok());
    REQUIRE(part.value().size() == 1);
    CHECK(part.value()[0].invoice_id == 1);
    CHECK(part.value()[0].amount == 400);

    // capped at the invoice amount
    auto over = store.allocatedToInvoice(2);
    REQUIRE(over.is_ok());
    CHECK(over.value() == 300);

    auto tx = store.getTransaction(3);
    REQUIRE(tx.is_ok());
    CHECK(tx.value().legacy_invoice_id == std::optional<Id>(1));
}
