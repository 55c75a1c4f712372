/**
 * Ledger demo - a small construction firm's books
 *
 * Walks through the everyday flow:
 * 1. Register a client company and a client-owned project
 * 2. Book invoices and an incoming payment
 * 3. Let the FIFO engine spread the payment over the oldest invoices
 * 4. Read the company and project ledgers
 * 5. Export a snapshot and run the integrity scan
 */

#include <sitebook.hpp>

#include <iostream>
#include <string>

using namespace sitebook;
using namespace sitebook::ledger;

static void fail(const std::string &what, const dp::Error &err) {
    std::cerr << "✗ " << what << ": " << message_of(err) << "\n";
}

int main(int argc, char **argv) {
    std::cout << "=== Sitebook Ledger Demo ===\n\n";

    Sitebook book;
    auto opened = argc > 1 ? book.open(argv[1]) : book.openInMemory();
    if (opened.is_err()) {
        fail("Cannot open ledger", opened.error());
        return 1;
    }
    std::cout << "✓ Ledger opened at schema version " << book.schemaVersion() << "\n";

    // ===========================================
    // 1. Parties and projects
    // ===========================================

    CompanyInput client_in;
    client_in.name = "Marmara Konut A.S.";
    client_in.role = CompanyRole::Customer;
    auto client = book.ledger().createCompany(client_in);
    if (client.is_err()) {
        fail("Create company", client.error());
        return 1;
    }

    ProjectInput project_in;
    project_in.name = "Kadikoy Residence";
    project_in.ownership = Ownership::Client;
    project_in.client_company_id = client.value().id;
    project_in.estimated_budget = 250000000;
    auto project = book.ledger().createProject(project_in);
    if (project.is_err()) {
        fail("Create project", project.error());
        return 1;
    }
    std::cout << "✓ Project " << project.value().code << " for " << client.value().name << "\n\n";

    // ===========================================
    // 2. Invoices and a payment, booked atomically
    // ===========================================

    const Id client_id = client.value().id;
    const Id project_id = project.value().id;
    using IdResult = dp::Result<Id, dp::Error>;

    auto payment = book.withTransaction([&](Sitebook &b) -> IdResult {
        struct Line {
            TxType type;
            const char *date;
            const char *description;
            Money amount;
        };
        const Line lines[] = {
            {TxType::InvoiceOut, "2024-01-10", "Progress bill 1", 4000000},
            {TxType::InvoiceOut, "2024-02-10", "Progress bill 2", 3500000},
            {TxType::InvoiceOut, "2024-03-10", "Progress bill 3", 5000000},
            {TxType::PaymentIn, "2024-03-20", "Bank transfer", 6000000},
        };

        Id last = 0;
        for (const auto &line : lines) {
            TransactionInput in;
            in.scope = Scope::Project;
            in.project_id = project_id;
            in.company_id = client_id;
            in.type = line.type;
            in.date = line.date;
            in.description = line.description;
            in.amount = line.amount;
            auto created = b.ledger().createTransaction(in);
            if (created.is_err())
                return IdResult::err(created.error());
            last = created.value().id;
        }
        return IdResult::ok(last);
    });
    if (payment.is_err()) {
        fail("Book transactions", payment.error());
        return 1;
    }
    std::cout << "✓ Booked three progress bills and one payment\n";

    // ===========================================
    // 3. FIFO allocation
    // ===========================================

    auto suggested = book.allocations().suggestAllocations(payment.value());
    if (suggested.is_err()) {
        fail("Suggest allocations", suggested.error());
        return 1;
    }
    for (const auto &a : suggested.value())
        std::cout << "  -> invoice " << a.invoice_id << ": " << formatMoney(a.amount) << "\n";

    auto applied = book.allocations().setAllocationsForPayment(payment.value(), suggested.value());
    if (applied.is_err()) {
        fail("Apply allocations", applied.error());
        return 1;
    }

    auto open = book.allocations().getOpenInvoices(project_id, EntityKind::Project, TxType::InvoiceOut);
    if (open.is_ok()) {
        std::cout << "\nStill open:\n";
        for (const auto &inv : open.value())
            std::cout << "  " << inv.date << " " << inv.description << ": " << formatMoney(inv.remaining) << " of "
                      << formatMoney(inv.amount_in_base) << "\n";
    }

    // ===========================================
    // 4. Ledgers
    // ===========================================

    auto project_ledger = book.projectLedger(project_id);
    if (project_ledger.is_ok()) {
        const auto &l = project_ledger.value();
        std::cout << "\nProject ledger:\n";
        std::cout << "  Income: " << formatMoney(l.total_income) << "\n";
        std::cout << "  Client receivable: " << formatMoney(l.client_receivable) << "\n";
        if (l.budget_used_percent)
            std::cout << "  Budget used: " << *l.budget_used_percent << "%\n";
    }

    const std::string &code = book.ledger().config().currencyCode(Currency::Base);
    auto summaries = book.listProjectsWithSummary();
    if (summaries.is_ok()) {
        std::cout << "\nProjects:\n";
        for (const auto &s : summaries.value())
            std::cout << "  " << s.project.code << " (" << s.client_name << "): profit "
                      << formatMoney(s.ledger.profit) << " " << code << " over " << s.transaction_count
                      << " transactions\n";
    }

    auto dashboard = book.dashboardTotals();
    if (dashboard.is_ok()) {
        std::cout << "\nDashboard:\n";
        std::cout << "  Invoiced: " << formatMoney(dashboard.value().income) << "\n";
        std::cout << "  Collected: " << formatMoney(dashboard.value().collected) << "\n";
    }

    // ===========================================
    // 5. Backup and health
    // ===========================================

    if (book.isDirty()) {
        auto image = book.exportSnapshot();
        if (image.is_ok()) {
            auto digest = Sitebook::snapshotDigest(image.value());
            book.clearDirty();
            std::cout << "\n✓ Snapshot exported (" << image.value().size() << " bytes";
            if (digest.is_ok())
                std::cout << ", sha256 " << digest.value().substr(0, 16) << "...";
            std::cout << ")\n";
        }
    }

    auto report = book.checkIntegrity();
    if (report.is_ok() && report.value().ok())
        std::cout << "✓ Integrity scan passed\n";

    auto stats = book.stats();
    if (stats.is_ok()) {
        std::cout << "\nLedger statistics:\n";
        for (const auto &t : stats.value().tables)
            std::cout << "  " << t.table << ": " << t.rows << "\n";
    }

    book.close();
    std::cout << "\n=== Demo completed successfully ===\n";
    return 0;
}
