#include <sitebook/ledger/allocation.hpp>
#include <sitebook/storage/ledger_store.hpp>

#include <algorithm>
#include <iostream>
#include <map>

namespace sitebook::ledger {

    using storage::SqliteStore;

    namespace {
        template <typename T> using Res = dp::Result<T, dp::Error>;
    }

    std::vector<AllocationRequest> autoAllocateFIFO(std::vector<OpenInvoice> invoices, Money payment_amount) {
        std::stable_sort(invoices.begin(), invoices.end(),
                         [](const OpenInvoice &a, const OpenInvoice &b) { return a.date < b.date; });

        std::vector<AllocationRequest> out;
        Money left = payment_amount;
        for (const auto &inv : invoices) {
            if (left <= 0)
                break;
            if (inv.remaining <= 0)
                continue;
            Money share = std::min(left, inv.remaining);
            out.push_back(AllocationRequest{inv.id, share});
            left -= share;
        }
        return out;
    }

    AllocationEngine::AllocationEngine(storage::LedgerStore &store) : store_(store) {}

    dp::Result<std::vector<OpenInvoice>, dp::Error> AllocationEngine::getOpenInvoices(Id entity_id, EntityKind entity,
                                                                                      TxType invoice_type) {
        return store_.openInvoices(entity_id, entity, invoice_type);
    }

    dp::Result<std::vector<AllocationRequest>, dp::Error> AllocationEngine::suggestAllocations(Id payment_id) {
        auto payment = store_.getTransaction(payment_id);
        if (payment.is_err())
            return Res<std::vector<AllocationRequest>>::err(payment.error());
        const Transaction &p = payment.value();
        if (!isPayment(p.type))
            return Res<std::vector<AllocationRequest>>::err(
                validation_error("Transaction " + std::to_string(payment_id) + " is not a payment"));

        EntityKind entity = EntityKind::Company;
        std::optional<Id> entity_id = p.company_id;
        if (p.scope == Scope::Project) {
            entity = EntityKind::Project;
            entity_id = p.project_id;
        }
        if (!entity_id)
            return Res<std::vector<AllocationRequest>>::ok({});

        auto open = store_.openInvoices(*entity_id, entity, counterpartOf(p.type), payment_id);
        if (open.is_err())
            return Res<std::vector<AllocationRequest>>::err(open.error());
        return Res<std::vector<AllocationRequest>>::ok(autoAllocateFIFO(open.value(), p.amount_in_base));
    }

    dp::Result<void, dp::Error>
    AllocationEngine::setAllocationsForPayment(Id payment_id, const std::vector<AllocationRequest> &allocations) {
        auto payment = store_.getTransaction(payment_id);
        if (payment.is_err())
            return Res<void>::err(payment.error());
        const Transaction &p = payment.value();
        if (!isPayment(p.type))
            return Res<void>::err(validation_error("Transaction " + std::to_string(payment_id) + " is not a payment"));

        // Merge duplicates, keeping first-seen order. The running total never passes
        // the payment amount, so merged shares cannot overflow.
        std::vector<AllocationRequest> merged;
        std::map<Id, std::size_t> slot;
        Money total = 0;
        for (const auto &req : allocations) {
            if (req.amount <= 0)
                return Res<void>::err(validation_error("Allocation amount must be positive"));
            if (req.amount > p.amount_in_base - total)
                return Res<void>::err(constraint_violation("Allocation exceeds payment amount"));
            total += req.amount;
            auto it = slot.find(req.invoice_id);
            if (it == slot.end()) {
                slot[req.invoice_id] = merged.size();
                merged.push_back(req);
            } else {
                merged[it->second].amount += req.amount;
            }
        }

        for (const auto &req : merged) {
            auto invoice = store_.getTransaction(req.invoice_id);
            if (invoice.is_err())
                return Res<void>::err(invoice.error());
            if (invoice.value().type != counterpartOf(p.type))
                return Res<void>::err(constraint_violation("Allocation direction does not match the payment"));

            auto others = store_.allocatedToInvoice(req.invoice_id, payment_id);
            if (others.is_err())
                return Res<void>::err(others.error());
            if (others.value() + req.amount > invoice.value().amount_in_base)
                return Res<void>::err(constraint_violation("Allocation exceeds invoice remaining balance"));
        }

        SqliteStore::Savepoint sp(store_.db_);
        if (!sp.ok())
            return Res<void>::err(storage_error("Cannot open savepoint"));
        auto replaced = store_.replaceAllocations(payment_id, merged);
        if (replaced.is_err())
            return replaced;
        auto released = sp.release();
        if (released.is_err())
            return released;

        store_.markDirty();
        std::cout << "Payment " << payment_id << " allocated " << formatMoney(total) << " "
                  << store_.config().currencyCode(Currency::Base) << " over " << merged.size()
                  << " invoices" << std::endl;
        return Res<void>::ok();
    }

    dp::Result<std::vector<AllocationDetail>, dp::Error> AllocationEngine::getAllocationsForPayment(Id payment_id) {
        return queryDetails(payment_id, true);
    }

    dp::Result<std::vector<AllocationDetail>, dp::Error> AllocationEngine::getAllocationsForInvoice(Id invoice_id) {
        return queryDetails(invoice_id, false);
    }

    dp::Result<std::vector<AllocationDetail>, dp::Error> AllocationEngine::queryDetails(Id id, bool by_payment) {
        const char *own = by_payment ? "a.payment_id" : "a.invoice_id";
        const char *other = by_payment ? "a.invoice_id" : "a.payment_id";

        SqliteStore::Statement stmt(store_.db_, std::string("SELECT a.id, a.payment_id, a.invoice_id, a.amount, t.id, "
                                                            "t.type, t.description, t.date, t.document_no, t.amount, "
                                                            "t.currency, t.amount_in_base "
                                                            "FROM payment_allocations a JOIN transactions t ON t.id = ") +
                                                    other + " WHERE " + own + " = ? ORDER BY t.date, t.id");
        if (!stmt.ok())
            return Res<std::vector<AllocationDetail>>::err(stmt.error());
        stmt.bind(1, id);

        std::vector<AllocationDetail> out;
        while (true) {
            auto row = stmt.step();
            if (row.is_err())
                return Res<std::vector<AllocationDetail>>::err(row.error());
            if (!row.value())
                break;
            AllocationDetail d;
            d.id = stmt.int64(0);
            d.payment_id = stmt.int64(1);
            d.invoice_id = stmt.int64(2);
            d.amount = stmt.int64(3);
            d.counterpart_id = stmt.int64(4);
            d.counterpart_type = parseTxType(stmt.text(5)).value_or(TxType::InvoiceOut);
            d.description = stmt.text(6);
            d.date = stmt.text(7);
            d.document_no = stmt.text(8);
            d.counterpart_amount = stmt.int64(9);
            d.counterpart_currency = parseCurrency(stmt.text(10)).value_or(Currency::Base);
            d.counterpart_base = stmt.int64(11);
            out.push_back(std::move(d));
        }
        return Res<std::vector<AllocationDetail>>::ok(std::move(out));
    }

} // namespace sitebook::ledger
