#include <sitebook/storage/ledger_store.hpp>

#include <algorithm>
#include <iostream>
#include <map>
#include <set>

namespace sitebook::storage {

    namespace {

        template <typename T> using Res = dp::Result<T, dp::Error>;

        std::string idList(const std::vector<int64_t> &ids) {
            std::string out;
            for (auto id : ids) {
                if (!out.empty())
                    out += ", ";
                out += std::to_string(id);
            }
            return out;
        }

        template <typename Row> std::vector<int64_t> idsOf(const std::vector<Row> &rows) {
            std::vector<int64_t> out;
            out.reserve(rows.size());
            for (const auto &r : rows)
                out.push_back(r.id);
            return out;
        }

        bool rowExists(SqliteStore &db, const char *table, int64_t id) {
            SqliteStore::Statement stmt(db, std::string("SELECT 1 FROM ") + table + " WHERE id = ?");
            if (!stmt.ok())
                return false;
            stmt.bind(1, id);
            auto row = stmt.step();
            return row.is_ok() && row.value();
        }

    } // namespace

    // ===========================================
    // Delete into trash
    // ===========================================

    dp::Result<void, dp::Error> LedgerStore::deleteRowsById(const std::string &table, const std::vector<int64_t> &ids) {
        if (ids.empty())
            return Res<void>::ok();
        return db_.execute("DELETE FROM " + table + " WHERE id IN (" + idList(ids) + ")");
    }

    dp::Result<Id, dp::Error> LedgerStore::moveToTrash(const TrashBundle &bundle, const std::string &label) {
        auto bytes = bundle.toBytes();
        auto hash = computeSHA256(bytes);
        if (hash.is_err())
            return Res<Id>::err(hash.error());

        SqliteStore::Statement stmt(db_, "INSERT INTO trash (kind, label, snapshot, digest, deleted_at) "
                                         "VALUES (?, ?, ?, ?, ?)");
        if (!stmt.ok())
            return Res<Id>::err(stmt.error());
        stmt.bind(1, toString(bundle.getKind()))
            .bind(2, label)
            .bindBlob(3, bytes)
            .bind(4, hashToHex(hash.value()))
            .bind(5, currentTimestamp());
        auto inserted = stmt.run();
        if (inserted.is_err())
            return Res<Id>::err(inserted.error());
        return Res<Id>::ok(db_.lastInsertId());
    }

    dp::Result<Id, dp::Error> LedgerStore::deleteCompany(Id id) {
        auto company = getCompany(id);
        if (company.is_err())
            return Res<Id>::err(company.error());

        auto projects = queryProjects("client_company_id = ?", {id});
        if (projects.is_err())
            return Res<Id>::err(projects.error());
        auto project_ids = idsOf(projects.value());

        std::string where = "t.company_id = ?";
        if (!project_ids.empty())
            where += " OR t.project_id IN (" + idList(project_ids) + ")";
        auto txs = queryTransactions(where, {id});
        if (txs.is_err())
            return Res<Id>::err(txs.error());
        auto tx_ids = idsOf(txs.value());

        auto allocs = allocationsTouching(tx_ids);
        if (allocs.is_err())
            return Res<Id>::err(allocs.error());

        TrashBundle bundle;
        bundle.kind = static_cast<dp::u8>(TrashKind::Company);
        bundle.companies.push_back(CompanyRecord(company.value()));
        for (const auto &p : projects.value())
            bundle.projects.push_back(ProjectRecord(p));
        for (const auto &t : txs.value())
            bundle.transactions.push_back(TransactionRecord(t));
        for (const auto &a : allocs.value())
            bundle.allocations.push_back(AllocationRecord(a));

        SqliteStore::Savepoint sp(db_);
        if (!sp.ok())
            return Res<Id>::err(storage_error("Cannot open savepoint"));

        auto trash_id = moveToTrash(bundle, "Company: " + company.value().name);
        if (trash_id.is_err())
            return trash_id;

        auto removed = deleteRowsById("payment_allocations", idsOf(allocs.value()));
        if (removed.is_ok())
            removed = deleteRowsById("transactions", tx_ids);
        if (removed.is_ok())
            removed = deleteRowsById("projects", project_ids);
        if (removed.is_ok())
            removed = deleteRowsById("companies", {id});
        if (removed.is_err())
            return Res<Id>::err(removed.error());

        auto released = sp.release();
        if (released.is_err())
            return Res<Id>::err(released.error());

        markDirty();
        std::cout << "Company " << id << " moved to trash with " << tx_ids.size() << " transactions" << std::endl;
        return trash_id;
    }

    dp::Result<Id, dp::Error> LedgerStore::deleteProject(Id id) {
        auto project = getProject(id);
        if (project.is_err())
            return Res<Id>::err(project.error());

        auto txs = queryTransactions("t.project_id = ?", {id});
        if (txs.is_err())
            return Res<Id>::err(txs.error());
        auto tx_ids = idsOf(txs.value());
        auto allocs = allocationsTouching(tx_ids);
        if (allocs.is_err())
            return Res<Id>::err(allocs.error());

        TrashBundle bundle;
        bundle.kind = static_cast<dp::u8>(TrashKind::Project);
        bundle.projects.push_back(ProjectRecord(project.value()));
        for (const auto &t : txs.value())
            bundle.transactions.push_back(TransactionRecord(t));
        for (const auto &a : allocs.value())
            bundle.allocations.push_back(AllocationRecord(a));

        SqliteStore::Savepoint sp(db_);
        if (!sp.ok())
            return Res<Id>::err(storage_error("Cannot open savepoint"));

        auto trash_id = moveToTrash(bundle, "Project: " + project.value().code + " " + project.value().name);
        if (trash_id.is_err())
            return trash_id;

        auto removed = deleteRowsById("payment_allocations", idsOf(allocs.value()));
        if (removed.is_ok())
            removed = deleteRowsById("transactions", tx_ids);
        if (removed.is_ok())
            removed = deleteRowsById("projects", {id});
        if (removed.is_err())
            return Res<Id>::err(removed.error());

        auto released = sp.release();
        if (released.is_err())
            return Res<Id>::err(released.error());

        markDirty();
        std::cout << "Project " << id << " moved to trash with " << tx_ids.size() << " transactions" << std::endl;
        return trash_id;
    }

    dp::Result<Id, dp::Error> LedgerStore::deleteTransaction(Id id) {
        auto tx = getTransaction(id);
        if (tx.is_err())
            return Res<Id>::err(tx.error());

        auto allocs = allocationsTouching({id});
        if (allocs.is_err())
            return Res<Id>::err(allocs.error());

        TrashBundle bundle;
        bundle.kind = static_cast<dp::u8>(TrashKind::Transaction);
        bundle.transactions.push_back(TransactionRecord(tx.value()));
        for (const auto &a : allocs.value())
            bundle.allocations.push_back(AllocationRecord(a));

        SqliteStore::Savepoint sp(db_);
        if (!sp.ok())
            return Res<Id>::err(storage_error("Cannot open savepoint"));

        auto trash_id = moveToTrash(bundle, std::string(toString(tx.value().type)) + ": " + tx.value().description);
        if (trash_id.is_err())
            return trash_id;

        // Payments that pointed at this invoice through the legacy link lose it
        SqliteStore::Statement unlink(db_, "UPDATE transactions SET linked_invoice_id = NULL WHERE linked_invoice_id = ?");
        if (!unlink.ok())
            return Res<Id>::err(unlink.error());
        unlink.bind(1, id);

        auto removed = deleteRowsById("payment_allocations", idsOf(allocs.value()));
        if (removed.is_ok())
            removed = unlink.run();
        if (removed.is_ok())
            removed = deleteRowsById("transactions", {id});
        if (removed.is_err())
            return Res<Id>::err(removed.error());

        auto released = sp.release();
        if (released.is_err())
            return Res<Id>::err(released.error());

        markDirty();
        return trash_id;
    }

    // ===========================================
    // Trash listing and restore
    // ===========================================

    dp::Result<std::vector<TrashEntry>, dp::Error> LedgerStore::listTrash() {
        SqliteStore::Statement stmt(db_, "SELECT id, kind, label, digest, length(snapshot), deleted_at FROM trash "
                                         "ORDER BY deleted_at DESC, id DESC");
        if (!stmt.ok())
            return Res<std::vector<TrashEntry>>::err(stmt.error());

        std::vector<TrashEntry> out;
        while (true) {
            auto row = stmt.step();
            if (row.is_err())
                return Res<std::vector<TrashEntry>>::err(row.error());
            if (!row.value())
                break;
            TrashEntry e;
            e.id = stmt.int64(0);
            e.kind = parseTrashKind(stmt.text(1)).value_or(TrashKind::Transaction);
            e.label = stmt.text(2);
            e.digest = stmt.text(3);
            e.snapshot_size = static_cast<std::size_t>(stmt.int64(4));
            e.deleted_at = stmt.int64(5);
            out.push_back(std::move(e));
        }
        return Res<std::vector<TrashEntry>>::ok(std::move(out));
    }

    dp::Result<void, dp::Error> LedgerStore::restoreTrash(Id trash_id) {
        SqliteStore::Statement load(db_, "SELECT snapshot, digest, label FROM trash WHERE id = ?");
        if (!load.ok())
            return Res<void>::err(load.error());
        load.bind(1, trash_id);
        auto found = load.step();
        if (found.is_err())
            return Res<void>::err(found.error());
        if (!found.value())
            return Res<void>::err(not_found_error("Trash entry " + std::to_string(trash_id) + " not found"));

        auto bytes = load.blob(0);
        std::string digest = load.text(1);
        std::string label = load.text(2);

        auto hash = computeSHA256(bytes);
        if (hash.is_err())
            return Res<void>::err(hash.error());
        if (hashToHex(hash.value()) != digest)
            return Res<void>::err(integrity_error("Trash entry " + std::to_string(trash_id) + " failed digest check"));

        auto decoded = TrashBundle::fromBytes(bytes);
        if (decoded.is_err())
            return Res<void>::err(integrity_error("Trash entry " + std::to_string(trash_id) +
                                                  " is unreadable: " + message_of(decoded.error())));
        const TrashBundle &bundle = decoded.value();

        SqliteStore::Savepoint sp(db_);
        if (!sp.ok())
            return Res<void>::err(storage_error("Cannot open savepoint"));

        for (const auto &rec : bundle.companies) {
            Company c = rec.toCompany();
            if (rowExists(db_, "companies", c.id))
                return Res<void>::err(
                    constraint_violation("Restored company " + c.name + " conflicts with an existing record"));
            c.is_active = true;
            auto inserted = insertCompanyRow(c);
            if (inserted.is_err())
                return inserted;
        }

        for (const auto &rec : bundle.projects) {
            Project p = rec.toProject();
            if (rowExists(db_, "projects", p.id))
                return Res<void>::err(
                    constraint_violation("Restored project " + p.code + " conflicts with an existing record"));
            if (p.client_company_id && !rowExists(db_, "companies", *p.client_company_id))
                return Res<void>::err(constraint_violation("Client company of project " + p.code + " no longer exists"));
            auto taken = validateProject(p, p.id);
            if (taken.is_err())
                return taken;
            p.is_active = true;
            auto inserted = insertProjectRow(p);
            if (inserted.is_err())
                return inserted;
        }

        std::set<int64_t> restored;
        std::vector<std::pair<int64_t, int64_t>> legacy_links;
        for (const auto &rec : bundle.transactions) {
            Transaction t = rec.toTransaction();
            if (rowExists(db_, "transactions", t.id))
                return Res<void>::err(constraint_violation("Restored transaction " + t.description +
                                                           " conflicts with an existing record"));
            if (t.company_id && !rowExists(db_, "companies", *t.company_id))
                return Res<void>::err(constraint_violation("Company of restored transaction " + t.description +
                                                           " no longer exists"));
            if (t.project_id && !rowExists(db_, "projects", *t.project_id))
                return Res<void>::err(constraint_violation("Project of restored transaction " + t.description +
                                                           " no longer exists"));
            if (t.category_id && !rowExists(db_, "categories", *t.category_id))
                t.category_id.reset();
            if (t.legacy_invoice_id) {
                legacy_links.emplace_back(t.id, *t.legacy_invoice_id);
                t.legacy_invoice_id.reset();
            }
            auto inserted = insertTransactionRow(t);
            if (inserted.is_err())
                return inserted;
            restored.insert(t.id);
        }

        for (const auto &link : legacy_links) {
            if (!rowExists(db_, "transactions", link.second))
                continue;
            SqliteStore::Statement relink(db_, "UPDATE transactions SET linked_invoice_id = ? WHERE id = ?");
            if (!relink.ok())
                return Res<void>::err(relink.error());
            relink.bind(1, link.second).bind(2, link.first);
            auto updated = relink.run();
            if (updated.is_err())
                return updated;
        }

        std::set<int64_t> touched;
        for (const auto &rec : bundle.allocations) {
            PaymentAllocation a = rec.toAllocation();
            if (!rowExists(db_, "transactions", a.payment_id) || !rowExists(db_, "transactions", a.invoice_id))
                continue;
            SqliteStore::Statement insert(db_, "INSERT INTO payment_allocations (id, payment_id, invoice_id, amount, "
                                               "created_at) VALUES (?, ?, ?, ?, ?)");
            if (!insert.ok())
                return Res<void>::err(insert.error());
            if (rowExists(db_, "payment_allocations", a.id))
                insert.bindNull(1);
            else
                insert.bind(1, a.id);
            insert.bind(2, a.payment_id).bind(3, a.invoice_id).bind(4, a.amount).bind(5, a.created_at);
            auto inserted = insert.run();
            if (inserted.is_err())
                return inserted;
            touched.insert(a.payment_id);
            touched.insert(a.invoice_id);
        }

        // Rows booked while the entry sat in the trash may leave no room for the restored shares
        for (auto tx_id : touched) {
            auto tx = getTransaction(tx_id);
            if (tx.is_err())
                return Res<void>::err(tx.error());
            if (tx.value().allocated_amount > tx.value().amount_in_base) {
                return Res<void>::err(constraint_violation(
                    isPayment(tx.value().type) ? "Allocation exceeds payment amount"
                                               : "Allocation exceeds invoice remaining balance"));
            }
        }

        SqliteStore::Statement drop(db_, "DELETE FROM trash WHERE id = ?");
        if (!drop.ok())
            return Res<void>::err(drop.error());
        drop.bind(1, trash_id);
        auto dropped = drop.run();
        if (dropped.is_err())
            return dropped;

        auto released = sp.release();
        if (released.is_err())
            return released;

        markDirty();
        std::cout << "Restored trash entry " << trash_id << " (" << label << ")" << std::endl;
        return Res<void>::ok();
    }

    dp::Result<void, dp::Error> LedgerStore::purgeTrash(Id trash_id) {
        SqliteStore::Statement stmt(db_, "DELETE FROM trash WHERE id = ?");
        if (!stmt.ok())
            return Res<void>::err(stmt.error());
        stmt.bind(1, trash_id);
        auto removed = stmt.run();
        if (removed.is_err())
            return removed;
        if (db_.changes() == 0)
            return Res<void>::err(not_found_error("Trash entry " + std::to_string(trash_id) + " not found"));
        markDirty();
        return Res<void>::ok();
    }

    dp::Result<int64_t, dp::Error> LedgerStore::emptyTrash() {
        auto removed = db_.execute("DELETE FROM trash");
        if (removed.is_err())
            return Res<int64_t>::err(removed.error());
        int64_t count = db_.changes();
        if (count > 0)
            markDirty();
        return Res<int64_t>::ok(count);
    }

} // namespace sitebook::storage
