#include <sitebook/storage/sqlite_store.hpp>

#include <chrono>
#include <cstring>
#include <iostream>
#include <keylock/keylock.hpp>
#include <sqlite3.h>

namespace sitebook::storage {

    // ===========================================
    // Utility functions implementation
    // ===========================================

    int64_t currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    dp::Result<std::vector<uint8_t>, dp::Error> computeSHA256(const std::vector<uint8_t> &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto result = crypto.hash(data);
        if (!result.success) {
            return dp::Result<std::vector<uint8_t>, dp::Error>::err(dp::Error::io_error("SHA256 hashing failed"));
        }
        return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result.data);
    }

    std::string hashToHex(const std::vector<uint8_t> &hash) { return keylock::keylock::to_hex(hash); }

    // ===========================================
    // SqliteStore lifecycle
    // ===========================================

    SqliteStore::SqliteStore() : db_(nullptr), is_open_(false), tx_state_(TxState::Idle) {}

    SqliteStore::~SqliteStore() { close(); }

    SqliteStore::SqliteStore(SqliteStore &&other) noexcept
        : db_(other.db_), db_path_(std::move(other.db_path_)), is_open_(other.is_open_), opts_(other.opts_),
          tx_state_(other.tx_state_), migrations_(std::move(other.migrations_)) {
        other.db_ = nullptr;
        other.is_open_ = false;
        other.tx_state_ = TxState::Idle;
    }

    SqliteStore &SqliteStore::operator=(SqliteStore &&other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            db_path_ = std::move(other.db_path_);
            is_open_ = other.is_open_;
            opts_ = other.opts_;
            tx_state_ = other.tx_state_;
            migrations_ = std::move(other.migrations_);
            other.db_ = nullptr;
            other.is_open_ = false;
            other.tx_state_ = TxState::Idle;
        }
        return *this;
    }

    dp::Result<void, dp::Error> SqliteStore::open(const std::string &path, const OpenOptions &opts) {
        if (is_open_) {
            return dp::Result<void, dp::Error>::err(storage_error("Database already open: " + db_path_));
        }
        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            std::cerr << "Failed to open database " << path << ": " << msg << std::endl;
            return dp::Result<void, dp::Error>::err(storage_error("Cannot open database: " + msg));
        }

        db_path_ = path;
        is_open_ = true;
        opts_ = opts;
        tx_state_ = TxState::Idle;
        applyPragmas(db_, opts);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> SqliteStore::openInMemory(const OpenOptions &opts) { return open(":memory:", opts); }

    void SqliteStore::close() {
        if (db_) {
            if (tx_state_ == TxState::Begun) {
                sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            }
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
            tx_state_ = TxState::Idle;
        }
    }

    bool SqliteStore::isOpen() const { return is_open_; }

    void SqliteStore::applyPragmas(sqlite3 *db, const OpenOptions &opts) {
        if (!db)
            return;

        if (opts.enable_wal) {
            sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        if (opts.enable_foreign_keys) {
            sqlite3_exec(db, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
        }

        std::string busy_timeout = "PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";";
        sqlite3_exec(db, busy_timeout.c_str(), nullptr, nullptr, nullptr);

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
        sqlite3_exec(db, cache_size.c_str(), nullptr, nullptr, nullptr);

        std::string sync_mode;
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        sqlite3_exec(db, sync_mode.c_str(), nullptr, nullptr, nullptr);
    }

    dp::Result<void, dp::Error> SqliteStore::exec(sqlite3 *db, const std::string &sql) {
        if (!db)
            return dp::Result<void, dp::Error>::err(storage_error("Database is not open"));

        char *errmsg = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : sqlite3_errstr(rc);
            if (errmsg) {
                sqlite3_free(errmsg);
            }
            return dp::Result<void, dp::Error>::err(storage_error(msg));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> SqliteStore::execute(const std::string &sql) { return exec(db_, sql); }

    dp::Result<int64_t, dp::Error> SqliteStore::queryInt64(const std::string &sql) {
        Statement stmt(*this, sql);
        if (!stmt.ok())
            return dp::Result<int64_t, dp::Error>::err(stmt.error());
        auto row = stmt.step();
        if (row.is_err())
            return dp::Result<int64_t, dp::Error>::err(row.error());
        return dp::Result<int64_t, dp::Error>::ok(row.value() ? stmt.int64(0) : 0);
    }

    int64_t SqliteStore::lastInsertId() const { return db_ ? sqlite3_last_insert_rowid(db_) : 0; }

    int SqliteStore::changes() const { return db_ ? sqlite3_changes(db_) : 0; }

    int64_t SqliteStore::sizeBytes() {
        auto pages = queryInt64("PRAGMA page_count");
        auto page_size = queryInt64("PRAGMA page_size");
        if (pages.is_err() || page_size.is_err())
            return 0;
        return pages.value() * page_size.value();
    }

    // ===========================================
    // Statement
    // ===========================================

    SqliteStore::Statement::Statement(SqliteStore &store, const std::string &sql)
        : db_(store.db_), stmt_(nullptr), prepare_rc_(SQLITE_MISUSE) {
        if (db_) {
            prepare_rc_ = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
            if (prepare_rc_ != SQLITE_OK && stmt_) {
                sqlite3_finalize(stmt_);
                stmt_ = nullptr;
            }
        }
    }

    SqliteStore::Statement::~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    dp::Error SqliteStore::Statement::error() const {
        if (!db_)
            return storage_error("Database is not open");
        return storage_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
    }

    SqliteStore::Statement &SqliteStore::Statement::bind(int idx, int64_t value) {
        if (stmt_)
            sqlite3_bind_int64(stmt_, idx, value);
        return *this;
    }

    SqliteStore::Statement &SqliteStore::Statement::bind(int idx, const std::string &value) {
        if (stmt_)
            sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
        return *this;
    }

    SqliteStore::Statement &SqliteStore::Statement::bind(int idx, const std::optional<int64_t> &value) {
        if (!stmt_)
            return *this;
        if (value) {
            sqlite3_bind_int64(stmt_, idx, *value);
        } else {
            sqlite3_bind_null(stmt_, idx);
        }
        return *this;
    }

    SqliteStore::Statement &SqliteStore::Statement::bindBlob(int idx, const std::vector<uint8_t> &value) {
        if (stmt_)
            sqlite3_bind_blob(stmt_, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        return *this;
    }

    SqliteStore::Statement &SqliteStore::Statement::bindNull(int idx) {
        if (stmt_)
            sqlite3_bind_null(stmt_, idx);
        return *this;
    }

    dp::Result<bool, dp::Error> SqliteStore::Statement::step() {
        if (!stmt_)
            return dp::Result<bool, dp::Error>::err(error());

        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW)
            return dp::Result<bool, dp::Error>::ok(true);
        if (rc == SQLITE_DONE)
            return dp::Result<bool, dp::Error>::ok(false);
        if ((rc & 0xff) == SQLITE_CONSTRAINT) {
            return dp::Result<bool, dp::Error>::err(
                constraint_violation("Change conflicts with existing ledger data"));
        }
        return dp::Result<bool, dp::Error>::err(storage_error(sqlite3_errmsg(db_)));
    }

    dp::Result<void, dp::Error> SqliteStore::Statement::run() {
        auto r = step();
        if (r.is_err())
            return dp::Result<void, dp::Error>::err(r.error());
        return dp::Result<void, dp::Error>::ok();
    }

    int64_t SqliteStore::Statement::int64(int col) const { return sqlite3_column_int64(stmt_, col); }

    std::string SqliteStore::Statement::text(int col) const {
        const unsigned char *value = sqlite3_column_text(stmt_, col);
        return value ? reinterpret_cast<const char *>(value) : "";
    }

    std::optional<int64_t> SqliteStore::Statement::optInt64(int col) const {
        if (isNull(col))
            return std::nullopt;
        return sqlite3_column_int64(stmt_, col);
    }

    std::vector<uint8_t> SqliteStore::Statement::blob(int col) const {
        const void *data = sqlite3_column_blob(stmt_, col);
        int size = sqlite3_column_bytes(stmt_, col);
        if (!data || size <= 0)
            return {};
        return std::vector<uint8_t>(static_cast<const uint8_t *>(data), static_cast<const uint8_t *>(data) + size);
    }

    bool SqliteStore::Statement::isNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

    // ===========================================
    // Savepoint
    // ===========================================

    SqliteStore::Savepoint::Savepoint(SqliteStore &store)
        : store_(store), lock_(store.connectionMutex()), active_(false) {
        if (store_.db_) {
            active_ = (sqlite3_exec(store_.db_, "SAVEPOINT sb_op", nullptr, nullptr, nullptr) == SQLITE_OK);
        }
    }

    SqliteStore::Savepoint::~Savepoint() { rollback(); }

    dp::Result<void, dp::Error> SqliteStore::Savepoint::release() {
        if (!active_)
            return dp::Result<void, dp::Error>::err(storage_error("Savepoint is not active"));
        auto r = exec(store_.db_, "RELEASE sb_op");
        if (r.is_err()) {
            rollback();
            return r;
        }
        active_ = false;
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteStore::Savepoint::rollback() {
        if (active_) {
            sqlite3_exec(store_.db_, "ROLLBACK TO sb_op; RELEASE sb_op", nullptr, nullptr, nullptr);
            active_ = false;
        }
    }

    // ===========================================
    // Explicit transactions
    // ===========================================

    bool SqliteStore::inAnyTransaction() const { return is_open_ && sqlite3_get_autocommit(db_) == 0; }

    dp::Result<void, dp::Error> SqliteStore::begin() {
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(storage_error("Database is not open"));
        if (tx_state_ == TxState::Begun)
            return dp::Result<void, dp::Error>::err(transaction_state_error("A transaction is already open"));

        auto r = exec(db_, "BEGIN TRANSACTION");
        if (r.is_err())
            return r;
        tx_state_ = TxState::Begun;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> SqliteStore::commit() {
        if (tx_state_ != TxState::Begun)
            return dp::Result<void, dp::Error>::err(transaction_state_error("No transaction to commit"));

        auto r = exec(db_, "COMMIT");
        if (r.is_err()) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            tx_state_ = TxState::RolledBack;
            return r;
        }
        tx_state_ = TxState::Committed;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> SqliteStore::rollback() {
        if (tx_state_ != TxState::Begun)
            return dp::Result<void, dp::Error>::err(transaction_state_error("No transaction to roll back"));

        auto r = exec(db_, "ROLLBACK");
        tx_state_ = TxState::RolledBack;
        return r;
    }

    // ===========================================
    // Schema migrations
    // ===========================================

    int32_t SqliteStore::currentVersion(sqlite3 *db) {
        sqlite3_stmt *stmt;
        const char *sql = "SELECT COALESCE(MAX(version), 0) FROM schema_migrations";
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        int32_t version = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return version;
    }

    dp::Result<void, dp::Error> SqliteStore::applyMigrations(sqlite3 *db, const std::vector<Migration> &migrations) {
        auto created = exec(db, SCHEMA_MIGRATIONS_TABLE);
        if (created.is_err())
            return created;

        for (const auto &migration : migrations) {
            if (migration.version <= currentVersion(db))
                continue;

            auto sp = exec(db, "SAVEPOINT sb_migrate");
            if (sp.is_err())
                return sp;

            for (const auto &sql : migration.statements) {
                auto r = exec(db, sql);
                if (r.is_err()) {
                    sqlite3_exec(db, "ROLLBACK TO sb_migrate; RELEASE sb_migrate", nullptr, nullptr, nullptr);
                    std::cerr << "Migration " << migration.version << " (" << migration.name
                              << ") failed: " << message_of(r.error()) << std::endl;
                    return r;
                }
            }

            sqlite3_stmt *stmt;
            const char *sql = "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?)";
            bool logged = false;
            if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
                sqlite3_bind_int(stmt, 1, migration.version);
                sqlite3_bind_text(stmt, 2, migration.name.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_int64(stmt, 3, currentTimestamp());
                logged = (sqlite3_step(stmt) == SQLITE_DONE);
                sqlite3_finalize(stmt);
            }
            if (!logged) {
                std::string msg = sqlite3_errmsg(db);
                sqlite3_exec(db, "ROLLBACK TO sb_migrate; RELEASE sb_migrate", nullptr, nullptr, nullptr);
                return dp::Result<void, dp::Error>::err(storage_error("Cannot record migration: " + msg));
            }

            auto released = exec(db, "RELEASE sb_migrate");
            if (released.is_err())
                return released;
            std::cout << "Migration " << migration.version << " applied: " << migration.name << std::endl;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> SqliteStore::migrate(const std::vector<Migration> &migrations) {
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(storage_error("Database is not open"));

        migrations_ = migrations;
        return applyMigrations(db_, migrations_);
    }

    int32_t SqliteStore::schemaVersion() {
        if (!db_)
            return 0;
        return currentVersion(db_);
    }

    std::vector<MigrationInfo> SqliteStore::appliedMigrations() {
        std::vector<MigrationInfo> out;
        Statement stmt(*this, "SELECT version, name, applied_at FROM schema_migrations ORDER BY version");
        if (!stmt.ok())
            return out;

        while (true) {
            auto row = stmt.step();
            if (row.is_err() || !row.value())
                break;
            MigrationInfo info;
            info.version = static_cast<int32_t>(stmt.int64(0));
            info.name = stmt.text(1);
            info.applied_at = stmt.int64(2);
            out.push_back(std::move(info));
        }
        return out;
    }

    // ===========================================
    // Snapshots
    // ===========================================

    namespace {
        constexpr const char kSqliteHeader[] = "SQLite format 3";
        constexpr size_t kHeaderSize = 100;

        // Bytes 18/19 of the header mark WAL mode; images are always stored in rollback-journal form
        void clearWalMarker(std::vector<uint8_t> &image) {
            if (image.size() >= kHeaderSize) {
                image[18] = 1;
                image[19] = 1;
            }
        }
    } // namespace

    dp::Result<std::vector<uint8_t>, dp::Error> SqliteStore::serialize() {
        std::lock_guard<std::recursive_mutex> lock(*conn_mutex_);
        if (!is_open_)
            return dp::Result<std::vector<uint8_t>, dp::Error>::err(storage_error("Database is not open"));

        sqlite3_int64 size = 0;
        unsigned char *data = sqlite3_serialize(db_, "main", &size, 0);
        if (!data || size <= 0) {
            if (data)
                sqlite3_free(data);
            return dp::Result<std::vector<uint8_t>, dp::Error>::err(storage_error("Failed to serialize database"));
        }

        std::vector<uint8_t> image(data, data + size);
        sqlite3_free(data);
        clearWalMarker(image);
        return dp::Result<std::vector<uint8_t>, dp::Error>::ok(std::move(image));
    }

    dp::Result<void, dp::Error> SqliteStore::deserialize(const std::vector<uint8_t> &image) {
        std::lock_guard<std::recursive_mutex> lock(*conn_mutex_);
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(storage_error("Database is not open"));
        if (inAnyTransaction())
            return dp::Result<void, dp::Error>::err(transaction_state_error("Cannot load a snapshot mid-transaction"));
        if (image.size() < kHeaderSize || std::memcmp(image.data(), kSqliteHeader, sizeof(kSqliteHeader)) != 0)
            return dp::Result<void, dp::Error>::err(snapshot_error("Snapshot is not a database image"));

        sqlite3 *scratch = nullptr;
        if (sqlite3_open(":memory:", &scratch) != SQLITE_OK) {
            if (scratch)
                sqlite3_close(scratch);
            return dp::Result<void, dp::Error>::err(storage_error("Cannot open scratch database"));
        }

        std::vector<uint8_t> copy = image;
        clearWalMarker(copy);
        auto *buf = static_cast<unsigned char *>(sqlite3_malloc64(copy.size()));
        if (!buf) {
            sqlite3_close(scratch);
            return dp::Result<void, dp::Error>::err(storage_error("Out of memory loading snapshot"));
        }
        std::memcpy(buf, copy.data(), copy.size());

        int rc = sqlite3_deserialize(scratch, "main", buf, static_cast<sqlite3_int64>(copy.size()),
                                     static_cast<sqlite3_int64>(copy.size()),
                                     SQLITE_DESERIALIZE_FREEONCLOSE | SQLITE_DESERIALIZE_RESIZEABLE);
        if (rc != SQLITE_OK) {
            sqlite3_close(scratch);
            return dp::Result<void, dp::Error>::err(snapshot_error("Snapshot could not be loaded"));
        }

        auto check = exec(scratch, "SELECT count(*) FROM sqlite_master");
        if (check.is_err()) {
            sqlite3_close(scratch);
            return dp::Result<void, dp::Error>::err(snapshot_error("Snapshot is corrupt: " + message_of(check.error())));
        }

        sqlite3_exec(scratch, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
        auto migrated = applyMigrations(scratch, migrations_);
        if (migrated.is_err()) {
            sqlite3_close(scratch);
            return dp::Result<void, dp::Error>::err(
                snapshot_error("Snapshot schema is incompatible: " + message_of(migrated.error())));
        }

        if (!passesQuickCheck(scratch)) {
            sqlite3_close(scratch);
            return dp::Result<void, dp::Error>::err(snapshot_error("Snapshot failed the quick check"));
        }

        sqlite3_backup *backup = sqlite3_backup_init(db_, "main", scratch, "main");
        if (!backup) {
            std::string msg = sqlite3_errmsg(db_);
            sqlite3_close(scratch);
            return dp::Result<void, dp::Error>::err(storage_error("Cannot replace database: " + msg));
        }
        sqlite3_backup_step(backup, -1);
        rc = sqlite3_backup_finish(backup);
        sqlite3_close(scratch);
        if (rc != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(storage_error("Cannot replace database: " + std::string(sqlite3_errstr(rc))));
        }

        std::cout << "Snapshot loaded into " << db_path_ << " (" << image.size() << " bytes, schema v"
                  << schemaVersion() << ")" << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Diagnostics
    // ===========================================

    dp::Result<std::vector<std::string>, dp::Error> SqliteStore::integrityCheck() {
        Statement stmt(*this, "PRAGMA integrity_check");
        if (!stmt.ok())
            return dp::Result<std::vector<std::string>, dp::Error>::err(stmt.error());

        std::vector<std::string> problems;
        while (true) {
            auto row = stmt.step();
            if (row.is_err())
                return dp::Result<std::vector<std::string>, dp::Error>::err(row.error());
            if (!row.value())
                break;
            std::string line = stmt.text(0);
            if (line != "ok")
                problems.push_back(line);
        }
        return dp::Result<std::vector<std::string>, dp::Error>::ok(std::move(problems));
    }

    bool SqliteStore::passesQuickCheck(sqlite3 *db) {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, "PRAGMA quick_check", -1, &stmt, nullptr) != SQLITE_OK)
            return false;
        bool healthy = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char *result = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
            healthy = result && std::strcmp(result, "ok") == 0;
        }
        sqlite3_finalize(stmt);
        return healthy;
    }

    bool SqliteStore::quickCheck() { return is_open_ && passesQuickCheck(db_); }

    dp::Result<std::vector<ForeignKeyViolation>, dp::Error> SqliteStore::foreignKeyCheck() {
        Statement stmt(*this, "PRAGMA foreign_key_check");
        if (!stmt.ok())
            return dp::Result<std::vector<ForeignKeyViolation>, dp::Error>::err(stmt.error());

        std::vector<ForeignKeyViolation> violations;
        while (true) {
            auto row = stmt.step();
            if (row.is_err())
                return dp::Result<std::vector<ForeignKeyViolation>, dp::Error>::err(row.error());
            if (!row.value())
                break;
            ForeignKeyViolation v;
            v.table = stmt.text(0);
            v.rowid = stmt.int64(1);
            v.parent = stmt.text(2);
            violations.push_back(std::move(v));
        }
        return dp::Result<std::vector<ForeignKeyViolation>, dp::Error>::ok(std::move(violations));
    }

} // namespace sitebook::storage
