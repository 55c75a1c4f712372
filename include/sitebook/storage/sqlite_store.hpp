#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sitebook/common/error.hpp>

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace sitebook::storage {

    // ===========================================
    // Core Types
    // ===========================================

    /// SQLite database configuration
    struct OpenOptions {
        bool enable_wal = true;
        bool enable_foreign_keys = true;
        int32_t busy_timeout_ms = 5000;
        int32_t cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        OpenOptions() = default;
    };

    /// One forward-only schema step. Statements run in order inside a savepoint.
    struct Migration {
        int32_t version = 0;
        std::string name;
        std::vector<std::string> statements;
    };

    /// Row of the schema_migrations log
    struct MigrationInfo {
        int32_t version = 0;
        std::string name;
        int64_t applied_at = 0;
    };

    /// Row reported by PRAGMA foreign_key_check
    struct ForeignKeyViolation {
        std::string table;
        int64_t rowid = 0;
        std::string parent;
    };

    /// Explicit transaction lifecycle
    enum class TxState : uint8_t { Idle = 0, Begun = 1, Committed = 2, RolledBack = 3 };

    // ===========================================
    // SqliteStore - connection, schema and snapshots
    // ===========================================

    class SqliteStore {
      public:
        SqliteStore();
        ~SqliteStore();

        // Non-copyable, movable
        SqliteStore(const SqliteStore &) = delete;
        SqliteStore &operator=(const SqliteStore &) = delete;
        SqliteStore(SqliteStore &&) noexcept;
        SqliteStore &operator=(SqliteStore &&) noexcept;

        /// Open or create database at given path
        /// @param path Database file path (e.g. "data/sitebook.db")
        /// @param opts Configuration options
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Open a private in-memory database
        dp::Result<void, dp::Error> openInMemory(const OpenOptions &opts = OpenOptions{});

        /// Close database connection. An open explicit transaction is rolled back.
        void close();

        bool isOpen() const;

        const std::string &path() const { return db_path_; }

        // ===========================================
        // Prepared statements (RAII)
        // ===========================================

        class Statement {
          public:
            Statement(SqliteStore &store, const std::string &sql);
            ~Statement();

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            /// False when preparation failed; error() describes why
            bool ok() const { return stmt_ != nullptr; }
            dp::Error error() const;

            Statement &bind(int idx, int64_t value);
            Statement &bind(int idx, const std::string &value);
            Statement &bind(int idx, const std::optional<int64_t> &value);
            Statement &bindBlob(int idx, const std::vector<uint8_t> &value);
            Statement &bindNull(int idx);

            /// Advance one row
            /// @return true while a row is available, false when done
            dp::Result<bool, dp::Error> step();

            /// Execute a statement that returns no rows
            dp::Result<void, dp::Error> run();

            int64_t int64(int col) const;
            std::string text(int col) const;
            std::optional<int64_t> optInt64(int col) const;
            std::vector<uint8_t> blob(int col) const;
            bool isNull(int col) const;

          private:
            sqlite3 *db_;
            sqlite3_stmt *stmt_;
            int prepare_rc_;
        };

        // ===========================================
        // Savepoints (RAII, nest freely)
        // ===========================================

        /// Holds the connection mutex from construction until destruction, so no other
        /// thread can snapshot or begin while the savepoint is open.
        class Savepoint {
          public:
            explicit Savepoint(SqliteStore &store);
            ~Savepoint();

            Savepoint(const Savepoint &) = delete;
            Savepoint &operator=(const Savepoint &) = delete;

            bool ok() const { return active_; }

            /// Keep the changes made since construction
            dp::Result<void, dp::Error> release();

            /// Undo the changes made since construction
            void rollback();

          private:
            SqliteStore &store_;
            std::unique_lock<std::recursive_mutex> lock_;
            bool active_;
        };

        // ===========================================
        // Explicit transactions
        // ===========================================

        /// BEGIN; fails with a transaction state error when one is already open
        dp::Result<void, dp::Error> begin();

        /// COMMIT the open transaction
        dp::Result<void, dp::Error> commit();

        /// ROLLBACK the open transaction
        dp::Result<void, dp::Error> rollback();

        TxState txState() const { return tx_state_; }
        bool inTransaction() const { return tx_state_ == TxState::Begun; }

        /// True while any transaction or savepoint is open on the connection
        bool inAnyTransaction() const;

        /// Serializes savepoints, explicit transactions and snapshots across threads
        std::recursive_mutex &connectionMutex() { return *conn_mutex_; }

        // ===========================================
        // Schema migrations
        // ===========================================

        /// Register migrations and apply the ones not yet in schema_migrations.
        /// They are replayed against every snapshot loaded later.
        dp::Result<void, dp::Error> migrate(const std::vector<Migration> &migrations);

        /// Highest applied migration version, 0 for a fresh database
        int32_t schemaVersion();

        std::vector<MigrationInfo> appliedMigrations();

        // ===========================================
        // Snapshots
        // ===========================================

        /// Serialize the whole database into one self-contained image
        dp::Result<std::vector<uint8_t>, dp::Error> serialize();

        /// Replace the database content with a serialized image.
        /// The image is validated and migrated in a scratch connection first;
        /// the current content is untouched on any failure.
        dp::Result<void, dp::Error> deserialize(const std::vector<uint8_t> &image);

        // ===========================================
        // Diagnostics
        // ===========================================

        /// PRAGMA integrity_check; empty vector when healthy
        dp::Result<std::vector<std::string>, dp::Error> integrityCheck();

        /// PRAGMA quick_check
        bool quickCheck();

        dp::Result<std::vector<ForeignKeyViolation>, dp::Error> foreignKeyCheck();

        // ===========================================
        // Raw SQL access
        // ===========================================

        /// Execute one or more SQL statements without parameters
        dp::Result<void, dp::Error> execute(const std::string &sql);

        /// Run a single-value query such as SELECT COUNT(*)
        dp::Result<int64_t, dp::Error> queryInt64(const std::string &sql);

        int64_t lastInsertId() const;
        int changes() const;

        /// Size of the database in bytes (page_count * page_size)
        int64_t sizeBytes();

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;
        OpenOptions opts_;
        TxState tx_state_;
        std::vector<Migration> migrations_;
        std::unique_ptr<std::recursive_mutex> conn_mutex_ = std::make_unique<std::recursive_mutex>();

        void applyPragmas(sqlite3 *db, const OpenOptions &opts);

        static dp::Result<void, dp::Error> applyMigrations(sqlite3 *db, const std::vector<Migration> &migrations);
        static dp::Result<void, dp::Error> exec(sqlite3 *db, const std::string &sql);
        static int32_t currentVersion(sqlite3 *db);
        static bool passesQuickCheck(sqlite3 *db);

        // Core schema SQL definitions
        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                name TEXT NOT NULL,
                applied_at INTEGER NOT NULL
            )
        )";
    };

    // ===========================================
    // Utility functions
    // ===========================================

    /// Compute SHA256 hash using keylock
    /// @param data Bytes to hash
    /// @return 32-byte SHA256 hash
    dp::Result<std::vector<uint8_t>, dp::Error> computeSHA256(const std::vector<uint8_t> &data);

    /// Convert hash bytes to hex string
    std::string hashToHex(const std::vector<uint8_t> &hash);

    /// Get current Unix timestamp in seconds
    int64_t currentTimestamp();

} // namespace sitebook::storage
