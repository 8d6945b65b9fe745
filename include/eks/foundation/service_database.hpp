#pragma once

/// @file service_database.hpp
/// @brief ServiceDatabase wrapping kcenon database_system (SQLite mode) with
///        a small connection pool, prepared statements and RAII transactions.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "eks/foundation/bytes.hpp"
#include "eks/foundation/service_result.hpp"

namespace eks::foundation {

// ── Type aliases for database values ────────────────────────────────────────

/// Sentinel type representing SQL NULL.
struct DbNull {};

/// A single column value in a query result row.
using DbValue = std::variant<DbNull, std::string, std::int64_t, double, bool>;

/// A single row: column name → value.
using DbRow = std::unordered_map<std::string, DbValue>;

/// Complete result set from a SELECT query.
using QueryResult = std::vector<DbRow>;

/// Configuration for the SQLite connection pool.
///
/// @c path is handed to the SQLite backend as the connection string. The
/// special path ":memory:" gives every connection its own database, so the
/// pool is capped at one connection for it.
struct DatabaseConfig {
    std::string path = "keys.sqlite";
    uint32_t maxConnections = 4;
    std::chrono::seconds connectionTimeout{5};
    std::chrono::milliseconds busyTimeout{5000};
};

// ── PreparedStatement ───────────────────────────────────────────────────────

/// A parameterized SQL statement with named parameter binding.
///
/// Parameters are written as $name placeholders and substituted as escaped
/// SQL literals by resolve(). Blobs are rendered as X'..' hex literals.
///
/// Example:
/// @code
///   PreparedStatement stmt("INSERT INTO keys (name, pubkey) VALUES ($name, $key)");
///   stmt.bindString("name", "alice").bindBlob("key", der);
///   auto rows = db.execute(stmt);
/// @endcode
class PreparedStatement {
public:
    explicit PreparedStatement(std::string sql);

    PreparedStatement& bindString(std::string_view name, std::string value);

    PreparedStatement& bindBlob(std::string_view name, const Bytes& value);

    /// The original SQL template.
    [[nodiscard]] std::string_view sql() const noexcept;

    /// The SQL template with all bound parameters substituted.
    [[nodiscard]] std::string resolve() const;

private:
    /// Blobs render as hex literals, text as quoted strings.
    struct BlobParam {
        Bytes data;
    };
    using ParamValue = std::variant<std::string, BlobParam>;

    std::string sql_;
    std::unordered_map<std::string, ParamValue> params_;
};

// ── Transaction ─────────────────────────────────────────────────────────────

/// RAII transaction guard.
///
/// Rolls back on destruction unless commit() or rollback() was called. All
/// statements run on the connection the transaction checked out.
class Transaction {
public:
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) noexcept;
    Transaction& operator=(Transaction&&) noexcept;

    [[nodiscard]] ServiceResult<void> commit();

    [[nodiscard]] ServiceResult<void> rollback();

    [[nodiscard]] ServiceResult<QueryResult> query(std::string_view sql);

    [[nodiscard]] ServiceResult<QueryResult> query(const PreparedStatement& stmt);

    [[nodiscard]] ServiceResult<void> execute(std::string_view sql);

    [[nodiscard]] ServiceResult<void> execute(const PreparedStatement& stmt);

    [[nodiscard]] bool isActive() const noexcept;

private:
    friend class ServiceDatabase;
    struct Impl;
    explicit Transaction(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

// ── ServiceDatabase ─────────────────────────────────────────────────────────

/// Database adapter over kcenon's database_system.
///
/// Statement failures whose backend message reports a UNIQUE constraint are
/// returned as ErrorCode::ConstraintViolation so callers can tell a duplicate
/// apart from other write failures.
///
/// Example:
/// @code
///   ServiceDatabase db;
///   DatabaseConfig config;
///   config.path = "keys.sqlite";
///   if (db.connect(config).hasValue()) {
///       auto rows = db.query("SELECT count(*) AS n FROM keys");
///   }
/// @endcode
class ServiceDatabase {
public:
    ServiceDatabase();
    ~ServiceDatabase();

    ServiceDatabase(const ServiceDatabase&) = delete;
    ServiceDatabase& operator=(const ServiceDatabase&) = delete;
    ServiceDatabase(ServiceDatabase&&) noexcept;
    ServiceDatabase& operator=(ServiceDatabase&&) noexcept;

    // ── Connection management ───────────────────────────────────────────

    /// Open the first connection. Further connections are opened on demand
    /// up to DatabaseConfig::maxConnections.
    [[nodiscard]] ServiceResult<void> connect(const DatabaseConfig& config);

    /// Close all pooled connections.
    void disconnect();

    [[nodiscard]] bool isConnected() const noexcept;

    // ── Statements ──────────────────────────────────────────────────────

    /// Execute a SELECT and return the result set.
    [[nodiscard]] ServiceResult<QueryResult> query(std::string_view sql);

    [[nodiscard]] ServiceResult<QueryResult> query(const PreparedStatement& stmt);

    /// Execute a command (INSERT/UPDATE/DELETE/DDL).
    [[nodiscard]] ServiceResult<void> execute(std::string_view sql);

    [[nodiscard]] ServiceResult<void> execute(const PreparedStatement& stmt);

    // ── Transactions ────────────────────────────────────────────────────

    /// Begin a transaction on a dedicated connection.
    [[nodiscard]] ServiceResult<Transaction> beginTransaction();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Classify a backend error message: UNIQUE violations become
/// ConstraintViolation, everything else @p fallback.
[[nodiscard]] ServiceError classifyDatabaseError(ErrorCode fallback, std::string message);

}  // namespace eks::foundation
