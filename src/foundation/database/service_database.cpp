/// @file service_database.cpp
/// @brief ServiceDatabase implementation over kcenon database_system.

#include "eks/foundation/service_database.hpp"

// kcenon database_system headers (hidden behind PIMPL)
#include <core/database_backend.h>
#include <core/database_context.h>
#include <database_manager.h>
#include <database_types.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace eks::foundation {

namespace {

QueryResult convertResult(const ::database::core::database_result& kcResult) {
    QueryResult result;
    result.reserve(kcResult.size());

    for (const auto& kcRow : kcResult) {
        DbRow row;
        for (const auto& [col, val] : kcRow) {
            std::visit([&](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::string> ||
                              std::is_same_v<T, std::int64_t> ||
                              std::is_same_v<T, double> ||
                              std::is_same_v<T, bool>) {
                    row[col] = arg;
                } else {
                    row[col] = DbNull{};
                }
            }, val);
        }
        result.push_back(std::move(row));
    }
    return result;
}

std::string quoteString(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped += '\'';
    for (char c : value) {
        if (c == '\'') {
            escaped += "''";
        } else {
            escaped += c;
        }
    }
    escaped += '\'';
    return escaped;
}

}  // anonymous namespace

ServiceError classifyDatabaseError(ErrorCode fallback, std::string message) {
    if (message.find("UNIQUE constraint") != std::string::npos) {
        return ServiceError(ErrorCode::ConstraintViolation, std::move(message));
    }
    return ServiceError(fallback, std::move(message));
}

// ---------------------------------------------------------------------------
// PreparedStatement
// ---------------------------------------------------------------------------

PreparedStatement::PreparedStatement(std::string sql)
    : sql_(std::move(sql)) {}

PreparedStatement& PreparedStatement::bindString(std::string_view name, std::string value) {
    params_[std::string(name)] = std::move(value);
    return *this;
}

PreparedStatement& PreparedStatement::bindBlob(std::string_view name, const Bytes& value) {
    params_[std::string(name)] = BlobParam{value};
    return *this;
}

std::string_view PreparedStatement::sql() const noexcept {
    return sql_;
}

std::string PreparedStatement::resolve() const {
    // Single left-to-right pass over the template, so text inside a bound
    // value is never scanned for placeholders.
    std::string resolved;
    resolved.reserve(sql_.size());

    std::size_t pos = 0;
    while (pos < sql_.size()) {
        if (sql_[pos] != '$') {
            resolved += sql_[pos++];
            continue;
        }
        auto nameEnd = pos + 1;
        while (nameEnd < sql_.size() &&
               (std::isalnum(static_cast<unsigned char>(sql_[nameEnd])) || sql_[nameEnd] == '_')) {
            ++nameEnd;
        }
        auto it = params_.find(sql_.substr(pos + 1, nameEnd - pos - 1));
        if (nameEnd == pos + 1 || it == params_.end()) {
            // Not a bound parameter: keep the text unchanged.
            resolved.append(sql_, pos, nameEnd - pos);
            pos = nameEnd;
            continue;
        }

        std::visit([&](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, std::string>) {
                resolved += quoteString(arg);
            } else {
                resolved += "X'" + toHex(arg.data) + "'";
            }
        }, it->second);
        pos = nameEnd;
    }

    return resolved;
}

// ---------------------------------------------------------------------------
// Connection pool entry
// ---------------------------------------------------------------------------

namespace {

struct PooledConnection {
    std::shared_ptr<::database::database_context> context;
    std::shared_ptr<::database::database_manager> manager;
    bool inUse = false;
};

}  // anonymous namespace

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

struct Transaction::Impl {
    std::shared_ptr<::database::database_manager> manager;
    std::function<void(::database::database_manager*)> returnConnection;
    bool active = true;

    void release() {
        if (active) {
            // Rollback failure leaves nothing to recover; the connection is
            // returned either way.
            (void)manager->rollback_transaction();
            active = false;
        }
        if (returnConnection) {
            returnConnection(manager.get());
            returnConnection = nullptr;
        }
    }
};

Transaction::Transaction(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

Transaction::~Transaction() {
    if (impl_) {
        impl_->release();
    }
}

Transaction::Transaction(Transaction&& other) noexcept = default;

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        if (impl_) {
            impl_->release();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

ServiceResult<void> Transaction::commit() {
    if (!isActive()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::TransactionFailed, "transaction not active"));
    }

    auto result = impl_->manager->commit_transaction();
    impl_->active = false;

    if (!result.is_ok()) {
        return ServiceResult<void>::err(
            classifyDatabaseError(ErrorCode::TransactionFailed,
                                  "commit failed: " + result.error().message));
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> Transaction::rollback() {
    if (!isActive()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::TransactionFailed, "transaction not active"));
    }

    auto result = impl_->manager->rollback_transaction();
    impl_->active = false;

    if (!result.is_ok()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::TransactionFailed,
                         "rollback failed: " + result.error().message));
    }
    return ServiceResult<void>::ok();
}

ServiceResult<QueryResult> Transaction::query(std::string_view sql) {
    if (!isActive()) {
        return ServiceResult<QueryResult>::err(
            ServiceError(ErrorCode::TransactionFailed, "transaction not active"));
    }

    auto result = impl_->manager->select_query_result(std::string(sql));
    if (!result.is_ok()) {
        return ServiceResult<QueryResult>::err(
            classifyDatabaseError(ErrorCode::QueryFailed, result.error().message));
    }
    return ServiceResult<QueryResult>::ok(convertResult(result.value()));
}

ServiceResult<QueryResult> Transaction::query(const PreparedStatement& stmt) {
    return query(stmt.resolve());
}

ServiceResult<void> Transaction::execute(std::string_view sql) {
    if (!isActive()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::TransactionFailed, "transaction not active"));
    }

    auto result = impl_->manager->execute_query_result(std::string(sql));
    if (!result.is_ok()) {
        return ServiceResult<void>::err(
            classifyDatabaseError(ErrorCode::QueryFailed, result.error().message));
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> Transaction::execute(const PreparedStatement& stmt) {
    return execute(stmt.resolve());
}

bool Transaction::isActive() const noexcept {
    return impl_ && impl_->active;
}

// ---------------------------------------------------------------------------
// ServiceDatabase::Impl
// ---------------------------------------------------------------------------

struct ServiceDatabase::Impl {
    DatabaseConfig config;

    std::vector<PooledConnection> pool;
    mutable std::mutex poolMutex;
    std::condition_variable poolCv;
    std::atomic<bool> connected{false};

    uint32_t connectionLimit() const {
        if (config.path == ":memory:") {
            return 1;
        }
        return std::max<uint32_t>(config.maxConnections, 1);
    }

    // Blocks up to connectionTimeout; nullptr when the pool stays exhausted.
    std::shared_ptr<::database::database_manager> checkout() {
        std::unique_lock lock(poolMutex);
        auto deadline = std::chrono::steady_clock::now() + config.connectionTimeout;

        while (true) {
            for (auto& conn : pool) {
                if (!conn.inUse) {
                    conn.inUse = true;
                    return conn.manager;
                }
            }

            if (pool.size() < connectionLimit()) {
                auto conn = createConnection();
                if (conn.manager) {
                    conn.inUse = true;
                    auto mgr = conn.manager;
                    pool.push_back(std::move(conn));
                    return mgr;
                }
            }

            if (poolCv.wait_until(lock, deadline) == std::cv_status::timeout) {
                return nullptr;
            }
        }
    }

    void checkin(::database::database_manager* mgr) {
        std::lock_guard lock(poolMutex);
        for (auto& conn : pool) {
            if (conn.manager.get() == mgr) {
                conn.inUse = false;
                poolCv.notify_one();
                return;
            }
        }
    }

    PooledConnection createConnection() {
        PooledConnection conn;
        conn.context = std::make_shared<::database::database_context>();
        conn.manager = std::make_shared<::database::database_manager>(conn.context);

        if (!conn.manager->set_mode(::database::database_types::sqlite)) {
            conn.manager.reset();
            return conn;
        }

        auto result = conn.manager->connect_result(config.path);
        if (!result.is_ok()) {
            conn.manager.reset();
            return conn;
        }

        // Concurrent writers on separate connections wait instead of failing
        // with SQLITE_BUSY.
        auto pragma = conn.manager->execute_query_result(
            "PRAGMA busy_timeout = " + std::to_string(config.busyTimeout.count()));
        if (!pragma.is_ok()) {
            (void)conn.manager->disconnect_result();
            conn.manager.reset();
        }
        return conn;
    }
};

ServiceDatabase::ServiceDatabase()
    : impl_(std::make_unique<Impl>()) {}

ServiceDatabase::~ServiceDatabase() {
    if (impl_) {
        disconnect();
    }
}

ServiceDatabase::ServiceDatabase(ServiceDatabase&&) noexcept = default;

ServiceDatabase& ServiceDatabase::operator=(ServiceDatabase&& other) noexcept {
    if (this != &other) {
        if (impl_) {
            disconnect();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

ServiceResult<void> ServiceDatabase::connect(const DatabaseConfig& config) {
    if (impl_->connected.load()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::AlreadyExists, "already connected"));
    }

    impl_->config = config;

    auto conn = impl_->createConnection();
    if (!conn.manager) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::DatabaseError,
                         "failed to open sqlite database at " + config.path));
    }
    {
        std::lock_guard lock(impl_->poolMutex);
        impl_->pool.push_back(std::move(conn));
    }

    impl_->connected.store(true);
    return ServiceResult<void>::ok();
}

void ServiceDatabase::disconnect() {
    impl_->connected.store(false);

    std::lock_guard lock(impl_->poolMutex);
    for (auto& conn : impl_->pool) {
        if (conn.manager) {
            (void)conn.manager->disconnect_result();
        }
    }
    impl_->pool.clear();
}

bool ServiceDatabase::isConnected() const noexcept {
    return impl_->connected.load();
}

ServiceResult<QueryResult> ServiceDatabase::query(std::string_view sql) {
    if (!impl_->connected.load()) {
        return ServiceResult<QueryResult>::err(
            ServiceError(ErrorCode::NotConnected, "not connected to database"));
    }

    auto mgr = impl_->checkout();
    if (!mgr) {
        return ServiceResult<QueryResult>::err(
            ServiceError(ErrorCode::ConnectionPoolExhausted,
                         "no available connections in pool"));
    }

    auto result = mgr->select_query_result(std::string(sql));
    impl_->checkin(mgr.get());

    if (!result.is_ok()) {
        return ServiceResult<QueryResult>::err(
            classifyDatabaseError(ErrorCode::QueryFailed, result.error().message));
    }
    return ServiceResult<QueryResult>::ok(convertResult(result.value()));
}

ServiceResult<QueryResult> ServiceDatabase::query(const PreparedStatement& stmt) {
    return query(stmt.resolve());
}

ServiceResult<void> ServiceDatabase::execute(std::string_view sql) {
    if (!impl_->connected.load()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::NotConnected, "not connected to database"));
    }

    auto mgr = impl_->checkout();
    if (!mgr) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConnectionPoolExhausted,
                         "no available connections in pool"));
    }

    auto result = mgr->execute_query_result(std::string(sql));
    impl_->checkin(mgr.get());

    if (!result.is_ok()) {
        return ServiceResult<void>::err(
            classifyDatabaseError(ErrorCode::QueryFailed, result.error().message));
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> ServiceDatabase::execute(const PreparedStatement& stmt) {
    return execute(stmt.resolve());
}

ServiceResult<Transaction> ServiceDatabase::beginTransaction() {
    if (!impl_->connected.load()) {
        return ServiceResult<Transaction>::err(
            ServiceError(ErrorCode::NotConnected, "not connected to database"));
    }

    auto mgr = impl_->checkout();
    if (!mgr) {
        return ServiceResult<Transaction>::err(
            ServiceError(ErrorCode::ConnectionPoolExhausted,
                         "no available connections in pool"));
    }

    auto result = mgr->begin_transaction();
    if (!result.is_ok()) {
        impl_->checkin(mgr.get());
        return ServiceResult<Transaction>::err(
            ServiceError(ErrorCode::TransactionFailed,
                         "failed to begin transaction: " + result.error().message));
    }

    auto txnImpl = std::make_unique<Transaction::Impl>();
    txnImpl->manager = mgr;
    txnImpl->active = true;
    auto* implPtr = impl_.get();
    txnImpl->returnConnection = [implPtr](::database::database_manager* m) {
        implPtr->checkin(m);
    };

    return ServiceResult<Transaction>::ok(Transaction(std::move(txnImpl)));
}

}  // namespace eks::foundation
