/// @file key_repository.cpp
/// @brief InMemoryKeyRepository and DatabaseKeyRepository.

#include "eks/service/key_repository.hpp"

#include <charconv>

#include "eks/foundation/service_database.hpp"
#include "eks/foundation/service_logger.hpp"

namespace eks::service {

using foundation::Bytes;
using foundation::DbRow;
using foundation::ErrorCode;
using foundation::KeyId;
using foundation::LogCategory;
using foundation::PreparedStatement;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

ServiceError nameTaken(std::string_view name) {
    return ServiceError(ErrorCode::NameTaken, "name taken: " + std::string(name));
}

std::optional<int64_t> columnInt(const DbRow& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) {
        return std::nullopt;
    }
    if (const auto* v = std::get_if<int64_t>(&it->second)) {
        return *v;
    }
    // Some drivers hand back every column as text.
    if (const auto* s = std::get_if<std::string>(&it->second)) {
        int64_t parsed = 0;
        auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), parsed);
        if (ec == std::errc{} && ptr == s->data() + s->size()) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::optional<std::string> columnText(const DbRow& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&it->second)) {
        return *s;
    }
    if (std::holds_alternative<foundation::DbNull>(it->second)) {
        return std::string{};
    }
    return std::nullopt;
}

}  // anonymous namespace

// ── InMemoryKeyRepository ───────────────────────────────────────────────────

ServiceResult<KeyId> InMemoryKeyRepository::insert(std::string_view name,
                                                   const Bytes& pubkeyDer) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key(name);
    if (keys_.find(key) != keys_.end()) {
        return ServiceResult<KeyId>::err(nameTaken(name));
    }
    KeyId id(nextId_++);
    keys_.emplace(key, KeyRecord{id, key, pubkeyDer});
    return ServiceResult<KeyId>::ok(id);
}

ServiceResult<std::optional<KeyRecord>> InMemoryKeyRepository::find(
    std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(std::string(name));
    if (it == keys_.end()) {
        return ServiceResult<std::optional<KeyRecord>>::ok(std::nullopt);
    }
    return ServiceResult<std::optional<KeyRecord>>::ok(it->second);
}

ServiceResult<std::size_t> InMemoryKeyRepository::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ServiceResult<std::size_t>::ok(keys_.size());
}

// ── DatabaseKeyRepository ───────────────────────────────────────────────────

DatabaseKeyRepository::DatabaseKeyRepository(std::shared_ptr<foundation::ServiceDatabase> db)
    : db_(std::move(db)) {}

ServiceResult<void> DatabaseKeyRepository::initialize() {
    auto created = db_->execute(
        "CREATE TABLE IF NOT EXISTS keys (\n"
        "    id INTEGER PRIMARY KEY,\n"
        "    name TEXT UNIQUE NOT NULL,\n"
        "    pubkey BLOB\n"
        ")");
    if (created.hasError()) {
        EKS_LOG_ERROR(LogCategory::Database,
                      "could not create keys table: " + std::string(created.error().message()));
    }
    return created;
}

ServiceResult<KeyId> DatabaseKeyRepository::insert(std::string_view name,
                                                   const Bytes& pubkeyDer) {
    auto txn = db_->beginTransaction();
    if (txn.hasError()) {
        return ServiceResult<KeyId>::err(txn.error());
    }
    auto& tx = txn.value();

    PreparedStatement exists("SELECT id FROM keys WHERE name = $name");
    exists.bindString("name", std::string(name));
    auto existing = tx.query(exists);
    if (existing.hasError()) {
        return ServiceResult<KeyId>::err(existing.error());
    }
    if (!existing.value().empty()) {
        return ServiceResult<KeyId>::err(nameTaken(name));
    }

    PreparedStatement insertStmt("INSERT INTO keys (name, pubkey) VALUES ($name, $pubkey)");
    insertStmt.bindString("name", std::string(name)).bindBlob("pubkey", pubkeyDer);
    auto inserted = tx.execute(insertStmt);
    if (inserted.hasError()) {
        // A concurrent writer on another connection can still win the race.
        if (inserted.error().code() == ErrorCode::ConstraintViolation) {
            return ServiceResult<KeyId>::err(nameTaken(name));
        }
        return ServiceResult<KeyId>::err(inserted.error());
    }

    auto idRows = tx.query(exists);
    if (idRows.hasError()) {
        return ServiceResult<KeyId>::err(idRows.error());
    }
    auto id = idRows.value().empty() ? std::nullopt : columnInt(idRows.value().front(), "id");
    if (!id) {
        return ServiceResult<KeyId>::err(
            ServiceError(ErrorCode::QueryFailed, "inserted row not found"));
    }

    auto committed = tx.commit();
    if (committed.hasError()) {
        if (committed.error().code() == ErrorCode::ConstraintViolation) {
            return ServiceResult<KeyId>::err(nameTaken(name));
        }
        return ServiceResult<KeyId>::err(committed.error());
    }
    return ServiceResult<KeyId>::ok(KeyId(*id));
}

ServiceResult<std::optional<KeyRecord>> DatabaseKeyRepository::find(
    std::string_view name) const {
    PreparedStatement stmt(
        "SELECT id, name, hex(pubkey) AS pubkey_hex FROM keys WHERE name = $name");
    stmt.bindString("name", std::string(name));

    auto rows = db_->query(stmt);
    if (rows.hasError()) {
        return ServiceResult<std::optional<KeyRecord>>::err(rows.error());
    }
    if (rows.value().empty()) {
        return ServiceResult<std::optional<KeyRecord>>::ok(std::nullopt);
    }

    const auto& row = rows.value().front();
    auto id = columnInt(row, "id");
    auto storedName = columnText(row, "name");
    auto hex = columnText(row, "pubkey_hex");
    auto der = hex ? foundation::fromHex(*hex) : std::nullopt;
    if (!id || !storedName || !der) {
        return ServiceResult<std::optional<KeyRecord>>::err(
            ServiceError(ErrorCode::QueryFailed, "unexpected row shape in keys table"));
    }

    return ServiceResult<std::optional<KeyRecord>>::ok(
        KeyRecord{KeyId(*id), std::move(*storedName), std::move(*der)});
}

ServiceResult<std::size_t> DatabaseKeyRepository::count() const {
    auto rows = db_->query("SELECT count(*) AS n FROM keys");
    if (rows.hasError()) {
        return ServiceResult<std::size_t>::err(rows.error());
    }
    auto n = rows.value().empty() ? std::nullopt : columnInt(rows.value().front(), "n");
    if (!n || *n < 0) {
        return ServiceResult<std::size_t>::err(
            ServiceError(ErrorCode::QueryFailed, "count(*) returned no value"));
    }
    return ServiceResult<std::size_t>::ok(static_cast<std::size_t>(*n));
}

}  // namespace eks::service
