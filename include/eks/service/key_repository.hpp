#pragma once

/// @file key_repository.hpp
/// @brief Name → public key storage: interface, in-memory and SQLite backends.

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "eks/foundation/service_result.hpp"
#include "eks/service/key_types.hpp"

namespace eks::foundation {
class ServiceDatabase;
}

namespace eks::service {

/// Abstract interface for key persistence.
///
/// Implementations must be thread-safe when shared across threads.
class IKeyRepository {
public:
    virtual ~IKeyRepository() = default;

    /// Store @p pubkeyDer under @p name.
    /// @return The new row id, NameTaken for a duplicate name, or a storage error.
    [[nodiscard]] virtual foundation::ServiceResult<foundation::KeyId> insert(
        std::string_view name, const foundation::Bytes& pubkeyDer) = 0;

    /// Look up a key by exact name. An absent name is success with nullopt.
    [[nodiscard]] virtual foundation::ServiceResult<std::optional<KeyRecord>> find(
        std::string_view name) const = 0;

    /// Number of stored keys.
    [[nodiscard]] virtual foundation::ServiceResult<std::size_t> count() const = 0;
};

/// Thread-safe in-memory repository for tests and development.
class InMemoryKeyRepository : public IKeyRepository {
public:
    [[nodiscard]] foundation::ServiceResult<foundation::KeyId> insert(
        std::string_view name, const foundation::Bytes& pubkeyDer) override;

    [[nodiscard]] foundation::ServiceResult<std::optional<KeyRecord>> find(
        std::string_view name) const override;

    [[nodiscard]] foundation::ServiceResult<std::size_t> count() const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, KeyRecord> keys_;
    int64_t nextId_ = 1;
};

/// Repository over the `keys` table of a ServiceDatabase.
///
/// Schema:
/// @code
///   CREATE TABLE IF NOT EXISTS keys (
///       id INTEGER PRIMARY KEY,
///       name TEXT UNIQUE NOT NULL,
///       pubkey BLOB
///   )
/// @endcode
class DatabaseKeyRepository : public IKeyRepository {
public:
    explicit DatabaseKeyRepository(std::shared_ptr<foundation::ServiceDatabase> db);

    /// Create the table if it does not exist.
    [[nodiscard]] foundation::ServiceResult<void> initialize();

    [[nodiscard]] foundation::ServiceResult<foundation::KeyId> insert(
        std::string_view name, const foundation::Bytes& pubkeyDer) override;

    [[nodiscard]] foundation::ServiceResult<std::optional<KeyRecord>> find(
        std::string_view name) const override;

    [[nodiscard]] foundation::ServiceResult<std::size_t> count() const override;

private:
    std::shared_ptr<foundation::ServiceDatabase> db_;
};

}  // namespace eks::service
