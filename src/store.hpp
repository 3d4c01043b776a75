#pragma once

#include <sqlite3.h>
#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common.hpp"

class StoreError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class OwnershipError : public StoreError {
  public:
    using StoreError::StoreError;
};

// Durable key/value store shared by the daemon and the agent. Each connection declares the role
// of its process and may only write the keys that role owns. Single-key writes are atomic.
class StateStore {
  public:
    static constexpr int kSchemaVersion = 1;

    StateStore(const std::string &db_path, StoreRole role);
    ~StateStore();

    StateStore(const StateStore &) = delete;
    StateStore &operator=(const StateStore &) = delete;

    StoreRole Role() const {
        return m_Role;
    }
    const std::string &Path() const {
        return m_DbPath;
    }

    std::optional<nlohmann::json> Read(const std::string &key);
    void Write(const std::string &key, const nlohmann::json &value);
    void Erase(const std::string &key);
    std::vector<std::string> Keys(const std::string &prefix);

    // Changes whenever another connection commits to the database.
    int64_t DataVersion();

    // Groups several writes of one owner so readers never observe half of them. A read-only
    // transaction pins one consistent snapshot for a batch of reads.
    class Transaction {
      public:
        explicit Transaction(StateStore &store, bool write = true);
        ~Transaction();

        Transaction(const Transaction &) = delete;
        Transaction &operator=(const Transaction &) = delete;

        void Commit();

      private:
        StateStore &m_Store;
        bool m_Done = false;
    };

  private:
    void Init();
    void PrepareStatements();
    void CheckOwnership(const std::string &key) const;
    void ExecIgnoringErrors(const std::string &sql);
    void ExecOrThrow(const std::string &sql);

  private:
    sqlite3 *m_Db;
    std::string m_DbPath;
    StoreRole m_Role;

    sqlite3_stmt *m_ReadStmt = nullptr;
    sqlite3_stmt *m_WriteStmt = nullptr;
    sqlite3_stmt *m_EraseStmt = nullptr;

    static constexpr int kLookasideSlotSize = 128;
    static constexpr int kLookasideSlotCount = 64;
    std::array<unsigned char, kLookasideSlotSize * kLookasideSlotCount> m_Lookaside{};
};
