#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace rocksdb {
class ColumnFamilyHandle;
class Iterator;
class Snapshot;
class Status;
class Transaction;
class TransactionDB;
} // namespace rocksdb

namespace kvtree::storage {

// ── Status conversion ────────────────────────────────────────────────────────

// Which exception a failed rocksdb::Status turns into when it is not a
// contention error (Busy, TimedOut, TryAgain, Expired always become
// TransactionError).
enum class FailureKind : uint8_t {
    Open,         // → StorageOpenError
    Transaction,  // → TransactionError
    IO,           // → StorageIOError
};

// Throws the matching kvtree exception if `status` is not OK.
// `context` describes the failed operation and prefixes the message.
void check_status(const rocksdb::Status& status, FailureKind kind,
                  std::string_view context);

// ── EnvironmentOptions ───────────────────────────────────────────────────────

struct EnvironmentOptions {
    std::filesystem::path path;
    uint64_t size_cap_bytes = 1ULL << 40;
    uint32_t max_readers    = 126;
    uint32_t max_namespaces = 128;
    bool     sync_writes    = false;
};

// ── NamespaceHandle ──────────────────────────────────────────────────────────
//
// Names one column family of an Environment.  Cheap to copy; valid for as
// long as the Environment that issued it.

struct NamespaceHandle {
    std::string name;
    rocksdb::ColumnFamilyHandle* column_family = nullptr;
};

class Environment;

// ── Cursor ───────────────────────────────────────────────────────────────────
//
// Forward or backward range cursor over one namespace, reading from the
// snapshot of the ReadTxn that created it.  Must not outlive that ReadTxn and
// must stay on the thread that uses the ReadTxn.

class Cursor {
public:
    ~Cursor();

    Cursor(Cursor&&) noexcept;
    Cursor& operator=(Cursor&&) noexcept;
    Cursor(const Cursor&)            = delete;
    Cursor& operator=(const Cursor&) = delete;

    [[nodiscard]] bool valid() const;
    [[nodiscard]] std::string_view key() const;
    [[nodiscard]] std::string_view value() const;

    // Moves to the next entry in the cursor's direction.
    void next();

    // Throws StorageIOError if the underlying iterator stopped on an error
    // rather than at the end of the range.
    void check() const;

private:
    friend class ReadTxn;
    Cursor(std::unique_ptr<rocksdb::Iterator> it, bool backwards);

    std::unique_ptr<rocksdb::Iterator> it_;
    bool backwards_ = false;
};

// ── ReadTxn ──────────────────────────────────────────────────────────────────
//
// Snapshot-isolated read transaction.  Occupies one reader slot of the
// Environment until destroyed.

class ReadTxn {
public:
    ~ReadTxn();

    ReadTxn(const ReadTxn&)            = delete;
    ReadTxn& operator=(const ReadTxn&) = delete;
    ReadTxn(ReadTxn&&)                 = delete;
    ReadTxn& operator=(ReadTxn&&)      = delete;

    [[nodiscard]] std::optional<std::string> get(const NamespaceHandle& ns,
                                                 std::string_view key) const;

    // Ascending from the first key >= `start`, or from the first key of the
    // namespace when `start` is std::nullopt.
    [[nodiscard]] Cursor forward_range(const NamespaceHandle& ns,
                                       std::optional<std::string_view> start) const;

    // Descending from the last key <= `end_inclusive`.
    [[nodiscard]] Cursor backward_range(const NamespaceHandle& ns,
                                        std::string_view end_inclusive) const;

private:
    friend class Environment;
    explicit ReadTxn(Environment& env);

    Environment& env_;
    const rocksdb::Snapshot* snapshot_ = nullptr;
};

// ── WriteTxn ─────────────────────────────────────────────────────────────────
//
// Read-write transaction.  Holds the Environment's writer lock for its whole
// lifetime, so at most one WriteTxn exists per Environment at any time.
// Destroying a WriteTxn without commit() rolls it back.

class WriteTxn {
public:
    ~WriteTxn();

    WriteTxn(const WriteTxn&)            = delete;
    WriteTxn& operator=(const WriteTxn&) = delete;
    WriteTxn(WriteTxn&&)                 = delete;
    WriteTxn& operator=(WriteTxn&&)      = delete;

    // Reads through the transaction, so uncommitted writes are visible.
    [[nodiscard]] std::optional<std::string> get(const NamespaceHandle& ns,
                                                 std::string_view key) const;

    void put(const NamespaceHandle& ns, std::string_view key, std::string_view value);

    // Deleting a missing key is not an error.
    void remove(const NamespaceHandle& ns, std::string_view key);

    // Deletes every key of `ns`.  Returns the number of keys deleted.
    std::size_t clear(const NamespaceHandle& ns);

    // Throws TransactionError or StorageIOError; the transaction is spent
    // either way.
    void commit();

private:
    friend class Environment;
    explicit WriteTxn(Environment& env);

    void ensure_open() const;

    std::unique_lock<std::mutex> writer_lock_;
    Environment& env_;
    std::unique_ptr<rocksdb::Transaction> txn_;
    bool finished_ = false;
};

// ── Environment ──────────────────────────────────────────────────────────────
//
// One open RocksDB TransactionDB.  Every namespace is a column family; all
// existing column families are reopened at construction.
//
// Thread safety: all public methods may be called concurrently.  Write
// transactions are serialised on an internal writer lock; read transactions
// run concurrently up to max_readers.

class Environment {
public:
    // Opens (or creates) the database at options.path.
    // Throws StorageOpenError if the database cannot be opened.
    explicit Environment(EnvironmentOptions options,
                         std::shared_ptr<spdlog::logger> logger = {});

    ~Environment();

    // Not copyable or movable – RocksDB owns internal state.
    Environment(const Environment&)            = delete;
    Environment& operator=(const Environment&) = delete;
    Environment(Environment&&)                 = delete;
    Environment& operator=(Environment&&)      = delete;

    // Returns the handle for `name`, creating the column family if needed.
    // Throws StorageOpenError on an invalid name or when max_namespaces would
    // be exceeded.
    [[nodiscard]] NamespaceHandle open_namespace(const std::string& name);

    // Names of all namespaces, in name order.
    [[nodiscard]] std::vector<std::string> namespace_names() const;

    // Memtable size in bytes the namespace was opened with.
    [[nodiscard]] uint64_t write_buffer_size(const NamespaceHandle& ns) const;

    // Throws TransactionError when all reader slots are taken.
    [[nodiscard]] ReadTxn begin_read();

    // Blocks until the writer lock is free.
    [[nodiscard]] WriteTxn begin_write();

    // Syncs the write-ahead log and flushes every memtable to disk.
    // Throws StorageIOError.
    void force_sync();

    // Human-readable memory report (memtables, table readers, block cache).
    [[nodiscard]] std::string memory_usage() const;

    [[nodiscard]] uint32_t active_readers() const noexcept {
        return readers_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const EnvironmentOptions& options() const noexcept { return options_; }

private:
    friend class ReadTxn;
    friend class WriteTxn;

    void acquire_reader_slot();
    void release_reader_slot() noexcept;

    EnvironmentOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    std::unique_ptr<rocksdb::TransactionDB> db_;
    rocksdb::ColumnFamilyHandle* default_cf_ = nullptr;

    mutable std::mutex namespaces_mutex_;
    std::map<std::string, rocksdb::ColumnFamilyHandle*> namespaces_;

    std::mutex writer_mutex_;
    std::atomic<uint32_t> readers_{0};
};

} // namespace kvtree::storage
