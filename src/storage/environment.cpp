#include "storage/environment.hpp"

#include "common/errors.hpp"

#include <rocksdb/db.h>
#include <rocksdb/env.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/sst_file_manager.h>
#include <rocksdb/status.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>

#include <format>
#include <system_error>
#include <utility>

namespace kvtree::storage {

namespace fs = std::filesystem;

namespace {

rocksdb::Slice to_slice(std::string_view sv) {
    return rocksdb::Slice{sv.data(), sv.size()};
}

std::string_view to_view(const rocksdb::Slice& s) {
    return std::string_view{s.data(), s.size()};
}

double to_mib(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

// Options for every column family, whether created now or reopened later.
rocksdb::ColumnFamilyOptions namespace_options() {
    rocksdb::ColumnFamilyOptions cf_options;
    cf_options.OptimizeLevelStyleCompaction();
    return cf_options;
}

} // namespace

// ── check_status ──────────────────────────────────────────────────────────────

void check_status(const rocksdb::Status& status, FailureKind kind,
                  std::string_view context) {
    if (status.ok()) {
        return;
    }

    const std::string message = std::format("{}: {}", context, status.ToString());

    if (status.IsBusy() || status.IsTimedOut() || status.IsTryAgain() ||
        status.IsExpired()) {
        throw TransactionError(message);
    }

    switch (kind) {
    case FailureKind::Open:
        throw StorageOpenError(message);
    case FailureKind::Transaction:
        throw TransactionError(message);
    case FailureKind::IO:
        throw StorageIOError(message);
    }
    throw StorageIOError(message);
}

// ── Cursor ────────────────────────────────────────────────────────────────────

Cursor::Cursor(std::unique_ptr<rocksdb::Iterator> it, bool backwards)
    : it_(std::move(it))
    , backwards_(backwards)
{}

Cursor::~Cursor() = default;
Cursor::Cursor(Cursor&&) noexcept = default;
Cursor& Cursor::operator=(Cursor&&) noexcept = default;

bool Cursor::valid() const {
    return it_ && it_->Valid();
}

std::string_view Cursor::key() const {
    return to_view(it_->key());
}

std::string_view Cursor::value() const {
    return to_view(it_->value());
}

void Cursor::next() {
    if (backwards_) {
        it_->Prev();
    } else {
        it_->Next();
    }
}

void Cursor::check() const {
    check_status(it_->status(), FailureKind::IO, "range cursor");
}

// ── ReadTxn ───────────────────────────────────────────────────────────────────

ReadTxn::ReadTxn(Environment& env)
    : env_(env)
{
    env_.acquire_reader_slot();
    snapshot_ = env_.db_->GetSnapshot();
}

ReadTxn::~ReadTxn() {
    if (snapshot_) {
        env_.db_->ReleaseSnapshot(snapshot_);
    }
    env_.release_reader_slot();
}

std::optional<std::string> ReadTxn::get(const NamespaceHandle& ns,
                                        std::string_view key) const {
    rocksdb::ReadOptions read_options;
    read_options.snapshot = snapshot_;

    std::string value;
    auto status = env_.db_->Get(read_options, ns.column_family, to_slice(key), &value);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    check_status(status, FailureKind::IO, std::format("get from '{}'", ns.name));
    return value;
}

Cursor ReadTxn::forward_range(const NamespaceHandle& ns,
                              std::optional<std::string_view> start) const {
    rocksdb::ReadOptions read_options;
    read_options.snapshot = snapshot_;

    std::unique_ptr<rocksdb::Iterator> it(
        env_.db_->NewIterator(read_options, ns.column_family));
    if (start) {
        it->Seek(to_slice(*start));
    } else {
        it->SeekToFirst();
    }
    return Cursor{std::move(it), false};
}

Cursor ReadTxn::backward_range(const NamespaceHandle& ns,
                               std::string_view end_inclusive) const {
    rocksdb::ReadOptions read_options;
    read_options.snapshot = snapshot_;

    std::unique_ptr<rocksdb::Iterator> it(
        env_.db_->NewIterator(read_options, ns.column_family));
    it->SeekForPrev(to_slice(end_inclusive));
    return Cursor{std::move(it), true};
}

// ── WriteTxn ──────────────────────────────────────────────────────────────────

WriteTxn::WriteTxn(Environment& env)
    : writer_lock_(env.writer_mutex_)
    , env_(env)
{
    rocksdb::WriteOptions write_options;
    write_options.sync = env_.options_.sync_writes;
    txn_.reset(env_.db_->BeginTransaction(write_options));
    if (!txn_) {
        throw TransactionError("failed to begin write transaction");
    }
}

WriteTxn::~WriteTxn() {
    if (txn_ && !finished_) {
        auto status = txn_->Rollback();
        if (!status.ok() && env_.logger_) {
            env_.logger_->warn("Write transaction rollback failed: {}",
                               status.ToString());
        }
    }
}

void WriteTxn::ensure_open() const {
    if (finished_) {
        throw TransactionError("write transaction already finished");
    }
}

std::optional<std::string> WriteTxn::get(const NamespaceHandle& ns,
                                         std::string_view key) const {
    ensure_open();
    std::string value;
    auto status = txn_->Get(rocksdb::ReadOptions{}, ns.column_family,
                            to_slice(key), &value);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    check_status(status, FailureKind::IO, std::format("get from '{}'", ns.name));
    return value;
}

void WriteTxn::put(const NamespaceHandle& ns, std::string_view key,
                   std::string_view value) {
    ensure_open();
    check_status(txn_->Put(ns.column_family, to_slice(key), to_slice(value)),
                 FailureKind::IO, std::format("put into '{}'", ns.name));
}

void WriteTxn::remove(const NamespaceHandle& ns, std::string_view key) {
    ensure_open();
    check_status(txn_->Delete(ns.column_family, to_slice(key)),
                 FailureKind::IO, std::format("delete from '{}'", ns.name));
}

std::size_t WriteTxn::clear(const NamespaceHandle& ns) {
    ensure_open();

    // Collect first: deleting through the transaction while its own iterator
    // is positioned would make the iterator observe the deletions.
    std::vector<std::string> keys;
    {
        std::unique_ptr<rocksdb::Iterator> it(
            txn_->GetIterator(rocksdb::ReadOptions{}, ns.column_family));
        for (it->SeekToFirst(); it->Valid(); it->Next()) {
            keys.emplace_back(it->key().ToString());
        }
        check_status(it->status(), FailureKind::IO,
                     std::format("scan '{}' for clear", ns.name));
    }

    for (const auto& key : keys) {
        remove(ns, key);
    }
    return keys.size();
}

void WriteTxn::commit() {
    ensure_open();
    finished_ = true;
    check_status(txn_->Commit(), FailureKind::Transaction, "commit");
}

// ── Environment ───────────────────────────────────────────────────────────────

Environment::Environment(EnvironmentOptions options,
                         std::shared_ptr<spdlog::logger> logger)
    : options_(std::move(options))
    , logger_(std::move(logger))
{
    if (options_.path.empty()) {
        throw StorageOpenError("database path must not be empty");
    }

    std::error_code fs_ec;
    fs::create_directories(options_.path, fs_ec);
    if (fs_ec) {
        throw StorageOpenError(std::format("Failed to create database directory {}: {}",
                                           options_.path.string(), fs_ec.message()));
    }

    rocksdb::Options db_options{rocksdb::DBOptions{}, namespace_options()};
    db_options.create_if_missing = true;
    db_options.create_missing_column_families = true;
    db_options.IncreaseParallelism();

    // The size cap is enforced by refusing writes once SST files reach it.
    db_options.sst_file_manager.reset(
        rocksdb::NewSstFileManager(rocksdb::Env::Default()));
    db_options.sst_file_manager->SetMaxAllowedSpaceUsage(options_.size_cap_bytes);

    // A fresh directory has no column families yet; anything else that fails
    // to list will fail again, with a better message, in Open().
    std::vector<std::string> cf_names;
    auto list_status = rocksdb::DB::ListColumnFamilies(
        db_options, options_.path.string(), &cf_names);
    if (!list_status.ok() || cf_names.empty()) {
        cf_names = {rocksdb::kDefaultColumnFamilyName};
    }

    if (cf_names.size() - 1 > options_.max_namespaces) {
        throw StorageOpenError(std::format(
            "Database at {} has {} namespaces, more than the configured maximum of {}",
            options_.path.string(), cf_names.size() - 1, options_.max_namespaces));
    }

    std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
    descriptors.reserve(cf_names.size());
    for (const auto& name : cf_names) {
        descriptors.emplace_back(name, namespace_options());
    }

    std::vector<rocksdb::ColumnFamilyHandle*> handles;
    rocksdb::TransactionDB* raw_db = nullptr;
    auto status = rocksdb::TransactionDB::Open(
        db_options, rocksdb::TransactionDBOptions{}, options_.path.string(),
        descriptors, &handles, &raw_db);
    if (!status.ok()) {
        for (auto* handle : handles) {
            delete handle;
        }
        check_status(status, FailureKind::Open,
                     std::format("Failed to open RocksDB at {}", options_.path.string()));
    }
    db_.reset(raw_db);

    // Descriptor order = handle order
    for (std::size_t i = 0; i < handles.size(); ++i) {
        if (cf_names[i] == rocksdb::kDefaultColumnFamilyName) {
            default_cf_ = handles[i];
        } else {
            namespaces_.emplace(cf_names[i], handles[i]);
        }
    }

    if (logger_) {
        logger_->info("RocksDB opened at {} ({} namespaces)",
                      options_.path.string(), namespaces_.size());
    }
}

Environment::~Environment() {
    if (!db_) {
        return;
    }
    if (logger_) {
        logger_->info("Closing RocksDB at {}", options_.path.string());
    }
    for (auto& [name, handle] : namespaces_) {
        auto destroyed = db_->DestroyColumnFamilyHandle(handle);
        if (!destroyed.ok() && logger_) {
            logger_->warn("Releasing namespace '{}' failed: {}", name, destroyed.ToString());
        }
    }
    if (default_cf_) {
        auto destroyed = db_->DestroyColumnFamilyHandle(default_cf_);
        if (!destroyed.ok() && logger_) {
            logger_->warn("Releasing default column family failed: {}", destroyed.ToString());
        }
    }
    auto status = db_->Close();
    if (!status.ok() && logger_) {
        logger_->warn("RocksDB close reported: {}", status.ToString());
    }
}

NamespaceHandle Environment::open_namespace(const std::string& name) {
    if (name.empty()) {
        throw StorageOpenError("namespace name must not be empty");
    }
    if (name == rocksdb::kDefaultColumnFamilyName) {
        throw StorageOpenError(std::format("namespace name '{}' is reserved", name));
    }

    std::lock_guard lock(namespaces_mutex_);
    if (auto it = namespaces_.find(name); it != namespaces_.end()) {
        return NamespaceHandle{name, it->second};
    }

    if (namespaces_.size() >= options_.max_namespaces) {
        throw StorageOpenError(std::format(
            "cannot create namespace '{}': limit of {} namespaces reached",
            name, options_.max_namespaces));
    }

    rocksdb::ColumnFamilyHandle* handle = nullptr;
    check_status(db_->CreateColumnFamily(namespace_options(), name, &handle),
                 FailureKind::Open, std::format("create namespace '{}'", name));
    namespaces_.emplace(name, handle);

    if (logger_) {
        logger_->debug("Created namespace '{}'", name);
    }
    return NamespaceHandle{name, handle};
}

uint64_t Environment::write_buffer_size(const NamespaceHandle& ns) const {
    return db_->GetOptions(ns.column_family).write_buffer_size;
}

std::vector<std::string> Environment::namespace_names() const {
    std::lock_guard lock(namespaces_mutex_);
    std::vector<std::string> names;
    names.reserve(namespaces_.size());
    for (const auto& [name, _] : namespaces_) {
        names.push_back(name);
    }
    return names;
}

ReadTxn Environment::begin_read() {
    return ReadTxn{*this};
}

WriteTxn Environment::begin_write() {
    return WriteTxn{*this};
}

void Environment::force_sync() {
    check_status(db_->FlushWAL(true), FailureKind::IO, "sync write-ahead log");

    std::vector<rocksdb::ColumnFamilyHandle*> handles;
    {
        std::lock_guard lock(namespaces_mutex_);
        handles.reserve(namespaces_.size() + 1);
        handles.push_back(default_cf_);
        for (const auto& [_, handle] : namespaces_) {
            handles.push_back(handle);
        }
    }

    rocksdb::FlushOptions flush_options;
    flush_options.wait = true;
    check_status(db_->Flush(flush_options, handles), FailureKind::IO, "flush memtables");
}

std::string Environment::memory_usage() const {
    // Properties a column family does not report stay at zero.
    uint64_t memtables = 0;
    uint64_t table_readers = 0;
    uint64_t block_cache = 0;
    (void)db_->GetAggregatedIntProperty("rocksdb.cur-size-all-mem-tables", &memtables);
    (void)db_->GetAggregatedIntProperty("rocksdb.estimate-table-readers-mem", &table_readers);
    (void)db_->GetIntProperty(default_cf_, "rocksdb.block-cache-usage", &block_cache);

    return std::format(
        "Memtables: {:.2f} MiB\nTable readers: {:.2f} MiB\nBlock cache: {:.2f} MiB\n"
        "Active readers: {}/{}\n",
        to_mib(memtables), to_mib(table_readers), to_mib(block_cache),
        active_readers(), options_.max_readers);
}

void Environment::acquire_reader_slot() {
    uint32_t current = readers_.load(std::memory_order_relaxed);
    do {
        if (current >= options_.max_readers) {
            throw TransactionError(std::format(
                "cannot begin read transaction: all {} reader slots in use",
                options_.max_readers));
        }
    } while (!readers_.compare_exchange_weak(current, current + 1,
                                             std::memory_order_acq_rel,
                                             std::memory_order_relaxed));
}

void Environment::release_reader_slot() noexcept {
    readers_.fetch_sub(1, std::memory_order_acq_rel);
}

} // namespace kvtree::storage
