#pragma once

#include <stdexcept>
#include <string>

namespace kvtree {

// ── Error taxonomy ───────────────────────────────────────────────────────────
//
// Every failure reported by the underlying store is converted into one of the
// exceptions below and thrown to the caller of the failing operation.

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The environment or a namespace cannot be created or opened: bad path,
// permissions, corruption, or a configured limit was exceeded.
class StorageOpenError : public StorageError {
public:
    using StorageError::StorageError;
};

// A transaction could not begin or commit (contention, resource exhaustion).
class TransactionError : public StorageError {
public:
    using StorageError::StorageError;
};

// Read, write or sync failure at the store level.
class StorageIOError : public StorageError {
public:
    using StorageError::StorageError;
};

} // namespace kvtree
