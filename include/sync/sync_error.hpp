#ifndef BSYNC_SYNC_ERROR_HPP
#define BSYNC_SYNC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace bsync {
namespace sync {

class SyncError : public std::runtime_error {
public:
    explicit SyncError(const std::string& message) 
        : std::runtime_error(message) {}
};

// Source root or bucket inaccessible. Aborts the run.
class ScanError : public SyncError {
public:
    explicit ScanError(const std::string& message) 
        : SyncError("Scan error: " + message) {}
};

// A path or key that cannot be mapped. Fatal for that entry only.
class InvalidPathError : public SyncError {
public:
    explicit InvalidPathError(const std::string& message) 
        : SyncError("Invalid path: " + message) {}
};

// Network, timeout or throttling failure; retried
class TransientTransferError : public SyncError {
public:
    explicit TransientTransferError(const std::string& message) 
        : SyncError("Transient transfer error: " + message) {}
};

// Permission, invalid key or local disk failure; never retried
class PermanentTransferError : public SyncError {
public:
    explicit PermanentTransferError(const std::string& message) 
        : SyncError("Transfer error: " + message) {}
};

class CancellationError : public SyncError {
public:
    explicit CancellationError(const std::string& message) 
        : SyncError("Cancelled: " + message) {}
};

} // namespace sync
} // namespace bsync

#endif // BSYNC_SYNC_ERROR_HPP
