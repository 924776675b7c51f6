#ifndef BSYNC_STORAGE_ERROR_HPP
#define BSYNC_STORAGE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace bsync {
namespace storage {

enum class StorageErrorKind {
    TRANSIENT,          // network failure, timeout, throttling, 5xx
    NOT_FOUND,          // missing bucket or key
    PERMISSION_DENIED,
    INVALID_KEY,
    OTHER
};

inline const char* storage_error_kind_to_string(StorageErrorKind kind) {
    switch (kind) {
        case StorageErrorKind::TRANSIENT: return "Transient";
        case StorageErrorKind::NOT_FOUND: return "Not found";
        case StorageErrorKind::PERMISSION_DENIED: return "Permission denied";
        case StorageErrorKind::INVALID_KEY: return "Invalid key";
        case StorageErrorKind::OTHER: return "Storage error";
        default: return "Undefined error";
    }
}

class StorageError : public std::runtime_error {
public:
    StorageError(StorageErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(storage_error_kind_to_string(kind)) + ": " + message)
        , kind_(kind) {}

    StorageErrorKind kind() const { return kind_; }
    bool is_transient() const { return kind_ == StorageErrorKind::TRANSIENT; }

private:
    StorageErrorKind kind_;
};

} // namespace storage
} // namespace bsync

#endif // BSYNC_STORAGE_ERROR_HPP
