#ifndef BSYNC_SYNC_TYPES_HPP
#define BSYNC_SYNC_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace bsync {
namespace sync {

using Timestamp = std::chrono::system_clock::time_point;

// Renders a timestamp as ISO-8601 UTC with millisecond precision
std::string format_timestamp(Timestamp ts);


/**
 * Path of an item relative to the sync root, as an ordered list of segments.
 * Construction validates every segment: no empty, "." or ".." segments, no
 * '/' or '\\' inside a segment and no control characters. Throws
 * InvalidPathError otherwise.
 */
class RelativePath {
public:
  RelativePath() = default;
  explicit RelativePath(std::vector<std::string> segments);

  // Splits a '/'-separated string and validates it
  static RelativePath parse(const std::string& canonical);

  const std::vector<std::string>& segments() const { return segments_; }
  bool empty() const { return segments_.empty(); }

  // Segments joined with '/'
  const std::string& str() const { return canonical_; }

  bool operator==(const RelativePath& other) const { return canonical_ == other.canonical_; }
  bool operator!=(const RelativePath& other) const { return canonical_ != other.canonical_; }
  bool operator<(const RelativePath& other) const { return canonical_ < other.canonical_; }

private:
  std::vector<std::string> segments_;
  std::string canonical_;
};

inline std::ostream& operator<<(std::ostream& os, const RelativePath& path) {
  os << path.str();
  return os;
}


struct ManifestEntry {
  RelativePath relative_path;
  std::uint64_t size{0};
  Timestamp last_modified{};
  // Lowercase hex MD5 when the side can supply one
  std::optional<std::string> content_hash;
};


/**
 * Normalized snapshot of one side of a sync. Entries are keyed by relative
 * path and iterate in canonical path order.
 */
class Manifest {
public:
  using EntryMap = std::map<RelativePath, ManifestEntry>;
  using const_iterator = EntryMap::const_iterator;

  // ---- MUTATORS ----
  // Returns false if an entry with the same path is already present
  bool add(ManifestEntry entry);
  // Directory marker seen on the remote side
  void add_directory(RelativePath path);
  // Records an item that could not be represented
  void add_rejected(const std::string& name, const std::string& reason);


  // ---- QUERY OPERATIONS ----
  const ManifestEntry* find(const RelativePath& path) const;
  bool contains(const RelativePath& path) const { return entries_.count(path) != 0; }
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  std::uint64_t total_bytes() const;

  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

  const std::set<RelativePath>& directories() const { return directories_; }
  const std::vector<std::pair<std::string, std::string>>& rejected() const { return rejected_; }

private:
  EntryMap entries_;
  std::set<RelativePath> directories_;
  std::vector<std::pair<std::string, std::string>> rejected_;
};


enum class TransferDirection {
  UPLOAD,
  DOWNLOAD
};

enum class TransferReason {
  NEW,
  MODIFIED,
  // Present only on the destination; the task removes the destination copy
  STALE_LOCAL_ONLY
};

struct TransferTask {
  RelativePath relative_path;
  TransferDirection direction{TransferDirection::UPLOAD};
  TransferReason reason{TransferReason::NEW};
};


enum class TransferOutcome {
  SUCCEEDED,
  FAILED,
  SKIPPED
};

struct TransferResult {
  RelativePath relative_path;
  TransferOutcome outcome{TransferOutcome::SKIPPED};
  std::optional<std::string> error_detail;
  // Dispatches to a worker; a task skipped on cancellation counts its one dispatch
  unsigned int attempts{1};
};


struct SyncSummary {
  std::size_t succeeded{0};
  std::size_t failed{0};
  // Unchanged entries plus tasks skipped by cancellation
  std::size_t skipped{0};

  // Source entries found equivalent on the destination
  std::size_t unchanged{0};
  // Destination-only entries left in place because deletion was not enabled
  std::size_t stale_ignored{0};

  // Failed relative paths with their error detail
  std::vector<std::pair<std::string, std::string>> failures;
  // Items rejected during scanning (name, reason)
  std::vector<std::pair<std::string, std::string>> rejected;

  bool cancelled{false};
  bool aborted{false};
  std::string abort_reason;
  // Controller state when the summary was produced (DONE or ABORTED)
  std::string final_state;

  // A cancelled run is partial and never counts as a success
  bool success() const { return !aborted && !cancelled && failed == 0; }
};


// ---- STRING CONVERSIONS FOR LOGGING ----
const char* to_string(TransferDirection direction);
const char* to_string(TransferReason reason);
const char* to_string(TransferOutcome outcome);

inline std::ostream& operator<<(std::ostream& os, TransferDirection direction) {
  return os << to_string(direction);
}

inline std::ostream& operator<<(std::ostream& os, TransferReason reason) {
  return os << to_string(reason);
}

inline std::ostream& operator<<(std::ostream& os, TransferOutcome outcome) {
  return os << to_string(outcome);
}

} // namespace sync
} // namespace bsync

#endif // BSYNC_SYNC_TYPES_HPP
