#include "sync/types.hpp"
#include "sync/sync_error.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace bsync {
namespace sync {

namespace {

void validate_segment(const std::string& segment) {
  if (segment.empty()) {
    throw InvalidPathError("empty path segment");
  }
  if (segment == "." || segment == "..") {
    throw InvalidPathError("relative segment '" + segment + "' is not allowed");
  }
  for (unsigned char c : segment) {
    if (c == '/' || c == '\\') {
      throw InvalidPathError("separator inside segment '" + segment + "'");
    }
    if (c < 0x20 || c == 0x7F) {
      throw InvalidPathError("control character in segment '" + segment + "'");
    }
  }
}

} // namespace

std::string format_timestamp(Timestamp ts) {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
    ts.time_since_epoch()).count();
  std::time_t seconds = static_cast<std::time_t>(millis / 1000);
  long remainder = static_cast<long>(millis % 1000);
  if (remainder < 0) {
    remainder += 1000;
    --seconds;
  }

  std::tm tm{};
  gmtime_r(&seconds, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
     << std::setw(3) << std::setfill('0') << remainder << 'Z';
  return ss.str();
}


//==============================================
// RELATIVE PATH
//==============================================

RelativePath::RelativePath(std::vector<std::string> segments)
  : segments_(std::move(segments)) {
  if (segments_.empty()) {
    throw InvalidPathError("empty relative path");
  }

  for (const auto& segment : segments_) {
    validate_segment(segment);
    if (!canonical_.empty()) {
      canonical_ += '/';
    }
    canonical_ += segment;
  }
}

RelativePath RelativePath::parse(const std::string& canonical) {
  if (canonical.empty()) {
    throw InvalidPathError("empty relative path");
  }
  if (canonical.front() == '/') {
    throw InvalidPathError("absolute path '" + canonical + "'");
  }

  std::vector<std::string> segments;
  std::string::size_type start = 0;
  while (true) {
    const auto pos = canonical.find('/', start);
    segments.push_back(canonical.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
    if (pos == std::string::npos) {
      break;
    }
    start = pos + 1;
  }
  return RelativePath(std::move(segments));
}


//==============================================
// MANIFEST
//==============================================

bool Manifest::add(ManifestEntry entry) {
  RelativePath key = entry.relative_path;
  auto [it, inserted] = entries_.emplace(std::move(key), std::move(entry));
  if (!inserted) {
    BOOST_LOG_TRIVIAL(warning) << "Manifest: Duplicate entry ignored: " << it->first;
  }
  return inserted;
}

void Manifest::add_directory(RelativePath path) {
  directories_.insert(std::move(path));
}

void Manifest::add_rejected(const std::string& name, const std::string& reason) {
  rejected_.emplace_back(name, reason);
}

const ManifestEntry* Manifest::find(const RelativePath& path) const {
  auto it = entries_.find(path);
  return it == entries_.end() ? nullptr : &it->second;
}

std::uint64_t Manifest::total_bytes() const {
  std::uint64_t total = 0;
  for (const auto& [path, entry] : entries_) {
    total += entry.size;
  }
  return total;
}


//==============================================
// STRING CONVERSIONS
//==============================================

const char* to_string(TransferDirection direction) {
  switch (direction) {
    case TransferDirection::UPLOAD:   return "UPLOAD";
    case TransferDirection::DOWNLOAD: return "DOWNLOAD";
  }
  return "UNKNOWN";
}

const char* to_string(TransferReason reason) {
  switch (reason) {
    case TransferReason::NEW:              return "NEW";
    case TransferReason::MODIFIED:         return "MODIFIED";
    case TransferReason::STALE_LOCAL_ONLY: return "STALE_LOCAL_ONLY";
  }
  return "UNKNOWN";
}

const char* to_string(TransferOutcome outcome) {
  switch (outcome) {
    case TransferOutcome::SUCCEEDED: return "SUCCEEDED";
    case TransferOutcome::FAILED:    return "FAILED";
    case TransferOutcome::SKIPPED:   return "SKIPPED";
  }
  return "UNKNOWN";
}

} // namespace sync
} // namespace bsync
