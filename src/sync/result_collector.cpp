#include "sync/result_collector.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace bsync {
namespace sync {

void ResultCollector::add(TransferResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.push_back(std::move(result));
    BOOST_LOG_TRIVIAL(trace) << "Collector: Stored result for " << results_.back().relative_path
                             << ". Results collected: " << results_.size();
}

std::vector<TransferResult> ResultCollector::take_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferResult> taken;
    taken.swap(results_);
    return taken;
}

bool ResultCollector::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.empty();
}

std::size_t ResultCollector::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

} // namespace sync
} // namespace bsync
