#pragma once

#include <mutex>
#include <vector>
#include "sync/types.hpp"

namespace bsync {
namespace sync {

// Thread-safe sink for transfer results produced by the worker pool
class ResultCollector {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR
    ResultCollector() = default;
    ~ResultCollector() = default;


    // ---- COLLECTOR CONTROL METHODS ----
    // Appends one result
    void add(TransferResult result);
    // Removes and returns every result collected so far
    std::vector<TransferResult> take_all();


    // ---- QUERY METHODS ----
    bool empty() const;
    std::size_t size() const;

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::vector<TransferResult> results_;
};

} // namespace sync
} // namespace bsync
