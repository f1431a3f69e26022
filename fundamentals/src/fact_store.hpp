#pragma once

#include "fact_cache.hpp"
#include "facts_ingestor.hpp"
#include "cancellation.hpp"
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

// Read-through access to fact sets. Concurrent misses for the same ticker
// share one in-flight fetch; followers wait on the leader's result. A follower
// stops waiting when its own token is cancelled, and takes over the fetch if
// the leader was cancelled while the follower was not.
class FactStore {
public:
    FactStore(FactCache& cache, FactsIngestor& ingestor);

    // Throws whatever the ingestor throws, to the leader and every follower,
    // except a Cancelled that only the leader asked for
    RawFactSet get(const std::string& ticker, const CancellationToken& cancel = CancellationToken());

    void invalidate(const std::string& ticker);

    size_t in_flight() const;

private:
    RawFactSet fetch_as_leader(const std::string& key, std::promise<RawFactSet>& promise,
                               const std::shared_future<RawFactSet>& future, const CancellationToken& cancel);
    RawFactSet wait_as_follower(const std::string& key, const std::shared_future<RawFactSet>& future,
                                const CancellationToken& cancel);

    FactCache& cache_;
    FactsIngestor& ingestor_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<RawFactSet>> in_flight_;
};
