#include "fact_store.hpp"
#include "ticker_directory.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>

FactStore::FactStore(FactCache& cache, FactsIngestor& ingestor)
    : cache_(cache), ingestor_(ingestor) {
}

RawFactSet FactStore::get(const std::string& ticker, const CancellationToken& cancel) {
    auto key = TickerDirectory::normalize(ticker);

    if (auto cached = cache_.get(key)) {
        spdlog::debug("Fact cache hit for {}", key);
        return *cached;
    }

    while (true) {
        std::promise<RawFactSet> promise;
        std::shared_future<RawFactSet> future;
        bool leader = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = in_flight_.find(key);
            if (it != in_flight_.end()) {
                future = it->second;
            } else {
                // A leader may have finished between the miss above and the lock
                if (auto cached = cache_.get(key)) {
                    return *cached;
                }
                future = promise.get_future().share();
                in_flight_.emplace(key, future);
                leader = true;
            }
        }

        if (leader) {
            return fetch_as_leader(key, promise, future, cancel);
        }

        try {
            return wait_as_follower(key, future, cancel);
        } catch (const FundamentalsError& e) {
            if (e.kind() != ErrorKind::Cancelled || cancel.is_cancelled()) {
                throw;
            }
            spdlog::info("In-flight fetch for {} was cancelled by its owner, retrying", key);
        }
    }
}

RawFactSet FactStore::fetch_as_leader(const std::string& key, std::promise<RawFactSet>& promise,
                                      const std::shared_future<RawFactSet>& future,
                                      const CancellationToken& cancel) {
    try {
        auto facts = ingestor_.fetch_company_facts(key, cancel);
        cache_.put(key, facts);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(key);
        }
        promise.set_value(std::move(facts));
    } catch (const std::exception&) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(key);
        }
        promise.set_exception(std::current_exception());
    }
    return future.get();
}

RawFactSet FactStore::wait_as_follower(const std::string& key, const std::shared_future<RawFactSet>& future,
                                       const CancellationToken& cancel) {
    spdlog::debug("Joining in-flight fetch for {}", key);
    while (future.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (cancel.is_cancelled()) {
            throw FundamentalsError::cancelled("wait for facts of " + key);
        }
    }
    return future.get();
}

void FactStore::invalidate(const std::string& ticker) {
    auto key = TickerDirectory::normalize(ticker);
    cache_.remove(key);
    spdlog::info("Invalidated cached facts for {}", key);
}

size_t FactStore::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}
