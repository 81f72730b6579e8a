#pragma once

#include "CancellationToken.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Process-wide bookkeeping of active invocations per action id
class RunRegistry {
public:
    using TokenPtr = std::shared_ptr<CancellationToken>;

    static RunRegistry& instance();

    // Registers a new invocation; runs that join while a stop is pending start
    // cancelled unless inherit_stop is false (recovery pipelines)
    TokenPtr acquire(const std::string& action_id, bool inherit_stop = true);

    // The entry disappears once its last active run is released
    void release(const std::string& action_id, const TokenPtr& token);

    // Cancels every active run of the action
    void stop(const std::string& action_id);
    void stop_all();

    bool is_cancelled(const std::string& action_id) const;
    size_t active_runs(const std::string& action_id) const;
    std::vector<std::string> active_actions() const;

private:
    struct Entry {
        size_t active_runs = 0;
        bool stop_pending = false;
        std::set<TokenPtr> tokens;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};
