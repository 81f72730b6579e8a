#include "RunRegistry.hpp"
#include "LogUtils.hpp"

RunRegistry& RunRegistry::instance() {
    static RunRegistry registry;
    return registry;
}

RunRegistry::TokenPtr RunRegistry::acquire(const std::string& action_id, bool inherit_stop) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[action_id];
    auto token = std::make_shared<CancellationToken>();
    if (entry.stop_pending && inherit_stop) {
        token->cancel();
    }
    entry.tokens.insert(token);
    ++entry.active_runs;
    return token;
}

void RunRegistry::release(const std::string& action_id, const TokenPtr& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(action_id);
    if (it == entries_.end()) {
        return;
    }

    auto& entry = it->second;
    if (entry.tokens.erase(token) > 0 && entry.active_runs > 0) {
        --entry.active_runs;
    }
    if (entry.active_runs == 0) {
        entries_.erase(it);
    }
}

void RunRegistry::stop(const std::string& action_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(action_id);
    if (it == entries_.end()) {
        LogUtils::debug("Stop requested for idle action '{}'", action_id);
        return;
    }

    LogUtils::info("Stopping action '{}' ({} active run(s))", action_id, it->second.active_runs);
    it->second.stop_pending = true;
    for (const auto& token : it->second.tokens) {
        token->cancel();
    }
}

void RunRegistry::stop_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [action_id, entry] : entries_) {
        LogUtils::info("Stopping action '{}' ({} active run(s))", action_id, entry.active_runs);
        entry.stop_pending = true;
        for (const auto& token : entry.tokens) {
            token->cancel();
        }
    }
}

bool RunRegistry::is_cancelled(const std::string& action_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(action_id);
    return it != entries_.end() && it->second.stop_pending;
}

size_t RunRegistry::active_runs(const std::string& action_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(action_id);
    return it == entries_.end() ? 0 : it->second.active_runs;
}

std::vector<std::string> RunRegistry::active_actions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [action_id, entry] : entries_) {
        ids.push_back(action_id);
    }
    return ids;
}
