#include "bracket_correlation.hpp"

namespace execution {

    void BracketCorrelation::put(long long entry_order_id, const CorrelationEntry& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[entry_order_id] = entry;
    }

    std::optional<CorrelationEntry> BracketCorrelation::find(long long entry_order_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(entry_order_id);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool BracketCorrelation::erase(long long entry_order_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(entry_order_id) > 0;
    }

    void BracketCorrelation::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    size_t BracketCorrelation::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::vector<long long> BracketCorrelation::entryOrderIds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<long long> ids;
        ids.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            ids.push_back(id);
        }
        return ids;
    }

} // namespace execution
