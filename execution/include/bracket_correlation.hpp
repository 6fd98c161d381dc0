#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "datatypes.hpp"

namespace execution {

    // What is needed to protect an entry once the exchange reports it filled
    struct CorrelationEntry {
        long long position_id = 0;
        std::optional<long long> signal_id;
        double stop_price = 0.0;
        double target_price = 0.0;
        core::PositionSide side = core::PositionSide::Long;
        double amount = 0.0;
    };

    // In-memory map entry_order_id -> CorrelationEntry, only populated while an entry
    // awaits its fill. Not the system of record; rebuilt from the store at startup.
    class BracketCorrelation {
    public:
        void put(long long entry_order_id, const CorrelationEntry& entry);
        std::optional<CorrelationEntry> find(long long entry_order_id) const;
        bool erase(long long entry_order_id);
        void clear();

        size_t size() const;
        std::vector<long long> entryOrderIds() const;

    private:
        mutable std::mutex mutex_;
        std::map<long long, CorrelationEntry> entries_;
    };

} // namespace execution
