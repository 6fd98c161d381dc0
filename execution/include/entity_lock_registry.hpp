#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace execution {

    enum class EntityKind {
        Order,
        Position,
        Portfolio
    };

    // One mutex per persisted entity. Every read-modify-write of an Order,
    // Position or the Portfolio row holds the entity's lock.
    class EntityLockRegistry {
    public:
        std::unique_lock<std::mutex> lock(EntityKind kind, long long id);

        size_t size() const;

    private:
        mutable std::mutex registry_mutex_;
        std::map<std::pair<EntityKind, long long>, std::unique_ptr<std::mutex>> locks_;
    };

} // namespace execution
