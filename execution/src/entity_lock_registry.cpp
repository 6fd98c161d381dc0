#include "entity_lock_registry.hpp"

namespace execution {

    std::unique_lock<std::mutex> EntityLockRegistry::lock(EntityKind kind, long long id) {
        std::mutex* entity_mutex = nullptr;
        {
            std::lock_guard<std::mutex> guard(registry_mutex_);
            auto& slot = locks_[{kind, id}];
            if (!slot) {
                slot = std::make_unique<std::mutex>();
            }
            entity_mutex = slot.get();
        }
        // Entries are never erased, so the pointer stays valid outside the registry lock
        return std::unique_lock<std::mutex>(*entity_mutex);
    }

    size_t EntityLockRegistry::size() const {
        std::lock_guard<std::mutex> guard(registry_mutex_);
        return locks_.size();
    }

} // namespace execution
