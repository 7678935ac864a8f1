#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <functional>
#include <memory>
#include <mutex>

template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    /**
     * @brief Найти значение или атомарно создать его через factory
     *
     * Два потока, одновременно запросившие отсутствующий ключ,
     * получат один и тот же объект.
     */
    std::shared_ptr<V> getOrCreate(const K &key, const std::function<std::shared_ptr<V>()> &factory)
    {
        if (auto existing = find(key))
        {
            return existing;
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        // Double-check после получения exclusive lock
        auto it = map_.find(key);
        if (it != map_.end())
        {
            return it->second;
        }
        auto created = factory();
        map_[key] = created;
        return created;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
