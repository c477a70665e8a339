#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <cstddef>

template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_); // ← UNIQUE_LOCK для WRITE!
        map_[key] = value;
    }

    /**
     * @brief Атомарная проверка и вставка
     *
     * Вставляет value, если ключа нет или если replaceExisting(existing) == true.
     * Проверка и запись выполняются под одним unique_lock — между ними
     * не может вклиниться другой писатель.
     *
     * @return true если значение было записано
     */
    template <typename Pred>
    bool insertIfAbsentOr(const K &key, const std::shared_ptr<V> &value, Pred replaceExisting)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end() && !replaceExisting(*it->second))
        {
            return false;
        }
        map_[key] = value;
        return true;
    }

    bool insertIfAbsent(const K &key, const std::shared_ptr<V> &value)
    {
        return insertIfAbsentOr(key, value, [](const V &) { return false; });
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Удалить все записи, для которых pred(value) == true
     * @return Количество удалённых записей
     */
    template <typename Pred>
    size_t eraseIf(Pred pred)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = map_.begin(); it != map_.end();)
        {
            if (pred(*it->second))
            {
                it = map_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
