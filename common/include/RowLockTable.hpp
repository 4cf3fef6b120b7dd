#pragma once

#include <unordered_map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

/**
 * @brief Таблица построчных блокировок
 *
 * lock(key) возвращает RAII-владение mutex'ом строки. Запись таблицы живёт,
 * пока её держит или ждёт хотя бы один поток, и удаляется при освобождении
 * последним: размер таблицы ограничен числом одновременно заблокированных
 * строк, а не числом когда-либо запрошенных ключей.
 *
 * @example
 * ```cpp
 * RowLockTable<std::string> locks;
 * {
 *     auto rowLock = locks.lock("unit-1");
 *     // ... изменение строки
 * }   // освобождено, запись удалена
 * ```
 */
template <typename K>
class RowLockTable
{
    struct Entry
    {
        std::mutex mutex;
        size_t holders = 0;     ///< владелец + ожидающие
    };

public:
    /**
     * @brief Владение блокировкой строки (move-only)
     */
    class RowLock
    {
    public:
        RowLock() = default;

        RowLock(RowLock &&other) noexcept
            : table_(other.table_), key_(std::move(other.key_)), entry_(other.entry_)
        {
            other.table_ = nullptr;
            other.entry_ = nullptr;
        }

        RowLock &operator=(RowLock &&other) noexcept
        {
            if (this != &other)
            {
                release();
                table_ = other.table_;
                key_ = std::move(other.key_);
                entry_ = other.entry_;
                other.table_ = nullptr;
                other.entry_ = nullptr;
            }
            return *this;
        }

        RowLock(const RowLock &) = delete;
        RowLock &operator=(const RowLock &) = delete;

        ~RowLock() { release(); }

        bool ownsLock() const { return entry_ != nullptr; }

        void release()
        {
            if (!entry_)
            {
                return;
            }
            entry_->mutex.unlock();
            table_->releaseEntry(key_);
            entry_ = nullptr;
            table_ = nullptr;
        }

    private:
        friend class RowLockTable;

        RowLock(RowLockTable *table, K key, Entry *entry)
            : table_(table), key_(std::move(key)), entry_(entry)
        {}

        RowLockTable *table_ = nullptr;
        K key_{};
        Entry *entry_ = nullptr;
    };

    RowLockTable() = default;

    RowLockTable(const RowLockTable &) = delete;
    RowLockTable &operator=(const RowLockTable &) = delete;

    /**
     * @brief Заблокировать строку (ждёт, если её держит другой поток)
     */
    RowLock lock(const K &key)
    {
        Entry *entry = nullptr;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            auto &slot = entries_[key];
            if (!slot)
            {
                slot = std::make_unique<Entry>();
            }
            ++slot->holders;
            entry = slot.get();
        }

        // Ожидание вне mutex_ таблицы; запись не удалится, пока holders > 0
        entry->mutex.lock();
        return RowLock(this, key, entry);
    }

    bool contains(const K &key) const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return entries_.find(key) != entries_.end();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return entries_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<K, std::unique_ptr<Entry>> entries_;

    void releaseEntry(const K &key)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && --it->second->holders == 0)
        {
            entries_.erase(it);
        }
    }
};
