/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "LedgerError.hpp"

#include <algorithm>
#include <mutex>
#include <shared_mutex>

//-------------------------------------------------------------------------

namespace uniledger
{

//-------------------------------------------------------------------------

// Id-keyed store where every value is guarded by its own timed mutex.
// Slots are never erased, so a handle stays valid for its whole lifetime.
// Lock waits are bounded; a timeout surfaces as CONCURRENCY_CONFLICT.
template<typename Id, typename T>
class ThreadSafeRegistry
{
public:
    using Lock = std::unique_lock<std::timed_mutex>;

    class Handle
    {
    public:
        Handle(Id id, Lock lock, T* value) noexcept
            : m_id{id}, m_lock{std::move(lock)}, m_value{value}
        {}

        [[nodiscard]] Id id() const noexcept { return m_id; }
        [[nodiscard]] T& operator*() const noexcept { return *m_value; }
        [[nodiscard]] T* operator->() const noexcept { return m_value; }

    private:
        Id m_id;
        Lock m_lock;
        T* m_value;
    };

    ThreadSafeRegistry(std::string label, std::chrono::milliseconds lockTimeout) noexcept
        : m_label{std::move(label)},
          m_lockTimeout{lockTimeout},
          m_mtx{std::make_unique<std::shared_mutex>()}
    {}

    void insert(Id id, T value)
    {
        std::unique_lock lock{*m_mtx};
        auto slot = std::make_unique<Slot>();
        slot->value = std::move(value);
        if (!m_slots.emplace(id, std::move(slot)).second) {
            throw std::invalid_argument{fmt::format(
                "{}: {} #{} already registered",
                std::source_location::current().function_name(), m_label, id)};
        }
    }

    [[nodiscard]] bool contains(Id id) const
    {
        std::shared_lock lock{*m_mtx};
        return m_slots.contains(id);
    }

    [[nodiscard]] size_t size() const
    {
        std::shared_lock lock{*m_mtx};
        return m_slots.size();
    }

    [[nodiscard]] std::vector<Id> ids() const
    {
        std::shared_lock lock{*m_mtx};
        return m_slots | views::keys | ranges::to<std::vector>;
    }

    [[nodiscard]] Expected<Handle> acquire(Id id) const
    {
        Slot* slot = find(id);
        if (slot == nullptr) {
            return std::unexpected{LedgerError::notFound(
                fmt::format("{} #{} does not exist", m_label, id))};
        }
        Lock lock{slot->mtx, std::defer_lock};
        if (!lock.try_lock_for(m_lockTimeout)) {
            return std::unexpected{LedgerError::conflict(fmt::format(
                "{} #{} is locked by a concurrent operation, retry", m_label, id))};
        }
        return Handle{id, std::move(lock), &slot->value};
    }

    // Locks are taken in ascending id order; duplicates are collapsed.
    [[nodiscard]] Expected<std::vector<Handle>> acquireAll(std::vector<Id> ids) const
    {
        ranges::sort(ids);
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        std::vector<Handle> handles;
        handles.reserve(ids.size());
        for (Id id : ids) {
            auto handle = acquire(id);
            if (!handle) {
                return std::unexpected{std::move(handle).error()};
            }
            handles.push_back(std::move(handle).value());
        }
        return handles;
    }

    [[nodiscard]] Expected<T> get(Id id) const
    {
        return acquire(id).transform([](const Handle& handle) { return *handle; });
    }

    [[nodiscard]] Expected<std::vector<T>> snapshot() const
    {
        std::vector<T> values;
        for (Id id : ids()) {
            auto value = get(id);
            if (!value) {
                return std::unexpected{std::move(value).error()};
            }
            values.push_back(std::move(value).value());
        }
        return values;
    }

private:
    struct Slot
    {
        T value;
        std::timed_mutex mtx;
    };

    [[nodiscard]] Slot* find(Id id) const
    {
        std::shared_lock lock{*m_mtx};
        auto it = m_slots.find(id);
        return it != m_slots.end() ? it->second.get() : nullptr;
    }

    std::string m_label;
    std::chrono::milliseconds m_lockTimeout;
    std::map<Id, std::unique_ptr<Slot>> m_slots;
    std::unique_ptr<std::shared_mutex> m_mtx;
};

//-------------------------------------------------------------------------

}  // namespace uniledger

//-------------------------------------------------------------------------
