#pragma once
#include <utility>
#include <bit>
#include <limits>
#include <fmt/core.h>

#include "dbvh/core/debug.hpp"
#include "dbvh/core/errors.hpp"

namespace dbvh {

    namespace detail {
        inline size_t NextPowerOfTwo(size_t value) {
            if (value <= 1) return 1;
            return std::bit_ceil(value);
        }
    }

    template <typename T>
    NodeArena<T>::NodeArena(size_t capacity)
    {
        grow(detail::NextPowerOfTwo(capacity));
    }

    // =============================
    // Allocation
    // =============================
    template <typename T>
    int NodeArena<T>::Allocate(const T& value)
    {
        const int index = allocateSlot();
        m_slots[index] = value;
        return index;
    }

    template <typename T>
    int NodeArena<T>::Allocate(T&& value)
    {
        const int index = allocateSlot();
        m_slots[index] = std::move(value);
        return index;
    }

    template <typename T>
    int NodeArena<T>::allocateSlot()
    {
        int index;
        if (!m_freeList.empty()) {
            // Reutiliza o último índice liberado
            index = m_freeList.back();
            m_freeList.pop_back();
        } else {
            if (static_cast<size_t>(m_peakIndex) >= m_slots.size())
                grow(m_slots.size() * 2);
            index = m_peakIndex++;
        }

        m_live[index] = 1;
        ++m_liveCount;
        return index;
    }

    template <typename T>
    void NodeArena<T>::Free(int index)
    {
        checkLive(index, "Free");

        m_slots[index] = T{};
        m_live[index] = 0;
        --m_liveCount;
        m_freeList.push_back(index);
    }

    template <typename T>
    void NodeArena<T>::Reset() noexcept
    {
        for (int i = 0; i < m_peakIndex; ++i) {
            m_slots[i] = T{};
            m_live[i] = 0;
        }
        m_freeList.clear();
        m_peakIndex = 0;
        m_liveCount = 0;
    }

    // =============================
    // Capacity
    // =============================
    template <typename T>
    void NodeArena<T>::Reserve(size_t capacity)
    {
        if (capacity > m_slots.size())
            grow(detail::NextPowerOfTwo(capacity));
    }

    template <typename T>
    size_t NodeArena<T>::FreeCount() const noexcept
    {
        return m_freeList.size() + (m_slots.size() - static_cast<size_t>(m_peakIndex));
    }

    template <typename T>
    void NodeArena<T>::EnsureFree(size_t count)
    {
        const size_t available = FreeCount();
        if (available < count)
            Reserve(m_slots.size() + (count - available));
    }

    template <typename T>
    void NodeArena<T>::grow(size_t newCapacity)
    {
        if (newCapacity > static_cast<size_t>(std::numeric_limits<int>::max())) {
            DBVH_LOG_ERROR("NodeArena: capacidade {} excede o limite de índices.", newCapacity);
            throw InvariantViolation(fmt::format("NodeArena capacity {} exceeds the index range", newCapacity));
        }

        if (!m_slots.empty())
            DBVH_LOG_DEBUG("NodeArena: crescendo de {} para {} slots.", m_slots.size(), newCapacity);

        // resize preserva os índices existentes
        m_slots.resize(newCapacity);
        m_live.resize(newCapacity, 0);
    }

    // =============================
    // Access
    // =============================
    template <typename T>
    T& NodeArena<T>::operator[](int index)
    {
        checkLive(index, "access");
        return m_slots[index];
    }

    template <typename T>
    const T& NodeArena<T>::operator[](int index) const
    {
        checkLive(index, "access");
        return m_slots[index];
    }

    template <typename T>
    bool NodeArena<T>::IsAllocated(int index) const noexcept
    {
        return index >= 0 && index < m_peakIndex && m_live[index] != 0;
    }

    template <typename T>
    void NodeArena<T>::checkLive(int index, const char* operation) const
    {
        if (IsAllocated(index))
            return;

        const bool inRange = index >= 0 && index < m_peakIndex;
        DBVH_LOG_ERROR("NodeArena: {} no índice {} ({}).", operation, index,
                       inRange ? "slot livre" : "fora do intervalo");
        throw InvariantViolation(fmt::format("NodeArena {} on {} index {}",
                                             operation, inRange ? "free" : "out-of-range", index));
    }

} // namespace dbvh
