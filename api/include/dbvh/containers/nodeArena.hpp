#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

namespace dbvh {

    /**
     * @brief Index-addressed pool of fixed-size slots.
     *
     * Slots are handed out as integer indices that stay valid until freed: the
     * pool never compacts, and growth keeps every live index where it is.
     * Freed slots go on a LIFO free list and are reused before the pool grows.
     *
     * Misuse (double free, out-of-range or free-slot access) throws
     * dbvh::InvariantViolation.
     *
     * @tparam T Slot type. Must be default-constructible; a freed slot is reset to T{}.
     */
    template <typename T>
    class NodeArena
    {
    public:
        static constexpr int NullIndex = -1;

        /**
         * @param capacity Initial number of slots (rounded up to a power of two).
         */
        explicit NodeArena(size_t capacity = 16);

        NodeArena(const NodeArena&) = default;
        NodeArena& operator=(const NodeArena&) = default;
        NodeArena(NodeArena&&) noexcept = default;
        NodeArena& operator=(NodeArena&&) noexcept = default;

        /**
         * @brief Store @p value in a free slot, growing the pool if none is left.
         * @return Index of the slot.
         */
        int Allocate(const T& value);
        int Allocate(T&& value);

        /**
         * @brief Reset the slot to T{} and make its index reusable.
         */
        void Free(int index);

        /**
         * @brief Logically free every slot. Capacity is kept.
         */
        void Reset() noexcept;

        /**
         * @brief Grow so that at least @p capacity slots exist.
         */
        void Reserve(size_t capacity);

        /**
         * @brief Guarantee that the next @p count allocations will not grow the pool.
         */
        void EnsureFree(size_t count);

        T& operator[](int index);
        const T& operator[](int index) const;

        bool IsAllocated(int index) const noexcept;

        size_t Capacity() const noexcept { return m_slots.size(); }
        size_t LiveCount() const noexcept { return m_liveCount; }

        /// Um além do maior índice já entregue desde o último Reset().
        int PeakIndex() const noexcept { return m_peakIndex; }

        /// Slots available without growing.
        size_t FreeCount() const noexcept;

    private:
        int allocateSlot();
        void grow(size_t newCapacity);
        void checkLive(int index, const char* operation) const;

    private:
        std::vector<T> m_slots;
        std::vector<uint8_t> m_live;
        std::vector<int> m_freeList;
        int m_peakIndex{0};
        size_t m_liveCount{0};
    };

} // namespace dbvh

#include "nodeArena.inl"
