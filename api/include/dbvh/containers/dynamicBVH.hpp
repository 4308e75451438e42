#pragma once

#include <vector>
#include <functional>
#include <limits>
#include <optional>
#include <shared_mutex>
#include <atomic>
#include <utility>
#include <nlohmann/json.hpp>

#include "dbvh/core/config.hpp"
#include "dbvh/physics/boundingVolume.hpp"
#include "dbvh/physics/ray.hpp"
#include "dbvh/containers/nodeArena.hpp"
#include "dbvh/containers/keyIndex.hpp"

namespace dbvh {
    /**
     * @brief Dynamic bounding volume hierarchy keyed by an opaque key.
     *
     * Binary tree stored in a NodeArena and addressed by integer index. Leaves
     * hold one key and its volume; internal nodes hold the union of their two
     * children. Insertion walks down choosing the child whose bounds grow the
     * least, with SubtreeSize as a balance signal, so the depth stays close to
     * log2(n) under streaming inserts.
     *
     * Every public member is thread-safe: mutations take an exclusive lock,
     * queries a shared one.
     *
     * @tparam KeyT Key type. Must be copyable, hashable with Hash and comparable with KeyEqual.
     */
    template <typename KeyT, typename Hash = std::hash<KeyT>, typename KeyEqual = std::equal_to<KeyT>>
    class DynamicBVH
    {
    public:
        using BoundingVolume = physics3D::BoundingVolume;
        using Ray = physics3D::Ray;
        using RayHit = physics3D::RayHit<KeyT>;

        static constexpr int NullIndex = -1;

        struct Node
        {
            KeyT value{};
            BoundingVolume bounds;
            int parentIndex{NullIndex};
            int leftChildIndex{NullIndex};
            int rightChildIndex{NullIndex};
            bool isLeaf{false};
            int subtreeSize{0};     // nós internos nesta subárvore (folha = 0)

            bool HasParent() const { return parentIndex != NullIndex; }
            bool HasChildren() const { return leftChildIndex != NullIndex || rightChildIndex != NullIndex; }
        };

    public:
        /**
         * @brief Construct an empty tree.
         * @param initialCapacity Node slots reserved up front.
         */
        explicit DynamicBVH(size_t initialCapacity = 64);

        /**
         * @brief Construct an empty tree with explicit tuning.
         * @throws ConfigError if @p config is invalid.
         */
        explicit DynamicBVH(const TreeConfig& config);

        ~DynamicBVH() noexcept = default;

        DynamicBVH(const DynamicBVH&) = delete;
        DynamicBVH& operator=(const DynamicBVH&) = delete;
        DynamicBVH(DynamicBVH&&) = delete;
        DynamicBVH& operator=(DynamicBVH&&) = delete;

        /**
         * @brief Insert a key with its bounds. An existing entry with the same key is replaced.
         * @throws InvalidBounds if @p bounds has Min > Max on some axis. The tree is left untouched.
         */
        void Insert(const KeyT& key, const BoundingVolume& bounds);

        /**
         * @brief Remove the entry of @p key.
         * @return false if the key is not in the tree.
         */
        bool Remove(const KeyT& key);

        /**
         * @brief Move an existing entry to new bounds (full relocation).
         * @return false if the key is not in the tree.
         * @throws InvalidBounds if @p bounds is invalid. The tree is left untouched.
         */
        bool UpdateEntryBounds(const KeyT& key, const BoundingVolume& bounds);

        /**
         * @brief Batch update under a single exclusive section.
         * @return Number of keys that were present and relocated.
         * @throws InvalidBounds if any bounds is invalid; nothing is applied in that case.
         */
        size_t UpdateMany(const std::vector<std::pair<KeyT, BoundingVolume>>& updates);

        /**
         * @brief Remove every entry. Arena capacity is kept.
         */
        void Clear();

        /**
         * @brief Reserve node slots for @p entryCount entries.
         */
        void EnsureCapacity(size_t entryCount);

        /**
         * @brief Append to @p outKeys every key whose bounds intersect @p range.
         */
        void Query(const BoundingVolume& range, std::vector<KeyT>& outKeys) const;

        /**
         * @brief Append to @p outKeys every key whose bounds contain @p point.
         */
        void QueryPoint(const math::Vec3& point, std::vector<KeyT>& outKeys) const;

        /**
         * @brief Query with callback for each intersecting entry.
         * @param cb Callback (key, bounds) -> bool. Return false to stop.
         * @return Number of entries passed to @p cb.
         *
         * The tree stays read-locked while @p cb runs; calling a mutating member from it deadlocks.
         */
        size_t QueryCallback(const BoundingVolume& range,
                             const std::function<bool(const KeyT&, const BoundingVolume&)>& cb) const;

        /**
         * @brief Append every entry hit by @p ray within @p tMax, sorted by distance.
         */
        void Raycast(const Ray& ray, std::vector<RayHit>& outHits,
                     float tMax = std::numeric_limits<float>::max()) const;

        /**
         * @brief Nearest entry hit by @p ray within @p tMax.
         */
        std::optional<RayHit> RaycastClosest(const Ray& ray,
                                             float tMax = std::numeric_limits<float>::max()) const;

        bool Contains(const KeyT& key) const;
        std::optional<BoundingVolume> TryGetBounds(const KeyT& key) const;
        std::optional<BoundingVolume> GetRootBounds() const;

        /**
         * @brief Collect all keys in the tree.
         */
        void GetAllItems(std::vector<KeyT>& out) const;

        size_t Count() const noexcept { return m_count.load(std::memory_order_acquire); }
        bool Empty() const noexcept { return Count() == 0; }
        size_t Capacity() const;

        // =============================
        // Inspection
        // =============================
        int GetRootIndex() const;

        /**
         * @brief Copy of the node stored at @p index.
         * @throws InvariantViolation if the slot is free or out of range.
         */
        Node GetNode(int index) const;

        /// Number of allocated node slots (leaves + internal nodes).
        size_t GetNodeCount() const;

        /// Levels from the root down to the deepest leaf; root alone = 1, empty = 0.
        int GetHeight() const;

        /**
         * @brief Visit every reachable node depth-first.
         * @param fn Callback (index, node, depth) with the root at depth 1.
         */
        void Traverse(const std::function<void(int, const Node&, int)>& fn) const;

        /**
         * @brief Full scan of the structural invariants.
         * @return false on the first violation found (also logged as an error).
         */
        bool ValidateStructure() const;

        // =============================
        // Serialization
        // =============================
        /**
         * @brief Entries as { "version", "count", "entries": [{ "key", "min", "max" }] }.
         */
        nlohmann::json ToJson() const;

        /**
         * @brief Replace the contents with the entries of @p j.
         * @throws SnapshotError if the document is malformed; the tree is left untouched.
         */
        void FromJson(const nlohmann::json& j);

        static constexpr int JsonFormatVersion = 1;

    private:
        using ReadLock = std::shared_lock<std::shared_mutex>;
        using WriteLock = std::unique_lock<std::shared_mutex>;

        // Helpers internos (chamados com o lock já adquirido)
        void insertLocked(const KeyT& key, const BoundingVolume& bounds);
        void insertLeaf(int leafIndex);
        void removeLeaf(int leafIndex);
        void clearLocked() noexcept;
        int chooseChild(int nodeIndex, const BoundingVolume& bounds) const;
        bool costsTie(double a, double b) const;
        void replaceChild(int parentIndex, int oldChild, int newChild);
        void refitUpwards(int nodeIndex);
        void reserveForInsert();

        // DFS pré-ordem; fn(index, node, depth) com a raiz em depth 1
        template <typename Fn>
        void forEachNode(Fn&& fn) const;

        static void validateBounds(const BoundingVolume& bounds, const char* operation);
        static void logUnknownKey(const KeyT& key, const char* operation);

    private:
        TreeConfig m_config;
        NodeArena<Node> m_nodes;
        KeyIndex<KeyT, Hash, KeyEqual> m_keys;
        int m_rootIndex{NullIndex};
        std::atomic<size_t> m_count{0};

        mutable std::shared_mutex m_mutex;
    };

} // namespace dbvh

#include "dynamicBVH.inl"
