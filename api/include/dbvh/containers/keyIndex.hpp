#pragma once

#include <unordered_map>
#include <optional>
#include <functional>

namespace dbvh {

    /**
     * @brief Maps an external key to the arena index of its current leaf.
     *
     * Keys are only hashed and compared for equality, never ordered.
     */
    template <typename KeyT, typename Hash = std::hash<KeyT>, typename KeyEqual = std::equal_to<KeyT>>
    class KeyIndex
    {
    public:
        KeyIndex() = default;
        explicit KeyIndex(size_t capacity) { m_map.reserve(capacity); }

        /// Insere ou sobrescreve.
        void Set(const KeyT& key, int nodeIndex) { m_map.insert_or_assign(key, nodeIndex); }

        std::optional<int> TryGet(const KeyT& key) const
        {
            auto it = m_map.find(key);
            if (it == m_map.end())
                return std::nullopt;
            return it->second;
        }

        /// @return false se a chave não existia.
        bool Remove(const KeyT& key) { return m_map.erase(key) > 0; }

        bool Contains(const KeyT& key) const { return m_map.find(key) != m_map.end(); }

        void Clear() noexcept { m_map.clear(); }
        void Reserve(size_t count) { m_map.reserve(count); }

        size_t Size() const noexcept { return m_map.size(); }

        template <typename Fn>
        void ForEach(Fn&& fn) const
        {
            for (const auto& [key, index] : m_map)
                fn(key, index);
        }

    private:
        std::unordered_map<KeyT, int, Hash, KeyEqual> m_map;
    };

} // namespace dbvh
