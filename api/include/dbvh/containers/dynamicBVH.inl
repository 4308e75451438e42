#pragma once
#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>
#include <functional>
#include <fmt/core.h>

#include "dbvh/core/debug.hpp"
#include "dbvh/core/errors.hpp"

namespace dbvh {

template <typename KeyT, typename Hash, typename KeyEqual>
DynamicBVH<KeyT, Hash, KeyEqual>::DynamicBVH(size_t initialCapacity)
    : m_nodes(initialCapacity), m_keys(initialCapacity / 2 + 1)
{
    m_config.initialCapacity = static_cast<int>(m_nodes.Capacity());
}

template <typename KeyT, typename Hash, typename KeyEqual>
DynamicBVH<KeyT, Hash, KeyEqual>::DynamicBVH(const TreeConfig& config)
    : m_config((config.Validate(), config)),
      m_nodes(static_cast<size_t>(config.initialCapacity)),
      m_keys(static_cast<size_t>(config.initialCapacity) / 2 + 1)
{
}

// =============================
// Public API
// =============================
template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::Insert(const KeyT& key, const BoundingVolume& bounds)
{
    validateBounds(bounds, "Insert");

    WriteLock lock(m_mutex);
    reserveForInsert();
    insertLocked(key, bounds);
}

template <typename KeyT, typename Hash, typename KeyEqual>
bool DynamicBVH<KeyT, Hash, KeyEqual>::Remove(const KeyT& key)
{
    WriteLock lock(m_mutex);

    const std::optional<int> leaf = m_keys.TryGet(key);
    if (!leaf) {
        logUnknownKey(key, "Remove");
        return false;
    }

    removeLeaf(*leaf);
    return true;
}

template <typename KeyT, typename Hash, typename KeyEqual>
bool DynamicBVH<KeyT, Hash, KeyEqual>::UpdateEntryBounds(const KeyT& key, const BoundingVolume& bounds)
{
    validateBounds(bounds, "UpdateEntryBounds");

    WriteLock lock(m_mutex);

    const std::optional<int> leaf = m_keys.TryGet(key);
    if (!leaf) {
        logUnknownKey(key, "UpdateEntryBounds");
        return false;
    }

    // Mesmo volume: a posição atual continua válida
    if (m_nodes[*leaf].bounds == bounds)
        return true;

    reserveForInsert();
    removeLeaf(*leaf);
    insertLocked(key, bounds);
    return true;
}

template <typename KeyT, typename Hash, typename KeyEqual>
size_t DynamicBVH<KeyT, Hash, KeyEqual>::UpdateMany(const std::vector<std::pair<KeyT, BoundingVolume>>& updates)
{
    // Valida tudo antes de tocar na árvore
    for (const auto& [key, bounds] : updates)
        validateBounds(bounds, "UpdateMany");

    WriteLock lock(m_mutex);
    reserveForInsert();

    size_t updated = 0;
    for (const auto& [key, bounds] : updates) {
        const std::optional<int> leaf = m_keys.TryGet(key);
        if (!leaf)
            continue;

        if (!(m_nodes[*leaf].bounds == bounds)) {
            removeLeaf(*leaf);
            insertLocked(key, bounds);
        }
        ++updated;
    }

    if (updated != updates.size())
        DBVH_LOG_DEBUG("DynamicBVH::UpdateMany: {} de {} chaves encontradas.", updated, updates.size());

    return updated;
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::Clear()
{
    WriteLock lock(m_mutex);
    if (m_rootIndex == NullIndex)
        return;

    DBVH_LOG_DEBUG("DynamicBVH::Clear: removendo {} entradas.", m_count.load());
    clearLocked();
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::EnsureCapacity(size_t entryCount)
{
    if (entryCount == 0)
        return;

    WriteLock lock(m_mutex);
    // n folhas precisam de n - 1 nós internos
    m_nodes.Reserve(entryCount * 2 - 1);
    m_keys.Reserve(entryCount);
}

// =============================
// Queries
// =============================
template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::Query(const BoundingVolume& range, std::vector<KeyT>& outKeys) const
{
    QueryCallback(range, [&outKeys](const KeyT& key, const BoundingVolume&) {
        outKeys.push_back(key);
        return true;
    });
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::QueryPoint(const math::Vec3& point, std::vector<KeyT>& outKeys) const
{
    // Um ponto é um volume degenerado; intervalos fechados tornam os testes equivalentes
    QueryCallback(BoundingVolume(point, point), [&outKeys](const KeyT& key, const BoundingVolume&) {
        outKeys.push_back(key);
        return true;
    });
}

template <typename KeyT, typename Hash, typename KeyEqual>
size_t DynamicBVH<KeyT, Hash, KeyEqual>::QueryCallback(
    const BoundingVolume& range,
    const std::function<bool(const KeyT&, const BoundingVolume&)>& cb) const
{
    ReadLock lock(m_mutex);
    if (m_rootIndex == NullIndex)
        return 0;

    size_t visited = 0;
    std::vector<int> stack;
    stack.reserve(64);
    stack.push_back(m_rootIndex);

    while (!stack.empty()) {
        const int index = stack.back();
        stack.pop_back();

        const Node& node = m_nodes[index];
        if (!node.bounds.Intersects(range))
            continue;

        if (node.isLeaf) {
            ++visited;
            if (!cb(node.value, node.bounds))
                break;
            continue;
        }

        stack.push_back(node.leftChildIndex);
        stack.push_back(node.rightChildIndex);
    }
    return visited;
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::Raycast(const Ray& ray, std::vector<RayHit>& outHits, float tMax) const
{
    std::vector<RayHit> hits;
    {
        ReadLock lock(m_mutex);
        if (m_rootIndex == NullIndex)
            return;

        std::vector<int> stack;
        stack.reserve(64);
        stack.push_back(m_rootIndex);

        while (!stack.empty()) {
            const int index = stack.back();
            stack.pop_back();

            const Node& node = m_nodes[index];
            const std::optional<float> t = node.bounds.Intersects(ray, tMax);
            if (!t)
                continue;

            if (node.isLeaf) {
                hits.push_back(RayHit{ node.value, *t, ray.GetPoint(*t) });
                continue;
            }

            stack.push_back(node.leftChildIndex);
            stack.push_back(node.rightChildIndex);
        }
    }

    std::stable_sort(hits.begin(), hits.end(), [](const RayHit& a, const RayHit& b) { return a.distance < b.distance; });
    outHits.insert(outHits.end(), std::make_move_iterator(hits.begin()), std::make_move_iterator(hits.end()));
}

template <typename KeyT, typename Hash, typename KeyEqual>
auto DynamicBVH<KeyT, Hash, KeyEqual>::RaycastClosest(const Ray& ray, float tMax) const -> std::optional<RayHit>
{
    ReadLock lock(m_mutex);
    if (m_rootIndex == NullIndex)
        return std::nullopt;

    std::optional<RayHit> best;
    float bestT = tMax;

    std::vector<int> stack;
    stack.reserve(64);
    stack.push_back(m_rootIndex);

    while (!stack.empty()) {
        const int index = stack.back();
        stack.pop_back();

        const Node& node = m_nodes[index];
        // Subárvores que começam depois do melhor acerto são podadas
        const std::optional<float> t = node.bounds.Intersects(ray, bestT);
        if (!t)
            continue;

        if (node.isLeaf) {
            if (!best || *t < bestT) {
                bestT = *t;
                best = RayHit{ node.value, *t, ray.GetPoint(*t) };
            }
            continue;
        }

        stack.push_back(node.leftChildIndex);
        stack.push_back(node.rightChildIndex);
    }
    return best;
}

// =============================
// Lookups
// =============================
template <typename KeyT, typename Hash, typename KeyEqual>
bool DynamicBVH<KeyT, Hash, KeyEqual>::Contains(const KeyT& key) const
{
    ReadLock lock(m_mutex);
    return m_keys.Contains(key);
}

template <typename KeyT, typename Hash, typename KeyEqual>
auto DynamicBVH<KeyT, Hash, KeyEqual>::TryGetBounds(const KeyT& key) const -> std::optional<BoundingVolume>
{
    ReadLock lock(m_mutex);
    const std::optional<int> leaf = m_keys.TryGet(key);
    if (!leaf)
        return std::nullopt;
    return m_nodes[*leaf].bounds;
}

template <typename KeyT, typename Hash, typename KeyEqual>
auto DynamicBVH<KeyT, Hash, KeyEqual>::GetRootBounds() const -> std::optional<BoundingVolume>
{
    ReadLock lock(m_mutex);
    if (m_rootIndex == NullIndex)
        return std::nullopt;
    return m_nodes[m_rootIndex].bounds;
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::GetAllItems(std::vector<KeyT>& out) const
{
    ReadLock lock(m_mutex);
    out.reserve(out.size() + m_count.load());
    forEachNode([&out](int, const Node& node, int) {
        if (node.isLeaf)
            out.push_back(node.value);
    });
}

template <typename KeyT, typename Hash, typename KeyEqual>
size_t DynamicBVH<KeyT, Hash, KeyEqual>::Capacity() const
{
    ReadLock lock(m_mutex);
    return m_nodes.Capacity();
}

// =============================
// Inspection
// =============================
template <typename KeyT, typename Hash, typename KeyEqual>
int DynamicBVH<KeyT, Hash, KeyEqual>::GetRootIndex() const
{
    ReadLock lock(m_mutex);
    return m_rootIndex;
}

template <typename KeyT, typename Hash, typename KeyEqual>
auto DynamicBVH<KeyT, Hash, KeyEqual>::GetNode(int index) const -> Node
{
    ReadLock lock(m_mutex);
    return m_nodes[index];
}

template <typename KeyT, typename Hash, typename KeyEqual>
size_t DynamicBVH<KeyT, Hash, KeyEqual>::GetNodeCount() const
{
    ReadLock lock(m_mutex);
    return m_nodes.LiveCount();
}

template <typename KeyT, typename Hash, typename KeyEqual>
int DynamicBVH<KeyT, Hash, KeyEqual>::GetHeight() const
{
    ReadLock lock(m_mutex);
    int height = 0;
    forEachNode([&height](int, const Node&, int depth) {
        height = std::max(height, depth);
    });
    return height;
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::Traverse(const std::function<void(int, const Node&, int)>& fn) const
{
    ReadLock lock(m_mutex);
    forEachNode(fn);
}

template <typename KeyT, typename Hash, typename KeyEqual>
bool DynamicBVH<KeyT, Hash, KeyEqual>::ValidateStructure() const
{
    ReadLock lock(m_mutex);

    auto fail = [](const std::string& message) {
        DBVH_LOG_ERROR("DynamicBVH::ValidateStructure: {}", message);
        return false;
    };

    if (m_rootIndex == NullIndex) {
        if (m_count.load() != 0 || m_keys.Size() != 0 || m_nodes.LiveCount() != 0)
            return fail("árvore vazia com entradas ou nós alocados");
        return true;
    }

    if (!m_nodes.IsAllocated(m_rootIndex))
        return fail(fmt::format("raiz {} não está alocada", m_rootIndex));
    if (m_nodes[m_rootIndex].HasParent())
        return fail(fmt::format("raiz {} tem pai {}", m_rootIndex, m_nodes[m_rootIndex].parentIndex));

    size_t leaves = 0;
    size_t reached = 0;
    std::vector<int> stack{ m_rootIndex };

    while (!stack.empty()) {
        const int index = stack.back();
        stack.pop_back();
        ++reached;

        if (reached > m_nodes.LiveCount())
            return fail("ciclo detectado: mais nós alcançados do que alocados");

        const Node& node = m_nodes[index];

        if (node.isLeaf) {
            if (node.HasChildren())
                return fail(fmt::format("folha {} tem filhos", index));
            if (node.subtreeSize != 0)
                return fail(fmt::format("folha {} com subtreeSize {}", index, node.subtreeSize));

            const std::optional<int> mapped = m_keys.TryGet(node.value);
            if (!mapped || *mapped != index)
                return fail(fmt::format("folha {} não corresponde ao índice de chaves", index));

            ++leaves;
            continue;
        }

        const int left = node.leftChildIndex;
        const int right = node.rightChildIndex;
        if (!m_nodes.IsAllocated(left) || !m_nodes.IsAllocated(right) || left == right)
            return fail(fmt::format("nó interno {} com filhos inválidos ({}, {})", index, left, right));

        const Node& l = m_nodes[left];
        const Node& r = m_nodes[right];
        if (l.parentIndex != index || r.parentIndex != index)
            return fail(fmt::format("filhos de {} apontam para pais ({}, {})", index, l.parentIndex, r.parentIndex));
        if (node.bounds != l.bounds.Union(r.bounds))
            return fail(fmt::format("bounds de {} ({}) diferente da união dos filhos", index, node.bounds.ToString()));
        if (node.subtreeSize != 1 + l.subtreeSize + r.subtreeSize)
            return fail(fmt::format("subtreeSize de {} = {}, esperado {}", index, node.subtreeSize,
                                    1 + l.subtreeSize + r.subtreeSize));

        stack.push_back(left);
        stack.push_back(right);
    }

    if (leaves != m_count.load())
        return fail(fmt::format("{} folhas alcançáveis, Count = {}", leaves, m_count.load()));
    if (leaves != m_keys.Size())
        return fail(fmt::format("{} folhas alcançáveis, {} chaves indexadas", leaves, m_keys.Size()));
    if (reached != m_nodes.LiveCount())
        return fail(fmt::format("{} nós alcançáveis, {} alocados", reached, m_nodes.LiveCount()));

    return true;
}

// =============================
// Serialization
// =============================
template <typename KeyT, typename Hash, typename KeyEqual>
nlohmann::json DynamicBVH<KeyT, Hash, KeyEqual>::ToJson() const
{
    ReadLock lock(m_mutex);

    nlohmann::json entries = nlohmann::json::array();
    forEachNode([&entries](int, const Node& node, int) {
        if (!node.isLeaf)
            return;
        nlohmann::json entry = node.bounds;
        entry["key"] = node.value;
        entries.push_back(std::move(entry));
    });

    return nlohmann::json{
        { "version", JsonFormatVersion },
        { "count", m_count.load() },
        { "entries", std::move(entries) }
    };
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::FromJson(const nlohmann::json& j)
{
    // Parse completo antes de qualquer mutação
    std::vector<std::pair<KeyT, BoundingVolume>> entries;
    try {
        if (!j.is_object())
            throw SnapshotError("snapshot root must be a JSON object");

        const int version = j.at("version").get<int>();
        if (version != JsonFormatVersion)
            throw SnapshotError(fmt::format("unsupported snapshot version {}", version));

        const nlohmann::json& list = j.at("entries");
        if (!list.is_array())
            throw SnapshotError("'entries' must be an array");

        entries.reserve(list.size());
        for (const auto& entry : list) {
            BoundingVolume bounds = entry.get<BoundingVolume>();
            if (!bounds.IsValid())
                throw SnapshotError(fmt::format("entry with invalid bounds {}", bounds.ToString()));
            entries.emplace_back(entry.at("key").get<KeyT>(), bounds);
        }

        if (j.contains("count") && j.at("count").get<size_t>() != entries.size())
            throw SnapshotError("'count' does not match the number of entries");
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError(fmt::format("malformed snapshot: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        throw SnapshotError(fmt::format("malformed snapshot: {}", e.what()));
    }

    WriteLock lock(m_mutex);
    clearLocked();
    m_nodes.Reserve(entries.size() * 2);
    m_keys.Reserve(entries.size());
    for (const auto& [key, bounds] : entries)
        insertLocked(key, bounds);

    DBVH_LOG_DEBUG("DynamicBVH::FromJson: {} entradas carregadas.", entries.size());
}

// =============================
// Internal Helpers
// =============================
template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::insertLocked(const KeyT& key, const BoundingVolume& bounds)
{
    // Reinserir uma chave substitui a entrada anterior
    if (const std::optional<int> existing = m_keys.TryGet(key))
        removeLeaf(*existing);

    Node leaf;
    leaf.value = key;
    leaf.bounds = bounds;
    leaf.isLeaf = true;

    const int leafIndex = m_nodes.Allocate(std::move(leaf));
    m_keys.Set(key, leafIndex);
    insertLeaf(leafIndex);
    m_count.fetch_add(1, std::memory_order_release);
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::insertLeaf(int leafIndex)
{
    if (m_rootIndex == NullIndex) {
        m_rootIndex = leafIndex;
        m_nodes[leafIndex].parentIndex = NullIndex;
        return;
    }

    const BoundingVolume leafBounds = m_nodes[leafIndex].bounds;

    // Desce até a folha que será irmã da nova
    int sibling = m_rootIndex;
    while (!m_nodes[sibling].isLeaf)
        sibling = chooseChild(sibling, leafBounds);

    const int oldParent = m_nodes[sibling].parentIndex;

    Node parent;
    parent.bounds = m_nodes[sibling].bounds.Union(leafBounds);
    parent.parentIndex = oldParent;
    parent.leftChildIndex = sibling;
    parent.rightChildIndex = leafIndex;
    parent.isLeaf = false;
    parent.subtreeSize = 1;

    const int parentIndex = m_nodes.Allocate(std::move(parent));
    m_nodes[sibling].parentIndex = parentIndex;
    m_nodes[leafIndex].parentIndex = parentIndex;

    if (oldParent == NullIndex)
        m_rootIndex = parentIndex;
    else
        replaceChild(oldParent, sibling, parentIndex);

    // subtreeSize mudou em todos os ancestrais: sem parada antecipada
    refitUpwards(oldParent);
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::removeLeaf(int leafIndex)
{
    const KeyT key = m_nodes[leafIndex].value;

    if (leafIndex == m_rootIndex) {
        clearLocked();
        return;
    }

    const int parentIndex = m_nodes[leafIndex].parentIndex;
    const Node& parent = m_nodes[parentIndex];
    const int grandParent = parent.parentIndex;
    const int sibling = parent.leftChildIndex == leafIndex ? parent.rightChildIndex : parent.leftChildIndex;

    // O irmão ocupa o lugar do pai
    if (grandParent == NullIndex) {
        m_rootIndex = sibling;
        m_nodes[sibling].parentIndex = NullIndex;
    } else {
        replaceChild(grandParent, parentIndex, sibling);
        m_nodes[sibling].parentIndex = grandParent;
    }

    m_nodes.Free(parentIndex);
    m_nodes.Free(leafIndex);
    m_keys.Remove(key);
    m_count.fetch_sub(1, std::memory_order_release);

    refitUpwards(grandParent);
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::clearLocked() noexcept
{
    m_nodes.Reset();
    m_keys.Clear();
    m_rootIndex = NullIndex;
    m_count.store(0, std::memory_order_release);
}

template <typename KeyT, typename Hash, typename KeyEqual>
int DynamicBVH<KeyT, Hash, KeyEqual>::chooseChild(int nodeIndex, const BoundingVolume& bounds) const
{
    const Node& node = m_nodes[nodeIndex];
    const Node& left = m_nodes[node.leftChildIndex];
    const Node& right = m_nodes[node.rightChildIndex];

    const int leftSize = left.subtreeSize;
    const int rightSize = right.subtreeSize;

    // Desequilíbrio acima do limite: força a descida no lado menor
    if (std::abs(leftSize - rightSize) > m_config.balanceThreshold)
        return leftSize < rightSize ? node.leftChildIndex : node.rightChildIndex;

    const double leftCost = left.bounds.GetCost(bounds);
    const double rightCost = right.bounds.GetCost(bounds);

    if (costsTie(leftCost, rightCost))
        return rightSize < leftSize ? node.rightChildIndex : node.leftChildIndex;

    return leftCost < rightCost ? node.leftChildIndex : node.rightChildIndex;
}

template <typename KeyT, typename Hash, typename KeyEqual>
bool DynamicBVH<KeyT, Hash, KeyEqual>::costsTie(double a, double b) const
{
    const double scale = std::max(std::abs(a), std::abs(b));
    return std::abs(a - b) <= m_config.costTolerance * scale;
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::replaceChild(int parentIndex, int oldChild, int newChild)
{
    Node& parent = m_nodes[parentIndex];
    if (parent.leftChildIndex == oldChild) {
        parent.leftChildIndex = newChild;
    } else if (parent.rightChildIndex == oldChild) {
        parent.rightChildIndex = newChild;
    } else {
        DBVH_LOG_ERROR("DynamicBVH: nó {} não é filho de {}.", oldChild, parentIndex);
        throw InvariantViolation(fmt::format("node {} is not a child of {}", oldChild, parentIndex));
    }
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::refitUpwards(int nodeIndex)
{
    while (nodeIndex != NullIndex) {
        Node& node = m_nodes[nodeIndex];
        const Node& left = m_nodes[node.leftChildIndex];
        const Node& right = m_nodes[node.rightChildIndex];

        node.bounds = left.bounds.Union(right.bounds);
        node.subtreeSize = 1 + left.subtreeSize + right.subtreeSize;

        nodeIndex = node.parentIndex;
    }
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::reserveForInsert()
{
    // Uma inserção aloca no máximo uma folha e um nó interno.
    // Crescer aqui, antes de mexer na árvore, mantém a operação tudo-ou-nada.
    m_nodes.EnsureFree(2);
    m_keys.Reserve(m_count.load() + 1);
}

template <typename KeyT, typename Hash, typename KeyEqual>
template <typename Fn>
void DynamicBVH<KeyT, Hash, KeyEqual>::forEachNode(Fn&& fn) const
{
    if (m_rootIndex == NullIndex)
        return;

    std::vector<std::pair<int, int>> stack;
    stack.reserve(64);
    stack.emplace_back(m_rootIndex, 1);

    while (!stack.empty()) {
        const auto [index, depth] = stack.back();
        stack.pop_back();

        const Node& node = m_nodes[index];
        fn(index, node, depth);

        if (!node.isLeaf) {
            stack.emplace_back(node.rightChildIndex, depth + 1);
            stack.emplace_back(node.leftChildIndex, depth + 1);
        }
    }
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::validateBounds(const BoundingVolume& bounds, const char* operation)
{
    if (!bounds.IsValid())
        throw InvalidBounds(fmt::format("DynamicBVH::{}: invalid bounds ({})", operation, bounds.ToString()));
}

template <typename KeyT, typename Hash, typename KeyEqual>
void DynamicBVH<KeyT, Hash, KeyEqual>::logUnknownKey(const KeyT& key, const char* operation)
{
    if constexpr (fmt::is_formattable<KeyT>::value)
        DBVH_LOG_WARN("DynamicBVH::{}: chave '{}' não encontrada.", operation, key);
    else
        DBVH_LOG_WARN("DynamicBVH::{}: chave não encontrada.", operation);
}

} // namespace dbvh
