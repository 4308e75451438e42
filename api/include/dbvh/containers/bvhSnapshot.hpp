#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>
#include <nlohmann/json.hpp>

#include "dbvh/containers/dynamicBVH.hpp"
#include "dbvh/core/compression.hpp"

namespace dbvh::snapshot {

    /**
     * Formato binário:
     * [4 bytes: "DBVH"] [u32 versão LE] [u64 tamanho BSON LE] [payload zlib]
     */
    inline constexpr std::array<uint8_t, 4> Magic{ 'D', 'B', 'V', 'H' };
    inline constexpr uint32_t FormatVersion = 1;
    inline constexpr size_t HeaderSize = 16;

    /**
     * @brief Encode a JSON document as a compressed snapshot.
     * @throws SnapshotError if the document cannot be encoded or compressed.
     */
    [[nodiscard]] std::vector<uint8_t> EncodeDocument(const nlohmann::json& document, int level = 6);

    /**
     * @brief Decode a compressed snapshot back into its JSON document.
     * @throws SnapshotError on bad magic, unknown version, size above @p maxUncompressedSize,
     *         zlib errors or invalid BSON.
     */
    [[nodiscard]] nlohmann::json DecodeDocument(std::span<const uint8_t> bytes,
                                                uint64_t maxUncompressedSize = compression::DefaultMaxUncompressedSize);

    /// @throws SnapshotError if the file cannot be written.
    void WriteSnapshotFile(const std::filesystem::path& path, std::span<const uint8_t> bytes);

    /// @throws SnapshotError if the file cannot be read.
    [[nodiscard]] std::vector<uint8_t> ReadSnapshotFile(const std::filesystem::path& path);

    /**
     * @brief Serialize every entry of @p tree into a compressed snapshot.
     */
    template <typename KeyT, typename Hash, typename KeyEqual>
    [[nodiscard]] std::vector<uint8_t> SaveSnapshot(const DynamicBVH<KeyT, Hash, KeyEqual>& tree, int level = 6)
    {
        return EncodeDocument(tree.ToJson(), level);
    }

    /**
     * @brief Replace the contents of @p tree with a snapshot.
     * @throws SnapshotError if @p bytes is not a valid snapshot; @p tree is left unchanged.
     */
    template <typename KeyT, typename Hash, typename KeyEqual>
    void LoadSnapshot(DynamicBVH<KeyT, Hash, KeyEqual>& tree, std::span<const uint8_t> bytes,
                      uint64_t maxUncompressedSize = compression::DefaultMaxUncompressedSize)
    {
        tree.FromJson(DecodeDocument(bytes, maxUncompressedSize));
    }

} // namespace dbvh::snapshot
