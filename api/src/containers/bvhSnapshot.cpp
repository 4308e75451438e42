#include "dbvh/containers/bvhSnapshot.hpp"
#include "dbvh/core/debug.hpp"
#include "dbvh/core/errors.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <fmt/core.h>

namespace dbvh::snapshot {
    namespace {
        // Escrita/leitura little-endian byte a byte, independente da plataforma
        template <typename T>
        void writeLE(std::vector<uint8_t>& out, T value)
        {
            for (size_t i = 0; i < sizeof(T); ++i)
                out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
        }

        template <typename T>
        T readLE(std::span<const uint8_t> bytes, size_t offset)
        {
            T value = 0;
            for (size_t i = 0; i < sizeof(T); ++i)
                value |= static_cast<T>(bytes[offset + i]) << (8 * i);
            return value;
        }
    }

    std::vector<uint8_t> EncodeDocument(const nlohmann::json& document, int level)
    {
        std::vector<uint8_t> bson;
        try {
            bson = nlohmann::json::to_bson(document);
        } catch (const nlohmann::json::exception& e) {
            throw SnapshotError(fmt::format("cannot encode snapshot as BSON: {}", e.what()));
        }

        const std::vector<uint8_t> payload = compression::CompressData(bson, level);
        if (payload.empty())
            throw SnapshotError("snapshot compression failed");

        std::vector<uint8_t> out;
        out.reserve(HeaderSize + payload.size());
        out.insert(out.end(), Magic.begin(), Magic.end());
        writeLE<uint32_t>(out, FormatVersion);
        writeLE<uint64_t>(out, static_cast<uint64_t>(bson.size()));
        out.insert(out.end(), payload.begin(), payload.end());

        DBVH_LOG_DEBUG("Snapshot codificado: {} bytes BSON -> {} bytes.", bson.size(), out.size());
        return out;
    }

    nlohmann::json DecodeDocument(std::span<const uint8_t> bytes, uint64_t maxUncompressedSize)
    {
        if (bytes.size() <= HeaderSize)
            throw SnapshotError(fmt::format("snapshot too short ({} bytes)", bytes.size()));

        if (!std::equal(Magic.begin(), Magic.end(), bytes.begin()))
            throw SnapshotError("bad snapshot magic");

        const uint32_t version = readLE<uint32_t>(bytes, 4);
        if (version != FormatVersion)
            throw SnapshotError(fmt::format("unsupported snapshot format version {}", version));

        const uint64_t rawSize = readLE<uint64_t>(bytes, 8);
        if (rawSize == 0 || rawSize > maxUncompressedSize)
            throw SnapshotError(fmt::format("snapshot payload size {} outside (0, {}]", rawSize, maxUncompressedSize));

        const std::vector<uint8_t> bson = compression::UncompressData(bytes.subspan(HeaderSize), rawSize, maxUncompressedSize);
        if (bson.empty())
            throw SnapshotError("snapshot payload could not be decompressed");

        try {
            return nlohmann::json::from_bson(bson);
        } catch (const nlohmann::json::exception& e) {
            throw SnapshotError(fmt::format("invalid snapshot BSON: {}", e.what()));
        }
    }

    void WriteSnapshotFile(const std::filesystem::path& path, std::span<const uint8_t> bytes)
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            throw SnapshotError(fmt::format("cannot open '{}' for writing", path.string()));

        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file)
            throw SnapshotError(fmt::format("failed writing snapshot to '{}'", path.string()));
    }

    std::vector<uint8_t> ReadSnapshotFile(const std::filesystem::path& path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
            throw SnapshotError(fmt::format("cannot open snapshot '{}'", path.string()));

        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad())
            throw SnapshotError(fmt::format("failed reading snapshot '{}'", path.string()));
        return bytes;
    }

} // namespace dbvh::snapshot
