#include "dbvh/core/compression.hpp"
#include "dbvh/core/debug.hpp"
#include <zlib.h>
#include <limits>

namespace dbvh::compression {

    [[nodiscard]] std::vector<uint8_t> CompressData(std::span<const uint8_t> data, int level)
    {
        if (data.empty())
        {
            DBVH_LOG_WARN("CompressData recebeu vetor vazio.");
            return {};
        }

        if (data.size() > std::numeric_limits<uLong>::max())
        {
            DBVH_LOG_ERROR("CompressData: entrada grande demais para zlib ({} bytes).", data.size());
            return {};
        }

        if (level < Z_NO_COMPRESSION || level > Z_BEST_COMPRESSION)
        {
            DBVH_LOG_WARN("Nível de compressão inválido: {}. Usando Z_BEST_SPEED.", level);
            level = Z_BEST_SPEED;
        }

        uLongf compressedSize = compressBound(static_cast<uLong>(data.size()));
        std::vector<uint8_t> compressed(compressedSize);

        int res = compress2(compressed.data(), &compressedSize,
                            data.data(), static_cast<uLong>(data.size()), level);

        if (res != Z_OK)
        {
            DBVH_LOG_ERROR("Falha na compressão zlib: {}", zError(res));
            return {};
        }

        compressed.resize(compressedSize);
        return compressed;
    }

    [[nodiscard]] std::vector<uint8_t> UncompressData(std::span<const uint8_t> compressedData,
                                                      uint64_t originalSize, uint64_t maxAllowedSize)
    {
        if (compressedData.empty())
        {
            DBVH_LOG_ERROR("Dados comprimidos inválidos: buffer vazio.");
            return {};
        }

        if (originalSize == 0 || originalSize > maxAllowedSize ||
            originalSize > std::numeric_limits<uLongf>::max())
        {
            DBVH_LOG_ERROR("Tamanho original inválido ou suspeito: {}", originalSize);
            return {};
        }

        std::vector<uint8_t> decompressed(static_cast<size_t>(originalSize));
        uLongf destLen = static_cast<uLongf>(originalSize);

        int res = uncompress(decompressed.data(), &destLen,
                             compressedData.data(),
                             static_cast<uLong>(compressedData.size()));

        if (res != Z_OK)
        {
            DBVH_LOG_ERROR("Falha na descompressão zlib: {}", zError(res));
            return {};
        }

        if (destLen != originalSize)
        {
            DBVH_LOG_ERROR("Tamanho descomprimido ({}) difere do esperado ({}).", destLen, originalSize);
            return {};
        }

        return decompressed;
    }

} // namespace dbvh::compression
