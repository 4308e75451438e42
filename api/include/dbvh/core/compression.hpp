#pragma once

#include <vector>
#include <cstdint>
#include <span>

namespace dbvh::compression {

    /// Limite padrão de descompressão (256 MB), contra decompression bombs.
    inline constexpr uint64_t DefaultMaxUncompressedSize = 256ULL * 1024 * 1024;

    /**
     * @brief Comprime os dados fornecidos usando zlib (stream zlib puro, sem cabeçalho próprio).
     *
     * O tamanho original não é armazenado: quem chama guarda esse valor no seu
     * próprio formato e o repassa para UncompressData().
     *
     * @param data Bytes a comprimir.
     * @param level Nível de compressão (0 = sem compressão, 9 = melhor compressão, padrão: Z_BEST_SPEED).
     * @return Dados comprimidos.
     *
     * @note Em caso de erro, retorna um vetor vazio.
     */
    [[nodiscard]] std::vector<uint8_t> CompressData(std::span<const uint8_t> data, int level = 1);

    /**
     * @brief Descomprime dados gerados por CompressData().
     *
     * @param compressedData Stream zlib.
     * @param originalSize Tamanho exato esperado após a descompressão.
     * @param maxAllowedSize Limite máximo de bytes a descomprimir.
     * @return Dados descomprimidos.
     *
     * @note Em caso de erro, tamanho divergente ou dados inválidos, retorna um vetor vazio.
     */
    [[nodiscard]] std::vector<uint8_t> UncompressData(std::span<const uint8_t> compressedData,
                                                      uint64_t originalSize,
                                                      uint64_t maxAllowedSize = DefaultMaxUncompressedSize);
} // namespace dbvh::compression
