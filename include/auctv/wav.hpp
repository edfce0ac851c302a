/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>

namespace auctv {

struct WavInfo {
    uint16_t channels = 0;
    uint32_t sampleRate = 0;
    uint16_t bitsPerSample = 0;
    uint32_t byteRate = 0;
    uint64_t dataBytes = 0;

    [[nodiscard]] double seconds() const noexcept {
        return byteRate == 0 ? 0.0 : static_cast<double>(dataBytes) / byteRate;
    }
};

// 16-bit mono PCM of digital silence, sampleRate Hz.
[[nodiscard]] bool writeSilentWav(const std::filesystem::path& path, double seconds,
                                  uint32_t sampleRate = 24000) noexcept;

// Parses the RIFF header. Streaming writers leave the data size at 0 or
// 0xFFFFFFFF; the remainder of the file is used in that case.
[[nodiscard]] std::optional<WavInfo> probeWav(const std::filesystem::path& path) noexcept;

}
