/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/wav.hpp"
#include "auctv/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <vector>

namespace auctv {

namespace {

void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void putU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
    }
}

void putTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

}

bool writeSilentWav(const std::filesystem::path& path, double seconds, uint32_t sampleRate) noexcept {
    try {
        if (seconds < 0.0 || sampleRate == 0) {
            return false;
        }
        const uint16_t channels = 1;
        const uint16_t bits = 16;
        const uint32_t blockAlign = channels * bits / 8;
        const uint64_t samples = static_cast<uint64_t>(std::llround(seconds * sampleRate));
        const uint64_t dataBytes = samples * blockAlign;
        if (dataBytes > 0xFFFFFFFFULL - 36) {
            return false;
        }

        std::vector<uint8_t> header;
        header.reserve(44);
        putTag(header, "RIFF");
        putU32(header, static_cast<uint32_t>(36 + dataBytes));
        putTag(header, "WAVE");
        putTag(header, "fmt ");
        putU32(header, 16);
        putU16(header, 1);  // PCM
        putU16(header, channels);
        putU32(header, sampleRate);
        putU32(header, sampleRate * blockAlign);
        putU16(header, static_cast<uint16_t>(blockAlign));
        putU16(header, bits);
        putTag(header, "data");
        putU32(header, static_cast<uint32_t>(dataBytes));

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            LOG_ERROR("Cannot create audio file: " + path.string());
            return false;
        }
        file.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));

        std::vector<char> zeros(64 * 1024, 0);
        uint64_t left = dataBytes;
        while (left > 0 && file) {
            auto n = static_cast<std::size_t>(std::min<uint64_t>(left, zeros.size()));
            file.write(zeros.data(), static_cast<std::streamsize>(n));
            left -= n;
        }
        file.flush();
        return file.good();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write silent audio " + path.string() + ": " + e.what());
        return false;
    }
}

std::optional<WavInfo> probeWav(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        std::error_code ec;
        const uint64_t fileSize = std::filesystem::file_size(path, ec);
        if (ec || fileSize < 12) {
            return std::nullopt;
        }

        uint8_t riff[12];
        file.read(reinterpret_cast<char*>(riff), sizeof(riff));
        if (!file || std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
            return std::nullopt;
        }

        WavInfo info;
        bool haveFmt = false;
        uint64_t offset = 12;
        while (offset + 8 <= fileSize) {
            uint8_t chunk[8];
            file.seekg(static_cast<std::streamoff>(offset));
            file.read(reinterpret_cast<char*>(chunk), sizeof(chunk));
            if (!file) break;
            const uint32_t size = readU32(chunk + 4);
            const uint64_t body = offset + 8;

            if (std::memcmp(chunk, "fmt ", 4) == 0 && size >= 16) {
                uint8_t fmt[16];
                file.read(reinterpret_cast<char*>(fmt), sizeof(fmt));
                if (!file) break;
                info.channels = readU16(fmt + 2);
                info.sampleRate = readU32(fmt + 4);
                info.byteRate = readU32(fmt + 8);
                info.bitsPerSample = readU16(fmt + 14);
                haveFmt = true;
            } else if (std::memcmp(chunk, "data", 4) == 0) {
                uint64_t available = fileSize - body;
                info.dataBytes = (size == 0 || size == 0xFFFFFFFFu || size > available) ? available : size;
                return haveFmt ? std::optional<WavInfo>(info) : std::nullopt;
            }
            // Chunks are word aligned
            offset = body + size + (size & 1u);
        }
        return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}
