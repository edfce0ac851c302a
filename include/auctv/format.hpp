/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace auctv {

// Korean-unit price for narration: 850000000 -> "8억 5천만원".
// Below 1억 the remainder under 만 is kept: 12345 -> "1만 2천3백4십5원".
[[nodiscard]] std::string formatKoreanPrice(int64_t won);

// "85.5평" or "85.5평 (282.6m²)" when square meters are known.
[[nodiscard]] std::string formatKoreanArea(std::optional<double> sqm, std::optional<double> pyeong);

// 0.64 -> "64%"
[[nodiscard]] std::string formatPercent(double ratio);

// "2024-03-15" -> "2024년 3월 15일"; anything else is returned unchanged.
[[nodiscard]] std::string formatKoreanDate(const std::string& isoDate);

[[nodiscard]] constexpr double sqmToPyeong(double sqm) noexcept { return sqm / 3.3058; }

// Non-whitespace code points in a UTF-8 string.
[[nodiscard]] std::size_t countSpokenChars(const std::string& text) noexcept;

// Collapses runs of ASCII whitespace into one space and trims both ends.
[[nodiscard]] std::string collapseSpaces(const std::string& text);

}
