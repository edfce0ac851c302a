/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/format.hpp"
#include <cmath>
#include <cstdio>
#include <vector>

namespace auctv {

namespace {

std::string oneDecimal(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", std::round(value * 10.0) / 10.0);
    return buf;
}

// 1..9999 as 천/백/십 groups, e.g. 2345 -> 2천3백4십5
std::string spellBelowTenThousand(int64_t n) {
    std::string out;
    if (n >= 1000) {
        out += std::to_string(n / 1000) + "천";
        n %= 1000;
    }
    if (n >= 100) {
        out += std::to_string(n / 100) + "백";
        n %= 100;
    }
    if (n >= 10) {
        out += std::to_string(n / 10) + "십";
        n %= 10;
    }
    if (n > 0) {
        out += std::to_string(n);
    }
    return out;
}

bool isAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}

std::string formatKoreanPrice(int64_t won) {
    if (won <= 0) {
        return "0원";
    }

    std::vector<std::string> parts;
    const int64_t eok = won / 100000000;
    const int64_t man = (won % 100000000) / 10000;
    const int64_t rest = won % 10000;

    if (eok > 0) {
        parts.push_back(std::to_string(eok) + "억");
    }
    if (man > 0) {
        parts.push_back(spellBelowTenThousand(man) + "만");
    }
    // Amounts of 1억 and more are spoken to the 만 unit only
    if (rest > 0 && eok == 0) {
        parts.push_back(spellBelowTenThousand(rest));
    }

    std::string result = parts.front();
    for (std::size_t i = 1; i < parts.size(); ++i) {
        result += " " + parts[i];
    }
    return result + "원";
}

std::string formatKoreanArea(std::optional<double> sqm, std::optional<double> pyeong) {
    double py = 0.0;
    if (pyeong) {
        py = *pyeong;
    } else if (sqm) {
        py = sqmToPyeong(*sqm);
    } else {
        return "";
    }
    std::string text = oneDecimal(py) + "평";
    if (sqm) {
        text += " (" + oneDecimal(*sqm) + "m²)";
    }
    return text;
}

std::string formatPercent(double ratio) {
    // Truncates like the listing sheets do; epsilon absorbs binary noise (0.29 * 100).
    return std::to_string(static_cast<long long>(ratio * 100.0 + 1e-9)) + "%";
}

std::string formatKoreanDate(const std::string& isoDate) {
    int year = 0;
    int month = 0;
    int day = 0;
    char tail = 0;
    if (std::sscanf(isoDate.c_str(), "%d-%d-%d%c", &year, &month, &day, &tail) != 3) {
        return isoDate;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return isoDate;
    }
    return std::to_string(year) + "년 " + std::to_string(month) + "월 " + std::to_string(day) + "일";
}

std::size_t countSpokenChars(const std::string& text) noexcept {
    std::size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) == 0x80) continue;  // continuation byte
        if (isAsciiSpace(c)) continue;
        ++count;
    }
    return count;
}

std::string collapseSpaces(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (unsigned char c : text) {
        if (isAsciiSpace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

}
