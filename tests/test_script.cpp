/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/format.hpp"
#include "auctv/script_generator.hpp"
#include <gtest/gtest.h>

using namespace auctv;

namespace {

Listing sampleListing() {
    Listing l;
    l.caseNumber = "2024타경12345";
    l.court = "서울중앙지방법원";
    l.assetTypeName = "아파트";
    l.address = "서울특별시 강남구 역삼동 123";
    l.addressDetail = "101동 1001호";
    l.region = "서울특별시";
    l.district = "강남구";
    l.landArea = 25.0;
    l.buildingAreaSqm = 84.97;
    l.floor = "10층";
    l.structure = "철근콘크리트구조";
    l.roofType = "평슬래브지붕";
    l.currentUse = "주거용";
    l.appraisalValue = 850000000;
    l.minimumBid = 680000000;
    l.minimumBidPercent = 0.8;
    l.auctionDate = "2025-03-07";
    l.auctionRound = 2;
    l.bidDepositPercent = 0.1;
    l.zoning = "제3종일반주거지역";
    l.terrain = "평지";
    l.roadAccess = "왕복 4차선 도로";
    return l;
}

}

TEST(KoreanFormat, Prices) {
    EXPECT_EQ(formatKoreanPrice(850000000), "8억 5천만원");
    EXPECT_EQ(formatKoreanPrice(123456789), "1억 2천3백4십5만원");
    EXPECT_EQ(formatKoreanPrice(300000000), "3억원");
    EXPECT_EQ(formatKoreanPrice(50000000), "5천만원");
    EXPECT_EQ(formatKoreanPrice(5000), "5천원");
    EXPECT_EQ(formatKoreanPrice(12345), "1만 2천3백4십5원");
    EXPECT_EQ(formatKoreanPrice(45000780), "4천5백만 7백8십원");
    EXPECT_EQ(formatKoreanPrice(100005000), "1억원");
    EXPECT_EQ(formatKoreanPrice(0), "0원");
    EXPECT_EQ(formatKoreanPrice(-10), "0원");
}

TEST(KoreanFormat, PercentTruncates) {
    EXPECT_EQ(formatPercent(0.8), "80%");
    EXPECT_EQ(formatPercent(0.29), "29%");
    EXPECT_EQ(formatPercent(0.1), "10%");
    EXPECT_EQ(formatPercent(0.645), "64%");
}

TEST(KoreanFormat, DatesAndAreas) {
    EXPECT_EQ(formatKoreanDate("2025-03-07"), "2025년 3월 7일");
    EXPECT_EQ(formatKoreanDate("미정"), "미정");
    EXPECT_EQ(formatKoreanArea(std::nullopt, 25.0), "25.0평");
    EXPECT_EQ(formatKoreanArea(99.17, std::nullopt), "30.0평 (99.2m²)");
    EXPECT_EQ(formatKoreanArea(std::nullopt, std::nullopt), "");
}

TEST(KoreanFormat, SpokenCharactersSkipWhitespace) {
    EXPECT_EQ(countSpokenChars(""), 0u);
    EXPECT_EQ(countSpokenChars("안녕 하세요"), 5u);
    EXPECT_EQ(countSpokenChars(" a b\tc\n"), 3u);
    EXPECT_EQ(collapseSpaces("  a   b \n c  "), "a b c");
}

TEST(TemplateSections, FillsSevenSectionsInOrder) {
    auto sections = fillSections(sampleListing(), "경매TV");
    ASSERT_EQ(sections.size(), 7u);
    const char* keys[] = {"intro", "case_overview", "price_info", "location_analysis",
                          "property_details", "legal_notes", "closing"};
    for (std::size_t i = 0; i < sections.size(); ++i) {
        EXPECT_EQ(sections[i].key, keys[i]);
        EXPECT_FALSE(sections[i].text.empty());
        EXPECT_EQ(sections[i].text.find("  "), std::string::npos) << sections[i].key;
    }
    EXPECT_EQ(sections[0].text, "안녕하세요. 경매TV입니다.");
    EXPECT_NE(sections[1].text.find("서울중앙지방법원 2024타경12345"), std::string::npos);
    EXPECT_NE(sections[1].text.find("101동 1001호"), std::string::npos);
    EXPECT_NE(sections[2].text.find("8억 5천만원"), std::string::npos);
    EXPECT_NE(sections[2].text.find("2025년 3월 7일"), std::string::npos);
    EXPECT_NE(sections[2].text.find("80%인 6억 8천만원"), std::string::npos);
    EXPECT_NE(sections[5].text.find("재매각"), std::string::npos);
    EXPECT_NE(sections[5].text.find("6천8백만원"), std::string::npos);
}

TEST(TemplateSections, MissingOptionalFieldsLeaveNoGaps) {
    Listing bare;
    bare.caseNumber = "2024타경1";
    bare.address = "부산광역시";
    for (const auto& section : fillSections(bare, "경매TV")) {
        EXPECT_EQ(section.text.find("  "), std::string::npos) << section.key;
    }
}

TEST(TemplateSections, FewerScenesTakeContiguousGroups) {
    auto sections = fillSections(sampleListing(), "경매TV");
    auto narration = distributeSections(sections, 3);
    ASSERT_EQ(narration.size(), 3u);
    EXPECT_EQ(narration[0], sections[0].text + " " + sections[1].text);
    EXPECT_EQ(narration[1], sections[2].text + " " + sections[3].text);
    EXPECT_EQ(narration[2], sections[4].text + " " + sections[5].text + " " + sections[6].text);
}

TEST(TemplateSections, SurplusScenesStaySilent) {
    auto sections = fillSections(sampleListing(), "경매TV");
    auto narration = distributeSections(sections, 9);
    ASSERT_EQ(narration.size(), 9u);
    for (std::size_t i = 0; i < 7; ++i) {
        EXPECT_EQ(narration[i], sections[i].text);
    }
    EXPECT_TRUE(narration[7].empty());
    EXPECT_TRUE(narration[8].empty());
    EXPECT_TRUE(distributeSections(sections, 0).empty());
}

TEST(TemplateSections, DocumentNarrationFramesPages) {
    auto narration = documentNarration(3, "경매TV");
    ASSERT_EQ(narration.size(), 3u);
    EXPECT_EQ(narration[0].rfind("안녕하세요. 경매TV입니다.", 0), 0u);
    EXPECT_NE(narration[0].find("1페이지입니다."), std::string::npos);
    EXPECT_EQ(narration[1], "2페이지입니다.");
    EXPECT_NE(narration[2].find("3페이지입니다."), std::string::npos);
    EXPECT_NE(narration[2].find("감사합니다."), std::string::npos);

    auto single = documentNarration(1, "경매TV");
    ASSERT_EQ(single.size(), 1u);
    EXPECT_NE(single[0].find("안녕하세요"), std::string::npos);
    EXPECT_NE(single[0].find("감사합니다."), std::string::npos);
}

TEST(TemplateScriptGenerator, IsDeterministic) {
    Listing listing = sampleListing();
    ScriptRequest request;
    request.listing = &listing;
    request.images = {"a.jpg", "b.jpg", "c.jpg", "d.jpg"};
    request.channelName = "경매TV";

    TemplateScript script;
    double reported = 0.0;
    ScriptResult first = script.generate(request, Deadline(), [&](double f) { reported = f; });
    ScriptResult second = script.generate(request, Deadline(), {});

    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.narration.size(), 4u);
    EXPECT_EQ(first.narration, second.narration);
    EXPECT_DOUBLE_EQ(reported, 1.0);
}

TEST(TemplateScriptGenerator, DocumentModeNarratesEveryPage) {
    ScriptRequest request;
    request.mode = JobMode::Document;
    request.images = {"p1.jpg", "p2.jpg"};
    request.channelName = "경매TV";

    TemplateScript script;
    ScriptResult result = script.generate(request, Deadline(), {});
    ASSERT_TRUE(result);
    ASSERT_EQ(result.narration.size(), 2u);
    EXPECT_EQ(result.narration, documentNarration(2, "경매TV"));
}

TEST(TemplateScriptGenerator, HonoursCancellation) {
    Listing listing = sampleListing();
    ScriptRequest request;
    request.listing = &listing;
    request.images = {"a.jpg"};

    std::atomic<bool> cancel{true};
    TemplateScript script;
    ScriptResult result = script.generate(request, Deadline::unbounded(&cancel), {});
    EXPECT_FALSE(result);
    EXPECT_EQ(result.code, ErrorCode::Cancelled);
}
