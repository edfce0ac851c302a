/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/script_generator.hpp"
#include "auctv/format.hpp"
#include "auctv/llm.hpp"
#include "auctv/logger.hpp"

namespace auctv {

namespace {

std::string orEmpty(const std::optional<std::string>& value) {
    return value ? *value : std::string();
}

std::string areaText(const std::optional<double>& pyeong, const std::optional<double>& sqm) {
    if (pyeong) return formatKoreanArea(std::nullopt, pyeong);
    if (sqm) return formatKoreanArea(sqm, std::nullopt);
    return "";
}

std::string listingFacts(const Listing& l) {
    std::string facts;
    facts += "사건번호: " + l.court + " " + l.caseNumber + "\n";
    facts += "물건 종류: " + l.assetTypeName + "\n";
    facts += "주소: " + l.fullAddress() + "\n";
    facts += "감정가: " + formatKoreanPrice(l.appraisalValue) + "\n";
    facts += "최저매각금액: " + formatKoreanPrice(l.minimumBid) + " (" + formatPercent(l.minimumBidPercent) + ")\n";
    facts += "매각기일: " + formatKoreanDate(l.auctionDate) + "\n";
    if (l.zoning) facts += "용도지역: " + *l.zoning + "\n";
    if (l.currentUse) facts += "현재 용도: " + *l.currentUse + "\n";
    facts += std::string("점유자: ") + (l.hasOccupant ? "있음" : "없음") +
             ", 임차인: " + (l.hasLease ? "있음" : "없음") + "\n";
    for (const auto& ri : l.rightsIssues) {
        facts += "권리관계: " + ri.typeName + " " + ri.description + "\n";
    }
    return facts;
}

const char* kScenePrompt =
    "당신은 부동산 경매 소개 영상의 나레이터입니다. 아래 물건 정보와 초안을 바탕으로 "
    "이 장면에서 읽을 나레이션을 두세 문장으로 다듬어 주세요. 음성 합성으로 읽힐 예정이므로 "
    "마크다운, 기호, 목록 없이 자연스러운 구어체 문장만 출력하세요. 초안에 없는 사실을 지어내지 마세요.\n\n";

const char* kPagePrompt =
    "이 감정평가서 페이지를 보여주며 읽을 나레이션을 두세 문장으로 작성해 주세요. "
    "물건 종류, 주소, 면적, 감정가격, 법원 및 사건번호 같은 중요한 정보가 보이면 포함하고, "
    "없으면 페이지에 있는 내용만 간단히 요약하세요. 마크다운이나 기호 없이 구어체 문장만 출력하세요.";

ScriptResult failure(ErrorCode code, std::string message) {
    ScriptResult r;
    r.code = code;
    r.message = std::move(message);
    return r;
}

ScriptResult fromLlm(const LlmResult& result, std::size_t scene) {
    if (result.cancelled) {
        return failure(ErrorCode::Cancelled, "Job cancelled");
    }
    if (result.timedOut) {
        return failure(ErrorCode::ExternalService, "Script generation timed out");
    }
    LOG_ERROR("Script generation failed at scene " + std::to_string(scene + 1) + ": " + result.error);
    return failure(ErrorCode::ExternalService, "Script generation failed");
}

}

std::vector<ScriptSection> fillSections(const Listing& l, const std::string& channelName) {
    const std::string landArea = areaText(l.landArea, l.landAreaSqm);
    const std::string buildingArea = areaText(l.buildingArea, l.buildingAreaSqm);
    const auto bidDeposit = static_cast<int64_t>(static_cast<double>(l.minimumBid) * l.bidDepositPercent);
    const char* roundText = l.auctionRound > 1 ? "재매각" : "신건";

    std::vector<ScriptSection> sections;
    sections.push_back({"intro", "안녕하세요. " + channelName + "입니다."});
    sections.push_back({"case_overview",
        "오늘은 " + l.court + " " + l.caseNumber + " " + l.fullAddress() + " 토지면적 " + landArea +
        ", 건물면적 " + buildingArea + "의 " + l.assetTypeName + "에 대한 경매 사건을 소개하겠습니다."});
    sections.push_back({"price_info",
        "본 건의 감정가는 " + formatKoreanPrice(l.appraisalValue) + "이고, 도래하는 " +
        formatKoreanDate(l.auctionDate) + "자 매각기일에서의 최저매각금액은 감정가의 " +
        formatPercent(l.minimumBidPercent) + "인 " + formatKoreanPrice(l.minimumBid) + "입니다."});
    sections.push_back({"location_analysis",
        "본 건은 " + orEmpty(l.region) + " " + orEmpty(l.district) + " 인근에 위치하며, 부근은 " +
        orEmpty(l.zoning) + " 내 " + orEmpty(l.terrain) + " 토지로 형성되어 있습니다. 본 건은 " +
        orEmpty(l.roadAccess) + "에 접하여 차량의 진출입이 가능합니다."});
    sections.push_back({"property_details",
        "본 건은 " + orEmpty(l.structure) + " " + orEmpty(l.roofType) + "의 " + orEmpty(l.floor) + " " +
        l.assetTypeName + "이며, 현재 " + orEmpty(l.currentUse) + "로 사용 중입니다."});
    sections.push_back({"legal_notes",
        std::string("본 건은 ") + roundText + "으로 입찰보증금은 최저매각금액의 " +
        formatPercent(l.bidDepositPercent) + "인 " + formatKoreanPrice(bidDeposit) + "이며, 점유자 " +
        (l.hasOccupant ? "있음" : "없음") + ", 임차인 " + (l.hasLease ? "있음" : "없음") + "입니다."});
    sections.push_back({"closing",
        "입찰 이전에 현장을 방문하시어 경락 후 활용방안 등 제반사항을 확인 바라오며, 검토 중 궁금하신 사항은 " +
        channelName + "에 문의 바랍니다. 위 매각기일에 경락, 유찰 또는 변경될 수 있음도 참고 바랍니다. 감사합니다."});

    for (auto& s : sections) {
        s.text = collapseSpaces(s.text);
    }
    return sections;
}

std::vector<std::string> distributeSections(const std::vector<ScriptSection>& sections, std::size_t scenes) {
    std::vector<std::string> narration(scenes);
    const std::size_t total = sections.size();
    if (scenes == 0 || total == 0) {
        return narration;
    }
    if (scenes >= total) {
        for (std::size_t i = 0; i < total; ++i) {
            narration[i] = sections[i].text;
        }
        return narration;
    }
    for (std::size_t i = 0; i < scenes; ++i) {
        const std::size_t begin = i * total / scenes;
        const std::size_t end = (i + 1) * total / scenes;
        std::string text;
        for (std::size_t k = begin; k < end; ++k) {
            if (!text.empty()) text += " ";
            text += sections[k].text;
        }
        narration[i] = text;
    }
    return narration;
}

std::vector<std::string> documentNarration(std::size_t pages, const std::string& channelName) {
    std::vector<std::string> narration;
    narration.reserve(pages);
    for (std::size_t i = 0; i < pages; ++i) {
        std::string text;
        if (i == 0) {
            text = "안녕하세요. " + channelName + "입니다. 감정평가서의 주요 내용을 페이지별로 살펴보겠습니다. ";
        }
        text += std::to_string(i + 1) + "페이지입니다.";
        if (i + 1 == pages) {
            text += " 자세한 사항은 " + channelName + "에 문의 바랍니다. 감사합니다.";
        }
        narration.push_back(text);
    }
    return narration;
}

ScriptResult TemplateScript::generate(const ScriptRequest& request, const Deadline& deadline,
                                      const ProgressFn& progress) noexcept {
    try {
        if (deadline.cancelled()) {
            return failure(ErrorCode::Cancelled, "Job cancelled");
        }
        ScriptResult result;
        if (request.mode == JobMode::Document) {
            result.narration = documentNarration(request.images.size(), request.channelName);
        } else {
            if (!request.listing) {
                return failure(ErrorCode::Internal, "Listing missing for script");
            }
            result.narration = distributeSections(fillSections(*request.listing, request.channelName),
                                                  request.images.size());
        }
        if (progress) progress(1.0);
        result.ok = true;
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Template script error: " + std::string(e.what()));
        return failure(ErrorCode::Internal, "Script generation failed");
    }
}

ScriptResult LlmScript::generate(const ScriptRequest& request, const Deadline& deadline,
                                 const ProgressFn& progress) noexcept {
    try {
        const std::size_t scenes = request.images.size();
        ScriptResult result;
        result.narration.resize(scenes);

        if (request.mode == JobMode::Document) {
            if (!llm_.isMultimodal()) {
                return failure(ErrorCode::ExternalService, "Vision model not configured");
            }
            for (std::size_t i = 0; i < scenes; ++i) {
                LlmResult page = llm_.describe(kPagePrompt, request.images[i], deadline);
                if (!page.ok) {
                    return fromLlm(page, i);
                }
                if (page.output.empty()) {
                    return failure(ErrorCode::ExternalService, "Script generation returned no text");
                }
                result.narration[i] = page.output;
                if (progress) progress(static_cast<double>(i + 1) / static_cast<double>(scenes));
            }
        } else {
            if (!request.listing) {
                return failure(ErrorCode::Internal, "Listing missing for script");
            }
            const std::string facts = listingFacts(*request.listing);
            auto drafts = distributeSections(fillSections(*request.listing, request.channelName), scenes);
            for (std::size_t i = 0; i < scenes; ++i) {
                if (drafts[i].empty()) continue;
                std::string prompt = std::string(kScenePrompt) + "[물건 정보]\n" + facts + "\n[초안]\n" + drafts[i];
                LlmResult scene = llm_.generate(prompt, deadline);
                if (!scene.ok) {
                    return fromLlm(scene, i);
                }
                if (scene.output.empty()) {
                    return failure(ErrorCode::ExternalService, "Script generation returned no text");
                }
                result.narration[i] = scene.output;
                if (progress) progress(static_cast<double>(i + 1) / static_cast<double>(scenes));
            }
        }
        result.ok = true;
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("LLM script error: " + std::string(e.what()));
        return failure(ErrorCode::ExternalService, "Script generation failed");
    }
}

}
