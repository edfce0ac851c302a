/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "auctv/listing.hpp"
#include "auctv/types.hpp"

namespace auctv {

class Llm;

struct ScriptRequest {
    JobMode mode = JobMode::Standard;
    const Listing* listing = nullptr;               // standard mode
    std::vector<std::filesystem::path> images;      // one per scene
    std::string channelName;
};

struct ScriptResult {
    bool ok = false;
    std::vector<std::string> narration;             // one per scene, may be empty
    ErrorCode code = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class ScriptGenerator {
public:
    virtual ~ScriptGenerator() = default;
    [[nodiscard]] virtual ScriptResult generate(const ScriptRequest& request, const Deadline& deadline,
                                                const ProgressFn& progress) noexcept = 0;
};

// Fixed Korean template. Deterministic and offline.
class TemplateScript final : public ScriptGenerator {
public:
    [[nodiscard]] ScriptResult generate(const ScriptRequest& request, const Deadline& deadline,
                                        const ProgressFn& progress) noexcept override;
};

// Rewrites each scene's template draft with the language model. Document
// pages go through the vision projector one page at a time. Any backend
// failure fails the script; there is no template fallback.
class LlmScript final : public ScriptGenerator {
public:
    explicit LlmScript(Llm& llm) : llm_(llm) {}

    [[nodiscard]] ScriptResult generate(const ScriptRequest& request, const Deadline& deadline,
                                        const ProgressFn& progress) noexcept override;

private:
    Llm& llm_;
};

struct ScriptSection {
    std::string key;
    std::string text;
};

// intro, case_overview, price_info, location_analysis, property_details,
// legal_notes, closing.
[[nodiscard]] std::vector<ScriptSection> fillSections(const Listing& listing, const std::string& channelName);

// Splits sections across scenes in order. With fewer scenes than sections
// each scene takes a contiguous group; surplus scenes get no narration.
[[nodiscard]] std::vector<std::string> distributeSections(const std::vector<ScriptSection>& sections,
                                                          std::size_t scenes);

[[nodiscard]] std::vector<std::string> documentNarration(std::size_t pages, const std::string& channelName);

}
