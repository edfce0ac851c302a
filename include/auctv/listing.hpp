/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "auctv/types.hpp"

namespace auctv {

struct RightIssue {
    std::string type = "other";
    std::string typeName = "기타";
    std::string description;
    std::string riskLevel = "caution";
    bool survivesAuction = false;
    std::optional<int64_t> amount;
    int priority = 0;
    std::optional<std::string> registrationDate;
};

// One court auction case as handed over by the listing collaborator.
struct Listing {
    std::string caseNumber;
    std::string court;
    std::string assetType = "OTHER";
    std::string assetTypeName = "기타";

    std::string address;
    std::optional<std::string> addressDetail;
    std::optional<std::string> region;
    std::optional<std::string> district;

    std::optional<double> landArea;          // 평
    std::optional<double> buildingArea;      // 평
    std::optional<double> landAreaSqm;
    std::optional<double> buildingAreaSqm;
    std::optional<std::string> floor;
    std::optional<int> buildYear;
    std::optional<std::string> structure;
    std::optional<std::string> roofType;
    std::optional<std::string> currentUse;

    int64_t appraisalValue = 0;
    int64_t minimumBid = 0;
    double minimumBidPercent = 0.0;
    std::string auctionDate;                 // YYYY-MM-DD
    int auctionRound = 1;
    double bidDepositPercent = 0.1;

    std::string riskLevel = "caution";
    bool hasOccupant = false;
    bool hasLease = false;
    std::vector<RightIssue> rightsIssues;
    std::optional<int64_t> leaseDeposit;
    std::optional<int64_t> monthlyRent;

    std::optional<std::string> zoning;
    std::optional<std::string> terrain;
    std::optional<std::string> roadAccess;

    std::vector<std::string> imageRefs;
    std::optional<std::string> mapImageRef;

    [[nodiscard]] std::string fullAddress() const;
};

// Throws nlohmann::json::exception on type mismatches.
[[nodiscard]] Listing listingFromJson(const nlohmann::json& j);
[[nodiscard]] nlohmann::json listingToJson(const Listing& listing);

// Blank record with every recognized field, for hand-authored listings.
[[nodiscard]] nlohmann::json listingTemplate();

// Case number as used in file names: separators and spaces removed.
[[nodiscard]] std::string safeCaseName(const std::string& caseNumber);

// Empty, oversized, or control-character identifiers are rejected.
[[nodiscard]] bool isValidCaseId(const std::string& caseId, std::string& reason);

// Optional exact-match criteria for browsing listings; unset fields match all.
struct ListingFilter {
    std::optional<std::string> court;
    std::optional<std::string> assetType;
    std::optional<std::string> region;

    [[nodiscard]] bool matches(const Listing& listing) const;
};

struct ListingLookup {
    bool ok = false;
    Listing listing;
    ErrorCode code = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class ListingSource {
public:
    virtual ~ListingSource() = default;

    [[nodiscard]] virtual ListingLookup find(const std::string& caseId) const = 0;
    [[nodiscard]] virtual std::vector<Listing> list(const ListingFilter& filter, std::size_t limit) const = 0;
    // Directory that relative image references resolve against.
    [[nodiscard]] virtual std::filesystem::path imageDir() const = 0;
};

// One <safe case>.json file per listing in a directory.
class JsonListingSource final : public ListingSource {
public:
    JsonListingSource(std::filesystem::path dir, std::filesystem::path imageDir);

    [[nodiscard]] ListingLookup find(const std::string& caseId) const override;
    [[nodiscard]] std::vector<Listing> list(const ListingFilter& filter, std::size_t limit) const override;
    [[nodiscard]] std::filesystem::path imageDir() const override { return imageDir_; }

private:
    [[nodiscard]] ListingLookup load(const std::filesystem::path& file) const;

    std::filesystem::path dir_;
    std::filesystem::path imageDir_;
};

// A single file holding {"properties": [...]}, the bundled sample set.
class SampleListingSource final : public ListingSource {
public:
    SampleListingSource(std::filesystem::path file, std::filesystem::path imageDir);

    [[nodiscard]] ListingLookup find(const std::string& caseId) const override;
    [[nodiscard]] std::vector<Listing> list(const ListingFilter& filter, std::size_t limit) const override;
    [[nodiscard]] std::filesystem::path imageDir() const override { return imageDir_; }

private:
    [[nodiscard]] bool loadAll(std::vector<Listing>& out, std::string& error) const;

    std::filesystem::path file_;
    std::filesystem::path imageDir_;
};

}
