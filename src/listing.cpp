/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/listing.hpp"
#include "auctv/logger.hpp"
#include <algorithm>
#include <fstream>

namespace auctv {

using nlohmann::json;

namespace {

constexpr std::size_t kMaxCaseIdBytes = 128;

template <typename T>
std::optional<T> optionalField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

template <typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    j[key] = value ? json(*value) : json(nullptr);
}

RightIssue rightIssueFromJson(const json& j) {
    RightIssue issue;
    issue.type = j.value("type", issue.type);
    issue.typeName = j.value("type_name", issue.typeName);
    issue.description = j.value("description", issue.description);
    issue.riskLevel = j.value("risk_level", issue.riskLevel);
    issue.survivesAuction = j.value("survives_auction", false);
    issue.amount = optionalField<int64_t>(j, "amount");
    issue.priority = j.value("priority", 0);
    issue.registrationDate = optionalField<std::string>(j, "registration_date");
    return issue;
}

bool readJsonFile(const std::filesystem::path& path, json& out, std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        error = "Cannot open " + path.string();
        return false;
    }
    try {
        out = json::parse(file);
        return true;
    } catch (const json::parse_error& e) {
        error = "Malformed JSON in " + path.filename().string() + ": " + e.what();
        return false;
    }
}

}

std::string Listing::fullAddress() const {
    if (!addressDetail || addressDetail->empty()) {
        return address;
    }
    return address + " " + *addressDetail;
}

Listing listingFromJson(const json& j) {
    Listing l;
    l.caseNumber = j.value("case_number", "");
    l.court = j.value("court", "");
    l.assetType = j.value("asset_type", l.assetType);
    l.assetTypeName = j.value("asset_type_name", l.assetTypeName);

    l.address = j.value("address", "");
    l.addressDetail = optionalField<std::string>(j, "address_detail");
    l.region = optionalField<std::string>(j, "region");
    l.district = optionalField<std::string>(j, "district");

    l.landArea = optionalField<double>(j, "land_area");
    l.buildingArea = optionalField<double>(j, "building_area");
    l.landAreaSqm = optionalField<double>(j, "land_area_sqm");
    l.buildingAreaSqm = optionalField<double>(j, "building_area_sqm");
    l.floor = optionalField<std::string>(j, "floor");
    l.buildYear = optionalField<int>(j, "build_year");
    l.structure = optionalField<std::string>(j, "structure");
    l.roofType = optionalField<std::string>(j, "roof_type");
    l.currentUse = optionalField<std::string>(j, "current_use");

    l.appraisalValue = j.value("appraisal_value", int64_t{0});
    l.minimumBid = j.value("minimum_bid", int64_t{0});
    l.minimumBidPercent = j.value("minimum_bid_percent", 0.0);
    l.auctionDate = j.value("auction_date", "");
    l.auctionRound = j.value("auction_round", 1);
    l.bidDepositPercent = j.value("bid_deposit_percent", 0.1);

    l.riskLevel = j.value("risk_level", l.riskLevel);
    l.hasOccupant = j.value("has_occupant", false);
    l.hasLease = j.value("has_lease", false);
    l.leaseDeposit = optionalField<int64_t>(j, "lease_deposit");
    l.monthlyRent = optionalField<int64_t>(j, "monthly_rent");
    if (auto it = j.find("rights_issues"); it != j.end() && it->is_array()) {
        for (const auto& item : *it) {
            l.rightsIssues.push_back(rightIssueFromJson(item));
        }
    }

    l.zoning = optionalField<std::string>(j, "zoning");
    l.terrain = optionalField<std::string>(j, "terrain");
    l.roadAccess = optionalField<std::string>(j, "road_access");

    if (auto it = j.find("image_urls"); it != j.end() && it->is_array()) {
        l.imageRefs = it->get<std::vector<std::string>>();
    }
    l.mapImageRef = optionalField<std::string>(j, "map_image_url");
    return l;
}

json listingToJson(const Listing& l) {
    json j;
    j["case_number"] = l.caseNumber;
    j["court"] = l.court;
    j["asset_type"] = l.assetType;
    j["asset_type_name"] = l.assetTypeName;
    j["address"] = l.address;
    putOptional(j, "address_detail", l.addressDetail);
    putOptional(j, "region", l.region);
    putOptional(j, "district", l.district);
    putOptional(j, "land_area", l.landArea);
    putOptional(j, "building_area", l.buildingArea);
    putOptional(j, "land_area_sqm", l.landAreaSqm);
    putOptional(j, "building_area_sqm", l.buildingAreaSqm);
    putOptional(j, "floor", l.floor);
    putOptional(j, "build_year", l.buildYear);
    putOptional(j, "structure", l.structure);
    putOptional(j, "roof_type", l.roofType);
    putOptional(j, "current_use", l.currentUse);
    j["appraisal_value"] = l.appraisalValue;
    j["minimum_bid"] = l.minimumBid;
    j["minimum_bid_percent"] = l.minimumBidPercent;
    j["auction_date"] = l.auctionDate;
    j["auction_round"] = l.auctionRound;
    j["bid_deposit_percent"] = l.bidDepositPercent;
    j["risk_level"] = l.riskLevel;
    j["has_occupant"] = l.hasOccupant;
    j["has_lease"] = l.hasLease;
    putOptional(j, "lease_deposit", l.leaseDeposit);
    putOptional(j, "monthly_rent", l.monthlyRent);
    putOptional(j, "zoning", l.zoning);
    putOptional(j, "terrain", l.terrain);
    putOptional(j, "road_access", l.roadAccess);

    json issues = json::array();
    for (const auto& ri : l.rightsIssues) {
        json item{{"type", ri.type},
                  {"type_name", ri.typeName},
                  {"description", ri.description},
                  {"risk_level", ri.riskLevel},
                  {"survives_auction", ri.survivesAuction},
                  {"priority", ri.priority}};
        putOptional(item, "amount", ri.amount);
        putOptional(item, "registration_date", ri.registrationDate);
        issues.push_back(std::move(item));
    }
    j["rights_issues"] = std::move(issues);
    j["image_urls"] = l.imageRefs;
    putOptional(j, "map_image_url", l.mapImageRef);
    return j;
}

json listingTemplate() {
    Listing blank;
    blank.caseNumber = "2024타경00000";
    blank.court = "";
    blank.auctionDate = "2024-01-01";
    RightIssue issue;
    blank.rightsIssues.push_back(issue);
    return listingToJson(blank);
}

std::string safeCaseName(const std::string& caseNumber) {
    std::string out;
    out.reserve(caseNumber.size());
    for (char c : caseNumber) {
        if (c == '/' || c == '\\') {
            out.push_back('_');
        } else if (c != ' ') {
            out.push_back(c);
        }
    }
    if (out == "." || out == "..") {
        out = "_";
    }
    return out;
}

bool isValidCaseId(const std::string& caseId, std::string& reason) {
    if (caseId.empty()) {
        reason = "Case identifier is empty";
        return false;
    }
    if (caseId.size() > kMaxCaseIdBytes) {
        reason = "Case identifier is too long";
        return false;
    }
    for (unsigned char c : caseId) {
        if (c < 0x20 || c == 0x7f) {
            reason = "Case identifier contains control characters";
            return false;
        }
    }
    if (safeCaseName(caseId).empty()) {
        reason = "Case identifier has no usable characters";
        return false;
    }
    return true;
}

bool ListingFilter::matches(const Listing& listing) const {
    if (court && listing.court != *court) return false;
    if (assetType && listing.assetType != *assetType) return false;
    if (region && listing.region.value_or("") != *region) return false;
    return true;
}

JsonListingSource::JsonListingSource(std::filesystem::path dir, std::filesystem::path imageDir)
    : dir_(std::move(dir)), imageDir_(std::move(imageDir)) {
}

ListingLookup JsonListingSource::find(const std::string& caseId) const {
    auto file = dir_ / (safeCaseName(caseId) + ".json");
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        LOG_DEBUG("Listing file not found: " + file.string());
        return {false, {}, ErrorCode::DataNotFound, "Listing not found: " + caseId};
    }
    ListingLookup found = load(file);
    if (found && found.listing.caseNumber.empty()) {
        found.listing.caseNumber = caseId;
    }
    return found;
}

ListingLookup JsonListingSource::load(const std::filesystem::path& file) const {
    json j;
    std::string error;
    if (!readJsonFile(file, j, error)) {
        LOG_WARN(error);
        return {false, {}, ErrorCode::InputValidation, "Listing file is not valid JSON: " + file.filename().string()};
    }
    try {
        return {true, listingFromJson(j), ErrorCode::None, ""};
    } catch (const json::exception& e) {
        LOG_WARN("Listing " + file.filename().string() + " has wrong field types: " + e.what());
        return {false, {}, ErrorCode::InputValidation, "Listing file has invalid fields: " + file.filename().string()};
    }
}

std::vector<Listing> JsonListingSource::list(const ListingFilter& filter, std::size_t limit) const {
    std::vector<Listing> result;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir_, ec)) {
        return result;
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        if (result.size() >= limit) break;
        ListingLookup found = load(file);
        if (found && filter.matches(found.listing)) {
            result.push_back(std::move(found.listing));
        }
    }
    return result;
}

SampleListingSource::SampleListingSource(std::filesystem::path file, std::filesystem::path imageDir)
    : file_(std::move(file)), imageDir_(std::move(imageDir)) {
}

bool SampleListingSource::loadAll(std::vector<Listing>& out, std::string& error) const {
    json j;
    if (!readJsonFile(file_, j, error)) {
        return false;
    }
    try {
        auto it = j.find("properties");
        if (it == j.end() || !it->is_array()) {
            error = file_.filename().string() + " has no properties array";
            return false;
        }
        for (const auto& item : *it) {
            out.push_back(listingFromJson(item));
        }
        return true;
    } catch (const json::exception& e) {
        error = file_.filename().string() + ": " + e.what();
        return false;
    }
}

ListingLookup SampleListingSource::find(const std::string& caseId) const {
    std::vector<Listing> all;
    std::string error;
    if (!loadAll(all, error)) {
        LOG_WARN("Sample listings unavailable: " + error);
        return {false, {}, ErrorCode::DataNotFound, "Listing not found: " + caseId};
    }
    for (auto& listing : all) {
        if (listing.caseNumber == caseId) {
            return {true, std::move(listing), ErrorCode::None, ""};
        }
    }
    return {false, {}, ErrorCode::DataNotFound, "Listing not found: " + caseId};
}

std::vector<Listing> SampleListingSource::list(const ListingFilter& filter, std::size_t limit) const {
    std::vector<Listing> all;
    std::string error;
    if (!loadAll(all, error)) {
        LOG_WARN("Sample listings unavailable: " + error);
        return {};
    }
    std::vector<Listing> result;
    for (auto& listing : all) {
        if (result.size() >= limit) break;
        if (filter.matches(listing)) {
            result.push_back(std::move(listing));
        }
    }
    return result;
}

}
