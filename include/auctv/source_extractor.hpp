/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "auctv/config.hpp"
#include "auctv/listing.hpp"
#include "auctv/types.hpp"

namespace auctv {

struct DocumentCheck {
    bool ok = false;
    int pages = 0;
    ErrorCode code = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct SourceResult {
    bool ok = false;
    std::vector<std::filesystem::path> images;  // scene order
    std::optional<Listing> listing;             // standard mode only
    ErrorCode code = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Resolves the ordered visual scenes of a job: listing photos (standard
// mode) or one rasterized image per document page (document mode).
class SourceExtractor final {
public:
    SourceExtractor(const Config& config,
                    std::shared_ptr<const ListingSource> jsonSource,
                    std::shared_ptr<const ListingSource> sampleSource);

    SourceExtractor(const SourceExtractor&) = delete;
    SourceExtractor& operator=(const SourceExtractor&) = delete;

    // Cheap synchronous checks run before a document job exists:
    // extension, %PDF- signature, size ceiling and page count via pdfinfo.
    [[nodiscard]] DocumentCheck inspectDocument(const std::filesystem::path& pdf,
                                                const Deadline& deadline) const noexcept;

    [[nodiscard]] SourceResult extractStandard(const std::string& caseId, ListingOrigin origin,
                                               const std::filesystem::path& workDir,
                                               const Deadline& deadline,
                                               const ProgressFn& progress) const noexcept;

    [[nodiscard]] SourceResult extractDocument(const std::filesystem::path& pdf,
                                               const std::filesystem::path& workDir,
                                               const Deadline& deadline) const noexcept;

    [[nodiscard]] const ListingSource& source(ListingOrigin origin) const noexcept;

private:
    [[nodiscard]] bool renderSlate(const std::filesystem::path& out, const char* color,
                                   const Deadline& deadline, std::string& error) const noexcept;
    [[nodiscard]] std::optional<std::filesystem::path> resolveImage(const ListingSource& source,
                                                                    const std::string& ref) const;

    const Config& config_;
    std::shared_ptr<const ListingSource> jsonSource_;
    std::shared_ptr<const ListingSource> sampleSource_;
};

[[nodiscard]] bool isSupportedImage(const std::filesystem::path& path);

}
