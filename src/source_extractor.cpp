/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/source_extractor.hpp"
#include "auctv/logger.hpp"
#include "auctv/subprocess.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace auctv {

namespace {

constexpr const char* kSlateColor = "0x64788c";
constexpr const char* kMapSlateColor = "0xc8dcc8";
constexpr int kRasterDpi = 150;

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Page number from pdftoppm output names such as page-7.jpg or page-007.jpg.
int pageNumber(const std::filesystem::path& path) {
    std::string stem = path.stem().string();
    auto dash = stem.rfind('-');
    if (dash == std::string::npos) return -1;
    try {
        return std::stoi(stem.substr(dash + 1));
    } catch (const std::exception&) {
        return -1;
    }
}

std::filesystem::path uniqueProbeLog(const std::filesystem::path& dir) {
    static std::atomic<uint64_t> counter{0};
    return dir / ("pdfinfo_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)) + ".txt");
}

int parsePageCount(const std::string& output) {
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("Pages:", 0) == 0) {
            try {
                return std::stoi(line.substr(6));
            } catch (const std::exception&) {
                return -1;
            }
        }
    }
    return -1;
}

}

bool isSupportedImage(const std::filesystem::path& path) {
    static const std::vector<std::string> valid_ext = {".jpg", ".jpeg", ".png", ".webp", ".bmp"};
    std::string ext = toLowerCopy(path.extension().string());
    return std::find(valid_ext.begin(), valid_ext.end(), ext) != valid_ext.end();
}

SourceExtractor::SourceExtractor(const Config& config,
                                 std::shared_ptr<const ListingSource> jsonSource,
                                 std::shared_ptr<const ListingSource> sampleSource)
    : config_(config), jsonSource_(std::move(jsonSource)), sampleSource_(std::move(sampleSource)) {
}

const ListingSource& SourceExtractor::source(ListingOrigin origin) const noexcept {
    return origin == ListingOrigin::Sample ? *sampleSource_ : *jsonSource_;
}

DocumentCheck SourceExtractor::inspectDocument(const std::filesystem::path& pdf,
                                               const Deadline& deadline) const noexcept {
    try {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(pdf, ec)) {
            return {false, 0, ErrorCode::InputValidation, "Document not found"};
        }
        if (toLowerCopy(pdf.extension().string()) != ".pdf") {
            return {false, 0, ErrorCode::InputValidation, "Only PDF documents are supported"};
        }
        auto size = std::filesystem::file_size(pdf, ec);
        if (ec) {
            return {false, 0, ErrorCode::Storage, "Cannot read document size"};
        }
        if (size > config_.maxDocumentBytes) {
            return {false, 0, ErrorCode::InputValidation,
                    "Document exceeds size limit (" + std::to_string(config_.maxDocumentBytes) + " bytes)"};
        }

        char magic[5] = {0};
        {
            std::ifstream file(pdf, std::ios::binary);
            file.read(magic, sizeof(magic));
            if (file.gcount() != static_cast<std::streamsize>(sizeof(magic)) ||
                std::memcmp(magic, "%PDF-", sizeof(magic)) != 0) {
                return {false, 0, ErrorCode::InputValidation, "File is not a PDF document"};
            }
        }

        std::filesystem::create_directories(config_.tempDir, ec);
        auto log = uniqueProbeLog(config_.tempDir);
        ProcessResult run = runProcess({config_.pdfinfoPath, pdf.string()}, log, deadline);
        std::string output = readTail(log, 64 * 1024);
        std::filesystem::remove(log, ec);

        if (run.launchFailed) {
            LOG_ERROR("pdfinfo unavailable: " + run.error);
            return {false, 0, ErrorCode::ExternalService, "Document inspection tool unavailable"};
        }
        if (run.cancelled) {
            return {false, 0, ErrorCode::Cancelled, "Job cancelled"};
        }
        if (run.timedOut) {
            return {false, 0, ErrorCode::ExternalService, "Document inspection timed out"};
        }
        if (!run.ok) {
            LOG_WARN("pdfinfo rejected " + pdf.filename().string() + ": " + output);
            return {false, 0, ErrorCode::InputValidation, "Document could not be read"};
        }

        int pages = parsePageCount(output);
        if (pages < 0) {
            return {false, 0, ErrorCode::InputValidation, "Document could not be read"};
        }
        if (pages == 0) {
            return {false, 0, ErrorCode::InputValidation, "Document has no pages"};
        }
        LOG_DEBUG("Document " + pdf.filename().string() + ": " + std::to_string(pages) + " page(s)");
        return {true, pages, ErrorCode::None, ""};
    } catch (const std::exception& e) {
        LOG_ERROR("Document inspection error: " + std::string(e.what()));
        return {false, 0, ErrorCode::Storage, "Document inspection failed"};
    }
}

std::optional<std::filesystem::path> SourceExtractor::resolveImage(const ListingSource& source,
                                                                   const std::string& ref) const {
    if (ref.empty() || ref.find("://") != std::string::npos) {
        return std::nullopt;
    }
    std::filesystem::path path(ref);
    if (path.is_relative()) {
        path = source.imageDir() / path;
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || !isSupportedImage(path)) {
        return std::nullopt;
    }
    return path;
}

bool SourceExtractor::renderSlate(const std::filesystem::path& out, const char* color,
                                  const Deadline& deadline, std::string& error) const noexcept {
    std::string size = std::to_string(config_.width) + "x" + std::to_string(config_.height);
    std::vector<std::string> argv = {
        config_.ffmpegPath, "-y", "-hide_banner", "-loglevel", "error",
        "-f", "lavfi", "-i", std::string("color=c=") + color + ":s=" + size,
        "-frames:v", "1", out.string()
    };
    auto log = out.parent_path() / (out.stem().string() + ".log");
    ProcessResult run = runProcess(argv, log, deadline);
    if (!run.ok) {
        error = run.error;
        LOG_ERROR("Placeholder render failed: " + run.error + " " + readTail(log));
        return false;
    }
    std::error_code ec;
    std::filesystem::remove(log, ec);
    if (!std::filesystem::exists(out, ec)) {
        error = "placeholder image missing";
        return false;
    }
    return true;
}

SourceResult SourceExtractor::extractStandard(const std::string& caseId, ListingOrigin origin,
                                              const std::filesystem::path& workDir,
                                              const Deadline& deadline,
                                              const ProgressFn& progress) const noexcept {
    SourceResult result;
    try {
        const ListingSource& src = source(origin);
        ListingLookup lookup = src.find(caseId);
        if (!lookup) {
            result.code = lookup.code;
            result.message = lookup.message;
            return result;
        }
        const Listing& listing = lookup.listing;

        auto slateDir = workDir / "sources";
        std::filesystem::create_directories(slateDir);

        std::vector<std::pair<std::string, const char*>> refs;
        for (const auto& ref : listing.imageRefs) {
            refs.emplace_back(ref, kSlateColor);
        }
        if (listing.mapImageRef) {
            refs.emplace_back(*listing.mapImageRef, kMapSlateColor);
        }

        for (std::size_t i = 0; i < refs.size(); ++i) {
            if (deadline.cancelled()) {
                return {false, {}, std::nullopt, ErrorCode::Cancelled, "Job cancelled"};
            }
            auto resolved = resolveImage(src, refs[i].first);
            if (resolved) {
                result.images.push_back(*resolved);
            } else if (origin == ListingOrigin::Sample) {
                // Sample listings ship without photos; stand in a slate per reference
                auto slate = slateDir / ("slate_" + std::to_string(i) + ".jpg");
                std::string error;
                if (!renderSlate(slate, refs[i].second, deadline, error)) {
                    ErrorCode code = deadline.cancelled() ? ErrorCode::Cancelled : ErrorCode::Render;
                    return {false, {}, std::nullopt, code,
                            code == ErrorCode::Cancelled ? "Job cancelled" : "Failed to render placeholder image"};
                }
                result.images.push_back(slate);
            } else {
                LOG_WARN("Skipping unavailable image for " + caseId + ": " + refs[i].first);
            }
            if (progress) progress(static_cast<double>(i + 1) / static_cast<double>(refs.size() + 1));
        }

        if (result.images.empty()) {
            auto slate = slateDir / "slate_default.jpg";
            std::string error;
            if (!renderSlate(slate, kSlateColor, deadline, error)) {
                ErrorCode code = deadline.cancelled() ? ErrorCode::Cancelled : ErrorCode::Render;
                return {false, {}, std::nullopt, code,
                        code == ErrorCode::Cancelled ? "Job cancelled" : "Failed to render placeholder image"};
            }
            result.images.push_back(slate);
        }

        result.listing = listing;
        result.ok = true;
        LOG_INFO("Resolved " + std::to_string(result.images.size()) + " scene image(s) for " + caseId);
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Source extraction error for " + caseId + ": " + e.what());
        return {false, {}, std::nullopt, ErrorCode::Storage, "Failed to prepare scene images"};
    }
}

SourceResult SourceExtractor::extractDocument(const std::filesystem::path& pdf,
                                              const std::filesystem::path& workDir,
                                              const Deadline& deadline) const noexcept {
    try {
        auto pagesDir = workDir / "pages";
        std::filesystem::create_directories(pagesDir);

        std::vector<std::string> argv = {
            config_.pdftoppmPath, "-r", std::to_string(kRasterDpi), "-jpeg",
            pdf.string(), (pagesDir / "page").string()
        };
        auto log = workDir / "pdftoppm.log";
        ProcessResult run = runProcess(argv, log, deadline);
        if (run.cancelled) {
            return {false, {}, std::nullopt, ErrorCode::Cancelled, "Job cancelled"};
        }
        if (run.launchFailed) {
            LOG_ERROR("pdftoppm unavailable: " + run.error);
            return {false, {}, std::nullopt, ErrorCode::ExternalService, "Document rasterizer unavailable"};
        }
        if (!run.ok) {
            LOG_ERROR("pdftoppm failed: " + run.error + " " + readTail(log));
            return {false, {}, std::nullopt, ErrorCode::InputValidation, "Document pages could not be rasterized"};
        }

        std::vector<std::pair<int, std::filesystem::path>> pages;
        for (const auto& entry : std::filesystem::directory_iterator(pagesDir)) {
            if (!entry.is_regular_file() || !isSupportedImage(entry.path())) continue;
            int n = pageNumber(entry.path());
            if (n > 0) pages.emplace_back(n, entry.path());
        }
        std::sort(pages.begin(), pages.end());

        if (pages.empty()) {
            return {false, {}, std::nullopt, ErrorCode::InputValidation, "Document has no pages"};
        }

        SourceResult result;
        for (std::size_t i = 0; i < pages.size(); ++i) {
            char name[32];
            std::snprintf(name, sizeof(name), "page_%03zu.jpg", i + 1);
            auto target = pagesDir / name;
            std::filesystem::rename(pages[i].second, target);
            result.images.push_back(target);
        }
        result.ok = true;
        LOG_INFO("Rasterized " + std::to_string(result.images.size()) + " page(s) from " + pdf.filename().string());
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Document extraction error: " + std::string(e.what()));
        return {false, {}, std::nullopt, ErrorCode::Storage, "Failed to prepare document pages"};
    }
}

}
