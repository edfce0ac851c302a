/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/pipeline.hpp"
#include "auctv/service.hpp"
#include "auctv/source_extractor.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <set>

using namespace auctv;
using auctv::testing::TempDirTest;
using auctv::testing::countFiles;
using auctv::testing::waitFor;
using auctv::testing::writeFile;
using auctv::testing::writeScript;

namespace {

constexpr const char* kCase = "2024타경12345";

}

class PipelineTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        config_ = Config::withRoot(root_);
        config_.workers = 2;
        config_.cancelTimeout = std::chrono::seconds(10);
        config_.ffmpegPath = auctv::testing::fakeFfmpeg(root_ / "bin").string();

        nlohmann::json sample = {{"properties", {
            {{"case_number", kCase}, {"court", "서울중앙지방법원"}, {"asset_type_name", "아파트"},
             {"address", "서울특별시 강남구 역삼동 123"}, {"appraisal_value", 850000000},
             {"minimum_bid", 680000000}, {"minimum_bid_percent", 0.8}, {"auction_date", "2025-03-07"},
             {"image_urls", {"a.jpg", "b.jpg", "c.jpg"}}},
        }}};
        writeFile(config_.sampleListingsFile(), sample.dump());
        for (const char* name : {"a.jpg", "b.jpg", "c.jpg"}) {
            writeFile(config_.sampleImagesDir() / name, "jpeg");
        }
    }

    void TearDown() override {
        if (service_) {
            service_->shutdown();
            service_.reset();
        }
        TempDirTest::TearDown();
    }

    Service& startService() {
        auto store = std::make_unique<MemoryJobStore>();
        store->setObserver([this](const Job& job) {
            std::lock_guard<std::mutex> lock(progressMutex_);
            progress_[job.id].push_back(job.progress);
        });
        service_ = std::make_unique<Service>(config_, std::move(store));
        EXPECT_TRUE(service_->start());
        return *service_;
    }

    Job submitSample(Service& service) {
        StandardRequest request;
        request.caseId = kCase;
        request.source = "mock";
        SubmitResult submitted = service.createJob(request);
        EXPECT_TRUE(submitted) << submitted.message;
        return submitted.job;
    }

    std::optional<Job> waitTerminal(Service& service, const JobId& id) {
        waitFor([&] {
            auto job = service.get(id);
            return !job || job->terminal();
        });
        return service.get(id);
    }

    std::vector<int> progressOf(const JobId& id) {
        std::lock_guard<std::mutex> lock(progressMutex_);
        return progress_[id];
    }

    Config config_;
    std::unique_ptr<Service> service_;
    std::mutex progressMutex_;
    std::map<JobId, std::vector<int>> progress_;
};

TEST_F(PipelineTest, StagesAreOrderedAndWeighted) {
    config_.renderTimeout = std::chrono::seconds(123);
    config_.finalizeTimeout = std::chrono::seconds(7);
    MemoryJobStore store;
    auto json = std::make_shared<JsonListingSource>(config_.listingsDir(), config_.listingImagesDir());
    auto sample = std::make_shared<SampleListingSource>(config_.sampleListingsFile(), config_.sampleImagesDir());
    SourceExtractor extractor(config_, json, sample);
    PipelineRunner runner(config_, store, extractor);

    const auto& stages = runner.stages();
    ASSERT_EQ(stages.size(), 5u);
    const char* labels[] = {"extracting-sources", "generating-script", "synthesizing-audio",
                            "assembling-video", "finalizing"};
    const int weights[] = {10, 25, 35, 25, 5};
    int total = 0;
    for (std::size_t i = 0; i < stages.size(); ++i) {
        EXPECT_EQ(stages[i].label, labels[i]);
        EXPECT_EQ(stages[i].weight, weights[i]);
        EXPECT_GT(stages[i].timeout.count(), 0);
        total += stages[i].weight;
    }
    EXPECT_EQ(total, 100);
    EXPECT_EQ(stages[3].timeout, std::chrono::seconds(123));
    EXPECT_EQ(stages[4].timeout, std::chrono::seconds(7));
    EXPECT_FALSE(runner.hasLanguageModel());
    EXPECT_FALSE(runner.hasNetworkSpeech());
}

TEST_F(PipelineTest, MockJobCompletesWithMonotonicProgress) {
    Service& service = startService();
    Job job = submitSample(service);
    EXPECT_EQ(job.status, JobStatus::Pending);
    EXPECT_EQ(job.params.scriptBackend, ScriptBackend::Template);
    EXPECT_EQ(job.params.speechBackend, SpeechBackend::Silent);

    auto done = waitTerminal(service, job.id);
    ASSERT_TRUE(done);
    ASSERT_EQ(done->status, JobStatus::Completed) << done->error.value_or("");
    EXPECT_EQ(done->progress, 100);
    EXPECT_EQ(done->currentStep.value_or(""), "completed");
    ASSERT_TRUE(done->outputRef);
    EXPECT_TRUE(std::filesystem::exists(config_.outputDir / *done->outputRef));
    EXPECT_EQ(done->outputRef->rfind("2024타경12345_", 0), 0u);
    EXPECT_NE(done->outputRef->find(job.id), std::string::npos);

    auto values = progressOf(job.id);
    ASSERT_FALSE(values.empty());
    EXPECT_TRUE(std::is_sorted(values.begin(), values.end()));
    EXPECT_EQ(values.back(), 100);

    // Scratch space is gone once the job is terminal
    EXPECT_FALSE(std::filesystem::exists(config_.jobDir(job.id)));

    nlohmann::json j = toJson(*done);
    EXPECT_EQ(j["status"], "completed");
    EXPECT_EQ(j["video_url"], "/api/videos/" + *done->outputRef);
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_EQ(j["created_at"].get<std::string>().back(), 'Z');
}

TEST_F(PipelineTest, ConcurrentJobsProduceDistinctOutputs) {
    Service& service = startService();
    std::vector<JobId> ids;
    for (int i = 0; i < config_.workers; ++i) {
        ids.push_back(submitSample(service).id);
    }

    std::set<std::string> outputs;
    for (const auto& id : ids) {
        auto done = waitTerminal(service, id);
        ASSERT_TRUE(done);
        ASSERT_EQ(done->status, JobStatus::Completed) << done->error.value_or("");
        outputs.insert(done->outputRef.value_or(""));
    }
    EXPECT_EQ(outputs.size(), ids.size());
    EXPECT_EQ(service.list().size(), ids.size());
}

TEST_F(PipelineTest, DeletingCompletedJobRemovesVideo) {
    Service& service = startService();
    Job job = submitSample(service);
    auto done = waitTerminal(service, job.id);
    ASSERT_TRUE(done);
    ASSERT_EQ(done->status, JobStatus::Completed);
    const auto video = config_.outputDir / *done->outputRef;

    auto stream = service.openVideo(*done->outputRef);
    ASSERT_TRUE(stream);
    stream.reset();

    EXPECT_EQ(service.remove(job.id), RemoveResult::Removed);
    EXPECT_FALSE(service.get(job.id));
    EXPECT_FALSE(std::filesystem::exists(video));
    EXPECT_FALSE(service.openVideo(*done->outputRef));
    EXPECT_EQ(service.remove(job.id), RemoveResult::NotFound);
}

TEST_F(PipelineTest, VideoNamesCannotEscapeOutputDirectory) {
    Service& service = startService();
    writeFile(root_ / "secret.mp4", "x");
    EXPECT_FALSE(service.openVideo("../secret.mp4"));
    EXPECT_FALSE(service.openVideo("a/b.mp4"));
    EXPECT_FALSE(service.openVideo(""));
}

TEST_F(PipelineTest, InvalidCaseIdCreatesNoJob) {
    Service& service = startService();
    StandardRequest request;
    request.caseId = "";
    SubmitResult submitted = service.createJob(request);
    EXPECT_FALSE(submitted);
    EXPECT_EQ(submitted.code, ErrorCode::InputValidation);

    request.caseId = kCase;
    request.source = "ftp";
    EXPECT_EQ(service.createJob(request).code, ErrorCode::InputValidation);
    EXPECT_TRUE(service.list().empty());
}

TEST_F(PipelineTest, UnknownCaseIsRejectedWithoutJob) {
    Service& service = startService();
    StandardRequest request;
    request.caseId = "2024타경404";
    request.source = "json";
    SubmitResult submitted = service.createJob(request);
    EXPECT_FALSE(submitted);
    EXPECT_EQ(submitted.code, ErrorCode::DataNotFound);
    EXPECT_EQ(submitted.message, "Listing not found: 2024타경404");

    request.source = "mock";
    EXPECT_EQ(service.createJob(request).code, ErrorCode::DataNotFound);
    EXPECT_TRUE(service.list().empty());
    EXPECT_EQ(countFiles(config_.tempDir), 0u);
}

TEST_F(PipelineTest, ZeroPageDocumentIsRejectedWithoutJob) {
    config_.pdfinfoPath = writeScript(root_ / "bin" / "pdfinfo", "echo 'Pages: 0'\n").string();
    Service& service = startService();
    writeFile(root_ / "empty.pdf", "%PDF-1.4\n");

    DocumentRequest request;
    request.path = root_ / "empty.pdf";
    SubmitResult submitted = service.createDocumentJob(request);
    EXPECT_FALSE(submitted);
    EXPECT_EQ(submitted.code, ErrorCode::InputValidation);
    EXPECT_TRUE(service.list().empty());
}

TEST_F(PipelineTest, DocumentJobNarratesEveryPage) {
    config_.pdfinfoPath = writeScript(root_ / "bin" / "pdfinfo", "echo 'Pages: 2'\n").string();
    config_.pdftoppmPath = writeScript(root_ / "bin" / "pdftoppm",
        "printf p > \"$5-1.jpg\"\nprintf p > \"$5-2.jpg\"\n").string();
    Service& service = startService();
    writeFile(root_ / "appraisal.pdf", "%PDF-1.4\n");

    DocumentRequest request;
    request.path = root_ / "appraisal.pdf";
    SubmitResult submitted = service.createDocumentJob(request);
    ASSERT_TRUE(submitted) << submitted.message;
    EXPECT_EQ(submitted.job.params.mode, JobMode::Document);
    EXPECT_EQ(submitted.job.params.pageCount, 2);

    auto done = waitTerminal(service, submitted.job.id);
    ASSERT_TRUE(done);
    ASSERT_EQ(done->status, JobStatus::Completed) << done->error.value_or("");
    EXPECT_EQ(done->outputRef->rfind("appraisal_", 0), 0u);
}

TEST_F(PipelineTest, RenderFailureFreezesProgress) {
    config_.ffmpegPath = writeScript(root_ / "bin" / "ffmpeg-broken", "exit 1\n").string();
    Service& service = startService();
    Job job = submitSample(service);

    auto done = waitTerminal(service, job.id);
    ASSERT_TRUE(done);
    EXPECT_EQ(done->status, JobStatus::Failed);
    EXPECT_EQ(done->errorCode, ErrorCode::Render);
    EXPECT_EQ(done->error.value_or(""), "Video encoding failed");
    EXPECT_EQ(done->progress, 70);
    EXPECT_EQ(done->currentStep.value_or(""), "assembling-video");
    EXPECT_EQ(countFiles(config_.outputDir), 0u);
    EXPECT_FALSE(std::filesystem::exists(config_.jobDir(job.id)));
}

TEST_F(PipelineTest, DeletingInFlightJobCancelsAndCleansUp) {
    config_.ffmpegPath = auctv::testing::fakeFfmpeg(root_ / "bin-slow", "sleep 30\n").string();
    Service& service = startService();
    Job job = submitSample(service);

    ASSERT_TRUE(waitFor([&] {
        auto current = service.get(job.id);
        return current && current->currentStep.value_or("") == "assembling-video";
    }));
    EXPECT_TRUE(std::filesystem::exists(config_.jobDir(job.id)));

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(service.remove(job.id), RemoveResult::Removed);
    EXPECT_LT(std::chrono::steady_clock::now() - start, config_.cancelTimeout);

    EXPECT_FALSE(service.get(job.id));
    EXPECT_FALSE(std::filesystem::exists(config_.jobDir(job.id)));
    EXPECT_EQ(countFiles(config_.outputDir), 0u);
}

TEST_F(PipelineTest, DeletingQueuedJobFailsItImmediately) {
    config_.workers = 1;
    config_.ffmpegPath = auctv::testing::fakeFfmpeg(root_ / "bin-slow", "sleep 30\n").string();
    Service& service = startService();
    Job running = submitSample(service);
    Job queued = submitSample(service);

    ASSERT_TRUE(waitFor([&] {
        auto current = service.get(running.id);
        return current && current->status == JobStatus::Processing;
    }));
    EXPECT_EQ(service.get(queued.id)->status, JobStatus::Pending);

    EXPECT_EQ(service.remove(queued.id), RemoveResult::Removed);
    EXPECT_FALSE(service.get(queued.id));
    EXPECT_EQ(service.remove(running.id), RemoveResult::Removed);
    EXPECT_TRUE(service.list().empty());
}

TEST_F(PipelineTest, ShutdownClosesQueuedJobs) {
    config_.workers = 1;
    config_.ffmpegPath = auctv::testing::fakeFfmpeg(root_ / "bin-slow", "sleep 30\n").string();
    Service& service = startService();
    Job running = submitSample(service);
    Job queued = submitSample(service);

    ASSERT_TRUE(waitFor([&] {
        auto current = service.get(running.id);
        return current && current->status == JobStatus::Processing;
    }));

    service.shutdown();

    auto closed = service.get(queued.id);
    ASSERT_TRUE(closed);
    EXPECT_EQ(closed->status, JobStatus::Failed);
    EXPECT_EQ(closed->errorCode, ErrorCode::Cancelled);
    EXPECT_EQ(closed->error.value_or(""), "Job cancelled");

    auto stopped = service.get(running.id);
    ASSERT_TRUE(stopped);
    EXPECT_EQ(stopped->status, JobStatus::Failed);
    EXPECT_EQ(stopped->errorCode, ErrorCode::Cancelled);
    EXPECT_FALSE(std::filesystem::exists(config_.jobDir(running.id)));
}

TEST(OutputNames, IncludeCaseTimestampAndId) {
    Job job;
    job.id = "0a1b2c3d";
    job.params.caseId = "2024타경 1/2";
    std::string name = PipelineRunner::outputName(job, WallClock::now());
    EXPECT_EQ(name.rfind("2024타경1_2_", 0), 0u);
    EXPECT_NE(name.find("_0a1b2c3d.mp4"), std::string::npos);

    job.params.mode = JobMode::Document;
    job.params.document = "/uploads/감정평가서.pdf";
    EXPECT_EQ(PipelineRunner::outputName(job, WallClock::now()).rfind("감정평가서_", 0), 0u);
}

TEST(JobJson, TimestampsAreIsoUtcWithMilliseconds) {
    WallClock::time_point t{std::chrono::milliseconds(1700000000123LL)};
    EXPECT_EQ(isoTimestamp(t), "2023-11-14T22:13:20.123Z");

    Job job;
    job.id = "deadbeef";
    job.status = JobStatus::Failed;
    job.error = "Job cancelled";
    nlohmann::json j = toJson(job);
    EXPECT_EQ(j["job_id"], "deadbeef");
    EXPECT_EQ(j["status"], "failed");
    EXPECT_EQ(j["error"], "Job cancelled");
    EXPECT_TRUE(j["video_url"].is_null());
    EXPECT_TRUE(j["current_step"].is_null());
}
