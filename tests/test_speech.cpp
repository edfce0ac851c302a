/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/speech.hpp"
#include "auctv/wav.hpp"
#include "test_support.hpp"
#include <algorithm>

using namespace auctv;
using auctv::testing::TempDirTest;
using auctv::testing::readFile;
using auctv::testing::writeScript;

namespace {

std::string repeat(const std::string& unit, int n) {
    std::string out;
    for (int i = 0; i < n; ++i) out += unit;
    return out;
}

}

TEST(SilentSpeechDuration, FollowsSpeakingRate) {
    // 35 syllables at 350 per minute
    EXPECT_DOUBLE_EQ(SilentSpeech::durationFor(repeat("가", 35)), 6.0);
    EXPECT_DOUBLE_EQ(SilentSpeech::durationFor(repeat("가 ", 35)), 6.0);
    EXPECT_DOUBLE_EQ(SilentSpeech::durationFor(repeat("가", 7)), 1.2);
}

TEST(SilentSpeechDuration, ClampedToBounds) {
    EXPECT_DOUBLE_EQ(SilentSpeech::durationFor(""), SilentSpeech::kMinSeconds);
    EXPECT_DOUBLE_EQ(SilentSpeech::durationFor("네"), SilentSpeech::kMinSeconds);
    EXPECT_DOUBLE_EQ(SilentSpeech::durationFor(repeat("가", 10000)), SilentSpeech::kMaxSeconds);
}

TEST(SilentSpeechDuration, RoundedToMilliseconds) {
    // 11 * 60 / 350 = 1.885714...
    EXPECT_DOUBLE_EQ(SilentSpeech::durationFor(repeat("가", 11)), 1.886);
}

TEST(ContentHash, StableFnv1a) {
    EXPECT_EQ(contentHash(""), "cbf29ce484222325");
    EXPECT_EQ(contentHash("a"), "af63dc4c8601ec8c");
    EXPECT_NE(contentHash("nara|0|안녕"), contentHash("nara|1|안녕"));
}

class SpeechTest : public TempDirTest {};

TEST_F(SpeechTest, SilentTrackMatchesReportedDuration) {
    SilentSpeech speech;
    auto out = root_ / "scene.wav";
    SpeechResult result = speech.synthesize(repeat("가", 35), "nara", out, Deadline());

    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(result.audio, out);
    EXPECT_DOUBLE_EQ(result.seconds, 6.0);

    auto info = probeWav(out);
    ASSERT_TRUE(info);
    EXPECT_EQ(info->channels, 1);
    EXPECT_EQ(info->bitsPerSample, 16);
    EXPECT_NEAR(info->seconds(), 6.0, 1e-6);
}

TEST_F(SpeechTest, SilentTrackIsDeterministic) {
    SilentSpeech speech;
    SpeechResult a = speech.synthesize("동일한 문장입니다", "nara", root_ / "a.wav", Deadline());
    SpeechResult b = speech.synthesize("동일한 문장입니다", "nara", root_ / "b.wav", Deadline());
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_DOUBLE_EQ(a.seconds, b.seconds);
    EXPECT_EQ(readFile(root_ / "a.wav"), readFile(root_ / "b.wav"));
}

TEST_F(SpeechTest, ProbeHandlesStreamingDataSize) {
    auto out = root_ / "stream.wav";
    ASSERT_TRUE(writeSilentWav(out, 2.0));
    std::string bytes = readFile(out);
    ASSERT_GE(bytes.size(), 44u);
    // Streaming encoders leave the data chunk size unset
    bytes[40] = bytes[41] = bytes[42] = bytes[43] = static_cast<char>(0xFF);
    auctv::testing::writeFile(out, bytes);

    auto info = probeWav(out);
    ASSERT_TRUE(info);
    EXPECT_NEAR(info->seconds(), 2.0, 1e-6);
}

TEST_F(SpeechTest, ProbeRejectsNonWav) {
    auctv::testing::writeFile(root_ / "x.wav", "{\"error\":\"bad request\"}");
    EXPECT_FALSE(probeWav(root_ / "x.wav"));
    EXPECT_FALSE(probeWav(root_ / "missing.wav"));
}

class NetworkSpeechTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        fixture_ = root_ / "fixture.wav";
        ASSERT_TRUE(writeSilentWav(fixture_, 3.0));
        calls_ = root_ / "calls.txt";
        args_ = root_ / "args.txt";
        settings_.endpoint = "https://tts.invalid/v1/tts";
        settings_.clientId = "client-id";
        settings_.clientSecret = "s3cr3t-value";
    }

    // curl stand-in: counts calls, records its arguments, copies the fixture
    // to -o and prints the status line curl's -w would.
    void fakeCurl(const std::string& status, int exitCode = 0) {
        settings_.curlPath = writeScript(root_ / "bin" / "curl",
            "echo call >> '" + calls_.string() + "'\n"
            "printf '%s ' \"$@\" >> '" + args_.string() + "'\n"
            "out=''\n"
            "while [ $# -gt 0 ]; do\n"
            "  if [ \"$1\" = \"-o\" ]; then out=\"$2\"; shift; fi\n"
            "  shift\n"
            "done\n"
            "cp '" + fixture_.string() + "' \"$out\"\n"
            "printf '\\nHTTP_STATUS:" + status + "\\n'\n"
            "exit " + std::to_string(exitCode) + "\n").string();
    }

    std::size_t callCount() const {
        std::string text = readFile(calls_);
        return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
    }

    std::filesystem::path fixture_;
    std::filesystem::path calls_;
    std::filesystem::path args_;
    TtsSettings settings_;
};

TEST_F(NetworkSpeechTest, ReadsDurationFromResponseAndCaches) {
    fakeCurl("200");
    NetworkSpeech speech(settings_, root_ / "cache");

    SpeechResult first = speech.synthesize("안녕하세요", "nara", root_ / "one.wav", Deadline(std::chrono::seconds(30)));
    ASSERT_TRUE(first) << first.message;
    EXPECT_NEAR(first.seconds, 3.0, 1e-6);
    EXPECT_EQ(callCount(), 1u);

    SpeechResult second = speech.synthesize("안녕하세요", "nara", root_ / "two.wav", Deadline(std::chrono::seconds(30)));
    ASSERT_TRUE(second);
    EXPECT_EQ(callCount(), 1u);
    EXPECT_TRUE(std::filesystem::exists(root_ / "two.wav"));

    SpeechResult other = speech.synthesize("다른 문장", "nara", root_ / "three.wav", Deadline(std::chrono::seconds(30)));
    ASSERT_TRUE(other);
    EXPECT_EQ(callCount(), 2u);
}

TEST_F(NetworkSpeechTest, CredentialsStayOffTheCommandLine) {
    fakeCurl("200");
    settings_.cache = false;
    NetworkSpeech speech(settings_, root_ / "cache");
    ASSERT_TRUE(speech.synthesize("안녕하세요", "nara", root_ / "one.wav", Deadline(std::chrono::seconds(30))));

    std::string args = readFile(args_);
    EXPECT_EQ(args.find("s3cr3t-value"), std::string::npos);
    EXPECT_NE(args.find("speaker=nara"), std::string::npos);
    EXPECT_NE(args.find("format=wav"), std::string::npos);
    // Header file is scratch only
    EXPECT_FALSE(std::filesystem::exists(root_ / "one.wav.headers"));
}

TEST_F(NetworkSpeechTest, HttpErrorIsExternalServiceFailure) {
    fakeCurl("401");
    NetworkSpeech speech(settings_, root_ / "cache");
    SpeechResult result = speech.synthesize("안녕하세요", "nara", root_ / "one.wav", Deadline(std::chrono::seconds(30)));

    EXPECT_FALSE(result);
    EXPECT_EQ(result.code, ErrorCode::ExternalService);
    EXPECT_EQ(result.message, "Speech synthesis failed");
    EXPECT_FALSE(std::filesystem::exists(root_ / "one.wav"));
    EXPECT_EQ(callCount(), 1u);
}

TEST_F(NetworkSpeechTest, TransportTimeoutIsRetriedOnce) {
    fakeCurl("000", 28);
    NetworkSpeech speech(settings_, root_ / "cache");
    SpeechResult result = speech.synthesize("안녕하세요", "nara", root_ / "one.wav", Deadline(std::chrono::seconds(30)));

    EXPECT_FALSE(result);
    EXPECT_EQ(result.code, ErrorCode::ExternalService);
    EXPECT_EQ(result.message, "Speech synthesis timed out");
    EXPECT_EQ(callCount(), 2u);
}

TEST_F(NetworkSpeechTest, CancelledBeforeRequest) {
    fakeCurl("200");
    NetworkSpeech speech(settings_, root_ / "cache");
    std::atomic<bool> cancel{true};
    SpeechResult result = speech.synthesize("안녕하세요", "nara", root_ / "one.wav", Deadline::unbounded(&cancel));

    EXPECT_EQ(result.code, ErrorCode::Cancelled);
    EXPECT_EQ(callCount(), 0u);
}

TEST_F(NetworkSpeechTest, CacheKeepsOnlyNewestResponses) {
    fakeCurl("200");
    settings_.cacheKeep = 1;
    NetworkSpeech speech(settings_, root_ / "cache");

    ASSERT_TRUE(speech.synthesize("첫 번째 문장", "nara", root_ / "one.wav", Deadline(std::chrono::seconds(30))));
    ASSERT_TRUE(speech.synthesize("두 번째 문장", "nara", root_ / "two.wav", Deadline(std::chrono::seconds(30))));
    EXPECT_EQ(auctv::testing::countFiles(root_ / "cache"), 1u);
    EXPECT_EQ(callCount(), 2u);
}

TEST_F(SpeechTest, PruneCacheDeletesOldestFiles) {
    const auto dir = root_ / "cache";
    const auto now = std::filesystem::file_time_type::clock::now();
    for (int i = 0; i < 5; ++i) {
        auto file = dir / ("entry_" + std::to_string(i) + ".wav");
        auctv::testing::writeFile(file, "x");
        std::filesystem::last_write_time(file, now - std::chrono::hours(5 - i));
    }

    EXPECT_EQ(pruneCache(dir, 2), 3u);
    EXPECT_EQ(auctv::testing::countFiles(dir), 2u);
    EXPECT_TRUE(std::filesystem::exists(dir / "entry_3.wav"));
    EXPECT_TRUE(std::filesystem::exists(dir / "entry_4.wav"));
    EXPECT_EQ(pruneCache(dir, 2), 0u);
    EXPECT_EQ(pruneCache(root_ / "missing", 2), 0u);
}
