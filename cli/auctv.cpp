/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/config.hpp"
#include "auctv/logger.hpp"
#include "auctv/service.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace auctv;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag
static volatile sig_atomic_t g_interrupted = 0;

void signalHandler(int signal) {
    (void)signal;
    g_interrupted = 1;
}

void printUsage(const char* progName) {
    std::cout << "auctv - Auction Listing Video Renderer v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " render <case> [--source mock|json] [--production] [--json]\n";
    std::cout << "       " << progName << " document <file.pdf> [--production] [--json]\n";
    std::cout << "       " << progName << " listings [--source mock|json] [--limit N] [--court C] [--type T] [--region R]\n";
    std::cout << "       " << progName << " template\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Commands:\n";
    std::cout << "  render      Render a narrated video for an auction case\n";
    std::cout << "  document    Render a narrated video from an appraisal PDF\n";
    std::cout << "  listings    List known auction cases\n";
    std::cout << "  template    Print a blank listing record\n\n";
    std::cout << "Options:\n";
    std::cout << "  --source <s>    Listing source: json (data/input) or mock (sample set)\n";
    std::cout << "  --production    Use the language model and network speech when configured\n";
    std::cout << "  --json          Print the final job record as JSON\n";
    std::cout << "  --limit <n>     Maximum listings to print (default 50)\n";
    std::cout << "  --court <c>     Only listings from this court\n";
    std::cout << "  --type <t>      Only listings of this asset type (e.g. APT)\n";
    std::cout << "  --region <r>    Only listings in this region\n";
    std::cout << "  -h, --help      Show this help message\n";
    std::cout << "  -v, --version   Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  AUCTV_HOME         Root for output/, temp/ and data/ (default: .)\n";
    std::cout << "  AUCTV_WORKERS      Render workers (default: 2)\n";
    std::cout << "  AUCTV_MODEL        GGUF model for production scripts\n";
    std::cout << "  AUCTV_MMPROJ       Vision projector for document scripts\n";
    std::cout << "  AUCTV_TTS_CLIENT_ID / AUCTV_TTS_CLIENT_SECRET   Network speech credentials\n";
    std::cout << "  AUCTV_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " render 2024타경12345 --source mock\n";
    std::cout << "  " << progName << " document appraisal.pdf --json\n";
}

struct Options {
    std::string source = "json";
    bool production = false;
    bool json = false;
    std::size_t limit = 50;
    ListingFilter filter;
    std::vector<std::string> positional;
};

bool parseOptions(int argc, char* argv[], int start, Options& out) {
    for (int i = start; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--source" || arg == "-s") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --source requires a value\n";
                return false;
            }
            out.source = argv[++i];
        } else if (arg == "--production") {
            out.production = true;
        } else if (arg == "--json") {
            out.json = true;
        } else if (arg == "--limit") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --limit requires a number\n";
                return false;
            }
            try {
                long n = std::stol(argv[++i]);
                out.limit = n > 0 ? static_cast<std::size_t>(n) : 0;
            } catch (const std::exception&) {
                std::cerr << "Error: invalid --limit\n";
                return false;
            }
        } else if (arg == "--court" || arg == "--type" || arg == "--region") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return false;
            }
            std::string value = argv[++i];
            if (arg == "--court") out.filter.court = value;
            else if (arg == "--type") out.filter.assetType = value;
            else out.filter.region = value;
        } else if (!arg.empty() && arg[0] == '-' && arg.size() > 1) {
            std::cerr << "Error: unknown option " << arg << "\n";
            return false;
        } else {
            out.positional.push_back(arg);
        }
    }
    return true;
}

// Polls until the job is terminal, printing each new step and progress value.
int waitForJob(Service& service, const JobId& id, bool json) {
    int lastProgress = -1;
    std::string lastStep;
    bool cancelRequested = false;

    for (;;) {
        if (g_interrupted && !cancelRequested) {
            cancelRequested = true;
            std::cerr << "\nInterrupted, cancelling " << id << "...\n";
            (void)service.remove(id);
            return 130;
        }

        auto job = service.get(id);
        if (!job) {
            std::cerr << "Error: job " << id << " disappeared\n";
            return 1;
        }

        const std::string step = job->currentStep.value_or("");
        if (!json && (job->progress != lastProgress || step != lastStep)) {
            std::cerr << "\r[" << id << "] " << job->progress << "% " << step << "\033[K" << std::flush;
            lastProgress = job->progress;
            lastStep = step;
        }

        if (job->terminal()) {
            if (!json) {
                std::cerr << "\n";
            }
            if (json) {
                std::cout << toJson(*job).dump(2) << std::endl;
            } else if (job->status == JobStatus::Completed) {
                std::cout << (service.config().outputDir / job->outputRef.value_or("")).string() << std::endl;
            } else {
                std::cerr << "Error: " << job->error.value_or("unknown error") << std::endl;
            }
            return job->status == JobStatus::Completed ? 0 : 1;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

int runRender(Service& service, const Options& options, bool document) {
    if (options.positional.size() != 1) {
        std::cerr << "Error: " << (document ? "document" : "render") << " takes exactly one argument\n";
        return 1;
    }
    if (!service.start()) {
        std::cerr << "Error: failed to start renderer (see log)\n";
        return 1;
    }

    SubmitResult submitted;
    if (document) {
        DocumentRequest request;
        request.path = options.positional[0];
        request.mock = !options.production;
        submitted = service.createDocumentJob(request);
    } else {
        StandardRequest request;
        request.caseId = options.positional[0];
        request.source = options.source;
        request.mock = !options.production;
        submitted = service.createJob(request);
    }

    if (!submitted) {
        std::cerr << "Error: " << submitted.message << " (" << toString(submitted.code) << ")\n";
        return 1;
    }
    int rc = waitForJob(service, submitted.job.id, options.json);
    service.shutdown();
    return rc;
}

int runListings(Service& service, const Options& options) {
    ListingsResult result = service.listings(options.source, options.limit, options.filter);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }
    for (const auto& listing : result.listings) {
        std::cout << listing.caseNumber << "\t" << listing.assetTypeName << "\t" << listing.fullAddress() << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean output; AUCTV_LOG_LEVEL overrides
    if (!Logger::envOverride())
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    Options options;
    if (!parseOptions(argc, argv, 2, options)) {
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        Service service(Config::fromEnv());

        if (command == "render") {
            return runRender(service, options, false);
        }
        if (command == "document") {
            return runRender(service, options, true);
        }
        if (command == "listings") {
            return runListings(service, options);
        }
        if (command == "template") {
            std::cout << service.listingTemplate().dump(2) << std::endl;
            return 0;
        }

        std::cerr << "Error: unknown command '" << command << "'\n\n";
        printUsage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
