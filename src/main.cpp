#include "config.hpp"
#include "debug.hpp"
#include "library.hpp"
#include "scanner.hpp"
#include "thumbnail_generator.hpp"

#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace MediaOrganizer;

namespace {

CancellationToken g_cancel;

void handleInterrupt(int) {
    g_cancel.cancel();
}

void handlePause(int) {
    g_cancel.pause();
}

void handleResume(int) {
    g_cancel.resume();
}

void printUsage() {
    std::cerr <<
        "Usage: media-organizer [--config FILE] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  scan DIR                        List DIR and read metadata\n"
        "  resume                          Read records left Pending\n"
        "  stage FILE TEMPLATE [--dry-run] Stage a rename, e.g. \"{filename}_{resolution}\"\n"
        "  move FILE DIR [TEMPLATE] [--dry-run]\n"
        "  copy FILE DIR [TEMPLATE] [--dry-run]\n"
        "  delete FILE [--dry-run]\n"
        "  preview                         Show the open draft batch and its estimated duration\n"
        "  summary BATCH                   Counts and sizes of a batch\n"
        "  discard                         Drop the open draft batch\n"
        "  commit                          Apply the open draft batch\n"
        "  undo [BATCH]                    Reverse the last committed batch\n"
        "  show FILE                       Print a file record\n"
        "  stats                           Cache usage\n"
        "  prune [--stale DIR]             Evict cache entries, or drop stale records\n"
        "  purge DIR                       Delete files held for batches that can no longer be undone\n"
        "  thumbnail FILE [OUT.ppm]        Render (or fetch) a thumbnail\n"
        "\n"
        "SIGUSR1 pauses a running commit or undo, SIGUSR2 resumes it.\n";
}

void printResult(const BatchResult& result) {
    for (const auto& op : result.succeeded) {
        std::cout << "  ok      " << operationKindName(op.kind) << " " << op.source.string();
        if (!op.destination.empty()) std::cout << " -> " << op.destination.string();
        std::cout << "\n";
    }
    for (const auto& [op, error] : result.failed) {
        std::cout << "  FAILED  " << operationKindName(op.kind) << " " << op.source.string();
        if (!op.destination.empty()) std::cout << " -> " << op.destination.string();
        std::cout << "  [" << errorKindName(error.kind) << "] " << error.message << "\n";
    }
    std::cout << "Batch " << result.batchId << ": " << result.succeeded.size() << " succeeded, "
              << result.failed.size() << " failed, " << result.bytesCopied << " bytes copied in "
              << std::fixed << std::setprecision(1) << result.duration.count() / 1000.0 << "s\n";
}

void printSummary(const BatchSummary& summary) {
    std::cout << "Batch " << summary.batchId << " [" << batchStateName(summary.state) << "]: "
              << summary.totalOperations << " operations (" << summary.staged << " staged, "
              << summary.applied << " applied, " << summary.failed << " failed), "
              << summary.totalBytes << " bytes to stream";
    if (summary.staged > 0) {
        std::cout << ", about " << std::fixed << std::setprecision(1) << summary.estimatedSeconds << "s remaining";
    }
    std::cout << "\n";
}

void printRecord(const FileRecord& record) {
    std::cout << "[" << scanStateName(record.scanState) << "] " << record.path.string();
    if (record.metadata) {
        const auto& m = *record.metadata;
        std::cout << "  " << m.width << "x" << m.height << " " << m.codec << " " << m.durationLabel();
        if (!m.subtitles.empty()) std::cout << " subs:" << m.subtitles.size();
    }
    std::cout << "\n";
}

void printPreview(const StagePreview& preview) {
    std::cout << operationKindName(preview.kind) << " " << preview.source.string();
    if (!preview.destination.empty()) std::cout << " -> " << preview.destination.string();
    if (preview.noOp) std::cout << "  (no change)";
    if (preview.conflict) {
        std::cout << "  [" << errorKindName(preview.conflict->kind) << "] " << preview.conflict->message;
    }
    std::cout << "\n";
}

bool writePpm(const std::vector<uint8_t>& payload, const std::string& outPath) {
    auto image = ThumbnailGenerator::decode(payload);
    if (!image) return false;

    std::ofstream out(outPath, std::ios::binary);
    if (!out) return false;
    out << "P6\n" << image->width << " " << image->height << "\n255\n";
    for (size_t i = 0; i + 3 < image->pixels.size(); i += 4) {
        out.write(reinterpret_cast<const char*>(&image->pixels[i]), 3);
    }
    return static_cast<bool>(out);
}

int stageCommand(Library& library, OperationKind kind, const std::vector<std::string>& args) {
    bool dryRun = false;
    std::vector<std::string> positional;
    for (const auto& arg : args) {
        if (arg == "--dry-run") {
            dryRun = true;
        } else {
            positional.push_back(arg);
        }
    }

    StageRequest request;
    request.kind = kind;
    request.dryRun = dryRun;

    switch (kind) {
        case OperationKind::Rename:
            if (positional.size() != 2) { printUsage(); return 2; }
            request.nameTemplate = positional[1];
            break;
        case OperationKind::Move:
        case OperationKind::Copy:
            if (positional.size() < 2 || positional.size() > 3) { printUsage(); return 2; }
            request.destinationDir = positional[1];
            if (positional.size() == 3) request.nameTemplate = positional[2];
            break;
        case OperationKind::Delete:
            if (positional.size() != 1) { printUsage(); return 2; }
            break;
    }
    request.record.path = std::filesystem::absolute(positional[0]);

    StageOutcome outcome = library.stage(std::move(request));
    printPreview(outcome.preview);
    if (outcome.operation) {
        std::cout << "Staged as operation " << outcome.operation->id << " in batch "
                  << outcome.operation->batchId << "\n";
    }
    return 0;
}

int run(Library& library, const std::string& command, const std::vector<std::string>& args) {
    if (command == "scan") {
        if (args.size() != 1) { printUsage(); return 2; }
        Scanner& scanner = library.scan(std::filesystem::absolute(args[0]));
        while (auto record = scanner.next()) {
            printRecord(*record);
        }
        ScanSummary summary = scanner.wait();
        std::cout << summary.listed << " listed, " << summary.enriched << " enriched, " << summary.failed
                  << " failed, " << summary.stale << " stale\n";
        return 0;
    }

    if (command == "resume") {
        Scanner& scanner = library.resumePending();
        while (auto record = scanner.next()) {
            printRecord(*record);
        }
        scanner.wait();
        return 0;
    }

    if (command == "stage") return stageCommand(library, OperationKind::Rename, args);
    if (command == "move") return stageCommand(library, OperationKind::Move, args);
    if (command == "copy") return stageCommand(library, OperationKind::Copy, args);
    if (command == "delete") return stageCommand(library, OperationKind::Delete, args);

    if (command == "preview") {
        auto batch = library.activeDraft();
        if (!batch) {
            std::cout << "No draft batch\n";
            return 0;
        }
        std::cout << "Draft batch " << batch->id() << " (" << batch->operations().size() << " operations)\n";
        for (const auto& op : batch->operations()) {
            std::cout << "  " << std::setw(4) << op.id << "  " << operationKindName(op.kind) << " "
                      << op.source.string();
            if (!op.destination.empty()) std::cout << " -> " << op.destination.string();
            std::cout << "\n";
        }
        printSummary(library.summary(batch->id()));
        return 0;
    }

    if (command == "summary") {
        if (args.size() != 1) { printUsage(); return 2; }
        printSummary(library.summary(std::stoll(args[0])));
        return 0;
    }

    if (command == "purge") {
        if (args.size() != 1) { printUsage(); return 2; }
        std::cout << library.purgeHoldingArea(std::filesystem::absolute(args[0])) << " held files removed\n";
        return 0;
    }

    if (command == "discard") {
        std::cout << (library.discardDraft() ? "Draft discarded\n" : "No draft to discard\n");
        return 0;
    }

    if (command == "commit") {
        auto progress = [](uint64_t copied, uint64_t total) {
            std::cerr << "\r  " << (total ? copied * 100 / total : 100) << "%" << std::flush;
        };
        BatchResult result = library.commit(g_cancel, progress);
        printResult(result);
        return result.failed.empty() ? 0 : 3;
    }

    if (command == "undo") {
        BatchResult result = args.empty() ? library.undo(g_cancel)
                                          : library.undo(std::stoll(args[0]), g_cancel);
        printResult(result);
        return result.failed.empty() ? 0 : 3;
    }

    if (command == "show") {
        if (args.size() != 1) { printUsage(); return 2; }
        auto record = library.record(std::filesystem::absolute(args[0]));
        if (!record) {
            std::cerr << "Not in library: " << args[0] << "\n";
            return 1;
        }
        printRecord(*record);
        std::cout << "  size " << record->size << "  fingerprint " << record->fingerprint << "\n";
        if (record->metadata) {
            for (const auto& sub : record->metadata->subtitles) {
                std::cout << "  subtitle #" << sub.index << " " << sub.codec
                          << " " << sub.language.value_or("und");
                if (sub.title) std::cout << " \"" << *sub.title << "\"";
                std::cout << "\n";
            }
        }
        return 0;
    }

    if (command == "stats") {
        CacheStats stats = library.cacheStats();
        std::cout << "Cache: " << stats.entryCount << " entries, " << stats.totalBytes << " of "
                  << library.config().cache.maxSizeBytes << " bytes\n";
        if (auto batch = library.undoableBatch()) {
            std::cout << "Undoable batch: " << *batch << "\n";
        }
        return 0;
    }

    if (command == "prune") {
        if (args.size() == 2 && args[0] == "--stale") {
            std::cout << library.pruneStale(std::filesystem::absolute(args[1])) << " stale records removed\n";
            return 0;
        }
        if (!args.empty()) { printUsage(); return 2; }
        std::cout << library.pruneCache() << " cache entries evicted\n";
        return 0;
    }

    if (command == "thumbnail") {
        if (args.empty() || args.size() > 2) { printUsage(); return 2; }
        CachePayload payload = library.thumbnail(std::filesystem::absolute(args[0]));
        std::cout << "Thumbnail payload: " << payload->size() << " bytes\n";
        if (args.size() == 2 && !writePpm(*payload, args[1])) {
            std::cerr << "Could not write " << args[1] << "\n";
            return 1;
        }
        return 0;
    }

    printUsage();
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    DEBUG_LOG("=== MediaOrganizer starting ===");
    DEBUG_LOG("PID: " << getpid());

    std::filesystem::path configPath = Config::defaultPath();
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        printUsage();
        return args.empty() ? 2 : 0;
    }

    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);
    std::signal(SIGUSR1, handlePause);
    std::signal(SIGUSR2, handleResume);

    try {
        Config config = loadConfig(configPath);
        ThumbnailGenerator generator(config.cache.workDir, config.cache.thumbnailWidth,
                                     config.commit.networkTimeoutSeconds);

        Library library(config);
        library.setThumbnailRenderer([&generator](const FileRecord& record) {
            return generator.generate(record);
        });

        if (!library.open()) {
            std::cerr << "Failed to open library at " << config.databasePath << "\n";
            return 1;
        }

        std::string command = args[0];
        args.erase(args.begin());
        int rc = run(library, command, args);

        library.shutdown();
        DEBUG_LOG("=== MediaOrganizer shutdown complete ===");
        return rc;
    } catch (const MediaError& e) {
        std::cerr << errorKindName(e.kind()) << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        DEBUG_LOG("FATAL EXCEPTION: " << e.what());
        return 1;
    }
}
