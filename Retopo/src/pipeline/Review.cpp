#include "pipeline/Review.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <istream>
#include <ostream>

namespace retopo::pipeline {

namespace {

std::string trimmed(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

std::string formatReviewStats(const ReviewStats& stats) {
    std::string text = fmt::format("=== {}/{} (attempt {}) ===\n", stats.category, stats.modelName, stats.attempt);
    if (!stats.result) {
        return text;
    }

    const auto& result = *stats.result;
    text += fmt::format("  Original: {} faces, {} vertices, {} islands (largest {} faces)\n",
                        result.sourceStats.faceCount, result.sourceStats.vertexCount,
                        result.sourceIslands.islandCount, result.sourceIslands.largestIslandFaceCount);

    for (const auto& lod : result.lods) {
        text += fmt::format("  {:<6} {:>7} faces (target {:>6})  {:<12} {} buffers{}\n",
                            lod.label, lod.faceCount, lod.targetFaceCount,
                            remesh::toString(lod.strategyUsed), lod.budget.bufferCount,
                            lod.budget.overLimit ? "  OVER LIMIT" : "");
    }

    for (const auto& warning : result.warnings()) {
        text += "  warning: " + warning + "\n";
    }

    text += fmt::format("  Processing time: {}ms\n", result.processingTime.count());
    return text;
}

std::optional<std::vector<core::LodSpec>> ConsoleReviewer::promptTargets() {
    while (true) {
        output_ << "New face targets (e.g. 4000,1500,500; empty keeps current): " << std::flush;
        std::string line;
        if (!std::getline(input_, line)) {
            return std::nullopt;
        }
        line = trimmed(line);
        if (line.empty()) {
            return std::nullopt;
        }
        auto specs = io::parseLodTargets(line);
        if (specs) {
            return std::move(specs.value());
        }
        output_ << "Invalid targets: " << line << "\n";
    }
}

ReviewOutcome ConsoleReviewer::review(const ReviewStats& stats) {
    output_ << formatReviewStats(stats);

    while (true) {
        output_ << "[a]pprove / [s]kip / [r]edo / [q]uit: " << std::flush;
        std::string line;
        if (!std::getline(input_, line)) {
            spdlog::warn("review input closed, quitting batch");
            return {ReviewDecision::Quit, std::nullopt, std::nullopt};
        }

        line = trimmed(line);
        const char choice = line.empty() ? '\0' : static_cast<char>(std::tolower(static_cast<unsigned char>(line.front())));
        switch (choice) {
            case 'a':
                return {ReviewDecision::Approve, std::nullopt, std::nullopt};
            case 's':
                return {ReviewDecision::Skip, std::nullopt, std::nullopt};
            case 'r':
                return {ReviewDecision::Redo, promptTargets(), std::nullopt};
            case 'q':
                return {ReviewDecision::Quit, std::nullopt, std::nullopt};
            default:
                output_ << "Unrecognized choice: " << line << "\n";
                break;
        }
    }
}

ReviewOutcome AutoApproveReviewer::review(const ReviewStats& stats) {
    spdlog::info("{}", formatReviewStats(stats));
    return {ReviewDecision::Approve, std::nullopt, std::nullopt};
}

} // namespace retopo::pipeline
