#include "pipeline/BatchController.hpp"
#include "io/PlyIO.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace retopo::pipeline {

namespace {

bool hasPlyExtension(const std::filesystem::path& path) {
    auto extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension == ".ply";
}

} // namespace

std::string_view toString(ReviewDecision decision) noexcept {
    switch (decision) {
        case ReviewDecision::Approve: return "approve";
        case ReviewDecision::Skip: return "skip";
        case ReviewDecision::Redo: return "redo";
        case ReviewDecision::Quit: return "quit";
    }
    return "unknown";
}

std::string_view toString(BatchState state) noexcept {
    switch (state) {
        case BatchState::Loading: return "Loading";
        case BatchState::Reviewing: return "Reviewing";
        case BatchState::Approved: return "Approved";
        case BatchState::Skipped: return "Skipped";
        case BatchState::Redoing: return "Redoing";
        case BatchState::Quit: return "Quit";
        case BatchState::Exhausted: return "Exhausted";
    }
    return "Unknown";
}

std::string_view toString(BatchError error) noexcept {
    switch (error) {
        case BatchError::RootNotFound: return "input folder not found";
        case BatchError::NoModels: return "no .ply models found";
    }
    return "unknown batch error";
}

std::string_view toString(ModelStatus status) noexcept {
    switch (status) {
        case ModelStatus::Exported: return "exported";
        case ModelStatus::Skipped: return "skipped";
        case ModelStatus::Failed: return "failed";
    }
    return "unknown";
}

std::expected<std::vector<CategoryFolder>, BatchError>
discoverCategories(const std::filesystem::path& root) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return std::unexpected(BatchError::RootNotFound);
    }

    std::vector<std::filesystem::path> directories;
    for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
        if (entry.is_directory(ec)) {
            directories.push_back(entry.path());
        }
    }
    if (ec) {
        return std::unexpected(BatchError::RootNotFound);
    }
    std::sort(directories.begin(), directories.end());

    std::vector<CategoryFolder> folders;
    size_t total = 0;
    for (const auto& directory : directories) {
        CategoryFolder folder;
        folder.name = directory.filename().string();
        for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
            if (entry.is_regular_file(ec) && hasPlyExtension(entry.path())) {
                folder.files.push_back(entry.path());
            }
        }
        std::sort(folder.files.begin(), folder.files.end());
        if (std::filesystem::exists(directory / "skeleton.glb", ec)) {
            folder.skeletonReference = "skeleton.glb";
        }
        total += folder.files.size();
        folders.push_back(std::move(folder));
    }

    if (total == 0) {
        return std::unexpected(BatchError::NoModels);
    }
    return folders;
}

std::expected<core::Mesh, std::string> PlyModelLoader::load(const std::filesystem::path& path) const {
    io::StandardPlyReader reader;
    auto mesh = reader.readPly(path);
    if (!mesh) {
        return std::unexpected(std::string(io::toString(mesh.error())));
    }
    return std::move(mesh.value());
}

std::expected<std::vector<std::filesystem::path>, std::string>
GlbModelExporter::exportModel(const ModelExport& model) {
    std::vector<io::NamedMesh> meshes;
    meshes.reserve(model.lods.size());
    for (const auto& lod : model.lods) {
        meshes.push_back({lod.label, lod.mesh});
    }

    auto written = exporter_.exportModel(outputRoot_ / model.category, model.modelName, meshes, model.skeletonReference);
    if (!written) {
        return std::unexpected(std::string(io::toString(written.error())));
    }
    return std::move(written.value());
}

BatchController::BatchController(std::vector<CategoryFolder> folders,
                                 io::CategoryConfig config,
                                 LodPipeline pipeline,
                                 std::shared_ptr<const IModelLoader> loader,
                                 std::shared_ptr<IReviewer> reviewer,
                                 std::shared_ptr<IExporter> exporter)
    : folders_(std::move(folders)),
      config_(std::move(config)),
      pipeline_(std::move(pipeline)),
      loader_(std::move(loader)),
      reviewer_(std::move(reviewer)),
      exporter_(std::move(exporter)) {}

void BatchController::transition(BatchState next) {
    const auto from = state_;
    state_ = next;
    spdlog::debug("batch: {} -> {}", toString(from), toString(next));
    if (observer_) {
        observer_(from, next, cursor_);
    }
}

bool BatchController::seekFirstModel() {
    cursor_.fileIndex = 0;
    for (cursor_.folderIndex = 0; cursor_.folderIndex < folders_.size(); ++cursor_.folderIndex) {
        if (!folders_[cursor_.folderIndex].files.empty()) {
            return true;
        }
    }
    return false;
}

void BatchController::advance() {
    pending_.reset();
    overrideSpecs_.reset();
    overridePolicy_.reset();
    attempts_ = 0;
    recorded_ = false;

    ++cursor_.fileIndex;
    while (cursor_.folderIndex < folders_.size() && cursor_.fileIndex >= folders_[cursor_.folderIndex].files.size()) {
        ++cursor_.folderIndex;
        cursor_.fileIndex = 0;
    }

    transition(cursor_.folderIndex < folders_.size() ? BatchState::Loading : BatchState::Exhausted);
}

void BatchController::record(ModelStatus status, std::string reason, std::vector<std::filesystem::path> files) {
    ModelRecord entry;
    entry.category = currentFolder().name;
    entry.modelName = currentFile().stem().string();
    entry.source = currentFile();
    entry.status = status;
    entry.attempts = attempts_;
    entry.exportedFiles = std::move(files);
    entry.reason = std::move(reason);
    cursor_.results.push_back(std::move(entry));
    recorded_ = true;
}

void BatchController::load() {
    ++attempts_;
    const auto& folder = currentFolder();
    const auto& path = currentFile();
    const auto modelName = path.stem().string();

    spdlog::info("[{}] {} (attempt {})", folder.name, modelName, attempts_);

    std::expected<core::Mesh, std::string> mesh;
    try {
        mesh = loader_->load(path);
    } catch (const std::exception& e) {
        mesh = std::unexpected(std::string(e.what()));
    }
    if (!mesh) {
        spdlog::warn("[{}] {}: load failed ({}), skipping", folder.name, modelName, mesh.error());
        record(ModelStatus::Skipped, "load failed: " + mesh.error());
        transition(BatchState::Skipped);
        return;
    }

    const auto& profile = config_.profileFor(folder.name);
    auto pipelineConfig = pipeline_.config();
    pipelineConfig.lods = overrideSpecs_.value_or(profile.lods);
    pipelineConfig.cleanup = overridePolicy_.value_or(profile.cleanup);
    pipeline_.updateConfig(std::move(pipelineConfig));

    std::expected<PipelineResult, PipelineFailure> result;
    try {
        result = pipeline_.execute(mesh.value(), progress_);
    } catch (const std::exception& e) {
        result = std::unexpected(PipelineFailure{PipelineError::SelectionFailed, std::string("internal error: ") + e.what()});
    }
    if (!result) {
        const auto reason = std::string(toString(result.error().error)) + ": " + result.error().message;
        spdlog::warn("[{}] {}: {}, skipping", folder.name, modelName, reason);
        record(ModelStatus::Skipped, reason);
        transition(BatchState::Skipped);
        return;
    }

    pending_ = std::move(result.value());
    transition(BatchState::Reviewing);
}

void BatchController::reviewCurrent() {
    ReviewStats stats;
    stats.category = currentFolder().name;
    stats.modelName = currentFile().stem().string();
    stats.attempt = attempts_;
    stats.result = &pending_.value();

    const auto outcome = reviewer_->review(stats);
    spdlog::debug("[{}] {}: {}", stats.category, stats.modelName, toString(outcome.decision));

    switch (outcome.decision) {
        case ReviewDecision::Approve:
            transition(BatchState::Approved);
            break;
        case ReviewDecision::Skip:
            transition(BatchState::Skipped);
            break;
        case ReviewDecision::Redo:
            if (outcome.adjustedSpecs) {
                overrideSpecs_ = outcome.adjustedSpecs;
            }
            if (outcome.adjustedPolicy) {
                overridePolicy_ = outcome.adjustedPolicy;
            }
            transition(BatchState::Redoing);
            break;
        case ReviewDecision::Quit:
            transition(BatchState::Quit);
            break;
    }
}

void BatchController::exportCurrent() {
    const auto& folder = currentFolder();
    const auto modelName = currentFile().stem().string();

    if (!exporter_) {
        record(ModelStatus::Exported, "export disabled");
        return;
    }

    ModelExport model{folder.name, modelName, pending_->lods, folder.skeletonReference};
    std::expected<std::vector<std::filesystem::path>, std::string> written;
    try {
        written = exporter_->exportModel(model);
    } catch (const std::exception& e) {
        written = std::unexpected(std::string(e.what()));
    }

    if (!written) {
        spdlog::error("[{}] {}: export failed: {}", folder.name, modelName, written.error());
        record(ModelStatus::Failed, "export failed: " + written.error());
        return;
    }

    spdlog::info("[{}] {}: exported {} files", folder.name, modelName, written->size());
    record(ModelStatus::Exported, {}, std::move(written.value()));
}

BatchSummary BatchController::run() {
    cursor_ = BatchCursor{};
    pending_.reset();
    overrideSpecs_.reset();
    overridePolicy_.reset();
    attempts_ = 0;
    recorded_ = false;
    state_ = BatchState::Loading;

    if (!seekFirstModel()) {
        transition(BatchState::Exhausted);
    }

    while (!isTerminal(state_)) {
        switch (state_) {
            case BatchState::Loading:
                load();
                break;
            case BatchState::Reviewing:
                reviewCurrent();
                break;
            case BatchState::Approved:
                exportCurrent();
                advance();
                break;
            case BatchState::Skipped:
                if (!recorded_) {
                    record(ModelStatus::Skipped, "skipped by reviewer");
                }
                advance();
                break;
            case BatchState::Redoing:
                pending_.reset();
                transition(BatchState::Loading);
                break;
            case BatchState::Quit:
            case BatchState::Exhausted:
                break;
        }
    }

    BatchSummary summary;
    summary.quit = state_ == BatchState::Quit;
    summary.records = cursor_.results;
    for (const auto& entry : summary.records) {
        switch (entry.status) {
            case ModelStatus::Exported: ++summary.exported; break;
            case ModelStatus::Skipped: ++summary.skipped; break;
            case ModelStatus::Failed: ++summary.failed; break;
        }
    }
    return summary;
}

} // namespace retopo::pipeline
