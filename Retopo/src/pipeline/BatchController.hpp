#pragma once

#include "LodPipeline.hpp"
#include "../io/CategoryConfig.hpp"
#include "../io/GlbExporter.hpp"
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace retopo::pipeline {

// 审阅决定
enum class ReviewDecision {
    Approve,
    Skip,
    Redo,
    Quit
};

// 批处理状态机
enum class BatchState {
    Loading,
    Reviewing,
    Approved,
    Skipped,
    Redoing,
    Quit,
    Exhausted
};

[[nodiscard]] std::string_view toString(ReviewDecision decision) noexcept;
[[nodiscard]] std::string_view toString(BatchState state) noexcept;

[[nodiscard]] inline bool isTerminal(BatchState state) noexcept {
    return state == BatchState::Quit || state == BatchState::Exhausted;
}

// 一个分类目录及其模型文件（排序后）
struct CategoryFolder {
    std::string name;
    std::vector<std::filesystem::path> files;
    std::optional<std::string> skeletonReference;   // 目录下存在 skeleton.glb 时记录
};

enum class BatchError {
    RootNotFound,
    NoModels
};

[[nodiscard]] std::string_view toString(BatchError error) noexcept;

// 扫描 root/<category>/*.ply；目录和文件均按名称排序
[[nodiscard]] std::expected<std::vector<CategoryFolder>, BatchError>
discoverCategories(const std::filesystem::path& root);

// 呈现给审阅者的统计信息
struct ReviewStats {
    std::string category;
    std::string modelName;
    size_t attempt{1};
    const PipelineResult* result{nullptr};
};

// 审阅结果；Redo 时可附带新的 LOD 目标或清理策略
struct ReviewOutcome {
    ReviewDecision decision{ReviewDecision::Approve};
    std::optional<std::vector<core::LodSpec>> adjustedSpecs;
    std::optional<core::CleanupPolicy> adjustedPolicy;
};

// 审阅接口
class IReviewer {
public:
    virtual ~IReviewer() = default;

    virtual ReviewOutcome review(const ReviewStats& stats) = 0;
};

// 模型加载接口
class IModelLoader {
public:
    virtual ~IModelLoader() = default;

    virtual std::expected<core::Mesh, std::string> load(const std::filesystem::path& path) const = 0;
};

// PLY 模型加载
class PlyModelLoader : public IModelLoader {
public:
    std::expected<core::Mesh, std::string> load(const std::filesystem::path& path) const override;
};

// 交给导出器的数据
struct ModelExport {
    std::string category;
    std::string modelName;
    std::span<const LodResult> lods;
    std::optional<std::string> skeletonReference;
};

// 导出接口
class IExporter {
public:
    virtual ~IExporter() = default;

    virtual std::expected<std::vector<std::filesystem::path>, std::string> exportModel(const ModelExport& model) = 0;
};

// 写出 <root>/<category>/<model>_<LOD>.glb
class GlbModelExporter : public IExporter {
public:
    explicit GlbModelExporter(std::filesystem::path outputRoot, io::GlbExportConfig config = {})
        : outputRoot_(std::move(outputRoot)), exporter_(std::move(config)) {}

    std::expected<std::vector<std::filesystem::path>, std::string> exportModel(const ModelExport& model) override;

private:
    std::filesystem::path outputRoot_;
    io::GlbExporter exporter_;
};

// 单个模型的最终记录
enum class ModelStatus {
    Exported,
    Skipped,
    Failed
};

[[nodiscard]] std::string_view toString(ModelStatus status) noexcept;

struct ModelRecord {
    std::string category;
    std::string modelName;
    std::filesystem::path source;
    ModelStatus status{ModelStatus::Skipped};
    size_t attempts{0};
    std::vector<std::filesystem::path> exportedFiles;
    std::string reason;
};

// 当前位置与累积结果，只在模型之间变化
struct BatchCursor {
    size_t folderIndex{0};
    size_t fileIndex{0};
    std::vector<ModelRecord> results;
};

struct BatchSummary {
    size_t exported{0};
    size_t skipped{0};
    size_t failed{0};
    bool quit{false};
    std::vector<ModelRecord> records;
};

// 遍历分类目录，逐模型运行管道并驱动审阅状态机
class BatchController {
public:
    using TransitionObserver = std::function<void(BatchState from, BatchState to, const BatchCursor& cursor)>;

    BatchController(std::vector<CategoryFolder> folders,
                    io::CategoryConfig config,
                    LodPipeline pipeline,
                    std::shared_ptr<const IModelLoader> loader,
                    std::shared_ptr<IReviewer> reviewer,
                    std::shared_ptr<IExporter> exporter);

    void setObserver(TransitionObserver observer) { observer_ = std::move(observer); }
    void setProgressCallback(ProgressCallback progress) { progress_ = std::move(progress); }

    // 运行到批处理结束或 Quit
    [[nodiscard]] BatchSummary run();

    BatchState state() const noexcept { return state_; }
    const BatchCursor& cursor() const noexcept { return cursor_; }

private:
    std::vector<CategoryFolder> folders_;
    io::CategoryConfig config_;
    LodPipeline pipeline_;
    std::shared_ptr<const IModelLoader> loader_;
    std::shared_ptr<IReviewer> reviewer_;
    std::shared_ptr<IExporter> exporter_;
    TransitionObserver observer_;
    ProgressCallback progress_;

    BatchState state_{BatchState::Loading};
    BatchCursor cursor_;

    // 当前模型的状态，换模型时清空
    std::optional<PipelineResult> pending_;
    std::optional<std::vector<core::LodSpec>> overrideSpecs_;
    std::optional<core::CleanupPolicy> overridePolicy_;
    size_t attempts_{0};
    bool recorded_{false};

    void transition(BatchState next);
    bool seekFirstModel();
    void advance();
    void record(ModelStatus status, std::string reason, std::vector<std::filesystem::path> files = {});

    const CategoryFolder& currentFolder() const { return folders_[cursor_.folderIndex]; }
    const std::filesystem::path& currentFile() const { return currentFolder().files[cursor_.fileIndex]; }

    void load();
    void reviewCurrent();
    void exportCurrent();
};

} // namespace retopo::pipeline
