#include "../pipeline/BatchController.hpp"
#include "../pipeline/LodPipeline.hpp"
#include "../pipeline/Review.hpp"
#include "../io/CategoryConfig.hpp"
#include "../remesh/ExternalRemesher.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

using namespace retopo;

// 命令行选项结构
struct CommandLineOptions {
    std::string input;
    std::string outputDir;
    std::string configFile;
    std::string category;
    std::string remesherPath;
    std::optional<long long> timeoutSeconds;
    std::optional<size_t> islandThreshold;
    bool autoApprove{false};
    bool keepTemp{false};
    bool deterministic{false};
    bool verbose{false};
    bool quiet{false};
    std::string logFile;
    bool showProgress{true};
    bool dryRun{false};
};

// 解析命令行参数
std::expected<CommandLineOptions, std::string> parseCommandLine(int argc, char* argv[]) {
    try {
        cxxopts::Options options("retopo", "Retopology and asset-budget pipeline for AI-generated meshes");

        options.add_options()
            ("i,input", "Category folder tree (<root>/<category>/*.ply) or a single PLY file", cxxopts::value<std::string>())
            ("o,output", "Output directory", cxxopts::value<std::string>())
            ("c,config", "Category configuration JSON", cxxopts::value<std::string>())
            ("category", "Category for single-model mode (default: parent folder name)", cxxopts::value<std::string>())
            ("remesher", "External remesher executable", cxxopts::value<std::string>())
            ("timeout", "External remesher timeout in seconds", cxxopts::value<long long>())
            ("island-threshold", "Island count at which a mesh is treated as soup", cxxopts::value<size_t>())
            ("auto-approve", "Approve every model without prompting", cxxopts::value<bool>()->default_value("false"))
            ("keep-temp", "Keep remesher temporary files", cxxopts::value<bool>()->default_value("false"))
            ("deterministic", "Run the external remesher in deterministic mode", cxxopts::value<bool>()->default_value("false"))
            ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", "Quiet mode", cxxopts::value<bool>()->default_value("false"))
            ("log-file", "Log file path", cxxopts::value<std::string>())
            ("no-progress", "Disable progress bar", cxxopts::value<bool>()->default_value("false"))
            ("dry-run", "Dry run (validate only)", cxxopts::value<bool>()->default_value("false"))
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            std::exit(0);
        }

        CommandLineOptions opts;

        if (result.count("input")) {
            opts.input = result["input"].as<std::string>();
        } else {
            return std::unexpected("Input is required");
        }

        if (result.count("output")) {
            opts.outputDir = result["output"].as<std::string>();
        } else {
            return std::unexpected("Output directory is required");
        }

        if (result.count("config")) {
            opts.configFile = result["config"].as<std::string>();
        }
        if (result.count("category")) {
            opts.category = result["category"].as<std::string>();
        }
        if (result.count("remesher")) {
            opts.remesherPath = result["remesher"].as<std::string>();
        }
        if (result.count("timeout")) {
            opts.timeoutSeconds = result["timeout"].as<long long>();
            if (*opts.timeoutSeconds <= 0) {
                return std::unexpected("Timeout must be positive");
            }
        }
        if (result.count("island-threshold")) {
            opts.islandThreshold = result["island-threshold"].as<size_t>();
            if (*opts.islandThreshold == 0) {
                return std::unexpected("Island threshold must be at least 1");
            }
        }

        opts.autoApprove = result["auto-approve"].as<bool>();
        opts.keepTemp = result["keep-temp"].as<bool>();
        opts.deterministic = result["deterministic"].as<bool>();
        opts.verbose = result["verbose"].as<bool>();
        opts.quiet = result["quiet"].as<bool>();
        opts.showProgress = !result["no-progress"].as<bool>();
        opts.dryRun = result["dry-run"].as<bool>();

        if (result.count("log-file")) {
            opts.logFile = result["log-file"].as<std::string>();
        }

        return opts;

    } catch (const std::exception& e) {
        return std::unexpected(std::string("Command line parsing error: ") + e.what());
    }
}

// 设置日志系统
void setupLogging(const CommandLineOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;

    if (!opts.quiet) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);
    }

    if (!opts.logFile.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.logFile, true);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("retopo", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

// 进度回调
void progressCallback(double progress, const std::string& message) {
    static auto lastUpdate = std::chrono::steady_clock::now();
    auto now = std::chrono::steady_clock::now();

    // 限制更新频率（每100ms）
    if (std::chrono::duration_cast<std::chrono::milliseconds>(now - lastUpdate).count() < 100
        && progress < 1.0) {
        return;
    }
    lastUpdate = now;

    // 简单的进度条
    const int barWidth = 40;
    int pos = static_cast<int>(barWidth * progress);

    std::cout << "\r[";
    for (int i = 0; i < barWidth; ++i) {
        if (i < pos) std::cout << "=";
        else if (i == pos) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << static_cast<int>(progress * 100.0) << "% " << message;
    std::cout.flush();

    if (progress >= 1.0) {
        std::cout << std::endl;
    }
}

// 加载分类配置，命令行覆盖文件设置
std::expected<io::CategoryConfig, std::string> loadConfig(const CommandLineOptions& opts) {
    io::CategoryConfig config;
    if (!opts.configFile.empty()) {
        auto loaded = io::CategoryConfig::loadFile(opts.configFile);
        if (!loaded) {
            return std::unexpected(opts.configFile + ": " + std::string(io::toString(loaded.error())));
        }
        config = std::move(*loaded);
    }

    auto& remesher = config.remesher();
    if (!opts.remesherPath.empty()) {
        remesher.toolPath = opts.remesherPath;
    }
    if (opts.timeoutSeconds) {
        remesher.timeout = std::chrono::seconds(*opts.timeoutSeconds);
        remesher.batchTimeout = std::chrono::seconds(*opts.timeoutSeconds);
    }
    if (opts.islandThreshold) {
        remesher.islandThreshold = *opts.islandThreshold;
    }
    if (opts.deterministic) {
        remesher.deterministic = true;
    }
    return config;
}

// 构建管道：批处理使用更长的外部工具超时
pipeline::LodPipeline buildPipeline(const io::CategoryConfig& config, const CommandLineOptions& opts, bool batchMode) {
    const auto& settings = config.remesher();

    remesh::ExternalRemesherConfig externalConfig;
    externalConfig.toolPath = settings.toolPath;
    externalConfig.searchLocations = remesh::defaultToolLocations();

    remesh::SelectorConfig selectorConfig;
    selectorConfig.islandThreshold = settings.islandThreshold;
    selectorConfig.graphOptions.weldTolerance = settings.weldTolerance;
    selectorConfig.remesherOptions.timeout = batchMode ? settings.batchTimeout : settings.timeout;
    selectorConfig.remesherOptions.creaseAngleDegrees = settings.creaseAngle;
    selectorConfig.remesherOptions.smoothIterations = settings.smoothIterations;
    selectorConfig.remesherOptions.deterministic = settings.deterministic;
    selectorConfig.remesherOptions.retainTemporaryFiles = opts.keepTemp;

    return pipeline::createPipeline()
        .withLods(config.defaults().lods)
        .withCleanupPolicy(config.defaults().cleanup)
        .withSelectorConfig(selectorConfig)
        .withExternalRemesher(remesh::createExternalRemesher(std::move(externalConfig)))
        .build();
}

// 收集输入：目录按分类扫描，单个文件归入 --category 或其父目录名
std::expected<std::vector<pipeline::CategoryFolder>, std::string> collectInputs(const CommandLineOptions& opts, bool& batchMode) {
    const std::filesystem::path input(opts.input);
    std::error_code ec;

    if (std::filesystem::is_directory(input, ec)) {
        batchMode = true;
        auto folders = pipeline::discoverCategories(input);
        if (!folders) {
            return std::unexpected(opts.input + ": " + std::string(pipeline::toString(folders.error())));
        }
        return std::move(*folders);
    }

    if (!std::filesystem::is_regular_file(input, ec)) {
        return std::unexpected(opts.input + ": input not found");
    }

    batchMode = false;
    pipeline::CategoryFolder folder;
    folder.name = !opts.category.empty() ? opts.category : input.parent_path().filename().string();
    if (folder.name.empty()) {
        folder.name = "default";
    }
    folder.files.push_back(input);
    if (std::filesystem::exists(input.parent_path() / "skeleton.glb", ec)) {
        folder.skeletonReference = "skeleton.glb";
    }
    return std::vector<pipeline::CategoryFolder>{std::move(folder)};
}

// 显示结果摘要
void showResultSummary(const pipeline::BatchSummary& summary) {
    spdlog::info("=== Retopology Batch Complete ===");
    spdlog::info("Exported: {}", summary.exported);
    spdlog::info("Skipped: {}", summary.skipped);
    spdlog::info("Failed: {}", summary.failed);
    if (summary.quit) {
        spdlog::info("Batch stopped by user");
    }

    for (const auto& record : summary.records) {
        spdlog::info("  [{}] {}: {}{}", record.category, record.modelName, pipeline::toString(record.status),
                     record.reason.empty() ? "" : " (" + record.reason + ")");
        for (const auto& file : record.exportedFiles) {
            spdlog::info("    - {}", file.string());
        }
    }
}

int main(int argc, char* argv[]) {
    try {
        // 解析命令行
        auto optsResult = parseCommandLine(argc, argv);
        if (!optsResult) {
            std::cerr << "Error: " << optsResult.error() << std::endl;
            return 1;
        }
        const auto opts = *optsResult;

        // 设置日志
        setupLogging(opts);

        spdlog::info("Retopo v0.1.0");
        spdlog::info("Input: {}", opts.input);
        spdlog::info("Output: {}", opts.outputDir);

        auto config = loadConfig(opts);
        if (!config) {
            spdlog::error("Configuration error: {}", config.error());
            return 1;
        }

        bool batchMode = false;
        auto folders = collectInputs(opts, batchMode);
        if (!folders) {
            spdlog::error("Input error: {}", folders.error());
            return 1;
        }

        // 验证配置
        for (const auto& folder : *folders) {
            const auto& profile = config->profileFor(folder.name);
            auto validation = pipeline::validateConfig({profile.lods, profile.cleanup});
            if (!validation) {
                spdlog::error("Configuration validation failed for category '{}'", folder.name);
                return 1;
            }
        }

        size_t modelCount = 0;
        for (const auto& folder : *folders) {
            modelCount += folder.files.size();
            spdlog::info("Category {}: {} models", folder.name, folder.files.size());
        }
        spdlog::info("Mode: {}, {} models", batchMode ? "batch" : "single model", modelCount);

        if (opts.dryRun) {
            spdlog::info("Effective configuration:\n{}", config->toJson().dump(2));
            spdlog::info("Dry run completed successfully");
            return 0;
        }

        std::shared_ptr<pipeline::IReviewer> reviewer;
        if (opts.autoApprove) {
            reviewer = std::make_shared<pipeline::AutoApproveReviewer>();
        } else {
            reviewer = std::make_shared<pipeline::ConsoleReviewer>(std::cin, std::cout);
        }

        pipeline::BatchController controller(std::move(*folders),
                                             *config,
                                             buildPipeline(*config, opts, batchMode),
                                             std::make_shared<pipeline::PlyModelLoader>(),
                                             std::move(reviewer),
                                             std::make_shared<pipeline::GlbModelExporter>(opts.outputDir));
        if (opts.showProgress && !opts.quiet) {
            controller.setProgressCallback(progressCallback);
        }

        spdlog::info("Starting retopology...");
        const auto summary = controller.run();

        // 显示结果
        showResultSummary(summary);

        return summary.failed == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
