#pragma once

#include "../core/AttributeBudget.hpp"
#include "../core/MeshGraph.hpp"
#include "../core/Types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace retopo::io {

enum class ConfigError {
    FileNotFound,
    ParseError,
    InvalidValue
};

[[nodiscard]] std::string_view toString(ConfigError error) noexcept;

// 外部重拓扑与策略相关设置
struct RemesherSettings {
    std::optional<std::filesystem::path> toolPath;
    float creaseAngle{30.0f};
    int smoothIterations{2};
    bool deterministic{false};
    std::chrono::seconds timeout{300};
    std::chrono::seconds batchTimeout{600};
    size_t islandThreshold{50};
    float weldTolerance{core::kDefaultWeldTolerance};
};

// 一个分类的 LOD 目标与清理策略
struct CategoryProfile {
    std::vector<core::LodSpec> lods{core::defaultLodSpecs()};
    core::CleanupPolicy cleanup;
};

// 分类配置：defaults + 按分类覆盖 + remesher 设置
class CategoryConfig {
public:
    CategoryConfig() = default;

    // 从 JSON 构建；分类条目只覆盖它写出的键
    [[nodiscard]] static std::expected<CategoryConfig, ConfigError> fromJson(const nlohmann::json& json);
    [[nodiscard]] static std::expected<CategoryConfig, ConfigError> fromString(std::string_view text);
    [[nodiscard]] static std::expected<CategoryConfig, ConfigError> loadFile(const std::filesystem::path& path);

    const CategoryProfile& defaults() const noexcept { return defaults_; }
    const RemesherSettings& remesher() const noexcept { return remesher_; }
    RemesherSettings& remesher() noexcept { return remesher_; }

    // 未知分类返回 defaults
    [[nodiscard]] const CategoryProfile& profileFor(std::string_view category) const;
    [[nodiscard]] bool hasCategory(std::string_view category) const;
    [[nodiscard]] std::vector<std::string> categories() const;

    // 序列化（--dry-run 打印生效配置）
    [[nodiscard]] nlohmann::json toJson() const;

private:
    CategoryProfile defaults_;
    std::map<std::string, CategoryProfile, std::less<>> categories_;
    RemesherSettings remesher_;
};

// 纯函数：解析 "4000,1500,500" 形式的目标列表，标签按 LOD0.. 生成
[[nodiscard]] std::expected<std::vector<core::LodSpec>, ConfigError> parseLodTargets(std::string_view text);

} // namespace retopo::io
