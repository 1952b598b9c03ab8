#include "io/CategoryConfig.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <fstream>
#include <set>

namespace retopo::io {

namespace {

using Json = nlohmann::json;

// 可选键：存在时按类型读取，类型不符由 nlohmann 抛出
template<typename T>
void readOptional(const Json& object, const char* key, T& target) {
    if (auto it = object.find(key); it != object.end()) {
        target = it->get<T>();
    }
}

std::expected<std::vector<core::LodSpec>, ConfigError> parseLods(const Json& array) {
    if (!array.is_array() || array.empty()) {
        spdlog::error("config: 'lods' must be a non-empty array");
        return std::unexpected(ConfigError::InvalidValue);
    }

    std::vector<core::LodSpec> lods;
    std::set<std::string> labels;
    for (size_t i = 0; i < array.size(); ++i) {
        const auto& entry = array[i];
        core::LodSpec spec;
        spec.label = entry.value("label", "LOD" + std::to_string(i));
        const auto target = entry.at("targetFaces").get<long long>();
        if (target <= 0) {
            spdlog::error("config: LOD '{}' has non-positive targetFaces {}", spec.label, target);
            return std::unexpected(ConfigError::InvalidValue);
        }
        spec.targetFaceCount = static_cast<size_t>(target);
        if (spec.label.empty() || !labels.insert(spec.label).second) {
            spdlog::error("config: LOD label '{}' is empty or duplicated", spec.label);
            return std::unexpected(ConfigError::InvalidValue);
        }
        lods.push_back(std::move(spec));
    }
    return lods;
}

std::expected<void, ConfigError> applyCleanup(const Json& object, core::CleanupPolicy& policy) {
    if (!object.is_object()) {
        spdlog::error("config: 'cleanup' must be an object");
        return std::unexpected(ConfigError::InvalidValue);
    }
    readOptional(object, "trimUvLayers", policy.trimUvLayers);
    readOptional(object, "trimColorLayers", policy.trimColorLayers);
    readOptional(object, "removeMorphTargets", policy.removeMorphTargets);
    readOptional(object, "removeCustomAttributes", policy.removeCustomAttributes);
    readOptional(object, "maxBuffers", policy.maxBuffers);
    if (policy.maxBuffers == 0) {
        spdlog::error("config: maxBuffers must be at least 1");
        return std::unexpected(ConfigError::InvalidValue);
    }
    return {};
}

// 在 base 之上覆盖 object 中写出的键
std::expected<CategoryProfile, ConfigError> applyProfile(const Json& object, CategoryProfile base) {
    if (!object.is_object()) {
        spdlog::error("config: category profile must be an object");
        return std::unexpected(ConfigError::InvalidValue);
    }
    if (auto it = object.find("lods"); it != object.end()) {
        auto lods = parseLods(*it);
        if (!lods) {
            return std::unexpected(lods.error());
        }
        base.lods = std::move(lods.value());
    }
    if (auto it = object.find("cleanup"); it != object.end()) {
        if (auto applied = applyCleanup(*it, base.cleanup); !applied) {
            return std::unexpected(applied.error());
        }
    }
    return base;
}

std::expected<void, ConfigError> applyRemesher(const Json& object, RemesherSettings& settings) {
    if (!object.is_object()) {
        spdlog::error("config: 'remesher' must be an object");
        return std::unexpected(ConfigError::InvalidValue);
    }
    if (auto it = object.find("toolPath"); it != object.end() && !it->is_null()) {
        settings.toolPath = std::filesystem::path(it->get<std::string>());
    }
    readOptional(object, "creaseAngle", settings.creaseAngle);
    readOptional(object, "smoothIterations", settings.smoothIterations);
    readOptional(object, "deterministic", settings.deterministic);
    readOptional(object, "islandThreshold", settings.islandThreshold);
    readOptional(object, "weldTolerance", settings.weldTolerance);

    long long timeout = settings.timeout.count();
    long long batchTimeout = settings.batchTimeout.count();
    readOptional(object, "timeoutSeconds", timeout);
    readOptional(object, "batchTimeoutSeconds", batchTimeout);
    if (timeout <= 0 || batchTimeout <= 0) {
        spdlog::error("config: remesher timeouts must be positive");
        return std::unexpected(ConfigError::InvalidValue);
    }
    settings.timeout = std::chrono::seconds(timeout);
    settings.batchTimeout = std::chrono::seconds(batchTimeout);

    if (settings.islandThreshold == 0 || settings.smoothIterations < 0 || settings.weldTolerance < 0.0f) {
        spdlog::error("config: invalid remesher settings");
        return std::unexpected(ConfigError::InvalidValue);
    }
    return {};
}

Json profileToJson(const CategoryProfile& profile) {
    Json lods = Json::array();
    for (const auto& spec : profile.lods) {
        lods.push_back({{"label", spec.label}, {"targetFaces", spec.targetFaceCount}});
    }
    return {
        {"lods", lods},
        {"cleanup", {
            {"trimUvLayers", profile.cleanup.trimUvLayers},
            {"trimColorLayers", profile.cleanup.trimColorLayers},
            {"removeMorphTargets", profile.cleanup.removeMorphTargets},
            {"removeCustomAttributes", profile.cleanup.removeCustomAttributes},
            {"maxBuffers", profile.cleanup.maxBuffers}}}};
}

} // namespace

std::string_view toString(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::FileNotFound: return "config file not found";
        case ConfigError::ParseError: return "config file is not valid JSON";
        case ConfigError::InvalidValue: return "config file contains an invalid value";
    }
    return "unknown config error";
}

std::expected<CategoryConfig, ConfigError> CategoryConfig::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        spdlog::error("config: top level must be an object");
        return std::unexpected(ConfigError::InvalidValue);
    }

    CategoryConfig config;
    try {
        if (auto it = json.find("defaults"); it != json.end()) {
            auto defaults = applyProfile(*it, config.defaults_);
            if (!defaults) {
                return std::unexpected(defaults.error());
            }
            config.defaults_ = std::move(defaults.value());
        }

        if (auto it = json.find("categories"); it != json.end()) {
            if (!it->is_object()) {
                spdlog::error("config: 'categories' must be an object");
                return std::unexpected(ConfigError::InvalidValue);
            }
            for (const auto& [name, entry] : it->items()) {
                auto profile = applyProfile(entry, config.defaults_);
                if (!profile) {
                    spdlog::error("config: category '{}' is invalid", name);
                    return std::unexpected(profile.error());
                }
                config.categories_.emplace(name, std::move(profile.value()));
            }
        }

        if (auto it = json.find("remesher"); it != json.end()) {
            if (auto applied = applyRemesher(*it, config.remesher_); !applied) {
                return std::unexpected(applied.error());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("config: {}", e.what());
        return std::unexpected(ConfigError::InvalidValue);
    }

    return config;
}

std::expected<CategoryConfig, ConfigError> CategoryConfig::fromString(std::string_view text) {
    try {
        return fromJson(nlohmann::json::parse(text));
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("config: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<CategoryConfig, ConfigError> CategoryConfig::loadFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FileNotFound);
    }
    try {
        return fromJson(nlohmann::json::parse(file));
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("config: {}: {}", path.string(), e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

const CategoryProfile& CategoryConfig::profileFor(std::string_view category) const {
    if (auto it = categories_.find(category); it != categories_.end()) {
        return it->second;
    }
    return defaults_;
}

bool CategoryConfig::hasCategory(std::string_view category) const {
    return categories_.find(category) != categories_.end();
}

std::vector<std::string> CategoryConfig::categories() const {
    std::vector<std::string> names;
    names.reserve(categories_.size());
    for (const auto& [name, profile] : categories_) {
        names.push_back(name);
    }
    return names;
}

nlohmann::json CategoryConfig::toJson() const {
    Json categories = Json::object();
    for (const auto& [name, profile] : categories_) {
        categories[name] = profileToJson(profile);
    }

    Json remesher{
        {"creaseAngle", remesher_.creaseAngle},
        {"smoothIterations", remesher_.smoothIterations},
        {"deterministic", remesher_.deterministic},
        {"timeoutSeconds", remesher_.timeout.count()},
        {"batchTimeoutSeconds", remesher_.batchTimeout.count()},
        {"islandThreshold", remesher_.islandThreshold},
        {"weldTolerance", remesher_.weldTolerance}};
    remesher["toolPath"] = remesher_.toolPath ? Json(remesher_.toolPath->string()) : Json(nullptr);

    return {{"defaults", profileToJson(defaults_)}, {"categories", categories}, {"remesher", remesher}};
}

std::expected<std::vector<core::LodSpec>, ConfigError> parseLodTargets(std::string_view text) {
    std::vector<core::LodSpec> specs;
    size_t start = 0;
    while (start <= text.size()) {
        const auto end = std::min(text.find(',', start), text.size());
        auto token = text.substr(start, end - start);
        while (!token.empty() && token.front() == ' ') {
            token.remove_prefix(1);
        }
        while (!token.empty() && token.back() == ' ') {
            token.remove_suffix(1);
        }

        size_t value = 0;
        const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size() || value == 0) {
            return std::unexpected(ConfigError::InvalidValue);
        }
        specs.push_back({"LOD" + std::to_string(specs.size()), value});
        start = end + 1;
    }
    return specs;
}

} // namespace retopo::io
