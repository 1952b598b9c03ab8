#include <catch2/catch_test_macros.hpp>
#include "../src/pipeline/BatchController.hpp"
#include "../src/io/PlyIO.hpp"
#include "TestMeshes.hpp"
#include <algorithm>
#include <deque>
#include <stdexcept>

using namespace retopo;
using namespace retopo::pipeline;
using namespace retopo::test;

namespace {

// 按文件名返回网格；名字里带 "broken" 的返回结构错误的网格，带 "missing" 的加载失败
class FakeLoader : public IModelLoader {
public:
    std::expected<core::Mesh, std::string> load(const std::filesystem::path& path) const override {
        loads.push_back(path.stem().string());
        const auto name = path.stem().string();
        if (name.find("missing") != std::string::npos) {
            return std::unexpected(std::string("file not found"));
        }
        if (name.find("broken") != std::string::npos) {
            return makeGrid(2, 2).withFaces({core::Face{{0, 1, 42}, 0}});
        }
        return makeGrid(10, 10);
    }

    mutable std::vector<std::string> loads;
};

// 按脚本依次给出审阅决定；脚本用完后 Quit
class ScriptedReviewer : public IReviewer {
public:
    explicit ScriptedReviewer(std::deque<ReviewOutcome> script)
        : script_(std::move(script)) {}

    ReviewOutcome review(const ReviewStats& stats) override {
        seen.push_back(stats.modelName + "#" + std::to_string(stats.attempt));
        REQUIRE(stats.result != nullptr);
        if (script_.empty()) {
            return {ReviewDecision::Quit, std::nullopt, std::nullopt};
        }
        auto next = std::move(script_.front());
        script_.pop_front();
        return next;
    }

    std::vector<std::string> seen;

private:
    std::deque<ReviewOutcome> script_;
};

class RecordingExporter : public IExporter {
public:
    std::expected<std::vector<std::filesystem::path>, std::string> exportModel(const ModelExport& model) override {
        std::vector<size_t> targets;
        for (const auto& lod : model.lods) {
            targets.push_back(lod.targetFaceCount);
        }
        exported.push_back({model.category + "/" + model.modelName, targets});
        if (failFor == model.modelName) {
            return std::unexpected(std::string("disk full"));
        }
        return std::vector<std::filesystem::path>{model.modelName + "_LOD0.glb"};
    }

    std::vector<std::pair<std::string, std::vector<size_t>>> exported;
    std::string failFor;
};

class GridQuadRemesher : public core::IQuadRemesher {
public:
    std::string name() const override { return "grid"; }

    std::expected<core::Mesh, std::string> remesh(const core::Mesh&, size_t targetFaces) const override {
        return makeGrid(targetFaces, 1);
    }
};

// 加载时抛异常的加载器
class ThrowingLoader : public IModelLoader {
public:
    std::expected<core::Mesh, std::string> load(const std::filesystem::path&) const override {
        throw std::runtime_error("decoder crashed");
    }
};

ReviewOutcome decide(ReviewDecision decision) {
    return {decision, std::nullopt, std::nullopt};
}

LodPipeline makePipeline() {
    return createPipeline()
        .withQuadRemesher(std::make_shared<GridQuadRemesher>())
        .withLogging(false)
        .build();
}

io::CategoryConfig makeConfig() {
    auto config = io::CategoryConfig::fromString(R"({"defaults": {"lods": [
        {"label": "LOD0", "targetFaces": 80},
        {"label": "LOD1", "targetFaces": 20}]}})");
    REQUIRE(config.has_value());
    return std::move(config.value());
}

std::vector<CategoryFolder> makeFolders(std::vector<std::string> names) {
    CategoryFolder folder;
    folder.name = "props";
    for (const auto& name : names) {
        folder.files.push_back(std::filesystem::path("/models/props") / (name + ".ply"));
    }
    return {folder};
}

} // namespace

TEST_CASE("Batch review sequence", "[batch]") {
    auto loader = std::make_shared<FakeLoader>();
    auto reviewer = std::make_shared<ScriptedReviewer>(std::deque<ReviewOutcome>{
        decide(ReviewDecision::Approve),
        decide(ReviewDecision::Skip),
        decide(ReviewDecision::Redo),
        decide(ReviewDecision::Approve),
        decide(ReviewDecision::Quit)});
    auto exporter = std::make_shared<RecordingExporter>();

    BatchController controller{makeFolders({"m0", "m1", "m2", "m3", "m4"}), makeConfig(), makePipeline(),
                               loader, reviewer, exporter};

    std::vector<std::pair<BatchState, BatchState>> transitions;
    controller.setObserver([&transitions](BatchState from, BatchState to, const BatchCursor&) {
        transitions.emplace_back(from, to);
    });

    auto summary = controller.run();

    SECTION("Models are loaded in order, the redone one twice") {
        REQUIRE(loader->loads == std::vector<std::string>{"m0", "m1", "m2", "m2", "m3"});
        REQUIRE(reviewer->seen == std::vector<std::string>{"m0#1", "m1#1", "m2#1", "m2#2", "m3#1"});
    }

    SECTION("Only approved models are exported") {
        REQUIRE(exporter->exported.size() == 2);
        REQUIRE(exporter->exported[0].first == "props/m0");
        REQUIRE(exporter->exported[1].first == "props/m2");
        REQUIRE(exporter->exported[1].second == std::vector<size_t>{80, 20});
    }

    SECTION("Summary reflects the quit") {
        REQUIRE(summary.quit);
        REQUIRE(controller.state() == BatchState::Quit);
        REQUIRE(summary.exported == 2);
        REQUIRE(summary.skipped == 1);
        REQUIRE(summary.failed == 0);
        REQUIRE(summary.records.size() == 3);
        REQUIRE(summary.records[1].modelName == "m1");
        REQUIRE(summary.records[1].status == ModelStatus::Skipped);
        REQUIRE(summary.records[1].reason == "skipped by reviewer");
        REQUIRE(summary.records[2].attempts == 2);
        REQUIRE(summary.records[2].exportedFiles.size() == 1);
    }

    SECTION("Observer sees every transition") {
        REQUIRE(transitions.front() == std::make_pair(BatchState::Loading, BatchState::Reviewing));
        REQUIRE(transitions.back() == std::make_pair(BatchState::Reviewing, BatchState::Quit));
        const auto redo = std::find(transitions.begin(), transitions.end(),
                                    std::make_pair(BatchState::Reviewing, BatchState::Redoing));
        REQUIRE(redo != transitions.end());
        REQUIRE(*(redo + 1) == std::make_pair(BatchState::Redoing, BatchState::Loading));
    }
}

TEST_CASE("Batch redo with adjusted targets", "[batch]") {
    auto loader = std::make_shared<FakeLoader>();
    ReviewOutcome redo{ReviewDecision::Redo, std::vector<core::LodSpec>{{"LOD0", 7}}, std::nullopt};
    auto reviewer = std::make_shared<ScriptedReviewer>(std::deque<ReviewOutcome>{
        redo, decide(ReviewDecision::Approve), decide(ReviewDecision::Approve)});
    auto exporter = std::make_shared<RecordingExporter>();

    BatchController controller{makeFolders({"a", "b"}), makeConfig(), makePipeline(), loader, reviewer, exporter};
    auto summary = controller.run();

    REQUIRE_FALSE(summary.quit);
    REQUIRE(controller.state() == BatchState::Exhausted);
    REQUIRE(exporter->exported.size() == 2);
    // 调整只作用于当前模型
    REQUIRE(exporter->exported[0].second == std::vector<size_t>{7});
    REQUIRE(exporter->exported[1].second == std::vector<size_t>{80, 20});
}

TEST_CASE("Batch failures do not stop the run", "[batch]") {
    auto loader = std::make_shared<FakeLoader>();
    auto reviewer = std::make_shared<ScriptedReviewer>(std::deque<ReviewOutcome>{
        decide(ReviewDecision::Approve), decide(ReviewDecision::Approve), decide(ReviewDecision::Approve)});
    auto exporter = std::make_shared<RecordingExporter>();
    exporter->failFor = "first";

    BatchController controller{makeFolders({"first", "broken", "missing", "last"}), makeConfig(), makePipeline(),
                               loader, reviewer, exporter};
    auto summary = controller.run();

    SECTION("Malformed and unreadable models are skipped without review") {
        REQUIRE(reviewer->seen == std::vector<std::string>{"first#1", "last#1"});
        REQUIRE(summary.records[1].status == ModelStatus::Skipped);
        REQUIRE(summary.records[1].reason.find("malformed mesh") != std::string::npos);
        REQUIRE(summary.records[2].status == ModelStatus::Skipped);
        REQUIRE(summary.records[2].reason == "load failed: file not found");
    }

    SECTION("Export failure is recorded and the batch continues") {
        REQUIRE(summary.records[0].status == ModelStatus::Failed);
        REQUIRE(summary.records[0].reason == "export failed: disk full");
        REQUIRE(summary.records[3].status == ModelStatus::Exported);
        REQUIRE(summary.failed == 1);
        REQUIRE(summary.skipped == 2);
        REQUIRE(summary.exported == 1);
        REQUIRE_FALSE(summary.quit);
    }
}

TEST_CASE("Batch across categories", "[batch]") {
    auto config = io::CategoryConfig::fromString(R"({"categories": {"characters": {"lods": [
        {"label": "LOD0", "targetFaces": 60}]}}})");
    REQUIRE(config.has_value());

    std::vector<CategoryFolder> folders(3);
    folders[0].name = "characters";
    folders[0].files = {"/models/characters/hero.ply"};
    folders[0].skeletonReference = "skeleton.glb";
    folders[1].name = "empty";
    folders[2].name = "props";
    folders[2].files = {"/models/props/crate.ply"};

    auto loader = std::make_shared<FakeLoader>();
    auto reviewer = std::make_shared<ScriptedReviewer>(std::deque<ReviewOutcome>{
        decide(ReviewDecision::Approve), decide(ReviewDecision::Approve)});
    auto exporter = std::make_shared<RecordingExporter>();

    BatchController controller{folders, config.value(), makePipeline(), loader, reviewer, exporter};
    auto summary = controller.run();

    REQUIRE(summary.exported == 2);
    REQUIRE(exporter->exported[0].first == "characters/hero");
    REQUIRE(exporter->exported[0].second == std::vector<size_t>{60});
    REQUIRE(exporter->exported[1].first == "props/crate");
    REQUIRE(exporter->exported[1].second.size() == 3);
    REQUIRE(summary.records[1].category == "props");
}

TEST_CASE("Batch edge cases", "[batch]") {
    auto loader = std::make_shared<FakeLoader>();

    SECTION("No models") {
        auto reviewer = std::make_shared<ScriptedReviewer>(std::deque<ReviewOutcome>{});
        BatchController controller{{}, io::CategoryConfig{}, makePipeline(), loader, reviewer, nullptr};

        auto summary = controller.run();
        REQUIRE(controller.state() == BatchState::Exhausted);
        REQUIRE(summary.records.empty());
        REQUIRE(loader->loads.empty());
    }

    SECTION("Export disabled") {
        auto reviewer = std::make_shared<ScriptedReviewer>(std::deque<ReviewOutcome>{decide(ReviewDecision::Approve)});
        BatchController controller{makeFolders({"solo"}), makeConfig(), makePipeline(), loader, reviewer, nullptr};

        auto summary = controller.run();
        REQUIRE(summary.exported == 1);
        REQUIRE(summary.records[0].reason == "export disabled");
        REQUIRE(summary.records[0].exportedFiles.empty());
    }

    SECTION("State names") {
        REQUIRE(toString(BatchState::Redoing) == "Redoing");
        REQUIRE(toString(ReviewDecision::Skip) == "skip");
        REQUIRE(isTerminal(BatchState::Quit));
        REQUIRE(isTerminal(BatchState::Exhausted));
        REQUIRE_FALSE(isTerminal(BatchState::Approved));
    }
}

TEST_CASE("Category discovery", "[batch]") {
    TempDir dir;

    SECTION("Folders and files are sorted") {
        dir.write("vehicles/truck.ply", "ply\n");
        dir.write("characters/zombie.ply", "ply\n");
        dir.write("characters/archer.PLY", "ply\n");
        dir.write("characters/notes.txt", "not a model");
        dir.write("characters/skeleton.glb", "glTF");
        dir.write("loose.ply", "ply\n");

        auto folders = discoverCategories(dir.path());
        REQUIRE(folders.has_value());
        REQUIRE(folders->size() == 2);
        REQUIRE((*folders)[0].name == "characters");
        REQUIRE((*folders)[0].files.size() == 2);
        REQUIRE((*folders)[0].files[0].filename() == "archer.PLY");
        REQUIRE((*folders)[0].files[1].filename() == "zombie.ply");
        REQUIRE((*folders)[0].skeletonReference == std::optional<std::string>("skeleton.glb"));
        REQUIRE((*folders)[1].name == "vehicles");
        REQUIRE_FALSE((*folders)[1].skeletonReference.has_value());
    }

    SECTION("No models") {
        std::filesystem::create_directories(dir.path() / "empty");
        REQUIRE(discoverCategories(dir.path()).error() == BatchError::NoModels);
    }

    SECTION("Missing root") {
        REQUIRE(discoverCategories(dir.path() / "absent").error() == BatchError::RootNotFound);
    }
}

TEST_CASE("PLY model loading and GLB model export", "[batch]") {
    TempDir dir;
    const auto source = dir.path() / "in" / "props" / "crate.ply";
    std::filesystem::create_directories(source.parent_path());
    REQUIRE(io::writePly(makeCube(), source).has_value());

    PlyModelLoader loader;
    auto mesh = loader.load(source);
    REQUIRE(mesh.has_value());
    REQUIRE(mesh->faceCount() == 6);
    REQUIRE(loader.load(dir.path() / "nope.ply").error() == "file not found");

    auto pipeline = makePipeline();
    auto result = pipeline.execute(mesh.value());
    REQUIRE(result.has_value());

    GlbModelExporter exporter{dir.path() / "out"};
    auto written = exporter.exportModel(ModelExport{"props", "crate", result->lods, std::string("skeleton.glb")});
    REQUIRE(written.has_value());
    REQUIRE(written->size() == result->lods.size() + 1);
    REQUIRE(std::filesystem::exists(dir.path() / "out" / "props" / "crate_LOD0.glb"));
    REQUIRE(std::filesystem::exists(dir.path() / "out" / "props" / "crate_all_lods.glb"));
}

TEST_CASE("Corrupt model files are skipped", "[batch]") {
    TempDir dir;
    const std::string header =
        "ply\nformat ascii 1.0\nelement vertex 3\nproperty float x\nproperty float y\nproperty float z\n"
        "element face 1\nproperty list uchar int vertex_indices\nproperty int material_index\nend_header\n"
        "0 0 0\n1 0 0\n0 1 0\n";
    dir.write("props/a_huge_count.ply",
              "ply\nformat ascii 1.0\nelement vertex 4000000000000000000\nproperty float x\nproperty float y\n"
              "property float z\nend_header\n0 0 0\n");
    dir.write("props/b_huge_material.ply", header + "3 0 1 2 2000000000\n");
    dir.write("props/c_negative_material.ply", header + "3 0 1 2 -1\n");
    REQUIRE(io::writePly(makeCube(), dir.path() / "props" / "d_good.ply").has_value());

    auto folders = discoverCategories(dir.path());
    REQUIRE(folders.has_value());

    SECTION("Unreadable files are recorded and the batch continues") {
        auto reviewer = std::make_shared<ScriptedReviewer>(std::deque<ReviewOutcome>{decide(ReviewDecision::Approve)});
        BatchController controller{folders.value(), makeConfig(), makePipeline(),
                                   std::make_shared<PlyModelLoader>(), reviewer, nullptr};

        auto summary = controller.run();
        REQUIRE(controller.state() == BatchState::Exhausted);
        REQUIRE(summary.records.size() == 4);
        REQUIRE(summary.skipped == 3);
        REQUIRE(summary.exported == 1);
        for (size_t i = 0; i < 3; ++i) {
            REQUIRE(summary.records[i].status == ModelStatus::Skipped);
            REQUIRE(summary.records[i].reason.rfind("load failed: ", 0) == 0);
        }
        REQUIRE(summary.records[3].modelName == "d_good");
        REQUIRE(reviewer->seen == std::vector<std::string>{"d_good#1"});
    }

    SECTION("Loader exceptions become skips") {
        auto reviewer = std::make_shared<ScriptedReviewer>(std::deque<ReviewOutcome>{});
        BatchController controller{folders.value(), makeConfig(), makePipeline(),
                                   std::make_shared<ThrowingLoader>(), reviewer, nullptr};

        auto summary = controller.run();
        REQUIRE(controller.state() == BatchState::Exhausted);
        REQUIRE(summary.skipped == 4);
        REQUIRE(summary.records[0].reason == "load failed: decoder crashed");
        REQUIRE(reviewer->seen.empty());
    }
}
