#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "models/model_scanner.h"

using namespace loradeck;
namespace fs = std::filesystem;

class TempLoraDir {
public:
    TempLoraDir() {
        base = fs::temp_directory_path() / fs::path("model-scanner-XXXXXX");
        std::string tmpl = base.string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* created = mkdtemp(buf.data());
        base = created ? fs::path(created) : fs::temp_directory_path();
    }
    ~TempLoraDir() {
        std::error_code ec;
        fs::remove_all(base, ec);
    }
    fs::path base;
};

static void create_file(const fs::path& path) {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << "dummy";
}

static std::vector<std::string> file_names(const std::vector<CardSeed>& seeds) {
    std::vector<std::string> names;
    for (const auto& seed : seeds) names.push_back(seed.model.safetensor_file_name);
    return names;
}

TEST(ModelScannerTest, FindsModelFilesSortedByRelativePath) {
    TempLoraDir tmp;
    auto root = tmp.base / "loras";
    create_file(root / "wan" / "b_low.safetensors");
    create_file(root / "wan" / "a_high.safetensors");
    create_file(root / "root_level.pt");
    create_file(root / "notes.txt");
    create_file(root / "wan" / "a_high.civitai.info");

    ModelScanner scanner;
    auto seeds = scanner.scan(root.string());
    EXPECT_EQ(file_names(seeds), (std::vector<std::string>{"root_level", "a_high", "b_low"}));
}

TEST(ModelScannerTest, BuildsTreePathUnderRootName) {
    TempLoraDir tmp;
    auto root = tmp.base / "loras";
    create_file(root / "wan" / "characters" / "alpha_high.safetensors");
    create_file(root / "top.safetensors");

    ModelScanner scanner;
    auto seeds = scanner.scan(root.string());
    ASSERT_EQ(seeds.size(), 2u);

    const auto& top = seeds[0];
    EXPECT_EQ(top.model.safetensor_file_name, "top");
    EXPECT_EQ(top.tree_segments, (std::vector<std::string>{"loras"}));
    EXPECT_EQ(top.tree_path, "loras");

    const auto& nested = seeds[1];
    EXPECT_EQ(nested.model.safetensor_file_name, "alpha_high");
    EXPECT_EQ(nested.source_path, root.string());
    ASSERT_TRUE(nested.folder_path.has_value());
    EXPECT_EQ(*nested.folder_path, (root / "wan" / "characters").string());
    EXPECT_EQ(nested.tree_segments, (std::vector<std::string>{"loras", "wan", "characters"}));
    EXPECT_EQ(nested.tree_path, "loras/wan/characters");
}

static ModelScanner merging_scanner() {
    ScanOptions options;
    options.merge_sources = true;
    return ModelScanner(options);
}

TEST(ModelScannerTest, MergeSourcesGroupsUnderBaseModel) {
    TempLoraDir tmp;
    auto root = tmp.base / "loras";
    create_file(root / "characters" / "alpha_high.safetensors");
    std::ofstream(root / "characters" / "alpha_high.civitai.info")
        << R"({"modelId": 5, "baseModel": "Wan Video 2.2 T2V-A14B"})";

    auto seeds = merging_scanner().scan(root.string());
    ASSERT_EQ(seeds.size(), 1u);
    EXPECT_EQ(seeds[0].tree_segments,
              (std::vector<std::string>{"Wan Video 2.2 T2V-A14B", "characters"}));
    EXPECT_EQ(seeds[0].tree_path, "Wan Video 2.2 T2V-A14B/characters");
}

TEST(ModelScannerTest, MergeSourcesUsesUnmergedNodeWithoutBaseModel) {
    TempLoraDir tmp;
    auto root = tmp.base / "loras";
    create_file(root / "wan" / "alpha_high.safetensors");
    create_file(root / "top.safetensors");
    std::ofstream(root / "top.civitai.info") << R"({"modelId": 9, "baseModel": "unknown"})";

    auto seeds = merging_scanner().scan(root.string());
    ASSERT_EQ(seeds.size(), 2u);
    EXPECT_EQ(seeds[0].tree_segments, (std::vector<std::string>{"loras (Unmerged)"}));
    EXPECT_EQ(seeds[1].tree_path, "loras (Unmerged)/wan");
}

TEST(ModelScannerTest, MergeSourcesSkipsFolderNamedAfterBaseModel) {
    TempLoraDir tmp;
    auto root = tmp.base / "loras";
    create_file(root / "sdxl" / "styles" / "ink.safetensors");
    std::ofstream(root / "sdxl" / "styles" / "ink.civitai.info")
        << R"({"modelId": 3, "baseModel": "SDXL"})";

    auto seeds = merging_scanner().scan(root.string());
    ASSERT_EQ(seeds.size(), 1u);
    EXPECT_EQ(seeds[0].tree_segments, (std::vector<std::string>{"SDXL", "styles"}));
    EXPECT_EQ(seeds[0].tree_path, "SDXL/styles");
}

TEST(ModelScannerTest, TrailingSeparatorKeepsRootName) {
    TempLoraDir tmp;
    auto root = tmp.base / "loras";
    create_file(root / "a.safetensors");

    ModelScanner scanner;
    auto seeds = scanner.scan(root.string() + "/");
    ASSERT_EQ(seeds.size(), 1u);
    EXPECT_EQ(seeds[0].tree_path, "loras");
}

TEST(ModelScannerTest, ExtensionsAreConfigurableAndCaseInsensitive) {
    TempLoraDir tmp;
    create_file(tmp.base / "upper.SAFETENSORS");
    create_file(tmp.base / "legacy.ckpt");

    ScanOptions options;
    options.extensions = {".safetensors"};
    ModelScanner scanner(options);
    EXPECT_TRUE(scanner.is_model_file("x/upper.SAFETENSORS"));
    EXPECT_FALSE(scanner.is_model_file("x/legacy.ckpt"));
    EXPECT_FALSE(scanner.is_model_file("x/noext"));

    auto seeds = scanner.scan(tmp.base.string());
    EXPECT_EQ(file_names(seeds), (std::vector<std::string>{"upper"}));
}

TEST(ModelScannerTest, ReadsSidecarMetadataIntoSeeds) {
    TempLoraDir tmp;
    create_file(tmp.base / "alpha_high.safetensors");
    std::ofstream(tmp.base / "alpha_high.civitai.info")
        << R"({"modelId": 5, "baseModel": "WanVideo"})";

    ModelScanner scanner;
    auto seeds = scanner.scan(tmp.base.string());
    ASSERT_EQ(seeds.size(), 1u);
    EXPECT_EQ(seeds[0].model.model_id, "5");
    EXPECT_EQ(seeds[0].model.base_model, "WanVideo");
}

TEST(ModelScannerTest, MissingRootYieldsNothing) {
    TempLoraDir tmp;
    ModelScanner scanner;
    EXPECT_TRUE(scanner.scan((tmp.base / "missing").string()).empty());
}

TEST(ModelScannerTest, ScanAllKeepsRootOrderAndSkipsMissing) {
    TempLoraDir tmp;
    create_file(tmp.base / "second" / "b.safetensors");
    create_file(tmp.base / "first" / "z.safetensors");

    ModelScanner scanner;
    auto seeds = scanner.scan_all({(tmp.base / "first").string(),
                                   (tmp.base / "missing").string(),
                                   (tmp.base / "second").string()});
    ASSERT_EQ(seeds.size(), 2u);
    EXPECT_EQ(seeds[0].model.safetensor_file_name, "z");
    EXPECT_EQ(seeds[0].tree_path, "first");
    EXPECT_EQ(seeds[1].model.safetensor_file_name, "b");
    EXPECT_EQ(seeds[1].tree_path, "second");
}
