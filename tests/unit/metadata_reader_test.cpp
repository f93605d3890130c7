#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "models/metadata_reader.h"

using namespace loradeck;
namespace fs = std::filesystem;

class TempLoraDir {
public:
    TempLoraDir() {
        base = fs::temp_directory_path() / fs::path("metadata-reader-XXXXXX");
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

static fs::path create_lora(const fs::path& dir, const std::string& file_name) {
    fs::create_directories(dir);
    auto path = dir / file_name;
    std::ofstream(path) << "dummy safetensors";
    return path;
}

TEST(MetadataReaderTest, NoSidecarKeepsFileNameFields) {
    TempLoraDir tmp;
    auto path = create_lora(tmp.base, "wan_character_high.safetensors");

    auto record = read_model_record(path);
    EXPECT_EQ(record.safetensor_file_name, "wan_character_high");
    EXPECT_EQ(record.version_name, "wan_character_high");
    EXPECT_EQ(record.file_path, path.string());
    EXPECT_TRUE(record.model_id.empty());
    EXPECT_TRUE(record.base_model.empty());
    EXPECT_FALSE(record.has_metadata);
}

TEST(MetadataReaderTest, ReadsCivitaiInfo) {
    TempLoraDir tmp;
    auto path = create_lora(tmp.base, "wan_character_high.safetensors");
    std::ofstream(tmp.base / "wan_character_high.civitai.info") << R"({
        "id": 998877,
        "modelId": 123456,
        "name": "Wan2.2 Character HIGH",
        "baseModel": "Wan Video 2.2 T2V-A14B",
        "model": {"name": "Wan Character", "type": "LORA", "tags": ["character", "wan"]}
    })";

    auto record = read_model_record(path);
    EXPECT_EQ(record.model_id, "123456");
    EXPECT_EQ(record.base_model, "Wan Video 2.2 T2V-A14B");
    EXPECT_EQ(record.version_name, "Wan2.2 Character HIGH");
    EXPECT_EQ(record.model_type, "LORA");
    EXPECT_EQ(record.tags, (std::vector<std::string>{"character", "wan"}));
    EXPECT_TRUE(record.has_metadata);
}

TEST(MetadataReaderTest, CivitaiInfoNormalizesLegacySdxl) {
    TempLoraDir tmp;
    auto path = create_lora(tmp.base, "style.safetensors");
    std::ofstream(tmp.base / "style.civitai.info") << R"({"modelId": "42", "baseModel": "SDXL 1.0"})";

    auto record = read_model_record(path);
    EXPECT_EQ(record.model_id, "42");
    EXPECT_EQ(record.base_model, "SDXL");
    EXPECT_EQ(record.version_name, "style");
}

TEST(MetadataReaderTest, ReadsUserMetadataJson) {
    TempLoraDir tmp;
    auto path = create_lora(tmp.base, "scifi_wan_low.safetensors");
    std::ofstream(tmp.base / "scifi_wan_low.json") << R"({
        "sd version": "WanVideo",
        "civitai": {"modelId": 777},
        "activation text": "scifi",
        "tags": ["scifi"]
    })";

    auto record = read_model_record(path);
    EXPECT_EQ(record.base_model, "WanVideo");
    EXPECT_EQ(record.model_id, "777");
    EXPECT_EQ(record.version_name, "scifi_wan_low");
    EXPECT_EQ(record.tags, (std::vector<std::string>{"scifi"}));
    EXPECT_TRUE(record.has_metadata);
}

TEST(MetadataReaderTest, CivitaiInfoWinsOverJson) {
    TempLoraDir tmp;
    auto path = create_lora(tmp.base, "model.safetensors");
    std::ofstream(tmp.base / "model.civitai.info") << R"({"modelId": 1, "baseModel": "Flux.1 D"})";
    std::ofstream(tmp.base / "model.json") << R"({"modelId": 2, "baseModel": "SD 1.5"})";

    auto sidecar = find_sidecar(path);
    ASSERT_TRUE(sidecar.has_value());
    EXPECT_EQ(sidecar->kind, SidecarKind::CivitaiInfo);

    auto record = read_model_record(path);
    EXPECT_EQ(record.model_id, "1");
    EXPECT_EQ(record.base_model, "Flux.1 D");
}

TEST(MetadataReaderTest, FindsMetadataJsonLast) {
    TempLoraDir tmp;
    auto path = create_lora(tmp.base, "model.safetensors");
    EXPECT_FALSE(find_sidecar(path).has_value());

    std::ofstream(tmp.base / "model.metadata.json") << R"({"baseModel": "Pony"})";
    auto sidecar = find_sidecar(path);
    ASSERT_TRUE(sidecar.has_value());
    EXPECT_EQ(sidecar->kind, SidecarKind::MetadataJson);
    EXPECT_EQ(read_model_record(path).base_model, "Pony");
}

TEST(MetadataReaderTest, MalformedSidecarIsIgnored) {
    TempLoraDir tmp;
    auto path = create_lora(tmp.base, "broken_high.safetensors");
    std::ofstream(tmp.base / "broken_high.civitai.info") << "{not json";

    auto record = read_model_record(path);
    EXPECT_EQ(record.safetensor_file_name, "broken_high");
    EXPECT_EQ(record.version_name, "broken_high");
    EXPECT_TRUE(record.model_id.empty());
    EXPECT_FALSE(record.has_metadata);
}

TEST(MetadataReaderTest, NonObjectSidecarIsIgnored) {
    TempLoraDir tmp;
    auto path = create_lora(tmp.base, "list.safetensors");
    std::ofstream(tmp.base / "list.json") << R"(["a", "b"])";

    auto record = read_model_record(path);
    EXPECT_FALSE(record.has_metadata);
    EXPECT_TRUE(record.tags.empty());
}
