#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "variants/variant_classifier.h"

using namespace loradeck;

namespace {

struct Sample {
    std::string name;
    std::string key;
    std::string label;
};

VariantClassification classify_text(const std::string& text) {
    return classify_variant(ClassificationInput::raw_text(text));
}

ModelRecord make_model(const std::string& file_name, const std::string& version_name = "") {
    ModelRecord model;
    model.safetensor_file_name = file_name;
    model.version_name = version_name;
    return model;
}

void expect_samples(const std::vector<Sample>& samples) {
    for (const auto& sample : samples) {
        SCOPED_TRACE(sample.name);
        auto result = classify_text(sample.name);
        EXPECT_EQ(result.normalized_key, sample.key);
        EXPECT_EQ(result.variant_label, sample.label);
    }
}

}  // namespace

TEST(VariantClassifierTest, DetectsSeparatedMarkers) {
    expect_samples({
        {"wriggling_t2v_high_e100.safetensors", "wrigglingt2v", "High"},
        {"Pump_wan22_e20_high", "pumpwan22", "High"},
        {"scifi_wan_low_30 (1)", "scifiwan", "Low"},
        {"wan22-f4c3spl4sh-100epoc-high-k3nk", "wan22f4c3spl4shk3nk", "High"},
        {"Another Model (LOW Noise)", "anothermodel", "Low"},
    });
}

TEST(VariantClassifierTest, DetectsShortHnLnMarkers) {
    expect_samples({
        {"model_HN", "model", "High"},
        {"model_LN", "model", "Low"},
        {"wan - custom - LN 15B", "wancustom", "Low"},
    });
}

TEST(VariantClassifierTest, DetectsMarkersEmbeddedInUppercaseRuns) {
    expect_samples({
        {"WANTT2VHIGHNOISEJIGGLE", "wantt2vjiggle", "High"},
        {"CassHamadaWan2.2HighNoise", "casshamadawan2", "High"},
        {"CassHamadaWan2.2HighNoise.safetensors", "casshamadawan2", "High"},
    });
}

TEST(VariantClassifierTest, StripsUppercaseVariantSuffixFromToken) {
    expect_samples({
        {"AAG_MuscleMommyH_high_noise", "aagmusclemommy", "High"},
        {"AAG_MuscleMommyL_low_noise", "aagmusclemommy", "Low"},
    });
}

TEST(VariantClassifierTest, DropsVersionAndSizeTokens) {
    expect_samples({
        {"WAN-2.2-I2V-BPlay-HIGH-v1", "wan22i2vbplay", "High"},
        {"WAN-2.2-T2V-oggy Style-HIGH 14B", "wan22t2voggystyle", "High"},
        {"WAN-2.2-T2V-cial-HIGH 14B", "wan22t2vcial", "High"},
        {"wan2.2_highnoise_cshot_v.1.0", "wan22cshot", "High"},
        {"Wan2.2 - I2V - King Machine - HIGH 14B", "wan22i2vkingmachine", "High"},
        {"WAN_2.2_mix_HIGH (Final)", "wan22mixfinal", "High"},
    });
}

TEST(VariantClassifierTest, KeysStayStableAcrossCopiesAndSpacing) {
    expect_samples({
        {"wan2.2_highnoise_cshot_v1.0 (Final Copy)", "wan22cshot0finalcopy", "High"},
        {"wan2.2-lownoise-cshot-v1.0-final", "wan22cshot0final", "Low"},
        {"WAN2.2_FINAL-HIGHNoise   .safetensors", "wan22final", "High"},
        {"WAN2.2_FINAL-LowNoise   .safetensors", "wan22fina", "Low"},
    });
}

TEST(VariantClassifierTest, NoMarkerYieldsEmptyLabel) {
    auto result = classify_text("Some Random Model");
    EXPECT_EQ(result.normalized_key, "somerandommodel");
    EXPECT_TRUE(result.variant_label.empty());
}

TEST(VariantClassifierTest, MarkerOnlyNameHasLabelButNoKey) {
    auto result = classify_text("HighNoise");
    EXPECT_EQ(result.variant_label, "High");
    EXPECT_TRUE(result.normalized_key.empty());
}

TEST(VariantClassifierTest, BlankTextYieldsEmptyClassification) {
    EXPECT_EQ(classify_text(""), VariantClassification{});
    EXPECT_EQ(classify_text("   "), VariantClassification{});
}

TEST(VariantClassifierTest, StripsDirectoryOnlyForModelExtensions) {
    auto with_dir = classify_text("/loras/wan/scifi_wan_low_30.safetensors");
    EXPECT_EQ(with_dir.normalized_key, "scifiwan");
    EXPECT_EQ(with_dir.variant_label, "Low");

    auto ckpt = classify_text("model_HN.CKPT");
    EXPECT_EQ(ckpt.normalized_key, "model");
    EXPECT_EQ(ckpt.variant_label, "High");
}

TEST(VariantClassifierTest, ClassificationIsDeterministic) {
    const std::string name = "WAN-2.2-I2V-BPlay-HIGH-v1";
    EXPECT_EQ(classify_text(name), classify_text(name));

    auto model = make_model("AAG_MuscleMommyL_low_noise", "v1");
    EXPECT_EQ(classify_variant(ClassificationInput::structured(model)),
              classify_variant(ClassificationInput::structured(model)));
}

TEST(VariantClassifierTest, StructuredUsesFileNameFirst) {
    auto model = make_model("model_HN", "other_low");
    auto result = classify_variant(ClassificationInput::structured(model));
    EXPECT_EQ(result.normalized_key, "model");
    EXPECT_EQ(result.variant_label, "High");
}

TEST(VariantClassifierTest, StructuredFallsBackToVersionNameForLabel) {
    auto model = make_model("wan_cshot_v1", "wan2.2_highnoise_cshot_v1.0");
    auto result = classify_variant(ClassificationInput::structured(model));
    EXPECT_EQ(result.normalized_key, "wancshot");
    EXPECT_EQ(result.variant_label, "High");
}

TEST(VariantClassifierTest, StructuredFallsBackToVersionNameForKey) {
    auto model = make_model("", "CassHamadaWan2.2HighNoise");
    auto result = classify_variant(ClassificationInput::structured(model));
    EXPECT_EQ(result.normalized_key, "casshamadawan2");
    EXPECT_EQ(result.variant_label, "High");
}

TEST(VariantClassifierTest, StructuredWithNoNamesIsEmpty) {
    auto result = classify_variant(ClassificationInput::structured(ModelRecord{}));
    EXPECT_TRUE(result.normalized_key.empty());
    EXPECT_TRUE(result.variant_label.empty());
}

TEST(VariantClassifierTest, RawTextHasNoFallback) {
    auto input = ClassificationInput::raw_text("HighNoise");
    EXPECT_EQ(input.kind(), ClassificationInput::Kind::RawText);
    EXPECT_TRUE(classify_variant(input).normalized_key.empty());
}

TEST(VariantClassifierTest, LabelHelpersIgnoreCase) {
    EXPECT_TRUE(is_high_label("High"));
    EXPECT_TRUE(is_high_label("HIGH"));
    EXPECT_FALSE(is_high_label("Low"));
    EXPECT_TRUE(is_low_label("low"));
    EXPECT_FALSE(is_low_label(""));
}
