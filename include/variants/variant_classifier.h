// variant_classifier.h - High/Low noise variant detection for LoRA file names
#pragma once

#include <string>

#include "models/model_record.h"

namespace loradeck {

constexpr const char* kHighVariantLabel = "High";
constexpr const char* kLowVariantLabel = "Low";

struct VariantClassification {
    std::string normalized_key;  // Lowercase alphanumeric identity; may be empty
    std::string variant_label;   // "High", "Low" or empty (no marker found)

    bool operator==(const VariantClassification& other) const {
        return normalized_key == other.normalized_key && variant_label == other.variant_label;
    }
    bool operator!=(const VariantClassification& other) const { return !(*this == other); }
};

// What to classify: a full model record, or a bare file/version name.
class ClassificationInput {
public:
    enum class Kind { Structured, RawText };

    static ClassificationInput structured(const ModelRecord& model);
    static ClassificationInput raw_text(std::string text);

    Kind kind() const { return kind_; }
    const ModelRecord& model() const { return model_; }
    const std::string& text() const { return text_; }

private:
    ClassificationInput() = default;

    Kind kind_{Kind::RawText};
    ModelRecord model_;
    std::string text_;
};

// Pure function: identical input always yields identical output.
//
// Structured input classifies the safetensor file name and, when the label
// or key comes out empty, fills the missing part from the version name.
// Raw text is classified as-is with no fallback.
VariantClassification classify_variant(const ClassificationInput& input);

bool is_high_label(const std::string& label);
bool is_low_label(const std::string& label);

}  // namespace loradeck
