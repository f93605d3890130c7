// variant_merger.h - groups High/Low LoRA files into single cards
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "models/model_record.h"
#include "variants/key_normalizer.h"
#include "variants/variant_classifier.h"

namespace loradeck {

// One discovered model file, before classification.
struct CardSeed {
    ModelRecord model;
    std::string source_path;                 // Root folder the file was discovered under
    std::optional<std::string> folder_path;  // Immediate containing folder
    std::string tree_path;
    std::vector<std::string> tree_segments;
};

struct VariantDescriptor {
    std::string label;
    ModelRecord model;
};

// One visible card: a standalone model or a merged High/Low group.
struct CardEntry {
    ModelRecord model;  // Selected/default model
    std::string source_path;
    std::optional<std::string> folder_path;
    std::string tree_path;
    std::vector<std::string> tree_segments;
    std::vector<VariantDescriptor> variants;
    std::string normalized_key;
};

// Only High/Low models with a key, a model id and a base model are grouped.
bool is_merge_eligible(const ModelRecord& model, const VariantClassification& classification);

// High -> 0, Low -> 1, anything else -> 2.
int variant_priority(const std::string& label);

// Priority first, then case-insensitive label text.
bool variant_label_less(const std::string& lhs, const std::string& rhs);

class VariantMerger {
public:
    VariantMerger() = default;
    explicit VariantMerger(KeyNormalizer normalizer);

    // Stable group-by over `seeds`: every card sits at the position of the
    // first seed that produced it. Holds no state between calls.
    std::vector<CardEntry> merge(const std::vector<CardSeed>& seeds) const;

    // One card per seed, in input order; labels are still resolved.
    std::vector<CardEntry> standalone(const std::vector<CardSeed>& seeds) const;

private:
    KeyNormalizer normalizer_;
};

}  // namespace loradeck
