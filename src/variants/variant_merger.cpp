#include "variants/variant_merger.h"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

#include "utils/text.h"

namespace loradeck {

namespace {

// Composite identity of a merged card; all parts stored lowercase.
struct GroupKey {
    std::string normalized_key;
    std::string model_id;
    std::string base_model;

    bool operator==(const GroupKey& other) const {
        return normalized_key == other.normalized_key && model_id == other.model_id &&
               base_model == other.base_model;
    }
};

struct GroupKeyHash {
    size_t operator()(const GroupKey& key) const {
        std::hash<std::string> hasher;
        size_t seed = hasher(key.normalized_key);
        seed ^= hasher(key.model_id) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        seed ^= hasher(key.base_model) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

GroupKey make_group_key(const ModelRecord& model, const VariantClassification& classification) {
    return GroupKey{to_lower_ascii(classification.normalized_key),
                    to_lower_ascii(model.model_id),
                    to_lower_ascii(model.base_model)};
}

// Accumulates the variants of one logical model.
class VariantGroup {
public:
    VariantGroup(const CardSeed& seed, std::string normalized_key)
        : seed_(seed), normalized_key_(std::move(normalized_key)) {}

    // Labels compare case-insensitively; a repeated label replaces the model
    // but keeps the label text first seen.
    void add_variant(const std::string& label, const ModelRecord& model) {
        auto it = std::find_if(variants_.begin(), variants_.end(), [&](const VariantDescriptor& v) {
            return equals_ignore_case(v.label, label);
        });
        if (it == variants_.end()) {
            variants_.push_back(VariantDescriptor{label, model});
            return;
        }
        spdlog::debug("Variant '{}' of '{}' replaced: {} -> {}", it->label, normalized_key_,
                      it->model.file_path, model.file_path);
        it->model = model;
    }

    CardEntry to_entry() const {
        std::vector<VariantDescriptor> ordered = variants_;
        std::sort(ordered.begin(), ordered.end(),
                  [](const VariantDescriptor& a, const VariantDescriptor& b) {
                      return variant_label_less(a.label, b.label);
                  });

        CardEntry entry;
        entry.model = ordered.front().model;
        entry.source_path = seed_.source_path;
        entry.folder_path = seed_.folder_path;
        entry.tree_path = seed_.tree_path;
        entry.tree_segments = seed_.tree_segments;
        entry.variants = std::move(ordered);
        entry.normalized_key = normalized_key_;
        return entry;
    }

private:
    CardSeed seed_;
    std::string normalized_key_;
    std::vector<VariantDescriptor> variants_;
};

// Position in the output: either a finished standalone entry or a group handle.
struct MergeSlot {
    enum class Kind { Standalone, Group };
    Kind kind;
    size_t index;  // into standalone entries or groups, depending on kind
};

CardEntry make_standalone_entry(const CardSeed& seed, const VariantClassification& classification) {
    CardEntry entry;
    entry.model = seed.model;
    entry.source_path = seed.source_path;
    entry.folder_path = seed.folder_path;
    entry.tree_path = seed.tree_path;
    entry.tree_segments = seed.tree_segments;
    if (!is_blank(classification.variant_label)) {
        entry.variants.push_back(VariantDescriptor{classification.variant_label, seed.model});
    }
    entry.normalized_key = classification.normalized_key;
    return entry;
}

}  // namespace

bool is_merge_eligible(const ModelRecord& model, const VariantClassification& classification) {
    if (!is_high_label(classification.variant_label) && !is_low_label(classification.variant_label)) {
        return false;
    }
    if (is_blank(classification.normalized_key)) return false;
    if (is_blank(model.model_id)) return false;
    if (is_blank(model.base_model)) return false;
    return true;
}

int variant_priority(const std::string& label) {
    if (is_high_label(label)) return 0;
    if (is_low_label(label)) return 1;
    return 2;
}

bool variant_label_less(const std::string& lhs, const std::string& rhs) {
    int lp = variant_priority(lhs);
    int rp = variant_priority(rhs);
    if (lp != rp) return lp < rp;
    return to_lower_ascii(lhs) < to_lower_ascii(rhs);
}

VariantMerger::VariantMerger(KeyNormalizer normalizer) : normalizer_(std::move(normalizer)) {}

std::vector<CardEntry> VariantMerger::merge(const std::vector<CardSeed>& seeds) const {
    std::vector<MergeSlot> slots;
    std::vector<CardEntry> standalone;
    std::vector<VariantGroup> groups;
    std::unordered_map<GroupKey, size_t, GroupKeyHash> group_index;
    slots.reserve(seeds.size());

    for (const auto& seed : seeds) {
        auto classification = normalizer_.resolve(seed.model);

        if (!is_merge_eligible(seed.model, classification)) {
            slots.push_back(MergeSlot{MergeSlot::Kind::Standalone, standalone.size()});
            standalone.push_back(make_standalone_entry(seed, classification));
            continue;
        }

        auto key = make_group_key(seed.model, classification);
        auto it = group_index.find(key);
        if (it == group_index.end()) {
            it = group_index.emplace(std::move(key), groups.size()).first;
            slots.push_back(MergeSlot{MergeSlot::Kind::Group, groups.size()});
            groups.emplace_back(seed, classification.normalized_key);
        }
        groups[it->second].add_variant(classification.variant_label, seed.model);
    }

    std::vector<CardEntry> entries;
    entries.reserve(slots.size());
    for (const auto& slot : slots) {
        if (slot.kind == MergeSlot::Kind::Group) {
            entries.push_back(groups[slot.index].to_entry());
        } else {
            entries.push_back(std::move(standalone[slot.index]));
        }
    }

    spdlog::debug("Merged {} seeds into {} cards ({} variant groups)",
                  seeds.size(), entries.size(), groups.size());
    return entries;
}

std::vector<CardEntry> VariantMerger::standalone(const std::vector<CardSeed>& seeds) const {
    std::vector<CardEntry> entries;
    entries.reserve(seeds.size());
    for (const auto& seed : seeds) {
        entries.push_back(make_standalone_entry(seed, normalizer_.resolve(seed.model)));
    }
    return entries;
}

}  // namespace loradeck
