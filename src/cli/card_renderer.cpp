#include "cli/card_renderer.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "utils/text.h"

namespace loradeck {
namespace cli {

namespace {

constexpr const char* kEmptyCell = "-";

std::string cell(const std::string& value) {
    return is_blank(value) ? kEmptyCell : value;
}

nlohmann::json model_to_json(const ModelRecord& model) {
    nlohmann::json j;
    j["file_name"] = model.safetensor_file_name;
    j["file_path"] = model.file_path;
    j["version_name"] = model.version_name;
    j["model_id"] = model.model_id;
    j["base_model"] = model.base_model;
    j["model_type"] = model.model_type;
    j["tags"] = model.tags;
    j["has_metadata"] = model.has_metadata;
    return j;
}

}  // namespace

std::string card_display_name(const CardEntry& card) {
    if (!is_blank(card.model.safetensor_file_name)) return card.model.safetensor_file_name;
    return cell(card.model.version_name);
}

std::string format_variant_labels(const CardEntry& card) {
    std::string out;
    for (const auto& variant : card.variants) {
        if (!out.empty()) out += '/';
        out += variant.label;
    }
    return cell(out);
}

std::string render_cards_table(const std::vector<CardEntry>& cards) {
    size_t name_width = 4;
    size_t variants_width = 8;
    size_t base_width = 10;
    for (const auto& card : cards) {
        name_width = std::max(name_width, card_display_name(card).size());
        variants_width = std::max(variants_width, format_variant_labels(card).size());
        base_width = std::max(base_width, cell(card.model.base_model).size());
    }
    name_width += 2;
    variants_width += 2;
    base_width += 2;

    std::ostringstream oss;
    oss << std::left
        << std::setw(static_cast<int>(name_width)) << "NAME"
        << std::setw(static_cast<int>(variants_width)) << "VARIANTS"
        << std::setw(static_cast<int>(base_width)) << "BASE MODEL"
        << "FOLDER" << "\n";

    for (const auto& card : cards) {
        oss << std::left
            << std::setw(static_cast<int>(name_width)) << card_display_name(card)
            << std::setw(static_cast<int>(variants_width)) << format_variant_labels(card)
            << std::setw(static_cast<int>(base_width)) << cell(card.model.base_model)
            << cell(card.tree_path) << "\n";
    }
    return oss.str();
}

nlohmann::json card_to_json(const CardEntry& card) {
    nlohmann::json j;
    j["name"] = card_display_name(card);
    j["normalized_key"] = card.normalized_key;
    j["model"] = model_to_json(card.model);
    j["source_path"] = card.source_path;
    j["folder_path"] = card.folder_path ? nlohmann::json(*card.folder_path) : nlohmann::json();
    j["tree_path"] = card.tree_path;
    j["tree_segments"] = card.tree_segments;

    auto variants = nlohmann::json::array();
    for (const auto& variant : card.variants) {
        variants.push_back({{"label", variant.label}, {"model", model_to_json(variant.model)}});
    }
    j["variants"] = std::move(variants);
    return j;
}

nlohmann::json cards_to_json(const std::vector<CardEntry>& cards) {
    auto out = nlohmann::json::array();
    for (const auto& card : cards) {
        out.push_back(card_to_json(card));
    }
    return out;
}

nlohmann::json classification_to_json(const std::string& name,
                                      const VariantClassification& classification) {
    return nlohmann::json{
        {"name", name},
        {"key", classification.normalized_key},
        {"label", classification.variant_label},
    };
}

}  // namespace cli
}  // namespace loradeck
