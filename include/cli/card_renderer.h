// card_renderer.h - text and JSON views of merged cards
#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "variants/variant_classifier.h"
#include "variants/variant_merger.h"

namespace loradeck {
namespace cli {

// Display name of a card: the selected model's file stem.
std::string card_display_name(const CardEntry& card);

// Variant labels joined with '/', "-" when the card has none.
std::string format_variant_labels(const CardEntry& card);

// Column table: NAME, VARIANTS, BASE MODEL, FOLDER. Ends with a newline.
std::string render_cards_table(const std::vector<CardEntry>& cards);

nlohmann::json card_to_json(const CardEntry& card);
nlohmann::json cards_to_json(const std::vector<CardEntry>& cards);

// {"name": ..., "key": ..., "label": ...}
nlohmann::json classification_to_json(const std::string& name,
                                      const VariantClassification& classification);

}  // namespace cli
}  // namespace loradeck
