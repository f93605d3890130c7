#pragma once

#include <string>
#include <utility>
#include <vector>

namespace loradeck {

struct DeckConfig {
    std::vector<std::string> lora_sources;  // Enabled LoRA source folders, in order
    bool merge_sources{false};
    std::vector<std::string> model_extensions{".safetensors", ".pt", ".ckpt", ".pth"};
    bool merge_variants{true};  // Group High/Low files into one card
};

// File: $LORADECK_CONFIG or ~/.loradeck/config.json
// Env overrides: LORADECK_LORA_SOURCES (csv), LORADECK_MERGE_SOURCES,
// LORADECK_MERGE_VARIANTS
DeckConfig loadDeckConfig();
std::pair<DeckConfig, std::string> loadDeckConfigWithLog();

}  // namespace loradeck
