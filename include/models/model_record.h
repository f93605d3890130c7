#pragma once

#include <string>
#include <vector>

namespace loradeck {

// Metadata for one model file on disk, as supplied by the metadata reader.
// Every field may be empty; the variant engine degrades accordingly.
struct ModelRecord {
    std::string model_id;              // Civitai model id (shared by all versions/files)
    std::string base_model;            // e.g. "Wan Video 2.2", "SDXL"
    std::string version_name;          // Civitai version name
    std::string safetensor_file_name;  // File stem without extension
    std::string file_path;             // Full path to the model file
    std::string model_type;            // e.g. "LORA", "LoCon"
    std::vector<std::string> tags;
    bool has_metadata{false};          // A sidecar contributed at least one field
};

// Trim and map legacy base-model labels ("SDXL 1.0" -> "SDXL").
std::string normalize_base_model(const std::string& base_model);

}  // namespace loradeck
