#pragma once

#include <filesystem>
#include <optional>

#include "models/model_record.h"

namespace loradeck {

// Sidecar kinds recognised next to a model file, in lookup order.
enum class SidecarKind {
    CivitaiInfo,   // <stem>.civitai.info
    Json,          // <stem>.json
    MetadataJson,  // <stem>.metadata.json
};

struct Sidecar {
    SidecarKind kind;
    std::filesystem::path path;
};

// First existing sidecar for the model file, if any.
std::optional<Sidecar> find_sidecar(const std::filesystem::path& model_file);

// Build a ModelRecord for a model file from its name and sidecar metadata.
// Never throws for unreadable or malformed sidecars; those are logged and the
// record keeps only file-name fields.
ModelRecord read_model_record(const std::filesystem::path& model_file);

}  // namespace loradeck
