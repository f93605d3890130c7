// model_scanner.h - discovers LoRA files under source folders
#pragma once

#include <string>
#include <vector>

#include "variants/variant_merger.h"

namespace loradeck {

struct ScanOptions {
    // Recognised model extensions, lowercase with leading dot.
    std::vector<std::string> extensions{".safetensors", ".pt", ".ckpt", ".pth"};
    // false: the root folder name leads every tree path so roots stay apart.
    // true: trees of all roots are merged under a base-model node
    // ("<root> (Unmerged)" when the base model is unknown).
    bool merge_sources{false};
};

class ModelScanner {
public:
    ModelScanner() = default;
    explicit ModelScanner(ScanOptions options);

    // One seed per model file under `source_root`, ordered by relative path.
    // A missing or unreadable root yields an empty list.
    std::vector<CardSeed> scan(const std::string& source_root) const;

    // Seeds of every root, in root order.
    std::vector<CardSeed> scan_all(const std::vector<std::string>& source_roots) const;

    bool is_model_file(const std::string& path) const;

    const ScanOptions& options() const { return options_; }

private:
    ScanOptions options_;
};

}  // namespace loradeck
