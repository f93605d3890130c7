// classify command
// Prints the normalized key and variant label of raw file names

#include "cli/commands.h"
#include "cli/card_renderer.h"
#include "variants/variant_classifier.h"
#include "utils/text.h"
#include <algorithm>
#include <iomanip>
#include <vector>

namespace loradeck {
namespace cli {
namespace commands {

int classify(const ClassifyOptions& options, std::ostream& out) {
    std::vector<VariantClassification> results;
    results.reserve(options.names.size());
    for (const auto& name : options.names) {
        results.push_back(classify_variant(ClassificationInput::raw_text(name)));
    }

    if (options.json) {
        auto j = nlohmann::json::array();
        for (size_t i = 0; i < results.size(); ++i) {
            j.push_back(classification_to_json(options.names[i], results[i]));
        }
        out << j.dump(2) << std::endl;
        return 0;
    }

    size_t key_width = 3;
    for (const auto& result : results) {
        key_width = std::max(key_width, result.normalized_key.size());
    }
    key_width += 2;

    out << std::left
        << std::setw(static_cast<int>(key_width)) << "KEY"
        << std::setw(7) << "LABEL"
        << "NAME" << "\n";
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& key = results[i].normalized_key;
        const auto& label = results[i].variant_label;
        out << std::left
            << std::setw(static_cast<int>(key_width)) << (key.empty() ? "-" : key)
            << std::setw(7) << (is_blank(label) ? "-" : label)
            << options.names[i] << "\n";
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace loradeck
