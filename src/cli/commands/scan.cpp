// scan command
// Scans LoRA source folders and prints merged cards

#include "cli/commands.h"
#include "cli/card_filter.h"
#include "cli/card_renderer.h"
#include "models/model_scanner.h"
#include "utils/config.h"
#include "utils/text.h"
#include "variants/variant_merger.h"
#include <iostream>
#include <utility>
#include <spdlog/spdlog.h>

namespace loradeck {
namespace cli {
namespace commands {

int scan(const ScanCommandOptions& options, std::ostream& out) {
    auto [cfg, cfg_log] = loadDeckConfigWithLog();
    spdlog::debug("Config loaded: {}", cfg_log);

    const auto& roots = options.paths.empty() ? cfg.lora_sources : options.paths;
    if (roots.empty()) {
        std::cerr << "Error: no LoRA source folders" << std::endl;
        std::cerr << "Pass folders to scan or set lora_sources in ~/.loradeck/config.json"
                  << std::endl;
        return 1;
    }

    ScanOptions scan_options;
    scan_options.extensions = cfg.model_extensions;
    scan_options.merge_sources = options.merge_sources || cfg.merge_sources;

    ModelScanner scanner(scan_options);
    auto seeds = scanner.scan_all(roots);

    VariantMerger merger;
    const bool merge_variants = cfg.merge_variants && !options.no_merge;
    auto cards = merge_variants ? merger.merge(seeds) : merger.standalone(seeds);
    spdlog::info("Scanned {} files from {} sources into {} cards", seeds.size(), roots.size(),
                 cards.size());

    if (!is_blank(options.search) || !is_blank(options.folder)) {
        const auto total = cards.size();
        cards = filter_cards(std::move(cards), CardFilter{options.search, options.folder});
        spdlog::debug("Filter search='{}' folder='{}' kept {} of {} cards", options.search,
                      options.folder, cards.size(), total);
    }

    if (options.json) {
        out << cards_to_json(cards).dump(2) << std::endl;
    } else {
        out << render_cards_table(cards);
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace loradeck
