#include "outcome.hpp"

#include "util/log.hpp"
#include "util/text.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace patchy;

void
patchy::record_failure(ApplyOutcome& outcome,
                       const UnitNames& names,
                       int64_t index,
                       const std::string& reason,
                       const std::string& unit_text) {
    outcome.blocks_failed++;
    outcome.failed_units.push_back({index, reason, make_snippet(unit_text)});
    outcome.errors.push_back(fmt::format("{} {}: {}", names.singular, index + 1, reason));
    LOG_DEBUG("{} {} failed: {}", names.singular, index + 1, reason);
}

void
patchy::abort_strict(ApplyOutcome& outcome,
                     const UnitNames& names,
                     const std::string& original_content,
                     int64_t failed_index,
                     const std::vector<std::string>& unit_texts) {
    const std::string reason =
        fmt::format("not applied: strict mode aborted at {} {}", names.singular, failed_index + 1);

    for (int64_t i = 0; i < outcome.blocks_total; i++) {
        bool recorded = std::any_of(outcome.failed_units.begin(), outcome.failed_units.end(),
                                    [i](const FailedUnit& unit) { return unit.index == i; });
        if (!recorded) {
            auto text = i < static_cast<int64_t>(unit_texts.size()) ? unit_texts[static_cast<std::size_t>(i)] : "";
            outcome.failed_units.push_back({i, reason, make_snippet(text)});
        }
    }
    std::stable_sort(outcome.failed_units.begin(), outcome.failed_units.end(),
                     [](const FailedUnit& a, const FailedUnit& b) { return a.index < b.index; });

    outcome.content = original_content;
    outcome.blocks_applied = 0;
    outcome.blocks_failed = outcome.blocks_total;
    outcome.telemetry.clear();
    outcome.errors.push_back(fmt::format("strict mode: aborted at {} {}, none of the {} {} were applied",
                                         names.singular, failed_index + 1, outcome.blocks_total, names.plural));
    LOG_DEBUG("strict mode abort at {} {}", names.singular, failed_index + 1);
}
