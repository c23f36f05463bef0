#include "unified.hpp"

#include <fmt/format.h>

using namespace patchy;

std::string
patchy::unified_diff_render(const std::vector<Hunk>& hunks, const std::string& old_name, const std::string& new_name) {
    std::string udiff;

    udiff += fmt::format("--- {}\n", old_name);
    udiff += fmt::format("+++ {}\n", new_name);

    auto format_change = [](const int64_t start, const int64_t count) -> std::string {
        if (count == 1)
            return fmt::format("{}", start);
        return fmt::format("{},{}", start, count);
    };

    for (const auto& hunk : hunks) {
        if (hunk.lines.empty()) {
            continue;
        }
        udiff += fmt::format("@@ -{} +{} @@\n", format_change(hunk.original_start, hunk.original_count),
                             format_change(hunk.new_start, hunk.new_count));
        for (const auto& line : hunk.lines) {
            char op = ' ';
            if (line.kind == HunkLineKind::Add)
                op = '+';
            else if (line.kind == HunkLineKind::Remove)
                op = '-';

            udiff += fmt::format("{}{}\n", op, line.text);
            if (line.missing_newline) {
                udiff += "\\ No newline at end of file\n";
            }
        }
    }

    return udiff;
}
