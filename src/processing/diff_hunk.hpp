#pragma once

/*
    Compose diff hunks out of an edit sequence.

    The hunks generated carry their line texts, so they can be rendered as a
    unified diff or turned into search/replace blocks directly.
*/

#include "algorithms/algorithm.hpp"
#include "edit/types.hpp"
#include "util/lines.hpp"

#include <gsl/span>

#include <vector>

namespace patchy {

std::vector<Hunk>
compose_hunks(const std::vector<Edit>& edit_sequence,
              const int64_t context_size,
              gsl::span<const Line> a,
              gsl::span<const Line> b);

}  // namespace patchy
