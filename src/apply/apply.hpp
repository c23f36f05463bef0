#pragma once

/*
    Entry points for applying edit text to a document.

    Both return the same ApplyOutcome whatever the dialect. They return false,
    with `error` filled in, only when the edit text can not be understood at
    all; edits that can not be located are reported in the outcome.
*/

#include "edit/types.hpp"

#include <string>

namespace patchy {

bool
apply_auto(const std::string& content,
           const std::string& edit_text,
           const ApplyOptions& options,
           ApplyOutcome& outcome,
           EditError& error);

bool
apply_with_format(const std::string& content,
                  const std::string& edit_text,
                  EditFormat format,
                  const ApplyOptions& options,
                  ApplyOutcome& outcome,
                  EditError& error);

}  // namespace patchy
