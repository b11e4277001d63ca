#pragma once

#include "cordon/dispatcher.h"
#include "cordon/types.h"

#include <string>
#include <vector>

namespace cordon {

// Trailing whitespace removed from each line, trailing blank lines dropped.
std::string normalize_output(const std::string& s);

// Integer percent, 0 when total is 0.
int grade_score(int passed, int total);

// Run `code` once per case with the case input as stdin and prompt echo
// disabled. Cases run one after another through the dispatcher. Returns the
// first non-OK dispatch status; `out` is complete only on OK.
DispatchStatus run_test_cases(Dispatcher& d, const std::string& code,
                              const std::vector<TestCase>& cases, GradeReport* out);

} // namespace cordon
