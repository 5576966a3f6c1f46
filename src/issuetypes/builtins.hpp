#pragma once

#include <vector>
#include "issuetypes/issue_type.hpp"

namespace orch::issuetypes {

// TASK, FEAT, FIX, SPIKE and INV, all marked with a builtin source.
std::vector<IssueType> builtin_issue_types();

}  // namespace orch::issuetypes
