// Case-insensitive name clashes between a case-preserving source and a
// case-sensitive destination (or the other way round).
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace bridgescp {

enum class CaseConflictPolicy {
    AutoRename, // destination renamed to the proposed unique name
    Ignore      // logged only, the original name is kept
};

struct CaseConflict {
    std::string originalName;  // name being written
    std::string conflictName;  // existing sibling that differs only in case
    std::string proposedName;  // stem_N.ext, empty when none could be found
};

std::string normalizeFilename(const std::string& name);
bool namesEqualIgnoreCase(const std::string& a, const std::string& b);

// Conflict only when a sibling matches ignoring ASCII case but not exactly.
std::optional<CaseConflict> checkCaseConflict(const std::string& candidate,
                                              const std::vector<std::string>& existingNames);

// First stem_N.ext (N = 1..1000) clashing with no sibling; empty if exhausted.
std::string proposeUniqueName(const std::string& name,
                              const std::vector<std::string>& existingNames);

// "rename" / "ignore"; unknown text falls back to AutoRename.
CaseConflictPolicy caseConflictPolicyFromString(const std::string& s);
const char* caseConflictPolicyName(CaseConflictPolicy p);

} // namespace bridgescp
