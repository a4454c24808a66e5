#include "bridgescp/CaseConflict.hpp"
#include <algorithm>
#include <cctype>

namespace bridgescp {

static constexpr int kMaxRenameAttempts = 1000;

std::string normalizeFilename(const std::string& name) {
    std::string out(name);
    for (char& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool namesEqualIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() && normalizeFilename(a) == normalizeFilename(b);
}

std::optional<CaseConflict> checkCaseConflict(const std::string& candidate,
                                              const std::vector<std::string>& existingNames) {
    // An exact match is an overwrite, not a case conflict.
    if (std::find(existingNames.begin(), existingNames.end(), candidate) != existingNames.end())
        return std::nullopt;
    for (const auto& name : existingNames) {
        if (namesEqualIgnoreCase(name, candidate)) {
            CaseConflict c;
            c.originalName = candidate;
            c.conflictName = name;
            c.proposedName = proposeUniqueName(candidate, existingNames);
            return c;
        }
    }
    return std::nullopt;
}

std::string proposeUniqueName(const std::string& name,
                              const std::vector<std::string>& existingNames) {
    // A leading dot belongs to the stem (".bashrc" has no extension).
    const auto dot = name.find_last_of('.');
    const bool hasExt = dot != std::string::npos && dot > 0;
    const std::string stem = hasExt ? name.substr(0, dot) : name;
    const std::string ext = hasExt ? name.substr(dot) : std::string();

    for (int n = 1; n <= kMaxRenameAttempts; ++n) {
        const std::string proposal = stem + "_" + std::to_string(n) + ext;
        const bool taken = std::any_of(existingNames.begin(), existingNames.end(),
                                       [&](const std::string& e) { return namesEqualIgnoreCase(e, proposal); });
        if (!taken) return proposal;
    }
    return {};
}

CaseConflictPolicy caseConflictPolicyFromString(const std::string& s) {
    return normalizeFilename(s) == "ignore" ? CaseConflictPolicy::Ignore
                                            : CaseConflictPolicy::AutoRename;
}

const char* caseConflictPolicyName(CaseConflictPolicy p) {
    return p == CaseConflictPolicy::Ignore ? "ignore" : "rename";
}

} // namespace bridgescp
