#include "PlanIssues.hpp"

const char* issueKindName(IssueKind kind) {
    switch (kind) {
        case IssueKind::DataUnavailable: return "DataUnavailable";
        case IssueKind::InfeasiblePlan:  return "InfeasiblePlan";
        case IssueKind::ModelDegraded:   return "ModelDegraded";
        case IssueKind::ConfigInvalid:   return "ConfigInvalid";
    }
    return "Unknown";
}

bool hasIssue(const std::vector<PlanIssue>& issues, IssueKind kind) {
    for (const auto& i : issues) {
        if (i.kind == kind) return true;
    }
    return false;
}
