#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// UTC epoch seconds.
using Timestamp = std::int64_t;

// Recoverable conditions are carried as issues on the plan/report.
// Only ConfigInvalid is ever thrown (ConfigInvalidError), at load time.
enum class IssueKind {
    DataUnavailable,
    InfeasiblePlan,
    ModelDegraded,
    ConfigInvalid
};

const char* issueKindName(IssueKind kind);

struct PlanIssue {
    IssueKind   kind;
    std::string detail;
    double      magnitude = 0.0;   // C for relaxations, steps for filled prices
};

bool hasIssue(const std::vector<PlanIssue>& issues, IssueKind kind);

// Zone definition rejected at configuration time.
class ConfigInvalidError : public std::runtime_error {
public:
    ConfigInvalidError(const std::string& zone, const std::string& what)
        : std::runtime_error("zone '" + zone + "': " + what), zone_(zone) {}
    const std::string& zone() const { return zone_; }

private:
    std::string zone_;
};

// Thrown by price/sensor sources when data cannot be fetched right now.
class DataUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
