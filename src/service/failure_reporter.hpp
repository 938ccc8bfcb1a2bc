#pragma once

#include <string>
#include <vector>

#include "core/types.hpp"

namespace ragquery {

// A completed answer whose turn could not be stored.
struct PersistFailure {
    std::string tenant_id;
    std::string user_id;
    std::string conversation_id;
    std::string question;
    std::string answer;
    std::vector<std::string> sources;
    std::string error;
    Clock::time_point occurred_at{};
};

// Side channel for failures that are not surfaced to the caller.
// Implementations may throw; callers log and move on.
class FailureReporter {
public:
    virtual ~FailureReporter() = default;

    virtual void report_persist_failure(const PersistFailure& failure) = 0;
};

class LogFailureReporter final : public FailureReporter {
public:
    void report_persist_failure(const PersistFailure& failure) override;
};

}  // namespace ragquery
