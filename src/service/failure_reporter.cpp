#include "service/failure_reporter.hpp"

#include <sstream>

#include "util/log.hpp"
#include "util/time.hpp"

namespace ragquery {

void LogFailureReporter::report_persist_failure(const PersistFailure& failure) {
    std::ostringstream oss;
    oss << "persist_failed tenant_id=" << failure.tenant_id << " conversation_id=" << failure.conversation_id
        << " user_id=" << failure.user_id << " sources=" << failure.sources.size()
        << " answer_bytes=" << failure.answer.size() << " at=" << time::to_iso8601(failure.occurred_at)
        << " error=" << failure.error;
    log::error(oss.str());
}

}  // namespace ragquery
