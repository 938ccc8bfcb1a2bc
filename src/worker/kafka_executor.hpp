#pragma once

#include "config/config.hpp"
#include "service/pipeline.hpp"

namespace ragquery {

// Consumes rag_query_request and rag_chunk_index until the process is
// stopped. Answers go to rag_query_result, failures to rag_failed. Offsets
// are committed after each message whatever its outcome.
int run_kafka_executor(const Config& config, const Pipeline& pipeline);

}  // namespace ragquery
