#pragma once

#include <string>

#include "service/pipeline.hpp"

namespace ragquery {

// HTTP status for an error kind; 500 for Internal.
int http_status_for(ErrorKind kind);

// Serves the /internal API until the listener stops. Returns the process exit
// code.
int run_http_server(const Pipeline& pipeline, const std::string& host, int port);

}  // namespace ragquery
