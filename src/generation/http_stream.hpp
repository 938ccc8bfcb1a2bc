#pragma once

#include <string>

#include "generation/provider.hpp"
#include "net/http_client.hpp"

namespace ragquery {

// Runs one streaming provider request bounded by the call's deadlines and
// cancel token. Transport errors, non-2xx statuses and malformed payloads
// become ProviderError; a cancelled call returns normally.
void run_provider_transfer(const std::string& provider, HttpRequest request, ProviderCall& call,
                           const BodyChunkHandler& on_chunk);

}  // namespace ragquery
