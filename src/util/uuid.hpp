#pragma once

#include <string>
#include <string_view>

namespace ragquery::uuid {

// Random version-4 UUID.
std::string generate();

// Deterministic UUID derived from the SHA-256 of `name`. Same name, same id,
// in every process.
std::string from_name(std::string_view name);

}  // namespace ragquery::uuid
