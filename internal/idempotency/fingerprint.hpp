#pragma once

#include <string>
#include <string_view>

namespace casetrack::idempotency {

/*
  Canonical form of a request body.

  JSON bodies are re-serialized with object keys sorted recursively and
  no insignificant whitespace, so {"b":1,"a":2} and { "a": 2, "b": 1 }
  normalize identically. Anything that does not parse as JSON is
  returned unchanged.
*/
std::string NormalizeBody(std::string_view body);

// Lowercase hex SHA-256 over (operation, resource_path, NormalizeBody(body)).
std::string ComputeFingerprint(std::string_view operation, std::string_view resource_path, std::string_view body);

} // namespace casetrack::idempotency
