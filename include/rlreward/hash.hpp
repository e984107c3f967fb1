#pragma once

// rlreward/hash.hpp - BLAKE3 digests used to identify sandbox runs.
//
// A program digest names the per-run script file and is the execution_id of
// the run's evaluation event, so one run can be correlated across the event
// log and the scratch directory. Digests are never used for caching rewards:
// every sample is executed.

#include <string>
#include <string_view>

namespace rlreward {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

std::string blake3_hex(std::string_view payload);

// Domain-separated hashing. Domains in use: "prog:" (full program text).
std::string hash_domain(std::string_view domain, std::string_view payload);

std::string program_digest(std::string_view program);

HashRuntimeInfo hash_runtime_info();

}  // namespace rlreward
