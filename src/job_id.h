#pragma once
#include <string>

namespace runbox {

// Generate a random (version 4) UUID for a job, e.g.
// "3f2b8c1e-9a4d-4e7f-b1c2-0d5e6f7a8b9c". Uses OpenSSL's CSPRNG.
// Throws std::runtime_error if the RNG cannot be seeded.
std::string generate_job_id();

// True if `id` is a lowercase canonical UUIDv4 string
bool is_valid_job_id(const std::string& id);

} // namespace runbox
