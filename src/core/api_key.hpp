#pragma once

#include <string>

namespace netvisor {

// Fresh daemon credential: 32 random bytes from the OpenSSL CSPRNG, hex encoded.
// Returns an empty string if the generator is not seeded.
std::string generate_api_key();

// SHA-256 of the key as lowercase hex. Used when api keys are kept hashed at rest.
std::string hash_api_key(const std::string &api_key);

}  // namespace netvisor
