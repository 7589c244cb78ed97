#pragma once

#include <istream>
#include <memory>
#include <string>
#include "client/object_request.hpp"
#include "config/params_provider.hpp"
#include "integrity/integrity_hasher.hpp"

namespace shardroot {
namespace client {

// Client-side entry point: fetches the redundancy parameters, hashes payloads and
// prepares object-creation requests. Signing and broadcast happen elsewhere.
class Client {
public:

  // ---- CONSTRUCTOR ----
  explicit Client(std::shared_ptr<config::RedundancyParamsProvider> provider,
                  size_t worker_threads = 0);


  // ---- PARAMETER QUERIES ----
  // Throws ConfigUnavailableError if the provider fails
  integrity::RedundancyConfig get_redundancy_params() const;


  // ---- HASHING ----
  // Reads the parameters once, then hashes the stream
  integrity::IntegrityResult compute_hash_roots(std::istream* reader,
                                                integrity::RedundancyType type =
                                                  integrity::RedundancyType::ErasureCoded,
                                                const std::atomic<bool>* cancel = nullptr) const;


  // ---- MESSAGE CONSTRUCTION ----
  // Validates the names, hashes the payload and returns a validated request
  CreateObjectRequest build_create_object(const std::string& creator,
                                          const std::string& bucket_name,
                                          const std::string& object_name,
                                          std::istream* reader,
                                          const CreateObjectOptions& options) const;

private:
  // ---- PARAMETERS ----
  std::shared_ptr<config::RedundancyParamsProvider> provider_;
  size_t worker_threads_;
};

} // namespace client
} // namespace shardroot
