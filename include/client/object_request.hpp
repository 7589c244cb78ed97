#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "integrity/integrity_hasher.hpp"

namespace shardroot {
namespace client {

class RequestError : public std::runtime_error {
public:
  explicit RequestError(const std::string& message) : std::runtime_error(message) {}
};

inline constexpr const char* CONTENT_DEFAULT = "application/octet-stream";

// Caller intent for a new object
struct CreateObjectOptions {
  bool is_public{false};
  std::string content_type;            // empty selects CONTENT_DEFAULT
  bool replicated{false};              // replica redundancy instead of erasure coding
  std::vector<std::string> secondary_sp_addresses;
};

// Object-creation record handed to the signing and broadcast layer
struct CreateObjectRequest {
  std::string creator;
  std::string bucket_name;
  std::string object_name;
  uint64_t payload_size{0};
  bool is_public{false};
  std::string content_type{CONTENT_DEFAULT};
  integrity::RedundancyType redundancy_type{integrity::RedundancyType::ErasureCoded};
  std::vector<integrity::HashRoot> expect_checksums;
  std::vector<std::string> secondary_sp_addresses;

  // Throws RequestError on the first violated rule
  void validate() const;
  // JSON rendering with hex-encoded checksums
  std::string to_json() const;
};

// ---- NAME RULES ----
// 3..63 characters of [a-z0-9-], not starting or ending with '-'
void verify_bucket_name(const std::string& bucket_name);
// 1..1024 bytes of valid UTF-8
void verify_object_name(const std::string& object_name);

// Assembles a request from a finished hash computation
CreateObjectRequest make_create_object_request(const std::string& creator,
                                               const std::string& bucket_name,
                                               const std::string& object_name,
                                               const integrity::IntegrityResult& integrity,
                                               const CreateObjectOptions& options);

} // namespace client
} // namespace shardroot
