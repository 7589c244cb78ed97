#include "client/object_request.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace shardroot {
namespace client {

namespace {

constexpr size_t MIN_BUCKET_NAME_LENGTH = 3;
constexpr size_t MAX_BUCKET_NAME_LENGTH = 63;
constexpr size_t MAX_OBJECT_NAME_LENGTH = 1024;

bool is_valid_utf8(const std::string& text) {
  size_t i = 0;
  while (i < text.size()) {
    auto c = static_cast<unsigned char>(text[i]);
    size_t extra = 0;
    uint32_t code_point = 0;

    if (c < 0x80) {
      i++;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      code_point = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      code_point = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      code_point = c & 0x07;
    } else {
      return false;
    }

    if (i + extra >= text.size()) {
      return false;
    }
    for (size_t k = 1; k <= extra; ++k) {
      auto next = static_cast<unsigned char>(text[i + k]);
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (next & 0x3F);
    }

    // Overlong encodings, surrogates and values past U+10FFFF
    if ((extra == 1 && code_point < 0x80) ||
        (extra == 2 && code_point < 0x800) ||
        (extra == 3 && code_point < 0x10000) ||
        (code_point >= 0xD800 && code_point <= 0xDFFF) ||
        code_point > 0x10FFFF) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

} // namespace

//==============================================
// NAME RULES
//==============================================

void verify_bucket_name(const std::string& bucket_name) {
  size_t length = bucket_name.size();
  if (length < MIN_BUCKET_NAME_LENGTH || length > MAX_BUCKET_NAME_LENGTH) {
    throw RequestError("Bucket name " + bucket_name + " length must be between [3-63]");
  }

  for (char c : bucket_name) {
    if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-')) {
      throw RequestError("Bucket name can only include lowercase letters, numbers, and -");
    }
  }

  if (bucket_name.front() == '-' || bucket_name.back() == '-') {
    throw RequestError("Bucket name must start and end with a lowercase letter or number");
  }
}

void verify_object_name(const std::string& object_name) {
  if (object_name.empty()) {
    throw RequestError("Object name is empty");
  }
  if (object_name.size() > MAX_OBJECT_NAME_LENGTH) {
    throw RequestError("Object name is longer than " + std::to_string(MAX_OBJECT_NAME_LENGTH) + " bytes");
  }
  if (!is_valid_utf8(object_name)) {
    throw RequestError("Object name is not valid UTF-8");
  }
}


//==============================================
// CREATE OBJECT REQUEST
//==============================================

void CreateObjectRequest::validate() const {
  if (creator.empty()) {
    throw RequestError("Creator address is empty");
  }
  verify_bucket_name(bucket_name);
  verify_object_name(object_name);

  if (content_type.empty()) {
    throw RequestError("Content type is empty");
  }
  if (expect_checksums.empty()) {
    throw RequestError("Expected checksums are empty");
  }
  for (const auto& address : secondary_sp_addresses) {
    if (address.empty()) {
      throw RequestError("Secondary storage provider address is empty");
    }
  }
}

std::string CreateObjectRequest::to_json() const {
  namespace pt = boost::property_tree;

  pt::ptree root;
  root.put("creator", creator);
  root.put("bucket_name", bucket_name);
  root.put("object_name", object_name);
  root.put("payload_size", payload_size);
  root.put("is_public", is_public);
  root.put("content_type", content_type);
  root.put("redundancy_type", integrity::redundancy_type_to_string(redundancy_type));

  pt::ptree checksums;
  for (const auto& checksum : expect_checksums) {
    pt::ptree entry;
    entry.put("", crypto::to_hex(checksum));
    checksums.push_back(std::make_pair("", entry));
  }
  root.add_child("expect_checksums", checksums);

  pt::ptree secondaries;
  for (const auto& address : secondary_sp_addresses) {
    pt::ptree entry;
    entry.put("", address);
    secondaries.push_back(std::make_pair("", entry));
  }
  root.add_child("expect_secondary_sp_addresses", secondaries);

  std::stringstream ss;
  pt::write_json(ss, root);
  return ss.str();
}

CreateObjectRequest make_create_object_request(const std::string& creator,
                                               const std::string& bucket_name,
                                               const std::string& object_name,
                                               const integrity::IntegrityResult& integrity,
                                               const CreateObjectOptions& options) {
  CreateObjectRequest request;
  request.creator = creator;
  request.bucket_name = bucket_name;
  request.object_name = object_name;
  request.payload_size = static_cast<uint64_t>(integrity.total_size);
  request.is_public = options.is_public;
  request.content_type = options.content_type.empty() ? CONTENT_DEFAULT : options.content_type;
  request.redundancy_type = options.replicated ? integrity::RedundancyType::Replicated
                                               : integrity::RedundancyType::ErasureCoded;
  request.expect_checksums = integrity.hash_roots;
  request.secondary_sp_addresses = options.secondary_sp_addresses;

  request.validate();
  BOOST_LOG_TRIVIAL(debug) << "Object request: Built create request for " << bucket_name
                           << "/" << object_name << " (" << request.payload_size << " bytes)";
  return request;
}

} // namespace client
} // namespace shardroot
