#include "client/client.hpp"
#include <boost/log/trivial.hpp>

namespace shardroot {
namespace client {

//==============================================
// CONSTRUCTOR
//==============================================

Client::Client(std::shared_ptr<config::RedundancyParamsProvider> provider, size_t worker_threads)
  : provider_(std::move(provider))
  , worker_threads_(worker_threads) {
  BOOST_LOG_TRIVIAL(info) << "Client: Initialized" << (provider_ ? "" : " without a parameter provider");
}


//==============================================
// PARAMETER QUERIES
//==============================================

integrity::RedundancyConfig Client::get_redundancy_params() const {
  if (!provider_) {
    BOOST_LOG_TRIVIAL(error) << "Client: No redundancy parameter provider configured";
    throw integrity::ConfigUnavailableError("no parameter provider configured");
  }

  try {
    return provider_->fetch();
  } catch (const integrity::ConfigUnavailableError&) {
    throw;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Client: Failed to fetch redundancy parameters: " << e.what();
    throw integrity::ConfigUnavailableError(e.what());
  }
}


//==============================================
// HASHING
//==============================================

integrity::IntegrityResult Client::compute_hash_roots(std::istream* reader,
                                                      integrity::RedundancyType type,
                                                      const std::atomic<bool>* cancel) const {
  if (reader == nullptr) {
    BOOST_LOG_TRIVIAL(error) << "Client: Fail to compute hash of payload, reader is null";
    throw integrity::MissingInputError("fail to compute hash of payload, reader is null");
  }

  integrity::RedundancyConfig params = get_redundancy_params();

  integrity::HashOptions options;
  options.redundancy_type = type;
  options.worker_threads = worker_threads_;
  options.cancel = cancel;
  return integrity::compute_integrity_hash(reader, params, options);
}


//==============================================
// MESSAGE CONSTRUCTION
//==============================================

CreateObjectRequest Client::build_create_object(const std::string& creator,
                                                const std::string& bucket_name,
                                                const std::string& object_name,
                                                std::istream* reader,
                                                const CreateObjectOptions& options) const {
  BOOST_LOG_TRIVIAL(info) << "Client: Preparing object " << bucket_name << "/" << object_name;

  if (reader == nullptr) {
    BOOST_LOG_TRIVIAL(error) << "Client: Fail to compute hash of payload, reader is null";
    throw integrity::MissingInputError("fail to compute hash of payload, reader is null");
  }

  // Reject bad names before reading any payload
  verify_bucket_name(bucket_name);
  verify_object_name(object_name);

  auto type = options.replicated ? integrity::RedundancyType::Replicated
                                 : integrity::RedundancyType::ErasureCoded;
  integrity::IntegrityResult result = compute_hash_roots(reader, type);

  CreateObjectRequest request = make_create_object_request(creator, bucket_name, object_name,
                                                           result, options);
  BOOST_LOG_TRIVIAL(info) << "Client: Object " << bucket_name << "/" << object_name
                          << " ready with " << request.expect_checksums.size() << " checksums";
  return request;
}

} // namespace client
} // namespace shardroot
