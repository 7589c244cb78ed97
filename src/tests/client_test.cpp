#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <stdexcept>
#include "client/client.hpp"
#include "test_utils.hpp"

using namespace shardroot::client;
using namespace shardroot::integrity;
using shardroot::config::RedundancyParamsProvider;
using shardroot::config::StaticParamsProvider;

namespace {

class FailingParamsProvider : public RedundancyParamsProvider {
public:
  RedundancyConfig fetch() override {
    fetches++;
    throw std::runtime_error("chain query timed out");
  }
  int fetches = 0;
};

} // namespace

class ClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
    provider_ = std::make_shared<StaticParamsProvider>(RedundancyConfig{1024, 4, 2});
  }

  std::shared_ptr<StaticParamsProvider> provider_;
};

TEST_F(ClientTest, ComputesRootsWithFetchedParams) {
  Client client(provider_);
  std::stringstream input("0123456789");
  IntegrityResult result = client.compute_hash_roots(&input);

  EXPECT_EQ(result.total_size, 10);
  ASSERT_EQ(result.hash_roots.size(), 6u);
  EXPECT_EQ(shardroot::crypto::to_hex(result.hash_roots[0]),
            "bf6aaaab7c143ca12ae448c69fb72bb4cf1b29154b9086a927a0a91ae334cdf7");
}

TEST_F(ClientTest, ProviderFailureIsConfigUnavailable) {
  auto failing = std::make_shared<FailingParamsProvider>();
  Client client(failing);
  std::stringstream input("0123456789");

  try {
    client.compute_hash_roots(&input);
    FAIL() << "expected ConfigUnavailableError";
  } catch (const ConfigUnavailableError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::CONFIG_UNAVAILABLE);
  }
  EXPECT_EQ(failing->fetches, 1);

  Client no_provider(nullptr);
  EXPECT_THROW(no_provider.get_redundancy_params(), ConfigUnavailableError);
}

TEST_F(ClientTest, NullReaderFailsBeforeFetchingParams) {
  auto failing = std::make_shared<FailingParamsProvider>();
  Client client(failing);
  EXPECT_THROW(client.compute_hash_roots(nullptr), MissingInputError);
  EXPECT_EQ(failing->fetches, 0);
}

TEST_F(ClientTest, BadNamesAreRejectedBeforeReading) {
  Client client(provider_);
  std::stringstream input("0123456789");
  EXPECT_THROW(client.build_create_object("0xcreator", "Bad_Bucket", "object", &input, {}), RequestError);
  EXPECT_THROW(client.build_create_object("0xcreator", "bucket", "", &input, {}), RequestError);
  EXPECT_EQ(static_cast<std::streamoff>(input.tellg()), 0);
}

TEST_F(ClientTest, BuildsCreateObjectRequest) {
  Client client(provider_, 2);
  std::stringstream input(to_string(make_payload(3000)));
  CreateObjectOptions options;
  options.content_type = "image/png";

  CreateObjectRequest request = client.build_create_object("0xcreator", "bucket", "image.png",
                                                           &input, options);
  EXPECT_EQ(request.payload_size, 3000u);
  EXPECT_EQ(request.expect_checksums.size(), 6u);
  EXPECT_EQ(request.content_type, "image/png");
  EXPECT_EQ(request.redundancy_type, RedundancyType::ErasureCoded);
}

TEST_F(ClientTest, ReplicatedRequestUsesContentDigest) {
  Client client(provider_);
  std::stringstream input("0123456789");
  CreateObjectOptions options;
  options.replicated = true;

  CreateObjectRequest request = client.build_create_object("0xcreator", "bucket", "object",
                                                           &input, options);
  for (const auto& checksum : request.expect_checksums) {
    EXPECT_EQ(shardroot::crypto::to_hex(checksum),
              "84d89877f0d4041efb6bf91a16f0248f2fd573e6af05c19f96bedb9f882f7882");
  }
}
