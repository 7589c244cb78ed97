#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include "cli/cli.hpp"
#include "test_utils.hpp"

using namespace shardroot::cli;

class CliTest : public ::testing::Test {
protected:
  std::string payload_file_;
  std::string params_file_;

  void SetUp() override {
    init_test_logging();
    auto dir = std::filesystem::temp_directory_path();
    payload_file_ = (dir / "shardroot_cli_payload.bin").string();
    params_file_ = (dir / "shardroot_cli_params.json").string();

    std::ofstream payload(payload_file_, std::ios::binary | std::ios::trunc);
    payload << "0123456789";
  }

  void TearDown() override {
    std::remove(payload_file_.c_str());
    std::remove(params_file_.c_str());
  }

  int run(const std::vector<std::string>& args, std::string& out, std::string& err) {
    CliOptions options = parse_arguments(args);
    EXPECT_TRUE(options.valid) << options.error;
    std::ostringstream out_stream;
    std::ostringstream err_stream;
    int status = CLI(options, out_stream, err_stream).run();
    out = out_stream.str();
    err = err_stream.str();
    return status;
  }
};

TEST_F(CliTest, ParsesCommandAndFlags) {
  CliOptions options = parse_arguments({"hash", "file.bin", "--data-shards", "10", "--parity-shards",
                                        "4", "--segment-size", "1024", "--replica", "--threads", "3"});
  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_EQ(options.command, "hash");
  ASSERT_EQ(options.arguments.size(), 1u);
  EXPECT_EQ(options.arguments[0], "file.bin");
  EXPECT_EQ(options.data_shards, 10u);
  EXPECT_EQ(options.parity_shards, 4u);
  EXPECT_EQ(options.segment_size, 1024u);
  EXPECT_TRUE(options.replicated);
  EXPECT_EQ(options.threads, 3u);
}

TEST_F(CliTest, DefaultsAndRepeatedFlags) {
  CliOptions options = parse_arguments({"create-object", "bucket", "object", "file.bin",
                                        "--secondary-sp", "0xsp1", "--secondary-sp", "0xsp2", "--public"});
  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_EQ(options.data_shards, 4u);
  EXPECT_EQ(options.parity_shards, 2u);
  EXPECT_EQ(options.segment_size, 16u * 1024 * 1024);
  EXPECT_EQ(options.secondary_sps.size(), 2u);
  EXPECT_TRUE(options.is_public);
  EXPECT_EQ(options.log_level, "info");
}

TEST_F(CliTest, RejectsBadArguments) {
  EXPECT_FALSE(parse_arguments({}).valid);
  EXPECT_FALSE(parse_arguments({"frobnicate"}).valid);
  EXPECT_FALSE(parse_arguments({"hash"}).valid);
  EXPECT_FALSE(parse_arguments({"hash", "a", "b"}).valid);
  EXPECT_FALSE(parse_arguments({"hash", "a", "--data-shards"}).valid);
  EXPECT_FALSE(parse_arguments({"hash", "a", "--data-shards", "-1"}).valid);
  EXPECT_FALSE(parse_arguments({"hash", "a", "--data-shards", "4x"}).valid);
  EXPECT_FALSE(parse_arguments({"hash", "a", "--data-shards", "5000000000"}).valid);
  EXPECT_FALSE(parse_arguments({"hash", "a", "--colour", "red"}).valid);

  CliOptions options = parse_arguments({"params", "extra"});
  EXPECT_FALSE(options.valid);
  EXPECT_EQ(options.error, "Command params takes 0 argument(s), got 1");
}

TEST_F(CliTest, HashPrintsSizeAndRoots) {
  std::string out, err;
  int status = run({"hash", payload_file_, "--segment-size", "1024"}, out, err);

  EXPECT_EQ(status, 0) << err;
  EXPECT_NE(out.find("total_size: 10\n"), std::string::npos);
  EXPECT_NE(out.find("root[0]: bf6aaaab7c143ca12ae448c69fb72bb4cf1b29154b9086a927a0a91ae334cdf7"),
            std::string::npos);
  EXPECT_NE(out.find("root[5]: e33cfd33cbe74e587458bbe75b559b1c8f590a2c041a9a587b414499356d46eb"),
            std::string::npos);
}

TEST_F(CliTest, HashFailsOnInvalidShardCounts) {
  std::string out, err;
  EXPECT_EQ(run({"hash", payload_file_, "--data-shards", "0"}, out, err), 1);
  EXPECT_NE(err.find("Invalid config"), std::string::npos) << err;
  EXPECT_TRUE(out.empty());

  EXPECT_EQ(run({"hash", payload_file_ + ".missing"}, out, err), 1);
  EXPECT_NE(err.find("Error opening file"), std::string::npos);
}

TEST_F(CliTest, ParamsFromJsonFile) {
  {
    std::ofstream params(params_file_, std::ios::trunc);
    params << R"({"params": {"redundant_data_chunk_num": 6, "redundant_parity_chunk_num": 3, "max_segment_size": 2048}})";
  }

  std::string out, err;
  EXPECT_EQ(run({"params", "--params", params_file_}, out, err), 0) << err;
  std::stringstream rendered(out);
  auto config = shardroot::config::JsonParamsProvider::parse(rendered);
  EXPECT_EQ(config.data_shards, 6u);
  EXPECT_EQ(config.parity_shards, 3u);
  EXPECT_EQ(config.segment_size, 2048u);

  EXPECT_EQ(run({"params", "--params", params_file_ + ".missing"}, out, err), 1);
  EXPECT_NE(err.find("Config unavailable"), std::string::npos) << err;
}

TEST_F(CliTest, CreateObjectPrintsRequest) {
  std::string out, err;
  int status = run({"create-object", "bucket", "object", payload_file_, "--creator", "0xcreator",
                    "--segment-size", "1024", "--content-type", "text/plain"}, out, err);
  EXPECT_EQ(status, 0) << err;
  std::stringstream json(out);
  boost::property_tree::ptree tree;
  boost::property_tree::read_json(json, tree);
  EXPECT_EQ(tree.get<std::string>("content_type"), "text/plain");
  EXPECT_EQ(tree.get<std::string>("creator"), "0xcreator");
  EXPECT_EQ(tree.get_child("expect_checksums").front().second.get_value<std::string>(),
            "bf6aaaab7c143ca12ae448c69fb72bb4cf1b29154b9086a927a0a91ae334cdf7");

  EXPECT_EQ(run({"create-object", "Bad_Bucket", "object", payload_file_, "--creator", "0xcreator"}, out, err), 1);
  EXPECT_NE(err.find("Bucket name"), std::string::npos);
}

TEST_F(CliTest, VerifyShardComparesRoot) {
  std::string out, err;
  // Replica shards hold the content itself
  EXPECT_EQ(run({"verify-shard", payload_file_,
                 "84d89877f0d4041efb6bf91a16f0248f2fd573e6af05c19f96bedb9f882f7882"}, out, err), 0) << err;
  EXPECT_NE(out.find("Shard root matches"), std::string::npos);

  EXPECT_EQ(run({"verify-shard", payload_file_,
                 "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"}, out, err), 1);
  EXPECT_NE(err.find("Shard root mismatch"), std::string::npos);

  EXPECT_EQ(run({"verify-shard", payload_file_, "not-hex"}, out, err), 1);
}

TEST_F(CliTest, CollectsProgramArguments) {
  char program[] = "shardroot";
  char command[] = "params";
  char* argv[] = {program, command, nullptr};

  EXPECT_TRUE(collect_arguments(0, nullptr).empty());
  EXPECT_TRUE(collect_arguments(1, argv).empty());
  EXPECT_EQ(collect_arguments(2, argv), std::vector<std::string>{"params"});
}

TEST_F(CliTest, LogConsoleFlag) {
  EXPECT_FALSE(parse_arguments({"params"}).log_console);
  CliOptions options = parse_arguments({"params", "--log-console", "--log-level", "debug"});
  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_TRUE(options.log_console);
  EXPECT_EQ(options.log_level, "debug");
}
