#include <gtest/gtest.h>

#include <set>

#include "core/api_key.hpp"
#include "core/uuid.hpp"
#include "daemon/daemon.hpp"
#include "fleet/api.hpp"

using namespace netvisor;

// --- Daemon ---

TEST(DaemonTest, CreateAssignsFreshCredentials) {
  auto ip = asio::ip::make_address("10.1.2.3");
  auto a = Daemon::create("host-a", ip, 60073, "net-1");
  auto b = Daemon::create("host-b", ip, 60073, "net-1");

  EXPECT_EQ(a.id.size(), 36);
  EXPECT_NE(a.id, b.id);
  EXPECT_EQ(a.api_key.size(), 64);
  EXPECT_NE(a.api_key, b.api_key);
  EXPECT_EQ(a.host_id, "host-a");
  EXPECT_EQ(a.port, 60073);
}

TEST(DaemonTest, JsonRoundTripKeepsAddressFamily) {
  auto daemon = Daemon::create("host-6", asio::ip::make_address("fd00::17"), 9000, "net-2");
  daemon.registered_at = from_epoch_ms(1700000000123);
  daemon.last_seen = from_epoch_ms(1700000005000);

  auto j = daemon.to_json();
  EXPECT_EQ(j["ip"], "fd00::17");
  EXPECT_EQ(j["registered_at"], 1700000000123);

  auto parsed = Daemon::from_json(j);
  ASSERT_TRUE(parsed.ok());
  EXPECT_EQ(parsed.value->id, daemon.id);
  EXPECT_TRUE(parsed.value->ip.is_v6());
  EXPECT_EQ(parsed.value->ip, daemon.ip);
  EXPECT_EQ(parsed.value->registered_at, daemon.registered_at);
  EXPECT_EQ(parsed.value->last_seen, daemon.last_seen);
}

TEST(DaemonTest, FromJsonRejectsBadRecords) {
  json bad_ip = {{"id", "d1"}, {"host_id", "h1"}, {"ip", "300.1.1.1"}, {"port", 80}};
  EXPECT_TRUE(Daemon::from_json(bad_ip).is(ErrorKind::SerializationFailure));

  json missing_host = {{"id", "d1"}, {"ip", "10.0.0.1"}, {"port", 80}};
  EXPECT_TRUE(Daemon::from_json(missing_host).is(ErrorKind::SerializationFailure));

  json wrong_type = {{"id", "d1"}, {"host_id", "h1"}, {"ip", "10.0.0.1"}, {"port", "eighty"}};
  EXPECT_TRUE(Daemon::from_json(wrong_type).is(ErrorKind::SerializationFailure));

  EXPECT_TRUE(Daemon::from_json(json::array()).is(ErrorKind::SerializationFailure));
}

TEST(DaemonTest, ParseAddress) {
  EXPECT_TRUE(parse_address("192.168.0.1").ok());
  EXPECT_TRUE(parse_address("::1").ok());
  EXPECT_TRUE(parse_address("").is(ErrorKind::SerializationFailure));
  EXPECT_TRUE(parse_address("daemon.local").is(ErrorKind::SerializationFailure));
}

// --- Credentials ---

TEST(ApiKeyTest, GeneratedKeysAreHexAndDistinct) {
  std::set<std::string> keys;
  for (int i = 0; i < 100; ++i) {
    auto key = generate_api_key();
    ASSERT_EQ(key.size(), 64);
    EXPECT_EQ(key.find_first_not_of("0123456789abcdef"), std::string::npos);
    keys.insert(key);
  }
  EXPECT_EQ(keys.size(), 100);
}

TEST(ApiKeyTest, HashIsSha256Hex) {
  // sha256("abc")
  EXPECT_EQ(hash_api_key("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_NE(hash_api_key("abc"), hash_api_key("abd"));
}

TEST(UUIDTest, Version4Format) {
  auto id = UUID::generate();
  ASSERT_EQ(id.size(), 36);
  EXPECT_EQ(id[8], '-');
  EXPECT_EQ(id[13], '-');
  EXPECT_EQ(id[14], '4');
  EXPECT_EQ(id[18], '-');
  EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
  EXPECT_EQ(id[23], '-');
}

// --- Wire types ---

TEST(EndpointTest, BuildsUrls) {
  Endpoint v4{asio::ip::make_address("10.0.0.5"), 60073, ApplicationProtocol::Http, routes::kDiscoveryInitiate};
  EXPECT_EQ(v4.to_url(), "http://10.0.0.5:60073/api/discovery/initiate");

  Endpoint v6{asio::ip::make_address("fd00::1"), 443, ApplicationProtocol::Https, "api/discovery/cancel"};
  EXPECT_EQ(v6.to_url(), "https://[fd00::1]:443/api/discovery/cancel");
}

TEST(ApiTest, DiscoveryRequestCarriesSessionAndOptions) {
  DiscoveryRequest request;
  request.session_id = "s-1";
  request.options = {{"subnets", {"10.0.0.0/24"}}, {"timeout_ms", 500}};

  auto j = request.to_json();
  EXPECT_EQ(j["session_id"], "s-1");
  EXPECT_EQ(j["timeout_ms"], 500);
  EXPECT_EQ(j["subnets"][0], "10.0.0.0/24");

  EXPECT_EQ(CancellationRequest{"s-1"}.to_json(), json({{"session_id", "s-1"}}));
}

TEST(ApiTest, ParseEnvelope) {
  auto ok = ApiResponse::parse(R"({"success":true,"error":null,"data":{"queued":1}})");
  ASSERT_TRUE(ok.ok());
  EXPECT_TRUE(ok.value->success);
  EXPECT_FALSE(ok.value->error.has_value());
  EXPECT_EQ(ok.value->data["queued"], 1);

  auto rejected = ApiResponse::parse(R"({"success":false,"error":"busy"})");
  ASSERT_TRUE(rejected.ok());
  EXPECT_FALSE(rejected.value->success);
  EXPECT_EQ(rejected.value->error.value_or(""), "busy");
  EXPECT_TRUE(rejected.value->data.is_null());

  EXPECT_TRUE(ApiResponse::parse("<html>").is(ErrorKind::SerializationFailure));
  EXPECT_TRUE(ApiResponse::parse(R"({"data":1})").is(ErrorKind::SerializationFailure));
  EXPECT_TRUE(ApiResponse::parse(R"({"success":"yes"})").is(ErrorKind::SerializationFailure));
}
