#pragma once

#include <asio/ip/address.hpp>
#include <cstdint>
#include <string>

#include "core/types.hpp"

namespace netvisor {

// A registered network-diagnostic agent running on a monitored host
struct Daemon {
  DaemonId id;
  HostId host_id;  // One daemon per host
  asio::ip::address ip;
  uint16_t port = 0;
  NetworkId network_id;
  std::string api_key;  // Credential presented on inbound calls (or its hash)
  Timestamp last_seen{};
  Timestamp registered_at{};

  // New record with a fresh id and api key; timestamps are set on registration
  static Daemon create(const HostId &host_id, const asio::ip::address &ip, uint16_t port, const NetworkId &network_id);

  json to_json() const;
  static Result<Daemon> from_json(const json &j);
};

// Parse the textual form of an IPv4/IPv6 address
Result<asio::ip::address> parse_address(const std::string &text);

}  // namespace netvisor
