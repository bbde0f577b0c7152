#include "daemon/daemon.hpp"

#include "core/api_key.hpp"
#include "core/uuid.hpp"

namespace netvisor {

Daemon Daemon::create(const HostId &host_id, const asio::ip::address &ip, uint16_t port, const NetworkId &network_id) {
  Daemon daemon;
  daemon.id = UUID::generate();
  daemon.host_id = host_id;
  daemon.ip = ip;
  daemon.port = port;
  daemon.network_id = network_id;
  daemon.api_key = generate_api_key();
  return daemon;
}

json Daemon::to_json() const {
  json j;
  j["id"] = id;
  j["host_id"] = host_id;
  j["ip"] = ip.to_string();
  j["port"] = port;
  j["network_id"] = network_id;
  j["api_key"] = api_key;
  j["last_seen"] = to_epoch_ms(last_seen);
  j["registered_at"] = to_epoch_ms(registered_at);
  return j;
}

Result<Daemon> Daemon::from_json(const json &j) {
  if (!j.is_object()) {
    return Result<Daemon>::failure(ErrorKind::SerializationFailure, "Daemon record is not a JSON object");
  }

  try {
    Daemon daemon;
    daemon.id = j.at("id").get<std::string>();
    daemon.host_id = j.at("host_id").get<std::string>();
    daemon.network_id = j.value("network_id", "");
    daemon.api_key = j.value("api_key", "");
    daemon.last_seen = from_epoch_ms(j.value("last_seen", int64_t(0)));
    daemon.registered_at = from_epoch_ms(j.value("registered_at", int64_t(0)));

    auto port = j.at("port").get<int64_t>();
    if (port < 0 || port > 65535) {
      return Result<Daemon>::failure(ErrorKind::SerializationFailure, "Daemon " + daemon.id + " has invalid port " + std::to_string(port));
    }
    daemon.port = static_cast<uint16_t>(port);

    auto ip = parse_address(j.at("ip").get<std::string>());
    if (!ip.ok()) {
      return Result<Daemon>::failure(ErrorKind::SerializationFailure, "Failed to deserialize IP of daemon " + daemon.id + ": " + ip.error->message);
    }
    daemon.ip = *ip.value;

    return Result<Daemon>::success(std::move(daemon));
  } catch (const json::exception &e) {
    return Result<Daemon>::failure(ErrorKind::SerializationFailure, std::string("Malformed daemon record: ") + e.what());
  }
}

Result<asio::ip::address> parse_address(const std::string &text) {
  asio::error_code ec;
  auto address = asio::ip::make_address(text, ec);
  if (ec) {
    return Result<asio::ip::address>::failure(ErrorKind::SerializationFailure, "'" + text + "' is not an IP address");
  }
  return Result<asio::ip::address>::success(address);
}

}  // namespace netvisor
