//
// Created by nodesync on 2026/10/18.
//

#include "node_params.hh"

#include <charconv>
#include <seastar/core/coroutine.hh>
#include <seastar/net/dns.hh>
#include <seastar/net/inet_address.hh>
#include <sstream>

#include "nodesync/logger.hh"
#include "util/error.hh"

namespace nodesync {

node_params::node_params(const config& cfg, node_options opts)
  : _cfg(cfg)
  , _opts(std::move(opts))
  , _number(parse_node_number(_opts))
  , _nodes_path(
        _opts.persistent_path.empty() ? _cfg.nodes_path
                                      : _opts.persistent_path) {}

std::optional<uint64_t> node_params::parse_node_number(
    const node_options& opts) {
  if (opts.node_number) {
    if (*opts.node_number < 0) {
      throw util::configuration_error(
          "node_number", fmt::format("invalid {}", *opts.node_number));
    }
    return static_cast<uint64_t>(*opts.node_number);
  }
  if (opts.take_node_number_from_hostname.empty()) {
    return std::nullopt;
  }
  if (opts.take_node_number_from_hostname != node_options::AFTER_LAST_DASH) {
    throw util::configuration_error(
        "take_node_number_from_hostname",
        fmt::format("unknown policy {}", opts.take_node_number_from_hostname));
  }
  if (opts.hostname.empty()) {
    throw util::configuration_error(
        "hostname", "required if taking node number from host name");
  }
  auto pos = opts.hostname.rfind('-');
  if (pos == std::string::npos) {
    throw util::configuration_error(
        "hostname",
        fmt::format("invalid hostname for node number: {}", opts.hostname));
  }
  std::string_view suffix{opts.hostname};
  suffix.remove_prefix(pos + 1);
  uint64_t number = 0;
  auto [ptr, ec] =
      std::from_chars(suffix.data(), suffix.data() + suffix.size(), number);
  if (suffix.empty() || ec != std::errc{} ||
      ptr != suffix.data() + suffix.size()) {
    throw util::configuration_error(
        "hostname",
        fmt::format("invalid hostname for node number: {}", opts.hostname));
  }
  return number;
}

std::string node_params::identity() const {
  if (!_opts.hostname.empty()) {
    return _opts.hostname;
  }
  if (_number) {
    return fmt::format("node-{}", *_number);
  }
  return "-unknown-";
}

std::string node_params::cluster_meta_uri() const {
  if (!_opts.metadata_source.empty()) {
    return _opts.metadata_source;
  }
  if (!_cfg.nodes_json.empty()) {
    return _cfg.nodes_json;
  }
  if (!_cfg.cluster_meta_uri.empty()) {
    return _cfg.cluster_meta_uri;
  }
  throw util::configuration_error(
      "cluster_meta_uri", "failed to determine cluster_meta_uri");
}

future<std::string> node_params::address() const {
  if (!_opts.ip.empty()) {
    co_return _opts.ip;
  }
  if (_opts.hostname.empty()) {
    throw util::configuration_error("ip", "can not determine node ip");
  }
  auto host = co_await net::dns::get_host_by_name(
      _opts.hostname.c_str(), net::inet_address::family::INET);
  for (const auto& addr : host.addr_list) {
    std::ostringstream os;
    os << addr;
    auto ip = os.str();
    if (ip != "127.0.0.1") {
      l.info("determined address for {}: {}", _opts.hostname, ip);
      co_return ip;
    }
  }
  throw util::configuration_error(
      "hostname",
      fmt::format("no usable address for {}", _opts.hostname));
}

nodes::nodes_file node_params::make_nodes_file() const {
  return nodes::nodes_file{_nodes_path, _cfg.nodes_link};
}

future<std::unique_ptr<monitor::waiter>> make_waiter(
    const meta::location& loc, const config& cfg, abort_source& as) {
  std::unique_ptr<monitor::waiter> w;
  if (loc.type == meta::location_type::file) {
    w = co_await monitor::file_watcher::create(
        loc.path, std::chrono::milliseconds(cfg.watch_timeout_ms), as);
  } else {
    w = std::make_unique<monitor::sleeper>(
        std::chrono::milliseconds(cfg.wait_interval_ms),
        std::chrono::milliseconds(cfg.wait_max_interval_ms),
        cfg.wait_backoff_factor,
        as);
  }
  co_return std::move(w);
}

}  // namespace nodesync
