//
// Created by nodesync on 2026/10/18.
//

#include <fmt/ostream.h>

#include <cstring>
#include <fstream>
#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>

#include "meta/cluster_meta.hh"
#include "monitor/supervisor.hh"
#include "nodesync/config.hh"
#include "nodesync/logger.hh"
#include "nodesync/node_params.hh"
#include "reconcile/control.hh"
#include "reconcile/engine.hh"
#include "reconcile/registration.hh"
#include "util/error.hh"
#include "util/signal.hh"

using namespace seastar;

namespace {

using nodesync::l;

future<> set_node(const nodesync::node_params& params, abort_source& as) {
  auto meta = nodesync::meta::make_cluster_meta(params.cluster_meta_uri(), &as);
  auto nodes = params.make_nodes_file();
  auto address = co_await params.address();
  nodesync::reconcile::registration reg{*meta, nodes};
  if (!params.node_number()) {
    l.warn("no node number given, registering {} as pnn 0", address);
  }
  co_await reg.register_or_refresh(
      params.identity(),
      address,
      params.pnn(),
      params.node_number().has_value());
  l.info(
      "node {} registered as {} with pnn {} in {}",
      params.identity(),
      address,
      params.pnn(),
      meta->name());
}

future<> run_supervisor(
    const nodesync::config& cfg,
    const nodesync::node_params& params,
    abort_source& as,
    bool manage) {
  auto uri = params.cluster_meta_uri();
  auto meta = nodesync::meta::make_cluster_meta(uri, &as);
  auto nodes = params.make_nodes_file();
  nodesync::reconcile::command_control ctl{cfg.reload_command};
  nodesync::reconcile::engine eng{*meta, nodes, ctl};
  auto waiter = co_await nodesync::make_waiter(
      nodesync::meta::parse_location(uri), cfg, as);
  nodesync::monitor::supervisor sup{
      eng, *meta, *waiter, params.pnn(), cfg.max_errors};
  std::exception_ptr ex;
  try {
    if (manage) {
      co_await sup.manage();
    } else {
      co_await sup.wait_until_admitted();
    }
  } catch (...) {
    ex = std::current_exception();
  }
  co_await waiter->close();
  if (ex) {
    std::rethrow_exception(ex);
  }
}

}  // namespace

static int nodesync_main(int argc, char** argv) {
  namespace bpo = boost::program_options;
  app_template::config app_cfg;
  app_cfg.name = "nodesync";
  app_cfg.description =
      "nodesync <set-node|manage-nodes|must-have-node> [options]\n"
      "  set-node        register the local node in the cluster metadata\n"
      "  manage-nodes    keep the ctdb nodes list in sync with the metadata\n"
      "  must-have-node  block until the local node is a cluster member";
  app_cfg.auto_handle_sigint_sigterm = false;
  app_template app{std::move(app_cfg)};
  app.add_positional_options({
      {"command",
       bpo::value<sstring>()->default_value(""),
       "set-node, manage-nodes or must-have-node",
       1},
  });
  app.add_options()(
      "config_file",
      bpo::value<sstring>()->default_value(""),
      "nodesync config file path");
  app.add_options()(
      "hostname",
      bpo::value<sstring>()->default_value(""),
      "the host name of the node");
  app.add_options()(
      "node_number", bpo::value<int64_t>(), "the expected node number");
  app.add_options()(
      "take_node_number_from_hostname",
      bpo::value<sstring>()->default_value(""),
      "take the node number from the host name, only after-last-dash is "
      "supported");
  app.add_options()(
      "ip",
      bpo::value<sstring>()->default_value(""),
      "the address of the node, resolved from the host name if not given");
  app.add_options()(
      "persistent_path",
      bpo::value<sstring>()->default_value(""),
      "the path of the persistent nodes list, overrides nodes_path");
  app.add_options()(
      "metadata_source",
      bpo::value<sstring>()->default_value(""),
      "the location of the cluster metadata, a path or a URI, overrides "
      "cluster_meta_uri");

  return app.run(argc, argv, [&]() -> future<int> {
    auto&& opts = app.configuration();
    nodesync::util::stop_signal stop_signal;
    auto command = std::string(opts["command"].as<sstring>());
    int ret = 0;
    try {
      nodesync::config cfg;
      auto&& config_file = opts["config_file"].as<sstring>();
      if (!config_file.empty()) {
        std::ifstream ifs{config_file.c_str(), std::ios::in};
        if (!ifs.good()) {
          throw nodesync::util::configuration_error(
              "config_file",
              fmt::format("cannot open {}", config_file.c_str()));
        }
        cfg = nodesync::config::read_from(ifs);
      }
      cfg.validate();
      l.debug("config: {}", fmt::streamed(cfg));

      nodesync::node_options nopts;
      nopts.hostname = opts["hostname"].as<sstring>();
      if (opts.count("node_number")) {
        nopts.node_number = opts["node_number"].as<int64_t>();
      }
      nopts.take_node_number_from_hostname =
          opts["take_node_number_from_hostname"].as<sstring>();
      nopts.ip = opts["ip"].as<sstring>();
      nopts.persistent_path = opts["persistent_path"].as<sstring>();
      nopts.metadata_source = opts["metadata_source"].as<sstring>();
      nodesync::node_params params{cfg, std::move(nopts)};

      if (command == "set-node") {
        co_await set_node(params, stop_signal.as());
      } else if (command == "manage-nodes") {
        co_await run_supervisor(cfg, params, stop_signal.as(), true);
      } else if (command == "must-have-node") {
        co_await run_supervisor(cfg, params, stop_signal.as(), false);
      } else {
        throw nodesync::util::configuration_error(
            "command", fmt::format("unknown command '{}'", command));
      }
    } catch (const abort_requested_exception&) {
      ret = command == "manage-nodes" ? 0 : 1;
    } catch (const sleep_aborted&) {
      ret = command == "manage-nodes" ? 0 : 1;
    } catch (const std::exception& e) {
      l.error("{} failed: {}", command, e.what());
      ret = 1;
    }
    if (stop_signal.stopping()) {
      l.info(
          "nodesync exiting... with {}:{}",
          stop_signal.signum(),
          ::strsignal(stop_signal.signum()));
    }
    co_return ret;
  });
}

int main(int argc, char** argv) { return nodesync_main(argc, argv); }
