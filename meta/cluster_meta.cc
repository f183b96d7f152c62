//
// Created by nodesync on 2026/10/18.
//

#include "cluster_meta.hh"

#include "meta/file_cluster_meta.hh"
#include "meta/rados_cluster_meta.hh"
#include "util/error.hh"

namespace nodesync::meta {

location parse_location(std::string_view uri) {
  if (uri.empty()) {
    throw util::configuration_error("cluster_meta_uri", "empty");
  }
  if (uri.starts_with("rados:")) {
    return location{.type = location_type::rados, .path = std::string(uri)};
  }
  auto path = uri;
  if (path.starts_with("file:")) {
    path.remove_prefix(5);
  } else if (auto pos = path.find("://"); pos != std::string_view::npos) {
    throw util::configuration_error(
        "cluster_meta_uri", fmt::format("unknown scheme in {}", uri));
  }
  if (path.starts_with("/")) {
    // file:///a, file://a and file:/a all refer to /a
    while (path.starts_with("/")) {
      path.remove_prefix(1);
    }
    while (path.ends_with("/")) {
      path.remove_suffix(1);
    }
    return location{
        .type = location_type::file, .path = "/" + std::string(path)};
  }
  if (path.empty()) {
    throw util::configuration_error(
        "cluster_meta_uri", fmt::format("no path in {}", uri));
  }
  return location{.type = location_type::file, .path = std::string(path)};
}

std::unique_ptr<cluster_meta> make_cluster_meta(
    std::string_view uri, abort_source* as) {
  auto loc = parse_location(uri);
  switch (loc.type) {
    case location_type::file:
      return std::make_unique<file_cluster_meta>(std::move(loc.path), as);
    case location_type::rados:
      return std::make_unique<rados_cluster_meta>(std::move(loc.path), as);
  }
  throw util::configuration_error("cluster_meta_uri", "unknown location");
}

}  // namespace nodesync::meta
