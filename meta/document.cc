//
// Created by nodesync on 2026/10/18.
//

#include "document.hh"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <unordered_set>

#include "simdjson.h"
#include "util/error.hh"

namespace {

std::string escape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\r':
        out += "\\r";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
        } else {
          out += c;
        }
    }
  }
  return out;
}

bool blank(std::string_view s) {
  return std::all_of(s.begin(), s.end(), [](char c) {
    return c == ' ' || c == '\n' || c == '\t' || c == '\r';
  });
}

nodesync::meta::node_entry parse_entry(simdjson::ondemand::object obj) {
  nodesync::meta::node_entry entry;
  bool has_node = false;
  bool has_pnn = false;
  for (auto field : obj) {
    std::string_view key = field.unescaped_key();
    if (key == "node") {
      entry.node = std::string_view(field.value().get_string());
      has_node = true;
    } else if (key == "pnn") {
      entry.pnn = field.value().get_uint64();
      has_pnn = true;
    } else if (key == "in_nodes") {
      entry.in_nodes = field.value().get_bool();
    } else if (key == "identity") {
      entry.identity = std::string_view(field.value().get_string());
    }
  }
  if (!has_node || !has_pnn) {
    throw nodesync::util::serialization_error(
        "node_entry", "missing node or pnn");
  }
  return entry;
}

}  // namespace

namespace nodesync::meta {

const node_entry* document::find(uint64_t pnn) const {
  auto it = std::find_if(nodes.begin(), nodes.end(), [pnn](const auto& e) {
    return e.pnn == pnn;
  });
  return it == nodes.end() ? nullptr : &*it;
}

node_entry* document::find(uint64_t pnn) {
  auto it = std::find_if(nodes.begin(), nodes.end(), [pnn](const auto& e) {
    return e.pnn == pnn;
  });
  return it == nodes.end() ? nullptr : &*it;
}

std::vector<node_entry> document::sorted() const {
  auto ret = nodes;
  std::stable_sort(ret.begin(), ret.end(), [](const auto& l, const auto& r) {
    return l.pnn < r.pnn;
  });
  return ret;
}

void document::validate() const {
  std::unordered_set<uint64_t> pnns;
  for (const auto& e : nodes) {
    if (!pnns.insert(e.pnn).second) {
      throw util::serialization_error(
          "document", fmt::format("duplicate pnn {}", e.pnn));
    }
  }
}

document document::read_from(std::string_view json) {
  document doc;
  if (blank(json)) {
    return doc;
  }
  simdjson::ondemand::parser parser;
  auto padded = simdjson::padded_string(json);
  try {
    simdjson::ondemand::document d = parser.iterate(padded);
    for (auto field : d.get_object()) {
      std::string_view key = field.unescaped_key();
      if (key != "nodes") {
        continue;
      }
      for (auto item : field.value().get_array()) {
        doc.nodes.emplace_back(parse_entry(item.get_object()));
      }
    }
  } catch (const simdjson::simdjson_error& ex) {
    throw util::serialization_error("document", ex.what());
  }
  doc.validate();
  return doc;
}

std::string document::write_to() const {
  std::string out = "{\"nodes\": [";
  auto it = std::back_inserter(out);
  bool first = true;
  for (const auto& e : nodes) {
    fmt::format_to(
        it,
        "{}{{\"node\": \"{}\", \"pnn\": {}, \"in_nodes\": {}",
        first ? "" : ", ",
        escape(e.node),
        e.pnn,
        e.in_nodes);
    if (!e.identity.empty()) {
      fmt::format_to(it, ", \"identity\": \"{}\"", escape(e.identity));
    }
    out += '}';
    first = false;
  }
  out += "]}\n";
  return out;
}

std::ostream& operator<<(std::ostream& os, const node_entry& entry) {
  return os << "node: " << entry.node << ", pnn: " << entry.pnn
            << ", in_nodes: " << entry.in_nodes
            << ", identity: " << entry.identity;
}

}  // namespace nodesync::meta
