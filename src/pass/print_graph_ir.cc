/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

/*!
 * \file print_graph_ir.cc
 * \brief Print the graph IR in LLVM style human readable format.
 */
#include <ripple/graph.h>
#include <ripple/graph_attr_types.h>
#include <ripple/pass.h>

#include <functional>
#include <map>
#include <sstream>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

namespace ripple {
namespace pass {
namespace {

// prints one value of a per-entry graph attribute
using EntryAttrPrinter = std::function<void(uint32_t eid, std::ostream& os)>;  // NOLINT(*)

template <typename T>
EntryAttrPrinter MakeEntryAttrPrinter(const T& vec) {
  return [&vec](uint32_t eid, std::ostream& os) {  // NOLINT(*)
    os << vec[eid];
  };
}

EntryAttrPrinter GetEntryAttrPrinter(const Graph& graph, const std::string& key) {
  auto it = graph.attrs.find(key);
  CHECK(it != graph.attrs.end()) << "Cannot find " << key << " in graph attr";
  const any& value = *(it->second);
  if (value.type() == typeid(AliasInfo)) {
    return MakeEntryAttrPrinter(ripple::get<AliasInfo>(value).storage);
  } else if (value.type() == typeid(LivenessInfo)) {
    return MakeEntryAttrPrinter(ripple::get<LivenessInfo>(value).last_read);
  } else if (value.type() == typeid(std::vector<uint32_t>)) {
    return MakeEntryAttrPrinter(ripple::get<std::vector<uint32_t> >(value));
  } else if (value.type() == typeid(std::vector<int>)) {
    return MakeEntryAttrPrinter(ripple::get<std::vector<int> >(value));
  } else if (value.type() == typeid(std::vector<std::string>)) {
    return MakeEntryAttrPrinter(ripple::get<std::vector<std::string> >(value));
  }
  LOG(FATAL) << "Cannot print graph attribute " << key << " of type " << value.type().name();
  return nullptr;
}

class IRPrinter {
 public:
  IRPrinter(const Graph& graph, std::ostream& os)  // NOLINT(*)
      : idx_(graph.indexed_graph()), os_(os) {}

  void JoinEntryAttr(const std::string& key, EntryAttrPrinter fp) {
    joined_.emplace_back(key, std::move(fp));
  }

  void Print() {
    const std::vector<uint32_t>& inputs = idx_.input_nodes();
    os_ << "Graph(";
    for (size_t i = 0; i < inputs.size(); ++i) {
      if (i != 0) os_ << (inputs.size() < 4 ? ", " : ",\n      ");
      os_ << '%' << idx_[inputs[i]].source->attrs.name;
    }
    os_ << ") {\n";
    // inputs only get a line of their own to carry the joined attributes
    if (joined_.size() != 0) {
      for (uint32_t nid : inputs) {
        os_ << "  %" << idx_[nid].source->attrs.name;
        PrintJoined(nid);
        os_ << '\n';
      }
    }
    for (uint32_t nid = 0; nid < idx_.num_nodes(); ++nid) {
      if (idx_[nid].source->is_variable()) continue;
      PrintCall(nid);
    }
    os_ << "  ret ";
    PrintEntries(idx_.outputs());
    os_ << "\n}";
  }

 private:
  void PrintCall(uint32_t nid) {
    const IndexedGraph::Node& inode = idx_[nid];
    const Node* node = inode.source;
    os_ << "  ";
    if (node->num_outputs() != 0) os_ << '%' << nid << " = ";
    os_ << node->op()->name << '(';
    PrintEntries(inode.inputs);
    std::map<std::string, std::string> dict(node->attrs.dict.begin(), node->attrs.dict.end());
    bool first = inode.inputs.empty();
    for (const auto& kv : dict) {
      if (!first) os_ << ", ";
      first = false;
      os_ << kv.first << "=\'" << kv.second << "\'";
    }
    os_ << ')';
    PrintJoined(nid);
    os_ << '\n';
  }

  void PrintEntries(const std::vector<IndexedGraph::NodeEntry>& entries) {
    for (size_t i = 0; i < entries.size(); ++i) {
      if (i != 0) os_ << ", ";
      PrintEntry(entries[i]);
    }
  }

  // variables print by name, calls by position, multi-output calls with the index
  void PrintEntry(const IndexedGraph::NodeEntry& e) {
    const Node* node = idx_[e.node_id].source;
    if (node->is_variable()) {
      os_ << '%' << node->attrs.name;
    } else if (node->num_outputs() == 1) {
      os_ << '%' << e.node_id;
    } else {
      os_ << '%' << e.node_id << '.' << e.index;
    }
  }

  void PrintJoined(uint32_t nid) {
    uint32_t num_outputs = idx_[nid].source->num_outputs();
    for (const auto& kv : joined_) {
      os_ << ", " << kv.first << '=';
      if (num_outputs == 1) {
        kv.second(idx_.entry_id(nid, 0), os_);
        continue;
      }
      os_ << '[';
      for (uint32_t i = 0; i < num_outputs; ++i) {
        if (i != 0) os_ << ", ";
        kv.second(idx_.entry_id(nid, i), os_);
      }
      os_ << ']';
    }
  }

  const IndexedGraph& idx_;
  std::ostream& os_;
  std::vector<std::pair<std::string, EntryAttrPrinter> > joined_;
};

// print the graph to ret.attrs["graphir"]
Graph PrintGraphIRPass(Graph src) {
  std::vector<std::string> join_entry_attrs;
  if (src.attrs.count("join_entry_attrs") != 0) {
    join_entry_attrs = src.MoveCopyAttr<std::vector<std::string> >("join_entry_attrs");
  }
  std::ostringstream os;
  IRPrinter printer(src, os);
  for (const std::string& key : join_entry_attrs) {
    printer.JoinEntryAttr(key, GetEntryAttrPrinter(src, key));
  }
  printer.Print();
  Graph ret;
  ret.attrs["graphir"] = std::make_shared<any>(os.str());
  return ret;
}

RIPPLE_REGISTER_PASS(PrintGraphIR)
.describe("Render the graph as text into ret.attrs[\"graphir\"], return an otherwise empty graph.")
.set_body(PrintGraphIRPass)
.provide_graph_attr("graphir");

}  // namespace
}  // namespace pass
}  // namespace ripple
