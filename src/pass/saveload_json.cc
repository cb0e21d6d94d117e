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
 * \file saveload_json.cc
 * \brief Save and load graph to/from JSON file.
 */
#include <ripple/pass.h>
#include <dmlc/json.h>
#include <memory>
#include <algorithm>
#include <map>
#include <sstream>

namespace ripple {
namespace pass {
namespace {

// auxiliary node structure for serialization.
struct JSONNode {
  // the node entry structure in serialized format
  struct Entry {
    uint32_t node_id;
    uint32_t index;
    Entry() = default;
    Entry(uint32_t node_id, uint32_t index):
      node_id(node_id), index(index) {
    }
    void Save(dmlc::JSONWriter *writer) const {
      writer->BeginArray(false);
      writer->WriteArrayItem(node_id);
      writer->WriteArrayItem(index);
      writer->EndArray();
    }
    void Load(dmlc::JSONReader *reader) {
      reader->BeginArray();
      CHECK(reader->NextArrayItem()) << "invalid json format";
      reader->Read(&node_id);
      CHECK(reader->NextArrayItem()) << "invalid json format";
      reader->Read(&index);
      CHECK(!reader->NextArrayItem()) << "invalid json format";
    }
  };

  // operator name, "null" for graph inputs
  std::string op_type_str;
  // name of the node
  std::string name;
  // attributes
  std::map<std::string, std::string> dict;
  // inputs
  std::vector<Entry> inputs;

  // function to save JSON node.
  void Save(dmlc::JSONWriter *writer) const {
    writer->BeginObject();
    writer->WriteObjectKeyValue("op", op_type_str);
    writer->WriteObjectKeyValue("name", name);
    if (dict.size() != 0) {
      writer->WriteObjectKeyValue("attrs", dict);
    }
    writer->WriteObjectKeyValue("inputs", inputs);
    writer->EndObject();
  }

  void Load(dmlc::JSONReader *reader) {
    dict.clear();
    dmlc::JSONObjectReadHelper helper;
    helper.DeclareField("op", &op_type_str);
    helper.DeclareField("name", &name);
    helper.DeclareField("inputs", &inputs);
    helper.DeclareOptionalField("attrs", &dict);
    helper.ReadAllFields(reader);
  }
};

// graph structure to help read/save JSON.
struct JSONGraph {
  std::vector<JSONNode> nodes;
  std::vector<uint32_t> arg_nodes;
  std::vector<JSONNode::Entry> heads;

  void Save(dmlc::JSONWriter *writer) const {
    writer->BeginObject();
    writer->WriteObjectKeyValue("nodes", nodes);
    writer->WriteObjectKeyValue("arg_nodes", arg_nodes);
    writer->WriteObjectKeyValue("heads", heads);
    writer->EndObject();
  }

  void Load(dmlc::JSONReader *reader) {
    dmlc::JSONObjectReadHelper helper;
    helper.DeclareField("nodes", &nodes);
    helper.DeclareOptionalField("arg_nodes", &arg_nodes);
    helper.DeclareField("heads", &heads);
    helper.ReadAllFields(reader);
  }
};

void Graph2JSONGraph(const Graph& src, JSONGraph *jgraph) {
  const IndexedGraph& idx = src.indexed_graph();
  for (uint32_t nid = 0; nid < idx.num_nodes(); ++nid) {
    const Node* n = idx[nid].source;
    if (n->is_variable()) {
      jgraph->arg_nodes.push_back(nid);
    }
    JSONNode jnode;
    jnode.op_type_str = n->is_variable() ? "null" : n->op()->name;
    jnode.name = n->attrs.name;
    // write attributes in order;
    jnode.dict.insert(n->attrs.dict.begin(), n->attrs.dict.end());
    jnode.inputs.reserve(n->inputs.size());
    for (const auto& e : idx[nid].inputs) {
      jnode.inputs.emplace_back(e.node_id, e.index);
    }
    jgraph->nodes.emplace_back(std::move(jnode));
  }
  for (const auto& e : idx.outputs()) {
    jgraph->heads.emplace_back(e.node_id, e.index);
  }
}

Graph JSONGraph2Graph(const JSONGraph &jgraph) {
  Graph ret;
  std::vector<NodePtr> nodes;
  for (const JSONNode &n : jgraph.nodes) {
    std::vector<NodeEntry> inputs;
    for (const JSONNode::Entry &e : n.inputs) {
      CHECK_LT(e.node_id, nodes.size())
          << "node " << n.name << " reads node " << e.node_id
          << " which is not defined before it";
      inputs.emplace_back(nodes[e.node_id], e.index);
    }
    if (n.op_type_str == "null") {
      CHECK(inputs.empty()) << "graph input " << n.name << " cannot have inputs";
      nodes.push_back(ret.AddVariable(n.name).node);
      continue;
    }
    const Op* op = nullptr;
    try {
      op = Op::Get(n.op_type_str);
    } catch (const dmlc::Error &err) {
      std::ostringstream os;
      os << "Failed loading Op " << n.name
         << " of type " << n.op_type_str << ": " << err.what();
      throw dmlc::Error(os.str());
    }
    // rebuild attribute parser
    nodes.push_back(ret.AddNode(
        op, n.name, std::move(inputs),
        std::unordered_map<std::string, std::string>(n.dict.begin(), n.dict.end())));
  }
  // consistency check
  for (uint32_t nid : jgraph.arg_nodes) {
    CHECK(nid < nodes.size());
    CHECK(nodes[nid]->is_variable());
  }
  for (const JSONNode::Entry &e : jgraph.heads) {
    CHECK(e.node_id < nodes.size())
        << "graph output refers to node " << e.node_id << " which does not exist";
    CHECK_LT(e.index, nodes[e.node_id]->num_outputs())
        << "graph output refers to output " << e.index << " of node "
        << nodes[e.node_id]->attrs.name;
    ret.outputs.emplace_back(nodes[e.node_id], e.index);
  }
  ret.indexed_graph();
  return ret;
}

// Load a graph from JSON file.
Graph LoadJSON(Graph src) {
  CHECK_NE(src.attrs.count("json"), 0U)
      << "Load JSON require json to be presented.";
  const std::string &json_str =
      ripple::get<std::string>(*src.attrs.at("json"));
  std::istringstream is(json_str);
  dmlc::JSONReader reader(&is);
  JSONGraph jgraph;
  // load in json graph.
  jgraph.Load(&reader);
  return JSONGraph2Graph(jgraph);
}

// save a graph to json
Graph SaveJSON(Graph src) {
  JSONGraph jgraph;
  Graph2JSONGraph(src, &jgraph);
  std::ostringstream os;
  dmlc::JSONWriter writer(&os);
  jgraph.Save(&writer);
  Graph ret;
  ret.attrs["json"] = std::make_shared<any>(os.str());
  return ret;
}

// register pass
RIPPLE_REGISTER_PASS(LoadJSON)
.describe("Return a new Graph, loaded from src.attrs[\"json\"]")
.set_body(LoadJSON)
.set_change_graph(true)
.depend_graph_attr("json");

RIPPLE_REGISTER_PASS(SaveJSON)
.describe("Return a new empty Graph. Save graph to ret.attrs[\"json\"]")
.set_body(SaveJSON)
.set_change_graph(true)
.provide_graph_attr("json");

}  // namespace
}  // namespace pass
}  // namespace ripple
