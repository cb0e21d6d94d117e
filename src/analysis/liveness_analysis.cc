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
 * \file liveness_analysis.cc
 * \brief Compute the last read of each node entry.
 */
#include <ripple/graph.h>
#include <ripple/graph_attr_types.h>
#include <ripple/op_attr_types.h>
#include <ripple/pass.h>
#include <algorithm>

namespace ripple {
namespace pass {
namespace {

// A view reader is not a data read by itself: the readers of the view
// are in the same storage class and are counted there.
inline bool IsDataRead(const Node* reader) {
  static auto& is_view = Op::GetAttr<TIsView>("TIsView");
  static auto& is_meta_only = Op::GetAttr<TIsMetaOnly>("TIsMetaOnly");
  if (reader->is_variable()) return false;
  return !is_meta_only.get(reader->op(), false) &&
      !is_view.get(reader->op(), false);
}

Graph AnalyzeLiveness(Graph ret) {
  const IndexedGraph& idx = ret.indexed_graph();
  const AliasInfo& alias = ret.GetAttr<AliasInfo>("alias_info");
  CHECK_EQ(alias.storage.size(), idx.num_node_entries())
      << "alias_info does not match the graph, rerun AnalyzeAlias";
  const uint32_t num_nodes = static_cast<uint32_t>(idx.num_nodes());

  LivenessInfo info;
  info.num_nodes = num_nodes;
  info.def.resize(idx.num_node_entries());
  for (uint32_t eid = 0; eid < idx.num_node_entries(); ++eid) {
    info.def[eid] = idx.entry_node(eid);
  }
  info.last_read = info.def;
  std::vector<bool> seen(idx.num_node_entries(), false);

  // graph outputs are read after the last node.
  for (const auto& e : idx.outputs()) {
    uint32_t eid = idx.entry_id(e);
    info.last_read[eid] = num_nodes;
    seen[eid] = true;
  }
  // backward traversal, the first read met is the last one.
  for (uint32_t nid = num_nodes; nid != 0; --nid) {
    const auto& inode = idx[nid - 1];
    if (!IsDataRead(inode.source)) continue;
    for (const auto& e : inode.inputs) {
      uint32_t eid = idx.entry_id(e);
      if (seen[eid]) continue;
      seen[eid] = true;
      info.last_read[eid] = nid - 1;
    }
  }
  // liveness is shared by the whole storage class.
  std::vector<uint32_t> class_last(alias.storage_entries.size(), 0);
  for (uint32_t sid = 0; sid < alias.storage_entries.size(); ++sid) {
    for (uint32_t eid : alias.storage_entries[sid]) {
      class_last[sid] = std::max(class_last[sid], info.last_read[eid]);
    }
  }
  info.storage_last_read.resize(idx.num_node_entries());
  for (uint32_t eid = 0; eid < idx.num_node_entries(); ++eid) {
    info.storage_last_read[eid] = class_last[alias.storage[eid]];
  }
  ret.attrs["liveness"] = std::make_shared<any>(std::move(info));
  return ret;
}

RIPPLE_REGISTER_PASS(AnalyzeLiveness)
.describe("Compute the last data read of each node entry and of its storage.")
.set_body(AnalyzeLiveness)
.set_change_graph(false)
.depend_graph_attr("alias_info")
.depend_op_attr("TIsMetaOnly")
.provide_graph_attr("liveness");

}  // namespace
}  // namespace pass
}  // namespace ripple
