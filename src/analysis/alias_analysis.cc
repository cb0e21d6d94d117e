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
 * \file alias_analysis.cc
 * \brief Group node entries by the storage they share.
 */
#include <ripple/graph.h>
#include <ripple/graph_attr_types.h>
#include <ripple/op_attr_types.h>
#include <ripple/pass.h>

namespace ripple {
namespace pass {
namespace {

// forward pass over program order, a view or a returned self joins the
// storage of its input 0, everything else starts a new storage.
Graph AnalyzeAlias(Graph ret) {
  static auto& is_view = Op::GetAttr<TIsView>("TIsView");
  static auto& returns_self = Op::GetAttr<TReturnsSelf>("TReturnsSelf");
  const IndexedGraph& idx = ret.indexed_graph();

  AliasInfo info;
  info.view_parent.resize(idx.num_node_entries(), kNoEntry);
  info.base.resize(idx.num_node_entries(), kNoEntry);
  info.storage.resize(idx.num_node_entries(), kNoEntry);

  for (uint32_t nid = 0; nid < idx.num_nodes(); ++nid) {
    const auto& inode = idx[nid];
    const Node* source = inode.source;
    bool alias_input0 = false;
    if (!source->is_variable() && inode.inputs.size() != 0 &&
        source->num_outputs() != 0) {
      alias_input0 = is_view.get(source->op(), false) ||
          returns_self.get(source->op(), false);
    }
    for (uint32_t i = 0; i < source->num_outputs(); ++i) {
      uint32_t eid = idx.entry_id(nid, i);
      if (i == 0 && alias_input0) {
        uint32_t parent = idx.entry_id(inode.inputs[0]);
        info.view_parent[eid] = parent;
        info.base[eid] = info.base[parent];
        info.storage[eid] = info.storage[parent];
        info.storage_entries[info.storage[eid]].push_back(eid);
      } else {
        info.base[eid] = eid;
        info.storage[eid] = static_cast<uint32_t>(info.storage_entries.size());
        info.storage_entries.emplace_back(std::vector<uint32_t>{eid});
        info.storage_has_input.push_back(source->is_variable());
      }
    }
  }
  ret.attrs["alias_info"] = std::make_shared<any>(std::move(info));
  return ret;
}

RIPPLE_REGISTER_PASS(AnalyzeAlias)
.describe("Compute the view parent, base and storage class of each node entry.")
.set_body(AnalyzeAlias)
.set_change_graph(false)
.depend_op_attr("TIsView")
.depend_op_attr("TReturnsSelf")
.provide_graph_attr("alias_info");

}  // namespace
}  // namespace pass
}  // namespace ripple
