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
 * \file graph.cc
 * \brief Graph data structure and its use lists.
 */
#include <ripple/graph.h>
#include <ripple/op_attr_types.h>
#include <limits>

namespace ripple {

const IndexedGraph& Graph::indexed_graph() const {
  if (indexed_graph_ == nullptr) {
    indexed_graph_.reset(new IndexedGraph(*this));
  }
  return *indexed_graph_;
}

NodeEntry Graph::AddVariable(const std::string& name) {
  NodePtr n = Node::Create(nullptr, name);
  this->Insert(nodes_.end(), n);
  return NodeEntry(n, 0);
}

NodePtr Graph::AddNode(const Op* op,
                       const std::string& name,
                       std::vector<NodeEntry> inputs,
                       std::unordered_map<std::string, std::string> dict) {
  CHECK(op != nullptr)
      << "Graph inputs are created by AddVariable, node " << name << " needs an operator";
  NodePtr n = Node::Create(op, name);
  n->attrs.dict = std::move(dict);
  if (op->attr_parser != nullptr) {
    op->attr_parser(&(n->attrs));
  }
  n->inputs = std::move(inputs);
  this->Insert(nodes_.end(), n);
  return n;
}

NodePtr Graph::InsertNodeBefore(const Node* anchor,
                                const Op* op,
                                const std::string& name,
                                std::vector<NodeEntry> inputs,
                                std::unordered_map<std::string, std::string> dict) {
  CHECK(op != nullptr);
  NodePtr n = Node::Create(op, name);
  n->attrs.dict = std::move(dict);
  if (op->attr_parser != nullptr) {
    op->attr_parser(&(n->attrs));
  }
  n->inputs = std::move(inputs);
  this->Insert(this->Find(anchor), n);
  return n;
}

void Graph::ReplaceNode(const Node* old_node, NodePtr new_node) {
  auto pos = this->Find(old_node);
  const std::vector<std::vector<Use> >& old_uses = uses_.at(old_node);
  for (uint32_t i = 0; i < old_uses.size(); ++i) {
    CHECK(old_uses[i].empty())
        << "Cannot replace node " << old_node->attrs.name
        << ": output " << i << " is still read by " << old_uses[i][0].node->attrs.name;
  }
  for (const NodeEntry& e : outputs) {
    CHECK(e.node.get() != old_node)
        << "Cannot replace node " << old_node->attrs.name << ": it is a graph output";
  }
  NodePtr keep = *pos;
  this->RemoveUses(keep.get());
  uses_.erase(old_node);
  pos = nodes_.erase(pos);
  this->Insert(pos, new_node);
}

void Graph::SetInput(Node* node, uint32_t i, NodeEntry entry) {
  CHECK(this->Contains(node))
      << "Node " << node->attrs.name << " is not part of the graph";
  CHECK_LT(i, node->inputs.size())
      << "Node " << node->attrs.name << " has no input " << i;
  CHECK(entry.node != nullptr && this->Contains(entry.node.get()))
      << "New input of " << node->attrs.name << " is not part of the graph";
  CHECK_LT(entry.index, entry.node->num_outputs());
  const NodeEntry& old = node->inputs[i];
  std::vector<Use>& old_uses = uses_.at(old.node.get())[old.index];
  for (auto it = old_uses.begin(); it != old_uses.end(); ++it) {
    if (it->node == node && it->input_index == i) {
      old_uses.erase(it);
      break;
    }
  }
  node->inputs[i] = std::move(entry);
  const NodeEntry& e = node->inputs[i];
  uses_.at(e.node.get())[e.index].push_back(Use{node, i});
  this->Invalidate();
}

void Graph::ReplaceAllUsesWith(const NodeEntry& old_entry, const NodeEntry& new_entry) {
  if (NodeEntryEqual()(old_entry, new_entry)) return;
  CHECK(this->Contains(old_entry.node.get()))
      << "Node " << old_entry.node->attrs.name << " is not part of the graph";
  CHECK(this->Contains(new_entry.node.get()))
      << "Node " << new_entry.node->attrs.name << " is not part of the graph";
  std::vector<Use> moved;
  moved.swap(uses_.at(old_entry.node.get())[old_entry.index]);
  std::vector<Use>& new_uses = uses_.at(new_entry.node.get())[new_entry.index];
  for (const Use& u : moved) {
    u.node->inputs[u.input_index] = new_entry;
    new_uses.push_back(u);
  }
  for (NodeEntry& e : outputs) {
    if (NodeEntryEqual()(e, old_entry)) e = new_entry;
  }
  this->Invalidate();
}

void Graph::EraseNode(const Node* node) {
  auto pos = this->Find(node);
  const std::vector<std::vector<Use> >& node_uses = uses_.at(node);
  for (uint32_t i = 0; i < node_uses.size(); ++i) {
    CHECK(node_uses[i].empty())
        << "Cannot erase node " << node->attrs.name
        << ": output " << i << " is still read by " << node_uses[i][0].node->attrs.name;
  }
  for (const NodeEntry& e : outputs) {
    CHECK(e.node.get() != node)
        << "Cannot erase node " << node->attrs.name << ": it is a graph output";
  }
  NodePtr keep = *pos;
  this->RemoveUses(keep.get());
  uses_.erase(node);
  nodes_.erase(pos);
  this->Invalidate();
}

const std::vector<Graph::Use>& Graph::uses(const NodeEntry& entry) const {
  auto it = uses_.find(entry.node.get());
  CHECK(it != uses_.end())
      << "Node " << entry.node->attrs.name << " is not part of the graph";
  CHECK_LT(entry.index, it->second.size());
  return it->second[entry.index];
}

std::vector<Node*> Graph::users(const NodeEntry& entry) const {
  std::vector<Node*> ret;
  for (const Use& u : this->uses(entry)) {
    if (std::find(ret.begin(), ret.end(), u.node) == ret.end()) {
      ret.push_back(u.node);
    }
  }
  return ret;
}

void Graph::Insert(std::vector<NodePtr>::iterator pos, const NodePtr& node) {
  CHECK(node != nullptr);
  CHECK(!this->Contains(node.get()))
      << "Node " << node->attrs.name << " is already part of the graph";
  if (!node->is_variable()) {
    uint32_t nin = node->num_inputs();
    if (nin != kVarg) {
      CHECK_EQ(node->inputs.size(), nin)
          << "Operator " << node->op()->name << " of node " << node->attrs.name
          << " expects " << nin << " inputs";
    }
  }
  for (const NodeEntry& e : node->inputs) {
    CHECK(e.node != nullptr)
        << "Node " << node->attrs.name << " has a null input";
    CHECK(this->Contains(e.node.get()))
        << "Node " << node->attrs.name << " reads " << e.node->attrs.name
        << " which is not part of the graph";
    CHECK_LT(e.index, e.node->num_outputs())
        << "Node " << node->attrs.name << " reads output " << e.index
        << " of " << e.node->attrs.name;
  }
  nodes_.insert(pos, node);
  uses_[node.get()].resize(node->num_outputs());
  this->AddUses(node.get());
  this->Invalidate();
}

std::vector<NodePtr>::iterator Graph::Find(const Node* node) {
  auto pos = std::find_if(nodes_.begin(), nodes_.end(),
                          [node](const NodePtr& n) { return n.get() == node; });
  CHECK(pos != nodes_.end())
      << "Node " << node->attrs.name << " is not part of the graph";
  return pos;
}

void Graph::AddUses(Node* node) {
  for (uint32_t i = 0; i < node->inputs.size(); ++i) {
    const NodeEntry& e = node->inputs[i];
    uses_.at(e.node.get())[e.index].push_back(Use{node, i});
  }
}

void Graph::RemoveUses(Node* node) {
  for (const NodeEntry& e : node->inputs) {
    auto it = uses_.find(e.node.get());
    if (it == uses_.end()) continue;
    std::vector<Use>& vec = it->second[e.index];
    vec.erase(std::remove_if(vec.begin(), vec.end(),
                             [node](const Use& u) { return u.node == node; }),
              vec.end());
  }
}

// implement constructor from graph
IndexedGraph::IndexedGraph(const Graph &g) {
  entry_rptr_.push_back(0);
  std::vector<size_t> inputs_rptr{0};

  for (const NodePtr& n : g.nodes()) {
    CHECK(n);
    CHECK_LT(nodes_.size(), std::numeric_limits<uint32_t>::max());
    uint32_t nid = static_cast<uint32_t>(nodes_.size());
    // nodes_
    IndexedGraph::Node new_node;
    new_node.source = n.get();
    new_node.weak_ref = n;
    nodes_.emplace_back(std::move(new_node));
    // arg_nodes_
    if (n->is_variable()) {
      input_nodes_.push_back(nid);
    }
    // input entries, every input must be defined earlier in program order
    for (const auto& e : n->inputs) {
      auto it = node2index_.find(e.node.get());
      CHECK(it != node2index_.end())
          << "Node " << n->attrs.name << " reads " << e.node->attrs.name
          << " which is not defined before it";
      CHECK_LT(e.index, e.node->num_outputs())
          << "Node " << n->attrs.name << " reads output " << e.index
          << " of " << e.node->attrs.name;
      input_entries_.emplace_back(NodeEntry{it->second, e.index});
    }
    inputs_rptr.push_back(input_entries_.size());
    // node2index_
    CHECK(node2index_.count(n.get()) == 0)
        << "Node " << n->attrs.name << " appears twice in the graph";
    node2index_[n.get()] = nid;
    // entry rptr
    entry_rptr_.push_back(entry_rptr_.back() + n->num_outputs());
    for (uint32_t i = 0; i < n->num_outputs(); ++i) {
      entry_node_.push_back(nid);
    }
  }

  for (const auto& e : g.outputs) {
    auto it = node2index_.find(e.node.get());
    CHECK(it != node2index_.end())
        << "Graph output " << e.node->attrs.name << " is not part of the graph";
    CHECK_LT(e.index, e.node->num_outputs());
    outputs_.emplace_back(NodeEntry{it->second, e.index});
  }

  // setup array view
  // input_entries_ must not change after this step.
  const NodeEntry* iptr = dmlc::BeginPtr(input_entries_);
  for (size_t nid = 0; nid < nodes_.size(); ++nid) {
    nodes_[nid].inputs = array_view<NodeEntry>(
        iptr + inputs_rptr[nid], iptr + inputs_rptr[nid + 1]);
  }

  users_.resize(this->num_node_entries());
  is_output_.resize(this->num_node_entries(), false);
  for (uint32_t nid = 0; nid < nodes_.size(); ++nid) {
    for (const NodeEntry& e : nodes_[nid].inputs) {
      std::vector<uint32_t>& vec = users_[this->entry_id(e)];
      if (vec.empty() || vec.back() != nid) vec.push_back(nid);
    }
  }
  for (const NodeEntry& e : outputs_) {
    is_output_[this->entry_id(e)] = true;
  }
}

}  // namespace ripple
