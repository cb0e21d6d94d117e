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
 * \file ripple/graph.h
 * \brief Configuation of ripple as well as basic data structure.
 */
#ifndef RIPPLE_GRAPH_H_
#define RIPPLE_GRAPH_H_

#include <vector>
#include <string>
#include <utility>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include "./base.h"
#include "./node.h"

namespace ripple {

class IndexedGraph;

/*!
 * \brief Computation graph in program order.
 *  This is the intermediate representation for optimization pass.
 *
 *  Unlike a purely dataflow graph, the order of nodes is part of the
 *  program: a mutating node such as copy_ takes effect at its position
 *  even when nothing reads its output.
 *
 *  The graph maintains the use list of every node output. All structural
 *  changes go through the member functions below so that the use lists
 *  always match the inputs of the nodes. Copies of a Graph share nodes,
 *  so a structural change through one copy leaves the others stale.
 */
class Graph {
 public:
  /*! \brief a read of a node output by the input slot of another node */
  struct Use {
    /*! \brief the reading node */
    Node* node;
    /*! \brief the input slot of the reading node */
    uint32_t input_index;
  };
  /*! \brief outputs of the computation graph. */
  std::vector<NodeEntry> outputs;
  /*!
   * \brief attributes of a graph
   *  Analysis results and pass options are stored here.
   */
  std::unordered_map<std::string, std::shared_ptr<any> > attrs;
  /*!
   * \brief Get the immutable attribute from attrs.
   * \param attr_name the name of the attribute
   * \return the reference to corresponding attribute
   * \tparam T the type of the attribute.
   */
  template<typename T>
  inline const T& GetAttr(const std::string& attr_name) const;
  /*!
   * \brief Check whether has a specific attribute.
   * \param attr_name the name of the attribute
   * \return a boolean result
   */
  inline bool HasAttr(const std::string& attr_name) const;
  /*!
   * \brief Get a move copy of the attribute, implement copy on write semantics.
   *  The content is moved if the reference counter of shared_ptr is 1.
   *  The attribute is erased from attrs after the call.
   *
   * \param attr_name the name of the attribute
   * \return a new copy of the corresponding attribute.
   * \tparam T the type of the attribute.
   */
  template<typename T>
  inline T MoveCopyAttr(const std::string& attr_name);
  /*!
   * \brief get a indexed graph of current graph, if not exist, create it on demand
   *  The indexed graph is dropped whenever the structure of the graph changes.
   * \return The indexed graph.
   * \sa IndexedGraph
   */
  const IndexedGraph& indexed_graph() const;
  /*! \return all the nodes of the graph in program order */
  inline const std::vector<NodePtr>& nodes() const {
    return nodes_;
  }
  /*!
   * \brief Append a graph input.
   * \param name The name of the input.
   * \return The entry of the new input.
   */
  NodeEntry AddVariable(const std::string& name);
  /*!
   * \brief Append a call to the end of the program.
   *  Runs the attribute parser of the operator and checks the input arity.
   * \param op The operator.
   * \param name The name of the node.
   * \param inputs The inputs, which must already be part of the graph.
   * \param dict The string attributes.
   * \return The created node.
   */
  NodePtr AddNode(const Op* op,
                  const std::string& name,
                  std::vector<NodeEntry> inputs,
                  std::unordered_map<std::string, std::string> dict = {});
  /*!
   * \brief Insert a call immediately before anchor.
   * \param anchor The node that comes right after the new node.
   * \param op The operator.
   * \param name The name of the node.
   * \param inputs The inputs.
   * \param dict The string attributes.
   * \return The created node.
   */
  NodePtr InsertNodeBefore(const Node* anchor,
                           const Op* op,
                           const std::string& name,
                           std::vector<NodeEntry> inputs,
                           std::unordered_map<std::string, std::string> dict = {});
  /*!
   * \brief Put a new node at the program position of old_node and drop old_node.
   *  Uses of old_node outputs must have been redirected before the call.
   * \param old_node The node to replace.
   * \param new_node The node taking its position, not yet part of the graph.
   */
  void ReplaceNode(const Node* old_node, NodePtr new_node);
  /*!
   * \brief Point input slot i of node to entry.
   * \param node The node to change.
   * \param i The input slot.
   * \param entry The new input.
   */
  void SetInput(Node* node, uint32_t i, NodeEntry entry);
  /*!
   * \brief Redirect every read of old_entry, including graph outputs, to new_entry.
   * \param old_entry The replaced value.
   * \param new_entry The replacement value.
   */
  void ReplaceAllUsesWith(const NodeEntry& old_entry, const NodeEntry& new_entry);
  /*!
   * \brief Remove a node whose outputs have no use.
   * \param node The node to remove.
   */
  void EraseNode(const Node* node);
  /*!
   * \brief Get the reads of a node output.
   * \param entry The node output.
   * \return The uses, graph outputs are not included.
   */
  const std::vector<Use>& uses(const NodeEntry& entry) const;
  /*!
   * \brief Get the nodes reading a node output, each node once.
   * \param entry The node output.
   * \return The reading nodes in the order their first read was added.
   */
  std::vector<Node*> users(const NodeEntry& entry) const;
  /*!
   * \brief Check whether a node belongs to the graph.
   * \param node The node.
   * \return whether the node is in the graph.
   */
  inline bool Contains(const Node* node) const {
    return uses_.count(node) != 0;
  }

 private:
  // insert a created node at the position
  void Insert(std::vector<NodePtr>::iterator pos, const NodePtr& node);
  // position of a node
  std::vector<NodePtr>::iterator Find(const Node* node);
  // register the reads done by node
  void AddUses(Node* node);
  // drop the reads done by node
  void RemoveUses(Node* node);
  // drop cached indexed graph
  inline void Invalidate() {
    indexed_graph_.reset();
  }
  /*! \brief nodes in program order */
  std::vector<NodePtr> nodes_;
  /*! \brief use list of each output of each node */
  std::unordered_map<const Node*, std::vector<std::vector<Use> > > uses_;
  // internal structure of indexed graph
  mutable std::shared_ptr<const IndexedGraph> indexed_graph_;
};

/*!
 * \brief Auxiliary data structure to index a graph.
 *  It maps Nodes in the graph to consecutive integers node_id.
 *  It also maps IndexedGraph::NodeEntry to consecutive integer entry_id.
 *  This allows storing properties of Node and NodeEntry into
 *  compact vector and quickly access them without resorting to hashmap.
 *
 *  The node_id of a node is its position in program order.
 */
class IndexedGraph {
 public:
  /*! \brief represents a data in the graph */
  struct NodeEntry {
    /*! \brief the source node id in the computation graph */
    uint32_t node_id;
    /*! \brief index of output from the source. */
    uint32_t index;
  };
  /*! \brief Node data structure in IndexedGraph */
  struct Node {
    /*! \brief pointer to the source node */
    const ripple::Node* source;
    /*! \brief inputs to the node */
    array_view<NodeEntry> inputs;
    /*! \brief weak reference to node */
    std::weak_ptr<ripple::Node> weak_ref;
  };
  /*! \return number of nodes in the graph */
  inline size_t num_nodes() const {
    return nodes_.size();
  }
  /*! \return total number of NodeEntry in the graph */
  inline size_t num_node_entries() const {
    return entry_rptr_.back();
  }
  /*!
   * \brief Get a unique entry id between 0 to num_node_entries()
   *  for a given IndexedGraph::NodeEntry
   * \param node_id The node index
   * \param index the output index
   * \return the unique index.
   */
  inline uint32_t entry_id(uint32_t node_id, uint32_t index) const {
    return entry_rptr_[node_id] + index;
  }
  /*!
   * \brief Get a unique entry id between 0 to num_node_entries()
   *  for a given IndexedGraph::NodeEntry
   * \param e The entry to query for index.
   * \return the unique index.
   */
  inline uint32_t entry_id(const NodeEntry& e) const {
    return entry_rptr_[e.node_id] + e.index;
  }
  /*!
   * \brief Get a unique entry id between 0 to num_node_entries()
   *  for a given NodeEntry.
   * \param e The entry to query for index.
   * \return the unique index.
   */
  inline uint32_t entry_id(const ripple::NodeEntry& e) const {
    return entry_rptr_[node_id(e.node.get())] + e.index;
  }
  /*!
   * \brief Get the node id owning an entry id.
   * \param eid The entry id.
   * \return the node id.
   */
  inline uint32_t entry_node(uint32_t eid) const {
    return entry_node_[eid];
  }
  /*!
   * \brief Get the corresponding node id for a given Node in the IndexedGraph.
   * \param node The Node to query for index.
   * \return the node index.
   */
  inline uint32_t node_id(const ripple::Node* node) const {
    auto it = node2index_.find(node);
    CHECK(it != node2index_.end())
        << "Node " << node->attrs.name << " is not part of the indexed graph";
    return it->second;
  }
  /*!
   * \brief Get the corresponding Node structure for a given node_id.
   * \param node_id The node id
   * \return const reference to the corresponding IndexedGraph::Node
   */
  inline const Node& operator[](uint32_t node_id) const {
    return nodes_[node_id];
  }
  /*!
   * \brief Get the corresponding Node structure
   * \param source The pointer to the Node structure
   * \return const reference to the corresponding IndexedGraph::Node
   */
  inline const Node& operator[](const ripple::Node* source) const {
    return nodes_[node_id(source)];
  }
  /*! \return list of argument nodes */
  inline const std::vector<uint32_t>& input_nodes() const {
    return input_nodes_;
  }
  /*! \return list of output entries */
  inline const std::vector<NodeEntry>& outputs() const {
    return outputs_;
  }
  /*!
   * \brief Get the ids of the nodes reading an entry.
   * \param eid The entry id.
   * \return sorted node ids, each reader once, graph outputs excluded.
   */
  inline const std::vector<uint32_t>& users(uint32_t eid) const {
    return users_[eid];
  }
  /*!
   * \brief Check whether an entry is an output of the graph.
   * \param eid The entry id.
   * \return whether it is an output.
   */
  inline bool is_output(uint32_t eid) const {
    return is_output_[eid];
  }
  /*! \return whether a node exists in the indexed graph */
  inline bool exist(const ripple::Node* node) const {
    return node2index_.count(node);
  }

  // disalllow copy assign
  IndexedGraph(const IndexedGraph&) = delete;

 private:
  friend class Graph;
  /*!
   * \brief Constructor an IndexedGraph from normal Graph
   * \param other The source graph.
   */
  explicit IndexedGraph(const Graph& other);
  // Node pointers in CSR structure.
  std::vector<Node> nodes_;
  // Index to all input nodes.
  std::vector<uint32_t> input_nodes_;
  // space to store the outputs entries
  std::vector<NodeEntry> outputs_;
  // mapping from node to index.
  std::unordered_map<const ripple::Node*, uint32_t> node2index_;
  // CSR pointer of node entries
  std::vector<size_t> entry_rptr_;
  // owner node of each entry
  std::vector<uint32_t> entry_node_;
  // space to store input entries of each
  std::vector<NodeEntry> input_entries_;
  // readers of each entry
  std::vector<std::vector<uint32_t> > users_;
  // whether each entry is a graph output
  std::vector<bool> is_output_;
};

// inline function implementations
template<typename T>
inline const T& Graph::GetAttr(const std::string& attr_name) const {
  auto it = attrs.find(attr_name);
  CHECK(it != attrs.end())
      << "Cannot find attribute " << attr_name << " in the graph";
  return ripple::unsafe_get<T>(*it->second);
}

inline bool Graph::HasAttr(const std::string& attr_name) const {
  auto it = attrs.find(attr_name);
  return it != attrs.end();
}

template<typename T>
inline T Graph::MoveCopyAttr(const std::string& attr_name) {
  auto it = attrs.find(attr_name);
  CHECK(it != attrs.end())
      << "Cannot find attribute " << attr_name << " in the graph";
  std::shared_ptr<any> sptr = it->second;
  attrs.erase(it);
  if (sptr.unique()) {
    return std::move(ripple::get<T>(*sptr));
  } else {
    return ripple::get<T>(*sptr);
  }
}

}  // namespace ripple

#endif  // RIPPLE_GRAPH_H_
