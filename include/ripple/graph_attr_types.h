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
 * \file ripple/graph_attr_types.h
 * \brief Data structures that can appear in graph attributes.
 */
#ifndef RIPPLE_GRAPH_ATTR_TYPES_H_
#define RIPPLE_GRAPH_ATTR_TYPES_H_

#include <vector>
#include <string>
#include <limits>
#include <unordered_map>
#include "./base.h"

namespace ripple {

/*!
 * \brief The result holder of JSON serializer
 *
 * \note Stored under ret.attrs["json"], provided by Pass "SaveJSON"

 * \code
 *  Graph ret = ApplyPass(src_graph, "SaveJSON");
 *  const JSONString& json = ret.GetAttr<JSONString>("json");
 * \endcode
 */
using JSONString = std::string;

/*!
 * \brief String options of a pass, parsed by the pass into its dmlc::Parameter.
 * \note Stored under graph.attrs["<pass>_options"], e.g. "reinplace_options".
 */
using PassOptions = std::unordered_map<std::string, std::string>;

/*! \brief marker of a missing entry id */
static const uint32_t kNoEntry = std::numeric_limits<uint32_t>::max();

/*!
 * \brief The storage sharing of each NodeEntry in the graph.
 * \note Stored under graph.attrs["alias_info"], provided by Pass "AnalyzeAlias"
 *
 * \code
 *  Graph g = ApplyPass(src_graph, "AnalyzeAlias");
 *  const AliasInfo& alias = g.GetAttr<AliasInfo>("alias_info");
 *  // get the base of an entry
 *  uint32_t base = alias.base[g.indexed_graph().entry_id(my_entry)];
 * \endcode
 */
struct AliasInfo {
  /*! \brief entry id of the view parent of each entry, kNoEntry for bases */
  std::vector<uint32_t> view_parent;
  /*! \brief entry id of the base of each entry */
  std::vector<uint32_t> base;
  /*! \brief storage class of each entry */
  std::vector<uint32_t> storage;
  /*! \brief entries of each storage class in program order */
  std::vector<std::vector<uint32_t> > storage_entries;
  /*! \brief whether each storage class contains a graph input */
  std::vector<bool> storage_has_input;
  /*! \return whether entry eid is a view of another entry */
  inline bool is_view(uint32_t eid) const {
    return view_parent[eid] != kNoEntry;
  }
  /*! \return whether two entries share storage */
  inline bool same_storage(uint32_t a, uint32_t b) const {
    return storage[a] == storage[b];
  }
  /*! \return whether entry eid shares storage with a graph input */
  inline bool aliases_input(uint32_t eid) const {
    return storage_has_input[storage[eid]];
  }
  /*! \return all entries sharing storage with eid, itself included */
  inline const std::vector<uint32_t>& aliases(uint32_t eid) const {
    return storage_entries[storage[eid]];
  }
};

/*!
 * \brief The last read of each NodeEntry in the graph.
 *
 *  Positions are node ids of the indexed graph. A graph output is read at
 *  position num_nodes. An entry that is never read has its producer as
 *  last read. Readers that only look at metadata do not count.
 *
 * \note Stored under graph.attrs["liveness"], provided by Pass "AnalyzeLiveness"
 */
struct LivenessInfo {
  /*! \brief number of nodes of the analyzed graph */
  uint32_t num_nodes{0};
  /*! \brief producer node id of each entry */
  std::vector<uint32_t> def;
  /*! \brief position of the last data read of each entry */
  std::vector<uint32_t> last_read;
  /*! \brief last data read of any entry in the storage class of each entry */
  std::vector<uint32_t> storage_last_read;
  /*!
   * \brief Whether the contents of an entry are read after a node.
   * \param eid The entry id.
   * \param nid The node id.
   * \return whether the entry is live after the node.
   */
  inline bool IsLiveAfter(uint32_t eid, uint32_t nid) const {
    return def[eid] <= nid && last_read[eid] > nid;
  }
  /*!
   * \brief Whether any entry sharing storage with eid is read after a node.
   * \param eid The entry id.
   * \param nid The node id.
   * \return whether the storage is live after the node.
   */
  inline bool IsStorageLiveAfter(uint32_t eid, uint32_t nid) const {
    return storage_last_read[eid] > nid;
  }
  /*!
   * \brief Get the live set after a node.
   * \param nid The node id.
   * \return the entry ids defined at or before nid and read after it.
   */
  inline std::vector<uint32_t> LiveAfter(uint32_t nid) const {
    std::vector<uint32_t> ret;
    for (uint32_t eid = 0; eid < last_read.size(); ++eid) {
      if (IsLiveAfter(eid, nid)) ret.push_back(eid);
    }
    return ret;
  }
};

}  // namespace ripple

#endif  // RIPPLE_GRAPH_ATTR_TYPES_H_
