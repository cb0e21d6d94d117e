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
 * \file ripple/pass_functions.h
 * \brief Pass functions that simply redirect the calls to ApplyPass
 *
 *  This file serves as documentation on how to use functions implemented in "src/pass".
 *  It is totally optional to add these functions when you add a new pass, since
 *  ApplyPass can be directly called.
 */
#ifndef RIPPLE_PASS_FUNCTIONS_H_
#define RIPPLE_PASS_FUNCTIONS_H_

#include <string>
#include <memory>
#include <vector>
#include <utility>
#include "./base.h"
#include "./pass.h"
#include "./diagnostics.h"
#include "./graph_attr_types.h"

namespace ripple {
namespace pass {

/*!
 * \brief Load a graph from JSON string, redirects to "LoadJSON" pass.
 * \param json_str The json string.
 * \return Loaded graph.
 */
inline Graph LoadJSON(const std::string& json_str) {
  Graph ret;
  ret.attrs["json"] = std::make_shared<any>(json_str);
  return ApplyPass(ret, "LoadJSON");
}

/*!
 * \brief Save a graph to json, redirects to "SaveJSON" pass.
 * \param graph The to be saved.
 * \return The json string.
 */
inline std::string SaveJSON(Graph graph) {
  Graph ret = ApplyPass(std::move(graph), "SaveJSON");
  return ret.GetAttr<std::string>("json");
}

/*!
 * \brief Render the graph as text, redirects to "PrintGraphIR" pass.
 * \param graph The graph to be printed.
 * \return The text.
 */
inline std::string PrintGraphIR(Graph graph) {
  Graph ret = ApplyPass(std::move(graph), "PrintGraphIR");
  return ret.GetAttr<std::string>("graphir");
}

/*!
 * \brief Group the node entries of the graph by storage.
 * \param graph source graph
 * \return A graph with new attribute "alias_info" of type AliasInfo.
 */
inline Graph AnalyzeAlias(Graph graph) {
  return ApplyPass(std::move(graph), "AnalyzeAlias");
}

/*!
 * \brief Compute the last read of the node entries of the graph.
 * \param graph source graph, analyzed by AnalyzeAlias
 * \return A graph with new attribute "liveness" of type LivenessInfo.
 */
inline Graph AnalyzeLiveness(Graph graph) {
  return ApplyPass(std::move(graph), "AnalyzeLiveness");
}

/*!
 * \brief Turn out-of-place calls of the graph into mutating calls where it is safe.
 *
 *  Runs AnalyzeAlias, AnalyzeLiveness and Reinplace over graph. The nodes
 *  of graph are rewritten in place, other copies of graph are left stale.
 *
 * \param graph The graph to rewrite.
 * \param counters Receives the number of clones forced by a live alias,
 *        nullptr to report nowhere.
 * \param options Options of the pass, see ReinplaceParam.
 */
inline void Reinplace(Graph* graph,
                      DiagnosticCounters* counters = DiagnosticCounters::Global(),
                      PassOptions options = PassOptions()) {
  graph->attrs["diagnostic_counters"] = std::make_shared<any>(counters);
  if (options.size() != 0) {
    graph->attrs["reinplace_options"] = std::make_shared<any>(std::move(options));
  }
  // copied so that graph keeps its nodes when a pass throws
  *graph = ApplyPasses(*graph, {"AnalyzeAlias", "AnalyzeLiveness", "Reinplace"});
  graph->attrs.erase("diagnostic_counters");
  graph->attrs.erase("reinplace_options");
}

}  // namespace pass
}  // namespace ripple
#endif  // RIPPLE_PASS_FUNCTIONS_H_
