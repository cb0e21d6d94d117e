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

#include <dmlc/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <ripple/graph.h>
#include <ripple/graph_attr_types.h>
#include <ripple/pass_functions.h>

#include "./test_ops.h"

namespace ripple {
namespace cpptest {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

Graph Analyze(Graph g) {
  return ApplyPasses(g, {"AnalyzeAlias", "AnalyzeLiveness"});
}

TEST(Liveness, LastRead) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry a = Call(&g, "sin", "a", {x});
  NodeEntry b = Call(&g, "cos", "b", {a});
  NodeEntry unused = Call(&g, "sin", "unused", {x});
  g.outputs = {b};

  g = Analyze(g);
  const IndexedGraph& idx = g.indexed_graph();
  const LivenessInfo& live = g.GetAttr<LivenessInfo>("liveness");
  EXPECT_EQ(live.num_nodes, 4U);
  EXPECT_EQ(live.last_read[idx.entry_id(x)], 3U);
  EXPECT_EQ(live.last_read[idx.entry_id(a)], 2U);
  EXPECT_EQ(live.last_read[idx.entry_id(b)], 4U);
  // never read, dead right after its producer
  EXPECT_EQ(live.last_read[idx.entry_id(unused)], 3U);
  EXPECT_EQ(live.def[idx.entry_id(b)], 2U);

  EXPECT_TRUE(live.IsLiveAfter(idx.entry_id(a), 1));
  EXPECT_FALSE(live.IsLiveAfter(idx.entry_id(a), 2));
  EXPECT_FALSE(live.IsLiveAfter(idx.entry_id(b), 1));
  EXPECT_TRUE(live.IsLiveAfter(idx.entry_id(b), 3));
  EXPECT_THAT(live.LiveAfter(1), ElementsAre(idx.entry_id(x), idx.entry_id(a)));
  EXPECT_THAT(live.LiveAfter(2), ElementsAre(idx.entry_id(x), idx.entry_id(b)));
  EXPECT_THAT(live.LiveAfter(3), ElementsAre(idx.entry_id(b)));
}

TEST(Liveness, MetaOnlyReadsDoNotCount) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry a = Call(&g, "sin", "a", {x});
  NodeEntry b = Call(&g, "cos", "b", {a});
  NodeEntry n = Call(&g, "sym_size", "n", {a});
  g.outputs = {b, n};

  g = Analyze(g);
  const IndexedGraph& idx = g.indexed_graph();
  const LivenessInfo& live = g.GetAttr<LivenessInfo>("liveness");
  EXPECT_EQ(live.last_read[idx.entry_id(a)], 2U);
  EXPECT_FALSE(live.IsStorageLiveAfter(idx.entry_id(a), 2));
}

TEST(Liveness, ViewsShareLiveness) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry a = Call(&g, "sin", "a", {x});
  NodeEntry v = Call(&g, "slice", "v", {a}, {{"begin", "0"}, {"end", "2"}});
  NodeEntry b = Call(&g, "cos", "b", {a});
  NodeEntry c = Call(&g, "sin", "c", {v});
  g.outputs = {b, c};

  g = Analyze(g);
  const IndexedGraph& idx = g.indexed_graph();
  const LivenessInfo& live = g.GetAttr<LivenessInfo>("liveness");
  uint32_t ea = idx.entry_id(a);
  uint32_t ev = idx.entry_id(v);
  // the slice itself is not a read of a.
  EXPECT_EQ(live.last_read[ea], 3U);
  EXPECT_EQ(live.last_read[ev], 4U);
  EXPECT_EQ(live.storage_last_read[ea], 4U);
  EXPECT_EQ(live.storage_last_read[ev], 4U);
  EXPECT_FALSE(live.IsLiveAfter(ea, 3));
  EXPECT_TRUE(live.IsStorageLiveAfter(ea, 3));
}

TEST(Liveness, GraphOutputsAreLive) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry a = Call(&g, "sin", "a", {x});
  NodeEntry v = Call(&g, "alias", "v", {a});
  NodeEntry b = Call(&g, "cos", "b", {a});
  g.outputs = {b, v};

  g = Analyze(g);
  const IndexedGraph& idx = g.indexed_graph();
  const LivenessInfo& live = g.GetAttr<LivenessInfo>("liveness");
  EXPECT_EQ(live.last_read[idx.entry_id(v)], 4U);
  EXPECT_TRUE(live.IsStorageLiveAfter(idx.entry_id(a), 3));
}

TEST(Liveness, RequiresAliasInfo) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  g.outputs = {x};
  try {
    ApplyPass(g, "AnalyzeLiveness");
    FAIL() << "AnalyzeLiveness ran without alias_info";
  } catch (const dmlc::Error& e) {
    EXPECT_THAT(e.what(), HasSubstr("provided by pass AnalyzeAlias"));
  }
}

}  // namespace cpptest
}  // namespace ripple

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  testing::FLAGS_gtest_death_test_style = "threadsafe";
  return RUN_ALL_TESTS();
}
