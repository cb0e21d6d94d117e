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
using ::testing::UnorderedElementsAre;

TEST(AliasAnalysis, ViewChains) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry v = Call(&g, "slice", "v", {x}, {{"begin", "1"}, {"end", "4"}});
  NodeEntry w = Call(&g, "select", "w", {v}, {{"index", "0"}});
  NodeEntry c = Call(&g, "clone", "c", {w});
  NodeEntry d = Call(&g, "alias", "d", {c});
  g.outputs = {d};

  g = pass::AnalyzeAlias(g);
  const IndexedGraph& idx = g.indexed_graph();
  const AliasInfo& alias = g.GetAttr<AliasInfo>("alias_info");
  uint32_t ex = idx.entry_id(x), ev = idx.entry_id(v), ew = idx.entry_id(w);
  uint32_t ec = idx.entry_id(c), ed = idx.entry_id(d);

  EXPECT_FALSE(alias.is_view(ex));
  EXPECT_TRUE(alias.is_view(ew));
  EXPECT_EQ(alias.view_parent[ew], ev);
  EXPECT_EQ(alias.view_parent[ev], ex);
  EXPECT_EQ(alias.base[ew], ex);
  EXPECT_TRUE(alias.same_storage(ew, ex));
  EXPECT_TRUE(alias.aliases_input(ew));
  EXPECT_THAT(alias.aliases(ex), ElementsAre(ex, ev, ew));

  EXPECT_FALSE(alias.is_view(ec));
  EXPECT_EQ(alias.base[ed], ec);
  EXPECT_FALSE(alias.same_storage(ec, ex));
  EXPECT_FALSE(alias.aliases_input(ed));
  EXPECT_THAT(alias.aliases(ed), ElementsAre(ec, ed));
}

TEST(AliasAnalysis, ReturnedSelfJoinsStorage) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry i = g.AddVariable("i");
  NodeEntry v = g.AddVariable("v");
  NodeEntry a = Call(&g, "empty_like", "a", {x});
  NodeEntry b = Call(&g, "index_put_", "b", {a, i, v});
  NodeEntry c = Call(&g, "copy_", "c", {x, b});
  NodeEntry d = Call(&g, "index_put", "d", {c, i, v});
  g.outputs = {d};

  g = pass::AnalyzeAlias(g);
  const IndexedGraph& idx = g.indexed_graph();
  const AliasInfo& alias = g.GetAttr<AliasInfo>("alias_info");
  EXPECT_TRUE(alias.same_storage(idx.entry_id(a), idx.entry_id(b)));
  EXPECT_TRUE(alias.same_storage(idx.entry_id(x), idx.entry_id(c)));
  EXPECT_FALSE(alias.same_storage(idx.entry_id(b), idx.entry_id(c)));
  EXPECT_FALSE(alias.same_storage(idx.entry_id(c), idx.entry_id(d)));
  EXPECT_TRUE(alias.aliases_input(idx.entry_id(c)));
  EXPECT_FALSE(alias.aliases_input(idx.entry_id(b)));
  EXPECT_FALSE(alias.aliases_input(idx.entry_id(d)));
}

TEST(AliasAnalysis, MultipleOutputsAreFreshStorage) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry out = g.AddVariable("out");
  NodeEntry af = Call(&g, "auto_functionalized", "af", {x, out},
                      {{"mutable_op", "sin_out_sum"}});
  g.outputs = {Output(af, 0), Output(af, 1)};

  g = pass::AnalyzeAlias(g);
  const IndexedGraph& idx = g.indexed_graph();
  const AliasInfo& alias = g.GetAttr<AliasInfo>("alias_info");
  uint32_t e0 = idx.entry_id(Output(af, 0));
  uint32_t e1 = idx.entry_id(Output(af, 1));
  EXPECT_FALSE(alias.same_storage(e0, e1));
  EXPECT_FALSE(alias.same_storage(e1, idx.entry_id(out)));
  EXPECT_EQ(alias.storage_entries.size(), 4U);
  EXPECT_THAT(alias.storage_has_input, ElementsAre(true, true, false, false));
}

TEST(AliasAnalysis, KeepsGraph) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  g.outputs = {Call(&g, "sin", "a", {x})};
  Graph ret = pass::AnalyzeAlias(g);
  EXPECT_EQ(ret.nodes().size(), 2U);
  EXPECT_TRUE(ret.HasAttr("alias_info"));
  EXPECT_THAT(ret.GetAttr<AliasInfo>("alias_info").storage, UnorderedElementsAre(0U, 1U));
}

}  // namespace cpptest
}  // namespace ripple

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  testing::FLAGS_gtest_death_test_style = "threadsafe";
  return RUN_ALL_TESTS();
}
