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
#include <ripple/op.h>

#include <string>
#include <vector>

#include "./test_ops.h"

namespace ripple {
namespace cpptest {

using ::testing::ElementsAre;

TEST(Graph, UseLists) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry a = Call(&g, "sin", "a", {x});
  NodeEntry b = Call(&g, "add", "b", {a, a});
  g.outputs.push_back(b);

  EXPECT_EQ(g.uses(a).size(), 2U);
  EXPECT_EQ(g.users(a).size(), 1U);
  EXPECT_EQ(g.users(a)[0], b.node.get());
  EXPECT_EQ(g.uses(a)[1].input_index, 1U);
  EXPECT_TRUE(g.uses(b).empty());
  EXPECT_TRUE(g.Contains(a.node.get()));
  EXPECT_THAT(OpSequence(g), ElementsAre("null", "sin", "add"));
}

TEST(Graph, AddNodeChecksInputs) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  // arity
  EXPECT_THROW(Call(&g, "add", "a", {x}), dmlc::Error);
  // input from another graph
  Graph other;
  NodeEntry y = other.AddVariable("y");
  EXPECT_THROW(Call(&g, "sin", "a", {y}), dmlc::Error);
  // output index out of range
  EXPECT_THROW(Call(&g, "sin", "a", {NodeEntry(x.node, 1)}), dmlc::Error);
  // a failed call leaves the graph untouched
  EXPECT_EQ(g.nodes().size(), 1U);
  EXPECT_THROW(g.AddNode(nullptr, "a", {x}), dmlc::Error);
}

TEST(Graph, ReplaceAllUsesWith) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry a = Call(&g, "sin", "a", {x});
  NodeEntry b = Call(&g, "cos", "b", {a});
  NodeEntry c = Call(&g, "add", "c", {a, b});
  g.outputs = {a, c};

  g.ReplaceAllUsesWith(a, x);
  EXPECT_TRUE(g.uses(a).empty());
  EXPECT_EQ(g.uses(x).size(), 3U);
  EXPECT_EQ(b.node->inputs[0].node, x.node);
  EXPECT_EQ(c.node->inputs[0].node, x.node);
  EXPECT_EQ(g.outputs[0].node, x.node);
  EXPECT_EQ(g.outputs[1].node, c.node);

  g.EraseNode(a.node.get());
  EXPECT_FALSE(g.Contains(a.node.get()));
  EXPECT_THAT(OpSequence(g), ElementsAre("null", "cos", "add"));
}

TEST(Graph, EraseNodeWithUses) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry a = Call(&g, "sin", "a", {x});
  NodeEntry b = Call(&g, "cos", "b", {a});
  g.outputs.push_back(b);
  EXPECT_THROW(g.EraseNode(a.node.get()), dmlc::Error);
  EXPECT_THROW(g.EraseNode(b.node.get()), dmlc::Error);
  EXPECT_EQ(g.nodes().size(), 3U);

  g.outputs.clear();
  g.EraseNode(b.node.get());
  EXPECT_TRUE(g.uses(a).empty());
  g.EraseNode(a.node.get());
  EXPECT_TRUE(g.uses(x).empty());
  EXPECT_THROW(g.EraseNode(a.node.get()), dmlc::Error);
}

TEST(Graph, InsertNodeBefore) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry a = Call(&g, "sin", "a", {x});
  NodePtr c = g.InsertNodeBefore(a.node.get(), Op::Get("clone"), "c", {x});
  g.SetInput(a.node.get(), 0, NodeEntry(c, 0));
  EXPECT_THAT(OpSequence(g), ElementsAre("null", "clone", "sin"));
  EXPECT_EQ(g.uses(x).size(), 1U);
  EXPECT_EQ(g.uses(NodeEntry(c, 0)).size(), 1U);

  const IndexedGraph& idx = g.indexed_graph();
  EXPECT_EQ(idx.node_id(c.get()), 1U);
  EXPECT_EQ(idx.node_id(a.node.get()), 2U);
}

TEST(Graph, ReplaceNode) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry i = g.AddVariable("i");
  NodeEntry v = g.AddVariable("v");
  NodeEntry a = Call(&g, "clone", "a", {x});
  NodeEntry b = Call(&g, "index_put", "b", {a, i, v});
  NodeEntry c = Call(&g, "sin", "c", {b});
  g.outputs.push_back(c);

  NodePtr inplace = Node::Create(Op::Get("index_put_"), "b");
  inplace->inputs = b.node->inputs;
  EXPECT_THROW(g.ReplaceNode(b.node.get(), inplace), dmlc::Error);

  g.ReplaceAllUsesWith(b, a);
  g.ReplaceNode(b.node.get(), inplace);
  EXPECT_THAT(OpSequence(g), ElementsAre("null", "null", "null", "clone", "index_put_", "sin"));
  EXPECT_FALSE(g.Contains(b.node.get()));
  EXPECT_EQ(g.users(a).size(), 2U);
  EXPECT_EQ(g.users(i)[0], inplace.get());
}

TEST(Graph, SetInput) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry y = g.AddVariable("y");
  NodeEntry a = Call(&g, "add", "a", {x, x});
  g.SetInput(a.node.get(), 1, y);
  EXPECT_EQ(g.uses(x).size(), 1U);
  EXPECT_EQ(g.uses(x)[0].input_index, 0U);
  EXPECT_EQ(g.uses(y).size(), 1U);
  EXPECT_THROW(g.SetInput(a.node.get(), 2, y), dmlc::Error);
}

TEST(IndexedGraph, Basic) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry a = Call(&g, "sin", "a", {x});
  NodeEntry b = Call(&g, "add", "b", {a, a});
  NodeEntry c = Call(&g, "mul", "c", {x, b});
  g.outputs = {c, a};

  const IndexedGraph& idx = g.indexed_graph();
  EXPECT_EQ(idx.num_nodes(), 4U);
  EXPECT_EQ(idx.num_node_entries(), 4U);
  EXPECT_THAT(idx.input_nodes(), ElementsAre(0U));
  uint32_t ex = idx.entry_id(x);
  uint32_t ea = idx.entry_id(a);
  EXPECT_THAT(idx.users(ex), ElementsAre(1U, 3U));
  EXPECT_THAT(idx.users(ea), ElementsAre(2U));
  EXPECT_TRUE(idx.is_output(ea));
  EXPECT_TRUE(idx.is_output(idx.entry_id(c)));
  EXPECT_FALSE(idx.is_output(idx.entry_id(b)));
  EXPECT_EQ(idx.entry_node(idx.entry_id(b)), 2U);
  EXPECT_EQ(idx[3].inputs[1].node_id, 2U);
  EXPECT_EQ(idx.outputs()[1].node_id, 1U);
}

TEST(IndexedGraph, MultipleOutputs) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry out = g.AddVariable("out");
  NodeEntry af = Call(&g, "auto_functionalized", "af", {x, out},
                      {{"mutable_op", "sin_out_sum"}});
  NodeEntry s = Call(&g, "sin", "s", {Output(af, 1)});
  g.outputs = {Output(af, 0), s};

  const IndexedGraph& idx = g.indexed_graph();
  EXPECT_EQ(idx.num_node_entries(), 5U);
  EXPECT_EQ(idx.entry_id(2, 1), 3U);
  EXPECT_EQ(idx.entry_node(3), 2U);
  EXPECT_TRUE(idx.users(2).empty());
  EXPECT_THAT(idx.users(3), ElementsAre(3U));
  EXPECT_TRUE(idx.is_output(2));
}

TEST(IndexedGraph, RejectsForeignOutput) {
  Graph g;
  g.AddVariable("x");
  Graph other;
  NodeEntry y = other.AddVariable("y");
  g.outputs.push_back(y);
  EXPECT_THROW(g.indexed_graph(), dmlc::Error);
}

TEST(IndexedGraph, DroppedOnChange) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  EXPECT_EQ(g.indexed_graph().num_nodes(), 1U);
  Call(&g, "sin", "a", {x});
  EXPECT_EQ(g.indexed_graph().num_nodes(), 2U);
}

}  // namespace cpptest
}  // namespace ripple

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  testing::FLAGS_gtest_death_test_style = "threadsafe";
  return RUN_ALL_TESTS();
}
