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
#include <ripple/diagnostics.h>
#include <ripple/graph.h>
#include <ripple/pass.h>
#include <ripple/pass_functions.h>

#include <memory>
#include <string>
#include <vector>

#include "./test_ops.h"

namespace ripple {
namespace cpptest {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

Graph SmallGraph() {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry a = Call(&g, "sin", "a", {x});
  NodeEntry b = Call(&g, "mul_scalar", "b", {a}, {{"scalar", "2"}});
  Call(&g, "sin_out", "w", {x, b});
  g.outputs = {b};
  return g;
}

TEST(Pass, Registry) {
  const PassFunctionReg* reg = dmlc::Registry<PassFunctionReg>::Find("Reinplace");
  ASSERT_NE(reg, nullptr);
  EXPECT_TRUE(reg->change_graph);
  EXPECT_THAT(reg->graph_attr_dependency, ElementsAre("alias_info", "liveness"));
  reg = dmlc::Registry<PassFunctionReg>::Find("AnalyzeAlias");
  ASSERT_NE(reg, nullptr);
  EXPECT_FALSE(reg->change_graph);
  EXPECT_THAT(reg->graph_attr_targets, ElementsAre("alias_info"));
  EXPECT_EQ(dmlc::Registry<PassFunctionReg>::Find("NoSuchPass"), nullptr);
}

TEST(Pass, UnknownPass) {
  try {
    ApplyPass(SmallGraph(), "NoSuchPass");
    FAIL() << "applied an unknown pass";
  } catch (const dmlc::Error& e) {
    EXPECT_THAT(e.what(), HasSubstr("Cannot find pass NoSuchPass"));
  }
}

TEST(Pass, MissingDependency) {
  Graph g = ApplyPass(SmallGraph(), "AnalyzeAlias");
  try {
    ApplyPass(g, "Reinplace");
    FAIL() << "Reinplace ran without liveness";
  } catch (const dmlc::Error& e) {
    EXPECT_THAT(e.what(), HasSubstr("Graph attr dependency liveness is required by pass Reinplace"));
    EXPECT_THAT(e.what(), HasSubstr("provided by pass AnalyzeLiveness"));
  }
  g = ApplyPasses(g, {"AnalyzeLiveness", "Reinplace"});
  EXPECT_EQ(g.nodes().size(), 4U);
}

TEST(PrintGraphIR, Text) {
  EXPECT_EQ(pass::PrintGraphIR(SmallGraph()),
            "Graph(%x) {\n"
            "  %1 = sin(%x)\n"
            "  %2 = mul_scalar(%1, scalar='2')\n"
            "  sin_out(%x, %2)\n"
            "  ret %2\n"
            "}");
}

TEST(PrintGraphIR, JoinEntryAttrs) {
  Graph g = pass::AnalyzeLiveness(pass::AnalyzeAlias(SmallGraph()));
  g.attrs["join_entry_attrs"] =
      std::make_shared<any>(std::vector<std::string>{"liveness"});
  EXPECT_EQ(pass::PrintGraphIR(g),
            "Graph(%x) {\n"
            "  %x, liveness=3\n"
            "  %1 = sin(%x), liveness=2\n"
            "  %2 = mul_scalar(%1, scalar='2'), liveness=4\n"
            "  sin_out(%x, %2), liveness=[]\n"
            "  ret %2\n"
            "}");
}

TEST(PrintGraphIR, MultipleOutputs) {
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry out = g.AddVariable("out");
  NodeEntry af = Call(&g, "auto_functionalized", "af", {x, out},
                      {{"mutable_op", "sin_out_sum"}});
  g.outputs = {Output(af, 1), Output(af, 0)};
  EXPECT_EQ(pass::PrintGraphIR(g),
            "Graph(%x, %out) {\n"
            "  %2 = auto_functionalized(%x, %out, mutable_op='sin_out_sum')\n"
            "  ret %2.1, %2.0\n"
            "}");
}

TEST(DiagnosticCounters, IncrementAndReset) {
  DiagnosticCounters counters;
  EXPECT_EQ(counters.Get("a"), 0);
  counters.Increment("a");
  counters.Increment("a", 4);
  counters.Increment("b", 0);
  EXPECT_EQ(counters.Get("a"), 5);
  EXPECT_EQ(counters.Get("b"), 0);
  counters.Reset();
  EXPECT_EQ(counters.Get("a"), 0);
  EXPECT_EQ(DiagnosticCounters::Global(), DiagnosticCounters::Global());
}

}  // namespace cpptest
}  // namespace ripple

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  testing::FLAGS_gtest_death_test_style = "threadsafe";
  return RUN_ALL_TESTS();
}
