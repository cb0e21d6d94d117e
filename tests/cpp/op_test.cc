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
#include <gtest/gtest.h>
#include <ripple/op.h>
#include <ripple/op_attr_types.h>
#include <ripple/top/tensor.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "./test_ops.h"

RIPPLE_REGISTER_OP(test_add)
.describe("add two data together")
.set_num_inputs(2)
.set_attr("inplace_pair", std::make_pair(0, 0));

RIPPLE_REGISTER_OP(test_add).set_attr<std::string>("nick_name", "plus");

TEST(Op, GetAttr) {
  using namespace ripple;
  auto add = Op::Get("test_add");
  auto nick = Op::GetAttr<std::string>("nick_name");

  CHECK_EQ(nick[add], "plus");
  EXPECT_EQ(add->num_inputs, 2U);
}

TEST(Op, GetUnknown) {
  using namespace ripple;
  EXPECT_THROW(Op::Get("no_such_op"), dmlc::Error);
  EXPECT_EQ(Op::Find("no_such_op"), nullptr);
  EXPECT_EQ(Op::Find("clone"), Op::Get("clone"));
}

TEST(Op, GetNamesCounterpart) {
  using namespace ripple;
  try {
    Op::Get("sin_");
    FAIL() << "sin_ is not registered";
  } catch (const dmlc::Error& e) {
    EXPECT_NE(std::string(e.what()).find("sin is"), std::string::npos) << e.what();
  }
  try {
    Op::Get("select_");
    FAIL() << "select_ is not registered";
  } catch (const dmlc::Error& e) {
    EXPECT_NE(std::string(e.what()).find("select is"), std::string::npos) << e.what();
  }
}

TEST(Op, ListNames) {
  using namespace ripple;
  std::vector<std::string> names = Op::ListNames();
  EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
  EXPECT_NE(std::find(names.begin(), names.end(), "index_put_"), names.end());
  EXPECT_NE(std::find(names.begin(), names.end(), "test_add"), names.end());
  EXPECT_EQ(std::find(names.begin(), names.end(), "no_such_op"), names.end());
}

TEST(Op, BuiltinTraits) {
  using namespace ripple;
  static auto& fmutate = Op::GetAttr<FMutateInputs>("FMutateInputs");
  static auto& inplaceable = Op::GetAttr<TInplaceableOp>("TInplaceableOp");
  static auto& is_view = Op::GetAttr<TIsView>("TIsView");
  static auto& returns_self = Op::GetAttr<TReturnsSelf>("TReturnsSelf");
  static auto& meta_only = Op::GetAttr<TIsMetaOnly>("TIsMetaOnly");

  EXPECT_TRUE(fmutate.count(Op::Get("copy_")));
  EXPECT_TRUE(returns_self.get(Op::Get("copy_"), false));
  EXPECT_FALSE(fmutate.count(Op::Get("index_put")));
  EXPECT_EQ(inplaceable[Op::Get("index_put")].inplace_op, "index_put_");
  EXPECT_EQ(inplaceable[Op::Get("_unsafe_index_put")].inplace_op, "_unsafe_index_put_");
  EXPECT_FALSE(inplaceable.count(Op::Get("index_put_")));
  EXPECT_TRUE(is_view.get(Op::Get("slice"), false));
  EXPECT_TRUE(is_view.get(Op::Get("select"), false));
  EXPECT_FALSE(is_view.get(Op::Get("clone"), false));
  EXPECT_TRUE(meta_only.get(Op::Get("sym_size"), false));
  EXPECT_FALSE(meta_only.get(Op::Get("empty_like"), false));
}

TEST(Op, ListInputNames) {
  using namespace ripple;
  NodeAttrs attrs;
  attrs.op = Op::Get("index_put");
  EXPECT_EQ(ListInputNames(attrs, 3),
            (std::vector<std::string>{"self", "indices", "values"}));
  attrs.op = Op::Get("sin");
  EXPECT_EQ(ListInputNames(attrs, 1), std::vector<std::string>{"data"});
  attrs.op = Op::Get("test_add");
  EXPECT_EQ(ListInputNames(attrs, 2), (std::vector<std::string>{"data", "data1"}));
}

TEST(Op, ParamParserError) {
  using namespace ripple;
  Graph g;
  NodeEntry x = g.AddVariable("x");
  EXPECT_THROW(g.AddNode(Op::Get("slice"), "s", {x}, {{"begin", "0"}}), dmlc::Error);
  EXPECT_THROW(g.AddNode(Op::Get("slice"), "s", {x},
                         {{"begin", "0"}, {"end", "2"}, {"stride", "1"}}),
               dmlc::Error);
  NodePtr s = g.AddNode(Op::Get("slice"), "s", {x}, {{"begin", "1"}, {"end", "3"}});
  const top::SliceParam& param = ripple::get<top::SliceParam>(s->attrs.parsed);
  EXPECT_EQ(param.begin, 1);
  EXPECT_EQ(param.end, 3);
  EXPECT_EQ(param.step, 1);
}

TEST(AutoFunctionalized, ParseWithoutBases) {
  using namespace ripple;
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry a = g.AddVariable("a");
  NodeEntry b = g.AddVariable("b");
  NodePtr n = g.AddNode(Op::Get("auto_functionalized"), "af", {x, a, b},
                        {{"mutable_op", "sin_cos_out"},
                         {"only_clone_these_tensors", "out_cos"}});
  const top::AutoFunctionalizedAttrs& af =
      ripple::get<top::AutoFunctionalizedAttrs>(n->attrs.parsed);
  EXPECT_EQ(af.mutable_op, Op::Get("sin_cos_out"));
  EXPECT_EQ(af.num_op_inputs, 3U);
  EXPECT_EQ(af.num_op_outputs, 0U);
  EXPECT_EQ(af.mutated_args, (std::vector<uint32_t>{1, 2}));
  EXPECT_EQ(af.slot_names, (std::vector<std::string>{"out_sin", "out_cos"}));
  EXPECT_EQ(af.only_clone, std::vector<std::string>{"out_cos"});
  EXPECT_EQ(af.slot_input(1), 2U);
  EXPECT_EQ(af.slot_output(1), 1U);
  EXPECT_EQ(n->num_inputs(), 3U);
  EXPECT_EQ(n->num_outputs(), 2U);
}

TEST(AutoFunctionalized, ParseWithBases) {
  using namespace ripple;
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry base = g.AddVariable("base");
  NodeEntry v = cpptest::Call(&g, "slice", "v", {base}, {{"begin", "0"}, {"end", "2"}});
  NodePtr n = g.AddNode(Op::Get("auto_functionalized"), "af", {x, v, base},
                        {{"mutable_op", "sin_out_sum"},
                         {"num_bases", "1"},
                         {"_out_base_index", "0"}});
  const top::AutoFunctionalizedAttrs& af =
      ripple::get<top::AutoFunctionalizedAttrs>(n->attrs.parsed);
  EXPECT_EQ(af.arg_base, std::vector<int>{0});
  EXPECT_EQ(af.slot_names, std::vector<std::string>{"_all_bases[0]"});
  EXPECT_EQ(af.slot_input(0), 2U);
  EXPECT_EQ(af.slot_output(0), 1U);
  EXPECT_EQ(n->num_outputs(), 2U);
  EXPECT_TRUE(af.op_attrs.dict.empty());
}

TEST(AutoFunctionalized, ForwardsOperatorAttributes) {
  using namespace ripple;
  Graph g;
  NodeEntry out = g.AddVariable("out");
  NodePtr n = g.AddNode(Op::Get("auto_functionalized"), "af", {out},
                        {{"mutable_op", "fill_"}, {"value", "3"}});
  const top::AutoFunctionalizedAttrs& af =
      ripple::get<top::AutoFunctionalizedAttrs>(n->attrs.parsed);
  EXPECT_EQ(af.op_attrs.dict.at("value"), "3");
  EXPECT_EQ(ripple::get<cpptest::FillParam>(af.op_attrs.parsed).value, 3.0f);
}

TEST(AutoFunctionalized, InvalidAttributes) {
  using namespace ripple;
  const Op* af = Op::Get("auto_functionalized");
  Graph g;
  NodeEntry x = g.AddVariable("x");
  NodeEntry out = g.AddVariable("out");
  // no mutable_op
  EXPECT_THROW(g.AddNode(af, "af", {x, out}, {}), dmlc::Error);
  // wraps an operator that mutates nothing
  EXPECT_THROW(g.AddNode(af, "af", {x}, {{"mutable_op", "sin"}}), dmlc::Error);
  // unknown operator
  EXPECT_THROW(g.AddNode(af, "af", {x}, {{"mutable_op", "no_such_op"}}), dmlc::Error);
  // only_clone names a slot that does not exist
  EXPECT_THROW(g.AddNode(af, "af", {x, out},
                         {{"mutable_op", "sin_out"}, {"only_clone_these_tensors", "x"}}),
               dmlc::Error);
  // bases without base indices
  EXPECT_THROW(g.AddNode(af, "af", {x, out, out},
                         {{"mutable_op", "sin_out"}, {"num_bases", "1"}}),
               dmlc::Error);
  // base index out of range
  EXPECT_THROW(g.AddNode(af, "af", {x, out, out},
                         {{"mutable_op", "sin_out"}, {"num_bases", "1"},
                          {"_out_base_index", "1"}}),
               dmlc::Error);
  // base index without bases
  EXPECT_THROW(g.AddNode(af, "af", {x, out},
                         {{"mutable_op", "sin_out"}, {"_out_base_index", "0"}}),
               dmlc::Error);
  // wrong arity
  EXPECT_THROW(g.AddNode(af, "af", {x},
                         {{"mutable_op", "sin_out"}}),
               dmlc::Error);
  // attribute rejected by the wrapped operator
  EXPECT_THROW(g.AddNode(af, "af", {out},
                         {{"mutable_op", "fill_"}, {"value", "1"}, {"color", "red"}}),
               dmlc::Error);
}

TEST(AutoFunctionalized, SplitJoinList) {
  using namespace ripple;
  EXPECT_EQ(top::SplitList(""), std::vector<std::string>{});
  EXPECT_EQ(top::SplitList("a, b,,c "), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(top::JoinList({"out_sin", "out_cos"}), "out_sin,out_cos");
  EXPECT_EQ(top::JoinList({}), "");
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  testing::FLAGS_gtest_death_test_style = "threadsafe";
  return RUN_ALL_TESTS();
}
