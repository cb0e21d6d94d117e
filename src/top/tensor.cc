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
 * \file tensor.cc
 * \brief Builtin tensor operators.
 */
#include <ripple/op.h>
#include <ripple/node.h>
#include <ripple/op_attr_types.h>
#include <ripple/executor.h>
#include <ripple/top/tensor.h>
#include <algorithm>
#include <cmath>
#include <functional>
#include <sstream>
#include "./op_common.h"

namespace ripple {
namespace top {

std::vector<std::string> SplitList(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream is(str);
  std::string item;
  while (std::getline(is, item, ',')) {
    item.erase(0, item.find_first_not_of(' '));
    item.erase(item.find_last_not_of(' ') + 1);
    if (!item.empty()) ret.push_back(item);
  }
  return ret;
}

std::string JoinList(const std::vector<std::string>& items) {
  std::ostringstream os;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i != 0) os << ',';
    os << items[i];
  }
  return os.str();
}

// empty_like
RIPPLE_REGISTER_OP(empty_like)
.describe(R"code(Allocate an array of the size of data.
The contents are unspecified.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs(1)
.set_num_outputs(1)
.set_attr<FCompute>("FCompute", [](const NodeAttrs& attrs,
                                   const std::vector<NDArray>& inputs,
                                   std::vector<NDArray>* outputs) {
    (*outputs)[0] = NDArray::Empty(inputs[0].size());
  });

// ones
DMLC_REGISTER_PARAMETER(OnesParam);

RIPPLE_REGISTER_OP(ones)
.describe(R"code(Allocate an array filled with ones.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs(0)
.set_num_outputs(1)
.set_attr_parser(ParamParser<OnesParam>)
.set_attr<FCompute>("FCompute", [](const NodeAttrs& attrs,
                                   const std::vector<NDArray>& inputs,
                                   std::vector<NDArray>* outputs) {
    const OnesParam& param = ripple::get<OnesParam>(attrs.parsed);
    (*outputs)[0] = NDArray::FromVector(std::vector<float>(param.size, 1.0f));
  });

// clone
RIPPLE_REGISTER_OP(clone)
.describe(R"code(Copy data into a fresh contiguous array.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs(1)
.set_num_outputs(1)
.set_attr<FCompute>("FCompute", [](const NodeAttrs& attrs,
                                   const std::vector<NDArray>& inputs,
                                   std::vector<NDArray>* outputs) {
    (*outputs)[0] = inputs[0].Copy();
  });

// copy_
RIPPLE_REGISTER_OP(copy_)
.describe(R"code(Write src into self and return self.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs(2)
.set_num_outputs(1)
.set_attr<FListInputNames>("FListInputNames", [](const NodeAttrs& attrs) {
    return std::vector<std::string>{"self", "src"};
  })
.set_attr<FMutateInputs>("FMutateInputs", MutateFirstInput)
.set_attr<TReturnsSelf>("TReturnsSelf", true)
.set_attr<FCompute>("FCompute", [](const NodeAttrs& attrs,
                                   const std::vector<NDArray>& inputs,
                                   std::vector<NDArray>* outputs) {
    CheckSameSize(attrs, inputs[0], inputs[1]);
    inputs[0].CopyFrom(inputs[1]);
    (*outputs)[0] = inputs[0];
  });

// elementwise
inline float Sin(float x) {
  return std::sin(x);
}

inline float Cos(float x) {
  return std::cos(x);
}

RIPPLE_REGISTER_ELEMWISE_UNARY_OP(sin, Sin)
.describe(R"code(Elementwise sine.

)code" RIPPLE_ADD_FILELINE);

RIPPLE_REGISTER_ELEMWISE_UNARY_OP(cos, Cos)
.describe(R"code(Elementwise cosine.

)code" RIPPLE_ADD_FILELINE);

RIPPLE_REGISTER_ELEMWISE_BINARY_OP(add, std::plus<float>())
.describe(R"code(Elementwise sum.

)code" RIPPLE_ADD_FILELINE);

RIPPLE_REGISTER_ELEMWISE_BINARY_OP(mul, std::multiplies<float>())
.describe(R"code(Elementwise product.

)code" RIPPLE_ADD_FILELINE);

// mul_scalar
DMLC_REGISTER_PARAMETER(MulScalarParam);

RIPPLE_REGISTER_OP(mul_scalar)
.describe(R"code(Multiply every element by a scalar.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs(1)
.set_num_outputs(1)
.set_attr_parser(ParamParser<MulScalarParam>)
.set_attr<FCompute>("FCompute", [](const NodeAttrs& attrs,
                                   const std::vector<NDArray>& inputs,
                                   std::vector<NDArray>* outputs) {
    const MulScalarParam& param = ripple::get<MulScalarParam>(attrs.parsed);
    NDArray out = NDArray::Empty(inputs[0].size());
    for (size_t i = 0; i < out.size(); ++i) {
      out[i] = inputs[0][i] * param.scalar;
    }
    (*outputs)[0] = out;
  });

// index_put and its in-place form
inline void IndexPut(const NodeAttrs& attrs,
                     const NDArray& self,
                     const NDArray& indices,
                     const NDArray& values) {
  CheckSameSize(attrs, indices, values);
  for (size_t i = 0; i < indices.size(); ++i) {
    int64_t index = static_cast<int64_t>(indices[i]);
    CHECK(index >= 0 && static_cast<size_t>(index) < self.size())
        << "index " << index << " is out of range of an array of size "
        << self.size() << " in node " << attrs.name;
    self[index] = values[i];
  }
}

inline std::vector<std::string> IndexPutInputNames(const NodeAttrs& attrs) {
  return std::vector<std::string>{"self", "indices", "values"};
}

void IndexPutCompute(const NodeAttrs& attrs,
                     const std::vector<NDArray>& inputs,
                     std::vector<NDArray>* outputs) {
  NDArray out = inputs[0].Copy();
  IndexPut(attrs, out, inputs[1], inputs[2]);
  (*outputs)[0] = out;
}

void IndexPutInplaceCompute(const NodeAttrs& attrs,
                            const std::vector<NDArray>& inputs,
                            std::vector<NDArray>* outputs) {
  IndexPut(attrs, inputs[0], inputs[1], inputs[2]);
  (*outputs)[0] = inputs[0];
}

RIPPLE_REGISTER_OP(index_put)
.describe(R"code(Copy self and write values at indices of the copy.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs(3)
.set_num_outputs(1)
.set_attr<FListInputNames>("FListInputNames", IndexPutInputNames)
.set_attr<TInplaceableOp>("TInplaceableOp", TInplaceableOp{"index_put_", 0})
.set_attr<FCompute>("FCompute", IndexPutCompute);

RIPPLE_REGISTER_OP(index_put_)
.describe(R"code(Write values at indices of self and return self.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs(3)
.set_num_outputs(1)
.set_attr<FListInputNames>("FListInputNames", IndexPutInputNames)
.set_attr<FMutateInputs>("FMutateInputs", MutateFirstInput)
.set_attr<TReturnsSelf>("TReturnsSelf", true)
.set_attr<FCompute>("FCompute", IndexPutInplaceCompute);

RIPPLE_REGISTER_OP(_unsafe_index_put)
.describe(R"code(index_put without a check on duplicated indices.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs(3)
.set_num_outputs(1)
.set_attr<FListInputNames>("FListInputNames", IndexPutInputNames)
.set_attr<TInplaceableOp>("TInplaceableOp", TInplaceableOp{"_unsafe_index_put_", 0})
.set_attr<FCompute>("FCompute", IndexPutCompute);

RIPPLE_REGISTER_OP(_unsafe_index_put_)
.describe(R"code(index_put_ without a check on duplicated indices.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs(3)
.set_num_outputs(1)
.set_attr<FListInputNames>("FListInputNames", IndexPutInputNames)
.set_attr<FMutateInputs>("FMutateInputs", MutateFirstInput)
.set_attr<TReturnsSelf>("TReturnsSelf", true)
.set_attr<FCompute>("FCompute", IndexPutInplaceCompute);

// views
DMLC_REGISTER_PARAMETER(SelectParam);

RIPPLE_REGISTER_OP(select)
.describe(R"code(View of a single element of data.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs(1)
.set_num_outputs(1)
.set_attr_parser(ParamParser<SelectParam>)
.set_attr<TIsView>("TIsView", true)
.set_attr<FCompute>("FCompute", [](const NodeAttrs& attrs,
                                   const std::vector<NDArray>& inputs,
                                   std::vector<NDArray>* outputs) {
    const SelectParam& param = ripple::get<SelectParam>(attrs.parsed);
    (*outputs)[0] = inputs[0].View(param.index, 1);
  });

DMLC_REGISTER_PARAMETER(SliceParam);

RIPPLE_REGISTER_OP(slice)
.describe(R"code(View of the elements begin, begin + step, ... before end.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs(1)
.set_num_outputs(1)
.set_attr_parser(ParamParser<SliceParam>)
.set_attr<TIsView>("TIsView", true)
.set_attr<FCompute>("FCompute", [](const NodeAttrs& attrs,
                                   const std::vector<NDArray>& inputs,
                                   std::vector<NDArray>* outputs) {
    const SliceParam& param = ripple::get<SliceParam>(attrs.parsed);
    size_t end = std::min(static_cast<size_t>(param.end), inputs[0].size());
    size_t begin = std::min(static_cast<size_t>(param.begin), end);
    size_t size = (end - begin + param.step - 1) / param.step;
    (*outputs)[0] = inputs[0].View(begin, size, param.step);
  });

RIPPLE_REGISTER_OP(alias)
.describe(R"code(View of the whole of data.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs(1)
.set_num_outputs(1)
.set_attr<TIsView>("TIsView", true)
.set_attr<FCompute>("FCompute", [](const NodeAttrs& attrs,
                                   const std::vector<NDArray>& inputs,
                                   std::vector<NDArray>* outputs) {
    (*outputs)[0] = inputs[0];
  });

// metadata
RIPPLE_REGISTER_OP(sym_size)
.describe(R"code(Number of elements of data, as a one element array.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs(1)
.set_num_outputs(1)
.set_attr<TIsMetaOnly>("TIsMetaOnly", true)
.set_attr<FCompute>("FCompute", [](const NodeAttrs& attrs,
                                   const std::vector<NDArray>& inputs,
                                   std::vector<NDArray>* outputs) {
    (*outputs)[0] = NDArray::FromVector({static_cast<float>(inputs[0].size())});
  });

// auto_functionalized
DMLC_REGISTER_PARAMETER(AutoFunctionalizedParam);

inline bool ParseBaseIndex(const std::string& key, std::string* arg) {
  static const std::string suffix = "_base_index";
  if (key.size() <= suffix.size() + 1 || key[0] != '_') return false;
  if (key.compare(key.size() - suffix.size(), suffix.size(), suffix) != 0) return false;
  *arg = key.substr(1, key.size() - suffix.size() - 1);
  return true;
}

void AutoFunctionalizedAttrParser(NodeAttrs* attrs) {
  static auto& fmutate = Op::GetAttr<FMutateInputs>("FMutateInputs");
  AutoFunctionalizedAttrs af;
  std::vector<std::pair<std::string, std::string> > unknown;
  try {
    unknown = af.param.InitAllowUnknown(attrs->dict);
  } catch (const dmlc::ParamError& e) {
    std::ostringstream os;
    os << e.what() << ", in auto_functionalized node " << attrs->name;
    throw dmlc::ParamError(os.str());
  }
  af.mutable_op = Op::Get(af.param.mutable_op);
  CHECK(fmutate.count(af.mutable_op))
      << "auto_functionalized node " << attrs->name << " wraps "
      << af.mutable_op->name << " which mutates none of its inputs";

  std::unordered_map<std::string, int> base_index;
  for (const auto& kv : unknown) {
    std::string arg;
    if (ParseBaseIndex(kv.first, &arg)) {
      std::istringstream is(kv.second);
      int index = -1;
      CHECK(is >> index)
          << "invalid " << kv.first << "=\"" << kv.second << "\" in node " << attrs->name;
      base_index[arg] = index;
    } else {
      af.op_attrs.dict.insert(kv);
    }
  }
  af.op_attrs.op = af.mutable_op;
  af.op_attrs.name = attrs->name;
  if (af.mutable_op->attr_parser != nullptr) {
    af.mutable_op->attr_parser(&(af.op_attrs));
  }
  af.num_op_inputs = af.mutable_op->get_num_inputs != nullptr ?
      af.mutable_op->get_num_inputs(af.op_attrs) : af.mutable_op->num_inputs;
  af.num_op_outputs = af.mutable_op->get_num_outputs != nullptr ?
      af.mutable_op->get_num_outputs(af.op_attrs) : af.mutable_op->num_outputs;
  CHECK_NE(af.num_op_inputs, kVarg)
      << "auto_functionalized cannot wrap " << af.mutable_op->name
      << " which takes a variable number of inputs";
  af.arg_names = ListInputNames(af.op_attrs, af.num_op_inputs);
  CHECK_EQ(af.arg_names.size(), af.num_op_inputs)
      << "FListInputNames of " << af.mutable_op->name << " does not match its inputs";

  af.mutated_args = fmutate[af.mutable_op](af.op_attrs);
  std::sort(af.mutated_args.begin(), af.mutated_args.end());
  af.mutated_args.erase(std::unique(af.mutated_args.begin(), af.mutated_args.end()),
                        af.mutated_args.end());
  for (uint32_t i : af.mutated_args) {
    CHECK_LT(i, af.num_op_inputs)
        << af.mutable_op->name << " mutates input " << i << " which it does not have";
  }

  if (af.param.num_bases == 0) {
    CHECK(base_index.empty())
        << "auto_functionalized node " << attrs->name
        << " has base indices but no bases";
    for (uint32_t i : af.mutated_args) {
      af.arg_base.push_back(-1);
      af.slot_names.push_back(af.arg_names[i]);
    }
  } else {
    for (uint32_t i : af.mutated_args) {
      auto it = base_index.find(af.arg_names[i]);
      CHECK(it != base_index.end())
          << "auto_functionalized node " << attrs->name << " is missing _"
          << af.arg_names[i] << "_base_index";
      CHECK(it->second >= 0 && it->second < af.param.num_bases)
          << "_" << af.arg_names[i] << "_base_index of node " << attrs->name
          << " is out of range";
      af.arg_base.push_back(it->second);
    }
    for (int k = 0; k < af.param.num_bases; ++k) {
      af.slot_names.push_back("_all_bases[" + std::to_string(k) + "]");
    }
  }

  af.only_clone = SplitList(af.param.only_clone_these_tensors);
  for (const std::string& name : af.only_clone) {
    CHECK(std::find(af.slot_names.begin(), af.slot_names.end(), name) != af.slot_names.end())
        << "only_clone_these_tensors of node " << attrs->name
        << " names " << name << " which is not a mutation slot";
  }
  attrs->parsed = std::move(af);
}

void AutoFunctionalizedCompute(const NodeAttrs& attrs,
                               const std::vector<NDArray>& inputs,
                               std::vector<NDArray>* outputs) {
  static auto& fcompute = Op::GetAttr<FCompute>("FCompute");
  const AutoFunctionalizedAttrs& af = ripple::get<AutoFunctionalizedAttrs>(attrs.parsed);
  CHECK(fcompute.count(af.mutable_op))
      << "operator " << af.mutable_op->name << " has no FCompute";
  std::vector<NDArray> args(inputs.begin(), inputs.begin() + af.num_op_inputs);
  std::vector<NDArray> slots(af.num_slots());
  if (af.param.num_bases == 0) {
    for (uint32_t k = 0; k < af.num_slots(); ++k) {
      slots[k] = args[af.mutated_args[k]].Copy();
      args[af.mutated_args[k]] = slots[k];
    }
  } else {
    for (uint32_t k = 0; k < af.num_slots(); ++k) {
      slots[k] = inputs[af.slot_input(k)].CopyStorage();
    }
    for (size_t i = 0; i < af.mutated_args.size(); ++i) {
      uint32_t a = af.mutated_args[i];
      const NDArray& base = inputs[af.slot_input(af.arg_base[i])];
      CHECK(args[a].SameStorage(base))
          << "argument " << af.arg_names[a] << " of node " << attrs.name
          << " is not a view of its base";
      args[a] = args[a].Rebase(slots[af.arg_base[i]]);
    }
  }
  std::vector<NDArray> op_outputs(af.num_op_outputs);
  fcompute[af.mutable_op](af.op_attrs, args, &op_outputs);
  for (uint32_t i = 0; i < af.num_op_outputs; ++i) {
    (*outputs)[i] = op_outputs[i];
  }
  for (uint32_t k = 0; k < af.num_slots(); ++k) {
    (*outputs)[af.slot_output(k)] = slots[k];
  }
}

RIPPLE_REGISTER_OP(auto_functionalized)
.describe(R"code(Functional form of a call to a mutating operator.
Returns the outputs of the operator followed by the new value of each
mutated argument, or of each base when bases are given.

)code" RIPPLE_ADD_FILELINE)
.set_num_inputs([](const NodeAttrs& attrs) {
    const AutoFunctionalizedAttrs& af = ripple::get<AutoFunctionalizedAttrs>(attrs.parsed);
    return af.num_op_inputs + static_cast<uint32_t>(af.param.num_bases);
  })
.set_num_outputs([](const NodeAttrs& attrs) {
    const AutoFunctionalizedAttrs& af = ripple::get<AutoFunctionalizedAttrs>(attrs.parsed);
    return af.num_op_outputs + af.num_slots();
  })
.set_attr_parser(AutoFunctionalizedAttrParser)
.set_attr<FListInputNames>("FListInputNames", [](const NodeAttrs& attrs) {
    const AutoFunctionalizedAttrs& af = ripple::get<AutoFunctionalizedAttrs>(attrs.parsed);
    std::vector<std::string> ret = af.arg_names;
    if (af.param.num_bases != 0) {
      ret.insert(ret.end(), af.slot_names.begin(), af.slot_names.end());
    }
    return ret;
  })
.set_attr<FCompute>("FCompute", AutoFunctionalizedCompute);

}  // namespace top
}  // namespace ripple
