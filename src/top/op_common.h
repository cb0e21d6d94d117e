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
 * \file op_common.h
 * \brief Common operator utilities
 */
#ifndef RIPPLE_TOP_OP_COMMON_H_
#define RIPPLE_TOP_OP_COMMON_H_

#include <dmlc/logging.h>
#include <dmlc/parameter.h>
#include <ripple/executor.h>
#include <ripple/op.h>
#include <ripple/op_attr_types.h>
#include <ripple/top/tensor.h>
#include <sstream>
#include <string>
#include <vector>

namespace ripple {
namespace top {

using runtime::NDArray;
using runtime::FCompute;

/*!
 * \brief Parse keyword arguments as PType arguments and save to parsed
 * \tparam PType the parameter type.
 * \param attrs The attributes.
 */
template<typename PType>
inline void ParamParser(NodeAttrs* attrs) {
  PType param;
  try {
    param.Init(attrs->dict);
  } catch (const dmlc::ParamError& e) {
    std::ostringstream os;
    os << e.what();
    os << ", in operator " << attrs->op->name << "("
       << "name=\"" << attrs->name << "\"";
    for (const auto& k : attrs->dict) {
      os << ", " << k.first << "=\"" << k.second << "\"";
    }
    os << ")";
    throw dmlc::ParamError(os.str());
  }
  attrs->parsed = std::move(param);
}

/*!
 * \brief Mark input 0 as mutated.
 * \param attrs The attributes.
 * \return {0}
 */
inline std::vector<uint32_t> MutateFirstInput(const NodeAttrs& attrs) {
  return std::vector<uint32_t>{0};
}

/*!
 * \brief Check that two arrays have the same size.
 * \param attrs The attributes of the checked node.
 * \param a The first array.
 * \param b The second array.
 */
inline void CheckSameSize(const NodeAttrs& attrs, const NDArray& a, const NDArray& b) {
  CHECK_EQ(a.size(), b.size())
      << "operator " << attrs.op->name << " of node " << attrs.name
      << " got arrays of sizes " << a.size() << " and " << b.size();
}

}  // namespace top
}  // namespace ripple

#define RIPPLE_REGISTER_ELEMWISE_UNARY_OP(name, fn)                   \
  RIPPLE_REGISTER_OP(name)                                            \
  .set_num_inputs(1)                                                  \
  .set_num_outputs(1)                                                 \
  .set_attr<FCompute>("FCompute", [](const NodeAttrs& attrs,          \
                                     const std::vector<NDArray>& inputs, \
                                     std::vector<NDArray>* outputs) { \
      NDArray out = NDArray::Empty(inputs[0].size());                 \
      for (size_t i = 0; i < out.size(); ++i) {                       \
        out[i] = fn(inputs[0][i]);                                    \
      }                                                               \
      (*outputs)[0] = out;                                            \
    })

#define RIPPLE_REGISTER_ELEMWISE_BINARY_OP(name, fn)                  \
  RIPPLE_REGISTER_OP(name)                                            \
  .set_num_inputs(2)                                                  \
  .set_num_outputs(1)                                                 \
  .set_attr<FListInputNames>("FListInputNames", [](const NodeAttrs& attrs) { \
      return std::vector<std::string>{"lhs", "rhs"};                  \
    })                                                                \
  .set_attr<FCompute>("FCompute", [](const NodeAttrs& attrs,          \
                                     const std::vector<NDArray>& inputs, \
                                     std::vector<NDArray>* outputs) { \
      CheckSameSize(attrs, inputs[0], inputs[1]);                     \
      NDArray out = NDArray::Empty(inputs[0].size());                 \
      for (size_t i = 0; i < out.size(); ++i) {                       \
        out[i] = fn(inputs[0][i], inputs[1][i]);                      \
      }                                                               \
      (*outputs)[0] = out;                                            \
    })

#endif  // RIPPLE_TOP_OP_COMMON_H_
