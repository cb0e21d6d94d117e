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
 * \file ripple/op_attr_types.h
 * \brief Data structures that can appear in operator attributes.
 */
#ifndef RIPPLE_OP_ATTR_TYPES_H_
#define RIPPLE_OP_ATTR_TYPES_H_

#include <vector>
#include <string>
#include <utility>
#include <functional>
#include "./base.h"
#include "./node.h"

namespace ripple {

// These types are optional attributes in each operator.
// Each attribute can be required by some passes.

/*!
 * \brief Return list of input arguments names of each operator.
 *
 * \param attrs The attributes of the node.
 * \return list of inputs
 * \note Register under "FListInputNames", default return {"data"}.
 *
 *  FListInputNames gives the names used to address the mutated arguments
 *  of an operator, e.g. in the metadata of auto_functionalized.
 */
using FListInputNames = std::function<std::vector<std::string> (const NodeAttrs& attrs)>;

/*!
 * \brief Check whether operator will mutate k-th input.
 * \param attrs The attributes of the node.
 * \return list of input indices it mutates.
 *
 * \note Register under "FMutateInputs", default return false
 *  An operator with FMutateInputs is a mutating operator. The reinplacing
 *  pass never rewrites a call to it.
 */
using FMutateInputs = std::function<std::vector<uint32_t> (const NodeAttrs& attrs)>;

/*!
 * \brief Whether the first output of the operator is a view of its first input.
 *  A view shares the storage of its input under a different indexing.
 *
 * \note Register under "TIsView", default false.
 */
using TIsView = bool;

/*!
 * \brief Whether a mutating operator returns its (mutated) first input.
 *  The output is then the same storage as input 0, like copy_ or index_put_.
 *
 * \note Register under "TReturnsSelf", default false.
 */
using TReturnsSelf = bool;

/*!
 * \brief Whether the operator only reads the metadata of its inputs
 *  (sizes, strides, offsets) and never their contents.
 *
 * \note Register under "TIsMetaOnly", default false.
 */
using TIsMetaOnly = bool;

/*!
 * \brief Extra condition an inplaceable call must satisfy before it is
 *  rewritten into its in-place counterpart.
 * \param node The candidate node.
 * \return whether the node can be rewritten.
 */
using FInplaceCheck = std::function<bool (const Node& node)>;

/*!
 * \brief Description of the in-place counterpart of an out-of-place operator.
 *
 * \note Register under "TInplaceableOp", by default an operator has no
 *  in-place counterpart and is never reinplaced.
 */
struct TInplaceableOp {
  /*! \brief name of the mutating counterpart */
  std::string inplace_op;
  /*! \brief index of the input the counterpart writes into */
  uint32_t mutated_arg{0};
  /*! \brief optional extra check, nullptr means always allowed */
  FInplaceCheck extra_check{nullptr};
};

/*!
 * \brief Get the names of the inputs of a node.
 * \param attrs The attributes of the node.
 * \param num_inputs The number of inputs of the node.
 * \return the names, "data", "data1", ... when FListInputNames is not registered.
 */
inline std::vector<std::string> ListInputNames(const NodeAttrs& attrs,
                                               uint32_t num_inputs) {
  static auto& flist_inputs = Op::GetAttr<FListInputNames>("FListInputNames");
  if (attrs.op != nullptr && flist_inputs.count(attrs.op)) {
    return flist_inputs[attrs.op](attrs);
  }
  std::vector<std::string> ret;
  for (uint32_t i = 0; i < num_inputs; ++i) {
    ret.push_back(i == 0 ? "data" : "data" + std::to_string(i));
  }
  return ret;
}

}  // namespace ripple

#endif  // RIPPLE_OP_ATTR_TYPES_H_
