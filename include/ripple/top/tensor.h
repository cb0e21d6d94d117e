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
 * \file ripple/top/tensor.h
 * \brief Auxiliary param for builtin tensor operators.
 */
#ifndef RIPPLE_TOP_TENSOR_H_
#define RIPPLE_TOP_TENSOR_H_

#include <dmlc/base.h>
#include <dmlc/parameter.h>
#include <string>
#include <vector>
#include <unordered_map>
#include "../node.h"

namespace ripple {
namespace top {

struct SelectParam : public dmlc::Parameter<SelectParam> {
  int index;

  DMLC_DECLARE_PARAMETER(SelectParam) {
    DMLC_DECLARE_FIELD(index).set_lower_bound(0)
    .describe("Position of the selected element.");
  }
};

struct SliceParam : public dmlc::Parameter<SliceParam> {
  int begin;
  int end;
  int step;

  DMLC_DECLARE_PARAMETER(SliceParam) {
    DMLC_DECLARE_FIELD(begin).set_lower_bound(0)
    .describe("First position of the slice.");
    DMLC_DECLARE_FIELD(end).set_lower_bound(0)
    .describe("Position after the last element of the slice.");
    DMLC_DECLARE_FIELD(step).set_default(1).set_lower_bound(1)
    .describe("Distance between consecutive elements.");
  }
};

struct OnesParam : public dmlc::Parameter<OnesParam> {
  int size;

  DMLC_DECLARE_PARAMETER(OnesParam) {
    DMLC_DECLARE_FIELD(size).set_lower_bound(0)
    .describe("Number of elements.");
  }
};

struct MulScalarParam : public dmlc::Parameter<MulScalarParam> {
  float scalar;

  DMLC_DECLARE_PARAMETER(MulScalarParam) {
    DMLC_DECLARE_FIELD(scalar)
    .describe("The factor.");
  }
};

struct AutoFunctionalizedParam : public dmlc::Parameter<AutoFunctionalizedParam> {
  std::string mutable_op;
  int num_bases;
  std::string only_clone_these_tensors;

  DMLC_DECLARE_PARAMETER(AutoFunctionalizedParam) {
    DMLC_DECLARE_FIELD(mutable_op)
    .describe("Name of the wrapped mutating operator.");
    DMLC_DECLARE_FIELD(num_bases).set_default(0).set_lower_bound(0)
    .describe("Number of base inputs following the operator inputs.");
    DMLC_DECLARE_FIELD(only_clone_these_tensors).set_default("")
    .describe("Comma separated mutation slots that must be cloned.");
  }
};

/*!
 * \brief Parsed form of an auto_functionalized call.
 *
 *  The inputs of the call are the inputs of the mutating operator
 *  followed by num_bases bases. The outputs are the outputs of the
 *  mutating operator followed by one output per mutation slot.
 *  Without bases the slots are the mutated arguments, otherwise the
 *  slots are the bases.
 */
struct AutoFunctionalizedAttrs {
  /*! \brief the declared fields */
  AutoFunctionalizedParam param;
  /*! \brief the wrapped mutating operator */
  const Op* mutable_op{nullptr};
  /*! \brief attributes of the mutating operator, forwarded from the call */
  NodeAttrs op_attrs;
  /*! \brief number of inputs of the mutating operator */
  uint32_t num_op_inputs{0};
  /*! \brief number of outputs of the mutating operator */
  uint32_t num_op_outputs{0};
  /*! \brief names of the inputs of the mutating operator */
  std::vector<std::string> arg_names;
  /*! \brief input indices written by the mutating operator, sorted */
  std::vector<uint32_t> mutated_args;
  /*! \brief base of each mutated argument, -1 when the call has no bases */
  std::vector<int> arg_base;
  /*! \brief name of each mutation slot */
  std::vector<std::string> slot_names;
  /*! \brief parsed only_clone_these_tensors */
  std::vector<std::string> only_clone;

  /*! \return number of mutation slots */
  inline uint32_t num_slots() const {
    return static_cast<uint32_t>(slot_names.size());
  }
  /*! \return input index holding the value of slot k */
  inline uint32_t slot_input(uint32_t k) const {
    return param.num_bases == 0 ? mutated_args[k] : num_op_inputs + k;
  }
  /*! \return output index holding the new value of slot k */
  inline uint32_t slot_output(uint32_t k) const {
    return num_op_outputs + k;
  }
};

/*!
 * \brief Split a comma separated list, dropping empty items.
 * \param str The list.
 * \return the items.
 */
std::vector<std::string> SplitList(const std::string& str);

/*!
 * \brief Join items into a comma separated list.
 * \param items The items.
 * \return the list.
 */
std::string JoinList(const std::vector<std::string>& items);

/*!
 * \brief Attribute parser of auto_functionalized.
 * \param attrs The attributes, parsed into AutoFunctionalizedAttrs.
 */
void AutoFunctionalizedAttrParser(NodeAttrs* attrs);

}  // namespace top
}  // namespace ripple

#endif  // RIPPLE_TOP_TENSOR_H_
