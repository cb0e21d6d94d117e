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
 * \file ripple/reinplace.h
 * \brief Decisions of the reinplacing pass.
 *
 *  The pass works in two phases. PlanReinplace classifies every candidate
 *  of a graph without touching it, ApplyReinplacePlan then rewrites the
 *  graph in program order following the plan.
 */
#ifndef RIPPLE_REINPLACE_H_
#define RIPPLE_REINPLACE_H_

#include <dmlc/parameter.h>
#include <string>
#include <vector>
#include <unordered_map>
#include "./base.h"
#include "./graph.h"

namespace ripple {
namespace pass {

/*! \brief name of the counter of clones forced by a live alias */
constexpr const char* kMissedReinplacingOpportunities =
    "possibly_missed_reinplacing_opportunities";

/*! \brief outcome for one mutated argument */
enum class Decision {
  /*! \brief mutate the argument in place */
  kReinplace,
  /*! \brief mutate a copy of the argument */
  kClone,
  /*! \brief leave the call as it is */
  kNoOp
};

/*! \brief why an argument is not mutated in place */
enum class CloneReason {
  kNone,
  /*! \brief a graph input that the graph never writes back */
  kGraphInput,
  /*! \brief shares storage with a graph input */
  kViewOfGraphInput,
  /*! \brief the storage is read after the call */
  kLiveAlias,
  /*! \brief listed in only_clone_these_tensors by the producer */
  kProducerCloneOnly,
  /*! \brief another slot of the call already mutates this storage */
  kSharedStorage
};

/*! \brief decision for one mutated argument of a candidate */
struct SlotDecision {
  /*! \brief name of the slot */
  std::string name;
  /*! \brief input of the candidate holding the slot value */
  uint32_t input_index{0};
  Decision decision{Decision::kNoOp};
  CloneReason reason{CloneReason::kNone};
  /*! \brief copy_ writing the new slot value back into a graph input, to erase */
  NodePtr copy_epilogue;
};

/*! \brief a call that can be turned into a mutating call */
struct MutationCandidate {
  enum Kind {
    /*! \brief out-of-place call with a registered in-place counterpart */
    kSimple,
    /*! \brief auto_functionalized call */
    kGrouped
  };
  Kind kind{kSimple};
  /*! \brief the call */
  NodePtr node;
  /*! \brief in-place counterpart, kSimple only */
  const Op* inplace_op{nullptr};
  /*! \brief the mutated arguments, one for kSimple */
  std::vector<SlotDecision> slots;
  /*! \return names of the slots decided kClone */
  std::vector<std::string> cloned() const;
};

/*! \brief decision table of a graph */
struct ReinplacePlan {
  /*! \brief candidates in program order */
  std::vector<MutationCandidate> candidates;
  /*! \brief clones forced by a live alias */
  int64_t missed{0};
  /*!
   * \brief Find the candidate of a node.
   * \param node The node.
   * \return the candidate, nullptr if the node is not a candidate.
   */
  const MutationCandidate* Find(const Node* node) const;
};

/*! \brief options of the reinplacing pass */
struct ReinplaceParam : public dmlc::Parameter<ReinplaceParam> {
  bool verbose;

  DMLC_DECLARE_PARAMETER(ReinplaceParam) {
    DMLC_DECLARE_FIELD(verbose).set_default(false)
    .describe("Log the decision of every auto_functionalized call."
              " Also enabled by RIPPLE_REINPLACE_VERBOSE=1.");
  }
};

/*!
 * \brief Classify every candidate of the graph.
 *  Requires the graph attributes alias_info and liveness.
 * \param graph The graph.
 * \return the plan.
 */
ReinplacePlan PlanReinplace(const Graph& graph);

/*!
 * \brief Rewrite the graph following the plan.
 * \param graph The graph the plan was made for.
 * \param plan The plan.
 */
void ApplyReinplacePlan(Graph* graph, const ReinplacePlan& plan);

/*! \return printable name of a decision */
const char* DecisionName(Decision decision);

/*! \return printable name of a clone reason */
const char* CloneReasonName(CloneReason reason);

}  // namespace pass
}  // namespace ripple

#endif  // RIPPLE_REINPLACE_H_
