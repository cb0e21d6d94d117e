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
 * \file reinplace.cc
 * \brief Turn out-of-place calls into mutating calls where it is safe.
 */
#include <ripple/reinplace.h>
#include <ripple/diagnostics.h>
#include <ripple/graph.h>
#include <ripple/graph_attr_types.h>
#include <ripple/op_attr_types.h>
#include <ripple/pass.h>
#include <ripple/top/tensor.h>
#include <algorithm>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace ripple {
namespace pass {

DMLC_REGISTER_PARAMETER(ReinplaceParam);

std::vector<std::string> MutationCandidate::cloned() const {
  std::vector<std::string> ret;
  for (const SlotDecision& s : slots) {
    if (s.decision == Decision::kClone) ret.push_back(s.name);
  }
  return ret;
}

const MutationCandidate* ReinplacePlan::Find(const Node* node) const {
  for (const MutationCandidate& c : candidates) {
    if (c.node.get() == node) return &c;
  }
  return nullptr;
}

const char* DecisionName(Decision decision) {
  switch (decision) {
    case Decision::kReinplace: return "reinplace";
    case Decision::kClone: return "clone";
    case Decision::kNoOp: return "noop";
  }
  return "unknown";
}

const char* CloneReasonName(CloneReason reason) {
  switch (reason) {
    case CloneReason::kNone: return "none";
    case CloneReason::kGraphInput: return "graph_input";
    case CloneReason::kViewOfGraphInput: return "view_of_graph_input";
    case CloneReason::kLiveAlias: return "live_alias";
    case CloneReason::kProducerCloneOnly: return "producer_clone_only";
    case CloneReason::kSharedStorage: return "shared_storage";
  }
  return "unknown";
}

namespace {

// Answers whether an argument may be mutated at a program point.
//
// Mutating a in place at the call nid turns the new value of a into a
// itself. The old contents of a must not be read after nid until the
// next copy_ into a overwrites them; once that copy_ ran, a holds the
// new value only if the copy_ wrote it back, and only until the next
// call that may write a.
class SafetyChecker {
 public:
  SafetyChecker(const IndexedGraph& idx,
                const AliasInfo& alias,
                const LivenessInfo& live)
      : idx_(idx), alias_(alias), live_(live) {
    static const Op* copy_op = Op::Get("copy_");
    for (uint32_t nid = 0; nid < idx_.num_nodes(); ++nid) {
      const auto& inode = idx_[nid];
      if (inode.source->op() != copy_op) continue;
      copies_[idx_.entry_id(inode.inputs[0])].push_back(nid);
    }
  }
  /*!
   * \brief Whether the argument a of the call nid can be mutated in place.
   * \param nid The call.
   * \param a The entry id of the argument.
   * \param result The entry id of the new value of a produced by the call.
   * \param reason Set to the reason when the answer is no.
   */
  bool CanInplace(uint32_t nid, uint32_t a, uint32_t result, CloneReason* reason) {
    uint32_t copy_nid = NextCopy(a, nid);
    if (idx_[idx_.entry_node(a)].source->is_variable()) {
      // the program never writes back into this input.
      if (copy_nid == kNoEntry) {
        *reason = CloneReason::kGraphInput;
        return false;
      }
    } else if (alias_.aliases_input(a)) {
      *reason = CloneReason::kViewOfGraphInput;
      return false;
    }
    if (ReadBeforeCopy(nid, a, copy_nid) || ReadAfterCopy(a, result, copy_nid)) {
      *reason = CloneReason::kLiveAlias;
      return false;
    }
    return true;
  }
  /*!
   * \brief Find the copy_ writing result back into the graph input a after the call nid.
   * \return the node, nullptr when the next copy_ into a writes something else.
   */
  NodePtr CopyEpilogue(uint32_t nid, uint32_t a, uint32_t result) const {
    uint32_t copy_nid = NextCopy(a, nid);
    if (copy_nid == kNoEntry) return nullptr;
    if (idx_.entry_id(idx_[copy_nid].inputs[1]) != result) return nullptr;
    return idx_[copy_nid].weak_ref.lock();
  }

 private:
  // first copy_ into a after nid, kNoEntry if there is none.
  uint32_t NextCopy(uint32_t a, uint32_t nid) const {
    auto it = copies_.find(a);
    if (it == copies_.end()) return kNoEntry;
    auto pos = std::upper_bound(it->second.begin(), it->second.end(), nid);
    return pos == it->second.end() ? kNoEntry : *pos;
  }
  // first call after nid that may write the storage of a, kNoEntry if there is none.
  uint32_t NextWrite(uint32_t a, uint32_t nid) {
    uint32_t ret = kNoEntry;
    for (uint32_t view : alias_.aliases(a)) {
      for (uint32_t user : idx_.users(view)) {
        if (user > nid && user < ret && MayWrite(user)) ret = user;
      }
    }
    return ret;
  }
  // whether the old contents of a are read after nid, before copy_nid overwrites them.
  bool ReadBeforeCopy(uint32_t nid, uint32_t a, uint32_t copy_nid) {
    if (copy_nid == kNoEntry && !live_.IsStorageLiveAfter(a, nid)) return false;
    for (uint32_t view : alias_.aliases(a)) {
      if (idx_.is_output(view) && copy_nid == kNoEntry) return true;
      for (uint32_t user : idx_.users(view)) {
        if (user <= nid || user >= copy_nid) continue;
        if (IsMetaOnlyUser(user)) continue;
        return true;
      }
    }
    return false;
  }
  // whether result is read once copy_nid may have overwritten a.
  bool ReadAfterCopy(uint32_t a, uint32_t result, uint32_t copy_nid) {
    if (copy_nid == kNoEntry) return false;
    uint32_t valid_until = copy_nid;
    if (idx_.entry_id(idx_[copy_nid].inputs[1]) == result) {
      valid_until = NextWrite(a, copy_nid);
    }
    for (uint32_t view : alias_.aliases(result)) {
      if (idx_.is_output(view) && valid_until != kNoEntry) return true;
      for (uint32_t user : idx_.users(view)) {
        if (user < valid_until || IsMetaOnlyUser(user)) continue;
        return true;
      }
    }
    return false;
  }
  bool MayWrite(uint32_t nid) const {
    static auto& fmutate = Op::GetAttr<FMutateInputs>("FMutateInputs");
    static auto& inplaceable = Op::GetAttr<TInplaceableOp>("TInplaceableOp");
    static const Op* af_op = Op::Get("auto_functionalized");
    const Op* op = idx_[nid].source->op();
    return op == af_op || fmutate.count(op) || inplaceable.count(op);
  }
  bool IsMetaOnlyUser(uint32_t nid) {
    static auto& is_view = Op::GetAttr<TIsView>("TIsView");
    static auto& is_meta_only = Op::GetAttr<TIsMetaOnly>("TIsMetaOnly");
    auto it = meta_only_.find(nid);
    if (it != meta_only_.end()) return it->second;
    const Op* op = idx_[nid].source->op();
    bool ret = is_meta_only.get(op, false);
    if (!ret && is_view.get(op, false)) {
      uint32_t eid = idx_.entry_id(nid, 0);
      ret = !idx_.is_output(eid);
      for (uint32_t user : idx_.users(eid)) {
        if (!ret) break;
        ret = IsMetaOnlyUser(user);
      }
    }
    meta_only_[nid] = ret;
    return ret;
  }

  const IndexedGraph& idx_;
  const AliasInfo& alias_;
  const LivenessInfo& live_;
  // copy_ nodes into each entry, in program order
  std::unordered_map<uint32_t, std::vector<uint32_t> > copies_;
  std::unordered_map<uint32_t, bool> meta_only_;
};

inline bool IsVariableEntry(const IndexedGraph& idx, uint32_t eid) {
  return idx[idx.entry_node(eid)].source->is_variable();
}

MutationCandidate PlanSimple(const IndexedGraph& idx,
                             uint32_t nid,
                             const TInplaceableOp& info,
                             SafetyChecker* checker,
                             int64_t* missed) {
  static auto& fmutate = Op::GetAttr<FMutateInputs>("FMutateInputs");
  NodePtr node = idx[nid].weak_ref.lock();
  MutationCandidate c;
  c.kind = MutationCandidate::kSimple;
  c.node = node;
  c.inplace_op = Op::Find(info.inplace_op);
  CHECK(c.inplace_op != nullptr)
      << "in-place counterpart " << info.inplace_op << " of operator "
      << node->op()->name << " is not registered";
  CHECK(fmutate.count(c.inplace_op))
      << "in-place counterpart " << info.inplace_op << " of operator "
      << node->op()->name << " mutates none of its inputs";
  CHECK_EQ(node->num_outputs(), 1U)
      << "operator " << node->op()->name << " with an in-place counterpart"
      << " must have a single output";
  CHECK_LT(info.mutated_arg, node->inputs.size())
      << "operator " << node->op()->name << " mutates input " << info.mutated_arg
      << " which node " << node->attrs.name << " does not have";

  SlotDecision s;
  uint32_t num_inputs = static_cast<uint32_t>(node->inputs.size());
  s.name = ListInputNames(node->attrs, num_inputs)[info.mutated_arg];
  s.input_index = info.mutated_arg;
  uint32_t a = idx.entry_id(node->inputs[info.mutated_arg]);
  uint32_t result = idx.entry_id(nid, 0);
  if (!checker->CanInplace(nid, a, result, &s.reason)) {
    s.decision = Decision::kClone;
    if (s.reason == CloneReason::kLiveAlias) ++(*missed);
  } else if (info.extra_check != nullptr && !info.extra_check(*node)) {
    s.decision = Decision::kNoOp;
  } else {
    s.decision = Decision::kReinplace;
    if (IsVariableEntry(idx, a)) {
      s.copy_epilogue = checker->CopyEpilogue(nid, a, result);
    }
  }
  c.slots.push_back(s);
  return c;
}

MutationCandidate PlanGrouped(const IndexedGraph& idx,
                              const AliasInfo& alias,
                              uint32_t nid,
                              SafetyChecker* checker,
                              int64_t* missed) {
  NodePtr node = idx[nid].weak_ref.lock();
  const top::AutoFunctionalizedAttrs& af =
      ripple::get<top::AutoFunctionalizedAttrs>(node->attrs.parsed);
  MutationCandidate c;
  c.kind = MutationCandidate::kGrouped;
  c.node = node;
  // storage classes mutated in place by the call
  std::unordered_set<uint32_t> reinplaced;
  for (uint32_t k = 0; k < af.num_slots(); ++k) {
    SlotDecision s;
    s.name = af.slot_names[k];
    s.input_index = af.slot_input(k);
    uint32_t a = idx.entry_id(node->inputs[s.input_index]);
    uint32_t result = idx.entry_id(nid, af.slot_output(k));
    if (std::find(af.only_clone.begin(), af.only_clone.end(), s.name) != af.only_clone.end()) {
      s.decision = Decision::kClone;
      s.reason = CloneReason::kProducerCloneOnly;
    } else if (reinplaced.count(alias.storage[a])) {
      s.decision = Decision::kClone;
      s.reason = CloneReason::kSharedStorage;
    } else if (!checker->CanInplace(nid, a, result, &s.reason)) {
      s.decision = Decision::kClone;
      if (s.reason == CloneReason::kLiveAlias) ++(*missed);
    } else {
      s.decision = Decision::kReinplace;
      reinplaced.insert(alias.storage[a]);
      if (IsVariableEntry(idx, a)) {
        s.copy_epilogue = checker->CopyEpilogue(nid, a, result);
      }
    }
    c.slots.push_back(s);
  }
  return c;
}

// erase the write back of a reinplaced slot, its readers see the input.
void EraseCopyEpilogue(Graph* g, const SlotDecision& s) {
  if (s.copy_epilogue == nullptr) return;
  NodeEntry dst = s.copy_epilogue->inputs[0];
  g->ReplaceAllUsesWith(NodeEntry(s.copy_epilogue, 0), dst);
  g->EraseNode(s.copy_epilogue.get());
}

void ApplySimple(Graph* g, const MutationCandidate& c) {
  const SlotDecision& s = c.slots[0];
  if (s.decision != Decision::kReinplace) return;
  const NodePtr& node = c.node;
  NodeEntry arg = node->inputs[s.input_index];
  EraseCopyEpilogue(g, s);
  g->ReplaceAllUsesWith(NodeEntry(node, 0), arg);
  NodePtr call = Node::Create(c.inplace_op, node->attrs.name);
  call->attrs.dict = node->attrs.dict;
  if (c.inplace_op->attr_parser != nullptr) {
    c.inplace_op->attr_parser(&(call->attrs));
  }
  call->inputs = node->inputs;
  g->ReplaceNode(node.get(), call);
}

// Rebuild on top of a clone of base the views leading from base to arg.
NodeEntry ReplayViews(Graph* g,
                      const Node* anchor,
                      const NodeEntry& base,
                      const NodeEntry& arg,
                      const NodeEntry& cloned) {
  static auto& is_view = Op::GetAttr<TIsView>("TIsView");
  std::vector<const Node*> chain;
  NodeEntry e = arg;
  while (!NodeEntryEqual()(e, base)) {
    const Node* n = e.node.get();
    CHECK(!n->is_variable() && e.index == 0 && is_view.get(n->op(), false))
        << "argument " << arg.node->attrs.name << " of " << anchor->attrs.name
        << " is not a view of its base " << base.node->attrs.name;
    chain.push_back(n);
    e = n->inputs[0];
  }
  NodeEntry cur = cloned;
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
    const Node* n = *it;
    std::vector<NodeEntry> inputs = n->inputs;
    inputs[0] = cur;
    NodePtr view = g->InsertNodeBefore(anchor, n->op(), n->attrs.name + "_replay",
                                       inputs, n->attrs.dict);
    cur = NodeEntry(view, 0);
  }
  return cur;
}

void ApplyGrouped(Graph* g, const MutationCandidate& c) {
  static const Op* clone_op = Op::Get("clone");
  const NodePtr& node = c.node;
  const top::AutoFunctionalizedAttrs& af =
      ripple::get<top::AutoFunctionalizedAttrs>(node->attrs.parsed);
  std::vector<NodeEntry> call_inputs(node->inputs.begin(),
                                     node->inputs.begin() + af.num_op_inputs);
  // value holding the new contents of each slot after the call
  std::vector<NodeEntry> slot_values;
  for (uint32_t k = 0; k < af.num_slots(); ++k) {
    const SlotDecision& s = c.slots[k];
    NodeEntry value = node->inputs[s.input_index];
    if (s.decision == Decision::kReinplace) {
      slot_values.push_back(value);
      continue;
    }
    NodePtr cloned = g->InsertNodeBefore(
        node.get(), clone_op, node->attrs.name + "_" + s.name + "_clone", {value});
    slot_values.emplace_back(cloned, 0);
    if (af.param.num_bases == 0) {
      call_inputs[af.mutated_args[k]] = slot_values.back();
    } else {
      for (size_t i = 0; i < af.mutated_args.size(); ++i) {
        if (af.arg_base[i] != static_cast<int>(k)) continue;
        uint32_t arg = af.mutated_args[i];
        call_inputs[arg] = ReplayViews(g, node.get(), value, node->inputs[arg], slot_values.back());
      }
    }
  }

  std::unordered_map<std::string, std::string> dict = af.op_attrs.dict;
  dict["__only_clone_these_tensors__"] = top::JoinList(c.cloned());
  dict["__mutable_op_origin__"] = "auto_functionalized";
  NodePtr call = g->InsertNodeBefore(
      node.get(), af.mutable_op, node->attrs.name, call_inputs, dict);
  for (uint32_t i = 0; i < af.num_op_outputs; ++i) {
    g->ReplaceAllUsesWith(NodeEntry(node, i), NodeEntry(call, i));
  }
  for (uint32_t k = 0; k < af.num_slots(); ++k) {
    EraseCopyEpilogue(g, c.slots[k]);
    g->ReplaceAllUsesWith(NodeEntry(node, af.slot_output(k)), slot_values[k]);
  }
  g->EraseNode(node.get());
}

void LogGrouped(const MutationCandidate& c) {
  std::ostringstream attempted, cloned, missed;
  for (const SlotDecision& s : c.slots) {
    attempted << ' ' << s.name;
    if (s.decision != Decision::kClone) continue;
    cloned << ' ' << s.name << '(' << CloneReasonName(s.reason) << ')';
    if (s.reason == CloneReason::kLiveAlias) missed << ' ' << s.name;
  }
  LOG(INFO) << "For node " << c.node->attrs.name << ", attempted to reinplace ["
            << attempted.str() << " ]. We were unable to reinplace ["
            << cloned.str() << " ]; [" << missed.str()
            << " ] (if non-empty) are possible missed reinplacing opportunities"
            << " that may be bad for memory usage and performance.";
}

}  // namespace

ReinplacePlan PlanReinplace(const Graph& g) {
  static auto& fmutate = Op::GetAttr<FMutateInputs>("FMutateInputs");
  static auto& inplaceable = Op::GetAttr<TInplaceableOp>("TInplaceableOp");
  static const Op* af_op = Op::Get("auto_functionalized");
  const IndexedGraph& idx = g.indexed_graph();
  const AliasInfo& alias = g.GetAttr<AliasInfo>("alias_info");
  const LivenessInfo& live = g.GetAttr<LivenessInfo>("liveness");
  CHECK_EQ(alias.storage.size(), idx.num_node_entries())
      << "alias_info does not match the graph, rerun AnalyzeAlias";
  CHECK_EQ(live.last_read.size(), idx.num_node_entries())
      << "liveness does not match the graph, rerun AnalyzeLiveness";

  SafetyChecker checker(idx, alias, live);
  ReinplacePlan plan;
  for (uint32_t nid = 0; nid < idx.num_nodes(); ++nid) {
    const Node* node = idx[nid].source;
    if (node->is_variable()) continue;
    // an explicit mutating call is kept as written.
    if (fmutate.count(node->op())) continue;
    if (node->op() == af_op) {
      plan.candidates.push_back(PlanGrouped(idx, alias, nid, &checker, &plan.missed));
    } else if (inplaceable.count(node->op())) {
      plan.candidates.push_back(
          PlanSimple(idx, nid, inplaceable[node->op()], &checker, &plan.missed));
    }
  }
  return plan;
}

void ApplyReinplacePlan(Graph* g, const ReinplacePlan& plan) {
  for (const MutationCandidate& c : plan.candidates) {
    if (c.kind == MutationCandidate::kSimple) {
      ApplySimple(g, c);
    } else {
      ApplyGrouped(g, c);
    }
  }
}

namespace {

Graph ReinplacePass(Graph ret) {
  ReinplaceParam param;
  if (ret.HasAttr("reinplace_options")) {
    param.Init(ret.GetAttr<PassOptions>("reinplace_options"));
  } else {
    param.Init(PassOptions());
  }
  param.verbose = param.verbose || dmlc::GetEnv("RIPPLE_REINPLACE_VERBOSE", false);
  DiagnosticCounters* counters = DiagnosticCounters::Global();
  if (ret.HasAttr("diagnostic_counters")) {
    counters = ret.GetAttr<DiagnosticCounters*>("diagnostic_counters");
  }

  ReinplacePlan plan = PlanReinplace(ret);
  if (param.verbose) {
    for (const MutationCandidate& c : plan.candidates) {
      if (c.kind == MutationCandidate::kGrouped) LogGrouped(c);
    }
  }
  if (counters != nullptr) {
    counters->Increment(kMissedReinplacingOpportunities, plan.missed);
  }
  ApplyReinplacePlan(&ret, plan);
  // the analyses describe the graph before the rewrite.
  ret.attrs.erase("alias_info");
  ret.attrs.erase("liveness");
  return ret;
}

RIPPLE_REGISTER_PASS(Reinplace)
.describe("Turn out-of-place calls into mutating calls where no later read can observe it.")
.set_body(ReinplacePass)
.set_change_graph(true)
.depend_graph_attr("alias_info")
.depend_graph_attr("liveness")
.depend_op_attr("TInplaceableOp")
.depend_op_attr("FMutateInputs");

}  // namespace
}  // namespace pass
}  // namespace ripple
