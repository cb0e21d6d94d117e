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
 * \file graph_executor.cc
 * \brief Reference executor of a graph over 1-D float arrays.
 */
#include <ripple/executor.h>
#include <ripple/op_attr_types.h>
#include <algorithm>

namespace ripple {
namespace runtime {

NDArray NDArray::Empty(size_t size) {
  NDArray ret;
  ret.data_ = std::make_shared<std::vector<float> >(size, 0.0f);
  ret.size_ = size;
  return ret;
}

NDArray NDArray::FromVector(const std::vector<float>& data) {
  NDArray ret;
  ret.data_ = std::make_shared<std::vector<float> >(data);
  ret.size_ = data.size();
  return ret;
}

NDArray NDArray::View(size_t begin, size_t size, size_t step) const {
  CHECK(defined());
  CHECK_GE(step, 1U);
  if (size != 0) {
    CHECK_LT(begin + (size - 1) * step, size_)
        << "view [" << begin << ", +" << size << ", step " << step
        << ") is out of range of an array of size " << size_;
  }
  NDArray ret = *this;
  ret.offset_ = offset_ + begin * stride_;
  ret.size_ = size;
  ret.stride_ = stride_ * step;
  return ret;
}

NDArray NDArray::Copy() const {
  NDArray ret = NDArray::Empty(size_);
  ret.CopyFrom(*this);
  return ret;
}

NDArray NDArray::CopyStorage() const {
  CHECK(defined());
  NDArray ret = *this;
  ret.data_ = std::make_shared<std::vector<float> >(*data_);
  return ret;
}

NDArray NDArray::Rebase(const NDArray& other) const {
  CHECK(other.defined());
  CHECK_EQ(data_->size(), other.data_->size())
      << "cannot rebase an array onto a storage of a different size";
  NDArray ret = *this;
  ret.data_ = other.data_;
  return ret;
}

void NDArray::CopyFrom(const NDArray& src) const {
  CHECK_EQ(size_, src.size_)
      << "copy between arrays of different sizes";
  // src may overlap this array, read it fully first.
  std::vector<float> tmp = src.ToVector();
  for (size_t i = 0; i < size_; ++i) {
    (*this)[i] = tmp[i];
  }
}

std::vector<float> NDArray::ToVector() const {
  std::vector<float> ret(size_);
  for (size_t i = 0; i < size_; ++i) {
    ret[i] = (*this)[i];
  }
  return ret;
}

GraphExecutor::GraphExecutor(Graph graph)
    : graph_(std::move(graph)) {
  data_entry_.resize(graph_.indexed_graph().num_node_entries());
  this->SetupOpExecs();
}

uint32_t GraphExecutor::num_inputs() const {
  return static_cast<uint32_t>(graph_.indexed_graph().input_nodes().size());
}

uint32_t GraphExecutor::num_outputs() const {
  return static_cast<uint32_t>(graph_.indexed_graph().outputs().size());
}

void GraphExecutor::Run() {
  const auto& idx = graph_.indexed_graph();
  for (uint32_t nid : idx.input_nodes()) {
    CHECK(data_entry_[idx.entry_id(nid, 0)].defined())
        << "input " << idx[nid].source->attrs.name << " is not set";
  }
  for (size_t i = 0; i < op_execs_.size(); ++i) {
    if (op_execs_[i]) op_execs_[i]();
  }
}

int GraphExecutor::GetInputIndex(const std::string& name) const {
  const auto& idx = graph_.indexed_graph();
  for (size_t i = 0; i< idx.input_nodes().size(); ++i) {
    if (idx[idx.input_nodes()[i]].source->attrs.name == name) {
      return static_cast<int>(i);
    }
  }
  LOG(FATAL) << "cannot find " << name << " among input";
  return -1;
}

void GraphExecutor::SetInput(int index, NDArray data) {
  const auto& idx = graph_.indexed_graph();
  CHECK_LT(static_cast<size_t>(index), idx.input_nodes().size());
  uint32_t eid = idx.entry_id(idx.input_nodes()[index], 0);
  data_entry_[eid] = std::move(data);
}

void GraphExecutor::SetInput(const std::string& name, NDArray data) {
  this->SetInput(this->GetInputIndex(name), std::move(data));
}

NDArray GraphExecutor::GetOutput(int index) const {
  const auto& idx = graph_.indexed_graph();
  CHECK_LT(static_cast<size_t>(index), idx.outputs().size());
  uint32_t eid = idx.entry_id(idx.outputs()[index]);
  CHECK(data_entry_[eid].defined())
      << "output " << index << " is not computed, call Run first";
  return data_entry_[eid];
}

void GraphExecutor::SetupOpExecs() {
  static auto& fcompute = Op::GetAttr<FCompute>("FCompute");
  const auto& idx = graph_.indexed_graph();
  op_execs_.resize(idx.num_nodes());
  for (uint32_t nid = 0; nid < idx.num_nodes(); ++nid) {
    const auto& inode = idx[nid];
    if (inode.source->is_variable()) continue;
    const Op* op = inode.source->op();
    CHECK(fcompute.count(op))
        << "operator " << op->name << " of node " << inode.source->attrs.name
        << " has no FCompute";
    std::vector<uint32_t> in_eids, out_eids;
    for (const auto& e : inode.inputs) {
      in_eids.push_back(idx.entry_id(e));
    }
    for (uint32_t index = 0; index < inode.source->num_outputs(); ++index) {
      out_eids.push_back(idx.entry_id(nid, index));
    }
    FCompute fn = fcompute[op];
    const NodeAttrs* attrs = &(inode.source->attrs);
    op_execs_[nid] = [this, fn, attrs, in_eids, out_eids]() {
      std::vector<NDArray> inputs;
      for (uint32_t eid : in_eids) {
        inputs.push_back(data_entry_[eid]);
      }
      std::vector<NDArray> outputs(out_eids.size());
      fn(*attrs, inputs, &outputs);
      for (size_t i = 0; i < out_eids.size(); ++i) {
        CHECK(outputs[i].defined())
            << "operator " << attrs->op->name << " did not set output " << i;
        data_entry_[out_eids[i]] = outputs[i];
      }
    };
  }
}

}  // namespace runtime
}  // namespace ripple
