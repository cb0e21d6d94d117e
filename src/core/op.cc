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
 * \file op.cc
 * \brief Operator registry and the attribute tables of the operators.
 */
#include <ripple/base.h>
#include <ripple/op.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dmlc {
DMLC_REGISTRY_ENABLE(ripple::Op);
}  // namespace dmlc

namespace ripple {

namespace {

// attribute tables of all operators, keyed by attribute name.
// Each table is an OpMap<T> indexed by Op::index_.
struct OpAttrTables {
  std::mutex mutex;
  uint32_t num_ops{0};
  std::unordered_map<std::string, std::unique_ptr<any> > tables;

  static OpAttrTables* Global() {
    static OpAttrTables inst;
    return &inst;
  }
};

// in-place operators are named after their functional form with a trailing '_'
std::string Counterpart(const std::string& name) {
  if (!name.empty() && name.back() == '_') {
    return name.substr(0, name.size() - 1);
  }
  return name + "_";
}

}  // namespace

Op::Op() {
  OpAttrTables* t = OpAttrTables::Global();
  std::lock_guard<std::mutex> lock(t->mutex);
  index_ = t->num_ops++;
}

const Op* Op::Get(const std::string& name) {
  const Op* op = dmlc::Registry<Op>::Find(name);
  if (op == nullptr) {
    std::string other = Counterpart(name);
    if (dmlc::Registry<Op>::Find(other) != nullptr) {
      LOG(FATAL) << "Operator " << name << " is not registered, "
                 << other << " is";
    }
    LOG(FATAL) << "Operator " << name << " is not registered";
  }
  return op;
}

const Op* Op::Find(const std::string& name) {
  return dmlc::Registry<Op>::Find(name);
}

std::vector<std::string> Op::ListNames() {
  std::vector<std::string> ret = dmlc::Registry<Op>::ListAllNames();
  std::sort(ret.begin(), ret.end());
  return ret;
}

const any* Op::GetAttrMap(const std::string& key) {
  OpAttrTables* t = OpAttrTables::Global();
  std::lock_guard<std::mutex> lock(t->mutex);
  auto it = t->tables.find(key);
  return it == t->tables.end() ? nullptr : it->second.get();
}

// updater runs under the lock and must not query the tables
void Op::UpdateAttrMap(const std::string& key,
                       std::function<void(any*)> updater) {
  OpAttrTables* t = OpAttrTables::Global();
  std::lock_guard<std::mutex> lock(t->mutex);
  std::unique_ptr<any>& table = t->tables[key];
  if (table == nullptr) table.reset(new any());
  if (updater != nullptr) updater(table.get());
}

}  // namespace ripple
