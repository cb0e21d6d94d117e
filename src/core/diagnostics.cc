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
 * \file diagnostics.cc
 * \brief Named counters reported by passes.
 */
#include <ripple/diagnostics.h>

namespace ripple {

void DiagnosticCounters::Increment(const std::string& key, int64_t delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_[key] += delta;
}

int64_t DiagnosticCounters::Get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counters_.find(key);
  return it == counters_.end() ? 0 : it->second;
}

void DiagnosticCounters::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_.clear();
}

DiagnosticCounters* DiagnosticCounters::Global() {
  static DiagnosticCounters inst;
  return &inst;
}

}  // namespace ripple
