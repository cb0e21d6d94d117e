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
 * \file ripple/diagnostics.h
 * \brief Named counters reported by passes.
 */
#ifndef RIPPLE_DIAGNOSTICS_H_
#define RIPPLE_DIAGNOSTICS_H_

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ripple {

/*!
 * \brief A table of named 64-bit counters.
 *
 *  A pass reports to the table its caller passes in graph.attrs["diagnostic_counters"],
 *  to Global() when the attribute is absent, and nowhere when it holds nullptr.
 */
class DiagnosticCounters {
 public:
  /*!
   * \brief Add delta to a counter, creating it at zero first.
   * \param key The name of the counter.
   * \param delta The amount to add.
   */
  void Increment(const std::string& key, int64_t delta = 1);
  /*!
   * \brief Read a counter.
   * \param key The name of the counter.
   * \return the value, 0 for a counter never incremented.
   */
  int64_t Get(const std::string& key) const;
  /*! \brief Set every counter back to zero. */
  void Reset();
  /*! \return the process-wide counters, the default sink of the passes */
  static DiagnosticCounters* Global();

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, int64_t> counters_;
};

}  // namespace ripple

#endif  // RIPPLE_DIAGNOSTICS_H_
