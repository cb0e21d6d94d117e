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
 * \file ripple/base.h
 * \brief dmlc-core pieces shared by the ripple headers.
 */
#ifndef RIPPLE_BASE_H_
#define RIPPLE_BASE_H_

#include <dmlc/base.h>
#include <dmlc/any.h>
#include <dmlc/logging.h>
#include <dmlc/registry.h>
#include <dmlc/array_view.h>

namespace ripple {

/*!
 * \brief Type erased value of a node attribute, a graph attribute
 *  or an operator attribute table.
 */
using dmlc::any;
/*! \brief checked getter of any */
using dmlc::get;
/*! \brief getter of any for attributes whose type the pass registry guarantees */
using dmlc::unsafe_get;
/*! \brief non-owning view of the inputs of an indexed node */
using dmlc::array_view;

}  // namespace ripple

#define RIPPLE_STRINGIZE_DETAIL(x) #x
#define RIPPLE_STRINGIZE(x) RIPPLE_STRINGIZE_DETAIL(x)
/*! \brief suffix of an operator description naming where it is registered */
#define RIPPLE_ADD_FILELINE "\n\nDefined in " __FILE__ ":L" RIPPLE_STRINGIZE(__LINE__)

#endif  // RIPPLE_BASE_H_
