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
 * \file ripple/executor.h
 * \brief Reference executor of a graph over 1-D float arrays.
 */
#ifndef RIPPLE_EXECUTOR_H_
#define RIPPLE_EXECUTOR_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "./base.h"
#include "./graph.h"

namespace ripple {
namespace runtime {

/*!
 * \brief 1-D float array over a shared storage.
 *  Views share the storage of their source, so writes through a view are
 *  visible through every other array on the same storage.
 */
class NDArray {
 public:
  NDArray() = default;
  /*!
   * \brief Allocate a zero filled array.
   * \param size The number of elements.
   */
  static NDArray Empty(size_t size);
  /*!
   * \brief Allocate an array holding a copy of data.
   * \param data The elements.
   */
  static NDArray FromVector(const std::vector<float>& data);
  /*! \return whether the array refers to a storage */
  inline bool defined() const {
    return data_ != nullptr;
  }
  /*! \return number of elements */
  inline size_t size() const {
    return size_;
  }
  /*! \return element i */
  inline float& operator[](size_t i) const {
    return (*data_)[offset_ + i * stride_];
  }
  /*!
   * \brief Make a view of the array.
   * \param begin First element of the view.
   * \param size Number of elements.
   * \param step Distance between elements.
   * \return the view, on the same storage.
   */
  NDArray View(size_t begin, size_t size, size_t step = 1) const;
  /*! \return a contiguous copy on fresh storage */
  NDArray Copy() const;
  /*!
   * \brief Copy the whole underlying storage, keeping the indexing.
   * \return an array indexing the copied storage the way this one does.
   */
  NDArray CopyStorage() const;
  /*!
   * \brief Index another storage the way this array indexes its own.
   * \param other An array holding the storage to use.
   * \return the rebased array.
   */
  NDArray Rebase(const NDArray& other) const;
  /*!
   * \brief Write the elements of src into this array.
   * \param src The source, of the same size.
   */
  void CopyFrom(const NDArray& src) const;
  /*! \return the elements */
  std::vector<float> ToVector() const;
  /*! \return whether the arrays share storage */
  inline bool SameStorage(const NDArray& other) const {
    return data_ == other.data_;
  }

 private:
  std::shared_ptr<std::vector<float> > data_;
  size_t offset_{0};
  size_t size_{0};
  size_t stride_{1};
};

/*!
 * \brief Reference kernel of an operator.
 *  A mutating kernel writes into its inputs.
 *
 * \param attrs The attributes of the node.
 * \param inputs The input arrays.
 * \param outputs The output arrays, to be set by the kernel.
 *
 * \note Register under "FCompute".
 */
using FCompute = std::function<void (const NodeAttrs& attrs,
                                     const std::vector<NDArray>& inputs,
                                     std::vector<NDArray>* outputs)>;

/*!
 * \brief Graph executor.
 *  Runs the nodes of a graph in program order.
 *
 * \code
 *  GraphExecutor exec(g);
 *  exec.SetInput("x", NDArray::FromVector({1, 2, 3}));
 *  exec.Run();
 *  std::vector<float> y = exec.GetOutput(0).ToVector();
 * \endcode
 */
class GraphExecutor {
 public:
  /*!
   * \brief Create an executor of the graph.
   *  Every operator of the graph must have FCompute.
   * \param graph The execution graph.
   */
  explicit GraphExecutor(Graph graph);
  /*! \return number of graph inputs */
  uint32_t num_inputs() const;
  /*! \return number of graph outputs */
  uint32_t num_outputs() const;
  /*!
   * \brief Get the input index given the name of input.
   * \param name The name of the input.
   * \return The index of input.
   */
  int GetInputIndex(const std::string& name) const;
  /*!
   * \brief set index-th input to the graph.
   *  The executor aliases data, so a mutation of the input is visible
   *  to the caller.
   * \param index The input index.
   * \param data The input data.
   */
  void SetInput(int index, NDArray data);
  /*!
   * \brief set an input to the graph by name.
   * \param name The input name.
   * \param data The input data.
   */
  void SetInput(const std::string& name, NDArray data);
  /*!
   * \brief Get index-th output.
   * \param index The output index.
   * \return the output of the last run.
   */
  NDArray GetOutput(int index) const;
  /*!
   * \brief Execute the graph, update output.
   */
  void Run();

 private:
  /*! \brief Setup the executors */
  void SetupOpExecs();
  /*! \brief The graph */
  Graph graph_;
  /*! \brief data entry of each node */
  std::vector<NDArray> data_entry_;
  /*! \brief operator on each node */
  std::vector<std::function<void()> > op_execs_;
};

}  // namespace runtime
}  // namespace ripple

#endif  // RIPPLE_EXECUTOR_H_
