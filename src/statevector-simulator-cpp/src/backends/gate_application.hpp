/*
Copyright (c) 2017 IBM Corporation. All Rights Reserved.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

  http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
*/

/**
 * @file    gate_application.hpp
 * @brief   In-place application of controlled single-qubit gates and SWAP
 */

#ifndef _gate_application_hpp_
#define _gate_application_hpp_

#include <algorithm>
#include <sstream>
#include <utility>

#include "qubit_vector.hpp"
#include "types.hpp"

namespace QCSIM {

using QV::QubitVector;
using QV::omp_int_t;

/*******************************************************************************
 *
 * Gate application
 *
 * Gates act directly on the flat amplitude vector. A single-qubit gate on
 * qubit t updates each pair of indexes (k, k | 2^t) that differ only in bit t,
 * so a controlled gate on n qubits never needs its 2^n x 2^n matrix.
 *
 ******************************************************************************/

/**
 * Checks that target and controls are valid qubits of qv, that controls has
 * no duplicates and does not contain target.
 * @throws InvalidIndexError, InvalidOperationError
 */
void check_controls(const QubitVector &qv, const uint_t target,
                    const reg_t &controls);

/**
 * Applies the row-major 2x2 matrix mat to qubit target, conditioned on every
 * qubit in controls being 1. An empty controls list applies the gate
 * unconditionally.
 * @param qv the state to update in place
 * @param target the target qubit
 * @param controls the control qubits
 * @param mat the row-major matrix {a, b, c, d}
 */
void apply_single_qubit(QubitVector &qv, const uint_t target,
                        const reg_t &controls, const cvector_t &mat);

/**
 * Exchanges the states of qubits q0 and q1.
 */
void apply_swap(QubitVector &qv, const uint_t q0, const uint_t q1);

/*******************************************************************************
 *
 * Implementations
 *
 ******************************************************************************/

inline void check_controls(const QubitVector &qv, const uint_t target,
                           const reg_t &controls) {
  qv.check_qubit(target);
  for (size_t j = 0; j < controls.size(); j++) {
    qv.check_qubit(controls[j]);
    if (controls[j] == target) {
      std::stringstream ss;
      ss << "target qubit " << target << " is also a control " << controls;
      throw InvalidOperationError(ss.str());
    }
    if (std::find(controls.begin() + j + 1, controls.end(), controls[j]) !=
        controls.end()) {
      std::stringstream ss;
      ss << "duplicate control qubit " << controls[j] << " in " << controls;
      throw InvalidOperationError(ss.str());
    }
  }
}

inline void apply_single_qubit(QubitVector &qv, const uint_t target,
                               const reg_t &controls, const cvector_t &mat) {

  // Error checking
  check_controls(qv, target, controls);
  if (mat.size() != 4) {
    std::stringstream ss;
    ss << "single-qubit matrix has " << mat.size() << " != 4 entries";
    throw InvalidOperationError(ss.str());
  }

  // Control bits that must all be set for the pair to be updated
  uint_t mask = 0;
  for (const auto q : controls)
    mask |= (1ULL << q);

  cvector_t &vec = qv.vector();
  const omp_int_t end1 = qv.size();     // end for k1 loop
  const omp_int_t end2 = 1LL << target; // end for k2 loop
  const omp_int_t step1 = end2 << 1;    // step for k1 loop

#pragma omp parallel if (qv.parallel()) num_threads(qv.get_omp_threads())
  {
#ifdef _WIN32
  #pragma omp for
#else
  #pragma omp for collapse(2)
#endif
    for (omp_int_t k1 = 0; k1 < end1; k1 += step1)
      for (omp_int_t k2 = 0; k2 < end2; k2++) {
        const uint_t k = k1 | k2;
        if ((k & mask) != mask)
          continue;
        const auto cache0 = vec[k];
        const auto cache1 = vec[k | end2];
        vec[k] = mat[0] * cache0 + mat[1] * cache1;
        vec[k | end2] = mat[2] * cache0 + mat[3] * cache1;
      }
  } // end omp parallel
}

inline void apply_swap(QubitVector &qv, const uint_t q0, const uint_t q1) {

  // Error checking
  qv.check_qubit(q0);
  qv.check_qubit(q1);
  if (q0 == q1) {
    std::stringstream ss;
    ss << "swap targets must differ, got " << q0 << " twice";
    throw InvalidOperationError(ss.str());
  }

  const uint_t mask0 = 1ULL << q0;
  const uint_t mask1 = 1ULL << q1;
  cvector_t &vec = qv.vector();
  const omp_int_t end = qv.size();

  // Only the (q0=1, q1=0) member of each pair does the exchange
#pragma omp parallel for if (qv.parallel()) num_threads(qv.get_omp_threads())
  for (omp_int_t k = 0; k < end; k++) {
    const uint_t i = k;
    if ((i & mask0) && !(i & mask1))
      std::swap(vec[i], vec[(i ^ mask0) | mask1]);
  }
}

//------------------------------------------------------------------------------
} // end namespace QCSIM

#endif
