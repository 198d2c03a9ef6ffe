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
 * @file    qubit_vector.hpp
 * @brief   QubitVector class
 */

#ifndef _qubit_vector_hpp_
#define _qubit_vector_hpp_

#include <cmath>
#include <complex>
#include <sstream>
#include <string>
#include <vector>

#include "types.hpp"

namespace QV {

using omp_int_t = int64_t; // signed int for OpenMP 2.0 on msvc

/*******************************************************************************
 *
 * QubitVector Class
 *
 * Dense vector of the 2^n complex amplitudes of an n-qubit register. Bit i of
 * a basis index is the computational basis value of qubit i, so qubit 0 is the
 * least significant bit. The class only stores and queries amplitudes; gates
 * and measurements are applied by the backend functions operating on it.
 *
 ******************************************************************************/

class QubitVector {

public:

  /************************
   * Constructors
   ************************/

  explicit QubitVector(size_t num_qubits = 0);
  QubitVector(const cvector_t &vec);

  /************************
   * Utility
   ************************/

  inline uint_t size() const { return num_states; };
  inline uint_t qubits() const { return num_qubits; };
  inline cvector_t &vector() { return state_vector; };
  inline const cvector_t &vector() const { return state_vector; };

  // Iterate over amplitudes in basis index order
  inline cvector_t::const_iterator begin() const { return state_vector.cbegin(); };
  inline cvector_t::const_iterator end() const { return state_vector.cend(); };

  double norm() const;
  void renormalize();
  void initialize();

  void set_omp_threads(int n);
  void set_omp_threshold(int n);
  inline uint_t get_omp_threads() const { return omp_threads; };
  inline uint_t get_omp_threshold() const { return omp_threshold; };

  // True if loops over this vector should be run with OpenMP
  inline bool parallel() const {
    return num_qubits > omp_threshold && omp_threads > 1;
  };

  /**************************************
   * Z-measurement outcome probability
   **************************************/

  // Probability of a single basis index
  double probability(const uint_t index) const;

  // Probability that `qubit` is measured as `outcome`
  double probability(const uint_t qubit, const uint_t outcome) const;

  // Total probability of an arbitrary set of basis indexes
  double total_probability(const reg_t &indexes) const;

  /************************
   * Operators
   ************************/

  // Assignment operator
  QubitVector &operator=(const cvector_t &vec);

  // Element access
  complex_t &operator[](uint_t element);
  complex_t operator[](uint_t element) const;

  // Bounds checked element access
  complex_t &at(uint_t element);
  complex_t at(uint_t element) const;

  // Scalar multiplication
  QubitVector &operator*=(const complex_t &lambda);
  QubitVector &operator*=(const double &lambda);

  /************************
   * Error checking
   ************************/

  void check_qubit(const uint_t qubit) const;
  void check_index(const uint_t element) const;

protected:
  size_t num_qubits;
  size_t num_states;
  cvector_t state_vector;

  // OMP
  uint_t omp_threads = 1;     // Disable multithreading by default
  uint_t omp_threshold = 14;  // Qubit threshold for multithreading when enabled
};

/*******************************************************************************
 *
 * Implementations
 *
 ******************************************************************************/

//------------------------------------------------------------------------------
// Error Handling
//------------------------------------------------------------------------------

inline void QubitVector::check_qubit(const uint_t qubit) const {
  if (qubit + 1 > num_qubits) {
    std::stringstream ss;
    ss << "QubitVector: qubit index " << qubit << " >= " << num_qubits;
    throw QCSIM::InvalidIndexError(ss.str());
  }
}

inline void QubitVector::check_index(const uint_t element) const {
  if (element >= num_states) {
    std::stringstream ss;
    ss << "QubitVector: vector index " << element << " >= " << num_states;
    throw QCSIM::InvalidIndexError(ss.str());
  }
}

//------------------------------------------------------------------------------
// Constructors
//------------------------------------------------------------------------------

inline QubitVector::QubitVector(size_t num_qubits_) : num_qubits(num_qubits_) {
  if (num_qubits > 62) {
    std::stringstream ss;
    ss << "QubitVector: cannot allocate a " << num_qubits << "-qubit vector";
    throw QCSIM::InvalidOperationError(ss.str());
  }
  num_states = 1ULL << num_qubits;
  state_vector.assign(num_states, 0.);
}

inline QubitVector::QubitVector(const cvector_t &vec) : QubitVector() {
  *this = vec;
}

//------------------------------------------------------------------------------
// Operators
//------------------------------------------------------------------------------

inline complex_t &QubitVector::operator[](uint_t element) {
#ifdef QCSIM_DEBUG
  check_index(element);
#endif
  return state_vector[element];
}

inline complex_t QubitVector::operator[](uint_t element) const {
#ifdef QCSIM_DEBUG
  check_index(element);
#endif
  return state_vector[element];
}

inline complex_t &QubitVector::at(uint_t element) {
  check_index(element);
  return state_vector[element];
}

inline complex_t QubitVector::at(uint_t element) const {
  check_index(element);
  return state_vector[element];
}

inline QubitVector &QubitVector::operator=(const cvector_t &vec) {

  // Get qubit number
  uint_t size = vec.size();
  uint_t nq = 0;
  while (size >>= 1) ++nq;

  if (vec.empty() || vec.size() != 1ULL << nq) {
    std::stringstream ss;
    ss << "QubitVector: input vector of length " << vec.size()
       << " is not a multi-qubit vector";
    throw QCSIM::InvalidOperationError(ss.str());
  }
  num_qubits = nq;
  num_states = vec.size();
  state_vector = vec;
  return *this;
}

// Scalar multiplication
inline QubitVector &QubitVector::operator*=(const complex_t &lambda) {
  const omp_int_t end = num_states; // end for k loop
#pragma omp parallel for if (parallel()) num_threads(omp_threads)
  for (omp_int_t k = 0; k < end; k++)
    state_vector[k] *= lambda;
  return *this;
}

inline QubitVector &QubitVector::operator*=(const double &lambda) {
  *this *= complex_t(lambda);
  return *this;
}

//------------------------------------------------------------------------------
// Utility
//------------------------------------------------------------------------------

inline void QubitVector::initialize() {
  state_vector.assign(num_states, 0.);
  state_vector[0] = 1.;
}

inline double QubitVector::norm() const {
  double val = 0;
  const omp_int_t end = num_states; // end for k loop
#pragma omp parallel for reduction(+:val) if (parallel()) num_threads(omp_threads)
  for (omp_int_t k = 0; k < end; k++)
    val += std::norm(state_vector[k]);
  return val;
}

inline void QubitVector::renormalize() {
  const double nrm = norm();
  if ((nrm > 0.) == false) {
    throw QCSIM::NumericalError("QubitVector: vector has norm zero");
  }
  const double scale = 1.0 / std::sqrt(nrm);
  *this *= scale;
}

inline void QubitVector::set_omp_threads(int n) {
  if (n > 0)
    omp_threads = n;
}

inline void QubitVector::set_omp_threshold(int n) {
  if (n > 0)
    omp_threshold = n;
}

/*******************************************************************************
 *
 * PROBABILITIES
 *
 ******************************************************************************/

inline double QubitVector::probability(const uint_t index) const {
  return std::norm(state_vector[index]);
}

inline double QubitVector::probability(const uint_t qubit,
                                       const uint_t outcome) const {
  check_qubit(qubit);
  if (outcome > 1) {
    std::stringstream ss;
    ss << "QubitVector: invalid measurement outcome " << outcome;
    throw QCSIM::InvalidOperationError(ss.str());
  }

  const omp_int_t end1 = num_states;   // end for k1 loop
  const omp_int_t end2 = 1LL << qubit; // end for k2 loop
  const omp_int_t step1 = end2 << 1;   // step for k1 loop
  const omp_int_t offset = (outcome == 0) ? 0 : end2;
  double p = 0.;
#pragma omp parallel reduction(+:p) if (parallel()) num_threads(omp_threads)
  {
#ifdef _WIN32
  #pragma omp for
#else
  #pragma omp for collapse(2)
#endif
    for (omp_int_t k1 = 0; k1 < end1; k1 += step1)
      for (omp_int_t k2 = 0; k2 < end2; k2++)
        p += probability(k1 | k2 | offset);
  } // end omp parallel
  return p;
}

inline double QubitVector::total_probability(const reg_t &indexes) const {
  double p = 0.;
  for (const auto k : indexes) {
    check_index(k);
    p += probability(k);
  }
  return p;
}

//------------------------------------------------------------------------------
} // end namespace QV

// ostream overload for QubitVector
inline std::ostream &operator<<(std::ostream &out, const QV::QubitVector &qv) {
  out << qv.vector();
  return out;
}

//------------------------------------------------------------------------------
#endif
