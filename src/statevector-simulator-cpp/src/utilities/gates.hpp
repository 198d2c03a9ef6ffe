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
 * @file    gates.hpp
 * @brief   Single-qubit gate matrices
 */

#ifndef _gates_hpp_
#define _gates_hpp_

#include <cmath>
#include <complex>
#include <sstream>
#include <string>
#include <vector>
#define _USE_MATH_DEFINES
#include <math.h>

#include "types.hpp"

namespace QCSIM {
namespace Gates {

/*******************************************************************************
 *
 * Gate matrices
 *
 * Every function returns the four entries of a 2x2 matrix vectorized in
 * row-major order, {a, b, c, d} for [[a, b], [c, d]]. All angles are in
 * radians.
 *
 ******************************************************************************/

cvector_t I();
cvector_t X();
cvector_t Y();
cvector_t Z();
cvector_t H();
cvector_t P(const double theta);
cvector_t S();
cvector_t Sd();
cvector_t T();
cvector_t Td();
cvector_t RX(const double theta);
cvector_t RY(const double theta);
cvector_t RZ(const double theta);
cvector_t U(const double theta, const double phi, const double lambda);

/**
 * Number of angle parameters taken by a gate kind. Non-unitary kinds take
 * none.
 */
uint_t num_params(const gate_t id);

/**
 * True if the gate kind is a single-qubit unitary that can be applied with
 * apply_single_qubit.
 */
bool is_single_qubit(const gate_t id);

/**
 * Returns the matrix of a single-qubit unitary kind.
 * @param id the gate kind
 * @param params angle parameters, exactly num_params(id) of them
 * @throws InvalidOperationError for non-unitary kinds or a wrong number of
 *         parameters
 */
cvector_t matrix(const gate_t id, const rvector_t &params);

// Conjugate transpose of a row-major 2x2 matrix
cvector_t dagger(const cvector_t &mat);

// Product a.b of two row-major 2x2 matrices
cvector_t dot(const cvector_t &a, const cvector_t &b);

// True if mat^dagger . mat is the identity within eps
bool is_unitary(const cvector_t &mat, double eps = 1e-12);

// Lower case name used in programs and messages
std::string name(const gate_t id);

/*******************************************************************************
 *
 * Implementations
 *
 ******************************************************************************/

inline cvector_t I() { return cvector_t({1., 0., 0., 1.}); }

inline cvector_t X() { return cvector_t({0., 1., 1., 0.}); }

inline cvector_t Y() {
  const complex_t i(0., 1.);
  return cvector_t({0., -i, i, 0.});
}

inline cvector_t Z() { return cvector_t({1., 0., 0., -1.}); }

inline cvector_t H() {
  const double s = 1. / std::sqrt(2.);
  return cvector_t({s, s, s, -s});
}

inline cvector_t P(const double theta) {
  return cvector_t({1., 0., 0., std::exp(complex_t(0., theta))});
}

inline cvector_t S() { return cvector_t({1., 0., 0., complex_t(0., 1.)}); }

inline cvector_t Sd() { return cvector_t({1., 0., 0., complex_t(0., -1.)}); }

inline cvector_t T() { return P(M_PI / 4.); }

inline cvector_t Td() { return P(-M_PI / 4.); }

inline cvector_t RX(const double theta) {
  const double c = std::cos(theta / 2.);
  const double s = std::sin(theta / 2.);
  return cvector_t({c, complex_t(0., -s), complex_t(0., -s), c});
}

inline cvector_t RY(const double theta) {
  const double c = std::cos(theta / 2.);
  const double s = std::sin(theta / 2.);
  return cvector_t({c, -s, s, c});
}

inline cvector_t RZ(const double theta) {
  return cvector_t({std::exp(complex_t(0., -theta / 2.)), 0., 0.,
                    std::exp(complex_t(0., theta / 2.))});
}

inline cvector_t U(const double theta, const double phi, const double lambda) {
  const complex_t i(0., 1.);
  cvector_t mat(4);
  mat[0] = std::cos(theta / 2.);
  mat[1] = -std::exp(i * lambda) * std::sin(theta / 2.);
  mat[2] = std::exp(i * phi) * std::sin(theta / 2.);
  mat[3] = std::exp(i * (phi + lambda)) * std::cos(theta / 2.);
  return mat;
}

inline uint_t num_params(const gate_t id) {
  switch (id) {
  case gate_t::P:
  case gate_t::RX:
  case gate_t::RY:
  case gate_t::RZ:
    return 1;
  case gate_t::U:
    return 3;
  default:
    return 0;
  }
}

inline bool is_single_qubit(const gate_t id) {
  switch (id) {
  case gate_t::Swap:
  case gate_t::Measure:
  case gate_t::Reset:
  case gate_t::Barrier:
    return false;
  default:
    return true;
  }
}

inline cvector_t matrix(const gate_t id, const rvector_t &params) {
  if (is_single_qubit(id) == false || params.size() != num_params(id)) {
    std::stringstream ss;
    ss << "no matrix for gate \"" << name(id) << "\" with " << params.size()
       << " parameters";
    throw InvalidOperationError(ss.str());
  }
  switch (id) {
  case gate_t::I:
    return I();
  case gate_t::X:
    return X();
  case gate_t::Y:
    return Y();
  case gate_t::Z:
    return Z();
  case gate_t::H:
    return H();
  case gate_t::S:
    return S();
  case gate_t::Sd:
    return Sd();
  case gate_t::T:
    return T();
  case gate_t::Td:
    return Td();
  case gate_t::P:
    return P(params[0]);
  case gate_t::RX:
    return RX(params[0]);
  case gate_t::RY:
    return RY(params[0]);
  case gate_t::RZ:
    return RZ(params[0]);
  case gate_t::U:
    return U(params[0], params[1], params[2]);
  default:
    // unreachable, is_single_qubit filters the other kinds
    throw InvalidOperationError("invalid gate matrix");
  }
}

inline cvector_t dagger(const cvector_t &mat) {
  return cvector_t({std::conj(mat[0]), std::conj(mat[2]), std::conj(mat[1]),
                    std::conj(mat[3])});
}

inline cvector_t dot(const cvector_t &a, const cvector_t &b) {
  return cvector_t({a[0] * b[0] + a[1] * b[2], a[0] * b[1] + a[1] * b[3],
                    a[2] * b[0] + a[3] * b[2], a[2] * b[1] + a[3] * b[3]});
}

inline bool is_unitary(const cvector_t &mat, double eps) {
  if (mat.size() != 4)
    return false;
  const cvector_t prod = dot(dagger(mat), mat);
  const cvector_t id = I();
  for (size_t j = 0; j < 4; j++)
    if (std::abs(prod[j] - id[j]) > eps)
      return false;
  return true;
}

inline std::string name(const gate_t id) {
  switch (id) {
  case gate_t::I:
    return "id";
  case gate_t::X:
    return "x";
  case gate_t::Y:
    return "y";
  case gate_t::Z:
    return "z";
  case gate_t::H:
    return "h";
  case gate_t::S:
    return "s";
  case gate_t::Sd:
    return "sdg";
  case gate_t::T:
    return "t";
  case gate_t::Td:
    return "tdg";
  case gate_t::P:
    return "p";
  case gate_t::RX:
    return "rx";
  case gate_t::RY:
    return "ry";
  case gate_t::RZ:
    return "rz";
  case gate_t::U:
    return "u";
  case gate_t::Swap:
    return "swap";
  case gate_t::Measure:
    return "measure";
  case gate_t::Reset:
    return "reset";
  case gate_t::Barrier:
    return "barrier";
  }
  return "unknown";
}

//------------------------------------------------------------------------------
} // end namespace Gates
} // end namespace QCSIM

#endif
