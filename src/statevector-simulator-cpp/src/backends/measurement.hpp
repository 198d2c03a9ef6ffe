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
 * @file    measurement.hpp
 * @brief   Z-basis measurement, collapse and reset of a QubitVector
 */

#ifndef _measurement_hpp_
#define _measurement_hpp_

#include <cmath>
#include <sstream>
#include <utility>

#include "gate_application.hpp"
#include "gates.hpp"
#include "qubit_vector.hpp"
#include "rng_engine.hpp"
#include "types.hpp"

namespace QCSIM {

/*******************************************************************************
 *
 * Measurement
 *
 ******************************************************************************/

/**
 * Chooses a measurement outcome from the probability p0 of outcome 0 and a
 * uniform sample u in [0, 1). Returns 0 if u < p0 and 1 otherwise, so a sample
 * exactly on the boundary (u == p0) gives 1.
 */
uint_t sample_outcome(const double p0, const double u);

/**
 * Samples a measurement outcome for qubit without changing the state.
 * @return the outcome and its probability
 * @throws NumericalError if the probability of the sampled outcome is not
 *         above threshold
 */
std::pair<uint_t, double> measure_outcome(const QubitVector &qv,
                                          const uint_t qubit, RngEngine &rng,
                                          const double threshold);

/**
 * Projects the state onto qubit == outcome and renormalizes it by
 * 1 / sqrt(prob), where prob is the probability of that outcome.
 */
void collapse(QubitVector &qv, const uint_t qubit, const uint_t outcome,
              const double prob);

/**
 * Measures qubit in the Z basis: samples an outcome, collapses the state and
 * writes the outcome to creg[qubit].
 * @return the measured outcome
 */
uint_t measure(QubitVector &qv, creg_t &creg, const uint_t qubit,
               RngEngine &rng, const double threshold = 1e-15);

/**
 * Resets qubit to |0> by an unrecorded measurement followed by an X gate if
 * the outcome was 1.
 */
void reset(QubitVector &qv, const uint_t qubit, RngEngine &rng,
           const double threshold = 1e-15);

/*******************************************************************************
 *
 * Implementations
 *
 ******************************************************************************/

inline uint_t sample_outcome(const double p0, const double u) {
  return (u < p0) ? 0 : 1;
}

inline std::pair<uint_t, double> measure_outcome(const QubitVector &qv,
                                                 const uint_t qubit,
                                                 RngEngine &rng,
                                                 const double threshold) {
  // Probability of P0 outcome
  const double p0 = qv.probability(qubit, 0);
  const uint_t outcome = sample_outcome(p0, rng.rand());
  const double p = (outcome == 0) ? p0 : qv.probability(qubit, 1);

  if ((p > threshold) == false) {
    std::stringstream ss;
    ss << "measure qubit " << qubit << ": sampled outcome " << outcome
       << " has probability " << p;
    throw NumericalError(ss.str());
  }
#ifdef QCSIM_DEBUG
  std::stringstream ss;
  ss << "DEBUG measure_outcome(" << qubit << ") = " << outcome
     << " (p0 = " << p0 << ")";
  std::clog << ss.str() << std::endl;
#endif
  return std::make_pair(outcome, p);
}

inline void collapse(QubitVector &qv, const uint_t qubit, const uint_t outcome,
                     const double prob) {
  qv.check_qubit(qubit);

  const double scale = 1. / std::sqrt(prob);
  cvector_t &vec = qv.vector();
  const omp_int_t end1 = qv.size();    // end for k1 loop
  const omp_int_t end2 = 1LL << qubit; // end for k2 loop
  const omp_int_t step1 = end2 << 1;   // step for k1 loop
  const omp_int_t keep = (outcome == 0) ? 0 : end2;
  const omp_int_t drop = (outcome == 0) ? end2 : 0;

#pragma omp parallel if (qv.parallel()) num_threads(qv.get_omp_threads())
  {
#ifdef _WIN32
  #pragma omp for
#else
  #pragma omp for collapse(2)
#endif
    for (omp_int_t k1 = 0; k1 < end1; k1 += step1)
      for (omp_int_t k2 = 0; k2 < end2; k2++) {
        vec[k1 | k2 | keep] *= scale;
        vec[k1 | k2 | drop] = 0.;
      }
  } // end omp parallel
}

inline uint_t measure(QubitVector &qv, creg_t &creg, const uint_t qubit,
                      RngEngine &rng, const double threshold) {
  if (qubit >= creg.size()) {
    std::stringstream ss;
    ss << "measure: classical bit " << qubit << " >= " << creg.size();
    throw InvalidIndexError(ss.str());
  }
  const auto meas = measure_outcome(qv, qubit, rng, threshold);
  collapse(qv, qubit, meas.first, meas.second);
  creg[qubit] = static_cast<int_t>(meas.first);
  return meas.first;
}

inline void reset(QubitVector &qv, const uint_t qubit, RngEngine &rng,
                  const double threshold) {
  const auto meas = measure_outcome(qv, qubit, rng, threshold);
  collapse(qv, qubit, meas.first, meas.second);
  // if the measurement disagrees with |0> flip the qubit
  if (meas.first == 1)
    apply_single_qubit(qv, qubit, reg_t(), Gates::X());
}

//------------------------------------------------------------------------------
} // end namespace QCSIM

#endif
