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
 * @file    statevector_backend.hpp
 * @brief   State-vector simulator backend
 */

#ifndef _StatevectorBackend_hpp_
#define _StatevectorBackend_hpp_

#include <sstream>
#include <string>
#include <vector>

#include "base_backend.hpp"
#include "gate_application.hpp"
#include "gates.hpp"
#include "measurement.hpp"
#include "qubit_vector.hpp"

namespace QCSIM {

/*******************************************************************************
 *
 * StatevectorBackend class
 *
 ******************************************************************************/

class StatevectorBackend : public BaseBackend<QubitVector> {

public:
  /************************
   * Constructors
   ************************/

  StatevectorBackend() = default;

  /************************
   * BaseBackend Methods
   ************************/
  void set_config(const json_t &config) override;
  void initialize(const Circuit &prog) override;
  void qc_operation(const operation &op) override;

  /************************
   * GateSet
   ************************/

  const static gateset_t gateset;

  inline double get_measure_threshold() const { return measure_threshold; };

protected:
  /************************
   * OpenMP setting
   ************************/
  int omp_threshold = 14;

  // Smallest probability of a sampled outcome that may be renormalized
  double measure_threshold = 1e-15;
};

/*******************************************************************************
 *
 * StatevectorBackend methods
 *
 ******************************************************************************/

const gateset_t StatevectorBackend::gateset({// Single-qubit gates
                                             {"id", gate_t::I},
                                             {"x", gate_t::X},
                                             {"y", gate_t::Y},
                                             {"z", gate_t::Z},
                                             {"h", gate_t::H},
                                             {"s", gate_t::S},
                                             {"sdg", gate_t::Sd},
                                             {"t", gate_t::T},
                                             {"tdg", gate_t::Td},
                                             {"p", gate_t::P},
                                             {"rx", gate_t::RX},
                                             {"ry", gate_t::RY},
                                             {"rz", gate_t::RZ},
                                             {"u", gate_t::U},
                                             // Other operations
                                             {"swap", gate_t::Swap},
                                             {"measure", gate_t::Measure},
                                             {"reset", gate_t::Reset},
                                             {"barrier", gate_t::Barrier}});

inline void StatevectorBackend::set_config(const json_t &config) {
  // Set OMP threshold for state update functions
  JSON::get_value(omp_threshold, "threshold_omp_gate", config);
  JSON::get_value(measure_threshold, "measure_threshold", config);
  if (measure_threshold < 0.) {
    std::stringstream ss;
    ss << "measure_threshold must be non-negative, got " << measure_threshold;
    throw std::runtime_error(ss.str());
  }
}

inline void StatevectorBackend::initialize(const Circuit &prog) {
  // reset state std::vector to default state
  qreg = QubitVector(prog.nqubits);
  qreg.set_omp_threshold(omp_threshold);
  qreg.set_omp_threads(num_threads);
  qreg.initialize();

  creg.assign(prog.nclbits, CBIT_UNSET);
}

inline void StatevectorBackend::qc_operation(const operation &op) {

#ifdef QCSIM_DEBUG
  std::stringstream ss;
  ss << "DEBUG StatevectorBackend::qc_operation " << op.name << " " << op.qubits;
  std::clog << ss.str() << std::endl;
#endif
  switch (op.id) {
  case gate_t::Swap:
    apply_swap(qreg, op.qubits[0], op.qubits[1]);
    break;
  case gate_t::Measure:
    measure(qreg, creg, op.qubits[0], rng, measure_threshold);
    break;
  case gate_t::Reset:
    reset(qreg, op.qubits[0], rng, measure_threshold);
    break;
  case gate_t::Barrier:
    break;
  case gate_t::I: // id = no-op, with or without controls
    break;
  default:
    // All remaining kinds are single-qubit unitaries
    apply_single_qubit(qreg, op.qubits[0], op.controls,
                       Gates::matrix(op.id, op.params));
  }
}

//------------------------------------------------------------------------------
} // end namespace QCSIM

#endif
