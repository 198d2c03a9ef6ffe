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
 * @file    base_backend.hpp
 * @brief   Base simulator backend for the qcsim simulator
 */

#ifndef _BaseBackend_h_
#define _BaseBackend_h_

#include <string>
#include <vector>

#include "circuit.hpp"
#include "rng_engine.hpp"
#include "types.hpp"

namespace QCSIM {

/***************************************************************************/ /**
  *
  * BaseBackend class
  *
  * This is a base class for simulator backends. Backends are defined by the
  * Type of their representation of the quantum state of the system, given by
  * qreg, and hence the BaseBackend is a template class based on this Type.
  * A backend holds the state of exactly one shot at a time: initialize resets
  * it and execute replays a circuit's operations on it.
  *
  ******************************************************************************/

template <class StateType> class BaseBackend {

public:
  BaseBackend() = default;
  virtual ~BaseBackend() = default;

  /**
   * Initialize and execute a program on backend
   * @param prog
   */
  void execute(const Circuit &prog);

  /**
   * Apply a list of operations to the current backend state
   * @param ops
   */
  void execute(const std::vector<operation> &ops);

  /**
   * Initialize backend to the start of a shot
   * @param prog the circuit to be executed
   */
  virtual void initialize(const Circuit &prog) = 0;

  /**
   * Applies an operation to the backend state
   * @param op the operation to apply
   */
  virtual void qc_operation(const operation &op) = 0;

  /**
   * Sets the RNG seed of the backend to a fixed value.
   * @param seed: uint to use as RNG seed
   */
  inline void set_rng_seed(uint_t seed) { rng = RngEngine(seed); };

  // Templated state access methods

  /**
   * Returns a reference to the classical bit register of the backend
   * @return a reference to creg member
   */
  inline creg_t &access_creg() { return creg; };

  /**
   * Returns a reference to the quantum register of the backend. The type
   * returned by this function is the template parameter of BaseBackend
   * @return a reference to qreg member
   */
  inline StateType &access_qreg() { return qreg; };

  /**
   * Config Settings
   */
  virtual void set_config(const json_t &config) = 0;
  inline void set_num_threads(int n) {
    if (n > 0)
      num_threads = n;
  };

protected:
  /**
   * Number of threads to use for inner parallelization.
   */
  int num_threads = 1;

  /**
   * Stores the classical bit values written by measurements during a shot.
   * Every bit starts unset (CBIT_UNSET) at the start of the shot.
   */
  creg_t creg;

  /**
   * Stores a representation of the current quantum state of a backend as a
   * circuit is executed. The Type for this representation is the template
   * argument for the BaseBackend class, so derived classes can return their
   * state using the 'access_qreg' method.
   */
  StateType qreg;

  /**
   * RNG engine for backend. Used to generate random numbers for measurements
   * and resets
   */
  RngEngine rng;
};

/*******************************************************************************
 *
 * Common methods for derived classes
 *
 ******************************************************************************/

template <class StateType>
void BaseBackend<StateType>::execute(const Circuit &prog) {
  // Initialize backend for circuit
  initialize(prog);

  // Run through operation list
  execute(prog.operations);
}

template <class StateType>
void BaseBackend<StateType>::execute(const std::vector<operation> &ops) {
  for (const auto &op : ops)
    qc_operation(op);
}

//------------------------------------------------------------------------------
} // end namespace QCSIM

#endif
