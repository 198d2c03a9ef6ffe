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
 * @file    base_engine.hpp
 * @brief   Shot executor collecting the classical results of each shot
 */

#ifndef _BaseEngine_h_
#define _BaseEngine_h_

#include <algorithm>
#include <exception>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "base_backend.hpp"
#include "circuit.hpp"
#include "misc.hpp"
#include "qubit_vector.hpp"

namespace QCSIM {

using QV::QubitVector;

/***************************************************************************/ /**
 *
 * BaseEngine class
 *
 * Replays a circuit on a backend for a number of shots and records the
 * classical register of every shot in shot order. Each shot starts from a
 * freshly initialized backend, so shots share nothing but the backend's RNG
 * stream.
 *
 * If a shot throws, the results of the shots completed before it are kept,
 * the failing shot index and message are recorded and a ShotError is raised.
 *
 ******************************************************************************/

template <typename StateType = QubitVector> class BaseEngine {

public:
  //============================================================================
  // Configuration
  //============================================================================

  bool counts_show = true;      // Display the map of final creg bitstrings
  bool show_final_creg = false; // Display a list of all observed outcomes

  //============================================================================
  // Results / Data
  //============================================================================

  uint_t total_shots = 0; // Number of shots to obtain current results
  double time_taken = 0.; // Time taken for simulation of current results

  // Classical register for each completed shot
  std::vector<creg_t> output_creg;

  // Index of the first failed shot, or -1 if every shot completed
  int_t failed_shot = -1;
  std::string failed_status = "";

  //============================================================================
  // Constructors
  //============================================================================

  BaseEngine() = default;
  virtual ~BaseEngine() = default;

  //============================================================================
  // Methods
  //============================================================================

  /**
   * Sequentially executes a circuit multiple times on a simulation backend
   * and records the classical register after each shot.
   * @param circ the circuit to be executed on the backend
   * @param be a pointer to the backend to execute the circuit on
   * @param nshots the number of simulation shots to run
   * @param first_shot index of the first shot, used in error reports
   * @throws ShotError if a shot fails
   */
  virtual void run_program(const Circuit &circ, BaseBackend<StateType> *be,
                           uint_t nshots = 1, uint_t first_shot = 0);

  /**
   * Adds results data from another engine.
   * @param eng the engine to combine.
   */
  void add(const BaseEngine<StateType> &eng);

  /**
   * Overloads the += operator to combine the results of different engines.
   */
  inline BaseEngine &operator+=(const BaseEngine<StateType> &eng) {
    add(eng);
    return *this;
  };

  /**
   * This function records results based on the state of the backend after
   * the execution of each shot of a circuit
   * @param circ the circuit which was executed on the backend
   * @param be a pointer to the backend containing the state of the system
   *           after execution of the circuit
   */
  virtual void compute_results(const Circuit &circ, BaseBackend<StateType> *be);
};

/*******************************************************************************
 *
 * BaseEngine methods
 *
 ******************************************************************************/

template <typename StateType>
void BaseEngine<StateType>::run_program(const Circuit &prog,
                                        BaseBackend<StateType> *be,
                                        uint_t nshots, uint_t first_shot) {
  for (uint_t ishot = 0; ishot < nshots; ++ishot) {
    try {
      be->initialize(prog);
      be->execute(prog.operations);
    } catch (std::exception &e) {
      failed_shot = static_cast<int_t>(first_shot + ishot);
      failed_status = e.what();
#ifdef QCSIM_DEBUG
      std::stringstream ss;
      ss << "DEBUG BaseEngine::run_program shot " << failed_shot
         << " failed: " << failed_status;
      std::clog << ss.str() << std::endl;
#endif
      throw ShotError(first_shot + ishot, failed_status, output_creg);
    }
    compute_results(prog, be);
    total_shots++;
  }
}

template <typename StateType>
void BaseEngine<StateType>::compute_results(const Circuit & /* circ */,
                                            BaseBackend<StateType> *be) {
  output_creg.push_back(be->access_creg());
}

template <typename StateType>
void BaseEngine<StateType>::add(const BaseEngine<StateType> &eng) {
  time_taken += eng.time_taken;

  // add total shots;
  total_shots += eng.total_shots;

  // keep the earliest failure
  if (eng.failed_shot >= 0 &&
      (failed_shot < 0 || eng.failed_shot < failed_shot)) {
    failed_shot = eng.failed_shot;
    failed_status = eng.failed_status;
  }

  // copy output cregs
  std::copy(eng.output_creg.begin(), eng.output_creg.end(),
            std::back_inserter(output_creg));
}

/*******************************************************************************
 *
 * JSON conversion
 *
 ******************************************************************************/

template <typename StateType>
inline void to_json(json_t &js, const BaseEngine<StateType> &engine) {

  if (engine.counts_show && engine.output_creg.empty() == false)
    js["counts"] = counts(engine.output_creg);

  if (engine.show_final_creg && engine.output_creg.empty() == false) {
    svector_t memory;
    for (const auto &creg : engine.output_creg)
      memory.push_back(creg2ket(creg));
    js["memory"] = memory;
  }

  // check for edge case of null array and instead return empty object
  if (js.is_null())
    js = json_t::object();
}

template <typename StateType>
inline void from_json(const json_t &js, BaseEngine<StateType> &engine) {
  engine = BaseEngine<StateType>();
  // Check for single shot memory
  JSON::get_value(engine.show_final_creg, "memory", js);
  JSON::get_value(engine.counts_show, "counts", js);
}

//------------------------------------------------------------------------------
} // end namespace QCSIM

#endif
