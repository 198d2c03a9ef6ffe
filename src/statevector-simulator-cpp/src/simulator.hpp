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
 * @file    simulator.hpp
 * @brief   Simulator class
 */

#ifndef _Simulator_hpp_
#define _Simulator_hpp_

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
// Parallelization
#ifdef _OPENMP
#include <omp.h> // OpenMP
#endif

#include "circuit.hpp"
#include "misc.hpp"
#include "types.hpp"

// Engines
#include "base_engine.hpp"

// Backends
#include "statevector_backend.hpp"

namespace QCSIM {

using QV::omp_int_t; // signed int for OpenMP 2.0 on msvc

/***************************************************************************/ /**
   *
   * Simulator class
   *
   * Runs circuits for a number of shots. Shots may be split over OpenMP
   * threads: every worker gets its own backend seeded with seed + worker
   * index and its own engine, and the engines are merged in worker order, so
   * the results only depend on the seed and the number of shot threads.
   *
   ******************************************************************************/

class Simulator {
public:
  std::string id = "";                        // simulation id
  std::string backend = "qcsim_statevector";  // backend name in the output
  std::vector<Circuit> circuits;              // circuits to execute

  // Multithreading Params
  uint_t max_memory_gb = 16;   // max memory to use
  uint_t max_threads_shot = 1; // 0 for automatic
  uint_t max_threads_gate = 0; // 0 for automatic

  // Constructor
  inline Simulator(){};

  // Execute all quantum circuits
  json_t execute_json();
  inline std::string execute(int indent = 4) {
    return execute_json().dump(indent);
  };

  // Initialize a simulator from a JSON program
  void load_json(const json_t &input);

  // Initialize from a JSON file, or from stdin if file is '-'
  inline void load_file(const std::string file) {
    json_t js = JSON::load(file);
    load_json(js);
  };

  inline void load_string(const std::string &input) {
    json_t js = json_t::parse(input);
    load_json(js);
  };

  bool check_json(const json_t &js);

  // Execute a single circuit and return its JSON result
  template <class Engine, class Backend>
  json_t run_circuit(const Circuit &circ) const;

  /**
   * Execute shots of a circuit and return the engine holding the results.
   * @param circ the circuit
   * @param shots number of shots
   * @param rng_seed seed of the first shot worker
   * @throws ShotError if a shot fails, holding the shots completed before it
   */
  template <class Engine, class Backend>
  Engine run_shots(const Circuit &circ, uint_t shots, uint_t rng_seed) const;

  // Largest number of qubits allowed by max_memory_gb
  uint_t max_qubits() const;
};

/*******************************************************************************
 *
 * Simulator Methods
 *
 ******************************************************************************/

inline json_t Simulator::execute_json() {

  // Initialize ouput JSON
  std::chrono::time_point<myclock_t> start = myclock_t::now(); // start timer
  json_t ret;
  ret["id"] = id;
  ret["backend"] = backend;

  // Execute circuits
  try {
    bool success = true;
    for (const auto &circ : circuits) {
      json_t circ_res =
          run_circuit<BaseEngine<QubitVector>, StatevectorBackend>(circ);

      // Check results
      success &= circ_res["success"].get<bool>();
      ret["result"].push_back(circ_res);
    }
    ret["time_taken"] =
        std::chrono::duration<double>(myclock_t::now() - start).count();
    ret["status"] = std::string("COMPLETED");
    ret["success"] = success;
  } catch (std::exception &e) {
    ret["success"] = false;
    ret["status"] = std::string("ERROR: ") + e.what();
  }
  return ret;
}

//------------------------------------------------------------------------------
inline uint_t Simulator::max_qubits() const {
  const double amplitudes = max_memory_gb * 1e9 / 16.;
  if (amplitudes < 1.)
    return 0;
  return static_cast<uint_t>(std::floor(std::log2(amplitudes)));
}

//------------------------------------------------------------------------------
template <class Engine, class Backend>
Engine Simulator::run_shots(const Circuit &circ, uint_t shots,
                            uint_t rng_seed) const {

  std::chrono::time_point<myclock_t> start = myclock_t::now(); // start timer

  // Check max qubits
  if (circ.nqubits > max_qubits()) {
    std::stringstream msg;
    msg << "Number of qubits (" << circ.nqubits << ") exceeds maximum memory ("
        << max_memory_gb << " GB).";
    throw std::runtime_error(msg.str());
  }

  // Initialize reference engine and backend from JSON config
  Engine engine;
  if (circ.config.is_object())
    engine = circ.config.get<Engine>();
  Backend backend;
  backend.set_config(circ.config);

  uint_t threads = 1;
#ifdef _OPENMP
  // Thread number
  const uint_t ncpus = std::max(1, omp_get_num_procs());
  threads = (max_threads_shot > 0) ? max_threads_shot : ncpus;
  threads = std::max<uint_t>(1, std::min<uint_t>(threads, shots));
  uint_t gate_threads = std::max<uint_t>(1, ncpus / threads);
  if (max_threads_gate > 0)
    gate_threads = std::min<uint_t>(max_threads_gate, gate_threads);
  backend.set_num_threads(static_cast<int>(gate_threads));
  if (threads > 1 && gate_threads > 1)
    omp_set_max_active_levels(2); // allow nested gate threads
#endif

  // Single-threaded shots loop
  if (threads < 2) {
    backend.set_rng_seed(rng_seed);
    engine.run_program(circ, &backend, shots);
  }
  // Parallelized shots loop
  else {
    // Set number of shots, first shot and rng seed for each thread
    std::vector<std::pair<uint_t, uint_t>> shotseed;
    std::vector<uint_t> first;
    for (uint_t j = 0; j < threads; ++j)
      shotseed.push_back(std::make_pair(shots / threads, rng_seed + j));
    shotseed[0].first += (shots % threads);
    uint_t offset = 0;
    for (const auto &ss : shotseed) {
      first.push_back(offset);
      offset += ss.first;
    }

    std::vector<Engine> futures(threads);
    std::vector<std::exception_ptr> errors(threads);
#pragma omp parallel for if (threads > 1) num_threads(threads)
    for (omp_int_t j = 0; j < omp_int_t(threads); j++) {
      const auto &ss = shotseed[j];
      Backend be(backend);
      be.set_rng_seed(ss.second);
      futures[j] = engine;
      // exceptions may not leave the parallel region
      try {
        futures[j].run_program(circ, &be, ss.first, first[j]);
      } catch (std::exception &) {
        errors[j] = std::current_exception();
      }
    }
    for (auto &f : futures)
      engine += f;

    // Only shots before the first failure count as completed
    if (engine.failed_shot >= 0) {
      engine.output_creg.resize(static_cast<size_t>(engine.failed_shot));
      throw ShotError(engine.failed_shot, engine.failed_status,
                      engine.output_creg);
    }
    for (auto &e : errors)
      if (e)
        std::rethrow_exception(e);
  } // end parallel shots

  engine.time_taken =
      std::chrono::duration<double>(myclock_t::now() - start).count();
  return engine;
}

//------------------------------------------------------------------------------
template <class Engine, class Backend>
json_t Simulator::run_circuit(const Circuit &circ) const {

  std::chrono::time_point<myclock_t> start = myclock_t::now(); // start timer
  json_t ret;                                                  // results JSON

  // Set RNG Seed
  const uint_t rng_seed = (circ.rng_seed < 0)
                              ? std::random_device()()
                              : static_cast<uint_t>(circ.rng_seed);
  // Add metadata
  ret["name"] = circ.name;
  ret["shots"] = circ.shots;
  ret["seed"] = rng_seed;

  // Try to execute circuit
  try {
    ret["data"] = run_shots<Engine, Backend>(circ, circ.shots, rng_seed);
    ret["success"] = true;
    ret["status"] = std::string("DONE");
  } catch (ShotError &e) {
    // Report the shots completed before the failure
    Engine completed;
    if (circ.config.is_object())
      completed = circ.config.get<Engine>();
    completed.output_creg = e.completed();
    ret["data"] = completed;
    ret["failed_shot"] = e.shot();
    ret["success"] = false;
    ret["status"] = std::string("ERROR: ") + e.what();
  } catch (std::exception &e) {
    ret["success"] = false;
    ret["status"] = std::string("ERROR: ") + e.what();
  }

  // Add time taken and return result
  ret["time_taken"] =
      std::chrono::duration<double>(myclock_t::now() - start).count();
  return ret;
}

//------------------------------------------------------------------------------
inline void Simulator::load_json(const json_t &js) {
  try {
    if (check_json(js)) { // check valid program

      std::string new_id = "";
      JSON::get_value(new_id, "id", js);

      json_t config;
      JSON::get_value(config, "config", js);

      // Multithreading Parameters
      uint_t memory = max_memory_gb;
      uint_t threads_shot = max_threads_shot;
      uint_t threads_gate = max_threads_gate;
      JSON::get_uint(memory, "max_memory", config);
      JSON::get_uint(threads_shot, "max_threads_shot", config);
      JSON::get_uint(threads_gate, "max_threads_gate", config);
      if (memory == 0)
        throw std::runtime_error(std::string("\"max_memory\" must be positive"));

      // Load circuit instructions
      std::vector<Circuit> new_circuits;
      const json_t &circs = js["circuits"];
      for (auto it = circs.cbegin(); it != circs.cend(); ++it) {
        new_circuits.push_back(
            Circuit(*it, config, StatevectorBackend::gateset));
      }

      // Only a fully parsed program replaces the current one
      id = new_id;
      max_memory_gb = memory;
      max_threads_shot = threads_shot;
      max_threads_gate = threads_gate;
      circuits = std::move(new_circuits);
    } else {
      throw std::runtime_error(std::string("invalid program file."));
    }
  } catch (std::exception &e) {
    std::stringstream msg;
    msg << "unable to parse program, " << e.what();
    throw std::runtime_error(msg.str());
  }
}

//------------------------------------------------------------------------------
inline bool Simulator::check_json(const json_t &js) {
  std::vector<std::string> circuit_keys{"number_of_qubits", "operations"};

  bool pass = JSON::check_key("circuits", js) && js["circuits"].is_array();
  if (pass) {
    for (auto &c : js["circuits"])
      pass &= JSON::check_keys(circuit_keys, c);
  }
  return pass;
}

/*******************************************************************************
 *
 * Run
 *
 ******************************************************************************/

/**
 * Runs a circuit for a number of shots on the state-vector backend, one shot
 * thread, and returns the classical register of every shot in shot order.
 * @param circ the circuit to run
 * @param shots the number of shots
 * @param seed RNG seed, or -1 to draw one from std::random_device
 * @throws ShotError if a shot fails, holding the shots completed before it
 */
inline std::vector<creg_t> run(const Circuit &circ, uint_t shots,
                               int_t seed = -1) {
  const Simulator sim;
  const uint_t rng_seed =
      (seed < 0) ? std::random_device()() : static_cast<uint_t>(seed);
  return sim
      .run_shots<BaseEngine<QubitVector>, StatevectorBackend>(circ, shots,
                                                              rng_seed)
      .output_creg;
}

//------------------------------------------------------------------------------
} // end namespace QCSIM
//------------------------------------------------------------------------------
#endif
