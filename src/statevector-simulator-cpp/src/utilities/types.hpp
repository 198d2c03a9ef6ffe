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
 * @file    types.hpp
 * @brief   Common types, gate enumeration, exceptions and JSON helpers
 */

#ifndef _types_hpp_
#define _types_hpp_

#include <chrono>
#include <complex>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <stdint.h>

#include <nlohmann/json.hpp>

/***************************************************************************/ /**
 *
 * Numeric Types for backends
 *
 ******************************************************************************/

// Numeric Types
using int_t = int64_t;
using uint_t = uint64_t;
using complex_t = std::complex<double>;
using cvector_t = std::vector<complex_t>;
using rvector_t = std::vector<double>;

// Timer
using myclock_t = std::chrono::system_clock;

// Register Types
using reg_t = std::vector<uint_t>;  // list of qubit indexes
using creg_t = std::vector<int_t>;  // classical bit values (0, 1 or unset)
using svector_t = std::vector<std::string>;

// Output types
using counts_t = std::map<std::string, uint_t>;

// JSON type
using json_t = nlohmann::json;

// Value of a classical bit that has not been written during a shot
const int_t CBIT_UNSET = -1;

//------------------------------------------------------------------------------
// ostream overloads
//------------------------------------------------------------------------------

template <typename T>
std::ostream &operator<<(std::ostream &out, const std::vector<T> &v);

namespace QCSIM {

/*******************************************************************************
 *
 * Gate_ID enumeration
 *
 * Kinds of operation record. Any unitary kind may carry control qubits, so
 * there are no separate controlled kinds.
 *
 ******************************************************************************/

enum class gate_t {
  // Single-qubit unitaries
  I,  // Pauli-I gate
  X,  // Pauli-X gate
  Y,  // Pauli-Y gate
  Z,  // Pauli-Z gate
  H,  // Hadamard
  S,  // Phase gate aka Sqrt(Z) gate
  Sd, // Conjugate transpose of S
  T,  // T-gate
  Td, // Conjugate transpose of T-gate
  P,  // Phase gate P(theta)
  RX, // X-rotation
  RY, // Y-rotation
  RZ, // Z-rotation
  U,  // General single-qubit unitary U(theta, phi, lambda)

  // Multi-qubit and non-unitary operations
  Swap,    // SWAP of two qubits
  Measure, // Z-basis measurement into the matching classical bit
  Reset,   // reset to |0>
  Barrier  // display marker, no effect on the state
};

using gateset_t = std::map<std::string, gate_t>;

/*******************************************************************************
 *
 * Exceptions
 *
 ******************************************************************************/

// Qubit index outside [0, n)
class InvalidIndexError : public std::runtime_error {
public:
  explicit InvalidIndexError(const std::string &msg)
      : std::runtime_error(msg){};
};

// Malformed operation (bad controls, duplicate SWAP targets, ...)
class InvalidOperationError : public std::runtime_error {
public:
  explicit InvalidOperationError(const std::string &msg)
      : std::runtime_error(msg){};
};

// Numerically degenerate state reached during a shot
class NumericalError : public std::runtime_error {
public:
  explicit NumericalError(const std::string &msg)
      : std::runtime_error(msg){};
};

/**
 * Raised when a shot fails during replay. Results of the shots that completed
 * before the failing one are kept and can be read with completed().
 */
class ShotError : public std::runtime_error {
public:
  ShotError(uint_t shot, const std::string &msg,
            std::vector<creg_t> completed = {})
      : std::runtime_error(format(shot, msg)), shot_(shot),
        completed_(std::move(completed)){};

  inline uint_t shot() const { return shot_; };
  inline const std::vector<creg_t> &completed() const { return completed_; };

private:
  uint_t shot_;
  std::vector<creg_t> completed_;

  static std::string format(uint_t shot, const std::string &msg) {
    std::stringstream ss;
    ss << "shot " << shot << " failed: " << msg;
    return ss.str();
  }
};

} // end namespace QCSIM

/***************************************************************************/ /**
  *
  * JSON Library Helper Functions
  *
  ******************************************************************************/

namespace JSON {

/**
 * Load a json_t from a file. If the file name is 'stdin' or '-' the json_t will
 * be loaded from the standard input stream.
 * @param name: file name to load.
 * @returns: the loaded json.
 */
json_t load(std::string name);

/**
 * Check if a key exists in a json_t object.
 * @param key: key name.
 * @param js: the json_t to search for key.
 * @returns: true if the key exists, false otherwise.
 */
bool check_key(std::string key, const json_t &js);

/**
 * Check if all keys exists in a json_t object.
 * @param keys: vector of key names.
 * @param js: the json_t to search for keys.
 * @returns: true if all keys exists, false otherwise.
 */
bool check_keys(std::vector<std::string> keys, const json_t &js);

/**
 * Load a json_t object value into a variable if the key name exists.
 * @param var: variable to store key value.
 * @param key: key name.
 * @param js: the json_t to search for key.
 * @returns: true if the keys exists and val was set, false otherwise.
 */
template <typename T> bool get_value(T &var, std::string key, const json_t &js);

/**
 * Load a non-negative integer value into a uint_t if the key name exists.
 * @param var: variable to store key value.
 * @param key: key name.
 * @param js: the json_t to search for key.
 * @returns: true if the keys exists and val was set, false otherwise.
 * @throws std::runtime_error if the value is negative or not an integer.
 */
bool get_uint(uint_t &var, std::string key, const json_t &js);

} // end namespace JSON

/*******************************************************************************
 *
 * Implementations
 *
 ******************************************************************************/

//------------------------------------------------------------------------------
// JSON Helper Functions
//------------------------------------------------------------------------------

inline json_t JSON::load(std::string name) {
  if (name == "") {
    json_t js;
    return js; // Return empty node if no file
  }
  json_t js;
  if (name == "stdin" || name == "-") // Load from stdin
    std::cin >> js;
  else { // Load from file
    std::ifstream ifile;
    ifile.exceptions(std::ifstream::failbit | std::ifstream::badbit);
    try {
      ifile.open(name);
    } catch (std::exception &e) {
      throw std::runtime_error(std::string("no such file or directory \"") +
                               name + "\"");
    }
    ifile >> js;
  }
  return js;
}

inline bool JSON::check_key(std::string key, const json_t &js) {
  // returns false if the value is 'null'
  if (js.is_object() && js.find(key) != js.end() && !js[key].is_null())
    return true;
  else
    return false;
}

inline bool JSON::check_keys(std::vector<std::string> keys, const json_t &js) {
  bool pass = true;
  for (auto s : keys)
    pass &= check_key(s, js);
  return pass;
}

template <typename T>
bool JSON::get_value(T &var, std::string key, const json_t &js) {
  if (check_key(key, js)) {
    var = js[key].get<T>();
    return true;
  } else {
    return false;
  }
}

inline bool JSON::get_uint(uint_t &var, std::string key, const json_t &js) {
  if (check_key(key, js) == false)
    return false;
  const json_t &val = js[key];
  if (val.is_number_integer() == false || val.get<int_t>() < 0) {
    std::stringstream ss;
    ss << "\"" << key << "\" must be a non-negative integer, got " << val.dump();
    throw std::runtime_error(ss.str());
  }
  var = val.get<uint_t>();
  return true;
}

//------------------------------------------------------------------------------
// ostream overloads
//------------------------------------------------------------------------------

// ostream overload for vectors
template <typename T>
std::ostream &operator<<(std::ostream &out, const std::vector<T> &v) {
  out << "[";
  for (size_t i = 0; i < v.size(); ++i) {
    out << v[i];
    if (i + 1 != v.size())
      out << ", ";
  }
  out << "]";
  return out;
}

//------------------------------------------------------------------------------
#endif
