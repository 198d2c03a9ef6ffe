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
 * @file    circuit.hpp
 * @brief   Circuit program built once and replayed for every shot
 */

#ifndef _circuit_h_
#define _circuit_h_

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gates.hpp"
#include "misc.hpp"
#include "types.hpp"

namespace QCSIM {

/*******************************************************************************
 *
 * operation struct
 *
 ******************************************************************************/

struct operation {
public:
  gate_t id;
  std::string name;
  rvector_t params;  // gate angles
  reg_t qubits;      // target qubit, or both qubits of a swap
  reg_t controls;    // control qubits, all must be 1 for the gate to act
};

/*******************************************************************************
 *
 * Circuit class
 *
 * Ordered list of operation records over a fixed number of qubits. Builder
 * methods validate each record and append it without touching any amplitude,
 * so an invalid circuit is rejected before any shot runs. Every builder
 * returns the circuit so calls can be chained.
 *
 ******************************************************************************/

class Circuit {
public:
  uint_t nqubits = 0; // number of qubits
  uint_t nclbits = 0; // number of classical bits
  std::vector<operation> operations;

  std::string name = "";
  int_t rng_seed = -1; // backend rng seed
  uint_t shots = 1;    // number of simulation shots
  json_t config;       // local config

  /**
   * Default Constructor
   */
  Circuit(){};

  /**
   * Empty circuit on num_qubits qubits, with one classical bit per qubit.
   * @throws InvalidOperationError unless 1 <= num_qubits <= 62
   */
  explicit Circuit(uint_t num_qubits);

  /**
   * Full Constructor
   */
  inline Circuit(const json_t &circuit, const json_t &qobjconf,
                 const gateset_t &gs) {
    parse(circuit, qobjconf, gs);
  };

  /**
   * Parse a json circuit. Operations are appended through the builder
   * methods so the same validation applies.
   */
  void parse(const json_t &circuit, const json_t &qobjconf,
             const gateset_t &gs);

  /************************
   * Single-qubit gates
   ************************/

  Circuit &i(const reg_t &targets) { return gate(gate_t::I, targets); };
  Circuit &x(const reg_t &targets) { return gate(gate_t::X, targets); };
  Circuit &y(const reg_t &targets) { return gate(gate_t::Y, targets); };
  Circuit &z(const reg_t &targets) { return gate(gate_t::Z, targets); };
  Circuit &h(const reg_t &targets) { return gate(gate_t::H, targets); };
  Circuit &s(const reg_t &targets) { return gate(gate_t::S, targets); };
  Circuit &sdg(const reg_t &targets) { return gate(gate_t::Sd, targets); };
  Circuit &t(const reg_t &targets) { return gate(gate_t::T, targets); };
  Circuit &tdg(const reg_t &targets) { return gate(gate_t::Td, targets); };
  Circuit &p(const reg_t &targets, double theta) {
    return gate(gate_t::P, targets, reg_t(), {theta});
  };
  Circuit &rx(const reg_t &targets, double theta) {
    return gate(gate_t::RX, targets, reg_t(), {theta});
  };
  Circuit &ry(const reg_t &targets, double theta) {
    return gate(gate_t::RY, targets, reg_t(), {theta});
  };
  Circuit &rz(const reg_t &targets, double theta) {
    return gate(gate_t::RZ, targets, reg_t(), {theta});
  };
  Circuit &u(const reg_t &targets, double theta, double phi, double lambda) {
    return gate(gate_t::U, targets, reg_t(), {theta, phi, lambda});
  };

  // Single target versions
  Circuit &i(uint_t target) { return i(reg_t({target})); };
  Circuit &x(uint_t target) { return x(reg_t({target})); };
  Circuit &y(uint_t target) { return y(reg_t({target})); };
  Circuit &z(uint_t target) { return z(reg_t({target})); };
  Circuit &h(uint_t target) { return h(reg_t({target})); };
  Circuit &s(uint_t target) { return s(reg_t({target})); };
  Circuit &sdg(uint_t target) { return sdg(reg_t({target})); };
  Circuit &t(uint_t target) { return t(reg_t({target})); };
  Circuit &tdg(uint_t target) { return tdg(reg_t({target})); };
  Circuit &p(uint_t target, double theta) { return p(reg_t({target}), theta); };
  Circuit &rx(uint_t target, double theta) {
    return rx(reg_t({target}), theta);
  };
  Circuit &ry(uint_t target, double theta) {
    return ry(reg_t({target}), theta);
  };
  Circuit &rz(uint_t target, double theta) {
    return rz(reg_t({target}), theta);
  };
  Circuit &u(uint_t target, double theta, double phi, double lambda) {
    return u(reg_t({target}), theta, phi, lambda);
  };

  /************************
   * Controlled gates
   ************************/

  // All controlled gates require at least one control qubit
  Circuit &cx(const reg_t &controls, uint_t target) {
    return controlled(gate_t::X, controls, target);
  };
  Circuit &cy(const reg_t &controls, uint_t target) {
    return controlled(gate_t::Y, controls, target);
  };
  Circuit &cz(const reg_t &controls, uint_t target) {
    return controlled(gate_t::Z, controls, target);
  };
  Circuit &ch(const reg_t &controls, uint_t target) {
    return controlled(gate_t::H, controls, target);
  };
  Circuit &cp(const reg_t &controls, uint_t target, double theta) {
    return controlled(gate_t::P, controls, target, {theta});
  };
  Circuit &crx(const reg_t &controls, uint_t target, double theta) {
    return controlled(gate_t::RX, controls, target, {theta});
  };
  Circuit &cry(const reg_t &controls, uint_t target, double theta) {
    return controlled(gate_t::RY, controls, target, {theta});
  };
  Circuit &crz(const reg_t &controls, uint_t target, double theta) {
    return controlled(gate_t::RZ, controls, target, {theta});
  };
  Circuit &cu(const reg_t &controls, uint_t target, double theta, double phi,
              double lambda) {
    return controlled(gate_t::U, controls, target, {theta, phi, lambda});
  };

  // Toffoli
  Circuit &ccx(uint_t control0, uint_t control1, uint_t target) {
    return cx(reg_t({control0, control1}), target);
  };

  /************************
   * Generic gate
   ************************/

  /**
   * Appends one record of gate kind id per target.
   * @param id the gate kind
   * @param targets target qubits (both qubits for a swap)
   * @param controls control qubits, empty for an uncontrolled gate
   * @param params angle parameters
   */
  Circuit &gate(gate_t id, const reg_t &targets, const reg_t &controls = {},
                const rvector_t &params = {});

  /************************
   * Other operations
   ************************/

  Circuit &swap(uint_t q0, uint_t q1) {
    return gate(gate_t::Swap, reg_t({q0, q1}));
  };
  Circuit &barrier() { return gate(gate_t::Barrier, reg_t()); };
  Circuit &measure(const reg_t &targets) {
    return gate(gate_t::Measure, targets);
  };
  Circuit &measure(uint_t target) { return measure(reg_t({target})); };
  Circuit &reset(const reg_t &targets) { return gate(gate_t::Reset, targets); };
  Circuit &reset(uint_t target) { return reset(reg_t({target})); };

private:
  // true for a qubit measured with no operation acting on it since
  std::vector<bool> measured;

  Circuit &controlled(gate_t id, const reg_t &controls, uint_t target,
                      const rvector_t &params = {});

  void check_qubit(uint_t qubit, const std::string &label) const;
  void check_params(gate_t id, const rvector_t &params) const;
  void check_single(const operation &op) const;
  void append(operation &&op);

  /**
   *  Parse a json circuit operation
   */
  void parse_op(const json_t &js, const gateset_t &gs);
};

/*******************************************************************************
 *
 * Circuit methods
 *
 ******************************************************************************/

inline Circuit::Circuit(uint_t num_qubits)
    : nqubits(num_qubits), nclbits(num_qubits), measured(num_qubits, false) {
  if (num_qubits < 1 || num_qubits > 62) {
    std::stringstream ss;
    ss << "circuit must have between 1 and 62 qubits, got " << num_qubits;
    throw InvalidOperationError(ss.str());
  }
}

//------------------------------------------------------------------------------
// Validation
//------------------------------------------------------------------------------

inline void Circuit::check_qubit(uint_t qubit, const std::string &label) const {
  if (qubit >= nqubits) {
    std::stringstream ss;
    ss << label << ": qubit index " << qubit << " out of range [0, "
       << nqubits << ")";
    throw InvalidIndexError(ss.str());
  }
}

inline void Circuit::check_params(gate_t id, const rvector_t &params) const {
  if (params.size() != Gates::num_params(id)) {
    std::stringstream ss;
    ss << Gates::name(id) << ": expected " << Gates::num_params(id)
       << " parameters, got " << params.size();
    throw InvalidOperationError(ss.str());
  }
  for (const auto theta : params)
    if (std::isfinite(theta) == false) {
      std::stringstream ss;
      ss << Gates::name(id) << ": angle " << theta << " is not finite";
      throw InvalidOperationError(ss.str());
    }
}

inline void Circuit::check_single(const operation &op) const {
  const uint_t target = op.qubits[0];
  check_qubit(target, op.name);
  for (size_t j = 0; j < op.controls.size(); j++) {
    check_qubit(op.controls[j], op.name);
    if (op.controls[j] == target) {
      std::stringstream ss;
      ss << op.name << ": target qubit " << target << " is also a control "
         << op.controls;
      throw InvalidOperationError(ss.str());
    }
    if (std::find(op.controls.begin() + j + 1, op.controls.end(),
                  op.controls[j]) != op.controls.end()) {
      std::stringstream ss;
      ss << op.name << ": duplicate control qubit " << op.controls[j] << " in "
         << op.controls;
      throw InvalidOperationError(ss.str());
    }
  }
}

//------------------------------------------------------------------------------
// Builders
//------------------------------------------------------------------------------

inline Circuit &Circuit::controlled(gate_t id, const reg_t &controls,
                                    uint_t target, const rvector_t &params) {
  if (controls.empty()) {
    std::stringstream ss;
    ss << "c" << Gates::name(id) << ": at least one control qubit is required";
    throw InvalidOperationError(ss.str());
  }
  return gate(id, reg_t({target}), controls, params);
}

inline Circuit &Circuit::gate(gate_t id, const reg_t &targets,
                              const reg_t &controls, const rvector_t &params) {

  if (measured.size() != nqubits)
    measured.assign(nqubits, false);
  const std::string label = Gates::name(id);
  if (Gates::is_single_qubit(id) == false && controls.empty() == false) {
    std::stringstream ss;
    ss << label << ": operation cannot be controlled";
    throw InvalidOperationError(ss.str());
  }
  check_params(id, params);

  // Every record is validated before any is appended
  std::vector<operation> ops;
  operation op;
  op.id = id;
  op.name = label;
  switch (id) {
  case gate_t::Barrier:
    ops.push_back(op);
    break;
  case gate_t::Swap:
    if (targets.size() != 2) {
      std::stringstream ss;
      ss << "swap: expected 2 qubits, got " << targets;
      throw InvalidOperationError(ss.str());
    }
    check_qubit(targets[0], label);
    check_qubit(targets[1], label);
    if (targets[0] == targets[1]) {
      std::stringstream ss;
      ss << "swap: qubits must differ, got " << targets[0] << " twice";
      throw InvalidOperationError(ss.str());
    }
    op.qubits = targets;
    ops.push_back(op);
    break;
  case gate_t::Measure:
  case gate_t::Reset:
    for (auto it = targets.begin(); it != targets.end(); ++it) {
      check_qubit(*it, label);
      if (id == gate_t::Measure &&
          (measured[*it] || std::find(targets.begin(), it, *it) != it)) {
        std::stringstream ss;
        ss << "measure: qubit " << *it
           << " is measured again with no operation acting on it since";
        throw InvalidOperationError(ss.str());
      }
      op.qubits = reg_t({*it});
      ops.push_back(op);
    }
    break;
  default:
    // Single-qubit unitaries
    op.name = std::string(controls.size(), 'c') + label;
    op.params = params;
    op.controls = controls;
    for (const auto q : targets) {
      op.qubits = reg_t({q});
      check_single(op);
      ops.push_back(op);
    }
  }

  for (auto &o : ops)
    append(std::move(o));
  return *this;
}

inline void Circuit::append(operation &&op) {
  // Any operation acting on a qubit allows it to be measured again
  if (op.id == gate_t::Measure)
    measured[op.qubits[0]] = true;
  else {
    for (const auto q : op.qubits)
      measured[q] = false;
    for (const auto q : op.controls)
      measured[q] = false;
  }
#ifdef QCSIM_DEBUG
  std::stringstream ss;
  ss << "DEBUG Circuit::append " << op.name;
  if (!op.params.empty())
    ss << " params = " << op.params;
  if (!op.qubits.empty())
    ss << " qubits = " << op.qubits;
  if (!op.controls.empty())
    ss << " controls = " << op.controls;
  std::clog << ss.str() << std::endl;
#endif
  operations.push_back(std::move(op));
}

//------------------------------------------------------------------------------
// JSON
//------------------------------------------------------------------------------

inline void Circuit::parse(const json_t &circuit, const json_t &qobjconf,
                           const gateset_t &gs) {
#ifdef QCSIM_DEBUG
  std::clog << "DEBUG (json): parsing circuit object" << std::endl;
#endif
  uint_t num_qubits = 0;
  if (JSON::get_uint(num_qubits, "number_of_qubits", circuit) == false)
    throw std::runtime_error(std::string("circuit has no number_of_qubits"));
  *this = Circuit(num_qubits);

  // Load optional values
  JSON::get_value(name, "name", circuit); // look for circuit name

  // parse operations
  if (JSON::check_key("operations", circuit)) {
    const json_t &ops = circuit["operations"];
    if (ops.is_array() == false)
      throw std::runtime_error(std::string("operations must be a list"));
    for (auto it = ops.begin(); it != ops.end(); ++it)
      parse_op(*it, gs);
  }

  // Parse Config
  config = qobjconf; // copy qobj level config
  if (config.is_object() == false)
    config = json_t::object();
  if (JSON::check_key("config", circuit)) {
    for (auto it = circuit["config"].cbegin(); it != circuit["config"].cend();
         ++it) {
      config[it.key()] = it.value(); // overwrite circuit level config values
    }
  }

  // load config
  JSON::get_uint(shots, "shots", config);
  JSON::get_value(rng_seed, "seed", config);
}

//------------------------------------------------------------------------------
inline void Circuit::parse_op(const json_t &node, const gateset_t &gs) {

  std::string label;
  if (!(node.is_object() && JSON::get_value(label, "name", node)))
    throw InvalidOperationError(std::string("operation has no name"));
  to_lowercase(label);
  string_trim(label);

  reg_t qubits, controls;
  rvector_t params;
  JSON::get_value(qubits, "qubits", node);
  JSON::get_value(controls, "controls", node);
  JSON::get_value(params, "params", node);

#ifdef QCSIM_DEBUG
  std::stringstream ss;
  ss << "DEBUG (json): op " << label;
  if (!params.empty())
    ss << " params = " << params;
  if (!qubits.empty())
    ss << " qubits = " << qubits;
  if (!controls.empty())
    ss << " controls = " << controls;
  std::clog << ss.str() << std::endl;
#endif

  // Plain gate names
  auto pos = gs.find(label);
  if (pos != gs.end()) {
    gate(pos->second, qubits, controls, params);
    return;
  }

  // Controlled aliases: each leading 'c' requires one more control qubit
  const size_t nctrl = label.find_first_not_of('c');
  if (nctrl != std::string::npos && nctrl > 0) {
    pos = gs.find(label.substr(nctrl));
    if (pos != gs.end() && Gates::is_single_qubit(pos->second)) {
      if (controls.size() < nctrl) {
        std::stringstream ss;
        ss << label << ": expected at least " << nctrl
           << " control qubits, got " << controls;
        throw InvalidOperationError(ss.str());
      }
      gate(pos->second, qubits, controls, params);
      return;
    }
  }
  throw InvalidOperationError(std::string("invalid operation \'") + label +
                              "\'");
}

//------------------------------------------------------------------------------
} // end namespace QCSIM
#endif
