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

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "circuit.hpp"
#include "statevector_backend.hpp"
#include "test_utils.hpp"

using namespace std;
using namespace QCSIM;

/*******************************************************************************
   *
   * Circuit builder methods to test
   *
   *  - Circuit(uint_t)
   *  - single-qubit builders on one or several targets
   *  - controlled builders, ccx, gate, swap, barrier, measure, reset
   *  - build-time validation errors
   *  - parse(json)
   *
   ******************************************************************************/

int main() {

  clog << "\nCONSTRUCTOR TESTS" << endl;
  {
    Circuit circ(3);
    bool pass = (circ.nqubits == 3) && (circ.nclbits == 3);
    pass &= circ.operations.empty() && (circ.shots == 1) && (circ.rng_seed == -1);
    test_condition(pass, "Circuit(uint_t)");
    pass = throws<InvalidOperationError>([] { Circuit c(0); });
    pass &= throws<InvalidOperationError>([] { Circuit c(63); });
    test_condition(pass, "Circuit(uint_t) qubit range");
  }

  clog << "\nBUILDER TESTS" << endl;
  {
    Circuit circ(3);
    circ.h(0).x({1, 2}).rz(2, 0.5).u({0}, 0.1, 0.2, 0.3);
    bool pass = (circ.operations.size() == 5);
    pass &= (circ.operations[0].id == gate_t::H) && (circ.operations[0].qubits == reg_t({0}));
    pass &= (circ.operations[1].id == gate_t::X) && (circ.operations[1].qubits == reg_t({1}));
    pass &= (circ.operations[2].id == gate_t::X) && (circ.operations[2].qubits == reg_t({2}));
    pass &= (circ.operations[3].id == gate_t::RZ) && (circ.operations[3].params == rvector_t({0.5}));
    pass &= (circ.operations[4].params == rvector_t({0.1, 0.2, 0.3}));
    pass &= circ.operations[4].controls.empty();
    test_condition(pass, "single-qubit builders append one record per target");
  }
  {
    Circuit circ(4);
    circ.cx({0}, 1).ccx(0, 1, 2).crz({3, 0}, 1, 0.25).cu({2}, 3, 1., 2., 3.);
    bool pass = (circ.operations.size() == 4);
    pass &= (circ.operations[0].controls == reg_t({0})) && (circ.operations[0].name == "cx");
    pass &= (circ.operations[1].controls == reg_t({0, 1})) && (circ.operations[1].name == "ccx");
    pass &= (circ.operations[1].qubits == reg_t({2}));
    pass &= (circ.operations[2].id == gate_t::RZ) && (circ.operations[2].controls == reg_t({3, 0}));
    pass &= (circ.operations[3].id == gate_t::U) && (circ.operations[3].params.size() == 3);
    test_condition(pass, "controlled builders");
  }
  {
    Circuit circ(2);
    circ.swap(0, 1).barrier().measure({0, 1}).reset(0).measure(0);
    bool pass = (circ.operations.size() == 6);
    pass &= (circ.operations[0].id == gate_t::Swap) && (circ.operations[0].qubits == reg_t({0, 1}));
    pass &= (circ.operations[1].id == gate_t::Barrier) && circ.operations[1].qubits.empty();
    pass &= (circ.operations[2].id == gate_t::Measure) && (circ.operations[3].qubits == reg_t({1}));
    pass &= (circ.operations[4].id == gate_t::Reset);
    pass &= (circ.operations[5].id == gate_t::Measure);
    test_condition(pass, "swap, barrier, measure, reset");
  }

  clog << "\nVALIDATION TESTS" << endl;
  {
    bool pass = true;
    Circuit circ(3);
    pass &= throws<InvalidIndexError>([&] { circ.x(3); });
    pass &= throws<InvalidIndexError>([&] { circ.h({0, 5}); });
    pass &= throws<InvalidIndexError>([&] { circ.cx({4}, 0); });
    pass &= throws<InvalidIndexError>([&] { circ.swap(0, 3); });
    pass &= throws<InvalidIndexError>([&] { circ.measure(7); });
    pass &= throws<InvalidIndexError>([&] { circ.reset(3); });
    test_condition(pass, "index out of range");
  }
  {
    bool pass = true;
    Circuit circ(3);
    pass &= throws<InvalidOperationError>([&] { circ.cx({1}, 1); });
    pass &= throws<InvalidOperationError>([&] { circ.cx({0, 0}, 1); });
    pass &= throws<InvalidOperationError>([&] { circ.ccx(0, 2, 2); });
    pass &= throws<InvalidOperationError>([&] { circ.cz({}, 1); });
    pass &= throws<InvalidOperationError>([&] { circ.crx({}, 1, 0.1); });
    pass &= throws<InvalidOperationError>([&] { circ.swap(1, 1); });
    test_condition(pass, "invalid controls and swap targets");
  }
  {
    bool pass = true;
    Circuit circ(2);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    pass &= throws<InvalidOperationError>([&] { circ.rx(0, nan); });
    pass &= throws<InvalidOperationError>([&] { circ.u(0, 0., inf, 0.); });
    pass &= throws<InvalidOperationError>([&] { circ.gate(gate_t::P, {0}); });
    pass &= throws<InvalidOperationError>([&] { circ.gate(gate_t::H, {0}, {}, {1.}); });
    pass &= throws<InvalidOperationError>([&] { circ.gate(gate_t::Measure, {0}, {1}); });
    pass &= throws<InvalidOperationError>([&] { circ.gate(gate_t::Swap, {0}); });
    test_condition(pass, "invalid parameters");
  }
  {
    bool pass = true;
    Circuit circ(3);
    circ.h(0).measure(0);
    pass &= throws<InvalidOperationError>([&] { circ.measure(0); });
    pass &= throws<InvalidOperationError>([&] { circ.barrier().measure(0); });
    pass &= throws<InvalidOperationError>([&] { circ.measure({1, 1}); });
    test_condition(pass, "re-measurement without an intervening operation");
  }
  {
    bool pass = true;
    Circuit circ(3);
    circ.measure({0, 1, 2}).x(0).measure(0);      // gate target
    circ.cx({1}, 2).measure({1, 2});              // control and target
    circ.swap(0, 1).measure({0, 1}).reset(2).measure(2);
    pass &= (circ.operations.size() == 13);
    test_condition(pass, "operations between measurements allow re-measurement");
  }
  {
    // a failed call leaves the circuit unchanged
    Circuit circ(2);
    circ.h(0);
    bool pass = throws<InvalidOperationError>([&] { circ.cx({1}, 1); });
    pass &= throws<InvalidIndexError>([&] { circ.swap(0, 2); });
    pass &= throws<InvalidIndexError>([&] { circ.x({0, 1, 2}); });
    pass &= throws<InvalidOperationError>([&] { circ.measure({1, 0, 1}); });
    pass &= (circ.operations.size() == 1);
    // qubit 1 was not marked as measured by the failed call
    circ.measure(1);
    pass &= (circ.operations.size() == 2);
    test_condition(pass, "invalid calls append nothing");
  }

  clog << "\nJSON TESTS" << endl;
  {
    const json_t js = json_t::parse(R"({
      "name": "test",
      "number_of_qubits": 3,
      "config": {"shots": 7},
      "operations": [
        {"name": "H", "qubits": [0]},
        {"name": "cx", "controls": [0], "qubits": [1]},
        {"name": "ccx", "controls": [0, 1], "qubits": [2]},
        {"name": "crz", "controls": [2], "qubits": [0], "params": [0.5]},
        {"name": "swap", "qubits": [0, 2]},
        {"name": "barrier"},
        {"name": "measure", "qubits": [0, 1, 2]}
      ]})");
    const json_t qobjconf = {{"shots", 100}, {"seed", 11}};
    Circuit circ(js, qobjconf, StatevectorBackend::gateset);
    bool pass = (circ.name == "test") && (circ.nqubits == 3);
    pass &= (circ.shots == 7) && (circ.rng_seed == 11);
    pass &= (circ.operations.size() == 9);
    pass &= (circ.operations[0].id == gate_t::H);
    pass &= (circ.operations[2].id == gate_t::X) && (circ.operations[2].controls == reg_t({0, 1}));
    pass &= (circ.operations[3].id == gate_t::RZ) && (circ.operations[3].params == rvector_t({0.5}));
    pass &= (circ.operations[4].id == gate_t::Swap);
    test_condition(pass, "parse");
  }
  {
    bool pass = true;
    const json_t conf = json_t::object();
    const gateset_t &gs = StatevectorBackend::gateset;
    pass &= throws<InvalidOperationError>([&] {
      Circuit c(json_t::parse(R"({"number_of_qubits": 2, "operations": [{"name": "foo", "qubits": [0]}]})"), conf, gs);
    });
    pass &= throws<InvalidOperationError>([&] {
      Circuit c(json_t::parse(R"({"number_of_qubits": 2, "operations": [{"name": "cx", "qubits": [0]}]})"), conf, gs);
    });
    pass &= throws<InvalidOperationError>([&] {
      Circuit c(json_t::parse(R"({"number_of_qubits": 3, "operations": [{"name": "ccx", "controls": [0], "qubits": [2]}]})"), conf, gs);
    });
    pass &= throws<InvalidIndexError>([&] {
      Circuit c(json_t::parse(R"({"number_of_qubits": 2, "operations": [{"name": "x", "qubits": [2]}]})"), conf, gs);
    });
    pass &= throws<InvalidOperationError>([&] {
      Circuit c(json_t::parse(R"({"number_of_qubits": 2, "operations": [{"name": "rx", "qubits": [0]}]})"), conf, gs);
    });
    pass &= throws<std::runtime_error>([&] {
      Circuit c(json_t::parse(R"({"operations": []})"), conf, gs);
    });
    test_condition(pass, "parse (invalid operations)");
  }
  {
    bool pass = true;
    const gateset_t &gs = StatevectorBackend::gateset;
    const json_t circ = json_t::parse(R"({"number_of_qubits": 1, "operations": []})");
    pass &= throws<std::runtime_error>([&] { Circuit c(circ, json_t({{"shots", -1}}), gs); });
    pass &= throws<std::runtime_error>([&] { Circuit c(circ, json_t({{"shots", 2.5}}), gs); });
    pass &= throws<std::runtime_error>([&] {
      Circuit c(json_t::parse(R"({"number_of_qubits": -1, "operations": []})"), json_t::object(), gs);
    });
    Circuit c(circ, json_t({{"shots", 0}}), gs);
    pass &= (c.shots == 0);
    test_condition(pass, "parse (invalid shots and qubit numbers)");
  }

  // END
  return test_result();
}
