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

#include <complex>
#include <iostream>
#include <vector>

#include "qubit_vector.hpp"
#include "test_utils.hpp"

using namespace std;
using QV::QubitVector;

/*******************************************************************************
   *
   * QubitVector class methods to test
   *
   * Constructors:
   *  - QubitVector(uint_t)
   *  - QubitVector(cvector_t)
   *
   * Operators:
   *  - assignment = (cvector_t)
   *  - element access [], at()
   *  - scalar multiplication *= (complex_t)
   *  - scalar multiplication *= (double)
   *
   * Utility methods:
   *  - size()
   *  - qubits()
   *  - vector()
   *  - begin(), end()
   *  - set_omp_threads()
   *  - set_omp_threshold()
   *
   * Algebra:
   *  - norm()
   *  - renormalize()
   *  - initialize()
   *
   * Z-measurement outcome probabilities:
   *  - probability(uint)
   *  - probability(uint, uint)
   *  - total_probability(vector<uint>)
   *
   ******************************************************************************/

int main() {

  // USEFUL STATES
  const complex_t I(0, 1);
  const complex_t one(1, 0);
  const complex_t zero(0, 0);
  const complex_t ort2(1./std::sqrt(2.));

  const cvector_t xp({ort2, ort2});
  const cvector_t ym({ort2, -I * ort2});
  const cvector_t zm({0., 1.});

  //------------------------------------------------------------------------------
  // CONSTRUCTORS
  //------------------------------------------------------------------------------

  clog << "\nCONSTRUCTOR TESTS" << endl;
  {
    QubitVector test;
    test_condition(test.size() == 1, "size (default constructor)");
    test_condition(test.qubits() == 0, "qubits (default constructor)");
    test_condition(approx_equal(test.vector(), cvector_t({zero})), "vector (default constructor)");
  }
  {
    vector<size_t> dims({1, 2, 4, 8, 16, 32, 64, 128, 256, 512});
    bool size = true;
    bool qubits = true;
    bool vector = true;
    for (uint_t j=0; j < 10; j++) {
      QubitVector test(j);
      size &= (test.size() == dims[j]);
      qubits &= (test.qubits() == j);
      vector &= (approx_equal(test.vector(), cvector_t(dims[j], 0.)));
    }
    test_condition(size, "size (uint_t constructor)");
    test_condition(qubits, "qubits (uint_t constructor)");
    test_condition(vector, "vector (uint_t constructor)");
  }
  {
    QubitVector test(xp);
    test_condition(test.size() == 2, "size (cvector_t constructor)");
    test_condition(test.qubits() == 1, "qubits (cvector_t constructor)");
    test_condition(approx_equal(test.vector(), xp), "vector (cvector_t constructor)");
  }
  {
    bool pass = true;
    pass &= throws<QCSIM::InvalidOperationError>([] { QubitVector test(cvector_t(3, 0.)); });
    pass &= throws<QCSIM::InvalidOperationError>([] { QubitVector test = cvector_t(); });
    pass &= throws<QCSIM::InvalidOperationError>([] { QubitVector test(63); });
    test_condition(pass, "invalid constructor arguments");
  }

  //------------------------------------------------------------------------------
  // OPERATORS
  //------------------------------------------------------------------------------

  clog << "\nOPERATOR TESTS" << endl;
  {
    // setter operators
    QubitVector test;
    test = xp;
    bool pass_equal = true;
    pass_equal &= test.size() == 2;
    pass_equal &= test.qubits() == 1;
    pass_equal &= approx_equal(test.vector(), xp);
    test_condition(pass_equal, "operator= (cvector)");
  }
  {
    cvector_t v1(4, 1.0);
    cvector_t v2(4, -1.0);
    cvector_t v3(4, I);
    cvector_t v4(4, 2.0);

    QubitVector test = v1;
    bool pass_mult = true;
    test *= -one;
    pass_mult &= (test.vector() == v2);
    test = v1;
    test *= I;
    pass_mult &= (test.vector() == v3);
    test = v1;
    test *= 2.0;
    pass_mult &= (test.vector() == v4);
    test_condition(pass_mult, "operator*=");
  }
  {
    QubitVector test(2);
    test[3] = I;
    bool pass = approx_equal(test.at(3), I) && approx_equal(test[0], zero);
    pass &= throws<QCSIM::InvalidIndexError>([&] { test.at(4); });
    test_condition(pass, "element access");
  }

  //------------------------------------------------------------------------------
  // UTILITY
  //------------------------------------------------------------------------------

  clog << "\nUTILITY TESTS" << endl;
  {
    // initialize
    vector<size_t> dims({1, 2, 4, 8, 16, 32, 64, 128, 256, 512});
    bool pass_init = true;
    for (uint_t j=0; j < 4; j++) {
      QubitVector test(j);
      test *= 0.;
      cvector_t vec_z(dims[j], 0.);
      vec_z[0] = 1.0;
      test.initialize();
      pass_init &= approx_equal(test.vector(), vec_z);
    }
    test_condition(pass_init, "initialize");

    // renormalize
    bool pass_renorm = true;
    for (uint_t j=0; j < 10; j++) {
      QubitVector test(cvector_t(1ULL << j, 1.0));
      complex_t val = 1.0 / std::pow(2.0, 0.5 * j);
      cvector_t vec_x(dims[j], val);
      test.renormalize();
      pass_renorm &= approx_equal(test.vector(), vec_x);
    }
    test_condition(pass_renorm, "renormalize");
    QubitVector zero_vec(2);
    test_condition(throws<QCSIM::NumericalError>([&] { zero_vec.renormalize(); }),
                   "renormalize (zero vector)");

    // norm
    {
      bool pass = true;
      QubitVector test(0);
      pass &= approx_equal(test.norm(), 0.0);
      test = xp;
      pass &= approx_equal(test.norm(), 1.0);
      test = cvector_t({0.5, 0.0, 0.25, 0.0});
      pass &= approx_equal(test.norm(), 0.3125);
      test_condition(pass, "norm");
    }

    // iteration in basis index order
    {
      QubitVector test(cvector_t({0., 1., 2., 3.}));
      bool pass = true;
      double k = 0.;
      for (const auto &amp : test) {
        pass &= approx_equal(amp, complex_t(k));
        k += 1.;
      }
      pass &= (k == 4.);
      test_condition(pass, "begin / end");
    }

    // omp settings
    {
      QubitVector test(3);
      bool pass = (test.get_omp_threads() == 1) && (test.parallel() == false);
      test.set_omp_threads(4);
      test.set_omp_threshold(2);
      pass &= (test.get_omp_threads() == 4) && (test.get_omp_threshold() == 2);
      pass &= test.parallel();
      test.set_omp_threads(0); // ignored
      pass &= (test.get_omp_threads() == 4);
      test_condition(pass, "omp settings");
    }
  }

  //------------------------------------------------------------------------------
  // PROBABILITIES
  //------------------------------------------------------------------------------

  clog << "\nPROBABILITY TESTS" << endl;
  {
    QubitVector test(1);
    bool pass = true;
    pass &= approx_equal(test.probability(0, 0), 0.);
    pass &= approx_equal(test.probability(0, 1), 0.);
    test.initialize();
    pass &= approx_equal(test.probability(0, 0), 1.);
    pass &= approx_equal(test.probability(0, 1), 0.);
    test = xp;
    pass &= approx_equal(test.probability(0, 0), 0.5);
    pass &= approx_equal(test.probability(0, 1), 0.5);
    test = ym;
    pass &= approx_equal(test.probability(0, 0), 0.5);
    pass &= approx_equal(test.probability(0, 1), 0.5);
    test = zm;
    pass &= approx_equal(test.probability(0, 1), 1.);
    test_condition(pass, "probability (1-qubit)");
  }
  {
    // |psi> = 0.5 |00> + 0.5 |01> + 0.5i |10> - 0.5 |11>
    QubitVector test(cvector_t({0.5, 0.5, 0.5 * I, -0.5}));
    bool pass = true;
    pass &= approx_equal(test.probability(2), 0.25);
    pass &= approx_equal(test.probability(0, 1), 0.5);
    pass &= approx_equal(test.probability(1, 0), 0.5);
    test = cvector_t({0.6, 0., 0.8, 0.});
    pass &= approx_equal(test.probability(1, 1), 0.64);
    pass &= approx_equal(test.probability(0, 0), 1.);
    pass &= approx_equal(test.total_probability({0, 2}), 1.);
    pass &= approx_equal(test.total_probability({1, 2, 3}), 0.64);
    test_condition(pass, "probability (2-qubit)");
  }
  {
    QubitVector test(2);
    bool pass = true;
    pass &= throws<QCSIM::InvalidIndexError>([&] { test.probability(2, 0); });
    pass &= throws<QCSIM::InvalidOperationError>([&] { test.probability(0, 2); });
    pass &= throws<QCSIM::InvalidIndexError>([&] { test.total_probability({0, 4}); });
    test_condition(pass, "probability (invalid arguments)");
  }

  // END
  return test_result();
}
