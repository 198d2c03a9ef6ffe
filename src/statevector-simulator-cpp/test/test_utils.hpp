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
 * @file    test_utils.hpp
 * @brief   Condition reporting and approximate comparison for the tests
 */

#ifndef _test_utils_hpp_
#define _test_utils_hpp_

#include <cmath>
#include <complex>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "types.hpp"

// Number of failed conditions in this test executable
static uint_t failures = 0;

inline bool approx_equal(complex_t a, complex_t b, double threshold = 1e-10) {
  return !(std::abs(a - b) > threshold);
}
inline bool approx_equal(double a, double b, double threshold = 1e-10) {
  return !(std::abs(a - b) > threshold);
}

template <typename T>
bool approx_equal(const std::vector<T> &a, const std::vector<T> &b,
                  double threshold = 1e-10) {
  if (a.size() != b.size())
    return false;
  double diff = 0.;
  for (uint_t j = 0; j < a.size(); j++)
    diff += std::abs(a[j] - b[j]);
  return !(diff > threshold);
}

inline void test_condition(bool value, std::string msg = "") {
  std::string pass = (value) ? "PASSED: " : "FAILED: ";
  if (!value)
    failures++;
  std::clog << pass << msg << std::endl;
}

// True if func throws an exception of type E
template <typename E, typename Func> bool throws(Func func) {
  try {
    func();
  } catch (E &) {
    return true;
  } catch (std::exception &e) {
    std::clog << "  unexpected exception: " << e.what() << std::endl;
    return false;
  }
  return false;
}

// Exit status of the test executable
inline int test_result() {
  std::clog << "\n" << failures << " FAILED" << std::endl;
  return (failures == 0) ? 0 : 1;
}

#endif
