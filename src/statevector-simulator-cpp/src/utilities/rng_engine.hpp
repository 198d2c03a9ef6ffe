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
 * @file rng_engine.hpp
 * @brief RngEngine used by the simulator backends
 */

#ifndef _RngEngine_hpp_
#define _RngEngine_hpp_

#include <cmath>
#include <random>

#include "types.hpp"

namespace QCSIM {

/***************************************************************************/ /**
  *
  * RngEngine Class
  *
  * Objects of this class are used to generate random numbers for backends.
  * These are used to decide outcomes of measurements and resets. Each backend
  * owns its own engine, so shots running on different threads never share
  * one.
  *
  ******************************************************************************/

class RngEngine {
public:
  /**
   * Generate a uniformly distributed pseudo random real in the half-open
   * interval [a,b)
   * @param a closed lower bound on interval
   * @param b open upper bound on interval
   * @return the generated double
   */
  double rand(double a, double b);

  /**
   * Generate a uniformly distributed pseudo random real in the half-open
   * interval [0,1)
   * @return the generated double
   */
  inline double rand() { return rand(0., 1.); };

  /**
   * Default constructor initialize RNG engine with a random seed
   */
  RngEngine() {
    std::random_device rd;
    rng.seed(rd());
  };

  /**
   * Seeded constructor initialize RNG engine with a fixed seed. Both 32-bit
   * halves of the seed feed the mt19937 state.
   * @param seed integer to use as seed for mt19937 engine
   */
  explicit RngEngine(uint_t seed) {
    std::seed_seq seq{static_cast<uint32_t>(seed & 0xFFFFFFFFULL),
                      static_cast<uint32_t>(seed >> 32)};
    rng.seed(seq);
  };

private:
  std::mt19937 rng; // Mersenne twister rng engine
};

/*******************************************************************************
 *
 * RngEngine Methods
 *
 ******************************************************************************/

inline double RngEngine::rand(double a, double b) {
  double p = std::uniform_real_distribution<double>(a, b)(rng);
  // generate_canonical may round up to the open bound
  if (p >= b)
    p = std::nextafter(b, a);
#ifdef QCSIM_DEBUG
  std::stringstream ss;
  ss << "DEBUG: rand(" << a << "," << b << ") = " << p;
  std::clog << ss.str() << std::endl;
#endif
  return p;
}

//------------------------------------------------------------------------------
} // end namespace QCSIM
#endif
