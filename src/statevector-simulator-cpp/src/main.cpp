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
 * @file main.cpp
 * @brief qcsim state-vector simulator runner
 */

//#define QCSIM_DEBUG // Uncomment for verbose debugging output

#include <cstdio>
#include <iostream>
#include <string>

// Simulator
#include "simulator.hpp"

/*******************************************************************************
 *
 * Main
 *
 ******************************************************************************/

inline void failed(std::string msg, std::ostream &o = std::cout,
                   int indent = -1) {
  json_t ret;
  ret["success"] = false;
  ret["status"] = std::string("ERROR: ") + msg;
  o << ret.dump(indent) << std::endl;
}

int main(int argc, char **argv) {

  std::ostream &out = std::cout; // output stream
  int indent = 4;

  if (argc != 2) {
    failed("Invalid command line", out);
    // Print usage message
    std::cerr << std::endl;
    std::cerr << "qcsim_simulator file" << std::endl;
    std::cerr << std::endl;
    std::cerr << "  file : JSON circuit program, or '-' for standard input\n"
              << std::endl;
    return 1;
  }

  // Parse the program from a file or stdin
  QCSIM::Simulator sim;
  try {
    sim.load_file(std::string(argv[1]));
  } catch (std::exception &e) {
    std::stringstream msg;
    msg << "Invalid input (" << e.what() << ")";
    failed(msg.str(), out, indent);
    return 1;
  }

  // Execute simulation
  try {
    out << sim.execute(indent) << std::endl;
    return 0;
  } catch (std::exception &e) {
    std::stringstream msg;
    msg << "Failed to execute program (" << e.what() << ")";
    failed(msg.str(), out, indent);
    return 1;
  }

} // end main
