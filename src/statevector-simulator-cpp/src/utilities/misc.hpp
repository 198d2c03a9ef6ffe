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
 * @file    misc.hpp
 * @brief   miscellaneous functions
 */

#ifndef _misc_hpp_
#define _misc_hpp_

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "types.hpp"

/*******************************************************************************
 *
 * Function headers
 *
 ******************************************************************************/

/**
 * Converts a string to all lowercase characters
 * @param str: string to be converted to lowercase
 */
void to_lowercase(std::string &str);

/**
 * Removes whitespace, '_' and '-' characters from a string
 * @param str: string to be trimmed
 */
void string_trim(std::string &str);

/**
 * Converts a classical register to a ket bitstring "|c_{n-1}...c_0>". The
 * register is stored in order [c0, c1, ...] so the string is reversed, with
 * bit 0 right-most. Unset bits are written as 'x'.
 * @param creg: the classical register
 * @return: the bitstring
 */
std::string creg2ket(const creg_t &creg);

/**
 * Aggregates a list of shot results into a map from ket bitstring to the
 * number of shots that produced it.
 * @param results: classical register snapshot for each shot
 * @return: the counts map
 */
counts_t counts(const std::vector<creg_t> &results);

/*******************************************************************************
 *
 * Implementations
 *
 ******************************************************************************/

inline void to_lowercase(std::string &str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
}

inline void string_trim(std::string &str) {
  std::string tmp = "";
  for (auto c : str)
    if (c != ' ' && c != '_' && c != '-')
      tmp.push_back(c);
  str = tmp;
}

inline std::string creg2ket(const creg_t &creg) {
  std::string ket = "|";
  for (auto it = creg.crbegin(); it != creg.crend(); ++it) {
    if (*it == CBIT_UNSET)
      ket.push_back('x');
    else
      ket += std::to_string(*it);
  }
  ket.push_back('>');
  return ket;
}

inline counts_t counts(const std::vector<creg_t> &results) {
  counts_t ret;
  for (const auto &creg : results)
    ret[creg2ket(creg)] += 1;
  return ret;
}

//------------------------------------------------------------------------------
#endif
