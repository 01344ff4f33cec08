/* alg.hpp

   Copyright (C) 2012 Risto Saarelma

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation, either version 3 of the License, or
   (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef SIGHTLINE_ALG_HPP
#define SIGHTLINE_ALG_HPP

/// \file alg.hpp \brief Generic helper algorithms

#include <algorithm>

namespace sightline {

/// Helper function to run all_of over a range without spelling out the begin/end.
template<class Range, class Unary_Predicate>
bool all_of(const Range& a, Unary_Predicate p) {
  return std::all_of(a.begin(), a.end(), p);
}

/**
 * Return whether p holds for each corresponding pair of elements from ranges a and b.
 *
 * If a and b have different lengths, the elements that have no pair are
 * ignored.
 */
template<class Range, class Binary_Predicate>
bool pairwise_all_of(const Range& a, const Range& b, Binary_Predicate p) {
  auto a1 = a.begin(), a2 = a.end();
  auto b1 = b.begin(), b2 = b.end();
  while (a1 != a2 && b1 != b2 && p(*a1, *b1)) {
    ++a1;
    ++b1;
  }
  return a1 == a2 || b1 == b2;
}

/// Return whether the range contains an element equal to value.
template<class Range, class T>
bool range_contains(const Range& a, const T& value) {
  return std::find(a.begin(), a.end(), value) != a.end();
}

}

#endif
