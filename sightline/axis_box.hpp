// Copyright (C) 2012 Risto Saarelma

#ifndef SIGHTLINE_AXIS_BOX_HPP
#define SIGHTLINE_AXIS_BOX_HPP

#include "alg.hpp"
#include "vec.hpp"
#include "core.hpp"
#include <algorithm>
#include <numeric>

namespace sightline {

/// Axis-aligned variable-dimension box. The max corner is exclusive.
template<class T, int N> class Axis_Box {
 public:
  Axis_Box() {}

  Axis_Box(const Vec<T, N>& min, const Vec<T, N>& dim)
      : min_pt(min), dim_vec(dim) {
    ASSERT(all_of(dim_vec, [](T x) { return x >= 0; }));
  }

  Axis_Box(const Vec<T, N>& dim)
      : min_pt(), dim_vec(dim) {
    ASSERT(all_of(dim_vec, [](T x) { return x >= 0; }));
  }

  bool contains(const Vec<T, N>& pos) const {
    return pairwise_all_of(min_pt, pos, [](T a, T b) { return a <= b; }) &&
        pairwise_all_of(pos, max(), [](T a, T b) { return a < b; });
  }

  /// The overlapping part of the two boxes, with zero dimensions along the
  /// axes where they do not meet.
  Axis_Box<T, N> intersection(const Axis_Box<T, N>& other) const {
    Vec<T, N> lo = elem_max(min(), other.min());
    Vec<T, N> hi = elem_min(max(), other.max());
    Vec<T, N> dim;
    for (int i = 0; i < N; i++)
      dim[i] = std::max(T(0), hi[i] - lo[i]);
    return Axis_Box<T, N>(lo, dim);
  }

  const Vec<T, N>& min() const { return min_pt; }

  Vec<T, N> max() const { return min_pt + dim_vec; }

  const Vec<T, N>& dim() const { return dim_vec; }

  T volume() const {
    return std::accumulate(
        dim_vec.begin(), dim_vec.end(), T(1),
        [] (const T& a, const T& b) { return a * b; });
  }

 private:
  Vec<T, N> min_pt;
  Vec<T, N> dim_vec;
};

typedef Axis_Box<int, 2> ARecti;

}

#endif
