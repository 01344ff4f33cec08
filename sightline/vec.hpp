// Copyright (C) 2012 Risto Saarelma

#ifndef SIGHTLINE_VEC_HPP
#define SIGHTLINE_VEC_HPP

/// \file vec.hpp \brief Geometric vectors

#include <cstdlib>
#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <boost/static_assert.hpp>

namespace sightline {

/// Geometric vector class.
template<class T, int N> class Vec {
 public:
  Vec() {
    for (int i = 0; i < N; i++) {
      data[i] = T();
    }
  }

  Vec(std::initializer_list<T> args) {
    int i = 0;
    for (auto v : args) {
      data[i] = v;
      ++i;
      if (i == N)
        break;
    }
    for (; i < N; i++)
      data[i] = T();
  }

  Vec(const T& e0, const T& e1) {
    BOOST_STATIC_ASSERT(N == 2);
    data[0] = e0;
    data[1] = e1;
  }


  T& operator[](int i) {
    return data[i];
  }

  T operator[](int i) const {
    return data[i];
  }


  bool operator==(const Vec<T, N>& rhs) const {
    for (int i = 0; i < N; i++) {
      if (data[i] != rhs[i])
        return false;
    }
    return true;
  }

  bool operator!=(const Vec<T, N>& rhs) const { return !(*this == rhs); }

  /// Ordering relation predicate.
  bool operator<(const Vec<T, N>& rhs) const {
    for (int i = 0; i < N; i++) {
      if (data[i] < rhs[i])
        return true;
      else if (data[i] > rhs[i])
        return false;
    }
    return false;
  }


  T* begin() {
    return &data[0];
  }

  T* end() {
    return &data[N];
  }

  const T* begin() const {
    return &data[0];
  }

  const T* end() const {
    return &data[N];
  }


  Vec<T, N>& operator+=(const Vec<T, N>& rhs) {
    for (int i = 0; i < N; i++)
      data[i] += rhs[i];
    return *this;
  }

  Vec<T, N>& operator-=(const Vec<T, N>& rhs) {
    for (int i = 0; i < N; i++)
      data[i] -= rhs[i];
    return *this;
  }

  Vec<T, N>& operator*=(T rhs) {
    for (int i = 0; i < N; i++)
      data[i] *= rhs;
    return *this;
  }

  /// Sum of the squared elements.
  T abs_sq() const {
    T sum(0);
    for (auto i : *this)
      sum += i * i;
    return sum;
  }
private:
  T data[N];
};

typedef Vec<int, 2>    Vec2i;

template<class T, int N>
Vec<T, N> operator+(const Vec<T, N>& lhs, const Vec<T, N>& rhs) {
  Vec<T, N> result(lhs);
  result += rhs;
  return result;
}

template<class T, int N>
Vec<T, N> operator-(const Vec<T, N>& lhs, const Vec<T, N>& rhs) {
  Vec<T, N> result(lhs);
  result -= rhs;
  return result;
}

template<class T, int N>
Vec<T, N> operator-(const Vec<T, N>& vec) {
  Vec<T, N> result;
  result -= vec;
  return result;
}

template<class T, int N>
Vec<T, N> operator*(T lhs, const Vec<T, N>& rhs) {
  Vec<T, N> result = rhs;
  result *= lhs;
  return result;
}

template<class T, int N>
Vec<T, N> operator*(const Vec<T, N>& lhs, T rhs) {
  Vec<T, N> result = lhs;
  result *= rhs;
  return result;
}

/// Elementwise minimum.
template<class T, int N>
Vec<T, N> elem_min(const Vec<T, N>& lhs, const Vec<T, N>& rhs) {
  Vec<T, N> result;
  for (int i = 0; i < N; i++)
    result[i] = std::min(lhs[i], rhs[i]);
  return result;
}

/// Elementwise maximum.
template<class T, int N>
Vec<T, N> elem_max(const Vec<T, N>& lhs, const Vec<T, N>& rhs) {
  Vec<T, N> result;
  for (int i = 0; i < N; i++)
    result[i] = std::max(lhs[i], rhs[i]);
  return result;
}

/// Taxicab length, the number of orthogonal steps to cover the vector.
inline int manhattan_length(const Vec2i& vec) {
  return std::abs(vec[0]) + std::abs(vec[1]);
}

/// Chessboard length, the larger of the absolute components.
inline int chebyshev_length(const Vec2i& vec) {
  return std::max(std::abs(vec[0]), std::abs(vec[1]));
}

template<class T, int N>
std::ostream& operator<<(std::ostream& out, const Vec<T, N>& vec) {
  out << "<" << vec[0];
  for (int i = 1; i < N; i++)
    out << ", " << vec[i];
  out << ">";
  return out;
}

}

#endif
