#pragma once

#include <cmath>
#include <type_traits>

namespace entente::core {

// Clamp helpers shared by every scoring function.
//
// std::clamp is avoided because a few call sites clamp across mixed integer
// widths (trait ints into table indices).

template <class T>
constexpr T clamp(T v, T lo, T hi) {
  return (v < lo) ? lo : ((v > hi) ? hi : v);
}

// Clamp a value in a common type and cast to the requested output type.
template <class Out, class In, class Lo, class Hi>
constexpr Out clampCast(In v, Lo lo, Hi hi) {
  using C = std::common_type_t<In, Lo, Hi>;
  C cv = static_cast<C>(v);
  C clo = static_cast<C>(lo);
  C chi = static_cast<C>(hi);
  if (cv < clo) cv = clo;
  if (cv > chi) cv = chi;
  return static_cast<Out>(cv);
}

// Every probability/score in the engine is reported in [0,1].
// NaN collapses to 0 so a bad intermediate can never leak out of range.
inline double clamp01(double v) {
  if (!(v >= 0.0)) return 0.0;
  if (v > 1.0) return 1.0;
  return v;
}

} // namespace entente::core
