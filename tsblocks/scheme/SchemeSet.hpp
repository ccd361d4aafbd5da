#ifndef TSBLOCKS_SCHEMESET_H_
#define TSBLOCKS_SCHEMESET_H_
// ------------------------------------------------------------------------------
#include <bitset>
#include <initializer_list>
// ------------------------------------------------------------------------------
namespace tsblocks {
// ------------------------------------------------------------------------------
// Compact way of storing a set of schemes (e.g. enabled schemes) in a bitset.
// ------------------------------------------------------------------------------
template <typename T, std::size_t N = static_cast<std::size_t>(T::SCHEME_MAX)>
struct SchemeSet {
  constexpr SchemeSet() = default;
  SchemeSet(std::initializer_list<T> schemes) { enable(schemes); }

  SchemeSet& enable(std::initializer_list<T> schemes) {
    for (auto& s : schemes) {
      enable(s);
    }
    return *this;
  }

  SchemeSet& disable(std::initializer_list<T> schemes) {
    for (auto& s : schemes) {
      disable(s);
    }
    return *this;
  }

  SchemeSet& enable(T s) {
    set.set(static_cast<std::size_t>(s));
    return *this;
  }

  SchemeSet& disable(T s) {
    set.set(static_cast<std::size_t>(s), false);
    return *this;
  }

  [[nodiscard]] bool isEnabled(T s) const {
    return static_cast<std::size_t>(s) < N && set.test(static_cast<std::size_t>(s));
  }

 private:
  std::bitset<N> set;
};
// ------------------------------------------------------------------------------
}  // namespace tsblocks
// ------------------------------------------------------------------------------
#endif  // TSBLOCKS_SCHEMESET_H_
