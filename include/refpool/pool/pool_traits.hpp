#pragma once

#include <deque>
#include <list>
#include <map>
#include <new>
#include <set>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace refpool {
namespace pool {

// Opt-in marker. A type marked here gets PoolDefault (placement `new A()`)
// and PoolClone (placement copy construction) for free.
// Mark your own types with REFPOOL_POOL_DEFAULT_IMPL(Type) at global scope.
template <typename A>
struct PoolDefaultImpl
    : std::integral_constant<bool, std::is_arithmetic<A>::value || std::is_enum<A>::value ||
                                       std::is_pointer<A>::value> {};

template <typename... Ts>
struct AllPoolDefaultImpl : std::true_type {};

template <typename T, typename... Ts>
struct AllPoolDefaultImpl<T, Ts...>
    : std::integral_constant<bool, PoolDefaultImpl<T>::value && AllPoolDefaultImpl<Ts...>::value> {};

template <typename C, typename T, typename Alloc>
struct PoolDefaultImpl<std::basic_string<C, T, Alloc> > : std::true_type {};
template <typename T, typename Alloc>
struct PoolDefaultImpl<std::vector<T, Alloc> > : std::true_type {};
template <typename T, typename Alloc>
struct PoolDefaultImpl<std::deque<T, Alloc> > : std::true_type {};
template <typename T, typename Alloc>
struct PoolDefaultImpl<std::list<T, Alloc> > : std::true_type {};
template <typename K, typename V, typename Cmp, typename Alloc>
struct PoolDefaultImpl<std::map<K, V, Cmp, Alloc> > : std::true_type {};
template <typename K, typename Cmp, typename Alloc>
struct PoolDefaultImpl<std::set<K, Cmp, Alloc> > : std::true_type {};
template <typename K, typename V, typename H, typename Eq, typename Alloc>
struct PoolDefaultImpl<std::unordered_map<K, V, H, Eq, Alloc> > : std::true_type {};
template <typename K, typename H, typename Eq, typename Alloc>
struct PoolDefaultImpl<std::unordered_set<K, H, Eq, Alloc> > : std::true_type {};
template <typename T1, typename T2>
struct PoolDefaultImpl<std::pair<T1, T2> > : AllPoolDefaultImpl<T1, T2> {};
template <typename... Ts>
struct PoolDefaultImpl<std::tuple<Ts...> > : AllPoolDefaultImpl<Ts...> {};

// Construct a default value of A in uninitialized storage.
// Specialise directly when a type can be made ready more cheaply than by
// running its constructor; the result must still compare equal to A().
template <typename A, typename Enable = void>
struct PoolDefault;

template <typename A>
struct PoolDefault<A, typename std::enable_if<PoolDefaultImpl<A>::value>::type> {
  static void DefaultUninit(void* target) { ::new (target) A(); }
};

// Construct a copy of |source| in uninitialized storage.
template <typename A, typename Enable = void>
struct PoolClone;

template <typename A>
struct PoolClone<A, typename std::enable_if<PoolDefaultImpl<A>::value>::type> {
  static void CloneUninit(const A& source, void* target) { ::new (target) A(source); }
};

}  // namespace pool
}  // namespace refpool

#define REFPOOL_POOL_DEFAULT_IMPL(Type)                       \
  namespace refpool {                                         \
  namespace pool {                                            \
  template <>                                                 \
  struct PoolDefaultImpl<Type> : std::true_type {};           \
  }                                                           \
  }
