#ifndef RXCACHE_SRC_COMMON_OVERLOADED_H_
#define RXCACHE_SRC_COMMON_OVERLOADED_H_

namespace Rxcache {

// Overload set for std::visit; a missing alternative fails to compile
template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace Rxcache

#endif // RXCACHE_SRC_COMMON_OVERLOADED_H_
