/**
 * @file access.h
 * @brief Access capability tags for searches, linked models and clients
 */

#ifndef KCENON_CUBE_SEARCH_ACCESS_H
#define KCENON_CUBE_SEARCH_ACCESS_H

#include <type_traits>

namespace kcenon::cube {

/**
 * @brief Read-only view: anonymous clients and downgraded handles
 */
struct ro_access {};

/**
 * @brief Read-write view: logged-in clients
 */
struct rw_access {};

template <typename A>
inline constexpr bool is_access_tag_v =
    std::is_same_v<A, ro_access> || std::is_same_v<A, rw_access>;

template <typename A>
inline constexpr bool is_rw_v = std::is_same_v<A, rw_access>;

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_SEARCH_ACCESS_H
