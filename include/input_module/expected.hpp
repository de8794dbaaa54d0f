#pragma once

// Result aliases used by every fallible operation in the library. The error
// side defaults to std::error_code so transport, codec and session failures
// share one type; see errors.hpp for the categories.

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace fw::iom {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

}  // namespace fw::iom
