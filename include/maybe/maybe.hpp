#ifndef MAYBE_MAYBE_HPP
#define MAYBE_MAYBE_HPP

#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

#include "maybe/interceptor.hpp"

namespace maybe {

    namespace detail {

        template <typename Packed, std::size_t... I>
        auto call_packed(Packed& packed, std::index_sequence<I...>) {
            constexpr std::size_t last = std::tuple_size_v<Packed> - 1;
            using Generator            = std::tuple_element_t<0, Packed>;
            using Result               = std::decay_t<std::invoke_result_t<Generator, std::decay_t<std::tuple_element_t<I + 1, Packed>>...>>;
            using Signature            = Result(std::decay_t<std::tuple_element_t<I + 1, Packed>>...);

            const Interceptor<Signature> interceptor(std::get<0>(packed), std::get<last>(packed));
            return interceptor.invoke(std::get<I + 1>(packed)...);
        }

    } // namespace detail

    /**
     * maybe(generator, args..., recovery)
     *
     * Calls `generator(args...)` through an Interceptor and returns either its
     * value or, if it reported an error through the channel, the recovery's.
     */
    template <typename... Params>
    auto maybe(Params&&... params) {
        static_assert(sizeof...(Params) >= 2, "Both a generator and a recovery function need to be specified");
        auto packed = std::forward_as_tuple(std::forward<Params>(params)...);
        return detail::call_packed(packed, std::make_index_sequence<(sizeof...(Params) >= 2 ? sizeof...(Params) - 2 : 0)>{});
    }

} // namespace maybe

#endif // MAYBE_MAYBE_HPP
