#pragma once

#include <boost/leaf.hpp>

#include <tuple>
#include <type_traits>

namespace drydock {

/**
 * @brief A try-block paired with the handlers that were chained onto it with `drydock_leaf_catch`.
 * Evaluating the sequence runs boost::leaf::try_catch (or try_handle_all for result-returning
 * blocks).
 */
template <typename Try, typename... Handlers>
struct leaf_try_sequence {
    using result_type = std::invoke_result_t<Try>;

    Try&                     try_block;
    std::tuple<Handlers&...> handlers{};

    template <typename Catch>
    constexpr auto operator*(Catch c) const noexcept {
        return leaf_try_sequence<Try, Handlers..., typename Catch::handler_type>{
            try_block, std::tuple_cat(handlers, std::tie(c.handler))};
    }

    decltype(auto) run() const {
        static_assert(sizeof...(Handlers) != 0,
                      "drydock_leaf_try requires at least one drydock_leaf_catch block");
        return std::apply(
            [&](auto&... hs) {
                if constexpr (boost::leaf::is_result_type<result_type>::value) {
                    return boost::leaf::try_handle_all(try_block, hs...);
                } else {
                    return boost::leaf::try_catch(try_block, hs...);
                }
            },
            handlers);
    }
};

struct leaf_try_start {
    template <typename Func>
    constexpr auto operator->*(Func&& block) const {
        return leaf_try_sequence<Func>{block};
    }
};

template <typename H>
struct leaf_catch_handler {
    using handler_type = H;
    handler_type& handler;
};

struct leaf_catch_start {
    template <typename Func>
    constexpr auto operator->*(Func&& block) const {
        return leaf_catch_handler<std::remove_cvref_t<Func>>{block};
    }
};

struct leaf_try_runner {
    template <typename Try, typename... Handlers>
    decltype(auto) operator+(const leaf_try_sequence<Try, Handlers...>& seq) const {
        return seq.run();
    }
};

using boost::leaf::catch_;

}  // namespace drydock

/**
 * @brief Open a try {} block whose errors are handled by the following drydock_leaf_catch blocks
 */
#define drydock_leaf_try ::drydock::leaf_try_runner{} + ::drydock::leaf_try_start{}->*[&]()

/**
 * @brief Add an error handler to a drydock_leaf_try block
 */
#define drydock_leaf_catch *::drydock::leaf_catch_start{}->*[&]

#define drydock_leaf_catch_all                                                                     \
    drydock_leaf_catch(::boost::leaf::verbose_diagnostic_info const& diagnostic_info [[maybe_unused]])
