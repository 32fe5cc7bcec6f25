#pragma once

#include <neo/pp.hpp>

#include <boost/leaf/on_error.hpp>

/**
 * @brief Load the given error object into any error that leaves the enclosing scope, by exception
 * or by a failing result<>. The expression is evaluated only if that happens.
 */
#define DRYDOCK_E_SCOPE(...)                                                                       \
    auto NEO_CONCAT(_drydock_e_scope_, __LINE__)                                                   \
        = ::boost::leaf::on_error([&] { return __VA_ARGS__; })
