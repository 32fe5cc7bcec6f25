#pragma once

#include <functional>

namespace drydock {

/**
 * @brief Run `fn`, translating any error it raises into log messages and an exit code.
 *
 * Failures of the project or of its stages give 1, user cancellation gives 2, and anything
 * unexpected gives 42.
 */
int handle_cli_errors(std::function<int()> fn) noexcept;

}  // namespace drydock
