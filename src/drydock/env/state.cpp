#include "./state.hpp"

#include <magic_enum.hpp>

std::string_view drydock::to_string(service_state s) noexcept { return magic_enum::enum_name(s); }
