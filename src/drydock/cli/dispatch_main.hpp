#pragma once

namespace drydock::cli {

struct options;

int dispatch_main(const options&) noexcept;

}  // namespace drydock::cli
