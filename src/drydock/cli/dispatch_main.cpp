#include "./dispatch_main.hpp"

#include "./error_handler.hpp"
#include "./options.hpp"

#include <drydock/error/on_error.hpp>

#include <neo/utility.hpp>

using namespace drydock;

namespace drydock::cli {

namespace cmd {
using command = int(const options&);

command build;
command clean;
command test;
command run;
command ls;

}  // namespace cmd

int dispatch_main(const options& opts) noexcept {
    return drydock::handle_cli_errors([&] {
        DRYDOCK_E_SCOPE(opts.subcommand);
        switch (opts.subcommand) {
        case subcommand::build:
            return cmd::build(opts);
        case subcommand::clean:
            return cmd::clean(opts);
        case subcommand::test:
            return cmd::test(opts);
        case subcommand::run:
            return cmd::run(opts);
        case subcommand::ls:
            return cmd::ls(opts);
        case subcommand::_none_:;
        }
        neo::unreachable();
        return 6;
    });
}

}  // namespace drydock::cli
