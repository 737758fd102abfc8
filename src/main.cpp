#include <iostream>
#include <vector>
#include <string>
#include "cli/devstrip_cli.hpp"
#include "cli/theme.hpp"
#include "core/log.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        auto opts = parse_args(args);
        if (opts.is_err()) {
            std::cout << theme::fail(opts.error);
            std::cout << theme::step("Run devstrip --help for usage.");
            return 1;
        }

        DevstripCLI cli;
        return cli.run(opts.value);
    } catch (const std::exception& e) {
        devstrip_log(std::string("fatal: ") + e.what());
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
