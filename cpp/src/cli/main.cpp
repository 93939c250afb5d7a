#include "bundl/cli/commands.hpp"

int main(int argc, char** argv) {
    const bundl::cli::CliArgs args{argc > 0 ? argv + 1 : argv, argc > 0 ? static_cast<bundl::cli::u32>(argc - 1) : 0u};
    return bundl::cli::cli_main(args);
}
