#include <netrelay/netrelay.hpp>

#include <csignal>
#include <iostream>

int main(int argc, char **argv) {
    // Standard output carries relayed data only; status lines go to standard error
    auto data_out_res = netrelay::divert_fd(STDOUT_FILENO, STDERR_FILENO);
    if (data_out_res.is_err()) {
        std::cerr << data_out_res.error().message.c_str() << std::endl;
        return 1;
    }

    auto options_res = netrelay::parse_options(argc, argv);
    if (options_res.is_err()) {
        echo::error(options_res.error().message.c_str());
        std::cerr << netrelay::usage();
        return 1;
    }

    auto options = options_res.value();
    if (options.help) {
        std::cerr << netrelay::usage();
        return 0;
    }

    auto config_res = netrelay::make_config(options);
    if (config_res.is_err()) {
        echo::error(config_res.error().message.c_str());
        std::cerr << netrelay::usage();
        return 1;
    }

    // A peer or reader going away must show up as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    auto config = config_res.value();
    echo::debug("starting in ", netrelay::mode_name(config.mode), " mode");

    netrelay::FdReader local_in(STDIN_FILENO);
    netrelay::FdWriter local_out(data_out_res.value());
    auto res = netrelay::relay(config, local_in, local_out);
    if (res.is_err()) {
        echo::error(res.error().message.c_str());
        return 1;
    }

    return 0;
}
