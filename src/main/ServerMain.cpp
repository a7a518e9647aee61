#include <LogCompat.hpp>
#include <fmt/format.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <utility>

#include "config/ConfigLoader.hpp"
#include "logging/SpdlogInit.hpp"
#include "server/LogServer.hpp"

int main(int argc, char** argv) {
    LogStream_SpdlogInit();

    auto options = LogStream::parseServerCommandLine(argc, argv);
    if (!options.ok()) {
        LOG(ERROR) << options.status();
        LogStream_SpdlogDeInit();
        return EXIT_FAILURE;
    }
    if (options->showHelp) {
        std::cout << options->usage << std::endl;
        LogStream_SpdlogDeInit();
        return EXIT_SUCCESS;
    }
    LogStream_SpdlogInit(options->verbose);

    int rc = EXIT_SUCCESS;
    {
        LogStream::LogServer server(std::move(options->config));
        if (auto status = server.start(); !status.ok()) {
            LOG(ERROR) << "Cannot start server: " << status;
            rc = EXIT_FAILURE;
        } else {
            boost::asio::io_context signalContext;
            boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
            signals.async_wait(
                [](const boost::system::error_code& ec, int signo) {
                    if (!ec) {
                        LOG(INFO) << fmt::format("Received signal {}", signo);
                    }
                });
            signalContext.run();
            server.stop();
        }
    }
    LogStream_SpdlogDeInit();
    return rc;
}
