#include <LogCompat.hpp>
#include <fmt/format.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "client/LogClient.hpp"
#include "config/ConfigLoader.hpp"
#include "logging/SpdlogInit.hpp"

namespace {

int runLogger(const LogStream::LoggerOptions& options) {
    LogStream::LogClient client(options.client);
    if (auto status = client.connect(); !status.ok()) {
        // Lines are queued until the runner gets through or flush gives up.
        LOG(WARNING) << "Initial connection failed: " << status;
    }

    size_t lines = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (auto status = client.log(options.level, line, options.fields);
            !status.ok()) {
            LOG(ERROR) << "Cannot send entry: " << status;
            return EXIT_FAILURE;
        }
        ++lines;
    }

    const auto flushed = client.flush(options.client.timeout);
    if (!flushed.ok()) {
        LOG(ERROR) << "Flush failed: " << flushed;
    }
    const size_t dropped = client.dropped();
    client.close();
    if (dropped != 0) {
        LOG(ERROR) << fmt::format("{} of {} entries were dropped", dropped,
                                  lines);
        return EXIT_FAILURE;
    }
    return flushed.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}

}  // namespace

int main(int argc, char** argv) {
    LogStream_SpdlogInit();

    auto options = LogStream::parseLoggerCommandLine(argc, argv);
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

    const int rc = runLogger(*options);
    LogStream_SpdlogDeInit();
    return rc;
}
