#include "ingest/IngestServer.h"
#include "ingest/common/Config.h"
#include "ingest/common/Logger.h"
#include "ingest/common/ServerConfig.h"
#include "ingest/pipeline/EventQueue.h"

#include <getopt.h>
#include <signal.h>
#include <unistd.h>

#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

const size_t kQueueCapacity = 1024;

void PrintUsage(const char* prog) {
    printf("Usage: %s [-c config_file] [-C] [-h]\n", prog);
    printf("  -c  INI configuration file (default: built-in defaults)\n");
    printf("  -C  check config and exit\n");
    printf("  -h  show this help\n");
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace ingest;

    std::string configFile;
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            default:
                PrintUsage(argv[0]);
                return 1;
        }
    }

    // stdout carries events; logs go to stderr.
    common::Logger::Instance().SetStream(&std::cerr);
    common::Logger::Instance().SetColored(isatty(STDERR_FILENO) != 0);

    common::IniConfig ini;
    if (!configFile.empty() && !ini.Load(configFile)) {
        LOG_ERROR << "Failed to load config file " << configFile;
        return 1;
    }

    common::ServerConfig config;
    try {
        config = common::ServerConfig::FromIni(ini);
    } catch (const common::ConfigurationError& e) {
        LOG_ERROR << "Invalid configuration: " << e.what();
        return 1;
    }
    common::Logger::Instance().SetLevel(common::Logger::ParseLevel(config.logLevel));

    // Block the stop signals before any thread starts so only sigwait sees them.
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);
    signal(SIGPIPE, SIG_IGN);

    pipeline::BoundedEventQueue queue(kQueueCapacity);
    std::unique_ptr<IngestServer> server;
    try {
        server.reset(new IngestServer(config, &queue));
    } catch (const common::ConfigurationError& e) {
        LOG_ERROR << "Invalid configuration: " << e.what();
        return 1;
    }

    if (checkOnly) {
        printf("OK\n");
        return 0;
    }

    std::thread consumer([&queue]() {
        codec::Event event;
        while (queue.Pop(&event)) {
            std::cout << event.ToJson() << '\n';
            std::cout.flush();
        }
    });

    try {
        server->Start();
    } catch (const std::exception& e) {
        LOG_ERROR << "Failed to start: " << e.what();
        queue.Close();
        consumer.join();
        return 1;
    }

    int sig = 0;
    if (sigwait(&stopSignals, &sig) != 0) {
        LOG_ERROR << "sigwait failed, shutting down";
    } else {
        LOG_INFO << "Received signal " << sig << ", shutting down";
    }

    server->Stop();
    queue.Close();
    consumer.join();
    LOG_INFO << "Bye";
    return 0;
}
