#include "relay/RelayServer.h"
#include "relay/network/EventLoop.h"
#include "relay/network/InetAddress.h"
#include "relay/common/Logger.h"
#include "relay/common/Config.h"

#include <getopt.h>
#include <signal.h>
#include <unistd.h>

#include <cstdio>
#include <string>

namespace {

relay::network::EventLoop* g_loop = nullptr;

void OnTerminate(int) {
    if (g_loop) g_loop->Quit();
}

void PrintUsage(const char* prog) {
    printf("Usage: %s [-c config_file] [-C]\n", prog);
    printf("  -c  INI config file (defaults are used when omitted)\n");
    printf("  -C  check config and exit\n");
}

// Returns an empty string when the settings are usable, else the first problem found.
std::string CheckSettings(relay::common::Config& conf) {
    const int port = conf.GetInt("global", "listen_port", 8000);
    if (port < 0 || port > 65535) return "global.listen_port out of range";
    if (conf.GetInt("global", "threads", 0) < 0) return "global.threads must be >= 0";
    if (conf.GetInt("global", "resolver_threads", 4) < 1) return "global.resolver_threads must be >= 1";
    const std::string host = conf.GetString("global", "listen_host", "0.0.0.0");
    if (!relay::network::InetAddress(host, static_cast<uint16_t>(port)).valid()) {
        return "global.listen_host is not a numeric address";
    }
    const std::string caFile = conf.GetString("upstream", "ca_file", "");
    if (!caFile.empty() && ::access(caFile.c_str(), R_OK) != 0) return "upstream.ca_file is not readable";
    return std::string();
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace relay;

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
                return 2;
        }
    }

    auto& conf = common::Config::Instance();
    if (!configFile.empty() && !conf.Load(configFile)) {
        if (checkOnly) {
            fprintf(stderr, "cannot read %s\n", configFile.c_str());
            return 1;
        }
        LOG_ERROR << "Failed to load config " << configFile << ", using defaults.";
    }

    const std::string problem = CheckSettings(conf);
    if (checkOnly) {
        if (!problem.empty()) {
            fprintf(stderr, "%s\n", problem.c_str());
            return 1;
        }
        printf("OK\n");
        return 0;
    }
    if (!problem.empty()) {
        LOG_FATAL << "Invalid configuration: " << problem;
        return 1;
    }

    common::Logger::Instance().SetLevel(
        common::Logger::Instance().ParseLevel(conf.GetString("global", "log_level", "INFO")));

    const std::string host = conf.GetString("global", "listen_host", "0.0.0.0");
    const uint16_t port = static_cast<uint16_t>(conf.GetInt("global", "listen_port", 8000));

    RelayServer::Options options;
    options.threads = conf.GetInt("global", "threads", 0);
    options.resolverThreads = conf.GetInt("global", "resolver_threads", 4);
    options.tlsVerify = conf.GetInt("upstream", "tls_verify", 1) != 0;
    options.caFile = conf.GetString("upstream", "ca_file", "");

    ::signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;
    RelayServer server(&loop, network::InetAddress(host, port), options, "SyftBoxRelay");
    if (!server.ok()) {
        LOG_FATAL << "Cannot listen on " << host << ":" << port;
        return 1;
    }

    g_loop = &loop;
    ::signal(SIGINT, OnTerminate);
    ::signal(SIGTERM, OnTerminate);

    server.Start();
    LOG_INFO << "SyftBox relay running on " << server.hostport();
    loop.Loop();

    g_loop = nullptr;
    LOG_INFO << "SyftBox relay stopped";
    return 0;
}
