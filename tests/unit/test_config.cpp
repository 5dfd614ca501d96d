#include "relay/common/Config.h"
#include "relay/common/Logger.h"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace relay::common;

void testLoadFromString() {
    Config& conf = Config::Instance();
    assert(conf.LoadFromString(
        "# relay settings\n"
        "listen_port = 9000\n"
        "  log_level=DEBUG  \n"
        "\n"
        "[upstream]\n"
        "; comment\n"
        "ca_file = /etc/ssl/certs/ca bundle.pem\n"
        "tls_verify = zero\n"
        "not a setting line\n"));

    assert(conf.GetInt("global", "listen_port", 8000) == 9000);
    assert(conf.GetString("global", "log_level") == "DEBUG");
    assert(Logger::Instance().ParseLevel(conf.GetString("global", "log_level")) == LogLevel::DEBUG);
    assert(Logger::Instance().ParseLevel("warning") == LogLevel::WARN);
    assert(Logger::Instance().ParseLevel("verbose") == LogLevel::INFO);
    assert(conf.GetString("upstream", "ca_file") == "/etc/ssl/certs/ca bundle.pem");

    // Missing or malformed values fall back to the default.
    assert(conf.GetInt("global", "threads", 3) == 3);
    assert(conf.GetInt("upstream", "tls_verify", 1) == 1);
    assert(conf.GetString("nosuch", "key", "dflt") == "dflt");
    LOG_INFO << "Load From String PASS";
}

void testReloadReplacesSettings() {
    Config& conf = Config::Instance();
    assert(conf.LoadFromString("[upstream]\ntls_verify = 0\n"));
    assert(conf.GetInt("global", "listen_port", 8000) == 8000);
    assert(conf.GetInt("upstream", "tls_verify", 1) == 0);

    conf.SetString("global", "threads", "2");
    conf.SetString("", "ignored", "x");
    assert(conf.GetInt("global", "threads", 0) == 2);

    const std::string dump = conf.DumpIni();
    assert(dump == "[global]\nthreads = 2\n\n[upstream]\ntls_verify = 0\n\n");
    LOG_INFO << "Reload Replaces Settings PASS";
}

void testLoadFile() {
    Config& conf = Config::Instance();
    char path[] = "/tmp/relay_config_XXXXXX";
    int fd = ::mkstemp(path);
    assert(fd >= 0);
    ::close(fd);
    {
        std::ofstream out(path);
        out << "[global]\nlisten_host = 127.0.0.1\nresolver_threads = 2\n";
    }
    assert(conf.Load(path));
    assert(conf.LoadedFilename() && *conf.LoadedFilename() == path);
    assert(conf.GetString("global", "listen_host") == "127.0.0.1");
    assert(conf.GetInt("global", "resolver_threads", 4) == 2);
    std::remove(path);

    assert(!conf.Load("/nonexistent/relay.ini"));
    // A failed load keeps the previous settings.
    assert(conf.GetInt("global", "resolver_threads", 4) == 2);
    LOG_INFO << "Load File PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testLoadFromString();
    testReloadReplacesSettings();
    testLoadFile();
    return 0;
}
