#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/EventLoop.h"
#include "relay/network/InetAddress.h"
#include "relay/network/Resolver.h"
#include "relay/network/TlsContext.h"
#include "relay/protocol/HttpServer.h"
#include "relay/service/CorsPolicy.h"
#include "relay/service/RelayHandler.h"
#include "relay/service/UpstreamFetcher.h"

#include <string>

namespace relay {

namespace protocol {
class HttpRequest;
} // namespace protocol

// HTTP front end of the download relay: routes POST /proxy-download to the
// relay handler, answers everything else the way a typical web framework
// does and applies the CORS policy to every response.
class RelayServer : relay::common::noncopyable {
public:
    static const char* const kDownloadPath;

    struct Options {
        int threads{0};          // I/O loops besides the accepting one
        int resolverThreads{4};
        bool tlsVerify{true};
        std::string caFile;
        service::UpstreamFetcher::Options upstream;
    };

    RelayServer(network::EventLoop* loop,
                const network::InetAddress& listenAddr,
                Options options,
                const std::string& name = "RelayServer");
    ~RelayServer();

    // False when the listener could not be set up.
    bool ok() const { return server_.ok(); }
    bool tlsReady() const { return tls_.ok(); }
    const std::string& hostport() const { return server_.hostport(); }

    void Start();

private:
    void OnRequest(const protocol::HttpRequest& req, const protocol::HttpServer::Responder& respond);
    void HandleDownload(const protocol::HttpRequest& req, const protocol::HttpServer::Responder& respond);

    Options options_;
    const service::CorsPolicy& cors_;
    network::TlsContext tls_;
    network::Resolver resolver_;
    service::UpstreamFetcher fetcher_;
    service::RelayHandler handler_;
    protocol::HttpServer server_;
};

} // namespace relay
