#include "relay/RelayServer.h"
#include "relay/common/Logger.h"
#include "relay/protocol/HttpRequest.h"
#include "relay/protocol/HttpResponse.h"
#include "relay/service/ProxyRequest.h"

#include <memory>
#include <utility>
#include <vector>

namespace relay {

using protocol::HttpRequest;
using protocol::HttpResponse;
using protocol::HttpServer;

const char* const RelayServer::kDownloadPath = "/proxy-download";

namespace {

HttpResponse DetailResponse(int status, const char* detail) {
    HttpResponse resp;
    resp.setStatusCode(status);
    resp.setContentType("application/json");
    resp.setBody(std::string("{\"detail\":\"") + detail + "\"}");
    return resp;
}

const char* VersionString(HttpRequest::Version v) {
    return v == HttpRequest::kHttp10 ? "HTTP/1.0" : "HTTP/1.1";
}

} // namespace

RelayServer::RelayServer(network::EventLoop* loop,
                         const network::InetAddress& listenAddr,
                         Options options,
                         const std::string& name)
    : options_(std::move(options)),
      cors_(service::CorsPolicy::AllowAll()),
      resolver_(options_.resolverThreads),
      fetcher_(&resolver_, &tls_, options_.upstream),
      handler_(&fetcher_),
      server_(loop, listenAddr, name) {
    if (!tls_.InitClient(options_.tlsVerify, options_.caFile)) {
        LOG_ERROR << "RelayServer: TLS client context unavailable, https downloads will fail";
    }
    server_.setThreadNum(options_.threads);
    server_.setHttpCallback([this](const HttpRequest& req, const HttpServer::Responder& respond) {
        OnRequest(req, respond);
    });
}

RelayServer::~RelayServer() {
    // Resolver workers post back into the I/O loops; stop them while the loops still exist.
    resolver_.Stop();
}

void RelayServer::Start() {
    LOG_INFO << "RelayServer: upstream timeout " << options_.upstream.timeoutSec
             << "s, tls verify " << (options_.tlsVerify ? "on" : "off")
             << ", " << options_.threads << " I/O threads";
    server_.start();
}

void RelayServer::OnRequest(const HttpRequest& req, const HttpServer::Responder& respond) {
    // Everything the CORS decoration and access log need once the reply is ready.
    auto summary = std::make_shared<HttpRequest>();
    for (const auto& kv : req.headers()) summary->setHeader(kv.first, kv.second);
    const std::string line = req.methodString() + " " + req.path() + req.query() + " " +
                             VersionString(req.getVersion());
    const service::CorsPolicy& cors = cors_;

    HttpServer::Responder reply = [summary, line, &cors, respond](HttpResponse resp) {
        cors.apply(*summary, &resp);
        LOG_INFO << "\"" << line << "\" " << resp.statusCode() << " " << HttpResponse::ReasonPhrase(resp.statusCode());
        respond(std::move(resp));
    };

    if (cors_.isPreflight(req)) {
        HttpResponse resp = cors_.preflightResponse(req);
        LOG_INFO << "\"" << line << "\" " << resp.statusCode() << " " << HttpResponse::ReasonPhrase(resp.statusCode());
        respond(std::move(resp));
        return;
    }

    if (req.path() != kDownloadPath) {
        reply(DetailResponse(HttpResponse::k404NotFound, "Not Found"));
        return;
    }
    if (req.getMethod() != HttpRequest::kPost) {
        HttpResponse resp = DetailResponse(HttpResponse::k405MethodNotAllowed, "Method Not Allowed");
        resp.setHeader("Allow", "POST");
        reply(std::move(resp));
        return;
    }
    HandleDownload(req, reply);
}

void RelayServer::HandleDownload(const HttpRequest& req, const HttpServer::Responder& respond) {
    service::ProxyRequest proxyReq;
    std::vector<service::ValidationIssue> issues;
    if (!service::ProxyRequest::Decode(req.getHeader("Content-Type"), req.body(), &proxyReq, &issues)) {
        HttpResponse resp;
        resp.setStatusCode(HttpResponse::k422UnprocessableEntity);
        resp.setContentType("application/json");
        resp.setBody(service::RenderValidationErrors(issues));
        respond(std::move(resp));
        return;
    }

    network::EventLoop* loop = network::EventLoop::GetEventLoopOfCurrentThread();
    if (!loop) loop = server_.getLoop();
    handler_.Handle(loop, proxyReq, respond);
}

} // namespace relay
