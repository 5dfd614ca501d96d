#include "relay/protocol/HttpContext.h"
#include "relay/protocol/HttpResponse.h"
#include "relay/network/Buffer.h"
#include "relay/common/Logger.h"

#include <cassert>
#include <string>

using namespace relay::protocol;
using namespace relay::network;
using namespace relay::common;

void testBufferReclaimsConsumedBytes() {
    Buffer buf;
    const std::string big(10000, 'x');
    buf.Append(big);
    buf.Append("\r\ntail");
    assert(buf.ReadableBytes() == big.size() + 6);

    buf.Retrieve(9000);
    assert(buf.ReadableBytes() == 1006);
    assert(buf.FindCRLF() == buf.Peek() + 1000);

    // Appending after a large consumed prefix must keep the readable bytes intact.
    buf.Append("\r\nmore");
    assert(buf.ReadableBytes() == 1012);
    assert(buf.FindCRLF() == buf.Peek() + 1000);
    buf.RetrieveUntil(buf.FindCRLF() + 2);
    assert(buf.RetrieveAllAsString() == "tail\r\nmore");
    assert(buf.ReadableBytes() == 0);
    assert(buf.FindCRLF() == nullptr);

    buf.Append("ab");
    buf.Retrieve(5);
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Buffer Reclaims Consumed Bytes PASS";
}

void testParseRequest() {
    HttpContext context;
    Buffer buf;

    // Partial arrival
    buf.Append("POST /proxy-download?id=123 HTTP/1.1\r\nHost: ");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(!context.gotAll());

    buf.Append("localhost\r\ncontent-type: application/json\r\nAccept: */*\r\n\r\n");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());

    const HttpRequest& req = context.request();
    assert(req.getMethod() == HttpRequest::kPost);
    assert(req.methodString() == "POST");
    assert(req.getVersion() == HttpRequest::kHttp11);
    assert(req.path() == "/proxy-download");
    assert(req.query() == "?id=123");
    assert(req.getHeader("Host") == "localhost");
    assert(req.getHeader("Content-Type") == "application/json");
    assert(req.hasHeader("ACCEPT"));
    assert(req.body().empty());
    LOG_INFO << "Parse Request PASS";
}

void testParseContentLengthBody() {
    HttpContext context;
    Buffer buf;
    buf.Append("POST /proxy-download HTTP/1.1\r\n"
               "Host: localhost\r\n"
               "Content-Length: 13\r\n"
               "\r\n"
               "{\"url\":\"x\"}");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(!context.gotAll());
    buf.Append("\r\n");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    assert(context.request().body() == "{\"url\":\"x\"}\r\n");
    LOG_INFO << "Parse Content-Length Body PASS";
}

void testParseChunkedBody() {
    HttpContext context;
    Buffer buf;
    buf.Append("POST /chunk HTTP/1.1\r\n"
               "Host: localhost\r\n"
               "Transfer-Encoding: chunked\r\n"
               "\r\n"
               "5;ext=1\r\n"
               "hello\r\n"
               "6\r\n"
               " world\r\n"
               "0\r\n"
               "X-Trailer: t\r\n"
               "\r\n");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    assert(context.request().body() == "hello world");
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Parse Chunked Body PASS";
}

void testPipelinedRequestsConsumedOneAtATime() {
    HttpContext context;
    Buffer buf;
    buf.Append("GET /a HTTP/1.1\r\nHost: h\r\n\r\n"
               "\r\n"
               "GET /b HTTP/1.0\r\nHost: h\r\n\r\n");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    assert(context.request().path() == "/a");
    assert(buf.ReadableBytes() > 0);

    context.reset();
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    assert(context.request().path() == "/b");
    assert(context.request().getVersion() == HttpRequest::kHttp10);
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Pipelined Requests PASS";
}

void testRepeatedHeadersJoined() {
    HttpContext context;
    Buffer buf;
    buf.Append("OPTIONS /x HTTP/1.1\r\n"
               "Access-Control-Request-Headers: content-type\r\n"
               "access-control-request-headers: x-token\r\n"
               "\r\n");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    assert(context.request().getMethod() == HttpRequest::kOptions);
    assert(context.request().getHeader("Access-Control-Request-Headers") == "content-type, x-token");
    LOG_INFO << "Repeated Headers PASS";
}

void testMalformedRequests() {
    {
        HttpContext context;
        Buffer buf;
        buf.Append("GARBAGE\r\n\r\n");
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("GET / HTTP/2.0\r\n\r\n");
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nContent-Length: -1\r\n\r\n");
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n");
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n");
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n");
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    {
        // Sizes that do not fit in 64 bits are rejected.
        HttpContext context;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nffffffffffffffff\r\nab");
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n00000000000000001\r\nab");
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    {
        // A near-maximal size just waits for more data.
        HttpContext context;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nfffffffffffffffe\r\nab");
        assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
        assert(!context.gotAll());
        assert(context.request().body().empty());
        buf.Append("\r\n");
        assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
        assert(!context.gotAll());
    }
    LOG_INFO << "Malformed Requests PASS";
}

void testResponseGen() {
    HttpResponse resp(true);
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setContentType("text/plain");
    resp.addHeader("Cache-Control", "no-cache");
    resp.setBody("Hello World");

    Buffer buf;
    resp.appendToBuffer(&buf);
    const std::string output = buf.RetrieveAllAsString();
    assert(output ==
           "HTTP/1.1 200 OK\r\n"
           "Connection: close\r\n"
           "Content-Length: 11\r\n"
           "Content-Type: text/plain\r\n"
           "Cache-Control: no-cache\r\n"
           "\r\n"
           "Hello World");
    LOG_INFO << "Response Gen PASS";
}

void testResponseRelayedStatuses() {
    HttpResponse resp;
    resp.setStatusCode(418);
    resp.setContentType("application/json");
    resp.setContentType("application/json; v=2");
    assert(resp.headers().size() == 1);
    assert(resp.getHeader("content-type") == "application/json; v=2");
    resp.setBody("{\"error\": \"HTTP 418\"}");
    Buffer buf;
    resp.appendToBuffer(&buf);
    std::string out = buf.RetrieveAllAsString();
    assert(out.compare(0, 28, "HTTP/1.1 418 I'm a Teapot\r\nC") == 0);
    assert(out.find("Connection: keep-alive\r\n") != std::string::npos);
    assert(out.find("Content-Length: 21\r\n") != std::string::npos);

    HttpResponse unknown;
    unknown.setStatusCode(599);
    unknown.appendToBuffer(&buf);
    out = buf.RetrieveAllAsString();
    assert(out.compare(0, 15, "HTTP/1.1 599 \r\n") == 0);

    HttpResponse notModified;
    notModified.setStatusCode(304);
    notModified.setBody("{\"error\": \"HTTP 304\"}");
    notModified.appendToBuffer(&buf);
    out = buf.RetrieveAllAsString();
    assert(out.find("Content-Length") == std::string::npos);
    assert(out.find("HTTP 304\"}") == std::string::npos);

    HttpResponse head;
    head.setBody("abc");
    head.appendToBuffer(&buf, false);
    out = buf.RetrieveAllAsString();
    assert(out.find("Content-Length: 3\r\n") != std::string::npos);
    assert(out.size() >= 4 && out.compare(out.size() - 4, 4, "\r\n\r\n") == 0);

    assert(std::string(HttpResponse::ReasonPhrase(422)) == "Unprocessable Content");
    LOG_INFO << "Relayed Statuses PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testBufferReclaimsConsumedBytes();
    testParseRequest();
    testParseContentLengthBody();
    testParseChunkedBody();
    testPipelinedRequestsConsumedOneAtATime();
    testRepeatedHeadersJoined();
    testMalformedRequests();
    testResponseGen();
    testResponseRelayedStatuses();
    return 0;
}
