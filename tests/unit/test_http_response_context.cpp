#include "relay/protocol/HttpResponseContext.h"
#include "relay/common/Logger.h"

#include <cassert>
#include <cstring>
#include <string>

using namespace relay::protocol;
using namespace relay::common;

static bool feedStr(HttpResponseContext* ctx, const std::string& s) {
    return ctx->feed(s.data(), s.size());
}

void testContentLengthByteByByte() {
    std::string wire =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/octet-stream\r\n"
        "Content-Length: 5\r\n"
        "\r\n";
    wire.append("a\0b\r\n", 5);

    HttpResponseContext ctx;
    for (size_t i = 0; i + 1 < wire.size(); ++i) {
        assert(!ctx.feed(wire.data() + i, 1));
    }
    assert(ctx.feed(wire.data() + wire.size() - 1, 1));
    assert(ctx.gotAll());
    assert(ctx.statusCode() == 200);
    assert(ctx.reasonPhrase() == "OK");
    assert(ctx.getHeader("content-type") == "application/octet-stream");
    assert(ctx.body() == std::string("a\0b\r\n", 5));
    LOG_INFO << "Content-Length Byte By Byte PASS";
}

void testChunked() {
    HttpResponseContext ctx;
    assert(!feedStr(&ctx, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nWiki\r\n"));
    assert(!feedStr(&ctx, "5;name=v\r\npedia\r\nE\r\n in\r\n\r\nchunks.\r\n"));
    assert(feedStr(&ctx, "0\r\nExpires: never\r\n\r\n"));
    assert(ctx.body() == "Wikipedia in\r\n\r\nchunks.");
    LOG_INFO << "Chunked PASS";
}

void testReadUntilClose() {
    HttpResponseContext ctx;
    assert(!feedStr(&ctx, "HTTP/1.0 200 OK\nContent-Type: text/plain\n\nhello "));
    assert(!feedStr(&ctx, "world"));
    assert(ctx.needsCloseToFinish());
    assert(ctx.finishOnClose());
    assert(ctx.gotAll());
    assert(ctx.body() == "hello world");
    LOG_INFO << "Read Until Close PASS";
}

void testInterimAndBodiless() {
    HttpResponseContext ctx;
    assert(!feedStr(&ctx, "HTTP/1.1 100 Continue\r\n\r\n"));
    assert(feedStr(&ctx, "HTTP/1.1 204 No Content\r\nContent-Length: 10\r\n\r\n"));
    assert(ctx.statusCode() == 204);
    assert(ctx.body().empty());

    HttpResponseContext notFound;
    assert(feedStr(&notFound, "HTTP/1.1 404 Not Found\r\nContent-Length: 10, 10\r\n\r\nnot found!"));
    assert(notFound.statusCode() == 404);
    assert(notFound.body() == "not found!");
    LOG_INFO << "Interim And Bodiless PASS";
}

void testErrors() {
    HttpResponseContext none;
    assert(!none.finishOnClose());
    assert(none.error() == HttpResponseContext::Error::kNoResponse);

    HttpResponseContext garbage;
    assert(!feedStr(&garbage, "SSH-2.0-OpenSSH_8.9\r\n"));
    assert(garbage.hasError());
    assert(garbage.error() == HttpResponseContext::Error::kMalformed);

    HttpResponseContext truncated;
    assert(!feedStr(&truncated, "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort"));
    assert(!truncated.finishOnClose());
    assert(truncated.error() == HttpResponseContext::Error::kIncompleteBody);

    HttpResponseContext badChunk;
    assert(!feedStr(&badChunk, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nxyz\r\n"));
    assert(badChunk.error() == HttpResponseContext::Error::kMalformed);

    HttpResponseContext chunkCut;
    assert(!feedStr(&chunkCut, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nab"));
    assert(!chunkCut.finishOnClose());
    assert(chunkCut.error() == HttpResponseContext::Error::kIncompleteBody);

    HttpResponseContext hugeChunk;
    assert(!feedStr(&hugeChunk, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n10000000000000000\r\nab"));
    assert(hugeChunk.error() == HttpResponseContext::Error::kMalformed);

    HttpResponseContext maxChunk;
    assert(!feedStr(&maxChunk, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nffffffffffffffff\r\nab"));
    assert(maxChunk.error() == HttpResponseContext::Error::kMalformed);

    HttpResponseContext badLength;
    assert(!feedStr(&badLength, "HTTP/1.1 200 OK\r\nContent-Length: abc\r\n\r\n"));
    assert(badLength.error() == HttpResponseContext::Error::kMalformed);
    LOG_INFO << "Response Errors PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testContentLengthByteByByte();
    testChunked();
    testReadUntilClose();
    testInterimAndBodiless();
    testErrors();
    return 0;
}
