// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: test_protocol.cpp
//  描述: Protocol模块单元测试
//  版权: Copyright (c) 2026
// =============================================================================

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <unistd.h>
#include <sys/stat.h>
#include "protocol/protocol_types.hpp"
#include "protocol/protocol_utils.hpp"
#include "protocol/status_code.hpp"
#include "protocol/header_map.hpp"
#include "protocol/body.hpp"
#include "protocol/url.hpp"
#include "protocol/http_message.hpp"
#include "protocol/http_encoder.hpp"
#include "protocol/http_parser.hpp"

using namespace sync_http_client;
using namespace sync_http_client::protocol;
using utils::ErrorCode;
using utils::Result;

namespace {

std::string to_string(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

HttpRequest build_request(Method method, const std::string& uri, Body body = Body::empty()) {
    Result<HttpRequest> r = RequestBuilder().method(method).uri(uri).body(std::move(body));
    EXPECT_TRUE(r.is_ok()) << r.error_message();
    return r.take_value();
}

std::string encode_to_string(const HttpRequest& request) {
    Result<std::vector<uint8_t>> bytes = HttpEncoder::encode(request);
    EXPECT_TRUE(bytes.is_ok()) << bytes.error_message();
    return to_string(bytes.value());
}

// 拆分请求头，测试用
struct DecodedHead {
    std::string method;
    std::string target;
    std::string version;
    std::vector<HeaderField> headers;
    std::string rest;
};

DecodedHead decode_request_head(const std::string& wire) {
    DecodedHead head;
    size_t end = wire.find("\r\n\r\n");
    EXPECT_NE(end, std::string::npos);
    std::string block = wire.substr(0, end + 2);
    head.rest = wire.substr(end + 4);

    size_t line_end = block.find("\r\n");
    std::string request_line = block.substr(0, line_end);
    size_t sp1 = request_line.find(' ');
    size_t sp2 = request_line.rfind(' ');
    head.method = request_line.substr(0, sp1);
    head.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    head.version = request_line.substr(sp2 + 1);

    size_t pos = line_end + 2;
    while (pos < block.size()) {
        size_t next = block.find("\r\n", pos);
        std::string line = block.substr(pos, next - pos);
        size_t colon = line.find(':');
        head.headers.emplace_back(line.substr(0, colon), TrimOws(line.substr(colon + 1)));
        pos = next + 2;
    }
    return head;
}

size_t count_header(const DecodedHead& head, const std::string& name) {
    size_t n = 0;
    for (const auto& field : head.headers) {
        if (EqualsIgnoreCase(field.name, name)) {
            n++;
        }
    }
    return n;
}

std::string header_value(const DecodedHead& head, const std::string& name) {
    for (const auto& field : head.headers) {
        if (EqualsIgnoreCase(field.name, name)) {
            return field.value;
        }
    }
    return std::string();
}

// 临时文件，析构时删除
class ScopedFile {
public:
    explicit ScopedFile(const std::string& content)
        : path_("/tmp/shc_protocol_test_" + std::to_string(getpid()) + "_" +
                std::to_string(counter_++)) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }
    ~ScopedFile() { std::remove(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    static int counter_;
    std::string path_;
};

int ScopedFile::counter_ = 0;

// 每次只接收有限字节，模拟对端中途失败
class LimitedSink : public ByteSink {
public:
    explicit LimitedSink(size_t limit) : limit_(limit) {}

    Result<void> write(const uint8_t* data, size_t len) override {
        if (written_.size() + len > limit_) {
            return utils::make_err(ErrorCode::IO_ERROR, "sink full");
        }
        written_.append(reinterpret_cast<const char*>(data), len);
        return utils::make_ok();
    }

    const std::string& written() const { return written_; }

private:
    size_t limit_;
    std::string written_;
};

} // namespace

// =============================================================================
// 类型与工具函数
// =============================================================================

TEST(ProtocolTypesTest, MethodTokens) {
    EXPECT_STREQ(method_to_string(Method::GET), "GET");
    EXPECT_STREQ(method_to_string(Method::DELETE_), "DELETE");
    EXPECT_STREQ(method_to_string(Method::OPTIONS), "OPTIONS");

    Result<Method> m = string_to_method("PATCH");
    ASSERT_TRUE(m.is_ok());
    EXPECT_EQ(m.value(), Method::PATCH);
    EXPECT_EQ(string_to_method("get").error_code(), ErrorCode::INVALID_METHOD);
}

TEST(ProtocolTypesTest, Versions) {
    EXPECT_STREQ(version_to_string(Version::HTTP_1_0), "HTTP/1.0");
    EXPECT_STREQ(version_to_string(Version::HTTP_1_1), "HTTP/1.1");
    EXPECT_EQ(parse_version("HTTP/1.1").value(), Version::HTTP_1_1);
    EXPECT_TRUE(parse_version("HTTP/2").is_err());
}

TEST(ProtocolUtilsTest, ListContainsToken) {
    EXPECT_TRUE(ListContainsToken("gzip, Chunked", "chunked"));
    EXPECT_TRUE(ListContainsToken("chunked;foo=bar", "chunked"));
    EXPECT_FALSE(ListContainsToken("notchunked", "chunked"));
    EXPECT_FALSE(ListContainsToken("", "chunked"));
}

// =============================================================================
// StatusCode
// =============================================================================

TEST(StatusCodeTest, RangeIsEnforced) {
    EXPECT_EQ(StatusCode::from(700).error_code(), ErrorCode::INVALID_STATUS_CODE);
    EXPECT_EQ(StatusCode::from(99).error_code(), ErrorCode::INVALID_STATUS_CODE);
    EXPECT_EQ(StatusCode::from(600).error_code(), ErrorCode::INVALID_STATUS_CODE);
    EXPECT_TRUE(StatusCode::from(100).is_ok());
    EXPECT_TRUE(StatusCode::from(599).is_ok());
}

TEST(StatusCodeTest, ClassFromFirstDigit) {
    Result<StatusCode> ok = StatusCode::from(200);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value().status_class(), StatusClass::SUCCESS);
    EXPECT_TRUE(ok.value().is_success());

    EXPECT_TRUE(StatusCode::from(101).value().is_informational());
    EXPECT_TRUE(StatusCode::from(302).value().is_redirection());
    EXPECT_TRUE(StatusCode::from(404).value().is_client_error());
    EXPECT_TRUE(StatusCode::from(503).value().is_server_error());
}

TEST(StatusCodeTest, CanonicalReason) {
    EXPECT_STREQ(StatusCode::from(404).value().canonical_reason(), "Not Found");
    EXPECT_STREQ(StatusCode::from(299).value().canonical_reason(), "");
    EXPECT_EQ(StatusCode::from(204).value(), StatusCode::from(204).value());
}

// =============================================================================
// HeaderMap
// =============================================================================

TEST(HeaderMapTest, AppendKeepsAllValuesInOrder) {
    HeaderMap headers;
    ASSERT_TRUE(headers.append("Accept", "text/html").is_ok());
    ASSERT_TRUE(headers.append("accept", "application/json").is_ok());

    std::vector<std::string> values = headers.get_all("ACCEPT");
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[0], "text/html");
    EXPECT_EQ(values[1], "application/json");

    ASSERT_TRUE(headers.set("Accept", "*/*").is_ok());
    values = headers.get_all("Accept");
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(values[0], "*/*");
}

TEST(HeaderMapTest, SetKeepsPositionOfFirstOccurrence) {
    HeaderMap headers;
    headers.append("A", "1");
    headers.append("B", "2");
    headers.append("a", "3");
    headers.set("a", "4");

    std::vector<HeaderField> fields(headers.begin(), headers.end());
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[0].name, "a");
    EXPECT_EQ(fields[0].value, "4");
    EXPECT_EQ(fields[1].name, "B");
}

TEST(HeaderMapTest, LookupIsCaseInsensitiveButCaseIsPreserved) {
    HeaderMap headers;
    headers.append("X-Request-ID", "abc");

    std::string value;
    EXPECT_TRUE(headers.get_first("x-request-id", &value));
    EXPECT_EQ(value, "abc");
    EXPECT_EQ(headers.begin()->name, "X-Request-ID");
    EXPECT_FALSE(headers.get_first("X-Other", &value));
    EXPECT_TRUE(headers.get_all("X-Other").empty());
}

TEST(HeaderMapTest, RemoveAndIterateAgain) {
    HeaderMap headers;
    headers.append("A", "1");
    headers.append("B", "2");
    headers.append("a", "3");
    EXPECT_EQ(headers.remove("A"), 2u);
    EXPECT_FALSE(headers.contains("a"));
    EXPECT_EQ(headers.size(), 1u);

    // 可重复遍历
    std::vector<std::string> first;
    std::vector<std::string> second;
    for (const auto& f : headers) first.push_back(f.name);
    for (const auto& f : headers) second.push_back(f.name);
    EXPECT_EQ(first, second);
}

TEST(HeaderMapTest, RejectsInvalidNamesAndValues) {
    HeaderMap headers;
    EXPECT_EQ(headers.append("", "v").error_code(), ErrorCode::INVALID_HEADER_NAME);
    EXPECT_EQ(headers.append("Bad Name", "v").error_code(), ErrorCode::INVALID_HEADER_NAME);
    EXPECT_EQ(headers.append("Bad:Name", "v").error_code(), ErrorCode::INVALID_HEADER_NAME);
    EXPECT_EQ(headers.append("X", "a\r\nInjected: 1").error_code(),
              ErrorCode::INVALID_HEADER_VALUE);
    EXPECT_EQ(headers.append("X", "a\nb").error_code(), ErrorCode::INVALID_HEADER_VALUE);
    EXPECT_EQ(headers.append("X", std::string("a\0b", 3)).error_code(),
              ErrorCode::INVALID_HEADER_VALUE);
    EXPECT_EQ(headers.set("X", "a\rb").error_code(), ErrorCode::INVALID_HEADER_VALUE);
    EXPECT_TRUE(headers.empty());
}

// =============================================================================
// Body
// =============================================================================

TEST(BodyTest, KnownLengths) {
    uint64_t length = 99;
    EXPECT_TRUE(Body::empty().known_length(&length));
    EXPECT_EQ(length, 0u);
    EXPECT_TRUE(Body::from_string("hello").known_length(&length));
    EXPECT_EQ(length, 5u);
    EXPECT_EQ(Body::from_string("hello").text(), "hello");
    EXPECT_EQ(Body::from_string("x").kind(), BodyKind::BYTES);
}

TEST(BodyTest, FromFileStreamsContent) {
    std::string content(40000, 'z');
    content += "tail";
    ScopedFile file(content);

    Result<Body> body = Body::from_file(file.path());
    ASSERT_TRUE(body.is_ok()) << body.error_message();
    EXPECT_EQ(body.value().kind(), BodyKind::FILE_BACKED);
    uint64_t length = 0;
    ASSERT_TRUE(body.value().known_length(&length));
    EXPECT_EQ(length, content.size());

    VectorSink sink;
    ASSERT_TRUE(body.value().write_to(sink).is_ok());
    EXPECT_EQ(to_string(sink.bytes()), content);
}

TEST(BodyTest, FromMissingFileFails) {
    Result<Body> body = Body::from_file("/nonexistent/shc/body.bin");
    EXPECT_EQ(body.error_code(), ErrorCode::IO_ERROR);
}

TEST(BodyTest, FromDirectoryFails) {
    EXPECT_EQ(Body::from_file("/tmp").error_code(), ErrorCode::IO_ERROR);
}

TEST(BodyTest, FileRemovedBeforeSendFails) {
    std::string path;
    Result<Body> body = utils::make_err<Body>(ErrorCode::UNKNOWN_ERROR);
    {
        ScopedFile file("data");
        path = file.path();
        body = Body::from_file(path);
        ASSERT_TRUE(body.is_ok());
    }
    VectorSink sink;
    EXPECT_EQ(body.value().write_to(sink).error_code(), ErrorCode::IO_ERROR);
}

TEST(BodyTest, FileShrunkBeforeSendFails) {
    ScopedFile file("0123456789");
    Result<Body> body = Body::from_file(file.path());
    ASSERT_TRUE(body.is_ok());
    ASSERT_EQ(truncate(file.path().c_str(), 4), 0);

    VectorSink sink;
    EXPECT_EQ(body.value().write_to(sink).error_code(), ErrorCode::IO_ERROR);
}

TEST(BodyTest, NonRegularFileHasUnknownLength) {
    std::string fifo = "/tmp/shc_protocol_fifo_" + std::to_string(getpid());
    ASSERT_EQ(mkfifo(fifo.c_str(), 0600), 0);
    // 打开FIFO读端不会阻塞于O_RDWR
    Result<Body> body = utils::make_err<Body>(ErrorCode::UNKNOWN_ERROR);
    {
        std::fstream keep_open(fifo);
        body = Body::from_file(fifo);
    }
    std::remove(fifo.c_str());
    ASSERT_TRUE(body.is_ok()) << body.error_message();
    EXPECT_FALSE(body.value().known_length(nullptr));
}

TEST(BodyTest, SinkErrorIsPropagated) {
    LimitedSink sink(3);
    EXPECT_EQ(Body::from_string("too long").write_to(sink).error_code(), ErrorCode::IO_ERROR);
}

// =============================================================================
// Url
// =============================================================================

TEST(UrlTest, ParsesComponents) {
    Result<Url> url = parse_url("http://Example.com:8080/a/b?x=1&y=2#frag");
    ASSERT_TRUE(url.is_ok()) << url.error_message();
    EXPECT_EQ(url.value().scheme, "http");
    EXPECT_EQ(url.value().host, "Example.com");
    EXPECT_EQ(url.value().port, 8080);
    EXPECT_TRUE(url.value().has_explicit_port);
    EXPECT_EQ(url.value().path, "/a/b");
    EXPECT_EQ(url.value().query, "x=1&y=2");
    EXPECT_EQ(url.value().request_target(), "/a/b?x=1&y=2");
    EXPECT_EQ(url.value().host_header(), "Example.com:8080");
}

TEST(UrlTest, DefaultsAndEmptyPath) {
    Result<Url> url = parse_url("HTTP://localhost");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().port, 80);
    EXPECT_FALSE(url.value().has_explicit_port);
    EXPECT_EQ(url.value().request_target(), "/");
    EXPECT_EQ(url.value().host_header(), "localhost");

    Result<Url> query_only = parse_url("http://h?q");
    ASSERT_TRUE(query_only.is_ok());
    EXPECT_EQ(query_only.value().request_target(), "/?q");

    // 显式写出80端口时Host不带端口
    EXPECT_EQ(parse_url("http://h:80/").value().host_header(), "h");
}

TEST(UrlTest, Ipv6Literal) {
    Result<Url> url = parse_url("http://[::1]:9000/x");
    ASSERT_TRUE(url.is_ok()) << url.error_message();
    EXPECT_EQ(url.value().host, "::1");
    EXPECT_EQ(url.value().port, 9000);
    EXPECT_EQ(url.value().host_header(), "[::1]:9000");
}

TEST(UrlTest, RejectsInvalidUris) {
    const char* bad[] = {
        "",
        "example.com/path",
        "https://example.com/",
        "ftp://example.com/",
        "http://",
        "http:///path",
        "http://user:pw@example.com/",
        "http://example.com:abc/",
        "http://example.com:0/",
        "http://example.com:65536/",
        "http://exa mple.com/",
        "http://[::1/",
        "http://example.com/\r\n",
    };
    for (const char* uri : bad) {
        EXPECT_EQ(parse_url(uri).error_code(), ErrorCode::INVALID_URI) << uri;
    }
}

// =============================================================================
// RequestBuilder / HttpRequest
// =============================================================================

TEST(RequestBuilderTest, BuildsRequest) {
    Result<HttpRequest> r = RequestBuilder()
        .method(Method::PUT)
        .uri("http://api.local/items/7")
        .version(Version::HTTP_1_0)
        .header("X-Trace", "1")
        .body(Body::from_string("payload"));
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(r.value().method(), Method::PUT);
    EXPECT_EQ(r.value().url().host, "api.local");
    EXPECT_EQ(r.value().version(), Version::HTTP_1_0);
    EXPECT_TRUE(r.value().headers().contains("x-trace"));
    EXPECT_EQ(r.value().body().text(), "payload");
}

TEST(RequestBuilderTest, FailsOnlyAtFinalization) {
    EXPECT_EQ(RequestBuilder().uri("http://h/").build().error_code(), ErrorCode::INVALID_METHOD);
    EXPECT_EQ(RequestBuilder().method(Method::GET).build().error_code(), ErrorCode::INVALID_URI);
    EXPECT_EQ(RequestBuilder().method(Method::GET).uri("not a uri").build().error_code(),
              ErrorCode::INVALID_URI);
    EXPECT_EQ(RequestBuilder().method(Method::GET).uri("http://h/")
                  .header("Bad Name", "v").build().error_code(),
              ErrorCode::INVALID_HEADER_NAME);
    EXPECT_EQ(RequestBuilder().method(Method::GET).uri("http://h/")
                  .header("X", "a\r\nb").build().error_code(),
              ErrorCode::INVALID_HEADER_VALUE);
}

TEST(RequestBuilderTest, WithDefaultHeaderDoesNotOverride) {
    HttpRequest request = build_request(Method::POST, "http://h/", Body::from_string("payload"));
    HttpRequest original(request);
    Result<HttpRequest> with_ua = std::move(request).with_default_header("User-Agent", "a/1");
    ASSERT_TRUE(with_ua.is_ok());
    Result<HttpRequest> again =
        with_ua.take_value().with_default_header("user-agent", "b/2");
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().headers().get_all("User-Agent"), std::vector<std::string>{"a/1"});
    EXPECT_EQ(to_string(again.value().body().bytes()), "payload");
    EXPECT_FALSE(original.headers().contains("User-Agent"));
}

// 请求只能经由RequestBuilder得到
static_assert(!std::is_default_constructible<HttpRequest>::value,
              "HttpRequest must not be default constructible");

TEST(RequestBuilderTest, RejectsMoreThanOneHost) {
    Result<HttpRequest> request = RequestBuilder()
        .method(Method::GET)
        .uri("http://h/")
        .header("Host", "x")
        .header("host", "y")
        .build();
    EXPECT_EQ(request.error_code(), ErrorCode::INVALID_HEADER_VALUE);
    EXPECT_EQ(utils::get_error_category(request.error_code()), utils::ErrorCategory::INPUT);
}

// =============================================================================
// HttpEncoder
// =============================================================================

TEST(HttpEncoderTest, RequestLineAndSynthesizedHostFirst) {
    Result<HttpRequest> r = RequestBuilder()
        .method(Method::GET)
        .uri("http://example.com:8080/search?q=c%2B%2B")
        .header("Accept", "*/*")
        .build();
    ASSERT_TRUE(r.is_ok());
    std::string wire = encode_to_string(r.value());

    EXPECT_EQ(wire.find("GET /search?q=c%2B%2B HTTP/1.1\r\nHost: example.com:8080\r\n"), 0u);
    DecodedHead head = decode_request_head(wire);
    EXPECT_EQ(count_header(head, "Host"), 1u);
    EXPECT_EQ(header_value(head, "Accept"), "*/*");
    EXPECT_EQ(header_value(head, "Content-Length"), "0");
    EXPECT_TRUE(head.rest.empty());
}

TEST(HttpEncoderTest, UserHostIsKept) {
    Result<HttpRequest> r = RequestBuilder()
        .method(Method::GET)
        .uri("http://10.0.0.1/")
        .header("host", "virtual.example")
        .build();
    ASSERT_TRUE(r.is_ok());
    DecodedHead head = decode_request_head(encode_to_string(r.value()));
    EXPECT_EQ(count_header(head, "Host"), 1u);
    EXPECT_EQ(header_value(head, "Host"), "virtual.example");
}

TEST(HttpEncoderTest, EncodeThenDecodeRecoversRequest) {
    HeaderMap headers;
    headers.append("Accept", "text/plain");
    headers.append("X-Multi", "one");
    headers.append("x-multi", "two");
    Result<HttpRequest> r = RequestBuilder()
        .method(Method::PATCH)
        .uri("http://svc.internal:81/v1/res?id=3")
        .version(Version::HTTP_1_0)
        .headers(headers)
        .body(Body::from_string("{\"a\":1}"));
    ASSERT_TRUE(r.is_ok());

    DecodedHead head = decode_request_head(encode_to_string(r.value()));
    EXPECT_EQ(head.method, "PATCH");
    EXPECT_EQ(head.target, "/v1/res?id=3");
    EXPECT_EQ(head.version, "HTTP/1.0");
    EXPECT_EQ(head.rest, "{\"a\":1}");

    // 用户头部按(小写名, 值)集合比较
    for (const auto& field : headers) {
        bool found = false;
        for (const auto& decoded : head.headers) {
            if (EqualsIgnoreCase(decoded.name, field.name) && decoded.value == field.value) {
                found = true;
            }
        }
        EXPECT_TRUE(found) << field.name << ": " << field.value;
    }
}

TEST(HttpEncoderTest, KnownLengthUsesContentLength) {
    HttpRequest request = build_request(Method::POST, "http://h/", Body::from_string("hello"));
    std::string wire = encode_to_string(request);
    DecodedHead head = decode_request_head(wire);
    EXPECT_EQ(header_value(head, "Content-Length"), "5");
    EXPECT_EQ(count_header(head, "Transfer-Encoding"), 0u);
    EXPECT_EQ(head.rest, "hello");
}

TEST(HttpEncoderTest, UserContentLengthIsReplaced) {
    Result<HttpRequest> r = RequestBuilder()
        .method(Method::POST)
        .uri("http://h/")
        .header("Content-Length", "999")
        .body(Body::from_string("abc"));
    ASSERT_TRUE(r.is_ok());
    DecodedHead head = decode_request_head(encode_to_string(r.value()));
    EXPECT_EQ(count_header(head, "Content-Length"), 1u);
    EXPECT_EQ(header_value(head, "Content-Length"), "3");
}

TEST(HttpEncoderTest, UserTransferEncodingSelectsChunked) {
    Result<HttpRequest> r = RequestBuilder()
        .method(Method::POST)
        .uri("http://h/")
        .header("Transfer-Encoding", "chunked")
        .body(Body::from_string("Wikipedia"));
    ASSERT_TRUE(r.is_ok());
    std::string wire = encode_to_string(r.value());
    DecodedHead head = decode_request_head(wire);
    EXPECT_EQ(count_header(head, "Transfer-Encoding"), 1u);
    EXPECT_EQ(count_header(head, "Content-Length"), 0u);
    EXPECT_EQ(head.rest, "9\r\nWikipedia\r\n0\r\n\r\n");
}

TEST(HttpEncoderTest, UnknownLengthUsesChunked) {
    std::string fifo = "/tmp/shc_encoder_fifo_" + std::to_string(getpid());
    ASSERT_EQ(mkfifo(fifo.c_str(), 0600), 0);
    Result<Body> body = utils::make_err<Body>(ErrorCode::UNKNOWN_ERROR);
    {
        std::fstream keep_open(fifo);
        body = Body::from_file(fifo);
    }
    ASSERT_TRUE(body.is_ok());

    HttpRequest request = build_request(Method::POST, "http://h/", body.take_value());
    utils::Buffer head_buf;
    Result<FramingMode> mode = HttpEncoder::encode_head(request, &head_buf);
    std::remove(fifo.c_str());
    ASSERT_TRUE(mode.is_ok()) << mode.error_message();
    EXPECT_EQ(mode.value(), FramingMode::CHUNKED);

    DecodedHead head = decode_request_head(head_buf.to_string());
    EXPECT_EQ(header_value(head, "Transfer-Encoding"), "chunked");
    EXPECT_EQ(count_header(head, "Content-Length"), 0u);
}

TEST(HttpEncoderTest, Http10CannotUseChunked) {
    Result<HttpRequest> r = RequestBuilder()
        .method(Method::POST)
        .uri("http://h/")
        .version(Version::HTTP_1_0)
        .header("Transfer-Encoding", "chunked")
        .body(Body::from_string("x"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(HttpEncoder::encode(r.value()).error_code(), ErrorCode::AMBIGUOUS_BODY_FRAMING);
}

TEST(HttpEncoderTest, TransferEncodingWithoutChunkedIsAmbiguous) {
    Result<HttpRequest> r = RequestBuilder()
        .method(Method::POST)
        .uri("http://h/")
        .header("Transfer-Encoding", "gzip")
        .body(Body::from_string("x"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(HttpEncoder::encode(r.value()).error_code(), ErrorCode::AMBIGUOUS_BODY_FRAMING);
}

TEST(HttpEncoderTest, ChunkedInAnyTransferEncodingHeader) {
    Result<HttpRequest> r = RequestBuilder()
        .method(Method::POST)
        .uri("http://h/")
        .header("Transfer-Encoding", "gzip")
        .header("Transfer-Encoding", "chunked")
        .body(Body::from_string("x"));
    ASSERT_TRUE(r.is_ok());
    std::string wire = encode_to_string(r.value());
    DecodedHead head = decode_request_head(wire);
    EXPECT_EQ(count_header(head, "Transfer-Encoding"), 2u);
    EXPECT_EQ(count_header(head, "Content-Length"), 0u);
    EXPECT_EQ(head.rest, "1\r\nx\r\n0\r\n\r\n");
}

TEST(HttpEncoderTest, ChunkedSinkFraming) {
    VectorSink out;
    ChunkedSink chunked(out);
    std::string a(20, 'a');
    ASSERT_TRUE(chunked.write(reinterpret_cast<const uint8_t*>(a.data()), a.size()).is_ok());
    ASSERT_TRUE(chunked.write(nullptr, 0).is_ok());
    ASSERT_TRUE(chunked.finish().is_ok());
    EXPECT_EQ(to_string(out.bytes()), "14\r\n" + a + "\r\n0\r\n\r\n");
}

TEST(HttpEncoderTest, FileBodyIsStreamed) {
    std::string content(BODY_CHUNK_SIZE * 2 + 7, 'f');
    ScopedFile file(content);
    Result<Body> body = Body::from_file(file.path());
    ASSERT_TRUE(body.is_ok());
    HttpRequest request = build_request(Method::PUT, "http://h/upload", body.take_value());

    DecodedHead head = decode_request_head(encode_to_string(request));
    EXPECT_EQ(header_value(head, "Content-Length"), std::to_string(content.size()));
    EXPECT_EQ(head.rest, content);
}

// =============================================================================
// ResponseParser
// =============================================================================

TEST(ResponseParserTest, ChunkedWikipedia) {
    Result<HttpResponse> r = ResponseParser::parse(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n");
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(r.value().text(), "Wikipedia");
    EXPECT_EQ(r.value().body().kind(), BodyKind::BYTES);
}

TEST(ResponseParserTest, NotFoundWithZeroLength) {
    Result<HttpResponse> r = ResponseParser::parse(
        "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(r.value().status_code(), 404);
    EXPECT_EQ(r.value().reason(), "Not Found");
    EXPECT_EQ(r.value().body().kind(), BodyKind::EMPTY);
    EXPECT_TRUE(r.value().body().bytes().empty());
}

TEST(ResponseParserTest, HeadResponseHasNoBody) {
    ResponseParser parser(Method::HEAD);
    Result<ParseResult> r = parser.feed("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), ParseResult::OK);
    HttpResponse response = parser.take_response();
    EXPECT_TRUE(response.body().bytes().empty());
    std::string length;
    EXPECT_TRUE(response.headers().get_first("Content-Length", &length));
    EXPECT_EQ(length, "5");
}

TEST(ResponseParserTest, NoBodyStatusesIgnoreFraming) {
    for (const char* status : {"204 No Content", "304 Not Modified", "100 Continue"}) {
        ResponseParser parser;
        std::string wire = std::string("HTTP/1.1 ") + status +
                           "\r\nTransfer-Encoding: chunked\r\n\r\n";
        Result<ParseResult> r = parser.feed(wire);
        ASSERT_TRUE(r.is_ok()) << status;
        EXPECT_EQ(r.value(), ParseResult::OK) << status;
    }
}

TEST(ResponseParserTest, CloseDelimitedBody) {
    ResponseParser parser;
    Result<ParseResult> r = parser.feed("HTTP/1.0 200 OK\r\nServer: t\r\n\r\nOK");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), ParseResult::NEED_MORE);
    EXPECT_TRUE(parser.headers_complete());

    r = parser.finish();
    ASSERT_TRUE(r.is_ok());
    HttpResponse response = parser.take_response();
    EXPECT_EQ(response.text(), "OK");
    EXPECT_EQ(response.version(), Version::HTTP_1_0);
    EXPECT_TRUE(response.connection_close());
}

TEST(ResponseParserTest, TruncatedChunkedBodyIsUnexpectedEof) {
    Result<HttpResponse> r = ResponseParser::parse(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nWi");
    EXPECT_EQ(r.error_code(), ErrorCode::UNEXPECTED_EOF);
}

TEST(ResponseParserTest, TruncatedLengthBodyIsUnexpectedEof) {
    Result<HttpResponse> r = ResponseParser::parse(
        "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort");
    EXPECT_EQ(r.error_code(), ErrorCode::UNEXPECTED_EOF);
}

TEST(ResponseParserTest, TruncatedHeadIsUnexpectedEof) {
    EXPECT_EQ(ResponseParser::parse("HTTP/1.1 200 OK\r\nServer").error_code(),
              ErrorCode::UNEXPECTED_EOF);
    EXPECT_EQ(ResponseParser::parse("").error_code(), ErrorCode::UNEXPECTED_EOF);
}

TEST(ResponseParserTest, ByteAtATimeMatchesOneShot) {
    std::string wire =
        "HTTP/1.1 201 Created\r\nLocation: /x\r\nTransfer-Encoding: chunked\r\n\r\n"
        "3;ext=1\r\nabc\r\n10\r\n0123456789abcdef\r\n0\r\nTrailer: t\r\n\r\n";
    ResponseParser parser;
    Result<ParseResult> r = utils::make_ok(ParseResult::NEED_MORE);
    for (size_t i = 0; i < wire.size(); ++i) {
        r = parser.feed(reinterpret_cast<const uint8_t*>(&wire[i]), 1);
        ASSERT_TRUE(r.is_ok()) << "byte " << i << ": " << r.error_message();
        if (i + 1 < wire.size()) {
            EXPECT_EQ(r.value(), ParseResult::NEED_MORE) << "byte " << i;
        }
    }
    EXPECT_EQ(r.value(), ParseResult::OK);
    HttpResponse response = parser.take_response();
    EXPECT_EQ(response.status_code(), 201);
    EXPECT_EQ(response.text(), "abc0123456789abcdef");
    // trailer不合并到头部
    EXPECT_FALSE(response.headers().contains("Trailer"));
}

TEST(ResponseParserTest, DoesNotConsumePastFraming) {
    ResponseParser parser;
    Result<ParseResult> r = parser.feed(
        "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nhiEXTRA");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), ParseResult::OK);
    EXPECT_EQ(parser.buffered_bytes(), 5u);
    EXPECT_EQ(parser.take_response().text(), "hi");
}

TEST(ResponseParserTest, ChunkedTakesPriorityOverContentLength) {
    Result<HttpResponse> r = ResponseParser::parse(
        "HTTP/1.1 200 OK\r\nContent-Length: 100\r\nTransfer-Encoding: chunked\r\n\r\n"
        "2\r\nok\r\n0\r\n\r\n");
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(r.value().text(), "ok");
}

TEST(ResponseParserTest, ChunkedInAnyTransferEncodingHeader) {
    Result<HttpResponse> split = ResponseParser::parse(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nTransfer-Encoding: gzip\r\n\r\n"
        "4\r\nWiki\r\n0\r\n\r\n");
    ASSERT_TRUE(split.is_ok()) << split.error_message();
    EXPECT_EQ(split.value().text(), "Wiki");

    Result<HttpResponse> listed = ResponseParser::parse(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked, gzip\r\n\r\n"
        "4\r\nWiki\r\n0\r\n\r\n");
    ASSERT_TRUE(listed.is_ok()) << listed.error_message();
    EXPECT_EQ(listed.value().text(), "Wiki");

    // 分块结束即完成，不等待关闭
    ResponseParser parser;
    Result<ParseResult> r = parser.feed(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: gzip\r\nTransfer-Encoding: Chunked\r\n\r\n"
        "2\r\nok\r\n0\r\n\r\n");
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(r.value(), ParseResult::OK);
    EXPECT_EQ(parser.take_response().text(), "ok");
}

TEST(ResponseParserTest, TransferEncodingWithoutChunkedReadsUntilClose) {
    ResponseParser parser;
    Result<ParseResult> r = parser.feed(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: gzip\r\nContent-Length: 2\r\n\r\n"
        "4\r\nWiki\r\n0\r\n\r\n");
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(r.value(), ParseResult::NEED_MORE);

    r = parser.finish();
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(parser.take_response().text(), "4\r\nWiki\r\n0\r\n\r\n");
}

TEST(ResponseParserTest, ContentLengthValues) {
    Result<HttpResponse> same = ResponseParser::parse(
        "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nContent-Length: 2, 2\r\n\r\nok");
    ASSERT_TRUE(same.is_ok()) << same.error_message();
    EXPECT_EQ(same.value().text(), "ok");

    EXPECT_EQ(ResponseParser::parse(
                  "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nContent-Length: 3\r\n\r\nok")
                  .error_code(),
              ErrorCode::INVALID_CONTENT_LENGTH);
    EXPECT_EQ(ResponseParser::parse("HTTP/1.1 200 OK\r\nContent-Length: -1\r\n\r\n").error_code(),
              ErrorCode::INVALID_CONTENT_LENGTH);
    EXPECT_EQ(ResponseParser::parse("HTTP/1.1 200 OK\r\nContent-Length: abc\r\n\r\n").error_code(),
              ErrorCode::INVALID_CONTENT_LENGTH);
}

TEST(ResponseParserTest, MalformedStatusLines) {
    const char* bad[] = {
        "HTTP/2.0 200 OK\r\n\r\n",
        "HTTP/1.1 20 OK\r\n\r\n",
        "HTTP/1.1 2000 OK\r\n\r\n",
        "HTTP/1.1 2x0 OK\r\n\r\n",
        "garbage\r\n\r\n",
    };
    for (const char* wire : bad) {
        EXPECT_EQ(ResponseParser::parse(wire).error_code(), ErrorCode::MALFORMED_STATUS_LINE)
            << wire;
    }
    EXPECT_EQ(ResponseParser::parse("HTTP/1.1 700 Odd\r\n\r\n").error_code(),
              ErrorCode::INVALID_STATUS_CODE);
}

TEST(ResponseParserTest, EmptyReasonPhraseIsAccepted) {
    Result<HttpResponse> r = ResponseParser::parse("HTTP/1.1 200\r\nContent-Length: 0\r\n\r\n");
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(r.value().reason(), "");
    Result<HttpResponse> spaced = ResponseParser::parse("HTTP/1.1 200 \r\nContent-Length: 0\r\n\r\n");
    ASSERT_TRUE(spaced.is_ok());
    EXPECT_EQ(spaced.value().reason(), "");
}

TEST(ResponseParserTest, StatusLineWithoutCrlfWithinLimit) {
    ResponseParser parser;
    std::string endless = "HTTP/1.1 200 " + std::string(MAX_LINE_LEN + 10, 'x');
    EXPECT_EQ(parser.feed(endless).error_code(), ErrorCode::MALFORMED_STATUS_LINE);
    // 失败后保持同一错误
    EXPECT_EQ(parser.feed("\r\n").error_code(), ErrorCode::MALFORMED_STATUS_LINE);
    EXPECT_EQ(parser.state(), ResponseParser::State::FAILED);
}

TEST(ResponseParserTest, MalformedHeaderLines) {
    EXPECT_EQ(ResponseParser::parse("HTTP/1.1 200 OK\r\nNoColonHere\r\n\r\n").error_code(),
              ErrorCode::MALFORMED_HEADER_LINE);
    EXPECT_EQ(ResponseParser::parse("HTTP/1.1 200 OK\r\nA: 1\r\n folded\r\n\r\n").error_code(),
              ErrorCode::MALFORMED_HEADER_LINE);
    EXPECT_EQ(ResponseParser::parse("HTTP/1.1 200 OK\r\nBad Name: 1\r\n\r\n").error_code(),
              ErrorCode::MALFORMED_HEADER_LINE);

    std::string many = "HTTP/1.1 200 OK\r\n";
    for (size_t i = 0; i <= MAX_HEADERS; ++i) {
        many += "X-" + std::to_string(i) + ": v\r\n";
    }
    many += "\r\n";
    EXPECT_EQ(ResponseParser::parse(many).error_code(), ErrorCode::MALFORMED_HEADER_LINE);
}

TEST(ResponseParserTest, HeaderValuesAreTrimmed) {
    Result<HttpResponse> r = ResponseParser::parse(
        "HTTP/1.1 200 OK\r\nX-Pad:   spaced value \t\r\nContent-Length: 0\r\n\r\n");
    ASSERT_TRUE(r.is_ok());
    std::string value;
    ASSERT_TRUE(r.value().headers().get_first("x-pad", &value));
    EXPECT_EQ(value, "spaced value");
}

TEST(ResponseParserTest, MalformedChunks) {
    EXPECT_EQ(ResponseParser::parse(
                  "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n").error_code(),
              ErrorCode::MALFORMED_CHUNK_SIZE);
    EXPECT_EQ(ResponseParser::parse(
                  "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n\r\n").error_code(),
              ErrorCode::MALFORMED_CHUNK_SIZE);
    // 分块数据后缺少CRLF
    EXPECT_EQ(ResponseParser::parse(
                  "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n2\r\nokXX0\r\n\r\n")
                  .error_code(),
              ErrorCode::MALFORMED_CHUNK_SIZE);
    EXPECT_EQ(ResponseParser::parse(
                  "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                  "11111111111111111\r\n").error_code(),
              ErrorCode::MALFORMED_CHUNK_SIZE);
}

TEST(ResponseParserTest, ConnectionCloseDetection) {
    Result<HttpResponse> keep = ResponseParser::parse(
        "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
    ASSERT_TRUE(keep.is_ok());
    EXPECT_FALSE(keep.value().connection_close());

    Result<HttpResponse> close = ResponseParser::parse(
        "HTTP/1.1 200 OK\r\nConnection: Close\r\nContent-Length: 0\r\n\r\n");
    ASSERT_TRUE(close.is_ok());
    EXPECT_TRUE(close.value().connection_close());

    Result<HttpResponse> http10_keep = ResponseParser::parse(
        "HTTP/1.0 200 OK\r\nConnection: keep-alive\r\nContent-Length: 0\r\n\r\n");
    ASSERT_TRUE(http10_keep.is_ok());
    EXPECT_FALSE(http10_keep.value().connection_close());
}

TEST(ResponseParserTest, ResetAllowsReuse) {
    ResponseParser parser(Method::GET);
    ASSERT_TRUE(parser.feed("HTTP/1.1 200 OK\r\nContent-Length: 1\r\n\r\na").is_ok());
    ASSERT_TRUE(parser.is_complete());
    parser.reset(Method::HEAD);
    EXPECT_FALSE(parser.is_complete());
    EXPECT_FALSE(parser.headers_complete());
    Result<ParseResult> r = parser.feed("HTTP/1.1 200 OK\r\nContent-Length: 1\r\n\r\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), ParseResult::OK);
}

// 文件结束
