//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_transport.cpp
// Purpose: HTTPTransport against a local Beast server: handshake, headers, sessions, event streams, errors
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "toolhost/Connection.h"
#include "toolhost/HTTPTransport.hpp"
#include "toolhost/ServerManager.h"
#include "toolhost/errors/Errors.h"
#include "support/TestSupport.h"

using namespace toolhost;
using toolhost::test_support::TempDir;
using toolhost::test_support::initializeResult;
using toolhost::test_support::writeFile;

namespace http = boost::beast::http;

namespace {

struct Reply {
    http::status status{http::status::ok};
    std::string body;
    std::string contentType{"application/json"};
    std::string sessionId;
};

// What the server saw for one POST
struct Seen {
    std::string target;
    std::string authorization;
    std::string sessionId;
    std::string host;
    std::string body;
};

//==========================================================================================================
// MiniServer
// Purpose: Blocking accept loop on 127.0.0.1:<ephemeral>; one request per connection, answered by the
//          per-test responder.
//==========================================================================================================
struct MiniServer {
    using Responder = std::function<Reply(const JSONValue& message)>;

    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> running{false};
    unsigned short port{0};
    Responder responder;

    std::mutex mu;
    std::vector<Seen> seen;

    explicit MiniServer(Responder r) : responder(std::move(r)) {}
    ~MiniServer() { stop(); }

    std::string url(const std::string& path = "/mcp") const {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }

    std::vector<Seen> requests() {
        std::lock_guard<std::mutex> lock(mu);
        return seen;
    }

    void serveOne() {
        using boost::asio::ip::tcp;
        tcp::socket socket{io};
        boost::system::error_code ec;
        acceptor.accept(socket, ec);
        if (ec || !running.load()) {
            return;
        }
        boost::beast::tcp_stream stream{std::move(socket)};
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(stream, buffer, req, ec);
        if (ec) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mu);
            seen.push_back(Seen{std::string(req.target()), std::string(req[http::field::authorization]),
                                std::string(req["Mcp-Session-Id"]), std::string(req[http::field::host]), req.body()});
        }

        JSONValue message;
        try {
            message = ParseJSON(req.body());
        } catch (const JSONParseError&) {
            message = JSONValue(nullptr);
        }
        Reply reply = responder(message);

        http::response<http::string_body> res{reply.status, req.version()};
        res.set(http::field::server, "mini-server");
        res.set(http::field::content_type, reply.contentType);
        if (!reply.sessionId.empty()) {
            res.set("Mcp-Session-Id", reply.sessionId);
        }
        res.keep_alive(false);
        res.body() = reply.body;
        res.prepare_payload();
        http::write(stream, res, ec);
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    void start() {
        using boost::asio::ip::tcp;
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        running.store(true);
        thr = std::thread([this]() {
            while (running.load()) {
                serveOne();
            }
        });
    }

    void stop() {
        if (!running.exchange(false)) {
            return;
        }
        // Wake the blocking accept
        boost::system::error_code ec;
        boost::asio::ip::tcp::socket poke{io};
        poke.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port), ec);
        poke.close(ec);
        if (thr.joinable()) {
            thr.join();
        }
        acceptor.close(ec);
    }
};

std::string envelope(const JSONValue& request, const JSONValue& result) {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(std::string("2.0"));
    if (const JSONValue* id = request.Find("id")) {
        obj["id"] = std::make_shared<JSONValue>(*id);
    }
    obj["result"] = std::make_shared<JSONValue>(result);
    return SerializeJSON(JSONValue{obj});
}

// Answers initialize with a session id; everything else echoes the method name as the result.
Reply basicResponder(const JSONValue& msg) {
    if (!msg.Find("id")) {
        return Reply{http::status::accepted, "", "application/json", ""};
    }
    const std::string method = msg.GetString("method");
    if (method == Methods::Initialize) {
        return Reply{http::status::ok, envelope(msg, initializeResult("remote")), "application/json", "session-abc"};
    }
    return Reply{http::status::ok, envelope(msg, JSONValue(method)), "application/json", ""};
}

std::unique_ptr<HTTPTransport> startTransport(const std::string& url, const std::string& token = "") {
    HTTPTransport::Options o;
    o.serverId = "remote";
    o.url = url;
    o.bearerToken = token;
    o.connectTimeoutMs = 1000;
    o.requestTimeoutSeconds = 5;
    auto t = std::make_unique<HTTPTransport>(o);
    t->Start().get();
    return t;
}

} // namespace

TEST(HTTPTransport, HandshakeThroughManagerAndSessionHeaderIsEchoed) {
    MiniServer srv(basicResponder);
    srv.start();

    TempDir dir;
    writeFile(dir.file("tool_servers.json"),
              "{\"servers\":{\"remote\":{\"url\":\"" + srv.url() + "\",\"bearer_token\":\"secret\"}}}");
    RegistryOptions ro;
    ro.configPath = dir.file("tool_servers.json");
    ro.customServersPath = dir.file("custom.json");
    ServerRegistry registry(ro);
    registry.Load();
    ManagerOptions mo;
    mo.clientInfo = Implementation("toolhost-test", "0");
    ServerManager mgr(registry, std::make_shared<DefaultTransportFactory>(), mo);

    auto conn = mgr.StartServer("remote");
    EXPECT_EQ(mgr.GetServerStatus("remote"), ServerStatus::Running);
    EXPECT_EQ(conn->GetSessionId(), "session-abc");

    JSONValue result = mgr.SendRequest("remote", "tools/list");
    EXPECT_EQ(std::get<std::string>(result.value), "tools/list");

    auto reqs = srv.requests();
    // initialize + tools/list, no initialized notification over HTTP
    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(reqs[0].target, "/mcp");
    EXPECT_EQ(reqs[0].authorization, "Bearer secret");
    EXPECT_EQ(reqs[0].host, "127.0.0.1:" + std::to_string(srv.port));
    EXPECT_TRUE(reqs[0].sessionId.empty());
    EXPECT_EQ(ParseJSON(reqs[0].body).GetString("method"), "initialize");
    EXPECT_EQ(reqs[1].sessionId, "session-abc");
    EXPECT_EQ(ParseJSON(reqs[1].body).GetInt("id", 0), 2);

    mgr.StopServer("remote");
    EXPECT_EQ(mgr.GetServerStatus("remote"), ServerStatus::Stopped);
}

TEST(HTTPTransport, SessionIdDefaultsBeforeServerIssuesOne) {
    MiniServer srv(basicResponder);
    srv.start();
    auto t = startTransport(srv.url());
    EXPECT_EQ(t->GetSessionId(), "http-remote");
    EXPECT_TRUE(srv.requests().empty()) << "Start must not touch the network";
    t->Close().get();
}

TEST(HTTPTransport, NoAuthorizationHeaderWithoutToken) {
    MiniServer srv(basicResponder);
    srv.start();
    Connection conn("remote", TransportKind::Http, startTransport(srv.url()), std::chrono::seconds(5));
    conn.Request("ping");
    auto reqs = srv.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_TRUE(reqs[0].authorization.empty());
}

TEST(HTTPTransport, NonSuccessStatusIsTransportError) {
    MiniServer srv([](const JSONValue&) {
        return Reply{http::status::internal_server_error, "oops", "text/plain", ""};
    });
    srv.start();
    Connection conn("remote", TransportKind::Http, startTransport(srv.url()), std::chrono::seconds(5));
    try {
        conn.Request("tools/list");
        FAIL() << "expected TransportError";
    } catch (const errors::TransportError& e) {
        EXPECT_EQ(e.httpStatus(), 500);
    }
    EXPECT_EQ(conn.PendingRequests(), 0u);
}

TEST(HTTPTransport, EventStreamResponseIsUnwrapped) {
    std::promise<std::string> notified;
    auto notifiedFuture = notified.get_future();
    MiniServer srv([](const JSONValue& msg) {
        std::string body;
        body += "event: message\n";
        body += "data: {\"jsonrpc\":\"2.0\",\"method\":\"notifications/progress\",\"params\":{\"progress\":1}}\n\n";
        body += "event: message\n";
        body += "data: " + envelope(msg, JSONValue(std::string("streamed"))) + "\n\n";
        return Reply{http::status::ok, body, "text/event-stream", ""};
    });
    srv.start();

    HTTPTransport::Options o;
    o.serverId = "remote";
    o.url = srv.url();
    auto t = std::make_unique<HTTPTransport>(o);
    t->SetNotificationHandler([&notified](std::unique_ptr<JSONRPCNotification> n) { notified.set_value(n->method); });
    t->Start().get();
    Connection conn("remote", TransportKind::Http, std::move(t), std::chrono::seconds(5));

    JSONValue result = conn.Request("tools/call");
    EXPECT_EQ(std::get<std::string>(result.value), "streamed");
    ASSERT_EQ(notifiedFuture.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(notifiedFuture.get(), "notifications/progress");
}

TEST(HTTPTransport, MismatchedResponseIdIsRejected) {
    MiniServer srv([](const JSONValue&) {
        return Reply{http::status::ok, R"({"jsonrpc":"2.0","id":"wrong","result":{}})", "application/json", ""};
    });
    srv.start();
    Connection conn("remote", TransportKind::Http, startTransport(srv.url()), std::chrono::seconds(5));
    EXPECT_THROW(conn.Request("noop"), errors::TransportError);
}

TEST(HTTPTransport, RpcErrorPassesThrough) {
    MiniServer srv([](const JSONValue& msg) {
        auto resp = CreateErrorResponse(JSONRPCId(msg.GetInt("id", 0)), JSONRPCErrorCodes::MethodNotFound, "nope");
        return Reply{http::status::ok, resp->Serialize(), "application/json", ""};
    });
    srv.start();
    Connection conn("remote", TransportKind::Http, startTransport(srv.url()), std::chrono::seconds(5));
    try {
        conn.Request("missing/method");
        FAIL() << "expected RPCError";
    } catch (const errors::RPCError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::MethodNotFound);
        EXPECT_EQ(e.rpcMessage(), "nope");
    }
}

TEST(HTTPTransport, UnreachableServerIsTransportError) {
    // Bind then release a port so nothing listens on it
    unsigned short port = 0;
    {
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor a{io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)};
        port = a.local_endpoint().port();
    }
    Connection conn("remote", TransportKind::Http,
                    startTransport("http://127.0.0.1:" + std::to_string(port) + "/mcp"), std::chrono::seconds(5));
    EXPECT_THROW(conn.Request("tools/list"), errors::TransportError);
}

TEST(HTTPTransport, InvalidUrlFailsStart) {
    HTTPTransport::Options o;
    o.serverId = "bad";
    o.url = "ftp://example.com/mcp";
    HTTPTransport t(o);
    EXPECT_THROW(t.Start().get(), errors::TransportError);
    EXPECT_FALSE(t.IsConnected());
}

TEST(HTTPTransport, CloseRejectsFurtherRequests) {
    MiniServer srv(basicResponder);
    srv.start();
    auto t = startTransport(srv.url());
    t->Close().get();
    auto f = t->SendRequest(std::make_unique<JSONRPCRequest>(int64_t{1}, "ping"));
    EXPECT_THROW(f.get(), errors::ServerDisconnectedError);
}

TEST(HTTPTransport, CloseFailsNotificationStillInFlight) {
    // Listens but never accepts, so the POST is written and no reply ever comes
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor silent{io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)};
    const unsigned short port = silent.local_endpoint().port();

    auto t = startTransport("http://127.0.0.1:" + std::to_string(port) + "/mcp");
    auto f = t->SendNotification(std::make_unique<JSONRPCNotification>("notifications/progress"));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    ASSERT_EQ(f.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);

    t->Close().get();
    ASSERT_EQ(f.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(f.get(), errors::ServerDisconnectedError);
}
