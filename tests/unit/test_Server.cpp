#include "protocols/http/Server.hpp"
#include "protocols/http/Router.hpp"
#include "concurrency/ThreadPool.hpp"
#include "storage/Manager.hpp"

#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;

using namespace rh::protocols::http;
using tcp = asio::ip::tcp;

class ServerLoopbackTest : public ::testing::Test {
protected:
    static constexpr uint64_t LIMIT = 64 * 1024;

    fs::path test_dir;
    std::shared_ptr<rh::storage::Manager> storage;
    asio::io_context ioc;
    std::shared_ptr<rh::concurrency::ThreadPool> pool;
    std::shared_ptr<Server> server;
    std::thread ioThread;
    uint16_t port{0};

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "reelhall_server_loopback";
        fs::remove_all(test_dir);

        storage = std::make_shared<rh::storage::Manager>(test_dir, LIMIT, std::vector<std::string>{".mp4"});
        storage->ensureRoot();

        pool = std::make_shared<rh::concurrency::ThreadPool>(2);
        auto router = std::make_shared<const Router>(model::Context{storage, "/files/uploads"},
                                                     Cors(rh::config::CorsConfig{}));

        server = std::make_shared<Server>(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0), router, pool,
                                          Session::Limits{.headerBytes = 8192, .bodyBytes = LIMIT + 1024,
                                                          .maxUploadBytes = LIMIT});
        port = server->localEndpoint().port();
        server->run();
        ioThread = std::thread([this] { ioc.run(); });
    }

    void TearDown() override {
        server->close();
        ioc.stop();
        if (ioThread.joinable()) ioThread.join();
        pool->stop();
        fs::remove_all(test_dir);
    }

    [[nodiscard]] tcp::socket connect() {
        tcp::socket sock(ioc);
        sock.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
        return sock;
    }

    static bhttp::response<bhttp::string_body> exchange(tcp::socket& sock, bhttp::request<bhttp::string_body>& req,
                                                       beast::flat_buffer& buffer) {
        bhttp::write(sock, req);
        bhttp::response<bhttp::string_body> res;
        bhttp::read(sock, buffer, res);
        return res;
    }
};

TEST_F(ServerLoopbackTest, KeepAliveServesSeveralRequests) {
    auto sock = connect();
    beast::flat_buffer buffer;

    for (int i = 0; i < 3; ++i) {
        bhttp::request<bhttp::string_body> req{bhttp::verb::get, "/health", 11};
        req.set(bhttp::field::host, "localhost");
        const auto res = exchange(sock, req, buffer);
        EXPECT_EQ(res.result(), bhttp::status::ok);
        EXPECT_TRUE(res.keep_alive());
        EXPECT_EQ(nlohmann::json::parse(res.body())["status"], "OK");
    }
}

TEST_F(ServerLoopbackTest, RangeRequestOverTheWire) {
    std::string content;
    for (int i = 0; i < 50000; ++i) content += static_cast<char>('a' + i % 26);
    const auto name = storage->store("wire.mp4", content.size(), content).storedName;

    auto sock = connect();
    beast::flat_buffer buffer;

    bhttp::request<bhttp::string_body> req{bhttp::verb::get, "/api/stream/" + name, 11};
    req.set(bhttp::field::host, "localhost");
    req.set(bhttp::field::range, "bytes=10-19");
    const auto partial = exchange(sock, req, buffer);

    ASSERT_EQ(partial.result(), bhttp::status::partial_content);
    EXPECT_EQ(partial[bhttp::field::content_range], "bytes 10-19/50000");
    EXPECT_EQ(partial.body(), content.substr(10, 10));

    // Whole file on the same connection, spanning several body chunks
    bhttp::request<bhttp::string_body> full{bhttp::verb::get, "/api/stream/" + name, 11};
    full.set(bhttp::field::host, "localhost");
    const auto whole = exchange(sock, full, buffer);
    ASSERT_EQ(whole.result(), bhttp::status::ok);
    EXPECT_EQ(whole[bhttp::field::accept_ranges], "bytes");
    EXPECT_EQ(whole.body(), content);
}

TEST_F(ServerLoopbackTest, OversizedBodyIsRefusedFromHeaders) {
    auto sock = connect();
    beast::flat_buffer buffer;

    // Declares a body far over the limit and never sends it
    const std::string head =
        "POST /api/upload HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Type: multipart/form-data; boundary=x\r\n"
        "Content-Length: 10000000\r\n"
        "\r\n";
    asio::write(sock, asio::buffer(head));

    bhttp::response<bhttp::string_body> res;
    beast::error_code ec;
    bhttp::read(sock, buffer, res, ec);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(res.result(), bhttp::status::bad_request);
    EXPECT_EQ(nlohmann::json::parse(res.body())["error"], "File too large. Limit is 0.0625MB");
    EXPECT_FALSE(res.keep_alive());

    // Server closes its side afterwards
    char byte;
    sock.read_some(asio::buffer(&byte, 1), ec);
    EXPECT_EQ(ec, asio::error::eof);
}
