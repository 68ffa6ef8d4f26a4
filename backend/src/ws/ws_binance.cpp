#include "ws.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>

#include "md/symbol_codec.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

struct BinanceWs::Impl
{
    std::string host;
    std::string path;
    OnMsg on_msg;
    ReconnectPolicy policy;

    using Stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    net::io_context ioc{1};
    net::ssl::context ssl_ctx{net::ssl::context::tls_client};
    std::unique_ptr<tcp::resolver> resolver;
    std::unique_ptr<Stream> ws;
    beast::flat_buffer buffer;
    std::atomic<bool> stop_flag{false};

    // Outcome of the current session's connect chain
    bool handshake_ok{false};
    beast::error_code connect_ec;
    const char *connect_stage{""};

    std::mutex wait_m;
    std::condition_variable wait_cv;

    Impl(std::string symbol, OnMsg cb, std::string h, ReconnectPolicy p)
    : host(std::move(h)), path(SymbolCodec::to_stream_path(symbol)), on_msg(std::move(cb)), policy(p)
    {
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(net::ssl::verify_peer);
    }

    static bool expected_close(const beast::error_code &ec)
    {
        return ec == websocket::error::closed ||
               ec == net::error::operation_aborted ||
               ec == net::error::eof ||
               ec == net::error::not_connected ||
               ec == beast::errc::not_connected;
    }

    // Reconnect loop; each pass is one session.
    void run(unsigned short port)
    {
        auto backoff = policy.initial_backoff;
        unsigned failures = 0;

        while (!stop_flag.load(std::memory_order_relaxed))
        {
            bool connected = false;
            try
            {
                connected = session(port);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[binance-ws] " << path << " error: " << e.what() << "\n";
            }
            if (stop_flag.load(std::memory_order_relaxed))
                break;

            // A session that got past the handshake resets the backoff
            if (connected)
            {
                backoff = policy.initial_backoff;
                failures = 0;
            }
            ++failures;
            if (policy.max_attempts && failures > policy.max_attempts)
            {
                std::cerr << "[binance-ws] " << path << " giving up after "
                          << policy.max_attempts << " attempts\n";
                break;
            }

            std::cout << "[binance-ws] " << path << " reconnecting in "
                      << backoff.count() << "ms (attempt " << failures << ")" << std::endl;
            {
                std::unique_lock<std::mutex> lk(wait_m);
                wait_cv.wait_for(lk, backoff, [this] { return stop_flag.load(std::memory_order_relaxed); });
            }
            backoff = std::min(backoff * 2, policy.max_backoff);
        }
    }

    // Connect, handshake, then read until the stream closes. Every step is
    // asynchronous so stop() can cancel it. Returns true once the WebSocket
    // handshake succeeded; throws if connecting failed.
    bool session(unsigned short port)
    {
        ioc.restart();
        buffer.clear();
        handshake_ok = false;
        connect_ec = {};
        connect_stage = "";

        resolver = std::make_unique<tcp::resolver>(ioc);
        ws = std::make_unique<Stream>(ioc, ssl_ctx);

        // SNI
        if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), host.c_str())) {
            throw beast::system_error{
                beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                "SNI set failed"
            };
        }

        resolver->async_resolve(host, std::to_string(port),
            [this](beast::error_code ec, tcp::resolver::results_type results) {
                if (failed(ec, "resolve")) return;
                beast::get_lowest_layer(*ws).expires_after(policy.connect_timeout);
                beast::get_lowest_layer(*ws).async_connect(results,
                    [this](beast::error_code ec, const tcp::endpoint &) { on_connect(ec); });
            });

        ioc.run(); // returns when the connect chain fails or the read chain ends
        if (!handshake_ok && connect_ec && !stop_flag.load(std::memory_order_relaxed))
            throw beast::system_error{connect_ec, connect_stage};
        return handshake_ok;
    }

    bool failed(const beast::error_code &ec, const char *stage)
    {
        if (!ec) return false;
        connect_ec = ec;
        connect_stage = stage;
        return true;
    }

    void on_connect(beast::error_code ec)
    {
        if (failed(ec, "connect")) return;
        beast::get_lowest_layer(*ws).expires_after(policy.connect_timeout);
        ws->next_layer().async_handshake(net::ssl::stream_base::client,
            [this](beast::error_code ec) { on_tls_handshake(ec); });
    }

    void on_tls_handshake(beast::error_code ec)
    {
        if (failed(ec, "TLS handshake")) return;

        // The websocket stream keeps its own timeouts from here on
        beast::get_lowest_layer(*ws).expires_never();
        ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws->set_option(websocket::stream_base::decorator([](websocket::request_type &req){
            req.set(http::field::user_agent, std::string("tickflow-ws-connector/1.0"));
        }));
        // The raw trade stream needs no subscribe frame
        ws->async_handshake(host, path, [this](beast::error_code ec) {
            if (failed(ec, "WebSocket handshake")) return;
            handshake_ok = true;
            std::cout << "[binance-ws] connected " << host << path << std::endl;
            do_read();
        });
    }

    void do_read()
    {
        ws->async_read(buffer, [this](beast::error_code ec, std::size_t) {
            if (ec)
            {
                if (!expected_close(ec))
                    std::cerr << "[binance-ws] " << path << " read error: " << ec.message() << "\n";
                return;
            }
            std::string data = beast::buffers_to_string(buffer.cdata());
            buffer.consume(buffer.size());
            if (on_msg) on_msg(data);
            if (!stop_flag.load(std::memory_order_relaxed))
                do_read();
        });
    }

    void stop() noexcept
    {
        stop_flag.store(true, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lk(wait_m);
        }
        wait_cv.notify_all();
        try
        {
            // Runs on the I/O thread; tears down whichever session is live
            net::post(ioc, [this] {
                if (resolver) resolver->cancel();
                if (!ws) return;
                beast::error_code ec;
                beast::get_lowest_layer(*ws).socket().shutdown(tcp::socket::shutdown_both, ec);
                beast::get_lowest_layer(*ws).close();
            });
        }
        catch (const std::exception &e)
        {
            std::cerr << "[binance-ws] " << path << " stop error: " << e.what() << "\n";
        }
    }
};

BinanceWs::BinanceWs(std::string symbol, OnMsg cb, std::string host, ReconnectPolicy policy)
    : impl_(new Impl(std::move(symbol), std::move(cb), std::move(host), policy)) {}

BinanceWs::~BinanceWs() { delete impl_; }

void BinanceWs::start(unsigned short port) { impl_->run(port); }
void BinanceWs::stop() noexcept { impl_->stop(); }
