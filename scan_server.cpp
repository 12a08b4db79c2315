#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <atomic>

#include "src/utils/config.hpp"
#include "src/postgres/postgres.hpp"
#include "src/storage/storage_factory.hpp"
#include "src/websocket/scan_message_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// WebSocket session class
class Session : public std::enable_shared_from_this<Session> {
private:
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::shared_ptr<ScanMessageHandler> handler_;
    uint64_t session_id_;
    std::string response_;

public:
    Session(tcp::socket&& socket, std::shared_ptr<ScanMessageHandler> handler, uint64_t session_id)
        : ws_(std::move(socket)),
          handler_(handler),
          session_id_(session_id) {
    }

    void run() {
        net::dispatch(
            ws_.get_executor(),
            beast::bind_front_handler(
                &Session::on_run,
                shared_from_this()
            )
        );
    }

    void on_run() {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) {
                res.set(http::field::server, "Scan Ingest WebSocket Server");
            }
        ));

        ws_.async_accept(
            beast::bind_front_handler(
                &Session::on_accept,
                shared_from_this()
            )
        );
    }

    void on_accept(beast::error_code ec) {
        if (ec) {
            std::cerr << "Accept error: " << ec.message() << std::endl;
            return;
        }

        std::cout << "Client " << session_id_ << " connected" << std::endl;
        do_read();
    }

    void do_read() {
        ws_.async_read(
            buffer_,
            beast::bind_front_handler(
                &Session::on_read,
                shared_from_this()
            )
        );
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec == websocket::error::closed) {
            std::cout << "Client " << session_id_ << " disconnected" << std::endl;
            return;
        }

        if (ec) {
            std::cerr << "Read error: " << ec.message() << std::endl;
            return;
        }

        std::string message = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        // Kept as a member so the buffer outlives the async write
        response_ = handler_->processMessage(message);

        ws_.text(true);
        ws_.async_write(
            net::buffer(response_),
            beast::bind_front_handler(
                &Session::on_write,
                shared_from_this()
            )
        );
    }

    void on_write(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec) {
            std::cerr << "Write error: " << ec.message() << std::endl;
            return;
        }

        // Read next message
        do_read();
    }
};

// Listener class
class Listener : public std::enable_shared_from_this<Listener> {
private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<ScanMessageHandler> handler_;
    std::atomic<uint64_t> session_counter_{0};

public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<ScanMessageHandler> handler)
        : ioc_(ioc),
          acceptor_(net::make_strand(ioc)),
          handler_(handler) {

        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Open error: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Set option error: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Bind error: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Listen error: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

private:
    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            beast::bind_front_handler(
                &Listener::on_accept,
                shared_from_this()
            )
        );
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            std::cerr << "Accept error: " << ec.message() << std::endl;
        } else {
            uint64_t session_id = ++session_counter_;
            std::make_shared<Session>(std::move(socket), handler_, session_id)->run();
        }

        do_accept();
    }
};

// Main function
int main(int argc, char* argv[]) {
    try {
        // Load configuration
        Config config;
        std::string config_file = "config.ini";
        if (argc > 1) {
            config_file = argv[1];
        }
        config.load(config_file);

        // Capabilities live for the whole process
        std::cout << "Connecting to database..." << std::endl;
        auto db = std::make_shared<Postgres>(
            config.db_host,
            config.db_port,
            config.db_name,
            config.db_user,
            config.db_password
        );
        db->ensure_schema();
        std::shared_ptr<ScanStore> store = db;
        std::shared_ptr<ObjectStorage> storage = createStorage(config);

        auto issuer = std::make_shared<UploadTargetIssuer>(store, storage);
        auto orchestrator = std::make_shared<IngestionOrchestrator>(
            store,
            storage,
            QualityAnalyzer(config.blur_threshold, config.light_threshold),
            config.ingest_workers
        );

        // Create statistics
        ServerStats stats;
        auto handler = std::make_shared<ScanMessageHandler>(
            store, issuer, orchestrator, config.rescan_interval_days, stats);

        // Create IO context
        auto const num_threads = std::max<int>(1, std::thread::hardware_concurrency());
        net::io_context ioc{num_threads};

        // Create and launch listener
        auto const address = net::ip::make_address(config.server_host);
        auto const port = static_cast<unsigned short>(config.server_port);

        std::cout << "Starting WebSocket server on " << config.server_host << ":" << config.server_port << std::endl;

        std::make_shared<Listener>(
            ioc,
            tcp::endpoint{address, port},
            handler
        )->run();

        std::cout << "Server started successfully with " << num_threads << " threads" << std::endl;

        // Run the I/O service on multiple threads
        std::vector<std::thread> threads;
        threads.reserve(num_threads - 1);
        for (int i = 0; i < num_threads - 1; ++i) {
            threads.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
