#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "binchain/chain.hpp"
#include "binchain/chain_reader.hpp"
#include "binchain/cli/config.hpp"

namespace binchain::cli
{

    // Called for every complete chain; index counts chains per connection from 1.
    using ChainHandler = std::function<void(const std::string &peer, std::size_t index, const Chain &chain)>;

    void send_bytes(const std::string &host, std::uint16_t port, std::span<const std::uint8_t> data);

    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(asio::ip::tcp::socket socket, const ReaderLimits &limits, const ChainHandler &handler);

        void start();

    private:
        void read_next();
        void on_read(const std::error_code &ec, std::size_t bytes_transferred);
        void stop();
        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ChainReader reader_;
        const ChainHandler &handler_;
        std::string peer_;
        std::vector<std::uint8_t> buffer_;
        std::size_t chains_received_{0};
        std::uint64_t bytes_received_{0};
    };

    // Accepts connections until SIGINT/SIGTERM; every connection gets its own ChainReader.
    class Receiver
    {
    public:
        Receiver(ReceiveOptions options, ChainHandler handler);

        void run();

        // Safe to call from any thread, including from inside the handler.
        void stop();

        // Bound port; differs from the configured one when that was 0.
        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();
        void shutdown();

        ReceiveOptions options_;
        ChainHandler handler_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
    };

} // namespace binchain::cli
