#include "binchain/cli/net.hpp"

#include <asio/connect.hpp>
#include <asio/ip/address.hpp>
#include <asio/post.hpp>
#include <asio/write.hpp>

#include <csignal>
#include <utility>

#include <spdlog/spdlog.h>

#include "binchain/errors.hpp"

namespace binchain::cli
{

    namespace
    {
        constexpr std::size_t kReadBufferSize = 64 * 1024;
    } // namespace

    void send_bytes(const std::string &host, std::uint16_t port, std::span<const std::uint8_t> data)
    {
        asio::io_context io_context;
        asio::ip::tcp::resolver resolver(io_context);
        asio::ip::tcp::socket socket(io_context);
        const auto results = resolver.resolve(host, std::to_string(port));
        asio::connect(socket, results);
        asio::write(socket, asio::buffer(data.data(), data.size()));

        std::error_code ec;
        socket.shutdown(asio::ip::tcp::socket::shutdown_send, ec);
        socket.close(ec);
    }

    Connection::Connection(asio::ip::tcp::socket socket, const ReaderLimits &limits, const ChainHandler &handler)
        : socket_(std::move(socket)),
          reader_(limits),
          handler_(handler),
          buffer_(kReadBufferSize)
    {
        peer_ = remote_endpoint();
    }

    void Connection::start()
    {
        spdlog::info("Connection from {}", peer_);
        read_next();
    }

    void Connection::read_next()
    {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(buffer_),
                                [this, self](const std::error_code &ec, std::size_t bytes_transferred)
                                { on_read(ec, bytes_transferred); });
    }

    void Connection::on_read(const std::error_code &ec, std::size_t bytes_transferred)
    {
        if (ec)
        {
            if (ec != asio::error::eof)
            {
                spdlog::error("Read from {} failed: {}", peer_, ec.message());
            }
            else if (!reader_.is_complete())
            {
                spdlog::error("{} closed the connection in the middle of a chain ({} bytes pending)", peer_,
                              reader_.parser().state().pending.size());
            }
            stop();
            return;
        }

        bytes_received_ += bytes_transferred;
        spdlog::debug("{} bytes from {} ({} total)", bytes_transferred, peer_, bytes_received_);
        try
        {
            reader_.feed(std::span<const std::uint8_t>(buffer_.data(), bytes_transferred));
            while (auto chain = reader_.next())
            {
                ++chains_received_;
                handler_(peer_, chains_received_, *chain);
            }
        }
        catch (const binchain::ParseError &ex)
        {
            spdlog::error("Invalid chain data from {} ({}): {}", peer_, to_string(ex.code()), ex.what());
            stop();
            return;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to handle chain from {}: {}", peer_, ex.what());
            stop();
            return;
        }
        read_next();
    }

    void Connection::stop()
    {
        std::error_code ec;
        spdlog::info("Closing connection for {} after {} chains, {} bytes", peer_, chains_received_, bytes_received_);
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    std::string Connection::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Receiver::Receiver(ReceiveOptions options, ChainHandler handler)
        : options_(std::move(options)),
          handler_(std::move(handler)),
          acceptor_(io_context_),
          signals_(io_context_)
    {
        const auto address = asio::ip::make_address(options_.address);
        const asio::ip::tcp::endpoint endpoint(address, options_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} (max part size {})", options_.address, port(),
                     options_.limits.max_part_size);

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
            if (!ec)
            {
                handle_signal();
            } });
    }

    void Receiver::run()
    {
        accept_next();
        io_context_.run();
    }

    void Receiver::stop()
    {
        asio::post(io_context_, [this]()
                   { shutdown(); });
    }

    std::uint16_t Receiver::port() const
    {
        std::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? options_.port : endpoint.port();
    }

    void Receiver::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Receiver::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            auto connection = std::make_shared<Connection>(std::move(socket), options_.limits, handler_);
            connection->start();
        }
        else if (ec != asio::error::operation_aborted)
        {
            spdlog::error("Accept error: {}", ec.message());
        }
        if (acceptor_.is_open())
        {
            accept_next();
        }
    }

    void Receiver::handle_signal()
    {
        spdlog::info("Signal received, shutting down");
        shutdown();
    }

    void Receiver::shutdown()
    {
        std::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
        io_context_.stop();
    }

} // namespace binchain::cli
