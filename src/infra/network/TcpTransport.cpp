#include "infra/network/TcpTransport.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

namespace camlink::infra {

namespace {

constexpr size_t READ_CHUNK_SIZE = 4096;

} // namespace

TcpStream::TcpStream(std::string host, uint16_t port)
    : socket_(ioContext_), host_(std::move(host)), port_(port) {}

TcpStream::~TcpStream() {
    close();
}

void TcpStream::runFor(std::chrono::milliseconds timeout, const char* operation) {
    ioContext_.restart();
    ioContext_.run_for(timeout);

    if (!ioContext_.stopped()) {
        // Abort the pending operation and let its handler run
        asio::error_code ignored;
        socket_.close(ignored);
        ioContext_.run();
        throw core::TimeoutError(fmt::format("{} {} timed out after {}ms", operation,
                                             remoteEndpoint(), timeout.count()));
    }
}

void TcpStream::open(std::chrono::milliseconds timeout) {
    asio::error_code ec;
    asio::ip::tcp::endpoint endpoint;

    auto address = asio::ip::make_address(host_, ec);
    if (!ec) {
        endpoint = asio::ip::tcp::endpoint(address, port_);
    } else {
        asio::ip::tcp::resolver resolver(ioContext_);
        auto results = resolver.resolve(asio::ip::tcp::v4(), host_, std::to_string(port_), ec);
        if (ec || results.empty()) {
            throw core::NetworkError(fmt::format("Cannot resolve {}: {}", host_, ec.message()));
        }
        endpoint = results.begin()->endpoint();
    }

    asio::error_code result = asio::error::would_block;
    socket_.async_connect(endpoint, [&result](const asio::error_code& error) { result = error; });
    runFor(timeout, "Connect to");

    if (result == asio::error::connection_refused) {
        throw core::ConnectionRefusedError(fmt::format("Connection to {} refused", remoteEndpoint()));
    }
    if (result) {
        throw core::NetworkError(
            fmt::format("Connection to {} failed: {}", remoteEndpoint(), result.message()));
    }

    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    spdlog::debug("Connected to {}", remoteEndpoint());
}

void TcpStream::write(const std::vector<uint8_t>& data, std::chrono::milliseconds timeout) {
    if (!socket_.is_open()) {
        throw core::NetworkError(fmt::format("Write to closed stream {}", remoteEndpoint()));
    }

    asio::error_code result = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(data),
                      [&result](const asio::error_code& error, size_t) { result = error; });
    runFor(timeout, "Write to");

    if (result) {
        throw core::NetworkError(
            fmt::format("Write to {} failed: {}", remoteEndpoint(), result.message()));
    }
}

std::vector<uint8_t> TcpStream::readSome(std::chrono::milliseconds timeout) {
    if (!socket_.is_open()) {
        throw core::NetworkError(fmt::format("Read from closed stream {}", remoteEndpoint()));
    }

    std::vector<uint8_t> buffer(READ_CHUNK_SIZE);
    asio::error_code result = asio::error::would_block;
    size_t received = 0;
    socket_.async_read_some(asio::buffer(buffer),
                            [&result, &received](const asio::error_code& error, size_t n) {
                                result = error;
                                received = n;
                            });
    runFor(timeout, "Read from");

    if (result == asio::error::eof) {
        return {};
    }
    if (result) {
        throw core::NetworkError(
            fmt::format("Read from {} failed: {}", remoteEndpoint(), result.message()));
    }

    buffer.resize(received);
    return buffer;
}

std::vector<uint8_t> TcpStream::readExactly(size_t size, std::chrono::milliseconds timeout) {
    if (!socket_.is_open()) {
        throw core::NetworkError(fmt::format("Read from closed stream {}", remoteEndpoint()));
    }

    std::vector<uint8_t> buffer(size);
    if (size == 0) {
        return buffer;
    }

    asio::error_code result = asio::error::would_block;
    asio::async_read(socket_, asio::buffer(buffer),
                     [&result](const asio::error_code& error, size_t) { result = error; });
    runFor(timeout, "Read from");

    if (result == asio::error::eof) {
        throw core::NetworkError(fmt::format("{} closed the connection", remoteEndpoint()));
    }
    if (result) {
        throw core::NetworkError(
            fmt::format("Read from {} failed: {}", remoteEndpoint(), result.message()));
    }
    return buffer;
}

void TcpStream::close() {
    if (socket_.is_open()) {
        asio::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }
}

bool TcpStream::isOpen() const {
    return socket_.is_open();
}

std::string TcpStream::remoteEndpoint() const {
    return host_ + ":" + std::to_string(port_);
}

std::unique_ptr<core::IByteStream> TcpTransport::connect(const std::string& host, uint16_t port,
                                                         std::chrono::milliseconds timeout) {
    auto stream = std::make_unique<TcpStream>(host, port);
    stream->open(timeout);
    return stream;
}

} // namespace camlink::infra
