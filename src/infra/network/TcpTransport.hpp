#pragma once

#include "core/services/ITransport.hpp"

#include <asio.hpp>
#include <chrono>
#include <string>

namespace camlink::infra {

/**
 * @brief Blocking TCP stream with per-operation timeouts.
 *
 * Each stream owns a private asio::io_context and drives it with run_for(),
 * so a stalled peer never blocks the shared worker pool. Not thread-safe;
 * one owner at a time.
 */
class TcpStream : public core::IByteStream {
public:
    TcpStream(std::string host, uint16_t port);
    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    /**
     * @brief Resolves the host and connects.
     * @param timeout Maximum time to wait for the connection.
     * @throws TimeoutError, ConnectionRefusedError or NetworkError.
     */
    void open(std::chrono::milliseconds timeout);

    void write(const std::vector<uint8_t>& data, std::chrono::milliseconds timeout) override;
    std::vector<uint8_t> readSome(std::chrono::milliseconds timeout) override;
    std::vector<uint8_t> readExactly(size_t size, std::chrono::milliseconds timeout) override;
    void close() override;
    bool isOpen() const override;
    std::string remoteEndpoint() const override;

private:
    void runFor(std::chrono::milliseconds timeout, const char* operation);

    asio::io_context ioContext_;
    asio::ip::tcp::socket socket_;
    std::string host_;
    uint16_t port_;
};

/**
 * @brief Opens real TCP streams.
 */
class TcpTransport : public core::ITransportFactory {
public:
    std::unique_ptr<core::IByteStream> connect(const std::string& host, uint16_t port,
                                               std::chrono::milliseconds timeout) override;
};

} // namespace camlink::infra
