/**
 * @file ITransport.hpp
 * @brief Interface for timeout-bound TCP byte streams.
 *
 * Every protocol client (HTTP, RTSP, vendor binary) talks to a camera through
 * this seam, so the protocol logic can run against an in-process transport.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace camlink::core {

/**
 * @brief A connected, bidirectional byte stream.
 *
 * All operations are bounded by a timeout. Transport failures are reported
 * as NetworkError (TimeoutError, ConnectionRefusedError).
 */
class IByteStream {
public:
    virtual ~IByteStream() = default;

    /**
     * @brief Writes all bytes to the peer.
     * @param data Bytes to send.
     * @param timeout Maximum time to wait for the write to complete.
     * @throws NetworkError if the stream is closed or the write fails.
     */
    virtual void write(const std::vector<uint8_t>& data, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Reads whatever the peer has sent, at least one byte.
     * @param timeout Maximum time to wait for data.
     * @return Received bytes, or an empty vector if the peer closed the stream.
     * @throws TimeoutError if nothing arrives in time.
     */
    virtual std::vector<uint8_t> readSome(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Reads exactly the requested number of bytes.
     * @param size Number of bytes to read.
     * @param timeout Maximum time to wait for all bytes.
     * @return Exactly size bytes.
     * @throws TimeoutError if the bytes do not arrive in time.
     * @throws NetworkError if the peer closes the stream first.
     */
    virtual std::vector<uint8_t> readExactly(size_t size, std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /**
     * @brief Returns "host:port" of the peer for logging.
     */
    virtual std::string remoteEndpoint() const = 0;
};

/**
 * @brief Opens byte streams to remote endpoints.
 */
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    /**
     * @brief Connects to a TCP endpoint.
     * @param host IPv4 address or hostname.
     * @param port TCP port.
     * @param timeout Maximum time to wait for the connection.
     * @return Connected stream.
     * @throws TimeoutError, ConnectionRefusedError or NetworkError.
     */
    virtual std::unique_ptr<IByteStream> connect(const std::string& host, uint16_t port,
                                                 std::chrono::milliseconds timeout) = 0;
};

} // namespace camlink::core
