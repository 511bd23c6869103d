#ifndef LANTEXT_OUTBOUND_CONNECTION_HPP
#define LANTEXT_OUTBOUND_CONNECTION_HPP

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lantext {

using tcp = boost::asio::ip::tcp;

/**
 * Blocking TCP client used for every outbound send. Each operation runs on a private
 * io_context for at most `timeout`; when the deadline passes the socket is closed and the
 * operation reports failure.
 */
class OutboundConnection {
public:
    explicit OutboundConnection(std::chrono::milliseconds timeout);

    /**
     * Closes the socket if it is still open.
     */
    ~OutboundConnection();

    OutboundConnection(const OutboundConnection&) = delete;
    OutboundConnection& operator=(const OutboundConnection&) = delete;

    /**
     * Resolves `host` and connects to it.
     *
     * @param host IP address or host name of the peer.
     * @param port TCP messaging port of the peer.
     * @return true once connected; false on timeout, refusal or resolve failure, with the
     * reason available from lastError().
     */
    bool connect(const std::string& host, uint16_t port);

    /**
     * Writes the whole buffer or fails.
     *
     * @param buf Bytes to send, typically an encoded frame.
     * @return false if the write failed or did not complete before the timeout.
     */
    bool write(const std::vector<uint8_t>& buf);

    /**
     * Shuts down and closes the socket. Errors are ignored; the peer sees end of stream.
     */
    void close();

    bool isOpen() const;

    const std::string& lastError() const { return error; }

private:
    /**
     * Runs the io_context until the pending operation finishes or the deadline expires.
     * @return false on timeout, in which case the socket has been closed.
     */
    bool runFor(std::chrono::milliseconds limit);

    boost::asio::io_context io;
    tcp::socket sock;
    std::chrono::milliseconds timeout;
    std::string error;
};

} // namespace lantext

#endif // LANTEXT_OUTBOUND_CONNECTION_HPP
