#include "OutboundConnection.hpp"

namespace lantext {

    OutboundConnection::OutboundConnection(std::chrono::milliseconds timeout)
        : io(), sock(io), timeout(timeout) {}

    OutboundConnection::~OutboundConnection() {
        close();
    }

    bool OutboundConnection::connect(const std::string& host, uint16_t port) {
        boost::system::error_code ec;
        tcp::resolver resolver(io);
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            error = "Resolve failed for " + host + ": " + ec.message();
            return false;
        }

        boost::system::error_code result = boost::asio::error::would_block;
        boost::asio::async_connect(sock, endpoints,
            [&result](const boost::system::error_code& connectError, const tcp::endpoint&) {
                result = connectError;
            });

        if (!runFor(timeout)) {
            error = "Connection timeout - peer at " + host + ":" + std::to_string(port) + " not responding";
            return false;
        }

        if (result == boost::asio::error::connection_refused) {
            error = "Connection refused - peer at " + host + ":" + std::to_string(port) + " not available";
            return false;
        }
        if (result) {
            error = "Connect failed: " + result.message();
            return false;
        }

        error.clear();
        return true;
    }

    bool OutboundConnection::write(const std::vector<uint8_t>& buf) {
        if (!sock.is_open()) {
            error = "Cannot send - not connected";
            return false;
        }

        boost::system::error_code result = boost::asio::error::would_block;
        boost::asio::async_write(sock, boost::asio::buffer(buf),
            [&result](const boost::system::error_code& writeError, std::size_t) {
                result = writeError;
            });

        if (!runFor(timeout)) {
            error = "Write timed out";
            return false;
        }

        if (result) {
            error = "Send error: " + result.message();
            close();
            return false;
        }

        return true;
    }

    void OutboundConnection::close() {
        if (!sock.is_open()) return;

        boost::system::error_code ec;
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);
    }

    bool OutboundConnection::isOpen() const {
        return sock.is_open();
    }

    bool OutboundConnection::runFor(std::chrono::milliseconds limit) {
        io.restart();
        io.run_for(limit);

        if (!io.stopped()) {
            // Deadline passed with the operation still pending: cancel it and let its
            // handler run so no state outlives this call
            boost::system::error_code ec;
            sock.close(ec);
            io.run();
            return false;
        }

        return true;
    }

} // namespace lantext
