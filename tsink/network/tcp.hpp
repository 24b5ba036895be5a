/*
 * Copyright (C) 2025 Agtonomy
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 */

#ifndef TSINK_NETWORK_TCP_HPP
#define TSINK_NETWORK_TCP_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "tsink/core/error_code.hpp"
#include "tsink/core/event_loop.hpp"

namespace tsink {
namespace network {

/**
 * TCP class for performing asynchronous IO on a connected TCP socket
 *
 * The class is a thin handle over a shared asio socket, so copies refer to the same connection. Handlers for pending
 * operations keep their own copy, which keeps the socket alive until they have run.
 */
class TCP {
 public:
  using SocketPtr = std::shared_ptr<asio::ip::tcp::socket>;
  using IOCompletionHandler = std::function<void(const tsink::core::error_code&, size_t)>;
  using CompletionHandler = std::function<void(const tsink::core::error_code&)>;

  /**
   * TCP constructor for an already created socket (such as from TCPServer or a resolved connect)
   *
   * @param socket shared pointer to underlying asio tcp socket
   */
  explicit TCP(SocketPtr socket) : socket_{std::move(socket)} {}

  /**
   * AsyncSend send data on the socket asynchronously
   *
   * @param data a pointer to the buffer to send
   * @param length the size of the data in the buffer
   * @param callback the completion handler
   */
  void AsyncSend(const void* data, size_t length, IOCompletionHandler callback) {
    socket_->async_send(asio::buffer(data, length), std::move(callback));
  }

  /**
   * AsyncReceive receive data on the socket asynchronously
   *
   * @param data a pointer to the buffer to receive data in
   * @param length the size of the buffer to receive data in
   * @param callback the completion handler
   */
  void AsyncReceive(void* data, size_t length, IOCompletionHandler callback) {
    socket_->async_receive(asio::buffer(data, length), std::move(callback));
  }

  /**
   * @brief Asynchronously send all data from the provided buffer.
   *
   * Keeps issuing sends until `size` bytes have gone out or an error occurs. The buffer must stay valid until the
   * callback runs.
   *
   * @param data     Pointer to the data buffer to send.
   * @param size     Total number of bytes to send from the buffer.
   * @param callback Completion handler to call once all data has been sent or an error occurs.
   * @param offset   (Internal) Number of bytes already sent; used for recursive continuation.
   */
  void AsyncSendAll(const void* data, size_t size, IOCompletionHandler callback, size_t offset = 0) {
    if (offset >= size) {
      callback({}, offset);
      return;
    }
    AsyncSend(static_cast<const uint8_t*>(data) + offset, size - offset,
              [self = *this, data, size, offset, callback = std::move(callback)](const tsink::core::error_code& ec,
                                                                                 size_t bytes_sent) mutable {
                if (ec) {
                  callback(ec, offset + bytes_sent);
                  return;
                }
                self.AsyncSendAll(data, size, std::move(callback), offset + bytes_sent);
              });
  }

  /*
   * IsOpen whether or not the underlying socket is in the open state
   */
  bool IsOpen() const { return socket_->is_open(); }

  /**
   * GetPort retrieve the port that this socket is bound to
   *
   * @return the local port number
   */
  uint16_t GetPort() const { return socket_->local_endpoint().port(); }

  /**
   * GetRemotePort retrieves the port that the remote peer is using (if available).
   *
   * @return optionally, the port number the remote endpoint is currently using if connected
   */
  std::optional<uint16_t> GetRemotePort() const {
    tsink::core::error_code ec;
    const auto ep = socket_->remote_endpoint(ec);
    if (!ec) {
      return ep.port();
    }
    return {};
  }

  /**
   * Shut down the send direction, signalling end-of-stream to the peer
   */
  void ShutdownSend() {
    tsink::core::error_code ec;
    socket_->shutdown(asio::ip::tcp::socket::shutdown_send, ec);
  }

  /**
   * Close the underlying socket, cancelling pending operations
   *
   * Errors are ignored since the socket is being discarded.
   */
  void Close() {
    tsink::core::error_code ec;
    socket_->close(ec);
  }

 private:
  SocketPtr socket_;
};

/**
 * TCPServer class to manage a passive socket responsible for listening/accepting inbound connections
 */
class TCPServer {
 public:
  using NewConnectionHandler = std::function<void(const tsink::core::error_code&, TCP)>;

  /**
   * TCPServer construct a server instance listening on the IPv4 loopback address
   *
   * @param loop the event loop thread handle to use for IO
   * @param ipv4_listen_port the ipv4 port to listen on (0 lets the OS pick one)
   * @param callback the handler for new inbound connections
   */
  TCPServer(tsink::core::EventLoop loop, uint16_t ipv4_listen_port, NewConnectionHandler callback)
      : loop_{loop},
        acceptor_{*loop, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), ipv4_listen_port)},
        connection_callback_{std::move(callback)} {
    AcceptNextConnection();
  }

  uint16_t GetPort() const { return acceptor_.local_endpoint().port(); }
  std::string GetAddress() const { return acceptor_.local_endpoint().address().to_string(); }

  /**
   * Stop accepting connections. Must be called from the loop thread or after the loop has stopped.
   */
  void Close() {
    tsink::core::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void AcceptNextConnection() {
    auto socket = std::make_shared<asio::ip::tcp::socket>(*loop_);
    acceptor_.async_accept(*socket, [this, socket](const tsink::core::error_code& error) {
      if (error == asio::error::operation_aborted) {
        // Exit immediately because `this` would have been invalidated
        return;
      }
      connection_callback_(error, TCP(socket));
      AcceptNextConnection();
    });
  }

  tsink::core::EventLoop loop_;
  asio::ip::tcp::acceptor acceptor_;
  NewConnectionHandler connection_callback_;
};

}  // namespace network
}  // namespace tsink

#endif  // TSINK_NETWORK_TCP_HPP
