#include "tcp_server.hpp"
#include "protocol.hpp"

#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace recon {
namespace network {

using observability::LogLevel;

namespace {

constexpr size_t kMaxMessageSize = 16 * 1024 * 1024;

}  // namespace

TCPServer::TCPServer(int port, RequestHandler handler)
    : port_(port),
      server_socket_(-1),
      request_handler_(std::move(handler)),
      running_(false) {
}

TCPServer::~TCPServer() {
  stop();
}

bool TCPServer::start() {
  // Create socket
  server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (server_socket_ < 0) {
    LOG_ERROR("Failed to create socket");
    return false;
  }

  // Set socket options
  int opt = 1;
  if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    LOG_ERROR("Failed to set socket options");
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  // Bind socket
  struct sockaddr_in address {};
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = INADDR_ANY;
  address.sin_port = htons(static_cast<uint16_t>(port_));

  if (bind(server_socket_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
    LOG_BUILDER(LogLevel::ERROR, "Failed to bind socket").field("port", port_);
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  socklen_t address_len = sizeof(address);
  if (getsockname(server_socket_, reinterpret_cast<struct sockaddr*>(&address),
                  &address_len) == 0) {
    port_ = ntohs(address.sin_port);
  }

  // Listen for connections
  if (listen(server_socket_, 16) < 0) {
    LOG_ERROR("Failed to listen on socket");
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  running_ = true;
  accept_thread_ = std::make_unique<std::thread>(&TCPServer::acceptLoop, this);

  LOG_BUILDER(LogLevel::INFO, "TCP server started").field("port", port_);
  return true;
}

void TCPServer::stop() {
  if (!running_) return;

  running_ = false;

  // Close server socket to break accept loop
  if (server_socket_ >= 0) {
    shutdown(server_socket_, SHUT_RDWR);
    close(server_socket_);
    server_socket_ = -1;
  }

  // Wait for accept thread
  if (accept_thread_ && accept_thread_->joinable()) {
    accept_thread_->join();
  }

  // Unblock client reads, then join outside the lock (clients take it on exit)
  std::unordered_map<int, std::unique_ptr<std::thread>> clients;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& pair : client_threads_) {
      shutdown(pair.first, SHUT_RDWR);
    }
    clients.swap(client_threads_);
    finished_clients_.clear();
  }
  for (auto& pair : clients) {
    if (pair.second && pair.second->joinable()) {
      pair.second->join();
    }
  }

  LOG_INFO("TCP server stopped");
}

void TCPServer::acceptLoop() {
  while (running_) {
    struct sockaddr_in client_address {};
    socklen_t client_addr_len = sizeof(client_address);

    int client_socket = accept(server_socket_,
                               reinterpret_cast<struct sockaddr*>(&client_address),
                               &client_addr_len);

    if (client_socket < 0) {
      if (running_) {
        LOG_WARN("Failed to accept connection");
      }
      continue;
    }

    reapFinishedClients();

    // Get client address for logging
    char client_ip[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &client_address.sin_addr, client_ip, INET_ADDRSTRLEN);
    std::string client_addr = std::string(client_ip) + ":" +
                              std::to_string(ntohs(client_address.sin_port));

    LOG_BUILDER(LogLevel::DEBUG, "Accepted connection").field("client", client_addr);
    observability::getGlobalMetrics().incrementCounter("recon_connections_total");

    // Handle client in separate thread
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      client_threads_[client_socket] =
          std::make_unique<std::thread>(&TCPServer::handleClient, this,
                                        client_socket, client_addr);
    }
  }
}

void TCPServer::handleClient(int client_socket, std::string client_addr) {
  char buffer[4096];
  std::string message_buffer;

  while (running_) {
    ssize_t bytes_read = read(client_socket, buffer, sizeof(buffer));

    if (bytes_read <= 0) {
      if (bytes_read < 0 && running_) {
        LOG_BUILDER(LogLevel::WARN, "Error reading from client").field("client", client_addr);
      }
      break;
    }

    message_buffer.append(buffer, static_cast<size_t>(bytes_read));

    // Process complete messages
    bool connection_ok = true;
    try {
      while (protocol::MessageFramer::isCompleteMessage(message_buffer)) {
        size_t framed_size = protocol::MessageFramer::framedSize(message_buffer);
        std::string request_json = protocol::MessageFramer::unframeMessage(message_buffer);
        message_buffer.erase(0, framed_size);

        std::string response_json = request_handler_(request_json);
        if (!writeAll(client_socket, protocol::MessageFramer::frameMessage(response_json))) {
          LOG_BUILDER(LogLevel::WARN, "Error writing to client").field("client", client_addr);
          connection_ok = false;
          break;
        }
      }
      if (message_buffer.size() >= protocol::MessageFramer::kHeaderSize &&
          protocol::MessageFramer::framedSize(message_buffer) > kMaxMessageSize) {
        throw std::runtime_error("Message exceeds maximum size");
      }
    } catch (const std::exception& e) {
      // Broken frame: answer once and drop the connection.
      LOG_BUILDER(LogLevel::WARN, "Invalid frame from client")
          .field("client", client_addr)
          .field("error", e.what());
      auto error_response = protocol::Response::error(
          protocol::Status::INVALID_REQUEST, std::string("Invalid frame: ") + e.what(), 0);
      if (!writeAll(client_socket, protocol::MessageFramer::frameMessage(
                                       protocol::serializeResponse(error_response)))) {
        LOG_BUILDER(LogLevel::DEBUG, "Client gone before error reply").field("client", client_addr);
      }
      connection_ok = false;
    }
    if (!connection_ok) break;
  }

  // Mark finished before the descriptor can be reused by accept().
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (client_threads_.count(client_socket)) {
      finished_clients_.push_back(client_socket);
    }
  }
  close(client_socket);
  LOG_BUILDER(LogLevel::DEBUG, "Closed connection").field("client", client_addr);
}

bool TCPServer::writeAll(int client_socket, const std::string& data) {
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = send(client_socket, data.data() + written, data.size() - written, MSG_NOSIGNAL);
    if (n <= 0) return false;
    written += static_cast<size_t>(n);
  }
  return true;
}

void TCPServer::reapFinishedClients() {
  std::vector<std::unique_ptr<std::thread>> finished;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (int socket : finished_clients_) {
      auto it = client_threads_.find(socket);
      if (it != client_threads_.end()) {
        finished.push_back(std::move(it->second));
        client_threads_.erase(it);
      }
    }
    finished_clients_.clear();
  }
  for (auto& thread : finished) {
    if (thread && thread->joinable()) {
      thread->join();
    }
  }
}

size_t TCPServer::getConnectionCount() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return client_threads_.size() - finished_clients_.size();
}

}  // namespace network
}  // namespace recon
