#include "LoopbackScpiServer.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace benchio {
namespace test {

LoopbackScpiServer::LoopbackScpiServer(Responder responder)
    : responder_(std::move(responder)) {
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    throw std::runtime_error("socket() failed");
  }
  int one = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  if (::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) <
          0 ||
      ::listen(listen_fd_, 4) < 0) {
    ::close(listen_fd_);
    throw std::runtime_error("bind/listen on loopback failed");
  }

  socklen_t len = sizeof(addr);
  getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
  port_ = ntohs(addr.sin_port);

  running_ = true;
  thread_ = std::thread([this] { serve(); });
}

LoopbackScpiServer::~LoopbackScpiServer() { stop(); }

std::vector<std::string> LoopbackScpiServer::received() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return received_;
}

void LoopbackScpiServer::stop() {
  running_ = false;
  if (thread_.joinable())
    thread_.join();
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
}

void LoopbackScpiServer::serve() {
  while (running_) {
    pollfd pfd{listen_fd_, POLLIN, 0};
    if (::poll(&pfd, 1, 50) <= 0)
      continue;
    int client = ::accept(listen_fd_, nullptr, nullptr);
    if (client < 0)
      continue;
    serve_client(client);
    ::close(client);
  }
}

void LoopbackScpiServer::serve_client(int client) {
  std::string buffer;
  char chunk[1024];

  while (running_) {
    pollfd pfd{client, POLLIN, 0};
    if (::poll(&pfd, 1, 50) <= 0)
      continue;
    ssize_t n = ::recv(client, chunk, sizeof(chunk), 0);
    if (n <= 0)
      return;
    buffer.append(chunk, static_cast<size_t>(n));

    size_t eol;
    while ((eol = buffer.find('\n')) != std::string::npos) {
      std::string line = buffer.substr(0, eol);
      buffer.erase(0, eol + 1);
      if (!line.empty() && line.back() == '\r')
        line.pop_back();

      {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.push_back(line);
      }

      std::optional<ScpiReply> reply = responder_(line);
      if (!reply)
        continue;
      if (!reply->text.empty()) {
        ::send(client, reply->text.data(), reply->text.size(), MSG_NOSIGNAL);
      }
      if (reply->hang_up)
        return;
    }
  }
}

} // namespace test
} // namespace benchio
