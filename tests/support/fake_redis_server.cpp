#include "support/fake_redis_server.hpp"

#include "cachify/redis_store.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <charconv>
#include <chrono>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace cachify::testing {
namespace {

std::string upper(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

} // namespace

FakeRedisServer::FakeRedisServer(std::string password)
    : password_(std::move(password)) {
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0)
    throw std::runtime_error("socket failed");
  int one = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) <
          0 ||
      ::listen(listen_fd_, 64) < 0) {
    ::close(listen_fd_);
    throw std::runtime_error("bind/listen failed");
  }
  socklen_t len = sizeof(addr);
  getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
  port_ = ntohs(addr.sin_port);
  thread_ = std::thread([this] { serve(); });
}

FakeRedisServer::~FakeRedisServer() {
  running_ = false;
  if (thread_.joinable())
    thread_.join();
  for (auto &[fd, client] : clients_)
    ::close(fd);
  ::close(listen_fd_);
}

std::string FakeRedisServer::url() const {
  std::string auth = password_.empty() ? "" : ":" + password_ + "@";
  return "redis://" + auth + "127.0.0.1:" + std::to_string(port_) + "/0";
}

std::vector<std::string> FakeRedisServer::command_log() const {
  std::lock_guard<std::mutex> lk(log_mu_);
  return log_;
}

void FakeRedisServer::serve() {
  while (running_) {
    if (drop_.exchange(false)) {
      for (auto &[fd, client] : clients_)
        ::close(fd);
      clients_.clear();
    }

    std::vector<pollfd> fds;
    fds.push_back({listen_fd_, POLLIN, 0});
    for (auto &[fd, client] : clients_)
      fds.push_back({fd, POLLIN, 0});
    if (::poll(fds.data(), fds.size(), 20) <= 0)
      continue;

    if (fds[0].revents & POLLIN) {
      int cfd = ::accept(listen_fd_, nullptr, nullptr);
      if (cfd >= 0) {
        clients_.emplace(cfd, Client{});
        ++connections_;
      }
    }

    for (std::size_t i = 1; i < fds.size(); ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;
      const int fd = fds[i].fd;
      auto &client = clients_.at(fd);
      char buf[4096];
      const auto n = ::recv(fd, buf, sizeof(buf), 0);
      if (n <= 0) {
        ::close(fd);
        clients_.erase(fd);
        continue;
      }
      client.reader.feed(buf, static_cast<std::size_t>(n));
      std::vector<std::string> cmd;
      auto status = CommandReader::Status::need_more;
      while ((status = client.reader.next(cmd)) ==
             CommandReader::Status::ready)
        client.out += handle(client, cmd);
      if (status == CommandReader::Status::protocol_error)
        client.out += reply::error("ERR Protocol error");
      if (!client.out.empty()) {
        if (const int ms = delay_ms_; ms > 0)
          std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        ::send(fd, client.out.data(), client.out.size(), MSG_NOSIGNAL);
        client.out.clear();
      }
      if (status == CommandReader::Status::protocol_error) {
        ::close(fd);
        clients_.erase(fd);
      }
    }
  }
}

std::string FakeRedisServer::handle(Client &client,
                                    const std::vector<std::string> &cmd) {
  ++commands_;
  const std::string name = upper(cmd[0]);
  {
    std::string line;
    for (std::size_t i = 0; i < cmd.size(); ++i)
      line += (i ? " " : "") + (i ? cmd[i] : name);
    std::lock_guard<std::mutex> lk(log_mu_);
    log_.push_back(std::move(line));
  }

  if (name == "AUTH") {
    if (password_.empty())
      return reply::error("ERR AUTH called without any password configured");
    if (cmd.size() < 2 || cmd.back() != password_)
      return reply::error("WRONGPASS invalid username-password pair");
    client.authed = true;
    return reply::status("OK");
  }
  if (!password_.empty() && !client.authed)
    return reply::error("NOAUTH Authentication required.");
  if (fail_next_ > 0) {
    --fail_next_;
    return reply::error("ERR injected failure");
  }

  if (name == "PING")
    return reply::status("PONG");
  if (name == "SELECT")
    return reply::status("OK");
  if (name == "GET" && cmd.size() == 2) {
    auto v = data_.get(cmd[1]);
    return v ? reply::bulk(*v) : reply::nil();
  }
  if (name == "SET" && cmd.size() >= 3) {
    bool nx = false;
    std::int64_t px = 0;
    for (std::size_t i = 3; i < cmd.size(); ++i) {
      const std::string opt = upper(cmd[i]);
      if (opt == "NX") {
        nx = true;
      } else if (opt == "PX" && i + 1 < cmd.size()) {
        const auto &arg = cmd[++i];
        auto res = std::from_chars(arg.data(), arg.data() + arg.size(), px);
        if (res.ec != std::errc() || px <= 0)
          return reply::error("ERR invalid expire time in 'set' command");
      } else {
        return reply::error("ERR syntax error");
      }
    }
    if (nx && data_.exists(cmd[1]))
      return reply::nil();
    data_.set(cmd[1], cmd[2], Duration(px));
    return reply::status("OK");
  }
  if (name == "DEL" && cmd.size() >= 2) {
    long long removed = 0;
    for (std::size_t i = 1; i < cmd.size(); ++i) {
      if (data_.exists(cmd[i])) {
        data_.del(cmd[i]);
        ++removed;
      }
    }
    return reply::integer(removed);
  }
  if (name == "EXISTS" && cmd.size() == 2)
    return reply::integer(data_.exists(cmd[1]) ? 1 : 0);
  if (name == "EVAL" && cmd.size() == 5) {
    if (cmd[1] != kReleaseScript || cmd[2] != "1")
      return reply::error("ERR unsupported script");
    auto v = data_.get(cmd[3]);
    if (v && *v == cmd[4]) {
      data_.del(cmd[3]);
      return reply::integer(1);
    }
    return reply::integer(0);
  }
  return reply::error("ERR unknown command '" + cmd[0] + "'");
}

} // namespace cachify::testing
