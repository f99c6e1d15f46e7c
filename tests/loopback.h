// Loopback socket helpers and a fixture that plays the client and device
// roles around a gateway. The IPTV side is 127.0.0.1 and the client lives on
// 127.0.0.2, so the client's listener and the gateway's accept socket can
// share a port number.
#pragma once

#include "zappa/test_hooks.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace loopback {

constexpr const char* kIptvAddress = "127.0.0.1";
constexpr const char* kClientAddress = "127.0.0.2";
constexpr int kIoTimeoutMs = 3000;

class Fd {
 public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd() { Reset(); }

  Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  Fd& operator=(Fd&& other) noexcept {
    if (this != &other) {
      Reset();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;

  void Reset() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

 private:
  int fd_ = -1;
};

inline sockaddr_in Address(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, address.c_str(), &addr.sin_addr);
  return addr;
}

inline uint16_t LocalPort(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
    return 0;
  }
  return ntohs(addr.sin_port);
}

inline bool WaitReadable(int fd, int timeout_ms) {
  pollfd entry{};
  entry.fd = fd;
  entry.events = POLLIN;
  return ::poll(&entry, 1, timeout_ms) > 0;
}

// Listening TCP socket on address:port (port 0 picks one).
inline Fd ListenTcp(const std::string& address, uint16_t port) {
  Fd fd(::socket(AF_INET, SOCK_STREAM, 0));
  int reuse = 1;
  ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
  sockaddr_in addr = Address(address, port);
  if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
      ::listen(fd.get(), 4) < 0) {
    return Fd();
  }
  return fd;
}

inline Fd ConnectTcp(const std::string& address, uint16_t port) {
  Fd fd(::socket(AF_INET, SOCK_STREAM, 0));
  sockaddr_in addr = Address(address, port);
  if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    return Fd();
  }
  return fd;
}

inline Fd AcceptWithin(int listen_fd, int timeout_ms) {
  if (!WaitReadable(listen_fd, timeout_ms)) {
    return Fd();
  }
  return Fd(::accept(listen_fd, nullptr, nullptr));
}

inline Fd BindUdp(const std::string& address, uint16_t port) {
  Fd fd(::socket(AF_INET, SOCK_DGRAM, 0));
  sockaddr_in addr = Address(address, port);
  if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    return Fd();
  }
  return fd;
}

struct Datagram {
  std::vector<uint8_t> payload;
  std::string source_address;
  uint16_t source_port = 0;
};

inline std::optional<Datagram> ReceiveDatagram(int fd, int timeout_ms) {
  if (!WaitReadable(fd, timeout_ms)) {
    return std::nullopt;
  }
  std::vector<uint8_t> buffer(65536);
  sockaddr_in from{};
  socklen_t from_len = sizeof(from);
  const ssize_t bytes = ::recvfrom(fd, buffer.data(), buffer.size(), 0,
                                   reinterpret_cast<sockaddr*>(&from), &from_len);
  if (bytes < 0) {
    return std::nullopt;
  }
  buffer.resize(static_cast<size_t>(bytes));
  char text[INET_ADDRSTRLEN] = {0};
  inet_ntop(AF_INET, &from.sin_addr, text, sizeof(text));
  return Datagram{buffer, text, ntohs(from.sin_port)};
}

inline bool SendAll(int fd, const std::vector<uint8_t>& data) {
  size_t offset = 0;
  while (offset < data.size()) {
    const ssize_t sent =
        ::send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
    if (sent <= 0) {
      return false;
    }
    offset += static_cast<size_t>(sent);
  }
  return true;
}

inline std::optional<std::vector<uint8_t>> ReadExactly(int fd, size_t length,
                                                       int timeout_ms) {
  std::vector<uint8_t> out(length);
  size_t offset = 0;
  while (offset < length) {
    if (!WaitReadable(fd, timeout_ms)) {
      return std::nullopt;
    }
    const ssize_t bytes = ::recv(fd, out.data() + offset, length - offset, 0);
    if (bytes <= 0) {
      return std::nullopt;
    }
    offset += static_cast<size_t>(bytes);
  }
  return out;
}

// True once the peer has closed (EOF or reset).
inline bool WaitForClose(int fd, int timeout_ms) {
  if (!WaitReadable(fd, timeout_ms)) {
    return false;
  }
  uint8_t byte = 0;
  return ::recv(fd, &byte, 1, 0) <= 0;
}

template <typename Predicate>
bool WaitFor(Predicate predicate,
             std::chrono::milliseconds timeout = std::chrono::milliseconds(kIoTimeoutMs)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

inline std::vector<uint8_t> Bytes(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

inline std::vector<uint8_t> Pattern(size_t length, uint8_t seed) {
  std::vector<uint8_t> data(length);
  for (size_t i = 0; i < length; ++i) {
    data[i] = static_cast<uint8_t>((i * 31 + seed) & 0xff);
  }
  return data;
}

inline std::optional<zappa::SessionInfo> FindSession(const zappa::Gateway& gateway,
                                                     uint16_t port) {
  for (const auto& session : gateway.GetSessions()) {
    if (session.source_port == port) {
      return session;
    }
  }
  return std::nullopt;
}

// A gateway with one discovered session. The test owns the client listener
// (127.0.0.2:port), the forward sink, and whatever device connections it opens.
class RelayTest : public ::testing::Test {
 protected:
  void SetUp() override {
    client_listener_ = ListenTcp(kClientAddress, 0);
    ASSERT_TRUE(client_listener_.valid());
    port_ = LocalPort(client_listener_.get());
    ASSERT_NE(port_, 0);

    sink_ = BindUdp(kIptvAddress, 0);
    ASSERT_TRUE(sink_.valid());

    zappa::Config config;
    config.lan_address = kClientAddress;
    config.iptv_address = kIptvAddress;
    config.log_callback = [](const std::string&) {};
    gateway_ = std::make_unique<zappa::Gateway>(config);
    zappa::test::SetForwardTarget(*gateway_, kIptvAddress, LocalPort(sink_.get()));

    ASSERT_TRUE(zappa::test::InjectDiscovery(*gateway_, Bytes("HELLO"),
                                             kClientAddress, port_));
    ASSERT_TRUE(ReceiveDatagram(sink_.get(), kIoTimeoutMs).has_value());
  }

  void TearDown() override { gateway_.reset(); }

  zappa::SessionState State() const {
    auto session = FindSession(*gateway_, port_);
    return session ? session->state : zappa::SessionState::kListening;
  }

  zappa::SessionInfo Session() const {
    auto session = FindSession(*gateway_, port_);
    return session.value_or(zappa::SessionInfo{});
  }

  // Play the device: connect to the gateway, then accept the relayed client
  // connection and wait until both pumps run.
  void Pair(Fd* device, Fd* client) {
    zappa::test::RunTick(*gateway_);
    *device = ConnectTcp(kIptvAddress, port_);
    ASSERT_TRUE(device->valid());
    *client = AcceptWithin(client_listener_.get(), kIoTimeoutMs);
    ASSERT_TRUE(client->valid());
    ASSERT_TRUE(WaitFor([&]() { return State() == zappa::SessionState::kAccepted; }));
    zappa::test::RunTick(*gateway_);
    const zappa::SessionInfo info = Session();
    ASSERT_TRUE(info.forward_to_client_running);
    ASSERT_TRUE(info.forward_to_device_running);
  }

  Fd client_listener_;
  Fd sink_;
  uint16_t port_ = 0;
  std::unique_ptr<zappa::Gateway> gateway_;
};

}  // namespace loopback
