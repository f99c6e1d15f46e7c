// Example: act as the LAN-side client. Emit a discovery datagram from an
// ephemeral port and print whatever the gateway relays back over TCP.
#include "zappa/zappa.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr int kAcceptTimeoutMs = 10000;

class ScopedFd {
 public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const { return fd_; }

 private:
  int fd_;
};

int Fail(const std::string& what) {
  std::cerr << what << " failed: " << std::strerror(errno) << std::endl;
  return 1;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cout << "Usage: zappa_probe <lan ip> [payload]\n";
    return 1;
  }
  const std::string lan_address = argv[1];
  const std::string payload = argc > 2 ? argv[2] : "HELLO";

  sockaddr_in local{};
  local.sin_family = AF_INET;
  if (inet_pton(AF_INET, lan_address.c_str(), &local.sin_addr) != 1) {
    std::cerr << "Invalid LAN address: " << lan_address << std::endl;
    return 1;
  }

  ScopedFd listener(::socket(AF_INET, SOCK_STREAM, 0));
  if (listener.get() < 0) {
    return Fail("socket(tcp)");
  }
  if (::bind(listener.get(), reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
    return Fail("bind(tcp)");
  }
  if (::listen(listener.get(), 1) < 0) {
    return Fail("listen");
  }
  socklen_t local_len = sizeof(local);
  if (::getsockname(listener.get(), reinterpret_cast<sockaddr*>(&local), &local_len) < 0) {
    return Fail("getsockname");
  }
  const uint16_t port = ntohs(local.sin_port);

  // The discovery datagram must leave from the port the gateway will connect back to.
  ScopedFd sender(::socket(AF_INET, SOCK_DGRAM, 0));
  if (sender.get() < 0) {
    return Fail("socket(udp)");
  }
  if (::bind(sender.get(), reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
    return Fail("bind(udp)");
  }
  if (::setsockopt(sender.get(), IPPROTO_IP, IP_MULTICAST_IF, &local.sin_addr,
                   sizeof(local.sin_addr)) < 0) {
    return Fail("setsockopt(IP_MULTICAST_IF)");
  }
  sockaddr_in group{};
  group.sin_family = AF_INET;
  group.sin_port = htons(zappa::kDiscoveryPort);
  inet_pton(AF_INET, zappa::kDiscoveryGroup, &group.sin_addr);
  if (::sendto(sender.get(), payload.data(), payload.size(), 0,
               reinterpret_cast<sockaddr*>(&group), sizeof(group)) < 0) {
    return Fail("sendto");
  }
  std::cout << "Sent \"" << payload << "\" from " << lan_address << ":" << port
            << ", waiting for the relayed connection..." << std::endl;

  pollfd entry{};
  entry.fd = listener.get();
  entry.events = POLLIN;
  const int ready = ::poll(&entry, 1, kAcceptTimeoutMs);
  if (ready < 0) {
    return Fail("poll");
  }
  if (ready == 0) {
    std::cerr << "No connection within " << kAcceptTimeoutMs / 1000 << " s" << std::endl;
    return 1;
  }
  ScopedFd conn(::accept(listener.get(), nullptr, nullptr));
  if (conn.get() < 0) {
    return Fail("accept");
  }
  std::cout << "Connected. Relayed data follows." << std::endl;

  char buffer[zappa::kRelayBufferSize];
  for (;;) {
    const ssize_t bytes = ::recv(conn.get(), buffer, sizeof(buffer), 0);
    if (bytes < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Fail("recv");
    }
    if (bytes == 0) {
      break;
    }
    std::cout.write(buffer, bytes);
    std::cout.flush();
  }
  std::cout << std::endl << "Connection closed." << std::endl;
  return 0;
}
