#include "device-inspector/errors.hpp"
#include "device-inspector/transport/TelnetStream.hpp"

#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace devinspect;
using namespace devinspect::transport;

namespace {
std::string bytes(std::initializer_list<int> values) {
  std::string out;
  for (int v : values)
    out += static_cast<char>(v);
  return out;
}
} // namespace

TEST(TelnetStream, Filter_PlainData) {
  TelnetStream stream(-1);
  EXPECT_EQ(stream.filter("Login: "), "Login: ");
  EXPECT_TRUE(stream.pending_replies().empty());
}

TEST(TelnetStream, Filter_RefusesDo) {
  TelnetStream stream(-1);
  EXPECT_EQ(stream.filter(bytes({255, 253, 1}) + "x"), "x");
  EXPECT_EQ(stream.pending_replies(), bytes({255, 252, 1}));
}

TEST(TelnetStream, Filter_RefusesWill) {
  TelnetStream stream(-1);
  EXPECT_EQ(stream.filter(bytes({255, 251, 3})), "");
  EXPECT_EQ(stream.pending_replies(), bytes({255, 254, 3}));
}

TEST(TelnetStream, Filter_EscapedIac) {
  TelnetStream stream(-1);
  EXPECT_EQ(stream.filter(bytes({'a', 255, 255, 'b'})), bytes({'a', 255, 'b'}));
}

TEST(TelnetStream, Filter_CommandSplitAcrossReads) {
  TelnetStream stream(-1);
  EXPECT_EQ(stream.filter(bytes({255})), "");
  EXPECT_EQ(stream.filter(bytes({253, 24}) + "hi"), "hi");
  EXPECT_EQ(stream.pending_replies(), bytes({255, 252, 24}));
}

TEST(TelnetStream, Filter_SkipsSubnegotiation) {
  TelnetStream stream(-1);
  EXPECT_EQ(stream.filter(bytes({255, 250, 24, 1, 255, 240}) + "ok"), "ok");
}

TEST(TelnetStream, Filter_DropsNul) {
  TelnetStream stream(-1);
  EXPECT_EQ(stream.filter(std::string("a\0b", 3)), "ab");
}

TEST(TelnetStream, SocketPair_ReadRepliesAndWrite) {
  int fds[2];
  ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
  TelnetStream stream(fds[0]);

  std::string greeting = bytes({255, 253, 1}) + "Login: ";
  ASSERT_EQ(::write(fds[1], greeting.data(), greeting.size()),
            static_cast<ssize_t>(greeting.size()));

  EXPECT_EQ(stream.read_some(std::chrono::milliseconds(1000)), "Login: ");

  char buf[16];
  ssize_t n = ::read(fds[1], buf, sizeof(buf));
  ASSERT_EQ(n, 3);
  EXPECT_EQ(std::string(buf, 3), bytes({255, 252, 1}));

  stream.write("admin\r\n");
  n = ::read(fds[1], buf, sizeof(buf));
  EXPECT_EQ(std::string(buf, static_cast<size_t>(n)), "admin\r\n");

  ::close(fds[1]);
}

TEST(TelnetStream, SocketPair_TimeoutReturnsEmpty) {
  int fds[2];
  ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
  TelnetStream stream(fds[0]);

  EXPECT_EQ(stream.read_some(std::chrono::milliseconds(20)), "");
  ::close(fds[1]);
}

TEST(TelnetStream, SocketPair_PeerCloseRaises) {
  int fds[2];
  ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
  TelnetStream stream(fds[0]);
  ::close(fds[1]);

  EXPECT_THROW(stream.read_some(std::chrono::milliseconds(1000)),
               StreamClosedError);
}

TEST(TelnetStream, Connect_Loopback) {
  int listener = socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(listener, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  ASSERT_EQ(bind(listener, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)),
            0);
  ASSERT_EQ(listen(listener, 1), 0);
  socklen_t len = sizeof(addr);
  ASSERT_EQ(getsockname(listener, reinterpret_cast<sockaddr *>(&addr), &len),
            0);

  auto stream = TelnetStream::connect("127.0.0.1", ntohs(addr.sin_port),
                                      std::chrono::milliseconds(2000));
  EXPECT_TRUE(stream->is_open());
  stream->close();
  EXPECT_FALSE(stream->is_open());
  ::close(listener);
}

TEST(TelnetStream, Connect_UnresolvableHost) {
  EXPECT_THROW(TelnetStream::connect("host.invalid", 23,
                                     std::chrono::milliseconds(500)),
               ConnectionFailure);
}

TEST(TelnetStream, ClosedStreamRaises) {
  TelnetStream stream(-1);
  EXPECT_THROW(stream.write("x"), StreamClosedError);
  EXPECT_THROW(stream.read_some(std::chrono::milliseconds(1)),
               StreamClosedError);
}
