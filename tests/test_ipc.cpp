#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <thread>
#include <unistd.h>

#include "ctl/ipc.hpp"

using namespace std::chrono_literals;

static bool wait_for_socket(const std::string &sock)
{
    for (int i = 0; i < 200; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

TEST(IPC, TestExpandUser)
{
    const char *path      = std::getenv("HOME");
    const char *test_home = "/tmp/ut-home";
    setenv("HOME", test_home, 1);

    EXPECT_EQ(ipc::expand_user("~"), test_home);
    EXPECT_EQ(ipc::expand_user("~/x/y"), std::string(test_home) + "/x/y");
    EXPECT_EQ(ipc::expand_user("/abs/path"), "/abs/path");
    EXPECT_EQ(ipc::expand_user("relative/~/path"), "relative/~/path");

    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, TestExpandUserNoHomeEnv)
{
    const char *path = std::getenv("HOME");
    unsetenv("HOME");
    EXPECT_EQ(ipc::expand_user("~"), "~");
    EXPECT_EQ(ipc::expand_user("~/x"), "~/x");
    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, TestStartServerAndSendLine)
{
    // temporary socket path
    std::string sock = "/tmp/parkterm-ipc-ut-" + std::to_string(getpid()) + ".sock";

    // run server (blocks until QUIT)
    std::thread th([&] { ipc::start_server(sock, nullptr); });
    ASSERT_TRUE(wait_for_socket(sock));
    // check if send_line executes without error
    ASSERT_TRUE(ipc::send_line(sock, "QUIT\n"));
    th.join();
    // server should unlink the socket
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(IPC, RepliesReachTheClient)
{
    std::string sock = "/tmp/parkterm-ipc-reply-" + std::to_string(getpid()) + ".sock";

    std::thread th([&] {
        ipc::start_server(sock, [](const std::string &line) -> std::string {
            if (line == "STATUS")
                return "link: connected\nsession: idle";
            if (line == "QUIT")
                return "bye";
            return "";
        });
    });
    ASSERT_TRUE(wait_for_socket(sock));

    std::string reply;
    ASSERT_TRUE(ipc::send_line(sock, "STATUS\r\n", &reply));
    EXPECT_EQ(reply, "link: connected\nsession: idle\n");

    reply.clear();
    ASSERT_TRUE(ipc::send_line(sock, "NOTHING\n", &reply));
    EXPECT_TRUE(reply.empty());

    reply.clear();
    ASSERT_TRUE(ipc::send_line(sock, "QUIT\n", &reply));
    EXPECT_EQ(reply, "bye\n");
    th.join();
}

TEST(IPC, SendLineWithoutServerFails)
{
    std::string sock = "/tmp/parkterm-ipc-none-" + std::to_string(getpid()) + ".sock";
    (void)unlink(sock.c_str());
    EXPECT_FALSE(ipc::send_line(sock, "STATUS\n"));
    EXPECT_FALSE(ipc::send_line("", "STATUS\n"));
    EXPECT_FALSE(ipc::send_line(std::string(200, 'x'), "STATUS\n"));
}
