#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

static constexpr const char *QUIT_LINE = "QUIT";
// a client that connects and never finishes its line must not wedge the daemon
static constexpr int RECV_TIMEOUT_MS = 2000;

static void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

static bool fill_addr(const std::string &sock_path, sockaddr_un &addr, socklen_t &addr_len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("[CMD] invalid socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("[CMD] path name too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
    addr.sun_path[sizeof(addr.sun_path) - 1] = '\0';
    addr_len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) +
                                      std::strlen(addr.sun_path) + 1);
    return true;
}

static bool write_all(int fd, const std::string &data)
{
    const char *buf  = data.data();
    size_t      len  = data.size();
    size_t      sent = 0;
    while (sent < len)
    {
        ssize_t n = send(fd, buf + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("[CMD] send() failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

// Reads until a newline (or EOF), bounded by RECV_TIMEOUT_MS per wait.
static bool read_line(int fd, std::string &line)
{
    char buf[256];
    while (1)
    {
        pollfd pfd{fd, POLLIN, 0};
        int    pr = poll(&pfd, 1, RECV_TIMEOUT_MS);
        if (pr == 0)
        {
            LOG_WARN("[CMD] client sent no complete line within %d ms", RECV_TIMEOUT_MS);
            return false;
        }
        if (pr < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("[CMD] poll() failed: %s", std::strerror(errno));
            return false;
        }

        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            line.append(buf, static_cast<size_t>(n));
            if (line.find('\n') != std::string::npos)
                return true;
            continue;
        }
        if (n == 0)
            return true;  // EOF
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("[CMD] recv() failed: %s", std::strerror(errno));
        return false;
    }
}

static bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        p(sock_path);
    fs::path        dir = p.parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec))
        {
            LOG_ERROR("[CMD] create_directories(%s) failed: %s", dir.string().c_str(),
                      ec.message().c_str());
            return false;
        }
    }
    // Enforce 0700 on the directory
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
    {
        LOG_WARN("[CMD] permissions(%s, 0700) failed: %s", dir.string().c_str(),
                 ec.message().c_str());
    }
    return true;
}

// ======================================================================
// Function: start_server
// - In: socket path, line handler
// - Out: true after a clean QUIT, false on socket setup or accept failure
// - Note: connections are served one at a time on the calling thread
// ======================================================================
bool start_server(const std::string &sock_path, const LineHandler &on_line)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!fill_addr(sock_path, addr, addr_len))
        return false;

    // ensure parent directory exists (mkdir -p)
    if (!ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // stale socket from a previous run

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("[CMD] socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("[CMD] bind() failed: %s", std::strerror(errno));
        return false;
    }
    if (listen(fd, 4) == -1)
    {
        int saved = errno;
        close(fd);
        unlink(sock_path.c_str());
        errno = saved;
        LOG_ERROR("[CMD] listen() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("[CMD] listening on %s", sock_path.c_str());

    while (1)
    {
        int newfd = accept(fd, nullptr, nullptr);
        if (newfd == -1)
        {
            if (errno == EINTR)
                continue;
            int saved = errno;
            close(fd);
            unlink(sock_path.c_str());
            errno = saved;
            LOG_ERROR("[CMD] accept() failed: %s", std::strerror(errno));
            return false;
        }
        set_cloexec(newfd);

        std::string line;
        if (!read_line(newfd, line))
        {
            close(newfd);
            continue;  // keep server alive; accept next connection
        }

        // take first line only
        auto        pos   = line.find('\n');
        std::string first = (pos == std::string::npos) ? line : line.substr(0, pos);
        // trim optional '\r'
        if (!first.empty() && first.back() == '\r')
            first.pop_back();

        std::string reply;
        if (on_line)
            reply = on_line(first);
        if (!reply.empty())
        {
            if (reply.back() != '\n')
                reply.push_back('\n');
            (void)write_all(newfd, reply);
        }
        close(newfd);

        if (first == QUIT_LINE)
            break;  // graceful shutdown
    }

    close(fd);
    unlink(sock_path.c_str());
    return true;
}

bool send_line(const std::string &sock_path, const std::string &line, std::string *reply)
{
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("[CMD] empty command line");
        return false;
    }
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!fill_addr(sock_path, addr, addr_len))
        return false;

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("[CMD] socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("[CMD] connect() failed: %s", std::strerror(errno));
        return false;
    }
    LOG_DEBUG("[CMD] sending line: %s", line.c_str());
    if (!write_all(fd, line))
    {
        close(fd);
        return false;
    }
    if (!reply)
    {
        close(fd);
        return true;
    }

    // the server answers and closes; read to EOF
    shutdown(fd, SHUT_WR);
    char buf[512];
    while (1)
    {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            reply->append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0)
            break;
        if (errno == EINTR)
            continue;
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("[CMD] recv() failed: %s", std::strerror(errno));
        return false;
    }
    close(fd);
    return true;
}

std::string expand_user(const std::string &p)
{
    // expand leading '~' or '~/' to $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && (*home))  // non-empty
        {
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
        }
    }
    return p;
}

}  // namespace ipc
