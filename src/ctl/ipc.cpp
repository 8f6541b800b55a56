#include "ctl/ipc.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

namespace
{

// mkdir -p with 0700 on the socket's directory
bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec) && !fs::create_directories(dir, ec))
    {
        LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                  ec.message().c_str());
        return false;
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
        LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(), ec.message().c_str());
    return true;
}

void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// close fd but keep errno of the failure being reported
void close_keep_errno(int fd)
{
    int saved = errno;
    close(fd);
    errno = saved;
}

bool make_addr(const std::string &sock_path, sockaddr_un &addr, socklen_t &len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
    len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) +
                                 std::strlen(addr.sun_path) + 1);
    return true;
}

int open_socket()
{
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return -1;
    }
    set_cloexec(fd);
    return fd;
}

// read until the first '\n' or EOF; returns the line without "\r\n"
bool read_first_line(int fd, std::string &out)
{
    std::string buf;
    char        chunk[256];
    while (buf.find('\n') == std::string::npos)
    {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n > 0)
        {
            buf.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0)
            break;  // EOF
        if (errno == EINTR)
            continue;
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }
    out = buf.substr(0, buf.find('\n'));
    if (!out.empty() && out.back() == '\r')
        out.pop_back();
    return true;
}

}  // namespace

bool start_server(const std::string &sock_path, void (*on_line)(const std::string &))
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!make_addr(sock_path, addr, addr_len) || !ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // stale socket from a previous run

    int fd = open_socket();
    if (fd == -1)
        return false;

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        close_keep_errno(fd);
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        return false;
    }
    if (listen(fd, 4) == -1)
    {
        close_keep_errno(fd);
        unlink(sock_path.c_str());
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        return false;
    }
    LOG_DEBUG("Control socket ready at %s", sock_path.c_str());

    bool ok = true;
    while (true)
    {
        int client = accept(fd, nullptr, nullptr);
        if (client == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            ok = false;
            break;
        }
        set_cloexec(client);

        std::string line;
        bool        got = read_first_line(client, line);
        close(client);
        if (!got)
            continue;  // drop this client, keep serving

        if (on_line)
            on_line(line);
        if (line == "QUIT")
            break;
    }

    close(fd);
    unlink(sock_path.c_str());
    return ok;
}

bool send_line(const std::string &sock_path, const std::string &line)
{
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Refusing to send an empty line");
        return false;
    }
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!make_addr(sock_path, addr, addr_len))
        return false;

    int fd = open_socket();
    if (fd == -1)
        return false;

    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        close_keep_errno(fd);
        LOG_ERROR("connect(%s) failed: %s", sock_path.c_str(), std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Sending line: %s", line.c_str());
    size_t sent = 0;
    while (sent < line.size())
    {
        ssize_t n = send(fd, line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        close_keep_errno(fd);
        LOG_ERROR("send() failed: %s", std::strerror(errno));
        return false;
    }
    close(fd);
    return true;
}

std::string expand_user(const std::string &p)
{
    if (p.empty() || p[0] != '~' || (p.size() > 1 && p[1] != '/'))
        return p;
    const char *home = std::getenv("HOME");
    if (!home || !*home)
        return p;
    return std::string(home) + p.substr(1);
}

}  // namespace ipc
