#pragma once
#include <string>

namespace ipc
{

// Line-oriented control channel over a UNIX stream socket: one line per connection.
// Blocks accepting connections until a "QUIT" line arrives; each first line is handed
// to on_line (may be null). The socket file is removed on return.
bool start_server(const std::string &sock_path, void (*on_line)(const std::string &));

// connect, send `line` (newline included by the caller), close
bool send_line(const std::string &sock_path, const std::string &line);

// "~" and "~/..." -> $HOME
std::string expand_user(const std::string &path);

}  // namespace ipc
