#pragma once
#include <functional>
#include <string>

namespace ipc
{

// Handles one command line and returns the text written back to the client (may be empty).
using LineHandler = std::function<std::string(const std::string &)>;

// Serves one newline-terminated command per connection until a "QUIT" line arrives.
// The socket file is created with a 0700 parent directory and removed on return.
bool        start_server(const std::string &sock_path, const LineHandler &on_line);
// Sends one line; when reply is given, reads the server's answer until it closes the connection.
bool        send_line(const std::string &sock_path, const std::string &line,
                      std::string *reply = nullptr);
std::string expand_user(const std::string &path);

}  // namespace ipc
