#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else
        {
            unsigned char c = static_cast<unsigned char>(mac[i]);
            if (!std::isxdigit(c))
                return false;
        }
    }
    return true;
}

static std::string to_upper_mac(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

static std::string join_args(const std::vector<std::string> &args, size_t from)
{
    std::string text;
    for (size_t i = from; i < args.size(); ++i)
    {
        if (i > from)
            text.push_back(' ');
        text += args[i];
    }
    return text;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  parktermctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  scan                       start device discovery\n"
                         "  stopscan\n"
                         "  devices                    list discovered devices\n"
                         "  connect AA:BB:CC:DD:EE:FF\n"
                         "  disconnect\n"
                         "  ticket <payload>           e.g. 'TICKET-ID-42|PRECIO:15'\n"
                         "  issue                      issue and scan a random ticket\n"
                         "  resend                     resend the coin count\n"
                         "  status\n"
                         "  cancel\n"
                         "  finalize\n"
                         "  sim <bytes>                loopback only: controller bytes\n"
                         "  drop                       loopback only: lose the link\n"
                         "  quit\n");
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");

        return exitc::bad_args;
    }
    std::string out = line;
    out.push_back('\n');
    std::string reply;
    if (!ipc::send_line(sock, out, &reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    if (!reply.empty())
        std::fputs(reply.c_str(), stdout);
    // the daemon answered; refusals are reported in the text and the daemon log
    if (reply.rfind("error:", 0) == 0)
        return exitc::refused;
    return exitc::ok;
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    auto simple = [&](const char *verb) {
        return [&, verb]() -> int {
            if (args.size() != 1)
            {
                print_usage();
                return exitc::bad_args;
            }
            return send_line(verb);
        };
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"scan", simple("SCAN")},
        {"stopscan", simple("STOPSCAN")},
        {"devices", simple("DEVICES")},
        {"connect",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string mac = to_upper_mac(args[1]);
             if (!is_valid_mac(mac))
             {
                 std::fprintf(stderr, "error: invalid MAC address: %s\n", args[1].c_str());
                 return exitc::bad_args;
             }
             return send_line("CONNECT " + mac);
         }},
        {"disconnect", simple("DISCONNECT")},
        {"ticket",
         [&]() -> int {
             if (args.size() < 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return send_line("TICKET " + join_args(args, 1));
         }},
        {"issue", simple("ISSUE")},
        {"resend", simple("RESEND")},
        {"status", simple("STATUS")},
        {"cancel", simple("CANCEL")},
        {"finalize", simple("FINALIZE")},
        {"sim",
         [&]() -> int {
             if (args.size() < 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return send_line("SIM " + join_args(args, 1));
         }},
        {"drop", simple("DROP")},
        {"quit", simple("QUIT")},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (const char *lv = std::getenv("PARKTERM_LOG_LEVEL"))
        parkterm::set_log_level_by_name(lv);

    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // env override first, --sock wins over both
    std::string sock;
    if (const char *e = std::getenv("PARKTERM_CTL_SOCK"); e && *e)
        sock = ipc::expand_user(e);

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock" && i + 1 < argc)
        {
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }
    if (sock.empty())
        sock = ipc::expand_user(constants::ctl_sock_path());

    const std::string &cmd = args[0];
    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };

    return run_cmd(cmd, args, sender);
}
