#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#ifndef PARKTERM_SOURCE_DIR
#error "PARKTERM_SOURCE_DIR must be defined by CMake to the project source root"
#endif

struct Check
{
    const char              *label;
    const char              *rel_path;
    std::vector<std::string> needles;  // all substrings must appear in the SAME line
    bool                     allow_prev_line_macro = true;  // sometimes macro is on prev line
};

static std::string read_file(const std::string &path)
{
    std::ifstream      ifs(path);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

static bool line_has_all(const std::string &line, const std::vector<std::string> &needles)
{
    for (const auto &n : needles)
    {
        if (line.find(n) == std::string::npos)
            return false;
    }
    return true;
}

static bool has_system_macro_near(const std::string              &content,
                                  const std::vector<std::string> &needles,
                                  bool                            allow_prev)
{
    std::istringstream iss(content);
    std::string        line, prev;
    while (std::getline(iss, line))
    {
        if (line_has_all(line, needles))
        {
            const bool on_same = line.find("LOG_SYSTEM(") != std::string::npos;
            const bool on_prev = allow_prev && prev.find("LOG_SYSTEM(") != std::string::npos;
            return on_same || on_prev;
        }
        prev = line;
    }
    return false;
}

// Operator-facing outcomes must print regardless of PARKTERM_LOG_LEVEL.
TEST(SystemLogs, OperatorOutcomesAreSystemLevel)
{
    const std::vector<Check> checks = {
        // clang-format off
        {"ticket scanned", "src/app/session_controller.cpp", {"[SESSION]", "ticket scanned"}},
        {"coin count sent", "src/app/session_controller.cpp", {"[SESSION]", "coin count", "sent"}},
        {"coin count failed", "src/app/session_controller.cpp", {"[SESSION]", "sending coin count"}},
        {"rate confirmed", "src/app/session_controller.cpp", {"[SESSION]", "controller confirmed rate"}},
        {"coin inserted", "src/app/session_controller.cpp", {"[SESSION]", "coin inserted"}},
        {"payment complete", "src/app/session_controller.cpp", {"[SESSION]", "payment complete"}},

        {"connecting", "src/conn/connection_manager.cpp", {"[CONN]", "connecting to"}},
        {"connected", "src/conn/connection_manager.cpp", {"[CONN]", "connected to"}},
        {"connect failed", "src/conn/connection_manager.cpp", {"[CONN]", "connection to", "failed"}},
        {"disconnected", "src/conn/connection_manager.cpp", {"[CONN]", "disconnected from"}},
        {"link lost", "src/conn/connection_manager.cpp", {"[CONN]", "link lost"}},

        {"scan started", "src/discovery/device_discovery.cpp", {"[SCAN]", "started"}},
        {"scan finished", "src/discovery/device_discovery.cpp", {"[SCAN]", "finished"}},

        {"LE connected", "src/transport/le_transport.cpp", {"[LE]", "connected to"}},
        {"LE dropped", "src/transport/le_transport.cpp", {"[LE]", "dropped"}},
        {"SPP connected", "src/transport/spp_transport.cpp", {"[SPP]", "connected to"}},
        {"SPP dropped", "src/transport/spp_transport.cpp", {"[SPP]", "dropped"}},

        {"QUIT", "src/daemon/main.cpp", {"[CMD]", "QUIT received"}}
        // clang-format on
    };

    for (const auto &c : checks)
    {
        const std::string path    = std::string(PARKTERM_SOURCE_DIR) + "/" + c.rel_path;
        const std::string content = read_file(path);
        ASSERT_FALSE(content.empty()) << "Missing file: " << path;
        const bool ok = has_system_macro_near(content, c.needles, c.allow_prev_line_macro);
        if (!ok)
        {
            std::ostringstream err;
            err << "Log for [" << c.label << "] is not LOG_SYSTEM near message in " << path
                << " (needles: ";
            for (size_t i = 0; i < c.needles.size(); ++i)
            {
                if (i)
                    err << ", ";
                err << '"' << c.needles[i] << '"';
            }
            err << ")";
            ADD_FAILURE() << err.str();
        }
    }
}
