#include <cstdlib>
#include <cstring>
#include <string>

#include "util/config.hpp"
#include "util/log.hpp"

namespace parkterm
{

static bool parse_ms(const char *key, std::uint32_t lo, std::uint32_t hi, std::uint32_t &out)
{
    const char *e = std::getenv(key);
    if (!e || !*e)
        return false;

    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 10);
    if (p && *p == '\0' && v >= lo && v <= hi)
    {
        out = static_cast<std::uint32_t>(v);
        LOG_INFO("Using %s=%u", key, out);
        return true;
    }
    LOG_WARN("Ignoring invalid %s='%s' (expect %u..%u)", key, e, lo, hi);
    return false;
}

Config load_config_from_env()
{
    Config cfg;

    if (const char *lv = std::getenv("PARKTERM_LOG_LEVEL"))
    {
        if (level_from_name(lv))
            set_log_level_by_name(lv);
        else
            LOG_WARN("Ignoring unknown PARKTERM_LOG_LEVEL='%s'", lv);
    }

    if (const char *t = std::getenv("PARKTERM_TRANSPORT"))
    {
        if (std::strcmp(t, "loopback") == 0)
            cfg.mode = TransportMode::Loopback;
        else if (std::strcmp(t, "bluez") == 0)
            cfg.mode = TransportMode::Bluez;
        else
            LOG_WARN("Ignoring unknown PARKTERM_TRANSPORT='%s' (expect bluez|loopback)", t);
    }

    if (const char *a = std::getenv("PARKTERM_ADAPTER"); a && *a)
        cfg.adapter = a;

    (void)parse_ms("PARKTERM_SCAN_TIMEOUT_MS", 1000, 60000, cfg.scan_timeout_ms);
    (void)parse_ms("PARKTERM_CONNECT_TIMEOUT_MS", 1000, 60000, cfg.connect_timeout_ms);

    if (const char *s = std::getenv("PARKTERM_CTL_SOCK"); s && *s)
        cfg.ctl_sock = s;

    return cfg;
}

}  // namespace parkterm
