#include "conn/transport_factory.hpp"
#include "transport/le_transport.hpp"
#include "transport/spp_transport.hpp"

namespace conn
{

TransportFactory make_bluez_factory(const parkterm::Config &cfg)
{
    const std::string   adapter = cfg.adapter;
    const std::uint32_t timeout = cfg.connect_timeout_ms;

    return [adapter, timeout](const transport::DeviceDescriptor &d)
               -> std::shared_ptr<transport::ITransport> {
        if (d.kind == transport::Kind::Classic)
        {
            transport::SppConfig sc;
            sc.adapter            = adapter;
            sc.dev_path           = d.handle;
            sc.address            = d.address;
            sc.connect_timeout_ms = timeout;
            return std::make_shared<transport::SppTransport>(std::move(sc));
        }
        transport::LeConfig lc;
        lc.adapter            = adapter;
        lc.dev_path           = d.handle;
        lc.address            = d.address;
        lc.connect_timeout_ms = timeout;
        return std::make_shared<transport::LeTransport>(std::move(lc));
    };
}

}  // namespace conn
