#include "conn/connection_manager.hpp"

#include "util/log.hpp"

namespace conn
{
using parkterm::Err;
using transport::LinkState;

ConnectionManager::ConnectionManager(ChunkChannel &channel, TransportFactory factory)
    : channel_(channel), factory_(std::move(factory))
{
}

ConnectionManager::~ConnectionManager()
{
    disconnect();
}

void ConnectionManager::set_teardown_hook(std::function<void()> hook)
{
    std::lock_guard<std::mutex> op(op_mu_);
    on_teardown_ = std::move(hook);
}

// ======================================================================
// Function: ConnectionManager::teardown_locked
// - In: op_mu_ held
// - Out: nothing active, epoch invalidated, old transport closed
// - Note: order matters: epoch, then hook, then transport
// ======================================================================
void ConnectionManager::teardown_locked(const char *why)
{
    std::shared_ptr<transport::ITransport>     old;
    std::optional<transport::DeviceDescriptor> dev;
    {
        std::lock_guard<std::mutex> lk(mu_);
        old = std::move(active_);
        dev = std::move(device_);
        active_.reset();
        device_.reset();
        state_ = LinkState::Disconnected;
    }

    // stale chunks are refused from here on, queued ones are dropped
    channel_.close();
    // wait out a decode pass that already popped a chunk of the old epoch
    if (on_teardown_)
        on_teardown_();

    if (old)
    {
        old->disconnect();
        LOG_SYSTEM("[CONN] disconnected from %s (%s)", dev ? dev->address.c_str() : "?", why);
    }
}

// ======================================================================
// Function: ConnectionManager::connect
// - In: descriptor from discovery
// - Out: Ok with the link active, or the transport's error with nothing active
// - Note: the previous link is torn down first even if the new one fails
// ======================================================================
Err ConnectionManager::connect(const transport::DeviceDescriptor &d)
{
    std::lock_guard<std::mutex> op(op_mu_);
    teardown_locked("switching device");

    auto t = factory_ ? factory_(d) : nullptr;
    if (!t)
    {
        LOG_ERROR("[CONN] no transport for %s (%s)", d.address.c_str(),
                  transport::kind_name(d.kind));
        std::lock_guard<std::mutex> lk(mu_);
        state_ = LinkState::Failed;
        return Err::ConnectFailed;
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        state_ = LinkState::Connecting;
    }
    LOG_SYSTEM("[CONN] connecting to %s '%s' over %s", d.address.c_str(), d.name.c_str(),
               transport::kind_name(d.kind));

    const std::uint64_t epoch = channel_.open();
    ChunkChannel       &ch    = channel_;
    Err                 e     = t->connect(
        [&ch, epoch](const transport::Chunk &c) { ch.push(epoch, c); },
        [&ch, epoch] { ch.push_closed(epoch); });

    if (e != Err::Ok)
    {
        channel_.close();
        t->disconnect();
        std::lock_guard<std::mutex> lk(mu_);
        state_ = LinkState::Failed;
        LOG_SYSTEM("[CONN] connection to %s failed: %s", d.address.c_str(), parkterm::err_name(e));
        return e;
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        active_ = std::move(t);
        device_ = d;
        state_  = LinkState::Connected;
    }
    LOG_SYSTEM("[CONN] connected to %s '%s'", d.address.c_str(), d.name.c_str());
    return Err::Ok;
}

void ConnectionManager::disconnect()
{
    std::lock_guard<std::mutex> op(op_mu_);
    teardown_locked("requested");
}

void ConnectionManager::on_link_lost(std::uint64_t epoch)
{
    std::lock_guard<std::mutex> op(op_mu_);
    if (!channel_.is_current(epoch))
        return;  // already replaced or torn down
    LOG_SYSTEM("[CONN] link lost");
    teardown_locked("link lost");
}

Err ConnectionManager::send(std::string_view command)
{
    std::shared_ptr<transport::ITransport> t;
    {
        std::lock_guard<std::mutex> lk(mu_);
        t = active_;
    }
    if (!t)
        return Err::NoActiveConnection;

    Err e = t->send(command);
    if (e != Err::Ok)
        LOG_WARN("[CONN] send '%.*s' failed: %s", (int)command.size(), command.data(),
                 parkterm::err_name(e));
    return e;
}

bool ConnectionManager::connected() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return active_ != nullptr && state_ == LinkState::Connected;
}

LinkState ConnectionManager::state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

std::optional<transport::DeviceDescriptor> ConnectionManager::active_device() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return device_;
}

}  // namespace conn
