/* ======================================================================
 * sd-bus client - one connection, two usage patterns
 *
 *  Command connection (scanner, workers)      Monitor connection (signal loop)
 *  -------------------------------------      --------------------------------
 *  get_managed_objects ──▶ ObjectManager.GetManagedObjects
 *  call_method         ──▶ Device1.Pair/Connect/Disconnect, Adapter1.*
 *  set_property        ──▶ Properties.Set
 *                                             add_match ──▶ AddMatch(rule)
 *                                             wait_properties_changed
 *                                               └─ sd_bus_process (under mu_)
 *                                               └─ sd_bus_wait    (outside mu_)
 *                                             ◀── PropertiesChanged → pending_
 *
 *  Notes
 *    └─ Blocking calls carry BUS_CALL_TIMEOUT_USEC
 *    └─ close() wakes a waiter; the connection is released in the destructor
 * ====================================================================== */

#include "bus/sdbus_client.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <systemd/sd-bus.h>

#include "bus/sdbus_codec.hpp"
#include "util/log.hpp"

namespace bus
{
namespace
{
// TU-local wrapper to unref and null a slot ptr
inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}
}  // namespace

std::unique_ptr<SdBusClient> SdBusClient::open_system()
{
    sd_bus *bus = nullptr;
    int     r   = sd_bus_open_system(&bus);
    if (r < 0 || !bus)
    {
        LOG_ERROR("[BT] failed to connect system bus: %s", std::strerror(-r));
        return nullptr;
    }
    return std::make_unique<SdBusClient>(bus);
}

SdBusClient::SdBusClient(sd_bus *bus) : bus_(bus)
{
    const char *name = nullptr;
    if (bus_ && sd_bus_get_unique_name(bus_, &name) >= 0 && name)
        unique_name_ = name;
}

SdBusClient::~SdBusClient()
{
    close();
    std::lock_guard<std::mutex> lk(mu_);
    unref_slot(match_slot_);
    if (bus_)
    {
        sd_bus_flush_close_unref(bus_);
        bus_ = nullptr;
    }
}

// ======================================================================
// Function: SdBusClient::get_managed_objects
// - In: service name (org.bluez)
// - Out: every object with its interfaces and basic-typed properties
// - Note: objects are kept in reply order
// ======================================================================
CallResult SdBusClient::get_managed_objects(const std::string &service, ManagedObjects &out)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_ || !bus_)
        return CallResult::transport_error("connection closed");

    sd_bus_message *msg   = nullptr;
    sd_bus_message *reply = nullptr;
    sd_bus_error    err   = SD_BUS_ERROR_NULL;
    int             r     = sd_bus_message_new_method_call(
        bus_, &msg, service.c_str(), "/", std::string(constants::OBJECT_MANAGER_IFACE).c_str(),
        "GetManagedObjects");
    if (r >= 0)
        r = sd_bus_call(bus_, msg, constants::BUS_CALL_TIMEOUT_USEC, &err, &reply);
    if (msg)
        sd_bus_message_unref(msg);

    if (r < 0)
    {
        CallResult res = classify_failure(r, err);
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return res;
    }
    sd_bus_error_free(&err);

    ManagedObjects objs;
    r = read_managed_objects(reply, objs);
    sd_bus_message_unref(reply);
    if (r < 0)
    {
        LOG_WARN("[BT] GetManagedObjects reply malformed: %s", std::strerror(-r));
        return CallResult::transport_error(std::string("malformed reply: ") + std::strerror(-r));
    }
    out = std::move(objs);
    return CallResult::success();
}

CallResult SdBusClient::call_method(const MethodCall &call)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_ || !bus_)
        return CallResult::transport_error("connection closed");

    sd_bus_message *msg = nullptr;
    sd_bus_message *rep = nullptr;
    sd_bus_error    err = SD_BUS_ERROR_NULL;
    int r = sd_bus_message_new_method_call(bus_, &msg, call.service.c_str(), call.path.c_str(),
                                           call.interface.c_str(), call.member.c_str());
    for (const auto &arg : call.path_args)
    {
        if (r < 0)
            break;
        r = sd_bus_message_append_basic(msg, 'o', arg.c_str());
    }
    if (r >= 0)
        r = sd_bus_call(bus_, msg, constants::BUS_CALL_TIMEOUT_USEC, &err, &rep);
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);

    CallResult res = r < 0 ? classify_failure(r, err) : CallResult::success();
    sd_bus_error_free(&err);
    return res;
}

CallResult SdBusClient::set_property(const std::string &service,
                                     const std::string &path,
                                     const std::string &interface,
                                     const std::string &name,
                                     const Property    &value)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_ || !bus_)
        return CallResult::transport_error("connection closed");

    sd_bus_error err  = SD_BUS_ERROR_NULL;
    int          r    = -EINVAL;
    const char  *dst  = service.c_str();
    const char  *obj  = path.c_str();
    const char  *ifc  = interface.c_str();
    const char  *prop = name.c_str();
    const char   sig[2] = {value.type, '\0'};

    // only the tags the orchestrator writes
    if (const auto *b = std::get_if<bool>(&value.value); b && value.type == 'b')
        r = sd_bus_set_property(bus_, dst, obj, ifc, prop, &err, sig, (int)*b);
    else if (const auto *s = std::get_if<std::string>(&value.value);
             s && (value.type == 's' || value.type == 'o'))
        r = sd_bus_set_property(bus_, dst, obj, ifc, prop, &err, sig, s->c_str());
    else if (const auto *u = std::get_if<std::uint32_t>(&value.value); u && value.type == 'u')
        r = sd_bus_set_property(bus_, dst, obj, ifc, prop, &err, sig, *u);
    else if (const auto *n = std::get_if<std::int16_t>(&value.value); n && value.type == 'n')
        r = sd_bus_set_property(bus_, dst, obj, ifc, prop, &err, sig, (int)*n);
    else
    {
        LOG_WARN("[BT] set_property(%s): unsupported type '%c'", prop, value.type);
        return CallResult::transport_error("unsupported property type");
    }

    CallResult res = r < 0 ? classify_failure(r, err) : CallResult::success();
    sd_bus_error_free(&err);
    return res;
}

// ======================================================================
// Function: SdBusClient::add_match
// - In: rule for PropertiesChanged (server-side filter)
// - Out: Ok when the bus daemon accepted the rule
// - Note: one match per connection; a second call replaces the first
// ======================================================================
CallResult SdBusClient::add_match(const MatchRule &rule)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_ || !bus_)
        return CallResult::transport_error("connection closed");

    unref_slot(match_slot_);
    const std::string text = rule.to_string();
    int r = sd_bus_add_match(bus_, &match_slot_, text.c_str(), &SdBusClient::on_properties_changed,
                             this);
    if (r < 0)
    {
        LOG_ERROR("[BT] AddMatch(%s) failed: %s", text.c_str(), std::strerror(-r));
        return CallResult::transport_error(std::strerror(-r));
    }
    LOG_DEBUG("[BT] AddMatch OK: %s", text.c_str());
    return CallResult::success();
}

WaitStatus SdBusClient::wait_properties_changed(std::chrono::milliseconds timeout,
                                                PropertiesChanged        &out)
{
    using clock         = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;

    while (true)
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_ || !bus_)
                return WaitStatus::Error;
            // drain everything already received; the match callback fills pending_
            while (pending_.empty())
            {
                int pr = sd_bus_process(bus_, nullptr);
                if (pr < 0)
                {
                    LOG_WARN("[BT] sd_bus_process failed: %s", std::strerror(-pr));
                    return WaitStatus::Error;
                }
                if (pr == 0)
                    break;
            }
            if (!pending_.empty())
            {
                out = std::move(pending_.front());
                pending_.pop_front();
                return WaitStatus::Signal;
            }
        }

        const auto now = clock::now();
        if (now >= deadline)
            return WaitStatus::Timeout;
        const auto left =
            std::chrono::duration_cast<std::chrono::microseconds>(deadline - now).count();
        // do not hold the lock while waiting, otherwise close() cannot get in
        int wr = sd_bus_wait(bus_, static_cast<uint64_t>(left));
        if (wr < 0 && wr != -EINTR)
            return WaitStatus::Error;
    }
}

void SdBusClient::close()
{
    if (closed_.exchange(true))
        return;
    // a method call in flight owns mu_ for up to BUS_CALL_TIMEOUT_USEC; new
    // calls already fail on closed_, the connection goes in the destructor
    std::unique_lock<std::mutex> lk(mu_, std::try_to_lock);
    if (!lk.owns_lock())
    {
        LOG_DEBUG("[BT] bus connection busy, close deferred to release");
        return;
    }
    // wakes a waiter blocked in sd_bus_wait()
    if (bus_)
        sd_bus_close(bus_);
}

int SdBusClient::on_properties_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    // runs inside sd_bus_process(), mu_ already held
    auto             *self = static_cast<SdBusClient *>(userdata);
    PropertiesChanged sig;
    int               r = read_properties_changed(m, sig);
    if (r < 0)
    {
        LOG_WARN("[BT] PropertiesChanged malformed on %s: %s",
                 sd_bus_message_get_path(m) ? sd_bus_message_get_path(m) : "?",
                 std::strerror(-r));
        return 0;
    }
    if (self->pending_.size() >= self->queue_limit_)
        self->pending_.pop_front();
    self->pending_.push_back(std::move(sig));
    return 0;
}

}  // namespace bus
