#include "bus/loopback_bus.hpp"

#include <algorithm>
#include <utility>

#include "util/constants.hpp"

namespace bus
{
// LoopbackBus: exercises the orchestrator (scan, monitor, workers) without a system bus.

void LoopbackBus::set_objects(ManagedObjects objs)
{
    std::lock_guard<std::mutex> lk(mu_);
    objects_ = std::move(objs);
}

void LoopbackBus::put_object(const std::string &path, InterfaceMap ifaces)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (auto *obj = find_locked(path))
    {
        obj->interfaces = std::move(ifaces);
        return;
    }
    objects_.push_back(ManagedObject{path, std::move(ifaces)});
}

void LoopbackBus::remove_object(const std::string &path)
{
    std::lock_guard<std::mutex> lk(mu_);
    objects_.erase(std::remove_if(objects_.begin(), objects_.end(),
                                  [&](const ManagedObject &o) { return o.path == path; }),
                   objects_.end());
}

void LoopbackBus::set_object_property(const std::string &path,
                                      const std::string &iface,
                                      const std::string &key,
                                      Property           value,
                                      bool               emit_signal)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                       *obj = find_locked(path);
    if (!obj)
        return;
    obj->interfaces[iface][key] = value;
    if (emit_signal)
    {
        PropertiesChanged sig;
        sig.path         = path;
        sig.interface    = iface;
        sig.changed[key] = std::move(value);
        emit_locked(std::move(sig));
    }
}

void LoopbackBus::emit(PropertiesChanged sig)
{
    std::lock_guard<std::mutex> lk(mu_);
    emit_locked(std::move(sig));
}

void LoopbackBus::fail_next(const std::string &member, CallResult result)
{
    std::lock_guard<std::mutex> lk(mu_);
    scripted_.emplace(member, std::move(result));
}

void LoopbackBus::set_reachable(bool reachable)
{
    std::lock_guard<std::mutex> lk(mu_);
    reachable_ = reachable;
}

std::size_t LoopbackBus::call_count(const std::string &member) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return static_cast<std::size_t>(std::count(calls_.begin(), calls_.end(), member));
}

std::vector<std::string> LoopbackBus::calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return calls_;
}

CallResult LoopbackBus::get_managed_objects(const std::string & /*service*/,
                                            ManagedObjects &out)
{
    std::lock_guard<std::mutex> lk(mu_);
    CallResult                  res;
    if (intercept_locked("GetManagedObjects", res))
        return res;
    out = objects_;
    return CallResult::success();
}

CallResult LoopbackBus::call_method(const MethodCall &call)
{
    std::lock_guard<std::mutex> lk(mu_);
    CallResult                  res;
    if (intercept_locked(call.member, res))
        return res;

    if (call.member == "StartDiscovery" || call.member == "StopDiscovery")
        return CallResult::success();

    if (call.member == "RemoveDevice")
    {
        if (call.path_args.empty())
            return CallResult::error_reply("org.bluez.Error.InvalidArguments",
                                           "Invalid arguments in method call");
        const std::string &target = call.path_args.front();
        auto               it     = std::find_if(objects_.begin(), objects_.end(),
                                                 [&](const ManagedObject &o) { return o.path == target; });
        if (it == objects_.end())
            return CallResult::error_reply("org.bluez.Error.DoesNotExist", "Does Not Exist");
        const bool was_connected = [&] {
            auto dev = it->interfaces.find(std::string(constants::DEVICE_IFACE));
            if (dev == it->interfaces.end())
                return false;
            auto c = dev->second.find("Connected");
            return c != dev->second.end() && std::get_if<bool>(&c->second.value) &&
                   std::get<bool>(c->second.value);
        }();
        objects_.erase(it);
        if (was_connected)
            emit_locked(connected_changed(target, false));
        return CallResult::success();
    }

    auto *obj = find_locked(call.path);
    if (!obj)
        return CallResult::error_reply("org.freedesktop.DBus.Error.UnknownObject",
                                       "Unknown object '" + call.path + "'");
    auto &props = obj->interfaces[std::string(constants::DEVICE_IFACE)];

    if (call.member == "Pair")
    {
        props["Paired"] = Property{'b', true};
        return CallResult::success();
    }
    if (call.member == "Connect" || call.member == "Disconnect")
    {
        const bool want = call.member == "Connect";
        auto       cur  = props.find("Connected");
        const bool was  = cur != props.end() && std::get_if<bool>(&cur->second.value) &&
                         std::get<bool>(cur->second.value);
        props["Connected"] = Property{'b', want};
        if (was != want)
            emit_locked(connected_changed(call.path, want));
        return CallResult::success();
    }
    return CallResult::error_reply("org.freedesktop.DBus.Error.UnknownMethod",
                                   "Unknown method '" + call.member + "'");
}

CallResult LoopbackBus::set_property(const std::string & /*service*/,
                                     const std::string &path,
                                     const std::string &interface,
                                     const std::string &name,
                                     const Property    &value)
{
    std::lock_guard<std::mutex> lk(mu_);
    CallResult                  res;
    if (intercept_locked("Set", res))
        return res;
    auto *obj = find_locked(path);
    if (!obj)
        return CallResult::error_reply("org.freedesktop.DBus.Error.UnknownObject",
                                       "Unknown object '" + path + "'");
    obj->interfaces[interface][name] = value;
    return CallResult::success();
}

CallResult LoopbackBus::add_match(const MatchRule &rule)
{
    std::lock_guard<std::mutex> lk(mu_);
    CallResult                  res;
    if (intercept_locked("AddMatch", res))
        return res;
    matches_.push_back(rule);
    return CallResult::success();
}

WaitStatus LoopbackBus::wait_properties_changed(std::chrono::milliseconds timeout,
                                                PropertiesChanged        &out)
{
    std::unique_lock<std::mutex> lk(mu_);
    if (closed_ || !reachable_)
        return WaitStatus::Error;
    if (!cv_.wait_for(lk, timeout, [&] { return closed_ || !pending_.empty(); }))
        return WaitStatus::Timeout;
    if (pending_.empty())
        return WaitStatus::Error;  // woken by close()
    out = std::move(pending_.front());
    pending_.pop_front();
    return WaitStatus::Signal;
}

void LoopbackBus::close()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
    }
    cv_.notify_all();
}

// ---- private ----

bool LoopbackBus::intercept_locked(const std::string &member, CallResult &out)
{
    calls_.push_back(member);
    if (closed_)
    {
        out = CallResult::transport_error("connection closed");
        return true;
    }
    if (!reachable_)
    {
        out = CallResult::transport_error("bus unreachable");
        return true;
    }
    auto it = scripted_.find(member);
    if (it == scripted_.end())
        return false;
    out = std::move(it->second);
    scripted_.erase(it);
    return true;
}

ManagedObject *LoopbackBus::find_locked(const std::string &path)
{
    for (auto &o : objects_)
    {
        if (o.path == path)
            return &o;
    }
    return nullptr;
}

void LoopbackBus::emit_locked(PropertiesChanged sig)
{
    const bool delivered =
        std::any_of(matches_.begin(), matches_.end(), [&](const MatchRule &r) {
            return r.matches(std::string(constants::PROPERTIES_IFACE),
                             std::string(constants::PROPERTIES_CHANGED), sig.interface);
        });
    if (!delivered)
        return;
    if (pending_.size() >= constants::SIGNAL_QUEUE_SIZE)
        pending_.pop_front();
    pending_.push_back(std::move(sig));
    cv_.notify_all();
}

PropertiesChanged LoopbackBus::connected_changed(const std::string &path, bool connected)
{
    PropertiesChanged sig;
    sig.path                 = path;
    sig.interface            = std::string(constants::DEVICE_IFACE);
    sig.changed["Connected"] = Property{'b', connected};
    return sig;
}

}  // namespace bus
