#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "bus/ibus.hpp"

namespace bus
{

// In-memory stand-in for the system bus and a minimal BlueZ behind it.
// Pair/Connect/Disconnect/RemoveDevice mutate the object table; Connected flips
// are emitted as PropertiesChanged to installed matches.
class LoopbackBus final : public IBus
{
  public:
    LoopbackBus() = default;

    // ---- scripting ----
    void set_objects(ManagedObjects objs);
    void put_object(const std::string &path, InterfaceMap ifaces);
    void remove_object(const std::string &path);
    void set_object_property(const std::string &path,
                             const std::string &iface,
                             const std::string &key,
                             Property           value,
                             bool               emit_signal);
    void emit(PropertiesChanged sig);

    // next call of `member` returns `result` instead of running
    void fail_next(const std::string &member, CallResult result);
    // false: every call reports a transport failure
    void set_reachable(bool reachable);

    std::size_t              call_count(const std::string &member) const;
    std::vector<std::string> calls() const;

    // ---- IBus ----
    CallResult  get_managed_objects(const std::string &service, ManagedObjects &out) override;
    CallResult  call_method(const MethodCall &call) override;
    CallResult  set_property(const std::string &service,
                             const std::string &path,
                             const std::string &interface,
                             const std::string &name,
                             const Property    &value) override;
    CallResult  add_match(const MatchRule &rule) override;
    WaitStatus  wait_properties_changed(std::chrono::milliseconds timeout,
                                        PropertiesChanged        &out) override;
    void        close() override;
    std::string name() const override { return "loopback"; }

  private:
    // returns true and fills `out` when the call must not proceed
    bool                 intercept_locked(const std::string &member, CallResult &out);
    ManagedObject       *find_locked(const std::string &path);
    void                 emit_locked(PropertiesChanged sig);
    static PropertiesChanged connected_changed(const std::string &path, bool connected);

    mutable std::mutex                        mu_;
    std::condition_variable                   cv_;
    ManagedObjects                            objects_;
    std::vector<MatchRule>                    matches_;
    std::deque<PropertiesChanged>             pending_;
    std::multimap<std::string, CallResult>    scripted_;
    std::vector<std::string>                  calls_;
    bool                                      reachable_{true};
    bool                                      closed_{false};
};

}  // namespace bus
