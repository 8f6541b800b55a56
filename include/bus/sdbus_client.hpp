#pragma once
#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "bus/ibus.hpp"
#include "util/constants.hpp"

struct sd_bus;
struct sd_bus_slot;
struct sd_bus_message;
struct sd_bus_error;

namespace bus
{

// One system-bus connection. sd-bus objects are not thread safe: every bus access
// is serialized by mu_, except the idle wait inside wait_properties_changed().
class SdBusClient final : public IBus
{
  public:
    // nullptr when the system bus cannot be reached
    static std::unique_ptr<SdBusClient> open_system();

    explicit SdBusClient(sd_bus *bus);
    ~SdBusClient() override;

    SdBusClient(const SdBusClient &)            = delete;
    SdBusClient &operator=(const SdBusClient &) = delete;

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
    std::string name() const override { return "sdbus"; }

    const std::string &unique_name() const { return unique_name_; }

  private:
    static int on_properties_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

    std::mutex                    mu_;
    sd_bus                       *bus_        = nullptr;
    sd_bus_slot                  *match_slot_ = nullptr;
    std::atomic<bool>             closed_{false};  // set first, without mu_
    std::deque<PropertiesChanged> pending_;  // matched signals not yet handed out
    std::size_t                   queue_limit_ = constants::SIGNAL_QUEUE_SIZE;
    std::string                   unique_name_;
};

}  // namespace bus
