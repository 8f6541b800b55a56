#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "bt/device.hpp"
#include "bt/registry.hpp"
#include "bus/ibus.hpp"
#include "util/constants.hpp"

namespace manager
{

enum class OperationKind
{
    Pair,
    Connect,
    Disconnect,
    Forget
};

const char *operation_kind_name(OperationKind k);

// Consumer callbacks. Every one of them runs inside process_callbacks(), on the
// consumer's thread. Empty members are not called.
struct Listeners
{
    std::function<void(const bt::Snapshot &)> devices_updated;
    std::function<void(const bt::Device &)>   device_connected;
    std::function<void(const bt::Device &)>   device_disconnected;
    std::function<void(const bt::Device &)>   device_paired;
    std::function<void(const std::string &)>  pair_failed;
    // opt-in: every failed pair/connect/disconnect/forget
    std::function<void(const bt::Device &, OperationKind, const std::string &)> operation_failed;
};

struct ManagerConfig
{
    std::chrono::milliseconds scan_period    = constants::SCAN_PERIOD;
    std::chrono::milliseconds scan_tick      = constants::SCAN_TICK;
    std::chrono::milliseconds adapter_retry  = constants::ADAPTER_RETRY;  // clamped to >= 1s
    std::chrono::milliseconds signal_wait    = constants::SIGNAL_WAIT;
    std::chrono::milliseconds inactive_poll  = constants::INACTIVE_POLL;
    std::chrono::milliseconds join_timeout   = constants::JOIN_TIMEOUT;
    bt::DuplicatePolicy       duplicates     = bt::DuplicatePolicy::KeepAll;
};

// Commands a consumer-side state machine issues.
struct IDeviceCommands
{
    virtual void pair_device(const bt::Device &d)       = 0;
    virtual void connect_device(const bt::Device &d)    = 0;
    virtual void disconnect_device(const bt::Device &d) = 0;
    virtual void forget_device(const bt::Device &d)     = 0;
    virtual ~IDeviceCommands()                          = default;
};

class BluetoothManager final : public IDeviceCommands
{
  public:
    // Starts adapter discovery right away. Either bus may be null (no system bus):
    // the manager then stays unavailable.
    BluetoothManager(std::shared_ptr<bus::IBus> bus,
                     std::shared_ptr<bus::IBus> monitor_bus,
                     Listeners                  listeners = {},
                     ManagerConfig              cfg       = {});
    ~BluetoothManager() override;

    BluetoothManager(const BluetoothManager &)            = delete;
    BluetoothManager &operator=(const BluetoothManager &) = delete;

    void add_listeners(Listeners l);

    // consumer tick: run queued callbacks (FIFO), returns how many ran
    std::size_t process_callbacks();
    std::size_t pending_callbacks() const;

    bool         is_available() const;
    bool         is_scanning() const;
    bt::Snapshot devices() const;
    std::string  adapter_path() const;

    void set_active(bool active);
    void start_scan();
    void stop_scan();

    void pair_device(const bt::Device &d) override;
    void connect_device(const bt::Device &d) override;
    void disconnect_device(const bt::Device &d) override;
    void forget_device(const bt::Device &d) override;

    // idempotent
    void stop();

  private:
    struct Impl;
    std::shared_ptr<Impl> impl_;  // shared with every background thread
};

}  // namespace manager
