#pragma once
#include <optional>
#include <string>

#include "bt/device.hpp"
#include "bt/registry.hpp"
#include "manager/bluetooth_manager.hpp"

namespace app
{

enum class OperationState
{
    Idle,
    Pairing,
    Connecting,
    Disconnecting,
    ShowForgetConfirm,
    Forgetting
};

const char *operation_state_name(OperationState s);

// One operation in flight at a time, driven by user requests and manager callbacks.
// Not thread-safe: use it from the thread that drains the manager's callbacks.
class OperationTracker
{
  public:
    explicit OperationTracker(manager::IDeviceCommands &cmds);

    // user requests; false when rejected (busy, or the device is in the wrong state)
    bool request_pair(const bt::Device &d);
    bool request_connect(const bt::Device &d);
    bool request_disconnect(const bt::Device &d);
    bool request_forget(const bt::Device &d);  // asks for confirmation first
    bool confirm_forget();
    bool cancel_forget();
    // row tap: disconnect if connected, connect if paired, pair otherwise
    bool activate(const bt::Device &d);

    // manager callbacks
    void on_devices_updated(const bt::Snapshot &devices);
    void on_paired(const bt::Device &d);
    void on_pair_failed(const std::string &message);
    void on_connected(const bt::Device &d);
    void on_disconnected(const bt::Device &d);
    void on_operation_failed(const bt::Device      &d,
                             manager::OperationKind kind,
                             const std::string     &message);

    OperationState                   state() const { return state_; }
    const std::optional<bt::Device> &target() const { return target_; }

    std::string status_text(const bt::Device &d) const;
    bool        is_busy(const bt::Device &d) const;

    // listener set wired to the on_* handlers; the tracker must outlive every later
    // process_callbacks() of that manager
    manager::Listeners listeners();

  private:
    bool is_target(const bt::Device &d) const;
    void begin(OperationState next, const bt::Device &d);
    void reset(const char *why);

    manager::IDeviceCommands &cmds_;
    OperationState            state_ = OperationState::Idle;
    std::optional<bt::Device> target_;
};

}  // namespace app
