/* ======================================================================
 * OperationTracker - per-device operation indicator
 *
 *   Idle ──pair──▶ Pairing ──paired──▶ Connecting ──connected──▶ Idle
 *                     └──pair_failed──▶ Idle
 *   Idle ──connect──▶ Connecting
 *   Idle ──disconnect──▶ Disconnecting ──disconnected──▶ Idle
 *   Idle ──forget──▶ ShowForgetConfirm ──confirm──▶ Forgetting ──disconnected──▶ Idle
 *                          └──cancel──▶ Idle
 *   any non-Idle ── target missing from devices_updated ──▶ Idle
 *   any non-Idle ── operation_failed(target, same kind) ──▶ Idle
 *
 *  The target is matched by address: object paths may change between refreshes.
 * ====================================================================== */

#include "app/operation_tracker.hpp"

#include "util/log.hpp"
#include "util/mac.hpp"

namespace app
{

const char *operation_state_name(OperationState s)
{
    switch (s)
    {
        case OperationState::Idle:
            return "idle";
        case OperationState::Pairing:
            return "pairing";
        case OperationState::Connecting:
            return "connecting";
        case OperationState::Disconnecting:
            return "disconnecting";
        case OperationState::ShowForgetConfirm:
            return "confirm-forget";
        case OperationState::Forgetting:
            return "forgetting";
    }
    return "?";
}

OperationTracker::OperationTracker(manager::IDeviceCommands &cmds) : cmds_(cmds) {}

bool OperationTracker::is_target(const bt::Device &d) const
{
    return target_ && mac::equal(target_->address, d.address);
}

void OperationTracker::begin(OperationState next, const bt::Device &d)
{
    LOG_DEBUG("%s -> %s (%s)", operation_state_name(state_), operation_state_name(next),
              d.address.c_str());
    state_  = next;
    target_ = d;
}

void OperationTracker::reset(const char *why)
{
    LOG_DEBUG("%s -> idle (%s)", operation_state_name(state_), why);
    state_ = OperationState::Idle;
    target_.reset();
}

bool OperationTracker::request_pair(const bt::Device &d)
{
    if (state_ != OperationState::Idle || d.paired)
        return false;
    begin(OperationState::Pairing, d);
    cmds_.pair_device(d);
    return true;
}

bool OperationTracker::request_connect(const bt::Device &d)
{
    if (state_ != OperationState::Idle || !d.paired)
        return false;
    begin(OperationState::Connecting, d);
    cmds_.connect_device(d);
    return true;
}

bool OperationTracker::request_disconnect(const bt::Device &d)
{
    if (state_ != OperationState::Idle || !d.connected)
        return false;
    begin(OperationState::Disconnecting, d);
    cmds_.disconnect_device(d);
    return true;
}

bool OperationTracker::request_forget(const bt::Device &d)
{
    if (state_ != OperationState::Idle || !d.paired)
        return false;
    begin(OperationState::ShowForgetConfirm, d);
    return true;
}

bool OperationTracker::confirm_forget()
{
    if (state_ != OperationState::ShowForgetConfirm || !target_)
        return false;
    state_ = OperationState::Forgetting;
    cmds_.forget_device(*target_);
    return true;
}

bool OperationTracker::cancel_forget()
{
    if (state_ != OperationState::ShowForgetConfirm)
        return false;
    reset("forget cancelled");
    return true;
}

bool OperationTracker::activate(const bt::Device &d)
{
    if (d.connected)
        return request_disconnect(d);
    if (d.paired)
        return request_connect(d);
    return request_pair(d);
}

void OperationTracker::on_devices_updated(const bt::Snapshot &devices)
{
    if (state_ == OperationState::Idle || !target_)
        return;
    for (const auto &d : devices)
    {
        if (is_target(d))
        {
            target_ = d;
            return;
        }
    }
    reset("target gone");
}

void OperationTracker::on_paired(const bt::Device &d)
{
    if (state_ != OperationState::Pairing || !is_target(d))
        return;
    // paired devices go straight on to connecting
    begin(OperationState::Connecting, d);
    cmds_.connect_device(d);
}

void OperationTracker::on_pair_failed(const std::string &message)
{
    if (state_ != OperationState::Pairing)
        return;
    LOG_DEBUG("pair failed: %s", message.c_str());
    reset("pair failed");
}

void OperationTracker::on_connected(const bt::Device &d)
{
    if (state_ == OperationState::Connecting && is_target(d))
        reset("connected");
}

void OperationTracker::on_disconnected(const bt::Device &d)
{
    if ((state_ == OperationState::Disconnecting || state_ == OperationState::Forgetting) &&
        is_target(d))
        reset("disconnected");
}

void OperationTracker::on_operation_failed(const bt::Device      &d,
                                           manager::OperationKind kind,
                                           const std::string     &message)
{
    if (!is_target(d))
        return;

    OperationState expected = OperationState::Idle;
    switch (kind)
    {
        case manager::OperationKind::Pair:
            expected = OperationState::Pairing;
            break;
        case manager::OperationKind::Connect:
            expected = OperationState::Connecting;
            break;
        case manager::OperationKind::Disconnect:
            expected = OperationState::Disconnecting;
            break;
        case manager::OperationKind::Forget:
            expected = OperationState::Forgetting;
            break;
    }
    if (state_ != expected)
        return;
    LOG_DEBUG("%s failed: %s", manager::operation_kind_name(kind), message.c_str());
    reset("operation failed");
}

std::string OperationTracker::status_text(const bt::Device &d) const
{
    if (!is_target(d))
        return {};
    switch (state_)
    {
        case OperationState::Pairing:
            return "PAIRING...";
        case OperationState::Connecting:
            return "CONNECTING...";
        case OperationState::Disconnecting:
            return "DISCONNECTING...";
        case OperationState::Forgetting:
            return "FORGETTING...";
        default:
            return {};
    }
}

bool OperationTracker::is_busy(const bt::Device &d) const
{
    return !status_text(d).empty();
}

manager::Listeners OperationTracker::listeners()
{
    manager::Listeners l;
    l.devices_updated     = [this](const bt::Snapshot &s) { on_devices_updated(s); };
    l.device_paired       = [this](const bt::Device &d) { on_paired(d); };
    l.pair_failed         = [this](const std::string &m) { on_pair_failed(m); };
    l.device_connected    = [this](const bt::Device &d) { on_connected(d); };
    l.device_disconnected = [this](const bt::Device &d) { on_disconnected(d); };
    l.operation_failed    = [this](const bt::Device &d, manager::OperationKind k,
                                const std::string &m) { on_operation_failed(d, k, m); };
    return l;
}

}  // namespace app
