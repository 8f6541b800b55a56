/* ======================================================================
 * BluetoothManager - threads and data flow
 *
 *  Consumer thread          Background threads                         BlueZ (bus)
 *  ---------------          ------------------                         -----------
 *  ctor
 *    └─ spawn ───────────▶  adapter discovery (retry every >= 1s) ───▶ GetManagedObjects
 *                             └─ found Adapter1 → spawn scanner + monitor
 *                           scanner: every scan_period while active ──▶ GetManagedObjects
 *                           monitor: AddMatch once, wait(signal_wait) ◀── PropertiesChanged
 *                             └─ Connected flip → callback + refresh
 *  pair/connect/... ─────▶  one detached worker per command ──────────▶ Device1.* / Adapter1.RemoveDevice
 *
 *  refresh: GetManagedObjects → build_snapshot → replace registry → queue devices_updated
 *  process_callbacks(): drains the queue on the consumer thread (FIFO)
 *
 *  Notes
 *    └─ registry, adapter path and thread handles share one lock (Impl::mu)
 *    └─ threads hold shared_ptr<Impl>; a thread that misses the join deadline
 *       is detached and still finds valid state
 *    └─ stop(): exit flag → StopDiscovery → bounded joins → close buses
 * ====================================================================== */

#include "manager/bluetooth_manager.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "manager/callback_queue.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace manager
{
namespace
{

const std::string BLUEZ(constants::BLUEZ_SERVICE);
const std::string ADAPTER_IFACE(constants::ADAPTER_IFACE);
const std::string DEVICE_IFACE(constants::DEVICE_IFACE);

std::int64_t now_ms()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

// a thread whose completion can be awaited with a deadline
struct LoopThread
{
    std::thread       thread;
    std::future<void> done;
};

template <typename F>
LoopThread spawn_loop(F body)
{
    std::promise<void> finished;
    LoopThread         lt;
    lt.done   = finished.get_future();
    lt.thread = std::thread([body = std::move(body), finished = std::move(finished)]() mutable {
        body();
        finished.set_value();
    });
    return lt;
}

// threads cannot be forced to end: give up after `timeout` and detach
bool join_for(LoopThread &lt, std::chrono::milliseconds timeout, const char *what)
{
    if (!lt.thread.joinable())
        return true;
    if (lt.done.valid() && lt.done.wait_for(timeout) == std::future_status::ready)
    {
        lt.thread.join();
        return true;
    }
    LOG_WARN("[BT] %s thread still running after %lldms, detaching", what,
             (long long)timeout.count());
    lt.thread.detach();
    return false;
}

}  // namespace

const char *operation_kind_name(OperationKind k)
{
    switch (k)
    {
        case OperationKind::Pair:
            return "pair";
        case OperationKind::Connect:
            return "connect";
        case OperationKind::Disconnect:
            return "disconnect";
        case OperationKind::Forget:
            return "forget";
    }
    return "?";
}

struct BluetoothManager::Impl
{
    Impl(std::shared_ptr<bus::IBus> b, std::shared_ptr<bus::IBus> m, ManagerConfig c)
        : bus(std::move(b)), monitor(std::move(m)), cfg(c)
    {
        if (cfg.adapter_retry < constants::ADAPTER_RETRY)
            cfg.adapter_retry = constants::ADAPTER_RETRY;
    }

    std::shared_ptr<bus::IBus> bus;      // commands and enumeration
    std::shared_ptr<bus::IBus> monitor;  // signal subscription only
    ManagerConfig              cfg;

    // registry, adapter path and thread handles; never held across a bus call
    mutable std::mutex mu;
    bt::DeviceRegistry registry;
    std::string        adapter;
    LoopThread         discovery_thr;
    LoopThread         scanner_thr;
    LoopThread         monitor_thr;

    // one refresh at a time, in order; held across GetManagedObjects
    std::mutex refresh_mu;

    std::mutex             listeners_mu;
    std::vector<Listeners> listeners;
    CallbackQueue          callbacks;

    std::atomic_bool          exit{false};
    std::atomic_bool          stopped{false};
    std::atomic_bool          available{false};
    std::atomic_bool          active{false};
    std::atomic_bool          scanning{false};
    std::atomic_bool          want_scan{false};  // last start_scan/stop_scan request
    std::atomic_bool          start_inflight{false};
    std::atomic_bool          stop_inflight{false};
    std::atomic<std::int64_t> last_scan_ms{0};

    std::mutex              wake_mu;
    std::condition_variable wake_cv;

    // false when woken by shutdown
    bool sleep_for(std::chrono::milliseconds d)
    {
        std::unique_lock<std::mutex> lk(wake_mu);
        return !wake_cv.wait_for(lk, d, [this] { return exit.load(); });
    }

    void wake()
    {
        {
            std::lock_guard<std::mutex> lk(wake_mu);
        }
        wake_cv.notify_all();
    }

    // bind the current listener sets now, run them on the next drain
    template <typename Fn, typename... Args>
    void enqueue(Fn Listeners::*member, const Args &...args)
    {
        std::lock_guard<std::mutex> lk(listeners_mu);
        for (const auto &l : listeners)
        {
            const Fn &fn = l.*member;
            if (!fn)
                continue;
            callbacks.push([fn, args...] { fn(args...); });
        }
    }

    std::optional<bt::Device> device_by_path(const std::string &path) const
    {
        std::lock_guard<std::mutex> lk(mu);
        return registry.find_by_path(path);
    }

    std::string adapter_path() const
    {
        std::lock_guard<std::mutex> lk(mu);
        return adapter;
    }

    bus::MethodCall device_call(const bt::Device &d, const char *member) const
    {
        return bus::MethodCall{BLUEZ, d.path, DEVICE_IFACE, member, {}};
    }

    void wait_for_adapter(const std::shared_ptr<Impl> &self);
    void scanner_loop();
    void monitor_loop();
    void handle_signal(const bus::PropertiesChanged &sig);
    void update_devices();
    void set_discovery(bool on);
    void start_discovery();
    void stop_discovery();

    void pair(const bt::Device &d);
    void run_device_method(const bt::Device &d, OperationKind kind, const char *member);
    void forget(const bt::Device &d);
    void report_failure(const bt::Device &d, OperationKind kind, const bus::CallResult &res);
};

// ======================================================================
// Function: Impl::wait_for_adapter
// - In: runs on its own thread until an Adapter1 object shows up or exit
// - Out: records the adapter path and starts the scanner and monitor loops
// - Note: no adapter is a normal mode; failures are logged once
// ======================================================================
void BluetoothManager::Impl::wait_for_adapter(const std::shared_ptr<Impl> &self)
{
    bool reported = false;
    while (!exit.load())
    {
        bus::ManagedObjects objs;
        bus::CallResult     res = bus->get_managed_objects(BLUEZ, objs);
        if (res.ok())
        {
            auto it = std::find_if(objs.begin(), objs.end(), [](const bus::ManagedObject &o) {
                return o.interfaces.count(ADAPTER_IFACE) != 0;
            });
            if (it != objs.end())
            {
                std::lock_guard<std::mutex> lk(mu);
                if (exit.load())
                    return;
                adapter = it->path;
                available.store(true);
                LOG_INFO("[BT] Found Bluetooth adapter: %s", adapter.c_str());
                scanner_thr = spawn_loop([self] { self->scanner_loop(); });
                monitor_thr = spawn_loop([self] { self->monitor_loop(); });
                LOG_DEBUG("[BT] manager initialized");
                return;
            }
            if (!reported)
                LOG_INFO("[BT] no Bluetooth adapter yet, retrying every %lldms",
                         (long long)cfg.adapter_retry.count());
        }
        else if (!reported)
        {
            LOG_WARN("[BT] Error finding Bluetooth adapter: %s", res.describe().c_str());
        }
        reported = true;
        sleep_for(cfg.adapter_retry);
    }
}

void BluetoothManager::Impl::scanner_loop()
{
    while (!exit.load())
    {
        if (active.load() && now_ms() - last_scan_ms.load() > cfg.scan_period.count())
        {
            update_devices();
            last_scan_ms.store(now_ms());
        }
        sleep_for(cfg.scan_tick);
    }
}

// ======================================================================
// Function: Impl::monitor_loop
// - In: monitor connection, adapter already known
// - Out: connected/disconnected callbacks followed by a full refresh
// - Note: a wait timeout is just the next poll; signals queue while inactive
// ======================================================================
void BluetoothManager::Impl::monitor_loop()
{
    bus::MatchRule rule;
    rule.interface = std::string(constants::PROPERTIES_IFACE);
    rule.member    = std::string(constants::PROPERTIES_CHANGED);
    rule.arg0      = DEVICE_IFACE;

    bool reported = false;
    while (!exit.load())
    {
        bus::CallResult res = monitor->add_match(rule);
        if (res.ok())
            break;
        if (!reported)
            LOG_ERROR("[BT] subscribe to PropertiesChanged failed: %s", res.describe().c_str());
        reported = true;
        sleep_for(cfg.adapter_retry);
    }

    while (!exit.load())
    {
        if (!active.load())
        {
            sleep_for(cfg.inactive_poll);
            continue;
        }

        bus::PropertiesChanged sig;
        switch (monitor->wait_properties_changed(cfg.signal_wait, sig))
        {
            case bus::WaitStatus::Timeout:
                break;
            case bus::WaitStatus::Error:
                if (!exit.load())
                {
                    LOG_DEBUG("[BT] signal wait failed, backing off");
                    sleep_for(cfg.signal_wait);
                }
                break;
            case bus::WaitStatus::Signal:
                handle_signal(sig);
                break;
        }
    }
}

void BluetoothManager::Impl::handle_signal(const bus::PropertiesChanged &sig)
{
    if (sig.interface != DEVICE_IFACE)
        return;
    auto it = sig.changed.find("Connected");
    if (it == sig.changed.end())
        return;
    const bool *connected = std::get_if<bool>(&it->second.value);
    if (!connected || it->second.type != 'b')
    {
        LOG_WARN("[BT] Connected on %s is not a boolean ('%c')", sig.path.c_str(),
                 it->second.type);
        return;
    }

    auto dev = device_by_path(sig.path);
    if (!dev)
        return;  // not listed (unnamed or not enumerated yet)

    dev->connected = *connected;
    if (*connected)
    {
        LOG_INFO("[BT] %s connected (%s)", dev->name.c_str(), sig.path.c_str());
        enqueue(&Listeners::device_connected, *dev);
    }
    else
    {
        LOG_INFO("[BT] %s disconnected (%s)", dev->name.c_str(), sig.path.c_str());
        enqueue(&Listeners::device_disconnected, *dev);
    }
    update_devices();
}

// ======================================================================
// Function: Impl::update_devices
// - In: any thread; refreshes are serialized by refresh_mu
// - Out: registry replaced, devices_updated queued with the new snapshot
// - Note: the bus call runs without mu, so queries and stop() never wait on it;
//         on a failed enumeration the previous snapshot stays
// ======================================================================
void BluetoothManager::Impl::update_devices()
{
    std::lock_guard<std::mutex> refresh(refresh_mu);
    if (adapter_path().empty())
        return;

    bus::ManagedObjects objs;
    bus::CallResult     res = bus->get_managed_objects(BLUEZ, objs);
    if (exit.load())
        return;  // shut down while the call was in flight
    if (!res.ok())
    {
        LOG_WARN("[BT] Failed to get Bluetooth objects: %s", res.describe().c_str());
        return;
    }

    std::size_t  skipped = 0;
    bt::Snapshot snap    = bt::build_snapshot(objs, cfg.duplicates, &skipped);
    {
        std::lock_guard<std::mutex> lk(mu);
        registry.replace(snap);
    }
    LOG_DEBUG("[BT] devices updated: %zu listed, %zu undecodable", snap.size(), skipped);
    enqueue(&Listeners::devices_updated, snap);
}

void BluetoothManager::Impl::set_discovery(bool on)
{
    const std::string path = adapter_path();
    if (path.empty())
        return;

    const char     *member = on ? "StartDiscovery" : "StopDiscovery";
    bus::CallResult res    = bus->call_method(bus::MethodCall{BLUEZ, path, ADAPTER_IFACE, member, {}});
    if (on)
    {
        if (res.ok() || res.error_name == constants::ERR_IN_PROGRESS)
        {
            scanning.store(true);
            LOG_DEBUG("[BT] Started Bluetooth scan on %s", path.c_str());
            return;
        }
        LOG_WARN("[BT] Failed to start Bluetooth scan: %s", res.describe().c_str());
        return;
    }
    // already stopped or state desync: treat as off either way
    scanning.store(false);
    if (res.ok())
        LOG_DEBUG("[BT] Stopped Bluetooth scan");
    else
        LOG_WARN("[BT] StopDiscovery failed (treat as off): %s", res.describe().c_str());
}

// a stop_scan() issued while StartDiscovery was in flight wins once it lands
void BluetoothManager::Impl::start_discovery()
{
    set_discovery(true);
    start_inflight.store(false);
    if (!want_scan.load() && scanning.load())
        stop_discovery();
}

void BluetoothManager::Impl::stop_discovery()
{
    if (stop_inflight.exchange(true))
        return;
    set_discovery(false);
    stop_inflight.store(false);
    if (want_scan.load() && !exit.load() && !start_inflight.exchange(true))
        start_discovery();
}

void BluetoothManager::Impl::report_failure(const bt::Device     &d,
                                            OperationKind         kind,
                                            const bus::CallResult &res)
{
    if (res.status == bus::CallStatus::ErrorReply)
        LOG_WARN("[BT] Failed to %s %s: %s: %s", operation_kind_name(kind), d.name.c_str(),
                 res.error_name.c_str(), res.message.c_str());
    else
        LOG_ERROR("[BT] Error during %s of %s: %s", operation_kind_name(kind), d.name.c_str(),
                  res.describe().c_str());
    enqueue(&Listeners::operation_failed, d, kind, res.describe());
}

// ======================================================================
// Function: Impl::pair
// - In: worker thread, device as the consumer last saw it
// - Out: device_paired with the refreshed device, or pair_failed(message)
// - Note: looks the device up again by path after the refresh; the snapshot
//         may have raced ahead of BlueZ's own Paired update
// ======================================================================
void BluetoothManager::Impl::pair(const bt::Device &d)
{
    bus::CallResult trust =
        bus->set_property(BLUEZ, d.path, DEVICE_IFACE, "Trusted", bus::Property{'b', true});
    if (trust.status == bus::CallStatus::TransportError)
    {
        report_failure(d, OperationKind::Pair, trust);
        enqueue(&Listeners::pair_failed, trust.describe());
        return;
    }
    if (!trust.ok())
        LOG_WARN("[BT] could not mark %s trusted: %s", d.name.c_str(), trust.describe().c_str());

    bus::CallResult res = bus->call_method(device_call(d, "Pair"));
    if (!res.ok())
    {
        report_failure(d, OperationKind::Pair, res);
        enqueue(&Listeners::pair_failed, res.describe());
        return;
    }

    LOG_INFO("[BT] Paired with %s", d.name.c_str());
    update_devices();
    if (auto updated = device_by_path(d.path))
        enqueue(&Listeners::device_paired, *updated);
}

void BluetoothManager::Impl::run_device_method(const bt::Device &d,
                                               OperationKind     kind,
                                               const char       *member)
{
    bus::CallResult res = bus->call_method(device_call(d, member));
    if (!res.ok())
    {
        report_failure(d, kind, res);
        return;
    }
    LOG_INFO("[BT] %s OK for %s", member, d.name.c_str());
    update_devices();
}

void BluetoothManager::Impl::forget(const bt::Device &d)
{
    const std::string path = adapter_path();
    if (path.empty())
        return;

    bus::CallResult res =
        bus->call_method(bus::MethodCall{BLUEZ, path, ADAPTER_IFACE, "RemoveDevice", {d.path}});
    if (!res.ok())
    {
        report_failure(d, OperationKind::Forget, res);
        return;
    }
    LOG_INFO("[BT] Forgot device %s", d.name.c_str());
    update_devices();
}

// ============== BluetoothManager ==============

namespace
{
template <typename Impl, typename F>
void spawn_worker(const std::shared_ptr<Impl> &self, F fn)
{
    // human-rate commands: one short-lived thread each
    std::thread([self, fn = std::move(fn)] { fn(*self); }).detach();
}
}  // namespace

BluetoothManager::BluetoothManager(std::shared_ptr<bus::IBus> bus,
                                   std::shared_ptr<bus::IBus> monitor_bus,
                                   Listeners                  listeners,
                                   ManagerConfig              cfg)
    : impl_(std::make_shared<Impl>(std::move(bus), std::move(monitor_bus), cfg))
{
    add_listeners(std::move(listeners));

    if (!impl_->bus || !impl_->monitor)
    {
        LOG_ERROR("[BT] no system bus connection, Bluetooth unavailable");
        return;
    }

    auto                        self = impl_;
    std::lock_guard<std::mutex> lk(impl_->mu);
    impl_->discovery_thr = spawn_loop([self] { self->wait_for_adapter(self); });
}

BluetoothManager::~BluetoothManager()
{
    stop();
}

void BluetoothManager::add_listeners(Listeners l)
{
    std::lock_guard<std::mutex> lk(impl_->listeners_mu);
    impl_->listeners.push_back(std::move(l));
}

std::size_t BluetoothManager::process_callbacks()
{
    return impl_->callbacks.drain();
}

std::size_t BluetoothManager::pending_callbacks() const
{
    return impl_->callbacks.pending();
}

bool BluetoothManager::is_available() const
{
    return impl_->available.load();
}

bool BluetoothManager::is_scanning() const
{
    return impl_->scanning.load();
}

bt::Snapshot BluetoothManager::devices() const
{
    std::lock_guard<std::mutex> lk(impl_->mu);
    return impl_->registry.snapshot();
}

std::string BluetoothManager::adapter_path() const
{
    std::lock_guard<std::mutex> lk(impl_->mu);
    return impl_->adapter;
}

void BluetoothManager::set_active(bool active)
{
    impl_->active.store(active);
    // refresh on the next tick unless one just happened
    if (active && now_ms() - impl_->last_scan_ms.load() > impl_->cfg.scan_period.count() / 2)
        impl_->last_scan_ms.store(0);
}

void BluetoothManager::start_scan()
{
    if (!impl_->available.load() || impl_->exit.load())
        return;
    impl_->want_scan.store(true);
    if (impl_->scanning.load() || impl_->start_inflight.exchange(true))
        return;
    spawn_worker(impl_, [](Impl &self) { self.start_discovery(); });
}

void BluetoothManager::stop_scan()
{
    if (!impl_->available.load() || impl_->exit.load())
        return;
    impl_->want_scan.store(false);
    // an in-flight start checks want_scan itself when it lands
    if (!impl_->scanning.load() || impl_->stop_inflight.load())
        return;
    spawn_worker(impl_, [](Impl &self) { self.stop_discovery(); });
}

void BluetoothManager::pair_device(const bt::Device &d)
{
    if (!impl_->available.load() || impl_->exit.load())
    {
        LOG_DEBUG("[BT] pair %s ignored: Bluetooth unavailable", d.name.c_str());
        return;
    }
    spawn_worker(impl_, [d](Impl &self) { self.pair(d); });
}

void BluetoothManager::connect_device(const bt::Device &d)
{
    if (!impl_->available.load() || impl_->exit.load())
    {
        LOG_DEBUG("[BT] connect %s ignored: Bluetooth unavailable", d.name.c_str());
        return;
    }
    spawn_worker(impl_,
                 [d](Impl &self) { self.run_device_method(d, OperationKind::Connect, "Connect"); });
}

void BluetoothManager::disconnect_device(const bt::Device &d)
{
    if (!impl_->available.load() || impl_->exit.load())
    {
        LOG_DEBUG("[BT] disconnect %s ignored: Bluetooth unavailable", d.name.c_str());
        return;
    }
    spawn_worker(impl_, [d](Impl &self) {
        self.run_device_method(d, OperationKind::Disconnect, "Disconnect");
    });
}

void BluetoothManager::forget_device(const bt::Device &d)
{
    if (!impl_->available.load() || impl_->exit.load())
    {
        LOG_DEBUG("[BT] forget %s ignored: Bluetooth unavailable", d.name.c_str());
        return;
    }
    spawn_worker(impl_, [d](Impl &self) { self.forget(d); });
}

// ======================================================================
// Function: BluetoothManager::stop
// - In: any thread except a manager callback; safe to call repeatedly
// - Out: loops ended or detached, discovery off, bus connections closed
// - Note: never waits on a bus call; StopDiscovery and the joins share one
//         join_timeout deadline, buses close last
// ======================================================================
void BluetoothManager::stop()
{
    if (impl_->stopped.exchange(true))
        return;

    LoopThread discovery, scanner, monitor;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        impl_->exit.store(true);
        discovery = std::move(impl_->discovery_thr);
        scanner   = std::move(impl_->scanner_thr);
        monitor   = std::move(impl_->monitor_thr);
    }
    impl_->want_scan.store(false);
    impl_->wake();

    const auto deadline = std::chrono::steady_clock::now() + impl_->cfg.join_timeout;
    auto       left     = [deadline] {
        auto d = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        return std::max(d, std::chrono::milliseconds(0));
    };

    // StopDiscovery can queue behind a stuck call on the same connection
    LoopThread scan_off;
    if (impl_->scanning.load() || impl_->start_inflight.load())
    {
        auto self = impl_;
        scan_off  = spawn_loop([self] { self->stop_discovery(); });
    }

    // Join OUTSIDE of the mutex; the loops take it to publish refreshes.
    join_for(scan_off, left(), "StopDiscovery");
    join_for(discovery, left(), "adapter discovery");
    join_for(scanner, left(), "scanner");
    join_for(monitor, left(), "monitor");

    if (impl_->monitor)
        impl_->monitor->close();
    if (impl_->bus)
        impl_->bus->close();
    LOG_DEBUG("[BT] manager stopped");
}

}  // namespace manager
