// fxstack - recovery and position-lifecycle manager
// Single-threaded tick loop
//
// SYSTEM OVERVIEW:
// 1. Load config and the last saved book (refuse to start on a malformed one)
// 2. Reconcile the book against the terminal and rebuild stacks from tags
// 3. Every tick: take new entry signals, then let the coordinator manage
//    every stack (recovery, stack exits, ladder, cascade, orphans)
// 4. Save every few ticks, when blocks change, and on shutdown
//
// STATE MANAGEMENT:
// - The terminal is the source of truth for what is open
// - The state file holds what the terminal cannot: stack links, ladder
//   flags, trailing stops and entry blocks
//
// EXIT CODES:
// - 0 clean shutdown
// - 1 tracker invariant broken (state deliberately not saved)
// - 2 malformed config or state file

#include "bridge_client.h"
#include "config.h"
#include "event_log.h"
#include "position_tracker.h"
#include "signal_inbox.h"
#include "stack_coordinator.h"
#include "state_store.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <print>
#include <string>
#include <thread>

namespace {

std::atomic<bool> stop_requested{false};

void on_signal(int) { stop_requested = true; }

void save(const fxstack::StateStore &store,
          const fxstack::StackCoordinator &coordinator) {
  if (auto saved = store.save(coordinator.snapshot()); not saved)
    std::println("\033[31m[STATE] Save failed: {}\033[0m",
                 saved.error().message);
}

} // namespace

int main() {
  std::println("fxstack - Recovery & Position-Lifecycle Manager");
  std::println("Starting at {}\n", fxstack::to_iso(fxstack::now_seconds()));

  // ═══════════════════════════════════════════════════════════════════════
  // STARTUP
  // ═══════════════════════════════════════════════════════════════════════

  const auto config_path =
      fxstack::get_env_or_default("FXSTACK_CONFIG", "fxstack.json");
  auto config = fxstack::load_config(config_path);
  if (not config) {
    std::println(stderr, "\033[31mBad config {}: {}\033[0m", config_path,
                 config.error().message);
    return 2;
  }

  const auto store = fxstack::StateStore{
      fxstack::get_env_or_default("FXSTACK_STATE", "data/recovery_state.json")};
  auto state = store.load();
  if (not state) {
    std::println(stderr, "\033[31mRefusing to start: {}\033[0m",
                 state.error().message);
    return 2;
  }

  auto bridge = fxstack::BridgeClient{};
  auto events = fxstack::JsonlEventLog{
      fxstack::get_env_or_default("FXSTACK_EVENTS_DIR", "data/events")};
  auto inbox = fxstack::SignalInbox{
      fxstack::get_env_or_default("FXSTACK_SIGNALS", "data/signals.jsonl")};

  const auto loop = config->loop;
  auto tracker = fxstack::PositionTracker{};
  auto coordinator = fxstack::StackCoordinator{tracker, bridge, bridge, events,
                                               std::move(*config)};

  std::println("Bridge {}, state {}, events {}", bridge.base_url(),
               store.path().string(), events.directory().string());

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  try {
    const auto start = fxstack::now_seconds();
    coordinator.restore(std::move(*state), start);

    const auto report = coordinator.reconcile(start);
    tracker.verify();
    std::println("[STARTUP] {} stacks after reconcile (+{} adopted, -{} "
                 "closed while down)\n",
                 tracker.size(), report.added, report.removed);

    // ═════════════════════════════════════════════════════════════════════
    // MAIN LOOP
    // ═════════════════════════════════════════════════════════════════════
    //
    // Serial each tick:
    // 1. Drain entry signals into new stacks
    // 2. Manage every tracked stack
    // 3. Save on cadence or when blocking flags moved
    //
    auto ticks = 0;
    while (not stop_requested) {
      const auto now = fxstack::now_seconds();

      for (const auto &signal : inbox.drain())
        if (auto opened = coordinator.open_entry(signal, now); not opened)
          std::println("[ENTRY] {} not opened: {}", signal.symbol,
                       opened.error());

      coordinator.run_tick(now);

      if (++ticks % loop.save_every_ticks == 0 or coordinator.take_dirty())
        save(store, coordinator);

      // Sleep in short steps so a signal is noticed promptly
      const auto wake = std::chrono::steady_clock::now() +
                        std::chrono::seconds{loop.tick_seconds};
      while (not stop_requested and std::chrono::steady_clock::now() < wake)
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
    }

  } catch (const fxstack::InvariantViolation &e) {
    std::println(stderr, "\033[31m[FATAL] Tracker invariant broken: {}\033[0m",
                 e.what());
    std::println(stderr, "\033[31m[FATAL] State not saved; last good file "
                         "kept at {}\033[0m",
                 store.path().string());
    return 1;
  }

  // ═══════════════════════════════════════════════════════════════════════
  // SHUTDOWN
  // ═══════════════════════════════════════════════════════════════════════

  save(store, coordinator);
  std::println("\nShutdown at {}, {} stacks saved",
               fxstack::to_iso(fxstack::now_seconds()), tracker.size());
  return 0;
}
