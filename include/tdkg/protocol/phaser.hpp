#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "tdkg/protocol/phase.hpp"

namespace tdkg {

using PhaseHandler = std::function<void(Phase phase)>;

// Source of the phase schedule. Policies decide when to move on; this base
// enforces that Deal, Response, Justification and Finish are each emitted
// exactly once and in that order, and keeps phases emitted before a handler
// is registered so none is lost. The handler is invoked with the internal
// lock held: it must not block or call back into the phaser.
class Phaser {
 public:
  virtual ~Phaser() = default;

  Phaser(const Phaser&) = delete;
  Phaser& operator=(const Phaser&) = delete;

  void RegisterHandler(PhaseHandler handler);

  // Next phase to be emitted, nullopt once kFinish went out.
  std::optional<Phase> next_phase() const;

 protected:
  Phaser() = default;

  // Throws std::logic_error unless `phase` is next_phase().
  void Emit(Phase phase);

 private:
  mutable std::mutex mu_;
  PhaseHandler handler_;
  std::vector<Phase> pending_;
  std::optional<Phase> next_ = Phase::kDeal;
};

// Fixed-delay policy: emits Deal immediately after Start(), then sleeps
// between consecutive phases on a background thread.
class TimePhaser : public Phaser {
 public:
  using SleepFn = std::function<void()>;

  explicit TimePhaser(std::chrono::milliseconds period);
  explicit TimePhaser(SleepFn sleep);
  ~TimePhaser() override;

  void Start();
  // Emits nothing further. A custom SleepFn in progress is not interrupted.
  void Stop();

 private:
  void Run();
  bool SleepBetweenPhases();

  std::chrono::milliseconds period_{0};
  SleepFn sleep_;

  std::mutex stop_mu_;
  std::condition_variable stop_cv_;
  bool stopped_ = false;
  bool started_ = false;
  std::thread worker_;
};

// Externally clocked policy, for schedules agreed out of band: every
// Advance() emits the next phase.
class TriggeredPhaser : public Phaser {
 public:
  TriggeredPhaser() = default;

  // False once every phase has been emitted.
  bool Advance();
};

}  // namespace tdkg
