#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <variant>
#include <vector>

#include "tdkg/auth/authenticator.hpp"
#include "tdkg/common/event_queue.hpp"
#include "tdkg/net/board.hpp"
#include "tdkg/protocol/config.hpp"
#include "tdkg/protocol/engine.hpp"
#include "tdkg/protocol/events.hpp"
#include "tdkg/protocol/outcome.hpp"
#include "tdkg/protocol/phaser.hpp"

namespace tdkg {

// Drives one key generation run. Phase signals and board deliveries are
// queued from any thread; Start() consumes them on the calling thread until
// the run ends, then publishes exactly one outcome through WaitEnd().
class Protocol {
 public:
  // Runs the JointFeldmanEngine configured by cfg.dkg.
  Protocol(ProtocolConfig cfg,
           std::shared_ptr<IBoard> board,
           std::shared_ptr<Phaser> phaser,
           EventHook hook = {});
  Protocol(ProtocolConfig cfg,
           std::unique_ptr<IKeyGenEngine> engine,
           std::shared_ptr<IBoard> board,
           std::shared_ptr<Phaser> phaser,
           EventHook hook = {});
  ~Protocol();

  Protocol(const Protocol&) = delete;
  Protocol& operator=(const Protocol&) = delete;

  // Blocks until the run terminates. Callable once.
  void Start();

  // Ends a running protocol with a kCancelled error. Safe from any thread.
  void Cancel();

  // The single outcome of the run. Callable once.
  std::future<ProtocolOutcome> WaitEnd();

  bool can_issue() const;

 private:
  struct CancelSignal {};
  using Event = std::variant<Phase, SignedEnvelope, CancelSignal>;

  bool HandlePhase(Phase phase);
  void HandleEnvelope(const SignedEnvelope& envelope);

  bool SendDeals();
  bool SendResponses();
  bool SendJustifications();
  void Finish();

  template <typename AuthBundle>
  bool SignAndPush(AuthBundle* envelope);
  void Push(const AuthDealBundle& envelope);
  void Push(const AuthResponseBundle& envelope);
  void Push(const AuthJustificationBundle& envelope);

  void Terminate(ProtocolOutcome outcome);
  void Notify(ProtocolEvent event) const;

  std::unique_ptr<IKeyGenEngine> engine_;
  std::shared_ptr<IBoard> board_;
  std::shared_ptr<Phaser> phaser_;
  std::unique_ptr<IAuthenticator> auth_;
  EventHook hook_;
  std::chrono::milliseconds phase_timeout_;
  const bool can_issue_;

  std::shared_ptr<EventQueue<Event>> inbox_;
  std::atomic<bool> started_{false};

  std::vector<DealBundle> deals_;
  std::vector<ResponseBundle> responses_;
  std::vector<JustificationBundle> justifications_;

  std::promise<ProtocolOutcome> outcome_;
  bool outcome_written_ = false;
};

}  // namespace tdkg
