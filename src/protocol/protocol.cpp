#include "tdkg/protocol/protocol.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "tdkg/dkg/joint_feldman_engine.hpp"

namespace tdkg {
namespace {

std::unique_ptr<IKeyGenEngine> RequireEngine(std::unique_ptr<IKeyGenEngine> engine) {
  if (!engine) {
    throw std::invalid_argument("Protocol requires a key generation engine");
  }
  return engine;
}

std::unique_ptr<IAuthenticator> BuildAuthenticator(const ProtocolConfig& cfg) {
  const Roster old_roster(cfg.dkg.old_nodes);
  const Roster new_roster = cfg.dkg.new_nodes.empty() ? old_roster : Roster(cfg.dkg.new_nodes);
  return MakeAuthenticator(cfg.auth, old_roster, new_roster, cfg.dkg.longterm);
}

ProtocolEvent PhaseEvent(ProtocolEventType type, Phase phase) {
  ProtocolEvent event;
  event.type = type;
  event.phase = phase;
  return event;
}

ProtocolEvent EnvelopeEvent(ProtocolEventType type,
                            EnvelopeKind kind,
                            PartyIndex sender,
                            std::string detail) {
  ProtocolEvent event;
  event.type = type;
  event.kind = kind;
  event.sender = sender;
  event.success = type != ProtocolEventType::kEnvelopeDropped;
  event.detail = std::move(detail);
  return event;
}

}  // namespace

Protocol::Protocol(ProtocolConfig cfg,
                   std::shared_ptr<IBoard> board,
                   std::shared_ptr<Phaser> phaser,
                   EventHook hook)
    : Protocol(cfg,
               std::make_unique<JointFeldmanEngine>(cfg.dkg),
               std::move(board),
               std::move(phaser),
               std::move(hook)) {}

Protocol::Protocol(ProtocolConfig cfg,
                   std::unique_ptr<IKeyGenEngine> engine,
                   std::shared_ptr<IBoard> board,
                   std::shared_ptr<Phaser> phaser,
                   EventHook hook)
    : engine_(RequireEngine(std::move(engine))),
      board_(std::move(board)),
      phaser_(std::move(phaser)),
      auth_(BuildAuthenticator(cfg)),
      hook_(std::move(hook)),
      phase_timeout_(cfg.phase_timeout),
      can_issue_(engine_->CanIssue()),
      inbox_(std::make_shared<EventQueue<Event>>()) {
  if (!board_) {
    throw std::invalid_argument("Protocol requires a board");
  }
  if (!phaser_) {
    throw std::invalid_argument("Protocol requires a phaser");
  }
  if (phase_timeout_.count() < 0) {
    throw std::invalid_argument("phase_timeout must not be negative");
  }

  // The handlers own the inbox, so late deliveries after the run (or after
  // this object) is gone land in a closed queue and are discarded.
  std::shared_ptr<EventQueue<Event>> inbox = inbox_;
  board_->RegisterHandler([inbox](const SignedEnvelope& envelope) { inbox->Push(envelope); });
  phaser_->RegisterHandler([inbox](Phase phase) { inbox->Push(phase); });
}

Protocol::~Protocol() {
  inbox_->Close();
  board_->RegisterHandler({});
  phaser_->RegisterHandler({});
}

void Protocol::Start() {
  if (started_.exchange(true)) {
    throw std::logic_error("Protocol::Start called twice");
  }

  auto deadline = std::chrono::steady_clock::now() + phase_timeout_;
  while (true) {
    Event event;
    const QueueStatus status = phase_timeout_.count() > 0 ? inbox_->PopUntil(deadline, &event)
                                                          : inbox_->Pop(&event);
    if (status == QueueStatus::kTimedOut) {
      Terminate(ProtocolOutcome::Failure(
          ProtocolErrorCode::kTimedOut,
          "no phase signal within " + std::to_string(phase_timeout_.count()) + "ms"));
      return;
    }
    // Only the destructor closes the inbox of a loop that has not terminated.
    if (status == QueueStatus::kClosed) {
      Terminate(ProtocolOutcome::Failure(ProtocolErrorCode::kCancelled, "inbox closed"));
      return;
    }

    if (const Phase* phase = std::get_if<Phase>(&event)) {
      deadline = std::chrono::steady_clock::now() + phase_timeout_;
      if (!HandlePhase(*phase)) {
        return;
      }
    } else if (const SignedEnvelope* envelope = std::get_if<SignedEnvelope>(&event)) {
      HandleEnvelope(*envelope);
    } else {
      Terminate(ProtocolOutcome::Failure(ProtocolErrorCode::kCancelled, "run cancelled"));
      return;
    }
  }
}

void Protocol::Cancel() {
  inbox_->Push(CancelSignal{});
}

std::future<ProtocolOutcome> Protocol::WaitEnd() {
  return outcome_.get_future();
}

bool Protocol::can_issue() const {
  return can_issue_;
}

bool Protocol::HandlePhase(Phase phase) {
  Notify(PhaseEvent(ProtocolEventType::kPhaseStarted, phase));

  bool keep_running = true;
  switch (phase) {
    case Phase::kDeal:
      keep_running = SendDeals();
      break;
    case Phase::kResponse:
      keep_running = SendResponses();
      break;
    case Phase::kJustification:
      keep_running = SendJustifications();
      break;
    case Phase::kFinish:
      Finish();
      return false;
  }

  if (keep_running) {
    Notify(PhaseEvent(ProtocolEventType::kPhaseCompleted, phase));
  }
  return keep_running;
}

void Protocol::HandleEnvelope(const SignedEnvelope& envelope) {
  const EnvelopeKind kind = KindOf(envelope);
  const PartyIndex sender = SenderOf(envelope);

  std::string error;
  bool verified = false;
  try {
    verified = auth_->Verify(envelope, &error);
  } catch (const std::exception& ex) {
    error = ex.what();
  }
  if (!verified) {
    Notify(EnvelopeEvent(ProtocolEventType::kEnvelopeDropped, kind, sender, std::move(error)));
    return;
  }

  switch (kind) {
    case EnvelopeKind::kDeal:
      deals_.push_back(std::get<AuthDealBundle>(envelope).bundle);
      break;
    case EnvelopeKind::kResponse:
      responses_.push_back(std::get<AuthResponseBundle>(envelope).bundle);
      break;
    case EnvelopeKind::kJustification:
      justifications_.push_back(std::get<AuthJustificationBundle>(envelope).bundle);
      break;
  }
  Notify(EnvelopeEvent(ProtocolEventType::kEnvelopeAccepted, kind, sender, {}));
}

bool Protocol::SendDeals() {
  if (!can_issue_) {
    return true;
  }

  AuthDealBundle envelope;
  try {
    envelope.bundle = engine_->Deals();
  } catch (const std::exception& ex) {
    Terminate(ProtocolOutcome::Failure(ProtocolErrorCode::kEngineFailed, ex.what()));
    return false;
  }
  return SignAndPush(&envelope);
}

bool Protocol::SendResponses() {
  std::optional<ResponseBundle> response;
  try {
    response = engine_->ProcessDeals(deals_);
  } catch (const std::exception& ex) {
    Terminate(ProtocolOutcome::Failure(ProtocolErrorCode::kEngineFailed, ex.what()));
    return false;
  }

  if (!response.has_value()) {
    return true;
  }
  AuthResponseBundle envelope;
  envelope.bundle = std::move(*response);
  return SignAndPush(&envelope);
}

bool Protocol::SendJustifications() {
  ResponseProcessing processed;
  try {
    processed = engine_->ProcessResponses(responses_);
  } catch (const std::exception& ex) {
    Terminate(ProtocolOutcome::Failure(ProtocolErrorCode::kEngineFailed, ex.what()));
    return false;
  }

  if (processed.result.has_value()) {
    Terminate(ProtocolOutcome::Success(std::move(*processed.result)));
    return false;
  }
  if (!processed.justification.has_value()) {
    return true;
  }
  AuthJustificationBundle envelope;
  envelope.bundle = std::move(*processed.justification);
  return SignAndPush(&envelope);
}

void Protocol::Finish() {
  std::optional<DkgResult> result;
  try {
    result = engine_->ProcessJustifications(justifications_);
  } catch (const std::exception& ex) {
    Terminate(ProtocolOutcome::Failure(ProtocolErrorCode::kEngineFailed, ex.what()));
    return;
  }
  Terminate(ProtocolOutcome::Success(std::move(*result)));
}

template <typename AuthBundle>
bool Protocol::SignAndPush(AuthBundle* envelope) {
  try {
    envelope->signature = auth_->Sign(envelope->bundle);
  } catch (const std::exception& ex) {
    Terminate(ProtocolOutcome::Failure(
        ProtocolErrorCode::kSigningFailed,
        std::string("cannot sign ") + ToString(AuthBundle::kKind) + " bundle: " + ex.what()));
    return false;
  }

  try {
    Push(*envelope);
  } catch (const std::exception& ex) {
    Terminate(ProtocolOutcome::Failure(
        ProtocolErrorCode::kBroadcastFailed,
        std::string("cannot push ") + ToString(AuthBundle::kKind) + " bundle: " + ex.what()));
    return false;
  }

  Notify(EnvelopeEvent(ProtocolEventType::kBundleSent, AuthBundle::kKind,
                       envelope->bundle.sender_index(), {}));
  return true;
}

void Protocol::Push(const AuthDealBundle& envelope) {
  board_->PushDeal(envelope);
}

void Protocol::Push(const AuthResponseBundle& envelope) {
  board_->PushResponse(envelope);
}

void Protocol::Push(const AuthJustificationBundle& envelope) {
  board_->PushJustification(envelope);
}

void Protocol::Terminate(ProtocolOutcome outcome) {
  if (outcome_written_) {
    return;
  }
  outcome_written_ = true;
  inbox_->Close();

  ProtocolEvent event;
  event.type = ProtocolEventType::kTerminated;
  event.success = outcome.ok();
  if (!outcome.ok()) {
    event.detail = std::string(ToString(outcome.error().code)) + ": " + outcome.error().message;
  }
  outcome_.set_value(std::move(outcome));
  Notify(std::move(event));
}

void Protocol::Notify(ProtocolEvent event) const {
  if (hook_) {
    hook_(event);
  }
}

}  // namespace tdkg
