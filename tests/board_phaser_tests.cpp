#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "tdkg/net/in_memory_board.hpp"
#include "tdkg/protocol/phaser.hpp"

namespace {

using tdkg::AuthDealBundle;
using tdkg::AuthJustificationBundle;
using tdkg::AuthResponseBundle;
using tdkg::EnvelopeKind;
using tdkg::InMemoryBoardNetwork;
using tdkg::Phase;
using tdkg::SignedEnvelope;
using tdkg::TimePhaser;
using tdkg::TriggeredPhaser;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

class ScriptedPhaser : public tdkg::Phaser {
 public:
  using Phaser::Emit;
};

struct Inbox {
  std::mutex mu;
  std::vector<SignedEnvelope> received;

  tdkg::BoardHandler Handler() {
    return [this](const SignedEnvelope& envelope) {
      std::lock_guard<std::mutex> lock(mu);
      received.push_back(envelope);
    };
  }
};

std::vector<Phase> ExpectedSchedule() {
  return {Phase::kDeal, Phase::kResponse, Phase::kJustification, Phase::kFinish};
}

void TestBoardDeliversToEveryEndpoint() {
  auto network = std::make_shared<InMemoryBoardNetwork>();
  auto a = network->CreateEndpoint();
  auto b = network->CreateEndpoint();
  auto c = network->CreateEndpoint();
  Expect(network->endpoint_count() == 3, "three endpoints registered");
  Expect(a->endpoint_id() != b->endpoint_id(), "endpoint ids are distinct");

  Inbox inbox_a;
  Inbox inbox_b;
  Inbox inbox_c;
  a->RegisterHandler(inbox_a.Handler());
  b->RegisterHandler(inbox_b.Handler());
  c->RegisterHandler(inbox_c.Handler());

  AuthDealBundle deal;
  deal.bundle.dealer_index = 4;
  a->PushDeal(deal);

  AuthResponseBundle response;
  response.bundle.share_index = 2;
  b->PushResponse(response);

  AuthJustificationBundle justification;
  justification.bundle.dealer_index = 1;
  c->PushJustification(justification);

  for (Inbox* inbox : {&inbox_a, &inbox_b, &inbox_c}) {
    Expect(inbox->received.size() == 3, "every endpoint sees every push, its own included");
    Expect(tdkg::KindOf(inbox->received[0]) == EnvelopeKind::kDeal, "deal delivered first");
    Expect(tdkg::SenderOf(inbox->received[0]) == 4, "deal sender is the dealer index");
    Expect(tdkg::KindOf(inbox->received[1]) == EnvelopeKind::kResponse, "response second");
    Expect(tdkg::SenderOf(inbox->received[1]) == 2, "response sender is the share index");
    Expect(tdkg::KindOf(inbox->received[2]) == EnvelopeKind::kJustification,
           "justification third");
  }
  Expect(network->delivered_count() == 9, "delivery count covers all endpoints");
}

void TestBoardForgetsDestroyedEndpoints() {
  auto network = std::make_shared<InMemoryBoardNetwork>();
  auto survivor = network->CreateEndpoint();
  Inbox inbox;
  survivor->RegisterHandler(inbox.Handler());

  {
    auto transient = network->CreateEndpoint();
    Expect(network->endpoint_count() == 2, "transient endpoint registered");
  }
  Expect(network->endpoint_count() == 1, "destroyed endpoint unregistered");

  survivor->PushDeal(AuthDealBundle{});
  Expect(inbox.received.size() == 1, "survivor still receives");
  Expect(network->delivered_count() == 1, "no delivery to destroyed endpoint");

  // Pushes before a handler is registered are not buffered by the board.
  auto late = network->CreateEndpoint();
  survivor->PushDeal(AuthDealBundle{});
  Inbox late_inbox;
  late->RegisterHandler(late_inbox.Handler());
  Expect(late_inbox.received.empty(), "board does not replay earlier pushes");
}

void TestTimePhaserEmitsScheduleOnce() {
  int sleeps = 0;
  TimePhaser phaser([&sleeps]() { ++sleeps; });

  std::mutex mu;
  std::vector<Phase> seen;
  std::promise<void> finished;
  phaser.RegisterHandler([&](Phase phase) {
    std::lock_guard<std::mutex> lock(mu);
    seen.push_back(phase);
    if (phase == Phase::kFinish) {
      finished.set_value();
    }
  });

  phaser.Start();
  finished.get_future().wait();
  phaser.Stop();

  std::lock_guard<std::mutex> lock(mu);
  Expect(seen == ExpectedSchedule(), "time phaser emits the four phases in order");
  Expect(sleeps == 3, "time phaser sleeps between consecutive phases only");
  Expect(!phaser.next_phase().has_value(), "nothing left after finish");
  ExpectThrow([&]() { phaser.Start(); }, "time phaser starts once");
}

void TestTimePhaserStopInterruptsPeriod() {
  auto phaser = std::make_unique<TimePhaser>(std::chrono::hours(1));
  std::promise<void> dealt;
  std::vector<Phase> seen;
  phaser->RegisterHandler([&](Phase phase) {
    seen.push_back(phase);
    if (phase == Phase::kDeal) {
      dealt.set_value();
    }
  });
  phaser->Start();
  dealt.get_future().wait();
  phaser.reset();
  Expect(seen.size() == 1 && seen[0] == Phase::kDeal, "stopped phaser emits nothing further");

  ExpectThrow([]() { (void)TimePhaser(std::chrono::milliseconds(-1)); }, "negative period rejected");
  ExpectThrow([]() { (void)TimePhaser(TimePhaser::SleepFn()); }, "empty sleep function rejected");
}

void TestTriggeredPhaserReplaysPendingPhases() {
  TriggeredPhaser phaser;
  Expect(phaser.next_phase() == Phase::kDeal, "deal is first");
  Expect(phaser.Advance(), "advance to deal");
  Expect(phaser.Advance(), "advance to response");

  std::vector<Phase> seen;
  phaser.RegisterHandler([&seen](Phase phase) { seen.push_back(phase); });
  Expect(seen.size() == 2, "phases emitted before registration are replayed");

  Expect(phaser.Advance(), "advance to justification");
  Expect(phaser.Advance(), "advance to finish");
  Expect(!phaser.Advance(), "no phase after finish");
  Expect(seen == ExpectedSchedule(), "triggered phaser emits the four phases in order");
}

void TestPhaserRejectsOutOfOrderEmission() {
  ScriptedPhaser phaser;
  std::vector<Phase> seen;
  phaser.RegisterHandler([&seen](Phase phase) { seen.push_back(phase); });

  ExpectThrow([&]() { phaser.Emit(Phase::kResponse); }, "response before deal");
  phaser.Emit(Phase::kDeal);
  ExpectThrow([&]() { phaser.Emit(Phase::kDeal); }, "deal emitted twice");
  phaser.Emit(Phase::kResponse);
  ExpectThrow([&]() { phaser.Emit(Phase::kFinish); }, "finish skipping justification");
  phaser.Emit(Phase::kJustification);
  phaser.Emit(Phase::kFinish);
  ExpectThrow([&]() { phaser.Emit(Phase::kFinish); }, "finish emitted twice");
  Expect(seen == ExpectedSchedule(), "only in-order phases reach the handler");
}

void TestPhaseHelpers() {
  Expect(tdkg::NextPhase(Phase::kDeal) == Phase::kResponse, "deal then response");
  Expect(tdkg::NextPhase(Phase::kJustification) == Phase::kFinish, "justification then finish");
  Expect(!tdkg::NextPhase(Phase::kFinish).has_value(), "finish is last");
  Expect(std::string(tdkg::ToString(Phase::kJustification)) == "justification",
         "phase name");
}

}  // namespace

int main() {
  try {
    TestBoardDeliversToEveryEndpoint();
    TestBoardForgetsDestroyedEndpoints();
    TestTimePhaserEmitsScheduleOnce();
    TestTimePhaserStopInterruptsPeriod();
    TestTriggeredPhaserReplaysPendingPhases();
    TestPhaserRejectsOutOfOrderEmission();
    TestPhaseHelpers();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "board and phaser tests passed" << '\n';
  return 0;
}
