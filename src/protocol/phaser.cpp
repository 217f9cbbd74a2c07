#include "tdkg/protocol/phaser.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace tdkg {

void Phaser::RegisterHandler(PhaseHandler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  handler_ = std::move(handler);
  if (!handler_) {
    return;
  }
  for (Phase phase : pending_) {
    handler_(phase);
  }
  pending_.clear();
}

std::optional<Phase> Phaser::next_phase() const {
  std::lock_guard<std::mutex> lock(mu_);
  return next_;
}

void Phaser::Emit(Phase phase) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!next_.has_value() || *next_ != phase) {
    throw std::logic_error(std::string("phase ") + ToString(phase) + " emitted out of order");
  }
  next_ = NextPhase(phase);

  if (handler_) {
    handler_(phase);
  } else {
    pending_.push_back(phase);
  }
}

TimePhaser::TimePhaser(std::chrono::milliseconds period) : period_(period) {
  if (period_.count() < 0) {
    throw std::invalid_argument("TimePhaser period must not be negative");
  }
}

TimePhaser::TimePhaser(SleepFn sleep) : sleep_(std::move(sleep)) {
  if (!sleep_) {
    throw std::invalid_argument("TimePhaser sleep function must not be empty");
  }
}

TimePhaser::~TimePhaser() {
  Stop();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void TimePhaser::Start() {
  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    if (started_) {
      throw std::logic_error("TimePhaser already started");
    }
    started_ = true;
  }
  worker_ = std::thread([this]() { Run(); });
}

void TimePhaser::Stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    stopped_ = true;
  }
  stop_cv_.notify_all();
}

void TimePhaser::Run() {
  std::optional<Phase> phase = Phase::kDeal;
  while (phase.has_value()) {
    {
      std::lock_guard<std::mutex> lock(stop_mu_);
      if (stopped_) {
        return;
      }
    }
    Emit(*phase);
    phase = NextPhase(*phase);
    if (phase.has_value() && !SleepBetweenPhases()) {
      return;
    }
  }
}

bool TimePhaser::SleepBetweenPhases() {
  if (sleep_) {
    sleep_();
    std::lock_guard<std::mutex> lock(stop_mu_);
    return !stopped_;
  }

  std::unique_lock<std::mutex> lock(stop_mu_);
  return !stop_cv_.wait_for(lock, period_, [this]() { return stopped_; });
}

bool TriggeredPhaser::Advance() {
  const std::optional<Phase> phase = next_phase();
  if (!phase.has_value()) {
    return false;
  }
  Emit(*phase);
  return true;
}

}  // namespace tdkg
