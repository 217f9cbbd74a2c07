#include "tdkg/net/in_memory_board.hpp"

#include <stdexcept>
#include <vector>

namespace tdkg {

std::shared_ptr<InMemoryBoard> InMemoryBoardNetwork::CreateEndpoint() {
  std::lock_guard<std::mutex> lock(mu_);
  const uint32_t endpoint_id = next_endpoint_id_++;
  auto endpoint = std::make_shared<InMemoryBoard>(endpoint_id, shared_from_this());
  endpoints_[endpoint_id] = endpoint;
  return endpoint;
}

size_t InMemoryBoardNetwork::endpoint_count() {
  std::lock_guard<std::mutex> lock(mu_);
  return endpoints_.size();
}

uint64_t InMemoryBoardNetwork::delivered_count() {
  std::lock_guard<std::mutex> lock(mu_);
  return delivered_count_;
}

void InMemoryBoardNetwork::Broadcast(const SignedEnvelope& envelope) {
  std::vector<std::shared_ptr<InMemoryBoard>> targets;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = endpoints_.begin(); it != endpoints_.end();) {
      auto endpoint = it->second.lock();
      if (!endpoint) {
        it = endpoints_.erase(it);
        continue;
      }
      targets.push_back(std::move(endpoint));
      ++it;
    }
    delivered_count_ += targets.size();
  }

  for (const auto& target : targets) {
    target->Deliver(envelope);
  }
}

void InMemoryBoardNetwork::Unregister(uint32_t endpoint_id) {
  std::lock_guard<std::mutex> lock(mu_);
  endpoints_.erase(endpoint_id);
}

InMemoryBoard::InMemoryBoard(uint32_t endpoint_id, std::shared_ptr<InMemoryBoardNetwork> network)
    : endpoint_id_(endpoint_id), network_(std::move(network)) {
  if (!network_) {
    throw std::invalid_argument("InMemoryBoard requires a network");
  }
}

InMemoryBoard::~InMemoryBoard() {
  network_->Unregister(endpoint_id_);
}

void InMemoryBoard::PushDeal(const AuthDealBundle& deal) {
  network_->Broadcast(deal);
}

void InMemoryBoard::PushResponse(const AuthResponseBundle& response) {
  network_->Broadcast(response);
}

void InMemoryBoard::PushJustification(const AuthJustificationBundle& justification) {
  network_->Broadcast(justification);
}

void InMemoryBoard::RegisterHandler(BoardHandler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  handler_ = std::move(handler);
}

uint32_t InMemoryBoard::endpoint_id() const {
  return endpoint_id_;
}

void InMemoryBoard::Deliver(const SignedEnvelope& envelope) {
  BoardHandler handler;
  {
    std::lock_guard<std::mutex> lock(mu_);
    handler = handler_;
  }

  if (handler) {
    handler(envelope);
  }
}

}  // namespace tdkg
