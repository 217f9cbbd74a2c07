#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "tdkg/net/board.hpp"

namespace tdkg {

class InMemoryBoard;

class InMemoryBoardNetwork : public std::enable_shared_from_this<InMemoryBoardNetwork> {
 public:
  std::shared_ptr<InMemoryBoard> CreateEndpoint();

  size_t endpoint_count();
  uint64_t delivered_count();

 private:
  friend class InMemoryBoard;

  void Broadcast(const SignedEnvelope& envelope);
  void Unregister(uint32_t endpoint_id);

  std::unordered_map<uint32_t, std::weak_ptr<InMemoryBoard>> endpoints_;
  uint32_t next_endpoint_id_ = 1;
  uint64_t delivered_count_ = 0;
  std::mutex mu_;
};

// Endpoint of an InMemoryBoardNetwork. Every push is delivered synchronously
// to all live endpoints, the pushing one included.
class InMemoryBoard : public IBoard {
 public:
  InMemoryBoard(uint32_t endpoint_id, std::shared_ptr<InMemoryBoardNetwork> network);
  ~InMemoryBoard() override;

  InMemoryBoard(const InMemoryBoard&) = delete;
  InMemoryBoard& operator=(const InMemoryBoard&) = delete;

  void PushDeal(const AuthDealBundle& deal) override;
  void PushResponse(const AuthResponseBundle& response) override;
  void PushJustification(const AuthJustificationBundle& justification) override;
  void RegisterHandler(BoardHandler handler) override;

  uint32_t endpoint_id() const;

 private:
  friend class InMemoryBoardNetwork;
  void Deliver(const SignedEnvelope& envelope);

  uint32_t endpoint_id_;
  std::shared_ptr<InMemoryBoardNetwork> network_;
  std::mutex mu_;
  BoardHandler handler_;
};

}  // namespace tdkg
