#include "tdkg/protocol/types.hpp"

#include <stdexcept>
#include <string>

namespace tdkg {

Roster::Roster(const std::vector<Node>& nodes) {
  for (const Node& node : nodes) {
    if (!keys_.emplace(node.index, node.public_key).second) {
      throw std::invalid_argument("roster contains duplicate index " +
                                  std::to_string(node.index));
    }
  }
}

std::optional<PublicKey> Roster::Find(PartyIndex index) const {
  const auto it = keys_.find(index);
  if (it == keys_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<PartyIndex> Roster::IndexOf(const PublicKey& public_key) const {
  for (const auto& [index, key] : keys_) {
    if (key == public_key) {
      return index;
    }
  }
  return std::nullopt;
}

bool Roster::Contains(PartyIndex index) const {
  return keys_.count(index) != 0;
}

size_t Roster::size() const {
  return keys_.size();
}

bool Roster::empty() const {
  return keys_.empty();
}

std::vector<PartyIndex> Roster::indices() const {
  std::vector<PartyIndex> out;
  out.reserve(keys_.size());
  for (const auto& entry : keys_) {
    out.push_back(entry.first);
  }
  return out;
}

std::vector<Node> Roster::nodes() const {
  std::vector<Node> out;
  out.reserve(keys_.size());
  for (const auto& [index, key] : keys_) {
    out.push_back(Node{.index = index, .public_key = key});
  }
  return out;
}

bool Roster::operator==(const Roster& other) const {
  return keys_ == other.keys_;
}

}  // namespace tdkg
