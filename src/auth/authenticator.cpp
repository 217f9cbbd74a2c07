#include "tdkg/auth/authenticator.hpp"

#include <optional>
#include <exception>
#include <stdexcept>
#include <utility>
#include <variant>

namespace tdkg {
namespace {

void SetError(std::string* error, std::string message) {
  if (error != nullptr) {
    *error = std::move(message);
  }
}

}  // namespace

bool NullAuthenticator::Verify(const SignedEnvelope&, std::string*) const {
  return true;
}

Bytes NullAuthenticator::Sign(const DealBundle&) const {
  return {};
}

Bytes NullAuthenticator::Sign(const ResponseBundle&) const {
  return {};
}

Bytes NullAuthenticator::Sign(const JustificationBundle&) const {
  return {};
}

RosterAuthenticator::RosterAuthenticator(std::shared_ptr<const ISignatureScheme> scheme,
                                         Roster old_roster,
                                         Roster new_roster,
                                         PrivateKey longterm)
    : scheme_(std::move(scheme)),
      old_roster_(std::move(old_roster)),
      new_roster_(std::move(new_roster)),
      longterm_(std::move(longterm)) {
  if (!scheme_) {
    throw std::invalid_argument("RosterAuthenticator requires a signature scheme");
  }
  if (old_roster_.empty()) {
    throw std::invalid_argument("RosterAuthenticator requires a non-empty old roster");
  }
  if (new_roster_.empty()) {
    new_roster_ = old_roster_;
  }
}

bool RosterAuthenticator::Verify(const SignedEnvelope& envelope, std::string* error) const {
  return std::visit(
      [&](const auto& typed) {
        const PartyIndex sender = typed.bundle.sender_index();
        const std::optional<PublicKey> public_key = roster(typed.kSenderRoster).Find(sender);
        if (!public_key.has_value()) {
          SetError(error, std::string(ToString(typed.kKind)) + " sender " +
                              std::to_string(sender) + " is not in the roster");
          return false;
        }

        bool verified = false;
        try {
          verified = scheme_->Verify(*public_key, typed.bundle.Hash(), typed.signature);
        } catch (const std::exception& ex) {
          SetError(error, std::string(ToString(typed.kKind)) + " signature from " +
                              std::to_string(sender) + " is unreadable: " + ex.what());
          return false;
        }
        if (!verified) {
          SetError(error, std::string(ToString(typed.kKind)) + " signature from " +
                              std::to_string(sender) + " does not verify");
          return false;
        }
        return true;
      },
      envelope);
}

Bytes RosterAuthenticator::Sign(const DealBundle& bundle) const {
  return SignDigest(bundle.Hash());
}

Bytes RosterAuthenticator::Sign(const ResponseBundle& bundle) const {
  return SignDigest(bundle.Hash());
}

Bytes RosterAuthenticator::Sign(const JustificationBundle& bundle) const {
  return SignDigest(bundle.Hash());
}

const Roster& RosterAuthenticator::roster(RosterKind kind) const {
  return kind == RosterKind::kOld ? old_roster_ : new_roster_;
}

Bytes RosterAuthenticator::SignDigest(const Bytes& digest) const {
  return scheme_->Sign(longterm_, digest);
}

std::unique_ptr<IAuthenticator> MakeAuthenticator(std::shared_ptr<const ISignatureScheme> scheme,
                                                  const Roster& old_roster,
                                                  const Roster& new_roster,
                                                  const PrivateKey& longterm) {
  if (!scheme) {
    return std::make_unique<NullAuthenticator>();
  }
  return std::make_unique<RosterAuthenticator>(std::move(scheme), old_roster, new_roster,
                                               longterm);
}

}  // namespace tdkg
