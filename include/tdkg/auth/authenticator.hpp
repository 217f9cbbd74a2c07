#pragma once

#include <memory>
#include <string>

#include "tdkg/auth/signature_scheme.hpp"
#include "tdkg/net/envelope.hpp"
#include "tdkg/protocol/types.hpp"

namespace tdkg {

// Sign/verify capability applied to every bundle crossing the board.
class IAuthenticator {
 public:
  virtual ~IAuthenticator() = default;

  // False when the envelope must be dropped; `error` receives the reason.
  virtual bool Verify(const SignedEnvelope& envelope, std::string* error) const = 0;

  // Throws when the signature cannot be produced.
  virtual Bytes Sign(const DealBundle& bundle) const = 0;
  virtual Bytes Sign(const ResponseBundle& bundle) const = 0;
  virtual Bytes Sign(const JustificationBundle& bundle) const = 0;
};

// Used when no signature scheme is configured: accepts every envelope and
// attaches empty signatures.
class NullAuthenticator : public IAuthenticator {
 public:
  bool Verify(const SignedEnvelope& envelope, std::string* error) const override;
  Bytes Sign(const DealBundle& bundle) const override;
  Bytes Sign(const ResponseBundle& bundle) const override;
  Bytes Sign(const JustificationBundle& bundle) const override;
};

class RosterAuthenticator : public IAuthenticator {
 public:
  // An empty new roster means the new generation equals the old one.
  RosterAuthenticator(std::shared_ptr<const ISignatureScheme> scheme,
                      Roster old_roster,
                      Roster new_roster,
                      PrivateKey longterm);

  bool Verify(const SignedEnvelope& envelope, std::string* error) const override;
  Bytes Sign(const DealBundle& bundle) const override;
  Bytes Sign(const ResponseBundle& bundle) const override;
  Bytes Sign(const JustificationBundle& bundle) const override;

  const Roster& roster(RosterKind kind) const;

 private:
  Bytes SignDigest(const Bytes& digest) const;

  std::shared_ptr<const ISignatureScheme> scheme_;
  Roster old_roster_;
  Roster new_roster_;
  PrivateKey longterm_;
};

// NullAuthenticator when `scheme` is null, RosterAuthenticator otherwise.
std::unique_ptr<IAuthenticator> MakeAuthenticator(std::shared_ptr<const ISignatureScheme> scheme,
                                                  const Roster& old_roster,
                                                  const Roster& new_roster,
                                                  const PrivateKey& longterm);

}  // namespace tdkg
