#ifndef _HANDSHAKE_SESSION_MANAGER_H_
#define _HANDSHAKE_SESSION_MANAGER_H_

#include <cstddef>
#include <cstdint>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "automaton.h"
#include "mutex.h"
#include "session.h"

namespace handshake {
struct SessionNotFound : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Keeps step-mode sessions alive between requests of a serving layer. Calls
// on different sessions run in parallel; calls on the same session are
// serialized.
class SessionManager {
public:
  using SessionId = uint64_t;

  SessionManager();
  explicit SessionManager(std::shared_ptr<const Automaton> automaton);

  SessionManager(const SessionManager &) = delete;
  SessionManager &operator=(const SessionManager &) = delete;

  SessionId Create();

  // Returns false if the id is unknown.
  bool Close(SessionId id);

  // The calls below throw SessionNotFound for an unknown id.
  StepResult Step(SessionId id, std::string_view symbol);
  VerifyResult Verify(SessionId id, const std::vector<std::string> &symbols);
  void Reset(SessionId id);
  std::vector<TransitionRecord> History(SessionId id) const;
  State GetState(SessionId id) const;

  const Description &Describe() const {
    return automaton_->Describe();
  }

  std::size_t Size() const;

private:
  struct Entry {
    explicit Entry(std::shared_ptr<const Automaton> automaton)
        : session(std::move(automaton)) {}

    Mutex mtx;
    Session session;
  };

  std::shared_ptr<Entry> Find(SessionId id) const;

  template <class Fn>
  auto WithSession(SessionId id, Fn fn) const {
    auto entry = Find(id);
    UniqueLock<Mutex> lock(entry->mtx);
    return fn(entry->session);
  }

  std::shared_ptr<const Automaton> automaton_;

  mutable RwLock lock_;
  std::unordered_map<SessionId, std::shared_ptr<Entry>> sessions_;
  SessionId next_id_ = 1;
};

} // namespace handshake

#endif // _HANDSHAKE_SESSION_MANAGER_H_
