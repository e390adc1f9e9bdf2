#include "session-manager.h"

#include "safe-log.h"

namespace handshake {
SessionManager::SessionManager() : SessionManager(CanonicalAutomaton()) {}

SessionManager::SessionManager(std::shared_ptr<const Automaton> automaton)
    : automaton_(std::move(automaton)) {
  if (!automaton_)
    throw ConfigError("session manager requires an automaton");
}

SessionManager::SessionId SessionManager::Create() {
  auto entry = std::make_shared<Entry>(automaton_);

  UniqueLock<RwLock> guard(lock_);
  const SessionId id = next_id_++;
  sessions_.emplace(id, std::move(entry));
  LogDebug("session ", id, " created");
  return id;
}

bool SessionManager::Close(SessionId id) {
  UniqueLock<RwLock> guard(lock_);
  if (!sessions_.erase(id))
    return false;
  LogDebug("session ", id, " closed");
  return true;
}

std::shared_ptr<SessionManager::Entry> SessionManager::Find(
    SessionId id) const {
  SharedLock guard(lock_);
  auto ite = sessions_.find(id);
  if (ite == sessions_.end())
    throw SessionNotFound("no session with id " + std::to_string(id));
  return ite->second;
}

StepResult SessionManager::Step(SessionId id, std::string_view symbol) {
  return WithSession(id, [symbol](Session &session) {
        return session.Step(symbol);
      });
}

VerifyResult SessionManager::Verify(
    SessionId id, const std::vector<std::string> &symbols) {
  return WithSession(id, [&symbols](Session &session) {
        return session.Verify(symbols);
      });
}

void SessionManager::Reset(SessionId id) {
  WithSession(id, [](Session &session) {
        session.Reset();
      });
}

std::vector<TransitionRecord> SessionManager::History(SessionId id) const {
  return WithSession(id, [](Session &session) {
        return session.GetHistory();
      });
}

State SessionManager::GetState(SessionId id) const {
  return WithSession(id, [](Session &session) {
        return session.GetState();
      });
}

std::size_t SessionManager::Size() const {
  SharedLock guard(lock_);
  return sessions_.size();
}

} // namespace handshake
