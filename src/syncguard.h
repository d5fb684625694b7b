#pragma once
#include <cstdint>

namespace cbx {

// Which direction of synchronization currently owns a binding.
//   Idle      inner editor events are forwarded to the host
//   Syncing   a host -> inner patch or selection is being applied
//   Escaping  focus is moving from the inner editor to the host
enum class SyncState : uint8_t { Idle, Syncing, Escaping };

class SyncGuard {
public:
    SyncState state() const { return m_state; }
    bool idle() const     { return m_state == SyncState::Idle; }
    bool syncing() const  { return m_state == SyncState::Syncing; }
    bool escaping() const { return m_state == SyncState::Escaping; }

    // Holds a state for the lifetime of the scope, then restores the
    // previous one. Scopes nest.
    class Scope {
    public:
        Scope(SyncGuard& guard, SyncState state)
            : m_guard(guard), m_prev(guard.m_state) { guard.m_state = state; }
        ~Scope() { m_guard.m_state = m_prev; }
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
    private:
        SyncGuard& m_guard;
        SyncState  m_prev;
    };

private:
    SyncState m_state = SyncState::Idle;
};

} // namespace cbx
