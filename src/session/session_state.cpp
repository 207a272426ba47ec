#include "session/session_state.hpp"

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Calibrating: return "Calibrating";
        case SessionState::Monitoring:  return "Monitoring";
        case SessionState::Capturing:   return "Capturing";
        case SessionState::Speaking:    return "Speaking";
        case SessionState::Shutdown:    return "Shutdown";
    }
    return "Unknown";
}
