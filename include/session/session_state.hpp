#ifndef SESSION_STATE_HPP
#define SESSION_STATE_HPP

enum class SessionState { Calibrating, Monitoring, Capturing, Speaking, Shutdown };

const char* toString(SessionState state);

#endif
