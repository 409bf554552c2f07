#pragma once

#include "troupe/types.hpp"
#include <chrono>
#include <optional>

namespace troupe {

// Readiness interest, and the readiness reported back
enum class Event : uint8_t {
    Read,
    Write,
    Both,
};

inline bool has_read(Event e) noexcept { return e != Event::Write; }
inline bool has_write(Event e) noexcept { return e != Event::Read; }

const char* event_string(Event e);

// One readiness report for a socket or timer registration
struct Notification {
    RegistrationId id = 0;
    Event event = Event::Read;

    bool operator==(const Notification& other) const noexcept {
        return id == other.id && event == other.event;
    }
};

// Reactor contract used by the cluster server. Readiness for registered
// sockets and ticks of interval timers are delivered as Notification
// batches through whatever channel the implementation was built with.
class Registrar {
public:
    virtual ~Registrar() = default;

    virtual std::optional<RegistrationId> register_socket(int fd, Event interest) = 0;
    virtual Status reregister(RegistrationId id, int fd, Event interest) = 0;
    virtual Status deregister(int fd) = 0;

    // Periodic timer; every period a Read notification for the id is posted
    virtual std::optional<RegistrationId> set_interval(std::chrono::milliseconds period) = 0;
};

}  // namespace troupe
