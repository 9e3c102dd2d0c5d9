#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace weave {

/**
 * Opaque binary payload: CRDT updates, state vectors, wire frames.
 */
using Bytes = std::vector<uint8_t>;

/**
 * Presence client identifier. One per live table instance, random per session.
 */
using ClientId = uint32_t;

/**
 * Timestamp - milliseconds since the Unix epoch.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

/**
 * Injectable wall clock. Components default to Timestamp::now; tests pin it.
 */
using NowFn = std::function<Timestamp()>;

/**
 * Connection lifecycle of a sync transport.
 */
enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Error
};

[[nodiscard]] const char* to_string(ConnectionStatus status);

/**
 * Palette used to colour collaborators. Order matters: colours are picked by hash.
 */
inline constexpr std::array<std::string_view, 16> COLLABORATION_COLORS = {
    "#f44336", "#e91e63", "#9c27b0", "#673ab7",
    "#3f51b5", "#2196f3", "#03a9f4", "#00bcd4",
    "#009688", "#4caf50", "#8bc34a", "#cddc39",
    "#ffeb3b", "#ffc107", "#ff9800", "#ff5722",
};

/**
 * Deterministic colour for a user id (32-bit "h*31 + c" string hash over the palette).
 */
[[nodiscard]] std::string color_for_user(std::string_view user_id);

/**
 * Random non-zero presence client id.
 */
[[nodiscard]] ClientId generate_client_id();

} // namespace weave
