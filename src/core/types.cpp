#include "core/types.hpp"

#include <cstdlib>
#include <random>
#include <type_traits>

namespace weave {

static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

const char* to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Reconnecting: return "reconnecting";
        case ConnectionStatus::Error: return "error";
    }
    return "unknown";
}

std::string color_for_user(std::string_view user_id) {
    // Wrapping 32-bit arithmetic, read back as signed.
    uint32_t hash = 0;
    for (unsigned char c : user_id) {
        hash = (hash << 5) - hash + c;
    }
    const auto signed_hash = static_cast<int64_t>(static_cast<int32_t>(hash));
    const auto index = static_cast<size_t>(std::llabs(signed_hash)) % COLLABORATION_COLORS.size();
    return std::string(COLLABORATION_COLORS[index]);
}

ClientId generate_client_id() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937 gen(rd());
    static thread_local std::uniform_int_distribution<ClientId> dist(1, 0x7FFFFFFF);
    return dist(gen);
}

} // namespace weave
