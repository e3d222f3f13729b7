#ifndef MESSAGE_CODEC_HPP
#define MESSAGE_CODEC_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

enum class StationState : uint8_t {
    Active,
    Standby,
    Maintenance,
    Error,
    Unknown
};

struct BroadcastMessage {
    int64_t message_id = -1;
    std::string timestamp = "unknown";
    StationState state = StationState::Unknown;
    // state text as received, "unknown" when the field is missing; empty for messages built locally
    std::string state_name;
    // publisher's ack port; 0 when the sender did not advertise one
    uint16_t response_port = 0;
};

namespace MessageCodec {
    // well-known ports and cadence
    constexpr uint16_t DEFAULT_BROADCAST_PORT = 37020;
    constexpr uint16_t DEFAULT_ACK_PORT = 37021;
    constexpr double DEFAULT_INTERVAL_SECONDS = 5.0;
    constexpr const char* FALLBACK_BROADCAST_ADDRESS = "255.255.255.255";

    // largest datagram either side sends or reads
    constexpr std::size_t MAX_DATAGRAM_SIZE = 1024;

    // wire key of the advertised ack port
    constexpr const char* RESPONSE_PORT_KEY = "_response_port";

    // JSON numbers are doubles; ids above 2^53 would not survive the round trip
    constexpr int64_t MAX_MESSAGE_ID = 9007199254740992LL;

    constexpr std::array<StationState, 4> STATE_CYCLE = {
        StationState::Active, StationState::Standby, StationState::Maintenance, StationState::Error
    };

    std::string name_for(StationState state);
    // unrecognized names map to StationState::Unknown
    StationState state_from_name(const std::string& name);

    // Compact JSON. Returns false if the result would not fit in one datagram.
    bool encode(const BroadcastMessage& msg, std::string& out);
    // Missing fields keep their defaults. Returns false (with a reason in error) when the
    // payload is not a JSON object or message_id is not an integer.
    bool decode(const char* data, std::size_t len, BroadcastMessage& out, std::string& error);

    std::string make_ack(const std::string& client_id, int64_t message_id);

    // local wall clock, ISO-8601 with milliseconds
    std::string now_iso8601();
}

#endif // MESSAGE_CODEC_HPP
