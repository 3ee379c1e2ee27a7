/**
 * @file catalogue.cpp
 * @brief Field layouts and CRC_EXTRA seeds for the built-in messages.
 */
#include "relay/proto/catalogue.hpp"

#include <algorithm>
#include <array>

namespace relay::proto {

namespace {

using F = FieldType;

constexpr FieldSpec kHeartbeat[] = {
    {"custom_mode", F::U32}, {"type", F::U8}, {"autopilot", F::U8},
    {"base_mode", F::U8}, {"system_status", F::U8}, {"mavlink_version", F::U8},
};

constexpr FieldSpec kSysStatus[] = {
    {"onboard_control_sensors_present", F::U32}, {"onboard_control_sensors_enabled", F::U32},
    {"onboard_control_sensors_health", F::U32}, {"load", F::U16}, {"voltage_battery", F::U16},
    {"current_battery", F::I16}, {"drop_rate_comm", F::U16}, {"errors_comm", F::U16},
    {"errors_count1", F::U16}, {"errors_count2", F::U16}, {"errors_count3", F::U16},
    {"errors_count4", F::U16}, {"battery_remaining", F::I8},
};

constexpr FieldSpec kSystemTime[] = {
    {"time_unix_usec", F::U64}, {"time_boot_ms", F::U32},
};

constexpr FieldSpec kPing[] = {
    {"time_usec", F::U64}, {"seq", F::U32}, {"target_system", F::U8}, {"target_component", F::U8},
};

constexpr FieldSpec kParamValue[] = {
    {"param_value", F::F32}, {"param_count", F::U16}, {"param_index", F::U16},
    {"param_id", F::Char, 16}, {"param_type", F::U8},
};

constexpr FieldSpec kGpsRawInt[] = {
    {"time_usec", F::U64}, {"lat", F::I32}, {"lon", F::I32}, {"alt", F::I32},
    {"eph", F::U16}, {"epv", F::U16}, {"vel", F::U16}, {"cog", F::U16},
    {"fix_type", F::U8}, {"satellites_visible", F::U8},
};

constexpr FieldSpec kGpsStatus[] = {
    {"satellites_visible", F::U8}, {"satellite_prn", F::U8, 20}, {"satellite_used", F::U8, 20},
    {"satellite_elevation", F::U8, 20}, {"satellite_azimuth", F::U8, 20}, {"satellite_snr", F::U8, 20},
};

constexpr FieldSpec kAttitude[] = {
    {"time_boot_ms", F::U32}, {"roll", F::F32}, {"pitch", F::F32}, {"yaw", F::F32},
    {"rollspeed", F::F32}, {"pitchspeed", F::F32}, {"yawspeed", F::F32},
};

constexpr FieldSpec kAttitudeQuaternion[] = {
    {"time_boot_ms", F::U32}, {"q1", F::F32}, {"q2", F::F32}, {"q3", F::F32}, {"q4", F::F32},
    {"rollspeed", F::F32}, {"pitchspeed", F::F32}, {"yawspeed", F::F32},
};

constexpr FieldSpec kLocalPositionNed[] = {
    {"time_boot_ms", F::U32}, {"x", F::F32}, {"y", F::F32}, {"z", F::F32},
    {"vx", F::F32}, {"vy", F::F32}, {"vz", F::F32},
};

constexpr FieldSpec kGlobalPositionInt[] = {
    {"time_boot_ms", F::U32}, {"lat", F::I32}, {"lon", F::I32}, {"alt", F::I32},
    {"relative_alt", F::I32}, {"vx", F::I16}, {"vy", F::I16}, {"vz", F::I16}, {"hdg", F::U16},
};

constexpr FieldSpec kRcChannelsRaw[] = {
    {"time_boot_ms", F::U32}, {"chan1_raw", F::U16}, {"chan2_raw", F::U16}, {"chan3_raw", F::U16},
    {"chan4_raw", F::U16}, {"chan5_raw", F::U16}, {"chan6_raw", F::U16}, {"chan7_raw", F::U16},
    {"chan8_raw", F::U16}, {"port", F::U8}, {"rssi", F::U8},
};

constexpr FieldSpec kServoOutputRaw[] = {
    {"time_usec", F::U32}, {"servo1_raw", F::U16}, {"servo2_raw", F::U16}, {"servo3_raw", F::U16},
    {"servo4_raw", F::U16}, {"servo5_raw", F::U16}, {"servo6_raw", F::U16}, {"servo7_raw", F::U16},
    {"servo8_raw", F::U16}, {"port", F::U8},
};

constexpr FieldSpec kMissionCurrent[] = {
    {"seq", F::U16},
};

constexpr FieldSpec kNavControllerOutput[] = {
    {"nav_roll", F::F32}, {"nav_pitch", F::F32}, {"alt_error", F::F32}, {"aspd_error", F::F32},
    {"xtrack_error", F::F32}, {"nav_bearing", F::I16}, {"target_bearing", F::I16}, {"wp_dist", F::U16},
};

constexpr FieldSpec kRcChannels[] = {
    {"time_boot_ms", F::U32},
    {"chan1_raw", F::U16}, {"chan2_raw", F::U16}, {"chan3_raw", F::U16}, {"chan4_raw", F::U16},
    {"chan5_raw", F::U16}, {"chan6_raw", F::U16}, {"chan7_raw", F::U16}, {"chan8_raw", F::U16},
    {"chan9_raw", F::U16}, {"chan10_raw", F::U16}, {"chan11_raw", F::U16}, {"chan12_raw", F::U16},
    {"chan13_raw", F::U16}, {"chan14_raw", F::U16}, {"chan15_raw", F::U16}, {"chan16_raw", F::U16},
    {"chan17_raw", F::U16}, {"chan18_raw", F::U16}, {"chancount", F::U8}, {"rssi", F::U8},
};

constexpr FieldSpec kVfrHud[] = {
    {"airspeed", F::F32}, {"groundspeed", F::F32}, {"alt", F::F32}, {"climb", F::F32},
    {"heading", F::I16}, {"throttle", F::U16},
};

constexpr FieldSpec kCommandLong[] = {
    {"param1", F::F32}, {"param2", F::F32}, {"param3", F::F32}, {"param4", F::F32},
    {"param5", F::F32}, {"param6", F::F32}, {"param7", F::F32}, {"command", F::U16},
    {"target_system", F::U8}, {"target_component", F::U8}, {"confirmation", F::U8},
};

constexpr FieldSpec kCommandAck[] = {
    {"command", F::U16}, {"result", F::U8},
};

constexpr FieldSpec kAttitudeTarget[] = {
    {"time_boot_ms", F::U32}, {"q", F::F32, 4}, {"body_roll_rate", F::F32},
    {"body_pitch_rate", F::F32}, {"body_yaw_rate", F::F32}, {"thrust", F::F32}, {"type_mask", F::U8},
};

constexpr FieldSpec kTimesync[] = {
    {"tc1", F::I64}, {"ts1", F::I64},
};

constexpr FieldSpec kExtendedSysState[] = {
    {"vtol_state", F::U8}, {"landed_state", F::U8},
};

constexpr FieldSpec kStatustext[] = {
    {"severity", F::U8}, {"text", F::Char, 50},
};

// Sorted by id (find_message uses binary search).
constexpr std::array<MessageSpec, 23> kCatalogue{{
    {0,   "HEARTBEAT",             50,  kHeartbeat},
    {1,   "SYS_STATUS",            124, kSysStatus},
    {2,   "SYSTEM_TIME",           137, kSystemTime},
    {4,   "PING",                  237, kPing},
    {22,  "PARAM_VALUE",           220, kParamValue},
    {24,  "GPS_RAW_INT",           24,  kGpsRawInt},
    {25,  "GPS_STATUS",            23,  kGpsStatus},
    {30,  "ATTITUDE",              39,  kAttitude},
    {31,  "ATTITUDE_QUATERNION",   246, kAttitudeQuaternion},
    {32,  "LOCAL_POSITION_NED",    185, kLocalPositionNed},
    {33,  "GLOBAL_POSITION_INT",   104, kGlobalPositionInt},
    {35,  "RC_CHANNELS_RAW",       244, kRcChannelsRaw},
    {36,  "SERVO_OUTPUT_RAW",      222, kServoOutputRaw},
    {42,  "MISSION_CURRENT",       28,  kMissionCurrent},
    {62,  "NAV_CONTROLLER_OUTPUT", 183, kNavControllerOutput},
    {65,  "RC_CHANNELS",           118, kRcChannels},
    {74,  "VFR_HUD",               20,  kVfrHud},
    {76,  "COMMAND_LONG",          152, kCommandLong},
    {77,  "COMMAND_ACK",           143, kCommandAck},
    {83,  "ATTITUDE_TARGET",       22,  kAttitudeTarget},
    {111, "TIMESYNC",              34,  kTimesync},
    {245, "EXTENDED_SYS_STATE",    130, kExtendedSysState},
    {253, "STATUSTEXT",            83,  kStatustext},
}};

} // namespace

std::size_t MessageSpec::payload_length() const noexcept {
    std::size_t n = 0;
    for (const auto& f : fields) n += f.wire_size();
    return n;
}

const MessageSpec* find_message(std::uint32_t id) noexcept {
    auto it = std::lower_bound(kCatalogue.begin(), kCatalogue.end(), id,
                               [](const MessageSpec& m, std::uint32_t v) { return m.id < v; });
    if (it == kCatalogue.end() || it->id != id) return nullptr;
    return &*it;
}

const MessageSpec* find_message(std::string_view name) noexcept {
    for (const auto& m : kCatalogue) {
        if (name == m.name) return &m;
    }
    return nullptr;
}

std::span<const MessageSpec> catalogue() noexcept {
    return {kCatalogue.data(), kCatalogue.size()};
}

} // namespace relay::proto
