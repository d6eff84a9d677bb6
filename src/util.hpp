#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "g6_types.hpp"

namespace g6
{

template <typename T, typename... Args>
bool is_any_of(T t, Args... args)
{
    return ((t == args) || ...);
}

void put_f32_le(Frame& frame, size_t offset, float value);
float get_f32_le(const Frame& frame, size_t offset);
uint32_t get_u32_le(const Frame& frame, size_t offset);

// Level 0-100 to the wire float in [0.0, 1.0]
constexpr float level_to_unit(int level)
{
    return static_cast<float>(level) / 100.0f;
}

// Wire float to level. Returns false for values outside [0.0, 1.0]
bool unit_to_level(float value, uint8_t& level);

// Toggles are exactly 0.0 or 1.0 on the wire
bool unit_to_toggle(float value, bool& enabled);

std::string hex_dump(const uint8_t* data, size_t len);
std::string hex_dump(const Frame& frame, size_t len = proto::payload_len);

// Number of bytes up to and including the last non-zero byte
size_t used_len(const Frame& frame);

int64_t epoch_ms();

} // namespace g6
