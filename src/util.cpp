#include <chrono>
#include <cmath>
#include <cstring>

#include "util.hpp"

namespace g6
{

void put_f32_le(Frame& frame, size_t offset, float value)
{
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    frame[offset] = bits & 0xff;
    frame[offset + 1] = (bits >> 8) & 0xff;
    frame[offset + 2] = (bits >> 16) & 0xff;
    frame[offset + 3] = (bits >> 24) & 0xff;
}

uint32_t get_u32_le(const Frame& frame, size_t offset)
{
    return ((uint32_t)frame[offset]) | (((uint32_t)frame[offset + 1]) << 8)
         | (((uint32_t)frame[offset + 2]) << 16) | (((uint32_t)frame[offset + 3]) << 24);
}

float get_f32_le(const Frame& frame, size_t offset)
{
    uint32_t bits = get_u32_le(frame, offset);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

bool unit_to_level(float value, uint8_t& level)
{
    if (!std::isfinite(value) || value < 0.0f || value > 1.0f) {
        return false;
    }
    level = static_cast<uint8_t>(std::lround(value * 100.0f));
    return true;
}

bool unit_to_toggle(float value, bool& enabled)
{
    if (value == 1.0f) {
        enabled = true;
        return true;
    }
    if (value == 0.0f) {
        enabled = false;
        return true;
    }
    return false;
}

std::string hex_dump(const uint8_t* data, size_t len)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 3);
    for (size_t i = 0; i < len; ++i) {
        if (i > 0) {
            out.push_back(' ');
        }
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string hex_dump(const Frame& frame, size_t len)
{
    return hex_dump(frame.data(), len < frame.size() ? len : frame.size());
}

size_t used_len(const Frame& frame)
{
    size_t len = frame.size();
    while (len > 0 && frame[len - 1] == 0) {
        --len;
    }
    return len;
}

int64_t epoch_ms()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace g6
