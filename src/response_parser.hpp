#pragma once

#include <optional>
#include <string>

#include "g6_types.hpp"

namespace g6
{

/* Decodes a frame read from the control interface. Never fails,
   frames that match no known layout come back as Unrecognized. */
DecodedResponse decode(const Frame& frame);

// Volume knob interface: byte 0 is a signed delta, the rest zero
DecodedResponse decode_knob(const Frame& frame);

// Printable run after the 3 byte header, terminated by a null byte
std::optional<std::string> ascii_payload(const Frame& frame);

std::optional<Output> route_from_code(uint8_t code);

// One line human readable description for the protocol console
std::string describe_frame(const Frame& frame);

} // namespace g6
