#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace galvo::lmc::config {

/**
 * @brief Constants that define the LMC board protocol and transport behaviour.
 *
 * Keeping the values here prevents magic numbers from drifting across
 * translation units and makes it easy to tune the integration in one place.
 */

// USB identity ----------------------------------------------------------------
constexpr std::uint16_t LMC_USB_VENDOR_ID = 0x9588;
constexpr std::uint16_t LMC_USB_PRODUCT_ID = 0x9899;
constexpr std::uint8_t LMC_ENDPOINT_OUT = 0x02;   // bulk, command frames
constexpr std::uint8_t LMC_ENDPOINT_IN = 0x88;    // bulk, 8-byte status frames
constexpr int LMC_USB_INTERFACE = 0;
constexpr std::chrono::milliseconds LMC_USB_TIMEOUT{100};
constexpr std::chrono::milliseconds LMC_MOCK_TIMEOUT{500};

// Framing ---------------------------------------------------------------------
constexpr std::size_t LMC_COMMAND_SIZE = 12;                 // u16 opcode + 5 x u16
constexpr std::size_t LMC_LIST_ENTRIES = 0x100;              // entries per list packet
constexpr std::size_t LMC_LIST_PACKET_SIZE = LMC_COMMAND_SIZE * LMC_LIST_ENTRIES; // 0xC00
constexpr std::size_t LMC_REPLY_SIZE = 8;
constexpr std::uint16_t LMC_LIST_OPCODE_BASE = 0x8000;

// Status word (4th word of a reply) -------------------------------------------
constexpr std::uint16_t LMC_STATUS_BUSY = 0x04;
constexpr std::uint16_t LMC_STATUS_READY = 0x20;

// Retry behaviour -------------------------------------------------------------
constexpr int LMC_TRANSFER_ATTEMPTS = 3;
constexpr std::chrono::milliseconds LMC_TRANSFER_BACKOFF{100};
constexpr int LMC_CONNECT_ATTEMPTS = 10;
constexpr std::chrono::milliseconds LMC_CONNECT_BACKOFF{300};

// Polling ---------------------------------------------------------------------
constexpr std::chrono::milliseconds LMC_POLL_INTERVAL{10};
constexpr std::chrono::milliseconds LMC_PAUSE_INTERVAL{300};
constexpr std::chrono::milliseconds LMC_INIT_SETTLE{50};

// Geometry --------------------------------------------------------------------
constexpr std::uint16_t LMC_FIELD_MAX = 0xFFFF;
constexpr std::uint16_t LMC_FIELD_CENTER = 0x8000;
constexpr double LMC_FIELD_UNITS = 65536.0;

// Correction tables -----------------------------------------------------------
constexpr std::size_t LMC_COR_GRID = 65;
constexpr std::size_t LMC_COR_ENTRIES = LMC_COR_GRID * LMC_COR_GRID;

} // namespace galvo::lmc::config
