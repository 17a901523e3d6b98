/*
 * LDFormat.h - Fixed offsets and constants of the MoTeC .ld container
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef LDFORMAT_H
#define LDFORMAT_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Telemetry {
namespace LDFormat {

// All integers in the file are little-endian; all pointers are absolute
// byte offsets from the start of the file.

// Header (file offset 0)
constexpr size_t HEADER_SIZE            = 0x6E2;
constexpr size_t HDR_MARKER             = 0;
constexpr size_t HDR_META_PTR           = 8;
constexpr size_t HDR_DATA_PTR           = 12;
constexpr size_t HDR_EVENT_PTR          = 36;
constexpr size_t HDR_STATIC_WORDS       = 64;   // u16 x3
constexpr size_t HDR_SERIAL             = 70;
constexpr size_t HDR_DEVICE_TYPE        = 74;
constexpr size_t HDR_DEVICE_VERSION     = 82;
constexpr size_t HDR_STATIC_ADB0        = 84;
constexpr size_t HDR_CHANNEL_COUNT      = 86;
constexpr size_t HDR_DATE               = 94;
constexpr size_t HDR_TIME               = 126;
constexpr size_t HDR_DRIVER             = 158;
constexpr size_t HDR_VEHICLE_ID         = 222;
constexpr size_t HDR_VENUE              = 350;
constexpr size_t HDR_PRO_LOGGING        = 1502;
constexpr size_t HDR_SHORT_COMMENT      = 1572;

constexpr size_t DEVICE_TYPE_WIDTH      = 8;
constexpr size_t DATE_WIDTH             = 16;
constexpr size_t TIME_WIDTH             = 16;
constexpr size_t NAME64_WIDTH           = 64;

constexpr uint32_t HEADER_MARKER        = 0x40;
constexpr uint16_t STATIC_WORD_0        = 0x0001;
constexpr uint16_t STATIC_WORD_1        = 0x4240;
constexpr uint16_t STATIC_WORD_2        = 0x000F;
constexpr uint16_t STATIC_ADB0          = 0xADB0;
constexpr uint32_t DEFAULT_SERIAL       = 0x1F44;
constexpr uint16_t DEFAULT_VERSION      = 420;
constexpr uint32_t PRO_LOGGING_MAGIC    = 0xC81A4;

// Event block (inside the preamble, at event_ptr)
constexpr size_t EVT_NAME               = 0;
constexpr size_t EVT_SESSION            = 64;
constexpr size_t EVT_COMMENT            = 128;
constexpr size_t EVT_VENUE_PTR          = 1152;
constexpr size_t EVENT_BLOCK_SIZE       = 1154;
constexpr size_t EVT_COMMENT_WIDTH      = 1024;

// Venue block (at venue_ptr)
constexpr size_t VEN_NAME               = 0;
constexpr size_t VEN_VEHICLE_PTR        = 1098;
constexpr size_t VENUE_BLOCK_SIZE       = 1100;

// Vehicle block (at vehicle_ptr)
constexpr size_t VEH_ID                 = 0;
constexpr size_t VEH_WEIGHT             = 192;
constexpr size_t VEH_TYPE               = 196;
constexpr size_t VEH_COMMENT            = 228;
constexpr size_t VEHICLE_BLOCK_SIZE     = 260;
constexpr size_t VEH_TEXT_WIDTH         = 32;

// Channel catalog record (at meta_ptr, contiguous, doubly linked)
constexpr size_t CHANNEL_RECORD_SIZE    = 124;
constexpr size_t CH_PREV_PTR            = 0;
constexpr size_t CH_NEXT_PTR            = 4;
constexpr size_t CH_DATA_PTR            = 8;
constexpr size_t CH_SAMPLE_COUNT        = 12;
constexpr size_t CH_COUNTER             = 16;
constexpr size_t CH_TYPE_CLASS          = 18;
constexpr size_t CH_WIDTH               = 20;
constexpr size_t CH_FREQUENCY           = 22;
constexpr size_t CH_SHIFT               = 24;
constexpr size_t CH_MUL                 = 26;
constexpr size_t CH_SCALE               = 28;
constexpr size_t CH_DEC                 = 30;
constexpr size_t CH_NAME                = 32;
constexpr size_t CH_SHORT_NAME          = 64;
constexpr size_t CH_UNIT                = 72;

constexpr size_t CH_NAME_WIDTH          = 32;
constexpr size_t CH_SHORT_NAME_WIDTH    = 8;
constexpr size_t CH_UNIT_WIDTH          = 12;

// Type class codes
constexpr uint16_t TYPE_CLASS_FLOAT     = 0x07;
constexpr uint16_t TYPE_CLASS_INT_0     = 0x00;
constexpr uint16_t TYPE_CLASS_INT_3     = 0x03;
constexpr uint16_t TYPE_CLASS_INT_5     = 0x05;

} // namespace LDFormat
} // namespace Telemetry
} // namespace LapCut

#endif // LDFORMAT_H
