#pragma once

// Compile-time configuration for the HexiLink library.
//
// Values marked [WIRE] must match the KW40Z host interface firmware. The rest
// are host-side tuning and can be overridden with -D on the command line.

// --- Serial Port Configuration ---

// [WIRE] The KW40Z application firmware runs its UART at 230400 baud, 8N2.
#ifndef HEXILINK_BAUDRATE
#define HEXILINK_BAUDRATE 230400UL
#endif

#ifndef HEXILINK_STOP_BITS
#define HEXILINK_STOP_BITS 2U
#endif

// --- Queues ---

// Frames received from the coprocessor and not yet dispatched.
#ifndef HEXILINK_RX_QUEUE_DEPTH
#define HEXILINK_RX_QUEUE_DEPTH 10U
#endif

// Frames waiting to be written by the writer loop.
#ifndef HEXILINK_TX_QUEUE_DEPTH
#define HEXILINK_TX_QUEUE_DEPTH 10U
#endif

// --- Delivery Confirmation ---

#ifndef HEXILINK_RETRANSMIT_COUNT
#define HEXILINK_RETRANSMIT_COUNT 3U
#endif

#ifndef HEXILINK_RETRANSMIT_TIMEOUT_MS
#define HEXILINK_RETRANSMIT_TIMEOUT_MS 100UL
#endif

// Any received frame counts as a confirmation when enabled; otherwise only
// PT_OK does. The KW40Z firmware does not always answer with PT_OK, so the
// permissive policy is the default.
#ifndef HEXILINK_RX_CONFIRMATION_ENABLE
#define HEXILINK_RX_CONFIRMATION_ENABLE 1
#endif

// Answer confirmable inbound frames with PT_OK.
#ifndef HEXILINK_TX_CONFIRMATION_ENABLE
#define HEXILINK_TX_CONFIRMATION_ENABLE 1
#endif

// --- Task Pacing ---

// Pause applied by every long-lived loop after an I/O or processing error.
#ifndef HEXILINK_LOOP_BACKOFF_MS
#define HEXILINK_LOOP_BACKOFF_MS 1000UL
#endif

#ifndef HEXILINK_HR_SAMPLE_INTERVAL_MS
#define HEXILINK_HR_SAMPLE_INTERVAL_MS 50UL
#endif

// Without a beat for this long the heart rate estimate restarts.
#ifndef HEXILINK_HR_RESET_WINDOW_MS
#define HEXILINK_HR_RESET_WINDOW_MS 3000UL
#endif

#ifndef HEXILINK_SENSOR_PUBLISH_INTERVAL_MS
#define HEXILINK_SENSOR_PUBLISH_INTERVAL_MS 5000UL
#endif

#ifndef HEXILINK_SENSOR_PUBLISH_BACKOFF_MS
#define HEXILINK_SENSOR_PUBLISH_BACKOFF_MS 3000UL
#endif

// --- Diagnostics ---

// 0 = off, 1 = error, 2 = warning, 3 = info, 4 = debug
#ifndef HEXILINK_LOG_LEVEL
#define HEXILINK_LOG_LEVEL 3
#endif

// Hex dump of every frame read or written (debug level).
#ifndef HEXILINK_DEBUG_FRAMES
#define HEXILINK_DEBUG_FRAMES 0
#endif

// Largest formatted log line, including the terminator.
#ifndef HEXILINK_LOG_LINE_SIZE
#define HEXILINK_LOG_LINE_SIZE 192U
#endif
