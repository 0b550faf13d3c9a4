/**
 * @file link.h
 * @brief MK312-link C API
 *
 * C-compatible interface for the MK312-link session.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Protocol constants                                                        */
  /* ========================================================================= */

  /** @brief Start of frame marker, host -> device */
#define MK312LINK_HOST_MARKER 0xA5

  /** @brief Start of frame marker, device -> host */
#define MK312LINK_DEVICE_MARKER 0x5A

  /** @brief Maximum payload size */
#define MK312LINK_MAX_PAYLOAD_SIZE 16

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) MK312LINK_ERR_##name = val,
#include "mk312link/errors.def"
#undef ERR
  } mk312link_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* mk312link_strerror(mk312link_error_t err);

  /* ========================================================================= */
  /* Link state                                                                */
  /* ========================================================================= */

  typedef enum
  {
    MK312LINK_STATE_DISCONNECTED = 0,
    MK312LINK_STATE_HANDSHAKING = 1,
    MK312LINK_STATE_ACTIVE = 2,
    MK312LINK_STATE_RESETTING = 3,
  } mk312link_state_t;

  /* ========================================================================= */
  /* Link handle                                                               */
  /* ========================================================================= */

  /** @brief Opaque handle to a session */
  typedef struct MK312Link MK312Link;

  /**
   * @brief Transport write callback
   *
   * @param user User-defined context pointer
   * @param data Data buffer to write
   * @param len  Number of bytes to write
   * @return 0 on success, negative on a fatal transport error
   */
  typedef int (*mk312link_write_fn)(void* user, const uint8_t* data, size_t len);

  /**
   * @brief Transport read callback
   *
   * @param user       User-defined context pointer
   * @param buf        Destination buffer
   * @param max        Maximum bytes to read
   * @param timeout_ms Time to wait for the first byte
   * @return Bytes read (> 0), 0 on timeout, negative on a fatal transport
   *         error
   */
  typedef int (*mk312link_read_fn)(void* user, uint8_t* buf, size_t max, uint32_t timeout_ms);

  /* ========================================================================= */
  /* Lifecycle functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Create a new session over the given transport callbacks
   *
   * @param write_fn   Transport write callback
   * @param read_fn    Transport read callback
   * @param user       User context pointer (passed to both callbacks)
   * @param timeout_ms Response window per request (0 selects 2000 ms)
   * @return Session handle, or NULL on invalid arguments or allocation
   *         failure
   */
  MK312Link* mk312link_create(mk312link_write_fn write_fn, mk312link_read_fn read_fn, void* user,
                              uint32_t timeout_ms);

  /**
   * @brief Reset the key if the session is active, then free the handle
   * @param link Session handle (NULL-safe)
   */
  void mk312link_destroy(MK312Link* link);

  /* ========================================================================= */
  /* Operation functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Establish the session key
   * @param link    Session handle
   * @param key_out Receives the session key (can be NULL)
   */
  mk312link_error_t mk312link_handshake(MK312Link* link, uint8_t* key_out);

  mk312link_error_t mk312link_read_register(MK312Link* link, uint16_t address, uint8_t* value);

  mk312link_error_t mk312link_write_register(MK312Link* link, uint16_t address, uint8_t value);

  /**
   * @brief Return the device to the unkeyed state (best effort)
   *
   * The session is DISCONNECTED afterwards.
   */
  void mk312link_reset_key(MK312Link* link);

  mk312link_state_t mk312link_state(const MK312Link* link);

#ifdef __cplusplus
} /* extern "C" */
#endif
