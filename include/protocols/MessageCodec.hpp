#pragma once
/** @file  MessageCodec.hpp
 *  @brief JSON-per-line codec for LogMessage (pure, no I/O).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// Tempo headers
#include "protocols/LogMessage.hpp"

namespace tempo::protocols {

  /**
 * @class MessageCodec
 * @brief Converts one LogMessage to one wire line and back.
 *
 *  * `toWire()` yields a single JSON object without line terminator; the
 *    channel appends the CRLF framing.
 *  * `fromWire()` throws `core::ProtocolError` for non-JSON text, an unknown
 *    `type`, or missing / ill-typed fields. It never terminates the process.
 */
  class MessageCodec {
  public:
    static std::string toWire(const LogMessage& msg);
    static LogMessage fromWire(const std::string& line);
  };

} // namespace tempo::protocols
