/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file wscore.hpp
 * @brief wscore - WebSocket protocol engine (umbrella header)
 *
 * RFC 6455 framing, fragmentation, control frames and the closing handshake,
 * RFC 7692 permessage-deflate, outbound backpressure and a per-source
 * connection rate limiter. Session is the transport-free core; Connection
 * and Server run it over sockpp sockets (optionally TLS via mbedTLS).
 *
 * Usage:
 *   #include "wscore.hpp"
 *
 *   int main() {
 *     wscore::Server server(8080);
 *     server.on_message = [](const auto& conn, const wscore::Message& msg) {
 *       conn->send(msg);
 *     };
 *     server.run();
 *   }
 *
 * @see RFC 6455: The WebSocket Protocol
 * @see RFC 7692: Compression Extensions for WebSocket
 */

#ifndef WSCORE_HPP_
#define WSCORE_HPP_

#include "wscore/backpressure.hpp"
#include "wscore/bytes.hpp"
#include "wscore/compression.hpp"
#include "wscore/config.hpp"
#include "wscore/connection.hpp"
#include "wscore/control_handler.hpp"
#include "wscore/crypto.hpp"
#include "wscore/fragment_assembler.hpp"
#include "wscore/frame.hpp"
#include "wscore/handshake.hpp"
#include "wscore/log.hpp"
#include "wscore/message.hpp"
#include "wscore/rate_limiter.hpp"
#include "wscore/server.hpp"
#include "wscore/session.hpp"
#include "wscore/state_machine.hpp"
#include "wscore/tls.hpp"
#include "wscore/transport.hpp"
#include "wscore/vocabulary.hpp"

#endif  // WSCORE_HPP_
