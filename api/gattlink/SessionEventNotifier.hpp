/*
 * Copyright (c) 2026 The gattlink Authors
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef GATTLINK_SESSION_EVENT_NOTIFIER_HPP_
#define GATTLINK_SESSION_EVENT_NOTIFIER_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>

#include <jau/basic_types.hpp>
#include <jau/eui48.hpp>

#include "GattEnv.hpp"

namespace gattlink {

    /** \addtogroup GattLinkAPI
     *
     *  @{
     */

    enum class SessionEventType : uint8_t {
        CONNECTED       = 0,
        DISCONNECTED    = 1
    };
    std::string to_string(const SessionEventType v) noexcept;

    /**
     * Connection lifecycle event of one GattSession.
     */
    struct SessionEvent {
        SessionEventType type;
        jau::EUI48 address;
        /** monotonic timestamp of the state transition, see jau::getCurrentMilliseconds() */
        uint64_t timestamp;

        std::string toString() const noexcept;
    };

    /**
     * Receiver of SessionEvent, registered via SessionEventNotifier::setSink().
     */
    class SessionEventListener {
        public:
            /**
             * Called on every CONNECTED or DISCONNECTED transition of any session,
             * from the thread causing the transition.
             */
            virtual void sessionEvent(const SessionEvent& e) = 0;

            virtual ~SessionEventListener() noexcept = default;

            virtual std::string toString() const noexcept {
                return "SessionEventListener["+jau::to_hexstring(this)+"]";
            }
    };
    typedef std::shared_ptr<SessionEventListener> SessionEventListenerRef;

    /**
     * Best effort broadcast of SessionEvent to one registered sink.
     *
     * Without a registered sink events are dropped, there is no queuing or replay.
     */
    class SessionEventNotifier {
        private:
            const GattEnv & env;
            mutable std::mutex mtx_sink;
            SessionEventListenerRef sink;

        public:
            SessionEventNotifier() noexcept;

            SessionEventNotifier(const SessionEventNotifier&) = delete;
            void operator=(const SessionEventNotifier&) = delete;

            /** Registers the given sink, replacing a previous one. */
            void setSink(const SessionEventListenerRef& l) noexcept;

            void clearSink() noexcept;

            bool hasSink() const noexcept;

            /**
             * Delivers the event to the sink, if any.
             * @return true if delivered, false if dropped or the sink threw an exception
             */
            bool send(const SessionEvent& e) noexcept;

            bool sendConnected(const jau::EUI48& address) noexcept {
                return send( SessionEvent{ SessionEventType::CONNECTED, address, jau::getCurrentMilliseconds() } );
            }

            bool sendDisconnected(const jau::EUI48& address) noexcept {
                return send( SessionEvent{ SessionEventType::DISCONNECTED, address, jau::getCurrentMilliseconds() } );
            }
    };
    typedef std::shared_ptr<SessionEventNotifier> SessionEventNotifierRef;

    /**@}*/

} // namespace gattlink

#endif /* GATTLINK_SESSION_EVENT_NOTIFIER_HPP_ */
