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

#ifndef GATTLINK_SESSION_HPP_
#define GATTLINK_SESSION_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>
#include <future>
#include <unordered_map>

#include <jau/basic_types.hpp>
#include <jau/int_types.hpp>
#include <jau/darray.hpp>
#include <jau/octets.hpp>
#include <jau/uuid.hpp>
#include <jau/eui48.hpp>

#include "GattTypes.hpp"
#include "GattEnv.hpp"
#include "GattService.hpp"
#include "GattStack.hpp"
#include "SessionEventNotifier.hpp"
#include "NotificationRouter.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module GattSession:
 *
 * - Connection state machine of one remote device
 * - Service discovery and characteristic index
 * - Pending operation registry correlating native stack callbacks to requests
 */
namespace gattlink {

    /** \addtogroup GattLinkAPI
     *
     *  @{
     */

    /**
     * Client side GATT session to one remote device.
     *
     * All requests return immediately, either an already failed std::future
     * on invalid state or a std::future resolved exactly once
     * by the related native stack callback or by disconnect().
     *
     * Pending completions are keyed as follows:
     * - read and write per characteristic uuid, a new request fails the pending one of the same uuid with GattErrorCode::OPERATION_OVERWRITTEN
     * - subscribe and unsubscribe per characteristic uuid, same overwrite semantics
     * - connect, service discovery and MTU exchange in one slot each, same overwrite semantics
     *
     * Requests may be issued from any thread, native stack callbacks may arrive on any thread.
     * The session's state is guarded by one recursive mutex, which is never held
     * while calling into the native stack or resolving a std::future.
     *
     * Controlling Environment variables, see {@link GattEnv}.
     */
    class GattSession : public std::enable_shared_from_this<GattSession> {
        public:
            typedef jau::nsize_t size_type;

        private:
            /** Private class only for private make_shared(). */
            class ctor_cookie { friend GattSession; ctor_cookie(const uint16_t secret) { (void)secret; } };

            /** GattStackCallback forwarding to this session via a weak back-reference. */
            class StackCallback;

            template<typename T>
            using PromiseRef = std::shared_ptr<std::promise<T>>;

            struct PendingDescOp {
                PromiseRef<void> promise;
                bool enable;
                /** optional listener to be added to the router after successful enable */
                GattCharListenerRef listener;
            };

            struct PendingOps {
                PromiseRef<void> connect;
                PromiseRef<void> discovery;
                PromiseRef<uint16_t> mtu;
                std::unordered_map<std::string, PromiseRef<jau::POctets>> reads;
                std::unordered_map<std::string, PromiseRef<void>> writes;
                std::unordered_map<std::string, PendingDescOp> descOps;

                size_type size() const noexcept;

                /** Fails and removes all pending completions with the given exception. */
                void failAll(const GattOpException& e) noexcept;
            };

            const GattEnv & env;
            const jau::EUI48 address;
            const GattStackRef stack;
            const SessionEventNotifierRef notifier;
            NotificationRouter router;

            mutable std::recursive_mutex mtx_session;
            ConnectionState state;
            /** Incremented on each connect(), disconnect() and connection drop, stale callbacks are dropped. */
            uint64_t connection_gen;
            /** Live connection, set iff ConnectionState::CONNECTED */
            GattConnectionRef gatt;
            /** Connection handle of a pending connect() while ConnectionState::CONNECTING */
            GattConnectionRef pendingConnection;
            jau::darray<GattServiceRef> services;
            /** Characteristic uuid key to GattChar over all services, later entries win on collision. */
            std::unordered_map<std::string, GattCharRef> charIndex;
            uint16_t mtu;
            PendingOps pending;

            /** Requires locked mtx_session */
            bool isCurrentConnection(const uint64_t gen) const noexcept {
                return gen == connection_gen && ConnectionState::CONNECTED == state && nullptr != gatt;
            }

            /** Requires locked mtx_session */
            void clearServices() noexcept;

            /** Requires locked mtx_session */
            void rebuildCharIndex() noexcept;

            /** Requires locked mtx_session */
            GattCharRef findGattCharByValueHandle(const uint16_t value_handle) const noexcept;

            /** Requires locked mtx_session */
            GattCharRef findGattCharByDescHandle(const uint16_t desc_handle) const noexcept;

            /**
             * Forces ConnectionState::DISCONNECTED, tears down any native connection
             * and fails all pending completions with GattErrorCode::DISCONNECTED.
             */
            void disconnectImpl(const bool sendEvent) noexcept;

            std::future<void> configNotification(const jau::uuid_t& uuid, const bool enable, const GattCharListenerRef& l) noexcept;

            void connectionStateChanged(const uint64_t gen, const GattConnectionRef& conn, const GattStatus status, const bool connected) noexcept;
            void servicesDiscovered(const uint64_t gen, const GattStatus status, const jau::darray<GattServiceRef>& discovered) noexcept;
            void characteristicRead(const uint64_t gen, const uint16_t value_handle, const GattStatus status, const jau::TROOctets& value) noexcept;
            void characteristicWritten(const uint64_t gen, const uint16_t value_handle, const GattStatus status) noexcept;
            void descriptorWritten(const uint64_t gen, const uint16_t desc_handle, const GattStatus status) noexcept;
            void mtuChanged(const uint64_t gen, const uint16_t new_mtu, const GattStatus status) noexcept;
            void characteristicChanged(const uint64_t gen, const uint16_t value_handle, const jau::TROOctets& value) noexcept;

        public:
            /** Private ctor for make_shared(). */
            GattSession(const GattSession::ctor_cookie& cc, const jau::EUI48& address_,
                        const GattStackRef& stack_, const SessionEventNotifierRef& notifier_) noexcept;

            static std::shared_ptr<GattSession> make_shared(const jau::EUI48& address_,
                                                            const GattStackRef& stack_, const SessionEventNotifierRef& notifier_) {
                return std::make_shared<GattSession>(GattSession::ctor_cookie(0), address_, stack_, notifier_);
            }

            GattSession(const GattSession&) = delete;
            void operator=(const GattSession&) = delete;

            /**
             * Releases the native connection if any, pending completions fail with GattErrorCode::DISCONNECTED.
             * No SessionEvent is sent.
             */
            ~GattSession() noexcept;

            const jau::EUI48& getAddress() const noexcept { return address; }

            ConnectionState getConnectionState() const noexcept;

            bool isConnected() const noexcept;

            /** Returns the last negotiated MTU or GattEnv::DEFAULT_MTU. */
            uint16_t getMtu() const noexcept;

            /**
             * Requests a native connection, moving to ConnectionState::CONNECTING.
             *
             * Resolves once connected, then SessionEventType::CONNECTED has been sent.
             * Fails with
             * - GattErrorCode::ALREADY_CONNECTED if connecting or connected
             * - GattErrorCode::PLATFORM_STATUS if the native stack refused or reported a failed connection
             * - GattErrorCode::DISCONNECTED if disconnect() has been called meanwhile
             */
            std::future<void> connect() noexcept;

            /**
             * Forces ConnectionState::DISCONNECTED, always succeeds and is idempotent.
             *
             * Tears down the native connection if any, clears services and characteristic index,
             * fails all pending completions with GattErrorCode::DISCONNECTED
             * and removes all per uuid listener.
             *
             * SessionEventType::DISCONNECTED is only sent if not already disconnected.
             */
            void disconnect() noexcept;

            /**
             * Discovers all services, replacing the current ones and rebuilding the characteristic index.
             *
             * Fails with GattErrorCode::NOT_CONNECTED if not connected, without a native request.
             * On a failed discovery services and index are cleared.
             */
            std::future<void> discoverServices() noexcept;

            /** Returns a snapshot of the discovered services, empty before discovery. */
            jau::darray<GattServiceRef> getGattServices() const noexcept;

            /** Returns the indexed characteristic of the given uuid or nullptr. */
            GattCharRef findGattChar(const jau::uuid_t& uuid) const noexcept;

            /**
             * Reads the characteristic value.
             *
             * Fails with GattErrorCode::NOT_CONNECTED or GattErrorCode::NOT_FOUND without a native request.
             */
            std::future<jau::POctets> read(const jau::uuid_t& uuid) noexcept;

            /**
             * Writes the characteristic value.
             *
             * @param withResponse if true, write with acknowledgement, otherwise write command
             *
             * Fails with GattErrorCode::NOT_CONNECTED or GattErrorCode::NOT_FOUND without a native request.
             */
            std::future<void> write(const jau::uuid_t& uuid, const jau::TROOctets& value, const bool withResponse) noexcept;

            /**
             * Enables notification if supported, otherwise indication,
             * by writing the Client Characteristic Configuration descriptor.
             *
             * The optional listener is added to this session's NotificationRouter for the given uuid
             * once enabled.
             *
             * Fails with GattErrorCode::NOT_SUPPORTED if the characteristic has neither
             * GattChar::PropertyBitVal::Notify nor GattChar::PropertyBitVal::Indicate or no CCCD.
             */
            std::future<void> subscribe(const jau::uuid_t& uuid, const GattCharListenerRef& l=nullptr) noexcept {
                return configNotification(uuid, true, l);
            }

            /**
             * Disables notification and indication, removing all per uuid listener once disabled.
             */
            std::future<void> unsubscribe(const jau::uuid_t& uuid) noexcept {
                return configNotification(uuid, false, nullptr);
            }

            /**
             * Requests the given ATT MTU, resolving with the negotiated value.
             *
             * Fails with GattErrorCode::NO_GATT_SESSION if not connected.
             */
            std::future<uint16_t> requestMtu(const uint16_t value) noexcept;

            /** Registers the session wide notification sink, see NotificationRouter::setSink(). */
            void setNotificationSink(const GattCharListenerRef& l) noexcept { router.setSink(l); }

            void clearNotificationSink() noexcept { router.clearSink(); }

            NotificationRouter& getNotificationRouter() noexcept { return router; }

            /** Returns the number of pending completions of all kinds. */
            size_type getPendingCount() const noexcept;

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<GattSession> GattSessionRef;

    /**@}*/

} // namespace gattlink

#endif /* GATTLINK_SESSION_HPP_ */
