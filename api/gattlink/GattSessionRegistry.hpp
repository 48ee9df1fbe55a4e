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

#ifndef GATTLINK_SESSION_REGISTRY_HPP_
#define GATTLINK_SESSION_REGISTRY_HPP_

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
#include "GattStack.hpp"
#include "GattSession.hpp"
#include "SessionEventNotifier.hpp"

namespace gattlink {

    /** \addtogroup GattLinkAPI
     *
     *  @{
     */

    /**
     * Device descriptor as reported by the scanner.
     *
     * Only the address is used for session management,
     * the remaining fields are kept for the application.
     */
    struct ScanRecord {
        jau::EUI48 address;
        std::string name;
        int8_t rssi;
        /** advertised service uuids */
        jau::darray<std::shared_ptr<const jau::uuid_t>> services;
        /** manufacturer specific data per company identifier */
        std::unordered_map<uint16_t, jau::POctets> manufacturerData;

        std::string toString() const noexcept;
    };

    /**
     * Synchronous precondition checked before any connection attempt,
     * e.g. runtime Bluetooth permissions.
     *
     * Implementations may trigger a user prompt as a side effect.
     */
    class PermissionGate {
        public:
            virtual ~PermissionGate() noexcept = default;

            /** Returns true if connecting is permitted. */
            virtual bool checkPermissions() = 0;
    };
    typedef std::shared_ptr<PermissionGate> PermissionGateRef;

    /**
     * Maps device address to GattSession, owning the session lifecycle
     * and the SessionEventNotifier shared by all sessions.
     *
     * A session is created on the first connect() or setNotificationSink()
     * for an address known via deviceFound().
     * It stays registered after disconnect in ConnectionState::DISCONNECTED
     * with cleared derived state, until removeSession().
     *
     * Requests against an address without a session fail like
     * requests against a disconnected session.
     *
     * Textual addresses and uuids failing to parse are treated as unknown.
     */
    class GattSessionRegistry {
        public:
            typedef jau::nsize_t size_type;

        private:
            const GattStackRef stack;
            const PermissionGateRef permissionGate;
            const SessionEventNotifierRef notifier;

            mutable std::mutex mtx_sessions;
            /** address string to ScanRecord */
            std::unordered_map<std::string, ScanRecord> knownDevices;
            /** address string to GattSession */
            std::unordered_map<std::string, GattSessionRef> sessions;

            GattSessionRef getOrCreateSession(const jau::EUI48& address) noexcept;

            static bool toAddress(const std::string& address, jau::EUI48& dest) noexcept;
            static std::unique_ptr<const jau::uuid_t> toUUID(const std::string& uuid) noexcept;

        public:
            /**
             * @param stack_ the native GATT stack, must not be nullptr
             * @param permissionGate_ optional PermissionGate, may be nullptr
             * @throws jau::IllegalArgumentException if stack_ is nullptr
             * @throws GattException if the stack has no usable adapter
             */
            GattSessionRegistry(const GattStackRef& stack_, const PermissionGateRef& permissionGate_=nullptr);

            GattSessionRegistry(const GattSessionRegistry&) = delete;
            void operator=(const GattSessionRegistry&) = delete;

            /** Disconnects and releases all sessions. */
            ~GattSessionRegistry() noexcept;

            /** Scanner input, records or updates the device as known. */
            void deviceFound(const ScanRecord& r) noexcept;

            bool isKnownDevice(const jau::EUI48& address) const noexcept;

            jau::darray<ScanRecord> getKnownDevices() const noexcept;

            /** Forgets all known devices, existing sessions stay registered. */
            void clearKnownDevices() noexcept;

            /** Returns the session of the given address or nullptr. */
            GattSessionRef getSession(const jau::EUI48& address) const noexcept;

            size_type getSessionCount() const noexcept;

            /**
             * Disconnects and removes the session of the given address.
             * @return true if a session has been removed
             */
            bool removeSession(const jau::EUI48& address) noexcept;

            /** Registers the lifecycle event sink, replacing a previous one. */
            void setLifecycleSink(const SessionEventListenerRef& l) noexcept { notifier->setSink(l); }

            void clearLifecycleSink() noexcept { notifier->clearSink(); }

            const SessionEventNotifierRef& getEventNotifier() const noexcept { return notifier; }

            /**
             * Connects to the given device, see GattSession::connect().
             *
             * Fails with GattErrorCode::NOT_FOUND if the address is unknown
             * and with GattErrorCode::PERMISSION_DENIED if the PermissionGate denies.
             */
            std::future<void> connect(const jau::EUI48& address) noexcept;
            std::future<void> connect(const std::string& address) noexcept;

            /** Always succeeds, see GattSession::disconnect(). */
            void disconnect(const jau::EUI48& address) noexcept;
            void disconnect(const std::string& address) noexcept;

            bool isConnected(const jau::EUI48& address) const noexcept;
            bool isConnected(const std::string& address) const noexcept;

            std::future<void> discoverServices(const jau::EUI48& address) noexcept;
            std::future<void> discoverServices(const std::string& address) noexcept;

            jau::darray<GattServiceRef> listServices(const jau::EUI48& address) const noexcept;
            jau::darray<GattServiceRef> listServices(const std::string& address) const noexcept;

            std::future<void> write(const jau::EUI48& address, const jau::uuid_t& uuid, const jau::TROOctets& value, const bool withResponse) noexcept;
            std::future<void> write(const std::string& address, const std::string& uuid, const jau::TROOctets& value, const bool withResponse) noexcept;

            std::future<jau::POctets> read(const jau::EUI48& address, const jau::uuid_t& uuid) noexcept;
            std::future<jau::POctets> read(const std::string& address, const std::string& uuid) noexcept;

            std::future<void> subscribe(const jau::EUI48& address, const jau::uuid_t& uuid, const GattCharListenerRef& l=nullptr) noexcept;
            std::future<void> subscribe(const std::string& address, const std::string& uuid, const GattCharListenerRef& l=nullptr) noexcept;

            std::future<void> unsubscribe(const jau::EUI48& address, const jau::uuid_t& uuid) noexcept;
            std::future<void> unsubscribe(const std::string& address, const std::string& uuid) noexcept;

            std::future<uint16_t> requestMtu(const jau::EUI48& address, const uint16_t value) noexcept;
            std::future<uint16_t> requestMtu(const std::string& address, const uint16_t value) noexcept;

            /**
             * Registers the notification sink of the given device's session,
             * creating the session if the device is known.
             * @return false if the device is unknown
             */
            bool setNotificationSink(const jau::EUI48& address, const GattCharListenerRef& l) noexcept;

            /** @return false if no session exists */
            bool clearNotificationSink(const jau::EUI48& address) noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace gattlink

#endif /* GATTLINK_SESSION_REGISTRY_HPP_ */
