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

#ifndef GATTLINK_STACK_HPP_
#define GATTLINK_STACK_HPP_

#include <cstdint>
#include <string>
#include <memory>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/octets.hpp>
#include <jau/eui48.hpp>

#include "GattTypes.hpp"
#include "GattService.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module GattStack:
 *
 * Interfaces of the underlying native GATT stack consumed by GattSession.
 *
 * The native stack accepts one request at a time per connection and reports
 * every outcome asynchronously through GattStackCallback, on any thread.
 */
namespace gattlink {

    /** \addtogroup GattLinkAPI
     *
     *  @{
     */

    class GattConnection; // forward
    typedef std::shared_ptr<GattConnection> GattConnectionRef;

    /**
     * Receiver of all asynchronous native GATT stack outcomes for one device.
     *
     * Methods may be called from any thread, including synchronously from within
     * the issuing GattConnection or GattStack request.
     *
     * Each callback passes the GattConnection it relates to,
     * allowing the receiver to drop outcomes of stale connections.
     */
    class GattStackCallback {
        public:
            virtual ~GattStackCallback() noexcept = default;

            /**
             * Connection state change.
             * @param conn the related connection
             * @param status GattStatus::SUCCESS if the state change was regular
             * @param connected true if connected, otherwise disconnected
             */
            virtual void connectionStateChanged(const GattConnectionRef& conn, const GattStatus status, const bool connected) = 0;

            /** Result of GattConnection::discoverServices(), services are empty on failure. */
            virtual void servicesDiscovered(const GattConnectionRef& conn, const GattStatus status,
                                            const jau::darray<GattServiceRef>& services) = 0;

            /** Result of GattConnection::readCharacteristic(). */
            virtual void characteristicRead(const GattConnectionRef& conn, const uint16_t value_handle,
                                            const GattStatus status, const jau::TROOctets& value) = 0;

            /** Result of GattConnection::writeCharacteristic(). */
            virtual void characteristicWritten(const GattConnectionRef& conn, const uint16_t value_handle, const GattStatus status) = 0;

            /** Result of GattConnection::writeDescriptor(). */
            virtual void descriptorWritten(const GattConnectionRef& conn, const uint16_t desc_handle, const GattStatus status) = 0;

            /** Result of GattConnection::requestMtu(). */
            virtual void mtuChanged(const GattConnectionRef& conn, const uint16_t mtu, const GattStatus status) = 0;

            /** Inbound notification or indication value. */
            virtual void characteristicChanged(const GattConnectionRef& conn, const uint16_t value_handle,
                                               const jau::TROOctets& value) = 0;
    };
    typedef std::shared_ptr<GattStackCallback> GattStackCallbackRef;

    /**
     * Native GATT connection handle to one remote device.
     *
     * Request methods return false if the native stack refused the request synchronously,
     * in which case no callback will follow.
     * Otherwise the outcome is reported via the GattStackCallback passed to GattStack::connect().
     */
    class GattConnection {
        public:
            virtual ~GattConnection() noexcept = default;

            virtual const jau::EUI48& getAddress() const noexcept = 0;

            virtual bool discoverServices() noexcept = 0;

            virtual bool readCharacteristic(const uint16_t value_handle) noexcept = 0;

            /**
             * @param value_handle characteristic value handle
             * @param value the value to write
             * @param withResponse if true, write with acknowledgement, otherwise write command without response
             */
            virtual bool writeCharacteristic(const uint16_t value_handle, const jau::TROOctets& value, const bool withResponse) noexcept = 0;

            /** Toggles local delivery of notifications and indications, completes synchronously. */
            virtual bool setCharacteristicNotification(const uint16_t value_handle, const bool enable) noexcept = 0;

            virtual bool writeDescriptor(const uint16_t desc_handle, const jau::TROOctets& value) noexcept = 0;

            virtual bool requestMtu(const uint16_t mtu) noexcept = 0;

            /** Requests teardown of the connection, a disconnected callback may follow. */
            virtual void disconnect() noexcept = 0;

            /** Releases all native resources, no further callbacks will follow. */
            virtual void close() noexcept = 0;

            virtual std::string toString() const noexcept {
                return "GattConnection["+getAddress().toString()+"]";
            }
    };

    /**
     * Native GATT stack, i.e. the local adapter's client side.
     */
    class GattStack {
        public:
            virtual ~GattStack() noexcept = default;

            /** Returns true if a usable local Bluetooth adapter exists. */
            virtual bool isAdapterAvailable() const noexcept = 0;

            /**
             * Requests a connection to the given device.
             *
             * @param address the remote device address
             * @param cb receiver of all outcomes related to the new connection
             * @return the pending connection handle, or nullptr if the request has been refused synchronously
             */
            virtual GattConnectionRef connect(const jau::EUI48& address, const GattStackCallbackRef& cb) noexcept = 0;

            virtual std::string toString() const noexcept {
                return "GattStack["+jau::to_hexstring(this)+"]";
            }
    };
    typedef std::shared_ptr<GattStack> GattStackRef;

    /**@}*/

} // namespace gattlink

#endif /* GATTLINK_STACK_HPP_ */
