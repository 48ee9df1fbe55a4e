/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2020 Gothel Software e.K.
 * Copyright (c) 2020 ZAFENA AB
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

#ifndef GATTLINK_CHARACTERISTIC_HPP_
#define GATTLINK_CHARACTERISTIC_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>
#include <jau/int_types.hpp>
#include <jau/darray.hpp>
#include <jau/octets.hpp>
#include <jau/uuid.hpp>

#include "GattTypes.hpp"
#include "GattDesc.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module GattChar:
 *
 * - BT Core Spec v5.2: Vol 3, Part G Generic Attribute Protocol (GATT)
 * - BT Core Spec v5.2: Vol 3, Part G GATT: 2.6 GATT Profile Hierarchy
 */
namespace gattlink {

    /** \addtogroup GattLinkAPI
     *
     *  @{
     */

    /**
     * Representing a discovered Gatt Characteristic of a connected peripheral.
     *
     * A list of shared GattChar instances is available from GattService
     * via GattService::characteristicList.
     *
     * BT Core Spec v5.2: Vol 3, Part G GATT: 3.3 Characteristic Definition
     *
     * Instances are created by the native GATT stack while discovering services
     * and are immutable once handed over to the GattSession.
     */
    class GattChar {
        public:
            /** BT Core Spec v5.2: Vol 3, Part G GATT: 3.3.1.1 Characteristic Properties */
            enum PropertyBitVal : uint8_t {
                NONE            = 0,
                Broadcast       = (1 << 0),
                Read            = (1 << 1),
                WriteNoAck      = (1 << 2),
                WriteWithAck    = (1 << 3),
                Notify          = (1 << 4),
                Indicate        = (1 << 5),
                AuthSignedWrite = (1 << 6),
                ExtProps        = (1 << 7)
            };

            typedef jau::nsize_t size_type;
            typedef jau::snsize_t ssize_type;

            /* Characteristics Property */
            const PropertyBitVal properties;

            /**
             * Stack-native Characteristics Value Handle.
             * <p>
             * Unique per connected device, used to address the characteristic
             * towards the native GATT stack and to correlate its callbacks.
             * </p>
             */
            const uint16_t value_handle;

            /* Characteristics Value Type UUID */
            std::unique_ptr<const jau::uuid_t> value_type;

            /** List of Characteristic Descriptions as shared reference */
            jau::darray<GattDescRef> descriptorList;

            /* Optional Client Characteristic Configuration index within descriptorList */
            ssize_type clientCharConfigIndex = -1;

            GattChar(const PropertyBitVal properties_, const uint16_t value_handle_, std::unique_ptr<const jau::uuid_t> && value_type_) noexcept
            : properties(properties_), value_handle(value_handle_), value_type(std::move(value_type_)) {}

            bool hasProperties(const PropertyBitVal v) const noexcept { return v == ( properties & v ); }

            /** Returns true if this characteristic can deliver notifications or indications. */
            bool canNotifyOrIndicate() const noexcept {
                return hasProperties(PropertyBitVal::Notify) || hasProperties(PropertyBitVal::Indicate);
            }

            /** Canonical uuid key of this characteristic's value type, see to_uuid_key(). */
            std::string getUUIDKey() const noexcept { return to_uuid_key(*value_type); }

            /**
             * Append the given descriptor, indexing the Client Characteristic Configuration if matching.
             */
            void addDescriptor(const GattDescRef& desc) noexcept;

            /**
             * Find a GattDesc by its desc_uuid.
             *
             * @parameter desc_uuid the UUID of the desired GattDesc
             * @return The matching descriptor or null if not found
             */
            GattDescRef findGattDesc(const jau::uuid_t& desc_uuid) const noexcept;

            /**
             * Find a GattDesc by its stack-native handle.
             */
            GattDescRef findGattDesc(const uint16_t desc_handle) const noexcept;

            /**
             * Return the Client Characteristic Configuration GattDescRef if available or nullptr.
             */
            GattDescRef getClientCharConfig() const noexcept {
                if( 0 > clientCharConfigIndex ) {
                    return nullptr;
                }
                return descriptorList.at(static_cast<size_type>(clientCharConfigIndex));
            }

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<GattChar> GattCharRef;

    constexpr uint8_t number(const GattChar::PropertyBitVal rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    constexpr GattChar::PropertyBitVal operator |(const GattChar::PropertyBitVal lhs, const GattChar::PropertyBitVal rhs) noexcept {
        return static_cast<GattChar::PropertyBitVal> ( number(lhs) | number(rhs) );
    }
    constexpr GattChar::PropertyBitVal operator &(const GattChar::PropertyBitVal lhs, const GattChar::PropertyBitVal rhs) noexcept {
        return static_cast<GattChar::PropertyBitVal> ( number(lhs) & number(rhs) );
    }
    constexpr bool operator ==(const GattChar::PropertyBitVal lhs, const GattChar::PropertyBitVal rhs) noexcept {
        return number(lhs) == number(rhs);
    }
    constexpr bool operator !=(const GattChar::PropertyBitVal lhs, const GattChar::PropertyBitVal rhs) noexcept {
        return !( lhs == rhs );
    }
    std::string to_string(const GattChar::PropertyBitVal mask) noexcept;

    /**
     * {@link GattChar} event listener for notification and indication events.
     * <p>
     * A listener instance may be registered as the session wide notification sink
     * via {@link GattSession::setNotificationSink()}, receiving all events of the device,
     * or per characteristic via {@link GattSession::subscribe()}.
     * </p>
     */
    class GattCharListener {
        public:
            /**
             * Called from the native GATT stack's callback thread, initiated by a received
             * notification or indication associated with the given {@link GattChar}.
             * @param charDecl {@link GattChar} related to this notification
             * @param charValue the notification value
             * @param timestamp monotonic timestamp at reception, see jau::getCurrentMilliseconds()
             */
            virtual void notificationReceived(GattCharRef charDecl,
                                              const jau::TROOctets& charValue, const uint64_t timestamp) = 0;

            virtual ~GattCharListener() noexcept = default;

            /** Return a simple description about this instance. */
            virtual std::string toString() const noexcept {
                return "GattCharListener["+jau::to_hexstring(this)+"]";
            }

            /**
             * Default comparison operator, merely testing for same memory reference.
             * <p>
             * Specializations may override.
             * </p>
             */
            virtual bool operator==(const GattCharListener& rhs) const noexcept
            { return this == &rhs; }

            bool operator!=(const GattCharListener& rhs) const noexcept
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<GattCharListener> GattCharListenerRef;

    /**@}*/

} // namespace gattlink

#endif /* GATTLINK_CHARACTERISTIC_HPP_ */
