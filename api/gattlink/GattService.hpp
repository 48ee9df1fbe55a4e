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

#ifndef GATTLINK_SERVICE_HPP_
#define GATTLINK_SERVICE_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>
#include <jau/uuid.hpp>

#include "GattChar.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module GattService:
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
     * Representing a discovered Gatt Service of a connected peripheral.
     *
     * A list of shared GattService instances can be retrieved from GattSession
     * after successful service discovery via GattSession::getGattServices().
     *
     * BT Core Spec v5.2: Vol 3, Part G GATT: 3.1 Service Definition
     */
    class GattService {
        public:
            const bool primary;

            /** Service start handle, stack-native. */
            const uint16_t handle;

            /** Service end handle, inclusive, stack-native. */
            const uint16_t end_handle;

            /** Service type UUID */
            std::unique_ptr<const jau::uuid_t> type;

            /** List of Characteristic Declarations as shared reference */
            jau::darray<GattCharRef> characteristicList;

            GattService(const bool isPrimary_, const uint16_t startHandle_, const uint16_t endHandle_,
                        std::unique_ptr<const jau::uuid_t> && type_) noexcept
            : primary(isPrimary_), handle(startHandle_), end_handle(endHandle_), type(std::move(type_)), characteristicList() {
                characteristicList.reserve(10);
            }

            /**
             * Find a GattChar by its char_uuid.
             *
             * @parameter char_uuid the jau::uuid_t of the desired GattChar, within this GattService.
             * @return The matching characteristic or null if not found
             */
            GattCharRef findGattChar(const jau::uuid_t& char_uuid) const noexcept;

            /**
             * Find a GattChar by its stack-native value handle.
             */
            GattCharRef findGattChar(const uint16_t value_handle) const noexcept;

            /**
             * Find the GattChar owning the descriptor with the given stack-native handle.
             */
            GattCharRef findGattCharByDescHandle(const uint16_t desc_handle) const noexcept;

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<GattService> GattServiceRef;

    /**@}*/

} // namespace gattlink

#endif /* GATTLINK_SERVICE_HPP_ */
