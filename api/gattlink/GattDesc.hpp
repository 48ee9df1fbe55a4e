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

#ifndef GATTLINK_DESC_HPP_
#define GATTLINK_DESC_HPP_

#include <cstdint>
#include <string>
#include <memory>

#include <jau/uuid.hpp>

/**
 * - - - - - - - - - - - - - - -
 *
 * Module GattDesc:
 *
 * - BT Core Spec v5.2: Vol 3, Part G Generic Attribute Protocol (GATT)
 * - BT Core Spec v5.2: Vol 3, Part G GATT: 3.3.3 Characteristic Descriptor Declarations
 */
namespace gattlink {

    /** \addtogroup GattLinkAPI
     *
     *  @{
     */

    /**
     * Characteristic Descriptor as discovered by the native GATT stack.
     *
     * Only the descriptor type and its stack-native handle are tracked,
     * values are never cached.
     */
    class GattDesc {
        public:
            /** Client Characteristic Configuration Descriptor type, uuid16 0x2902 */
            static const std::shared_ptr<jau::uuid_t> TYPE_CCC_DESC;

            /**
             * Following UUID16 GATT profile attribute types are listed under:
             * BT Core Spec v5.2: Vol 3, Part G GATT: 3.4 Summary of GATT Profile Attribute Types
             */
            enum Type : uint16_t {
                CHARACTERISTIC_EXTENDED_PROPERTIES          = 0x2900,
                CHARACTERISTIC_USER_DESCRIPTION             = 0x2901,
                CLIENT_CHARACTERISTIC_CONFIGURATION         = 0x2902,
                SERVER_CHARACTERISTIC_CONFIGURATION         = 0x2903,
                CHARACTERISTIC_PRESENTATION_FORMAT          = 0x2904,
                CHARACTERISTIC_AGGREGATE_FORMAT             = 0x2905
            };

            /** CCCD value disabling notification and indication */
            static constexpr const uint8_t CCC_DISABLE[2] = { 0x00, 0x00 };
            /** CCCD value enabling notification */
            static constexpr const uint8_t CCC_ENABLE_NOTIFY[2] = { 0x01, 0x00 };
            /** CCCD value enabling indication */
            static constexpr const uint8_t CCC_ENABLE_INDICATE[2] = { 0x02, 0x00 };

            /** Type of descriptor */
            std::unique_ptr<const jau::uuid_t> type;

            /** Stack-native descriptor handle, unique per connected device. */
            const uint16_t handle;

            GattDesc(std::unique_ptr<const jau::uuid_t> && type_, const uint16_t handle_) noexcept
            : type(std::move(type_)), handle(handle_) {}

            /** Value is uint16_t bitfield */
            bool isClientCharConfig() const noexcept{
                return TYPE_CCC_DESC->equivalent(*type);
            }

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<GattDesc> GattDescRef;

    /**@}*/

} // namespace gattlink

#endif /* GATTLINK_DESC_HPP_ */
