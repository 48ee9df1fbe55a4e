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

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>

#include "GattService.hpp"

using namespace gattlink;
using namespace jau;

GattCharRef GattService::findGattChar(const jau::uuid_t& char_uuid) const noexcept {
    for(const GattCharRef& c : characteristicList) {
        if( nullptr != c && char_uuid.equivalent( *(c->value_type) ) ) {
            return c;
        }
    }
    return nullptr;
}

GattCharRef GattService::findGattChar(const uint16_t value_handle) const noexcept {
    for(const GattCharRef& c : characteristicList) {
        if( nullptr != c && value_handle == c->value_handle ) {
            return c;
        }
    }
    return nullptr;
}

GattCharRef GattService::findGattCharByDescHandle(const uint16_t desc_handle) const noexcept {
    for(const GattCharRef& c : characteristicList) {
        if( nullptr != c && nullptr != c->findGattDesc(desc_handle) ) {
            return c;
        }
    }
    return nullptr;
}

std::string GattService::toString() const noexcept {
    return "Srvc[type 0x"+type->toString()+", handle ["+to_hexstring(handle)+".."+to_hexstring(end_handle)+"], "+
           (primary ? "primary" : "secondary")+", "+std::to_string(characteristicList.size())+" chars]";
}
