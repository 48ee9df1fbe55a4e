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

#include <jau/debug.hpp>

#include "GattChar.hpp"

using namespace gattlink;
using namespace jau;

#define CHAR_DECL_PROPS_ENUM(X) \
        X(GattChar,Broadcast,broadcast) \
        X(GattChar,Read,read) \
        X(GattChar,WriteNoAck,write-noack) \
        X(GattChar,WriteWithAck,write-ack) \
        X(GattChar,Notify,notify) \
        X(GattChar,Indicate,indicate) \
        X(GattChar,AuthSignedWrite,authenticated-signed-writes) \
        X(GattChar,ExtProps,extended-properties)

#define CASE2_TO_STRING2(U,V,W) case U::V: return #W;

static std::string _getPropertyBitValStr(const GattChar::PropertyBitVal prop) noexcept {
    switch(prop) {
        CHAR_DECL_PROPS_ENUM(CASE2_TO_STRING2)
        default: ; // fall through intended
    }
    return "Unknown property";
}

std::string gattlink::to_string(const GattChar::PropertyBitVal mask) noexcept {
    const GattChar::PropertyBitVal none = static_cast<GattChar::PropertyBitVal>(0);
    const uint8_t one = 1;
    bool has_pre = false;
    std::string out("[");
    for(int i=0; i<8; i++) {
        const GattChar::PropertyBitVal propertyBit = static_cast<GattChar::PropertyBitVal>( one << i );
        if( none != ( mask & propertyBit ) ) {
            if( has_pre ) { out.append(", "); }
            out.append(_getPropertyBitValStr(propertyBit));
            has_pre = true;
        }
    }
    out.append("]");
    return out;
}

void GattChar::addDescriptor(const GattDescRef& desc) noexcept {
    if( nullptr == desc ) {
        ERR_PRINT("GattDesc ref is null");
        return;
    }
    if( desc->isClientCharConfig() && 0 > clientCharConfigIndex ) {
        clientCharConfigIndex = static_cast<ssize_type>( descriptorList.size() );
    }
    descriptorList.push_back(desc);
}

GattDescRef GattChar::findGattDesc(const jau::uuid_t& desc_uuid) const noexcept {
    const size_type descriptors_size = descriptorList.size();
    for(size_type j = 0; j < descriptors_size; j++) {
        const GattDescRef& descriptor = descriptorList[j];
        if( nullptr != descriptor && desc_uuid.equivalent( *(descriptor->type) ) ) {
            return descriptor;
        }
    }
    return nullptr;
}

GattDescRef GattChar::findGattDesc(const uint16_t desc_handle) const noexcept {
    const size_type descriptors_size = descriptorList.size();
    for(size_type j = 0; j < descriptors_size; j++) {
        const GattDescRef& descriptor = descriptorList[j];
        if( nullptr != descriptor && desc_handle == descriptor->handle ) {
            return descriptor;
        }
    }
    return nullptr;
}

std::string GattChar::toString() const noexcept {
    std::string desc_str;
    if( 0 < descriptorList.size() ) {
        bool comma = false;
        desc_str = ", descr[";
        for(size_type i=0; i<descriptorList.size(); i++) {
            const GattDescRef& cd = descriptorList[i];
            if( comma ) {
                desc_str += ", ";
            }
            desc_str += cd->type->toString();
            comma = true;
        }
        desc_str += "]";
    }
    return "Char[value[type 0x"+value_type->toString()+", handle "+to_hexstring(value_handle)+
           ", props "+to_hexstring(number(properties))+" "+gattlink::to_string(properties)+
           desc_str+"]]";
}
