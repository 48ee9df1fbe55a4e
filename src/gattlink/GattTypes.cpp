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

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>

#include "GattTypes.hpp"

namespace gattlink {

#define GATT_STATUS(X) \
        X(SUCCESS) \
        X(READ_NOT_PERMITTED) \
        X(WRITE_NOT_PERMITTED) \
        X(INSUFFICIENT_AUTHENTICATION) \
        X(REQUEST_NOT_SUPPORTED) \
        X(INVALID_OFFSET) \
        X(INSUFFICIENT_AUTHORIZATION) \
        X(INVALID_ATTRIBUTE_LENGTH) \
        X(INSUFFICIENT_ENCRYPTION) \
        X(CONNECTION_CONGESTED) \
        X(ERROR) \
        X(FAILURE)

#define GATT_STATUS_CASE_TO_STRING(V) case GattStatus::V: return #V;

std::string to_string(const GattStatus v) noexcept {
    switch(v) {
    GATT_STATUS(GATT_STATUS_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "GattStatus "+jau::to_hexstring(number(v));
}

#define GATT_ERROR_CODE(X) \
        X(SUCCESS) \
        X(NOT_FOUND) \
        X(NOT_CONNECTED) \
        X(NO_GATT_SESSION) \
        X(OPERATION_OVERWRITTEN) \
        X(PLATFORM_STATUS) \
        X(PERMISSION_DENIED) \
        X(DISCONNECTED) \
        X(ALREADY_CONNECTED) \
        X(NOT_SUPPORTED)

#define GATT_ERROR_CODE_CASE_TO_STRING(V) case GattErrorCode::V: return #V;

std::string to_string(const GattErrorCode ec) noexcept {
    switch(ec) {
    GATT_ERROR_CODE(GATT_ERROR_CODE_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown GattErrorCode";
}

std::string to_string(const ConnectionState v) noexcept {
    switch(v) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING: return "CONNECTING";
        case ConnectionState::CONNECTED: return "CONNECTED";
    }
    return "Unknown ConnectionState";
}

} // namespace gattlink
