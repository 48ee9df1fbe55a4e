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

#ifndef GATTLINK_TYPES_HPP_
#define GATTLINK_TYPES_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <system_error>
#include <type_traits>

#include <jau/basic_types.hpp>
#include <jau/uuid.hpp>

/**
 * - - - - - - - - - - - - - - -
 *
 * GattTypes.hpp Module for common gattlink types:
 *
 * - GattErrorCode, the per request error taxonomy
 * - GattStatus, status values reported by the native GATT stack
 * - ConnectionState of a GattSession
 * - GattException and GattOpException
 *
 */
namespace gattlink {

    /** \addtogroup GattLinkAPI
     *
     *  @{
     */

    /**
     * Status values as reported by the native GATT stack within its callbacks.
     *
     * Values not listed here are passed through unchanged,
     * i.e. a GattStatus may hold any native `int32_t` value.
     */
    enum class GattStatus : int32_t {
        SUCCESS                         = 0x00,
        READ_NOT_PERMITTED              = 0x02,
        WRITE_NOT_PERMITTED             = 0x03,
        INSUFFICIENT_AUTHENTICATION     = 0x05,
        REQUEST_NOT_SUPPORTED           = 0x06,
        INVALID_OFFSET                  = 0x07,
        INSUFFICIENT_AUTHORIZATION      = 0x08,
        INVALID_ATTRIBUTE_LENGTH        = 0x0d,
        INSUFFICIENT_ENCRYPTION         = 0x0f,
        CONNECTION_CONGESTED            = 0x8f,
        ERROR                           = 0x85,
        /** Generic failure, also used for requests the native stack refused synchronously. */
        FAILURE                         = 0x101
    };
    constexpr int32_t number(const GattStatus rhs) noexcept {
        return static_cast<int32_t>(rhs);
    }
    constexpr GattStatus to_GattStatus(const int32_t v) noexcept {
        return static_cast<GattStatus>(v);
    }
    std::string to_string(const GattStatus v) noexcept;

    /**
     * Error codes of failed GattSession and GattSessionRegistry requests.
     */
    enum class GattErrorCode : uint8_t {
        SUCCESS                 = 0x00,
        /** Unknown device address or characteristic uuid. */
        NOT_FOUND               = 0x01,
        /** Request requires a connected session. */
        NOT_CONNECTED           = 0x02,
        /** MTU request without a live GATT connection. */
        NO_GATT_SESSION         = 0x03,
        /** Request has been superseded by a newer request for the same slot. */
        OPERATION_OVERWRITTEN   = 0x04,
        /** Native stack reported a non-success GattStatus. */
        PLATFORM_STATUS         = 0x05,
        /** PermissionGate denied the connection attempt. */
        PERMISSION_DENIED       = 0x06,
        /** Session has been disconnected while the request was pending. */
        DISCONNECTED            = 0x07,
        /** Session is already connecting or connected. */
        ALREADY_CONNECTED       = 0x08,
        /** Characteristic has no Notify or Indicate property, or no CCCD. */
        NOT_SUPPORTED           = 0x09
    };
    constexpr uint8_t number(const GattErrorCode rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const GattErrorCode ec) noexcept;

    class GattErrorCodeCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "GATT"; }
            std::string message(int condition) const override {
                return "GATT::"+to_string( static_cast<GattErrorCode>(condition) );
            }
            static GattErrorCodeCategory& get() {
                static GattErrorCodeCategory s;
                return s;
            }
    };
    inline std::error_code make_error_code( GattErrorCode e ) noexcept {
      return std::error_code( number(e), GattErrorCodeCategory::get() );
    }

    /**
     * Connection state of a GattSession.
     *
     * Transitions are driven by native stack callbacks,
     * except GattSession::disconnect() which forces DISCONNECTED.
     */
    enum class ConnectionState : uint8_t {
        DISCONNECTED    = 0,
        CONNECTING      = 1,
        CONNECTED       = 2
    };
    constexpr uint8_t number(const ConnectionState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const ConnectionState v) noexcept;

    /**
     * Base exception of gattlink, used for initialization failures.
     */
    class GattException : public jau::RuntimeException {
        protected:
            GattException(std::string const type, std::string const m, const char* file, int line) noexcept
            : RuntimeException(type, m, file, line) {}

        public:
            GattException(std::string const m, const char* file, int line) noexcept
            : RuntimeException("GattException", m, file, line) {}
    };

    /**
     * Failure of a single GattSession request, delivered through its std::future.
     */
    class GattOpException : public GattException {
        private:
            GattErrorCode code;
            GattStatus status;

        public:
            GattOpException(const GattErrorCode code_, const GattStatus status_, std::string const m, const char* file, int line) noexcept
            : GattException("GattOpException", to_string(code_)+", "+to_string(status_)+": "+m, file, line),
              code(code_), status(status_) {}

            GattOpException(const GattErrorCode code_, std::string const m, const char* file, int line) noexcept
            : GattOpException(code_, GattStatus::SUCCESS, m, file, line) {}

            GattErrorCode getErrorCode() const noexcept { return code; }

            /** Native status, only meaningful for GattErrorCode::PLATFORM_STATUS. */
            GattStatus getStatus() const noexcept { return status; }

            std::error_code error_code() const noexcept { return make_error_code(code); }
    };

    /**
     * Canonical key of the given uuid, i.e. its 128-bit string representation.
     *
     * A 16-bit uuid and its expanded 128-bit BT base form share the same key.
     */
    inline std::string to_uuid_key(const jau::uuid_t& uuid) noexcept {
        return uuid.toUUID128String();
    }

    /**@}*/

} // namespace gattlink

// allows implicit std::error_code construction from GattErrorCode
namespace std
{
    /** \addtogroup GattLinkAPI
     *
     *  @{
     */

    template <>
        struct is_error_code_enum<gattlink::GattErrorCode> : true_type {};

    /**@}*/
}

#endif /* GATTLINK_TYPES_HPP_ */
