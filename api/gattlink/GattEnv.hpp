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

#ifndef GATTLINK_ENV_HPP_
#define GATTLINK_ENV_HPP_

#include <cstdint>
#include <string>

#include <jau/environment.hpp>

namespace gattlink {

    /** \addtogroup GattLinkAPI
     *
     *  @{
     */

    /**
     * GATT session singleton runtime environment properties
     * <p>
     * Also see {@link jau::environment::getExplodingProperties(const std::string & prefixDomain)}.
     * </p>
     */
    class GattEnv : public jau::root_environment {
        private:
            GattEnv() noexcept; // NOLINT(modernize-use-equals-delete)

        public:
            /** Global Debug flag, retrieved first to trigger root domain initialization of 'gattlink'. */
            const bool DEBUG_GLOBAL;

        private:
            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Initial ATT MTU of a session before any negotiation, defaults to 23 (BLE minimum).
             * <p>
             * Environment variable is 'gattlink.gatt.mtu.default', range [23..517].
             * </p>
             */
            const int32_t DEFAULT_MTU;

            /**
             * Debug all GATT payload data passing a session
             * <p>
             * Environment variable is 'gattlink.debug.gatt.data'.
             * </p>
             */
            const bool DEBUG_DATA;

            /**
             * Debug lifecycle event and notification dispatching
             * <p>
             * Environment variable is 'gattlink.debug.gatt.event'.
             * </p>
             */
            const bool DEBUG_EVENT;

        public:
            static GattEnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 *
                 * Avoiding non-working double checked locking.
                 */
                static GattEnv e;
                return e;
            }
    };

    /**@}*/

} // namespace gattlink

#endif /* GATTLINK_ENV_HPP_ */
