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

#ifndef GATTLINK_NOTIFICATION_ROUTER_HPP_
#define GATTLINK_NOTIFICATION_ROUTER_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>

#include <jau/int_types.hpp>
#include <jau/cow_darray.hpp>
#include <jau/octets.hpp>
#include <jau/uuid.hpp>

#include "GattEnv.hpp"
#include "GattChar.hpp"

namespace gattlink {

    /** \addtogroup GattLinkAPI
     *
     *  @{
     */

    /**
     * Demultiplexes inbound characteristic value changes of one GattSession.
     *
     * Each event is delivered to the optional session wide sink first,
     * then to all per uuid GattCharListener matching the characteristic.
     *
     * Listener exceptions are caught and logged.
     */
    class NotificationRouter {
        public:
            typedef jau::nsize_t size_type;

            struct CharListenerPair {
                /** The actual listener */
                GattCharListenerRef listener;
                /** Canonical uuid key of the characteristic, see to_uuid_key() */
                std::string uuid_key;

                bool match(const GattChar& characteristic) const noexcept {
                    return uuid_key == characteristic.getUUIDKey();
                }
            };
            typedef jau::cow_darray<CharListenerPair> charListenerList_t;

        private:
            static charListenerList_t::equal_comparator charListenerRefEqComparator;
            static charListenerList_t::equal_comparator charListenerUUIDEqComparator;

            const GattEnv & env;
            mutable std::mutex mtx_sink;
            GattCharListenerRef sink;
            charListenerList_t charListenerList;

        public:
            NotificationRouter() noexcept;

            NotificationRouter(const NotificationRouter&) = delete;
            void operator=(const NotificationRouter&) = delete;

            /** Registers the session wide sink receiving all events, replacing a previous one. */
            void setSink(const GattCharListenerRef& l) noexcept;

            void clearSink() noexcept;

            bool hasSink() const noexcept;

            /**
             * Add the given listener for the given characteristic uuid key if not already present.
             * @return true if newly added
             */
            bool addCharListener(const std::string& uuid_key, const GattCharListenerRef& l) noexcept;

            bool addCharListener(const jau::uuid_t& uuid, const GattCharListenerRef& l) noexcept {
                return addCharListener(to_uuid_key(uuid), l);
            }

            /**
             * Remove the given listener for the given characteristic uuid key.
             * @return true if removed
             */
            bool removeCharListener(const std::string& uuid_key, const GattCharListenerRef& l) noexcept;

            /**
             * Remove all listener for the given characteristic uuid key.
             * @return number of removed listener
             */
            size_type removeAllCharListener(const std::string& uuid_key) noexcept;

            size_type removeAllCharListener(const jau::uuid_t& uuid) noexcept {
                return removeAllCharListener(to_uuid_key(uuid));
            }

            /**
             * Remove all per uuid listener, leaving the session wide sink untouched.
             * @return number of removed listener
             */
            size_type clearCharListener() noexcept;

            size_type getCharListenerCount() const noexcept { return charListenerList.size(); }

            /**
             * Dispatch the given characteristic value change.
             * @return number of receiver the event has been delivered to
             */
            size_type dispatch(const GattCharRef& characteristic, const jau::TROOctets& value, const uint64_t timestamp) noexcept;
    };

    /**@}*/

} // namespace gattlink

#endif /* GATTLINK_NOTIFICATION_ROUTER_HPP_ */
