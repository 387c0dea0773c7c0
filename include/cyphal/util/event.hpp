#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>
#include <utility>

namespace cyphal {
    namespace util {

        // ─── Listener handle ─────────────────────────────────────────────────────────
        using ListenerToken = u32;
        inline constexpr ListenerToken INVALID_TOKEN = 0;

        // ─── Synchronous event dispatcher ────────────────────────────────────────────
        // Listeners run on the emitting thread, in subscription order. A listener may
        // subscribe, unsubscribe or emit again from inside its own call: new listeners
        // wait for the next emit and removals take effect immediately but are erased
        // only once the outermost emit returns.
        template <typename... Args> class Event {
            struct Listener {
                ListenerToken token = INVALID_TOKEN;
                std::function<void(Args...)> fn;
                bool removed = false;
            };

            dp::Vector<Listener> listeners_;
            ListenerToken next_token_ = 1;
            u32 depth_ = 0; // nested emit() calls in progress

          public:
            ListenerToken subscribe(std::function<void(Args...)> fn) {
                ListenerToken token = next_token_++;
                listeners_.push_back({token, std::move(fn), false});
                return token;
            }

            Event &operator+=(std::function<void(Args...)> fn) {
                subscribe(std::move(fn));
                return *this;
            }

            // False when the token is unknown or already removed
            bool unsubscribe(ListenerToken token) {
                for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
                    if (it->token != token || it->removed)
                        continue;
                    if (depth_ > 0) {
                        it->removed = true;
                    } else {
                        listeners_.erase(it);
                    }
                    return true;
                }
                return false;
            }

            void emit(Args... args) {
                // Indexing, not iterators: a listener may push_back into the vector
                usize n = listeners_.size();
                ++depth_;
                for (usize i = 0; i < n; ++i) {
                    if (!listeners_[i].removed && listeners_[i].fn) {
                        listeners_[i].fn(args...);
                    }
                }
                --depth_;

                if (depth_ == 0) {
                    for (auto it = listeners_.begin(); it != listeners_.end();) {
                        it = it->removed ? listeners_.erase(it) : it + 1;
                    }
                }
            }

            usize count() const noexcept {
                usize active = 0;
                for (const auto &l : listeners_) {
                    if (!l.removed)
                        ++active;
                }
                return active;
            }

            // Inside an emit the listeners are only marked, so the running loop stays valid
            void clear() {
                if (depth_ == 0) {
                    listeners_.clear();
                    return;
                }
                for (auto &l : listeners_) {
                    l.removed = true;
                }
            }
        };

    } // namespace util
    using namespace util;
} // namespace cyphal
