/*
MIT License

Copyright (c) 2026 dakingffo

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/
#if defined(_MSC_VER) && _MSC_VER > 1000 || defined(__clang__) || (defined(__GNUC__) && __GNUC__ >= 3)
#pragma once
#endif

#ifndef RELAY_REGISTRY_HPP
#define RELAY_REGISTRY_HPP

#include "relay/signal.hpp"
#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace relay {
    // Name -> signal map holding its signals weakly. Every `get` with the same
    // name returns the same signal for as long as some caller keeps it alive.
    template <listener_value Sender, std::totally_ordered Priority = int>
        requires std::copyable<Priority>
    class registry {
    public:
        using signal_type = signal<Sender, Priority>;

        registry()  = default;
        ~registry() = default;

        registry(const registry&)            = delete;
        registry& operator=(const registry&) = delete;

        // `reverse` only applies when the signal is created by this call.
        std::shared_ptr<signal_type> get(std::string_view name, bool reverse = false) {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = signals_.find(name);
            if (it != signals_.end()) {
                if (auto existing = it->second.lock()) {
                    return existing;
                }
            }

            std::erase_if(signals_, [](const auto& entry) { return entry.second.expired(); });

            auto created = std::make_shared<signal_type>(std::string(name), reverse);
            signals_.insert_or_assign(std::string(name), created);
            return created;
        }

        bool contains(std::string_view name) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = signals_.find(name);
            return it != signals_.end() && !it->second.expired();
        }

        // Number of live signals.
        std::size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<std::size_t>(std::count_if(signals_.begin(), signals_.end(),
                [](const auto& entry) { return !entry.second.expired(); }));
        }

        static registry& global() {
            static registry instance;
            return instance;
        }

    private:
        mutable std::mutex mutex_;
        std::map<std::string, std::weak_ptr<signal_type>, std::less<>> signals_;
    };

    // Process-wide shared signal for `name`, per (Sender, Priority) pair.
    template <listener_value Sender, std::totally_ordered Priority = int>
        requires std::copyable<Priority>
    std::shared_ptr<signal<Sender, Priority>> shared_signal(std::string_view name, bool reverse = false) {
        return registry<Sender, Priority>::global().get(name, reverse);
    }
}

#endif // !RELAY_REGISTRY_HPP
