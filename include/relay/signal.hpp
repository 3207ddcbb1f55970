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

#ifndef RELAY_SIGNAL_HPP
#define RELAY_SIGNAL_HPP

#ifndef RELAY_ALWAYS_INLINE
#   if defined(_MSC_VER)
#       define RELAY_ALWAYS_INLINE [[msvc::forceinline]]
#   else
#       define RELAY_ALWAYS_INLINE [[gnu::always_inline]]
#   endif
#endif // !RELAY_ALWAYS_INLINE

#include "relay/listener.hpp"
#include <algorithm>
#include <atomic>
#include <concepts>
#include <cstdint>
#include <exception>
#include <functional>
#include <iterator>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace relay {
    class signal_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class slot_not_found : public signal_error {
    public:
        using signal_error::signal_error;
    };

    // Thrown by a target to end the current dispatch early. Not an error:
    // `call` swallows it and reports call_status::stopped.
    struct stop_dispatch : std::exception {
        const char* what() const noexcept override {
            return "relay: dispatch stopped by slot";
        }
    };

    enum class call_status {
        done,
        stopped
    };

    template <listener_value Sender, std::totally_ordered Priority>
        requires std::copyable<Priority>
    class signal;

    namespace detail {
        template <typename Sender>
        struct target_base {
            target_base()          = default;
            virtual ~target_base() = default;

            virtual void Invoke(const listener<Sender>& sender) = 0;
        };

        // Null function pointers, member pointers and empty std::function
        // objects satisfy slot_target but cannot be invoked.
        template <typename Fn>
        bool IsNullTarget(const Fn& fn) {
            if constexpr (std::is_pointer_v<Fn> || std::is_member_pointer_v<Fn>) {
                return fn == nullptr;
            }
            else if constexpr (!std::is_class_v<Fn>) {
                return false;
            }
            else if constexpr (requires { { fn == nullptr } -> std::convertible_to<bool>; }) {
                return fn == nullptr;
            }
            else {
                return false;
            }
        }

        template <typename Sender, typename Fn>
        struct target_impl : target_base<Sender> {
            template <typename F>
            target_impl(F&& fn) : fn_(std::forward<F>(fn)) {}
            ~target_impl() = default;

            void Invoke(const listener<Sender>& sender) override {
                std::invoke(fn_, sender);
            }

            Fn fn_;
        };
    }

    template <typename F, typename Sender>
    concept slot_target = std::move_constructible<std::decay_t<F>>
        && std::invocable<std::decay_t<F>&, const listener<Sender>&>;

    // Shared handle to a type-erased callable. Two slots share a target when
    // they hold the same handle; lookups compare handles, never callables.
    template <typename Sender>
    using target = std::shared_ptr<detail::target_base<Sender>>;

    template <listener_value Sender, slot_target<Sender> F>
    target<Sender> make_target(F&& fn) {
        if (detail::IsNullTarget<std::decay_t<F>>(fn)) {
            throw signal_error("relay: cannot make a target from a null callable");
        }
        return std::make_shared<detail::target_impl<Sender, std::decay_t<F>>>(std::forward<F>(fn));
    }

    // Immutable registration record, created by signal::add.
    template <listener_value Sender, std::totally_ordered Priority = int>
        requires std::copyable<Priority>
    class slot {
    public:
        using id_type       = std::uint64_t;
        using priority_type = Priority;
        using listener_type = listener<Sender>;
        using target_type   = ::relay::target<Sender>;

        id_type              id()       const noexcept { return id_; }
        const Priority&      priority() const noexcept { return priority_; }
        const listener_type& filter()   const noexcept { return filter_; }
        const target_type&   target()   const noexcept { return target_; }

        RELAY_ALWAYS_INLINE void operator()(const listener_type& sender) const {
            target_->Invoke(sender);
        }

        // Slots from different signals never compare equal, even with the same id.
        friend bool operator==(const slot& lhs, const slot& rhs) {
            return lhs.owner_ == rhs.owner_ && lhs.id_ == rhs.id_ && lhs.priority_ == rhs.priority_;
        }

        // (priority, id) ascending; the owning signal applies its own direction.
        friend bool operator<(const slot& lhs, const slot& rhs) {
            if (lhs.priority_ < rhs.priority_) {
                return true;
            }
            if (rhs.priority_ < lhs.priority_) {
                return false;
            }
            return lhs.id_ < rhs.id_;
        }

    private:
        template <listener_value S, std::totally_ordered P>
            requires std::copyable<P>
        friend class signal;

        slot(const void* owner, id_type id, Priority priority, listener_type filter, target_type target)
            : owner_(owner), id_(id), priority_(std::move(priority)), filter_(std::move(filter)), target_(std::move(target)) {}

        const void*   owner_;
        id_type       id_;
        Priority      priority_;
        listener_type filter_;
        target_type   target_;
    };

    // Named, ordered, thread-safe collection of slots for one event.
    //
    // Slots run by priority (ascending, or descending when `reverse`), ties by
    // insertion order. Writers serialize on a mutex and publish a new sorted
    // vector; `call` and the lookups read the published vector without locking,
    // so a dispatch always iterates the snapshot taken when it started.
    //
    // add/remove cost O(n): binary search for the position, then the published
    // vector is copied around the splice. Dispatch is the hot path.
    template <listener_value Sender, std::totally_ordered Priority = int>
        requires std::copyable<Priority>
    class signal {
    public:
        using slot_type     = slot<Sender, Priority>;
        using id_type       = typename slot_type::id_type;
        using priority_type = Priority;
        using listener_type = listener<Sender>;
        using target_type   = ::relay::target<Sender>;
        using slot_list     = std::vector<slot_type>;

        static inline const Priority default_priority{};

        explicit signal(std::string name = "<anonymous>", bool reverse = false)
            : name_(std::move(name)), reverse_(reverse), slots_(std::make_shared<const slot_list>()) {}

        signal(const signal&)            = delete;
        signal(signal&&)                 = delete;
        signal& operator=(const signal&) = delete;
        signal& operator=(signal&&)      = delete;
        ~signal()                        = default;

        const std::string& name()    const noexcept { return name_; }
        bool               reverse() const noexcept { return reverse_; }

        template <slot_target<Sender> F>
        slot_type add(F&& fn, Priority priority = default_priority, listener_type filter = any) {
            return Insert(make_target<Sender>(std::forward<F>(fn)), std::move(priority), std::move(filter));
        }

        slot_type add(target_type target, Priority priority = default_priority, listener_type filter = any) {
            if (!target) {
                throw signal_error("relay: cannot add a null target to signal '" + name_ + "'");
            }
            return Insert(std::move(target), std::move(priority), std::move(filter));
        }

        // A slot returned by another signal is never found here.
        bool remove(const slot_type& slot) {
            if (slot.owner_ != this) {
                return false;
            }
            return remove(slot.id());
        }

        bool remove(id_type id) {
            return RemoveIf([id](const slot_type& s) { return s.id() == id; }) != 0;
        }

        // Returns how many of the given slots were still registered.
        template <std::ranges::input_range R>
            requires std::same_as<std::ranges::range_value_t<R>, slot_type>
        std::size_t remove(const R& slots) {
            std::vector<id_type> ids;
            for (const slot_type& s : slots) {
                if (s.owner_ == this) {
                    ids.push_back(s.id());
                }
            }
            std::sort(ids.begin(), ids.end());
            return RemoveIf([&ids](const slot_type& s) {
                return std::binary_search(ids.begin(), ids.end(), s.id());
            });
        }

        std::size_t remove_target(const target_type& target) {
            return RemoveIf([&target](const slot_type& s) { return s.target() == target; });
        }

        void clear() {
            std::lock_guard<std::mutex> lock(write_mutex_);
            slots_.store(std::make_shared<const slot_list>(), std::memory_order_release);
        }

        // Invokes every slot whose filter matches `sender`, in dispatch order.
        // Exceptions other than stop_dispatch propagate and end the dispatch.
        call_status call(const listener_type& sender) {
            auto current = Snapshot();
            try {
                for (const slot_type& s : *current) {
                    if (matches(s.filter(), sender)) {
                        s(sender);
                    }
                }
            }
            catch (const stop_dispatch&) {
                return call_status::stopped;
            }
            return call_status::done;
        }

        RELAY_ALWAYS_INLINE call_status operator()(const listener_type& sender) {
            return call(sender);
        }

        std::optional<slot_type> find_by_identity(id_type id) const {
            auto current = Snapshot();
            auto it = std::find_if(current->begin(), current->end(),
                [id](const slot_type& s) { return s.id() == id; });
            if (it == current->end()) {
                return std::nullopt;
            }
            return *it;
        }

        slot_type at(id_type id) const {
            auto found = find_by_identity(id);
            if (!found) {
                throw slot_not_found("relay: slot " + std::to_string(id) + " not found in signal '" + name_ + "'");
            }
            return std::move(*found);
        }

        slot_list find_by_target(const target_type& target) const {
            return Select([&target](const slot_type& s) { return s.target() == target; });
        }

        // Exact match: find_by_listener(any) only returns slots registered with `any`.
        slot_list find_by_listener(const listener_type& filter) const {
            return Select([&filter](const slot_type& s) { return s.filter() == filter; });
        }

        bool contains(const slot_type& slot) const {
            auto current = Snapshot();
            return std::find(current->begin(), current->end(), slot) != current->end();
        }

        std::size_t size() const {
            return Snapshot()->size();
        }

        bool empty() const {
            return Snapshot()->empty();
        }

        slot_list slots() const {
            return *Snapshot();
        }

        // A priority that runs before every registered slot.
        Priority priority_higher(Priority boost = 1) const
            requires std::is_arithmetic_v<Priority> {
            return priority_higher(*Snapshot(), boost);
        }

        Priority priority_higher(const slot_type& slot, Priority boost = 1) const
            requires std::is_arithmetic_v<Priority> {
            return reverse_ ? Raise(slot.priority(), boost) : Lower(slot.priority(), boost);
        }

        template <std::ranges::input_range R>
            requires (std::is_arithmetic_v<Priority> && std::same_as<std::ranges::range_value_t<R>, slot_type>)
        Priority priority_higher(const R& slots, Priority boost = 1) const {
            if (reverse_) {
                return Raise(Extreme(slots, true), boost);
            }
            return Lower(Extreme(slots, false), boost);
        }

        // A priority that runs after every registered slot.
        Priority priority_lower(Priority boost = 1) const
            requires std::is_arithmetic_v<Priority> {
            return priority_lower(*Snapshot(), boost);
        }

        Priority priority_lower(const slot_type& slot, Priority boost = 1) const
            requires std::is_arithmetic_v<Priority> {
            return reverse_ ? Lower(slot.priority(), boost) : Raise(slot.priority(), boost);
        }

        template <std::ranges::input_range R>
            requires (std::is_arithmetic_v<Priority> && std::same_as<std::ranges::range_value_t<R>, slot_type>)
        Priority priority_lower(const R& slots, Priority boost = 1) const {
            if (reverse_) {
                return Lower(Extreme(slots, false), boost);
            }
            return Raise(Extreme(slots, true), boost);
        }

    private:
        RELAY_ALWAYS_INLINE std::shared_ptr<const slot_list> Snapshot() const noexcept {
            return slots_.load(std::memory_order_acquire);
        }

        bool Before(const slot_type& lhs, const slot_type& rhs) const {
            if (lhs.priority() < rhs.priority()) {
                return !reverse_;
            }
            if (rhs.priority() < lhs.priority()) {
                return reverse_;
            }
            return lhs.id() < rhs.id();
        }

        slot_type Insert(target_type target, Priority priority, listener_type filter) {
            std::lock_guard<std::mutex> lock(write_mutex_);

            slot_type new_slot(this, next_id_, std::move(priority), std::move(filter), std::move(target));

            auto current = Snapshot();
            auto pos = std::upper_bound(current->begin(), current->end(), new_slot,
                [this](const slot_type& lhs, const slot_type& rhs) { return Before(lhs, rhs); });

            auto updated = std::make_shared<slot_list>();
            updated->reserve(current->size() + 1);
            updated->insert(updated->end(), current->begin(), pos);
            updated->push_back(new_slot);
            updated->insert(updated->end(), pos, current->end());

            slots_.store(std::move(updated), std::memory_order_release);
            ++next_id_;

            return new_slot;
        }

        template <typename Pred>
        std::size_t RemoveIf(Pred&& pred) {
            std::lock_guard<std::mutex> lock(write_mutex_);

            auto current = Snapshot();
            auto removed = static_cast<std::size_t>(std::count_if(current->begin(), current->end(), pred));
            if (removed == 0) {
                return 0;
            }

            auto updated = std::make_shared<slot_list>();
            updated->reserve(current->size() - removed);
            std::copy_if(current->begin(), current->end(), std::back_inserter(*updated),
                [&pred](const slot_type& s) { return !pred(s); });

            slots_.store(std::move(updated), std::memory_order_release);
            return removed;
        }

        template <typename Pred>
        slot_list Select(Pred&& pred) const {
            auto current = Snapshot();
            slot_list result;
            std::copy_if(current->begin(), current->end(), std::back_inserter(result), pred);
            return result;
        }

        // Integral priorities saturate at their limits instead of overflowing.
        static Priority Raise(Priority base, Priority boost) {
            if constexpr (std::is_integral_v<Priority>) {
                using limits = std::numeric_limits<Priority>;
                if (boost > 0 && base > limits::max() - boost) {
                    return limits::max();
                }
                if (boost < 0 && base < limits::min() - boost) {
                    return limits::min();
                }
            }
            return static_cast<Priority>(base + boost);
        }

        static Priority Lower(Priority base, Priority boost) {
            if constexpr (std::is_integral_v<Priority>) {
                using limits = std::numeric_limits<Priority>;
                if (boost > 0 && base < limits::min() + boost) {
                    return limits::min();
                }
                if (boost < 0 && base > limits::max() + boost) {
                    return limits::max();
                }
            }
            return static_cast<Priority>(base - boost);
        }

        template <typename R>
        Priority Extreme(const R& slots, bool largest) const {
            auto first = std::ranges::begin(slots);
            auto last  = std::ranges::end(slots);
            if (first == last) {
                return default_priority;
            }
            Priority result = (*first).priority();
            for (++first; first != last; ++first) {
                const Priority& p = (*first).priority();
                if (largest ? result < p : p < result) {
                    result = p;
                }
            }
            return result;
        }

        std::string name_;
        bool        reverse_;

        std::mutex write_mutex_;
        id_type    next_id_ = 0;

        std::atomic<std::shared_ptr<const slot_list>> slots_;
    };
}

#endif // !RELAY_SIGNAL_HPP
