#pragma once

#include <mirror-core/allocation_cache.hh>
#include <mirror-core/assert.hh>
#include <mirror-core/fwd.hh>
#include <mirror-core/impl/object_lifetime_util.hh>
#include <mirror-core/mirrored_buffer.hh>
#include <mirror-core/optional.hh>
#include <mirror-core/result.hh>
#include <mirror-core/utility.hh>

#include <initializer_list>
#include <limits>
#include <type_traits>

/// Double-ended queue over a mirrored buffer whose live elements are always one contiguous range.
///
/// The deque owns a mirrored_buffer<T> of 2 * capacity() slots where slot i and slot i + capacity()
/// share physical memory. The live elements occupy the slots [head, tail) with
///
///     0 <= head <= tail <= 2 * capacity()      tail - head == size() <= capacity()
///
/// Whenever the live window would run off either end of the buffer, head and tail are both shifted by
/// capacity() into the other half. The elements do not move, the same memory is just addressed through
/// the other mirror. As a result data(), begin() and end() always describe a flat range of size() elements,
/// no matter how often the queue has wrapped around:
///
///     auto q = mc::ring_deque<int>();
///     q.push_back(1);
///     q.push_front(0);
///     process(q.data(), q.size()); // [0, 1], contiguous
///
/// Growth doubles the capacity (the first growth goes to 4). Actual capacities are usually larger
/// because mirrored regions are rounded up to the OS allocation granularity (typically a page).
///
/// Allocation:
///   Buffers come from the allocation_cache given at construction (nullptr = mc::thread_allocation_cache()).
///   Growth that fails to allocate is fatal ("mirrored allocation failed").
///   try_reserve() reports mirror_error::allocation_failure instead and leaves the deque unchanged.
///
/// Element types:
///   T must satisfy mc::is_mirror_relocatable<T> (checked statically). Elements are constructed in one half and
///   may later be moved from or destroyed through the other, so T must not store its own address.
///   Trivially copyable types always qualify, others opt in (see mirrored_buffer.hh).
///
/// Preconditions on indices and ranges are checked with MC_ASSERT_ALWAYS before anything is modified.
///
/// Any reallocation (growth, reserve, shrink_to_fit) invalidates pointers, references, and iterators.
/// Pushes without growth keep references valid, but data() may change when the window switches halves.
template <class T>
struct mc::ring_deque
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T>, "ring_deque requires move constructible elements");
    static_assert(mc::is_mirror_relocatable<T>, "ring_deque elements are accessed through both mirror halves, T must "
                                                "not depend on its own address (see mc::is_mirror_relocatable)");

    struct drain_range;

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T& operator[](isize i)
    {
        MC_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _buffer.get_unchecked(_head + i);
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        MC_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _buffer.get_unchecked(_head + i);
    }

    /// Returns a pointer to the element at index i, or nullptr if i is out of range.
    [[nodiscard]] T* get(isize i) { return 0 <= i && i < size() ? data() + i : nullptr; }
    [[nodiscard]] T const* get(isize i) const { return 0 <= i && i < size() ? data() + i : nullptr; }

    /// Returns a reference to the first element.
    /// Precondition: !empty(), also checked in release builds. See try_front for a non-asserting version.
    [[nodiscard]] T& front()
    {
        MC_ASSERT_ALWAYS(!empty(), "front() on empty deque");
        return *data();
    }
    [[nodiscard]] T const& front() const
    {
        MC_ASSERT_ALWAYS(!empty(), "front() on empty deque");
        return *data();
    }

    /// Returns a reference to the last element.
    /// Precondition: !empty(), also checked in release builds. See try_back for a non-asserting version.
    [[nodiscard]] T& back()
    {
        MC_ASSERT_ALWAYS(!empty(), "back() on empty deque");
        return data()[size() - 1];
    }
    [[nodiscard]] T const& back() const
    {
        MC_ASSERT_ALWAYS(!empty(), "back() on empty deque");
        return data()[size() - 1];
    }

    /// Pointer to the first element, or nullptr if the deque is empty.
    [[nodiscard]] T* try_front() { return get(0); }
    [[nodiscard]] T const* try_front() const { return get(0); }

    /// Pointer to the last element, or nullptr if the deque is empty.
    [[nodiscard]] T* try_back() { return get(size() - 1); }
    [[nodiscard]] T const* try_back() const { return get(size() - 1); }

    /// Pointer to the first live element. [data(), data() + size()) is always contiguous.
    /// nullptr if the deque never allocated.
    [[nodiscard]] T* data() { return _buffer.data() + _head; }
    [[nodiscard]] T const* data() const { return _buffer.data() + _head; }

    // iterators
public:
    [[nodiscard]] T* begin() { return data(); }
    [[nodiscard]] T* end() { return data() + size(); }
    [[nodiscard]] T const* begin() const { return data(); }
    [[nodiscard]] T const* end() const { return data() + size(); }

    // queries
public:
    /// Number of live elements.
    [[nodiscard]] isize size() const { return _tail - _head; }
    [[nodiscard]] bool empty() const { return _tail == _head; }

    /// Total size in bytes of all live elements.
    [[nodiscard]] isize size_bytes() const { return size() * isize(sizeof(T)); }

    /// Number of elements the deque can hold without reallocating.
    [[nodiscard]] isize capacity() const { return _buffer.size() / 2; }

    /// size() == capacity(), the next push reallocates.
    [[nodiscard]] bool is_full() const { return size() == capacity(); }

    /// The cache buffers are taken from and returned to (nullptr = the calling thread's cache).
    [[nodiscard]] allocation_cache* cache() const { return _buffer.cache(); }

    // factories
public:
    /// Empty deque with room for at least `capacity` elements.
    /// capacity == 0 does not allocate but still binds the deque to `cache`.
    [[nodiscard]] static ring_deque create_with_capacity(isize capacity, allocation_cache* cache = nullptr)
    {
        MC_ASSERT_ALWAYS(capacity >= 0, "capacity must be non-negative");
        MC_ASSERT_ALWAYS(capacity <= std::numeric_limits<isize>::max() / 2, "capacity overflow");
        ring_deque d;
        d._buffer = mirrored_buffer<T>::create_uninitialized(2 * capacity, cache);
        return d;
    }

    /// Deque holding copies of [first, last), exactly sized (up to granularity rounding).
    [[nodiscard]] static ring_deque create_copy_of(T const* first, T const* last, allocation_cache* cache = nullptr)
    {
        MC_ASSERT_ALWAYS(first <= last, "invalid source range");
        auto d = ring_deque::create_with_capacity(last - first, cache);
        d.impl_append_copies(first, last);
        return d;
    }

    // construction
public:
    /// Empty deque bound to the thread cache. Does not allocate.
    ring_deque() = default;

    ring_deque(std::initializer_list<T> values) : ring_deque(create_copy_of(values.begin(), values.end())) {}

    ~ring_deque() { impl::destroy_objects_in_reverse(data(), end()); }

    /// Moves the buffer, rhs is left empty but keeps its cache.
    ring_deque(ring_deque&& rhs) noexcept
      : _buffer(mc::move(rhs._buffer)), _head(mc::exchange(rhs._head, 0)), _tail(mc::exchange(rhs._tail, 0))
    {
    }
    ring_deque& operator=(ring_deque&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl::destroy_objects_in_reverse(data(), end());
            _buffer = mc::move(rhs._buffer);
            _head = mc::exchange(rhs._head, 0);
            _tail = mc::exchange(rhs._tail, 0);
        }
        return *this;
    }

    // deep copy semantics, the copy uses the source's cache
    ring_deque(ring_deque const& rhs) : ring_deque(create_copy_of(rhs.begin(), rhs.end(), rhs.cache())) {}

    // keeps the cache of the lhs
    ring_deque& operator=(ring_deque const& rhs)
    {
        if (this != &rhs)
            *this = create_copy_of(rhs.begin(), rhs.end(), cache());
        return *this;
    }

    // appends
public:
    /// Constructs a new element at the back, growing if the deque is full.
    /// Arguments may reference elements of this deque, also when it grows.
    /// Amortized O(1).
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        static_assert(
            requires { T(mc::forward<Args>(args)...); }, "emplace_back: T is not constructible from "
                                                         "the provided argument types");

        if (is_full()) [[unlikely]]
        {
            // construct before the old buffer (and whatever args point into) goes away
            T value(mc::forward<Args>(args)...);
            impl_grow();
            return impl_emplace_back_stable(mc::move(value));
        }

        return impl_emplace_back_stable(mc::forward<Args>(args)...);
    }

    T& push_back(T const& value) { return emplace_back(value); }
    T& push_back(T&& value) { return emplace_back(mc::move(value)); }

    /// Constructs a new element at the front, growing if the deque is full.
    /// Same guarantees as emplace_back.
    template <class... Args>
    T& emplace_front(Args&&... args)
    {
        static_assert(
            requires { T(mc::forward<Args>(args)...); }, "emplace_front: T is not constructible from "
                                                         "the provided argument types");

        if (is_full()) [[unlikely]]
        {
            T value(mc::forward<Args>(args)...);
            impl_grow();
            return impl_emplace_front_stable(mc::move(value));
        }

        return impl_emplace_front_stable(mc::forward<Args>(args)...);
    }

    T& push_front(T const& value) { return emplace_front(value); }
    T& push_front(T&& value) { return emplace_front(mc::move(value)); }

    /// Constructs a new element so that it ends up at index idx, shifting the shorter side of the deque
    /// by one slot to make room. Returns a reference to the new element.
    /// Precondition: 0 <= idx <= size().
    /// O(min(idx, size() - idx)).
    template <class... Args>
    T& emplace_at(isize idx, Args&&... args)
    {
        MC_ASSERT_ALWAYS(0 <= idx && idx <= size(), "insert index out of bounds");

        if (idx == size())
            return emplace_back(mc::forward<Args>(args)...);
        if (idx == 0)
            return emplace_front(mc::forward<Args>(args)...);

        // args may reference elements that are about to be shifted
        T value(mc::forward<Args>(args)...);

        if (is_full()) [[unlikely]]
            impl_grow();

        auto const n = size();
        if (idx < n - idx)
        {
            impl_make_room_front();
            auto const p = _buffer.data() + _head;
            impl::relocate_objects_to(p - 1, p, p + idx);
            --_head;
        }
        else
        {
            impl_make_room_back();
            auto const p = _buffer.data() + _head;
            impl::relocate_objects_to(p + idx + 1, p + idx, p + n);
            ++_tail;
        }

        return *new (mc::placement_new, _buffer.data() + _head + idx) T(mc::move(value));
    }

    T& insert_at(isize idx, T const& value) { return emplace_at(idx, value); }
    T& insert_at(isize idx, T&& value) { return emplace_at(idx, mc::move(value)); }

    /// Appends copies of [first, last), reserving once.
    /// The source range must not point into this deque.
    void extend(T const* first, T const* last)
    {
        MC_ASSERT_ALWAYS(first <= last, "invalid source range");
        impl_reserve_capacity(size() + (last - first));
        impl_append_copies(first, last);
    }
    void extend(std::initializer_list<T> values) { extend(values.begin(), values.end()); }

    // removals
public:
    /// Removes and returns the last element, or nullopt if the deque is empty.
    /// O(1).
    [[nodiscard]] mc::optional<T> pop_back()
    {
        if (empty())
            return mc::nullopt;

        auto const p = _buffer.data() + _tail - 1;
        mc::optional<T> value(mc::move(*p));
        p->~T();
        --_tail;
        return value;
    }

    /// Removes and returns the first element, or nullopt if the deque is empty.
    /// O(1).
    [[nodiscard]] mc::optional<T> pop_front()
    {
        if (empty())
            return mc::nullopt;

        auto const p = _buffer.data() + _head;
        mc::optional<T> value(mc::move(*p));
        p->~T();
        ++_head;
        return value;
    }

    /// Removes and returns the element at index idx, closing the gap from the shorter side.
    /// Precondition: 0 <= idx < size().
    /// O(min(idx, size() - idx)).
    /// NOTE: Prefer remove_at() if you don't need the return value (avoids an extra move).
    [[nodiscard("use remove_at() if you don't need the return value")]] T pop_at(isize idx)
    {
        MC_ASSERT_ALWAYS(0 <= idx && idx < size(), "remove index out of bounds");

        auto const p = _buffer.data() + _head + idx;
        T value = mc::move(*p);
        p->~T();
        impl_close_gap_at(idx);
        return value;
    }

    /// Removes the element at index idx, closing the gap from the shorter side.
    /// Precondition: 0 <= idx < size().
    void remove_at(isize idx)
    {
        MC_ASSERT_ALWAYS(0 <= idx && idx < size(), "remove index out of bounds");

        (_buffer.data() + _head + idx)->~T();
        impl_close_gap_at(idx);
    }

    /// Removes and returns the element at idx, replacing it with the last element.
    /// Does not preserve order. Returns nullopt if the deque is empty.
    /// Precondition: idx < size() (if not empty).
    /// O(1).
    [[nodiscard]] mc::optional<T> swap_remove_back(isize idx)
    {
        if (empty())
            return mc::nullopt;
        MC_ASSERT_ALWAYS(0 <= idx && idx < size(), "swap_remove_back index out of bounds");

        auto const p = data() + idx;
        auto const p_last = data() + size() - 1;
        mc::optional<T> value(mc::move(*p));
        if (p != p_last)
            *p = mc::move(*p_last);
        p_last->~T();
        --_tail;
        return value;
    }

    /// Removes and returns the element at idx, replacing it with the first element.
    /// Does not preserve order. Returns nullopt if the deque is empty.
    /// Precondition: idx < size() (if not empty).
    /// O(1).
    [[nodiscard]] mc::optional<T> swap_remove_front(isize idx)
    {
        if (empty())
            return mc::nullopt;
        MC_ASSERT_ALWAYS(0 <= idx && idx < size(), "swap_remove_front index out of bounds");

        auto const p = data() + idx;
        auto const p_first = data();
        mc::optional<T> value(mc::move(*p));
        if (p != p_first)
            *p = mc::move(*p_first);
        p_first->~T();
        ++_head;
        return value;
    }

    /// Destroys the elements from the back until size() == n. No-op if n >= size().
    /// Only moves the tail, capacity is unchanged.
    void truncate(isize n)
    {
        MC_ASSERT_ALWAYS(n >= 0, "truncate length must be non-negative");
        if (n >= size())
            return;

        impl::destroy_objects_in_reverse(data() + n, end());
        _tail = _head + n;
    }

    /// Destroys all elements, capacity is unchanged.
    void clear() { truncate(0); }

    /// Keeps only the elements for which pred(element) returns true, preserving their order.
    template <class Pred>
    void retain(Pred&& pred)
    {
        auto const p = data();
        auto const n = size();
        isize kept = 0;
        for (isize i = 0; i < n; ++i)
        {
            if (!pred(static_cast<T const&>(p[i])))
                continue;
            if (kept != i)
                p[kept] = mc::move(p[i]);
            ++kept;
        }
        truncate(kept);
    }

    /// Removes the elements [start, end) and returns a range yielding them by move.
    /// The deque is shortened to `start` right away and restored to its previous contents minus [start, end)
    /// when the returned range is destroyed, however many elements were taken out of it.
    /// The deque must not be used while the range is alive.
    /// Precondition: 0 <= start <= end <= size().
    ///
    /// Usage:
    ///   auto d = q.drain(2, 5);
    ///   while (d.remaining() > 0)
    ///       consume(d.next().value());
    [[nodiscard]] drain_range drain(isize start, isize end)
    {
        MC_ASSERT_ALWAYS(start <= end, "drain range start must not exceed end");
        MC_ASSERT_ALWAYS(0 <= start && end <= size(), "drain range out of bounds");
        return drain_range(*this, start, end);
    }

    /// Removes all elements, see drain(start, end).
    [[nodiscard]] drain_range drain() { return drain(0, size()); }

    /// Moves the elements [at, size()) into a new deque (same cache) and keeps [0, at).
    /// The capacity of this deque is unchanged.
    /// Precondition: 0 <= at <= size().
    [[nodiscard]] ring_deque split_off(isize at)
    {
        MC_ASSERT_ALWAYS(0 <= at && at <= size(), "split_off index out of bounds");

        auto const n = size() - at;
        auto other = ring_deque::create_with_capacity(n, cache());
        auto const src = data() + at;
        auto obj_end = other._buffer.data();
        impl::move_create_objects_to(obj_end, src, src + n);
        other._tail = n;

        impl::destroy_objects_in_reverse(src, src + n);
        _tail = _head + at;
        return other;
    }

    // capacity
public:
    /// Reallocates to capacity() + additional if that is larger than capacity(), no-op otherwise.
    /// Allocation failure is fatal, see try_reserve for a recoverable version.
    void reserve(isize additional)
    {
        MC_ASSERT_ALWAYS(additional >= 0, "reserve amount must be non-negative");
        MC_ASSERT_ALWAYS(additional <= std::numeric_limits<isize>::max() / 2 - capacity(), "capacity overflow");
        impl_reserve_capacity(capacity() + additional);
    }

    /// Like reserve, but reports mirror_error::allocation_failure instead of aborting.
    /// On failure the deque is unchanged. Returns the new capacity.
    [[nodiscard]] mc::result<isize, mc::mirror_error> try_reserve(isize additional)
    {
        MC_ASSERT_ALWAYS(additional >= 0, "reserve amount must be non-negative");
        MC_ASSERT_ALWAYS(additional <= std::numeric_limits<isize>::max() / 2 - capacity(), "capacity overflow");
        if (additional == 0)
            return capacity();
        return impl_try_reallocate(capacity() + additional);
    }

    /// Reallocates to the smallest buffer that holds size() elements.
    /// No-op if the deque is empty or if the smaller buffer would have the same byte size.
    /// Never increases capacity() and never changes size().
    void shrink_to_fit()
    {
        if (empty())
            return;

        auto const granularity = _buffer.allocation_granularity();
        if (mirrored_buffer<T>::alloc_size_bytes_for(2 * size(), granularity) >= _buffer.size_bytes())
            return;

        impl_reallocate(size());
    }

    /// Truncates to n elements or appends copies of value until size() == n.
    void resize(isize n, T const& value)
    {
        static_assert(std::is_copy_constructible_v<T>, "resize requires copy constructible elements");
        MC_ASSERT_ALWAYS(n >= 0, "resize length must be non-negative");

        if (n <= size())
        {
            truncate(n);
            return;
        }

        // copy first, value may live in this deque
        T const fill_value = value;
        impl_reserve_capacity(n);

        auto const count = n - size();
        impl_make_room_back_for(count);
        auto const base = _buffer.data();
        auto obj_end = base + _tail;
        MC_DEFER { _tail = obj_end - base; };
        impl::fill_create_objects_to(obj_end, count, fill_value);
    }

    // helper
private:
    template <class... Args>
    T& impl_emplace_back_stable(Args&&... args)
    {
        MC_ASSERT(!is_full(), "no room for emplace_back");
        impl_make_room_back();
        auto const p = new (mc::placement_new, _buffer.data() + _tail) T(mc::forward<Args>(args)...);
        ++_tail; // _after_ so exceptions in T(...) leave the state valid
        return *p;
    }

    template <class... Args>
    T& impl_emplace_front_stable(Args&&... args)
    {
        MC_ASSERT(!is_full(), "no room for emplace_front");
        impl_make_room_front();
        auto const p = new (mc::placement_new, _buffer.data() + _head - 1) T(mc::forward<Args>(args)...);
        --_head;
        return *p;
    }

    // switches the window into the lower half if the slot behind the last element is past the buffer
    // requires size() < capacity(), then head >= capacity() whenever tail == 2 * capacity()
    void impl_make_room_back() { impl_make_room_back_for(1); }

    void impl_make_room_back_for(isize count)
    {
        auto const cap = capacity();
        MC_ASSERT(size() + count <= cap, "not enough capacity");
        if (_tail + count > 2 * cap)
        {
            _head -= cap;
            _tail -= cap;
        }
    }

    // switches the window into the upper half if there is no slot in front of the first element
    void impl_make_room_front()
    {
        auto const cap = capacity();
        MC_ASSERT(size() < cap, "not enough capacity");
        if (_head == 0)
        {
            _head += cap;
            _tail += cap;
        }
    }

    // the slot at index idx was destroyed: shift the shorter side inward over it
    void impl_close_gap_at(isize idx)
    {
        auto const n = size();
        auto const p = _buffer.data() + _head;
        if (idx < n - idx - 1)
        {
            impl::relocate_objects_to(p + 1, p, p + idx);
            ++_head;
        }
        else
        {
            impl::relocate_objects_to(p + idx, p + idx + 1, p + n);
            --_tail;
        }
    }

    void impl_append_copies(T const* first, T const* last)
    {
        impl_make_room_back_for(last - first);
        auto const base = _buffer.data();
        auto obj_end = base + _tail;
        MC_DEFER { _tail = obj_end - base; };
        impl::copy_create_objects_to(obj_end, first, last);
    }

    MC_COLD_FUNC void impl_grow()
    {
        MC_ASSERT(is_full(), "only grow full deques");
        auto const cap = capacity();
        impl_reallocate(cap == 0 ? 4 : 2 * cap);
    }

    void impl_reserve_capacity(isize new_capacity)
    {
        if (new_capacity > capacity())
            impl_reallocate(new_capacity);
    }

    void impl_reallocate(isize new_capacity)
    {
        auto const res = impl_try_reallocate(new_capacity);
        MC_ASSERT_ALWAYS(res.has_value(), "mirrored allocation failed");
    }

    // moves all elements into a fresh buffer of at least new_capacity, starting at slot 0
    // the old buffer is released only after the new one exists
    mc::result<isize, mc::mirror_error> impl_try_reallocate(isize new_capacity)
    {
        MC_ASSERT(new_capacity >= size(), "new capacity too small for the live elements");
        MC_ASSERT_ALWAYS(new_capacity <= std::numeric_limits<isize>::max() / 2, "capacity overflow");

        auto new_buffer = mirrored_buffer<T>::try_create_uninitialized(2 * new_capacity, cache());
        if (new_buffer.has_error())
            return mc::failure(new_buffer.error());

        auto& b = new_buffer.value();
        auto const n = size();
        auto obj_end = b.data();
        impl::move_create_objects_to(obj_end, data(), end());
        impl::destroy_objects_in_reverse(data(), end());

        _buffer = mc::move(b);
        _head = 0;
        _tail = n;
        return capacity();
    }

    mirrored_buffer<T> _buffer;
    isize _head = 0;
    isize _tail = 0;
};

/// Elements removed by ring_deque::drain, yielded by move from either end.
/// Created by ring_deque::drain only. Neither copyable nor movable.
///
/// On destruction the elements that were not taken are destroyed and the elements behind the drained range
/// are moved forward to close the gap.
template <class T>
struct mc::ring_deque<T>::drain_range
{
    /// Moves out the next element from the front of the range, or returns nullopt if it is exhausted.
    [[nodiscard]] mc::optional<T> next()
    {
        if (_front == _back)
            return mc::nullopt;

        auto const p = _base + _front;
        mc::optional<T> value(mc::move(*p));
        p->~T();
        ++_front;
        return value;
    }

    /// Moves out the next element from the back of the range, or returns nullopt if it is exhausted.
    [[nodiscard]] mc::optional<T> next_back()
    {
        if (_front == _back)
            return mc::nullopt;

        --_back;
        auto const p = _base + _back;
        mc::optional<T> value(mc::move(*p));
        p->~T();
        return value;
    }

    /// Number of elements not yet taken.
    [[nodiscard]] isize remaining() const { return _back - _front; }

    ~drain_range()
    {
        impl::destroy_objects_in_reverse(_base + _front, _base + _back);
        impl::relocate_objects_to(_base + _start, _base + _end, _base + _size);
        _deque->_tail += _size - _end;
    }

    drain_range(drain_range const&) = delete;
    drain_range& operator=(drain_range const&) = delete;
    drain_range(drain_range&&) = delete;
    drain_range& operator=(drain_range&&) = delete;

private:
    drain_range(ring_deque& deque, isize start, isize end)
      : _deque(&deque), _base(deque.data()), _start(start), _end(end), _size(deque.size()), _front(start), _back(end)
    {
        // from here on the deque only owns [0, start), the rest is in our custody
        deque._tail = deque._head + start;
    }

    ring_deque* _deque;
    T* _base;
    isize _start;
    isize _end;
    isize _size;
    isize _front;
    isize _back;

    friend ring_deque;
};
