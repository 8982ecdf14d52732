#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/impl/object_lifetime.hh>
#include <ordered-core/utility.hh>

#include <new>
#include <type_traits>


/// Owning, contiguous, growable storage for the elements of oc::collection<T>.
///
/// Memory layout:
///   [ live objects: _data[0, _size) | uninitialized: _data[_size, _capacity) ]
///
/// The buffer only knows about object lifetime and growth. Index semantics (negative indices,
/// clamping, snapshots) live in oc::collection, which calls into the primitives here with
/// already-resolved positions.
///
/// Insertions in the middle rebuild into a fresh allocation: the inserted objects are created
/// first, while the source is still intact, so inserting elements of this very buffer is fine.
template <class T>
struct oc::impl::element_buffer
{
    static_assert(std::is_object_v<T> && !std::is_const_v<T>, "element type must be a non-const object type");

    // queries
public:
    [[nodiscard]] T* data() { return _data; }
    [[nodiscard]] T const* data() const { return _data; }
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] isize capacity() const { return _capacity; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    // capacity
public:
    /// Ensures room for at least new_capacity elements without changing size().
    void reserve(isize new_capacity)
    {
        OC_ASSERT(new_capacity >= 0, "capacity must be non-negative");
        if (new_capacity <= _capacity)
            return;

        T* new_data = allocate(new_capacity);
        T* new_end = new_data;
        oc::impl::move_create_objects_to(new_end, _data, _data + _size);
        replace_storage(new_data, new_capacity);
    }

    // growth
public:
    /// Constructs one element at the end.
    /// args may reference elements of this buffer, they are read before any old storage is released.
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        if (_size < _capacity)
        {
            new (oc::placement_new, _data + _size) T(oc::forward<Args>(args)...);
            ++_size;
            return _data[_size - 1];
        }

        auto const new_capacity = grown_capacity(_size + 1);
        T* new_data = allocate(new_capacity);
        try
        {
            new (oc::placement_new, new_data + _size) T(oc::forward<Args>(args)...);
        }
        catch (...)
        {
            deallocate(new_data, new_capacity);
            throw;
        }

        T* new_end = new_data;
        oc::impl::move_create_objects_to(new_end, _data, _data + _size);
        replace_storage(new_data, new_capacity);
        ++_size;
        return _data[_size - 1];
    }

    /// Value-constructs count elements at the end.
    void append_defaulted(isize count)
    {
        insert_with(_size, count, [&](T*& cursor) { oc::impl::default_create_objects_to(cursor, count); });
    }

    /// Appends count copies of value.
    void append_filled(isize count, T const& value)
    {
        insert_with(_size, count, [&](T*& cursor) { oc::impl::fill_create_objects_to(cursor, count, value); });
    }

    /// Copy-inserts [first, last) before position pos.
    /// Precondition: 0 <= pos <= size()
    void insert_copies(isize pos, T const* first, T const* last)
    {
        insert_with(pos, last - first, [&](T*& cursor) { oc::impl::copy_create_objects_to(cursor, first, last); });
    }

    /// Move-inserts [first, last) before position pos.
    /// The source range must not belong to this buffer.
    void insert_moved(isize pos, T* first, T* last)
    {
        insert_with(pos, last - first, [&](T*& cursor) { oc::impl::move_create_objects_to(cursor, first, last); });
    }

    // shrinking
public:
    /// Removes count elements starting at pos, shifting the tail down.
    /// Precondition: 0 <= pos && 0 <= count && pos + count <= size()
    void erase(isize pos, isize count)
    {
        OC_ASSERT(0 <= pos && 0 <= count && pos + count <= _size, "erase range out of bounds");
        if (count == 0)
            return;

        for (isize i = pos; i + count < _size; ++i)
            _data[i] = oc::move(_data[i + count]);

        oc::impl::destroy_objects_in_reverse(_data + _size - count, _data + _size);
        _size -= count;
    }

    /// Moves the element at pos out and removes it.
    [[nodiscard]] T extract_at(isize pos)
    {
        OC_ASSERT(0 <= pos && pos < _size, "extract position out of bounds");
        T result = oc::move(_data[pos]);
        erase(pos, 1);
        return result;
    }

    /// Destroys all elements, keeps the capacity.
    void clear()
    {
        oc::impl::destroy_objects_in_reverse(_data, _data + _size);
        _size = 0;
    }

    // ctors / value semantics
public:
    element_buffer() = default;

    element_buffer(element_buffer const& rhs)
    {
        if (rhs._size == 0)
            return;

        _data = allocate(rhs._size);
        _capacity = rhs._size;
        T* end = _data;
        try
        {
            oc::impl::copy_create_objects_to(end, rhs._data, rhs._data + rhs._size);
        }
        catch (...)
        {
            oc::impl::destroy_objects_in_reverse(_data, end);
            deallocate(_data, _capacity);
            throw;
        }
        _size = rhs._size;
    }

    element_buffer(element_buffer&& rhs) noexcept : _data(rhs._data), _size(rhs._size), _capacity(rhs._capacity)
    {
        rhs._data = nullptr;
        rhs._size = 0;
        rhs._capacity = 0;
    }

    element_buffer& operator=(element_buffer const& rhs)
    {
        if (this != &rhs)
        {
            element_buffer copy(rhs);
            swap(copy);
        }
        return *this;
    }

    element_buffer& operator=(element_buffer&& rhs) noexcept
    {
        if (this != &rhs)
        {
            element_buffer moved(oc::move(rhs));
            swap(moved);
        }
        return *this;
    }

    ~element_buffer()
    {
        oc::impl::destroy_objects_in_reverse(_data, _data + _size);
        deallocate(_data, _capacity);
    }

    void swap(element_buffer& rhs) noexcept
    {
        T* d = _data;
        isize s = _size;
        isize c = _capacity;
        _data = rhs._data;
        _size = rhs._size;
        _capacity = rhs._capacity;
        rhs._data = d;
        rhs._size = s;
        rhs._capacity = c;
    }

    // helper
private:
    /// create(cursor) must construct exactly count objects at cursor
    template <class CreateF>
    void insert_with(isize pos, isize count, CreateF&& create)
    {
        OC_ASSERT(0 <= pos && pos <= _size, "insert position out of bounds");
        OC_ASSERT(count >= 0, "insert count must be non-negative");
        if (count == 0)
            return;

        // fast path: appending into existing capacity never moves live elements
        if (pos == _size && _size + count <= _capacity)
        {
            T* end = _data + _size;
            try
            {
                create(end);
            }
            catch (...)
            {
                _size = end - _data;
                throw;
            }
            _size += count;
            return;
        }

        auto const new_capacity = _size + count <= _capacity ? _capacity : grown_capacity(_size + count);
        T* new_data = allocate(new_capacity);

        // inserted objects first: the source may still point into _data
        T* mid_end = new_data + pos;
        try
        {
            create(mid_end);
        }
        catch (...)
        {
            oc::impl::destroy_objects_in_reverse(new_data + pos, mid_end);
            deallocate(new_data, new_capacity);
            throw;
        }

        T* prefix_end = new_data;
        oc::impl::move_create_objects_to(prefix_end, _data, _data + pos);
        T* suffix_end = mid_end;
        oc::impl::move_create_objects_to(suffix_end, _data + pos, _data + _size);

        replace_storage(new_data, new_capacity);
        _size += count;
    }

    /// destroys the current (moved-from) objects and adopts new_data
    /// the element count stays the same
    void replace_storage(T* new_data, isize new_capacity)
    {
        oc::impl::destroy_objects_in_reverse(_data, _data + _size);
        deallocate(_data, _capacity);
        _data = new_data;
        _capacity = new_capacity;
    }

    [[nodiscard]] isize grown_capacity(isize min_capacity) const
    {
        auto doubled = _capacity * 2;
        if (doubled < 4)
            doubled = 4;
        return doubled < min_capacity ? min_capacity : doubled;
    }

    [[nodiscard]] static T* allocate(isize capacity)
    {
        if (capacity == 0)
            return nullptr;
        return static_cast<T*>(::operator new(size_t(capacity) * sizeof(T), std::align_val_t(alignof(T))));
    }

    static void deallocate(T* p, isize capacity)
    {
        if (p != nullptr)
            ::operator delete(p, size_t(capacity) * sizeof(T), std::align_val_t(alignof(T)));
    }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
    isize _capacity = 0;
};
