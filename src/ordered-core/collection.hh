#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/impl/element_buffer.hh>
#include <ordered-core/index.hh>
#include <ordered-core/optional.hh>
#include <ordered-core/string.hh>
#include <ordered-core/to_string.hh>
#include <ordered-core/utility.hh>

#include <algorithm>
#include <initializer_list>
#include <type_traits>
#include <vector>


/// One {index, value} pair as produced by collection::entries()
template <class T>
struct oc::entry
{
    isize index = 0;
    T value;

    [[nodiscard]] friend bool operator==(entry const&, entry const&) = default;
};

/// Ordered, 0-indexed sequence of T with the operation set of a scripting-language array.
///
/// Index conventions:
///   - get / set / remove_at / operator[] take plain indices in [0, length())
///     (get / set / remove_at report index_out_of_range in every build, operator[] only asserts)
///   - region operations (slice, splice, fill, copy_within, insert, index_of, ...) accept negative
///     indices as "offset from the end" and clamp out-of-range bounds instead of failing
///     (see <ordered-core/index.hh>)
///
/// Results:
///   - "no value" outcomes are oc::optional<T> (pop, shift, find, find_last, reduce without initial)
///   - "not found" indices are -1
///   - slice, splice, filter, map, reverse, concat, ... return new, independently owned collections
///
/// Callbacks:
///   Element callbacks may take (elem), (elem, idx) or (elem, idx, self), reducers take the accumulator first.
///   Traversals read length() once at the start and visit ascending indices (reduce_right: descending).
///   A callback that mutates the collection it is called from gets unspecified results
///   (indices that no longer exist are skipped, nothing beyond the current length is read).
///
/// Not synchronized. Copy is a deep copy, move leaves the source empty.
template <class T>
struct oc::collection
{
    using element_t = T;

    // factories
public:
    /// Empty collection with room for capacity elements.
    [[nodiscard]] static collection create_with_capacity(isize capacity)
    {
        collection result;
        result._items.reserve(capacity);
        return result;
    }

    /// size value-initialized elements (0 for arithmetic types).
    [[nodiscard]] static collection create_defaulted(isize size)
    {
        OC_ASSERT(size >= 0, "size must be non-negative");
        collection result;
        result._items.append_defaulted(size);
        return result;
    }

    /// size copies of value.
    [[nodiscard]] static collection create_filled(isize size, T const& value)
    {
        OC_ASSERT(size >= 0, "size must be non-negative");
        collection result;
        result._items.append_filled(size, value);
        return result;
    }

    /// One element per argument, each constructed as T(arg).
    template <class... Args>
    [[nodiscard]] static collection create_from(Args&&... items)
    {
        collection result;
        result._items.reserve(isize(sizeof...(Args)));
        (result._items.emplace_back(oc::forward<Args>(items)), ...);
        return result;
    }

    /// Copies every element of a range (anything usable in range-for).
    template <class Range>
    [[nodiscard]] static collection create_copy_of(Range const& range)
    {
        collection result;
        result._items = copy_to_buffer(range);
        return result;
    }

    // ctors
public:
    collection() = default;

    collection(std::initializer_list<T> items)
    {
        _items.reserve(isize(items.size()));
        _items.insert_copies(0, items.begin(), items.end());
    }

    // collection has deep-copy value semantics
    collection(collection const&) = default;
    collection(collection&&) noexcept = default;
    collection& operator=(collection const&) = default;
    collection& operator=(collection&&) noexcept = default;
    ~collection() = default;

    // queries
public:
    [[nodiscard]] isize length() const { return _items.size(); }
    [[nodiscard]] isize size() const { return _items.size(); }
    [[nodiscard]] bool empty() const { return _items.empty(); }

    // element access
public:
    /// Checked read, no index normalization.
    [[nodiscard]] T const& get(isize index) const
    {
        check_index(index);
        return _items.data()[index];
    }

    /// Checked write, no index normalization.
    void set(isize index, T value)
    {
        check_index(index);
        _items.data()[index] = oc::move(value);
    }

    [[nodiscard]] T& operator[](isize index)
    {
        OC_ASSERT(0 <= index && index < _items.size(), "index out of bounds");
        return _items.data()[index];
    }
    [[nodiscard]] T const& operator[](isize index) const
    {
        OC_ASSERT(0 <= index && index < _items.size(), "index out of bounds");
        return _items.data()[index];
    }

    [[nodiscard]] T& front()
    {
        OC_ASSERT(!empty(), "front() on empty collection");
        return _items.data()[0];
    }
    [[nodiscard]] T const& front() const
    {
        OC_ASSERT(!empty(), "front() on empty collection");
        return _items.data()[0];
    }

    [[nodiscard]] T& back()
    {
        OC_ASSERT(!empty(), "back() on empty collection");
        return _items.data()[_items.size() - 1];
    }
    [[nodiscard]] T const& back() const
    {
        OC_ASSERT(!empty(), "back() on empty collection");
        return _items.data()[_items.size() - 1];
    }

    // iterators
public:
    [[nodiscard]] T* begin() { return _items.data(); }
    [[nodiscard]] T* end() { return _items.data() + _items.size(); }
    [[nodiscard]] T const* begin() const { return _items.data(); }
    [[nodiscard]] T const* end() const { return _items.data() + _items.size(); }

    // basic mutation
public:
    /// Appends all items in argument order, returns the new length.
    template <class... Args>
    isize push(Args&&... items)
    {
        static_assert(sizeof...(Args) > 0, "push needs at least one item");
        // items may reference elements of this collection
        if constexpr (sizeof...(Args) == 1)
        {
            (_items.emplace_back(oc::forward<Args>(items)), ...);
        }
        else
        {
            auto suffix = make_buffer(oc::forward<Args>(items)...);
            _items.insert_moved(_items.size(), suffix.data(), suffix.data() + suffix.size());
        }
        return length();
    }

    /// Removes and returns the last element.
    [[nodiscard]] optional<T> pop()
    {
        if (empty())
            return nullopt;
        return _items.extract_at(_items.size() - 1);
    }

    /// Removes and returns the first element, the rest moves down by one.
    [[nodiscard]] optional<T> shift()
    {
        if (empty())
            return nullopt;
        return _items.extract_at(0);
    }

    /// Prepends all items (they keep their argument order), returns the new length.
    template <class... Args>
    isize unshift(Args&&... items)
    {
        static_assert(sizeof...(Args) > 0, "unshift needs at least one item");
        auto prefix = make_buffer(oc::forward<Args>(items)...);
        _items.insert_moved(0, prefix.data(), prefix.data() + prefix.size());
        return length();
    }

    /// Same as splice(index, 0, item).
    void insert(isize index, T item)
    {
        auto const pos = clamp_index(index, length());
        _items.insert_moved(pos, &item, &item + 1);
    }

    /// Same as splice(index, 0, ...items).
    template <class Range>
    void insert_range(isize index, Range const& items)
    {
        auto inserted = copy_to_buffer(items);
        auto const pos = clamp_index(index, length());
        _items.insert_moved(pos, inserted.data(), inserted.data() + inserted.size());
    }

    void add(T item) { _items.emplace_back(oc::move(item)); }

    template <class Range>
    void add_range(Range const& items)
    {
        insert_range(length(), items);
    }

    void clear() { _items.clear(); }

    /// Removes the first element equal to item, returns false if there was none.
    bool remove(T const& item)
    {
        auto const idx = index_of(item);
        if (idx < 0)
            return false;

        _items.erase(idx, 1);
        return true;
    }

    /// Checked removal by plain index (no normalization).
    T remove_at(isize index)
    {
        check_index(index);
        return _items.extract_at(index);
    }

    // region operations
public:
    [[nodiscard]] collection slice() const { return slice(0, length()); }
    [[nodiscard]] collection slice(isize start) const { return slice(start, length()); }

    /// New collection of the elements in [start, end).
    /// Bounds are normalized and clamped, end <= start gives an empty collection.
    [[nodiscard]] collection slice(isize start, isize end) const
    {
        auto const range = resolve_range(start, end, length());

        collection result;
        result._items.reserve(range.size());
        result._items.insert_copies(0, _items.data() + range.start, _items.data() + range.end);
        return result;
    }

    /// Removes delete_count elements at start and inserts items in their place.
    /// Returns the removed elements in their original order.
    /// start is normalized and clamped, delete_count is clamped to [0, length() - start].
    template <class... Args>
    collection splice(isize start, isize delete_count = 0, Args&&... items)
    {
        auto const len = length();
        auto const pos = clamp_index(start, len);
        auto const count = oc::clamp(delete_count, isize(0), len - pos);

        // the items may reference elements that are about to be removed
        auto inserted = make_buffer(oc::forward<Args>(items)...);

        collection removed;
        removed._items.reserve(count);
        removed._items.insert_moved(0, _items.data() + pos, _items.data() + pos + count);
        _items.erase(pos, count);

        _items.insert_moved(pos, inserted.data(), inserted.data() + inserted.size());
        return removed;
    }

    collection& copy_within(isize target, isize start) { return copy_within(target, start, length()); }

    /// Copies [start, end) over the elements starting at target, length() never changes.
    ///
    /// target and end are normalized and clamped independently.
    /// A negative start is resolved against end when end is negative too (start = length + end),
    /// otherwise against length (see resolve_copy_source).
    /// The source is read completely before the first write, so overlapping ranges are fine.
    /// Elements that would land at or past length() are dropped.
    collection& copy_within(isize target, isize start, isize end)
    {
        auto const len = length();
        auto const dest = clamp_index(target, len);
        auto const source = resolve_copy_source(start, end, len);
        auto const count = oc::min(source.size(), len - dest);
        if (count <= 0)
            return *this;

        impl::element_buffer<T> snapshot;
        snapshot.reserve(count);
        snapshot.insert_copies(0, _items.data() + source.start, _items.data() + source.start + count);

        auto* out = _items.data() + dest;
        for (isize i = 0; i < count; ++i)
            out[i] = oc::move(snapshot.data()[i]);

        return *this;
    }

    collection& fill(T const& value) { return fill(value, 0, length()); }
    collection& fill(T const& value, isize start) { return fill(value, start, length()); }

    /// Assigns value to every element in the normalized and clamped [start, end).
    collection& fill(T const& value, isize start, isize end)
    {
        auto const range = resolve_range(start, end, length());
        for (auto i = range.start; i < range.end; ++i)
            _items.data()[i] = value;
        return *this;
    }

    // predicates and searches
public:
    /// false at the first element failing pred, true otherwise (also when empty).
    template <class Pred>
    [[nodiscard]] bool every(Pred&& pred) const
    {
        auto const len = length();
        for (isize i = 0; is_visitable(i, len); ++i)
            if (!bool(oc::invoke_element_callback(pred, elem(i), i, *this)))
                return false;
        return true;
    }

    /// true at the first element passing pred, false otherwise (also when empty).
    template <class Pred>
    [[nodiscard]] bool some(Pred&& pred) const
    {
        auto const len = length();
        for (isize i = 0; is_visitable(i, len); ++i)
            if (bool(oc::invoke_element_callback(pred, elem(i), i, *this)))
                return true;
        return false;
    }

    /// New collection of all elements passing pred, in order.
    template <class Pred>
    [[nodiscard]] collection filter(Pred&& pred) const
    {
        collection result;
        auto const len = length();
        for (isize i = 0; is_visitable(i, len); ++i)
            if (bool(oc::invoke_element_callback(pred, elem(i), i, *this)) && i < _items.size())
                result._items.emplace_back(elem(i));
        return result;
    }

    /// Same as filter.
    template <class Pred>
    [[nodiscard]] collection find_all(Pred&& pred) const
    {
        return filter(pred);
    }

    template <class Pred>
    [[nodiscard]] optional<T> find(Pred&& pred) const
    {
        auto const idx = find_index(pred);
        if (idx < 0 || idx >= _items.size())
            return nullopt;
        return elem(idx);
    }

    template <class Pred>
    [[nodiscard]] isize find_index(Pred&& pred) const
    {
        auto const len = length();
        for (isize i = 0; is_visitable(i, len); ++i)
            if (bool(oc::invoke_element_callback(pred, elem(i), i, *this)))
                return i;
        return -1;
    }

    /// The last element passing pred.
    /// Scans ascending and keeps the latest match, so pred sees every element.
    template <class Pred>
    [[nodiscard]] optional<T> find_last(Pred&& pred) const
    {
        auto const idx = find_last_index(pred);
        if (idx < 0 || idx >= _items.size())
            return nullopt;
        return elem(idx);
    }

    template <class Pred>
    [[nodiscard]] isize find_last_index(Pred&& pred) const
    {
        isize last = -1;
        auto const len = length();
        for (isize i = 0; is_visitable(i, len); ++i)
            if (bool(oc::invoke_element_callback(pred, elem(i), i, *this)))
                last = i;
        return last;
    }

    /// First index in [from, length()) holding an element equal to item, or -1.
    /// A negative from is normalized.
    [[nodiscard]] isize index_of(T const& item, isize from = 0) const
    {
        auto const len = length();
        for (auto i = clamp_index(from, len); i < len; ++i)
            if (elem(i) == item)
                return i;
        return -1;
    }

    /// Last index in [from, length()) holding an element equal to item, or -1.
    [[nodiscard]] isize last_index_of(T const& item, isize from = 0) const
    {
        auto const first = clamp_index(from, length());
        for (auto i = length() - 1; i >= first; --i)
            if (elem(i) == item)
                return i;
        return -1;
    }

    [[nodiscard]] bool includes(T const& item, isize from = 0) const { return index_of(item, from) >= 0; }

    // traversal and transformation
public:
    template <class F>
    void for_each(F&& fn) const
    {
        auto const len = length();
        for (isize i = 0; is_visitable(i, len); ++i)
            oc::invoke_element_callback(fn, elem(i), i, *this);
    }

    /// New collection of fn results, same length and order.
    /// The element type is the decayed result type of fn.
    template <class F>
    [[nodiscard]] auto map(F&& fn) const
    {
        using result_t = oc::element_callback_result_t<F, T const&, collection>;
        static_assert(!std::is_void_v<result_t>, "map callback must return a value");

        auto const len = length();
        auto result = collection<result_t>::create_with_capacity(len);
        for (isize i = 0; is_visitable(i, len); ++i)
            result.add(oc::invoke_element_callback(fn, elem(i), i, *this));
        return result;
    }

    /// Left fold: acc = fn(acc, elem, idx, self) for ascending indices.
    /// Returns initial unchanged for an empty collection.
    template <class F, class Acc>
    [[nodiscard]] Acc reduce(F&& fn, Acc initial) const
    {
        auto const len = length();
        for (isize i = 0; is_visitable(i, len); ++i)
            initial = oc::invoke_reducer(fn, oc::move(initial), elem(i), i, *this);
        return initial;
    }

    /// Left fold without initial value.
    /// The accumulator is an optional<T> that starts empty; fn must handle that first step itself.
    /// An empty collection yields an empty optional, not an error.
    template <class F>
    [[nodiscard]] optional<T> reduce(F&& fn) const
    {
        return reduce(fn, optional<T>());
    }

    /// Right fold: visits descending indices, idx is the real element index.
    template <class F, class Acc>
    [[nodiscard]] Acc reduce_right(F&& fn, Acc initial) const
    {
        for (auto i = length() - 1; i >= 0; --i)
            if (i < length())
                initial = oc::invoke_reducer(fn, oc::move(initial), elem(i), i, *this);
        return initial;
    }

    template <class F>
    [[nodiscard]] optional<T> reduce_right(F&& fn) const
    {
        return reduce_right(fn, optional<T>());
    }

    /// Keeps only the elements for which pred is false.
    /// pred sees the unmodified collection, elements are removed afterwards.
    template <class Pred>
    void remove_all(Pred&& pred)
    {
        auto const len = length();

        impl::element_buffer<bool> drop;
        drop.reserve(len);
        for (isize i = 0; is_visitable(i, len); ++i)
            drop.emplace_back(bool(oc::invoke_element_callback(pred, elem(i), i, *this)));

        impl::element_buffer<T> kept;
        kept.reserve(drop.size());
        for (isize i = 0; i < drop.size() && i < length(); ++i)
            if (!drop.data()[i])
                kept.emplace_back(oc::move(_items.data()[i]));

        _items = oc::move(kept);
    }

    /// Stable in-place sort by operator<.
    collection& sort()
    {
        std::stable_sort(begin(), end());
        return *this;
    }

    /// Stable in-place sort by a three-way comparator.
    /// cmp(a, b) returns something comparable with 0: negative (a first), zero (keep order), positive (b first).
    template <class Cmp>
    collection& sort(Cmp&& cmp)
    {
        std::stable_sort(begin(), end(), [&cmp](T const& a, T const& b) { return cmp(a, b) < 0; });
        return *this;
    }

    /// New collection with the elements in reverse order.
    [[nodiscard]] collection reverse() const
    {
        collection result;
        result._items.reserve(length());
        for (auto i = length() - 1; i >= 0; --i)
            result._items.emplace_back(elem(i));
        return result;
    }

    /// String representations of all elements with separator in between.
    [[nodiscard]] string join(string_view separator = ",") const
    {
        string result;
        for (isize i = 0; i < length(); ++i)
        {
            if (i > 0)
                result += separator;
            result += oc::impl::element_to_string(elem(i));
        }
        return result;
    }

    [[nodiscard]] string to_string() const { return join(); }

    /// 0, 1, ..., length() - 1
    [[nodiscard]] collection<isize> keys() const
    {
        auto result = collection<isize>::create_with_capacity(length());
        for (isize i = 0; i < length(); ++i)
            result.add(i);
        return result;
    }

    [[nodiscard]] collection values() const { return *this; }

    [[nodiscard]] collection<entry<T>> entries() const
    {
        auto result = collection<entry<T>>::create_with_capacity(length());
        for (isize i = 0; i < length(); ++i)
            result.add(entry<T>{i, elem(i)});
        return result;
    }

    /// New collection: all elements of this one, then the items.
    /// An item that is itself a collection<T> contributes its elements.
    template <class... Args>
    [[nodiscard]] collection concat(Args&&... items) const
    {
        collection result = *this;
        (result.append_concat_item(oc::forward<Args>(items)), ...);
        return result;
    }

    /// Copy of the elements for APIs that need a std::vector.
    [[nodiscard]] std::vector<T> to_std_vector() const { return std::vector<T>(begin(), end()); }

    [[nodiscard]] friend bool operator==(collection const& lhs, collection const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs.length() != rhs.length())
            return false;
        for (isize i = 0; i < lhs.length(); ++i)
            if (!(lhs.elem(i) == rhs.elem(i)))
                return false;
        return true;
    }

    // helper
private:
    [[nodiscard]] T const& elem(isize i) const { return _items.data()[i]; }

    // i is inside the length snapshot and still exists
    [[nodiscard]] bool is_visitable(isize i, isize snapshot_length) const
    {
        return i < snapshot_length && i < _items.size();
    }

    void check_index(isize index) const
    {
        if (index < 0 || index >= _items.size()) [[unlikely]]
            oc::impl::report_index_out_of_range(index, _items.size());
    }

    template <class... Args>
    [[nodiscard]] static impl::element_buffer<T> make_buffer(Args&&... items)
    {
        impl::element_buffer<T> buffer;
        buffer.reserve(isize(sizeof...(Args)));
        (buffer.emplace_back(oc::forward<Args>(items)), ...);
        return buffer;
    }

    template <class Range>
    [[nodiscard]] static impl::element_buffer<T> copy_to_buffer(Range const& range)
    {
        impl::element_buffer<T> buffer;
        for (auto const& v : range)
            buffer.emplace_back(v);
        return buffer;
    }

    template <class U>
    void append_concat_item(U&& item)
    {
        if constexpr (std::is_same_v<std::remove_cvref_t<U>, collection>)
            _items.insert_copies(_items.size(), item.begin(), item.end());
        else
            _items.emplace_back(oc::forward<U>(item));
    }

    // members
private:
    impl::element_buffer<T> _items;
};
