#pragma once

#include <ordered-core/collection.hh>
#include <ordered-core/value.hh>

// dynamic_collection = collection<value>, see <ordered-core/fwd.hh>
//
// Holds elements of mixed kinds:
//
//   auto items = oc::make_dynamic(1, "two", true, nullptr);
//   items.push(oc::value::create_undefined());
//   items.join(); // "1,two,true,null,undefined"
//
// Every collection operation applies unchanged. Equality is per kind (value(1) != value("1")),
// sort() orders by kind first.

namespace oc
{
/// One element per argument, each converted to oc::value.
template <class... Args>
[[nodiscard]] dynamic_collection make_dynamic(Args&&... items)
{
    return dynamic_collection::create_from(oc::forward<Args>(items)...);
}
} // namespace oc
