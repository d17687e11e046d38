#pragma once

#include <espresso/route_tree.h>

#include <functional>

namespace espresso {

using RouteVisitor = std::function<void(Route &)>;
using ConstRouteVisitor = std::function<void(const Route &)>;

constexpr int kUnboundedDepth = -1;

// Visits every route below `root` (root itself excluded), descending at most
// `depth` levels. Depth 1 visits the immediate children only. Siblings are
// visited in ascending key order. Must not run while pages are registered.
void WalkRoutes(Route &root, int depth, const RouteVisitor &visit);
void WalkRoutes(const Route &root, int depth, const ConstRouteVisitor &visit);

// Visits the tree root followed by every descendant.
void ForEachRoute(RouteTree &tree, const RouteVisitor &visit);
void ForEachRoute(const RouteTree &tree, const ConstRouteVisitor &visit);

} // namespace espresso
