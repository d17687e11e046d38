#include <espresso/route_walker.h>

#include <stdexcept>
#include <string>

namespace espresso {
namespace {

void ValidateDepth(int depth) {
  if (depth < kUnboundedDepth) {
    throw std::invalid_argument("Walk depth must be -1 or non-negative, got " +
                                std::to_string(depth));
  }
}

template <typename RouteType, typename Visitor>
void WalkChildren(RouteType &route, int depth, int current_depth,
                  const Visitor &visit) {
  if (depth != kUnboundedDepth && current_depth == depth) {
    return;
  }
  for (const auto &[key, child] : route.children()) {
    RouteType &next = *child;
    visit(next);
    WalkChildren(next, depth, current_depth + 1, visit);
  }
}

} // namespace

void WalkRoutes(Route &root, int depth, const RouteVisitor &visit) {
  ValidateDepth(depth);
  WalkChildren(root, depth, 0, visit);
}

void WalkRoutes(const Route &root, int depth, const ConstRouteVisitor &visit) {
  ValidateDepth(depth);
  WalkChildren(root, depth, 0, visit);
}

void ForEachRoute(RouteTree &tree, const RouteVisitor &visit) {
  visit(tree.root());
  WalkRoutes(tree.root(), kUnboundedDepth, visit);
}

void ForEachRoute(const RouteTree &tree, const ConstRouteVisitor &visit) {
  visit(tree.root());
  WalkRoutes(tree.root(), kUnboundedDepth, visit);
}

} // namespace espresso
