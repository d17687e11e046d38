#pragma once

#include <espresso/models.h>
#include <espresso/route_tree.h>

namespace espresso {

struct Site {
  RouteTree routes;
  Nav nav;
  Footer footer;
};

} // namespace espresso
