#pragma once

#include <espresso/interfaces.h>

namespace espresso {

class SiteSummaryReporter : public Reporter {
public:
  Report Render(const Site &site, const std::vector<BuildWarning> &warnings,
                const BuildConfig &config) override;
};

} // namespace espresso
