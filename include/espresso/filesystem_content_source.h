#pragma once

#include <espresso/interfaces.h>
#include <espresso/logging.h>

#include <filesystem>
#include <memory>

namespace espresso {

class FilesystemContentSource : public ContentSource {
public:
  explicit FilesystemContentSource(std::shared_ptr<Logger> logger = nullptr);
  std::vector<ContentFile> Acquire(const BuildConfig &config) override;

private:
  std::shared_ptr<Logger> logger_;
};

std::filesystem::path ContentRoot(const BuildConfig &config);

} // namespace espresso
