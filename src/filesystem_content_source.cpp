#include <espresso/filesystem_content_source.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace espresso {

namespace {

bool HasContentExtension(const std::filesystem::path &path,
                         const std::vector<std::string> &extensions) {
  const auto extension = path.extension().string();
  return std::find(extensions.begin(), extensions.end(), extension) !=
         extensions.end();
}

bool IsHidden(const std::filesystem::path &path) {
  const auto name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

std::string ReadFile(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("Failed to open content file: " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(stream),
                     std::istreambuf_iterator<char>());
}

std::vector<std::filesystem::path>
CollectContentFiles(const std::filesystem::path &root,
                    const std::vector<std::string> &extensions) {
  std::vector<std::filesystem::path> files;

  for (std::filesystem::recursive_directory_iterator it(root), end; it != end;
       ++it) {
    const auto &entry = *it;
    if (IsHidden(entry.path())) {
      if (entry.is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file() ||
        !HasContentExtension(entry.path(), extensions)) {
      continue;
    }
    files.push_back(entry.path());
  }

  std::sort(files.begin(), files.end());
  return files;
}

} // namespace

std::filesystem::path ContentRoot(const BuildConfig &config) {
  if (config.root_path.empty()) {
    throw std::invalid_argument("BuildConfig.root_path must not be empty.");
  }
  return (std::filesystem::path(config.root_path) / config.content_dir)
      .lexically_normal();
}

FilesystemContentSource::FilesystemContentSource(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

std::vector<ContentFile>
FilesystemContentSource::Acquire(const BuildConfig &config) {
  const auto root = ContentRoot(config);
  if (!std::filesystem::exists(root) ||
      !std::filesystem::is_directory(root)) {
    throw std::runtime_error("Content directory not found: " + root.string());
  }

  std::vector<ContentFile> files;
  for (const auto &path : CollectContentFiles(root, config.extensions)) {
    files.push_back(ContentFile{path.generic_string(), ReadFile(path)});
  }

  logger_->Log(LogLevel::kInfo, "source.collected",
               {{"count", std::to_string(files.size())},
                {"root", root.generic_string()}});
  return files;
}

} // namespace espresso
