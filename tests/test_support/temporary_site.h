#ifndef ESPRESSO_TEST_SUPPORT_TEMPORARY_SITE_H
#define ESPRESSO_TEST_SUPPORT_TEMPORARY_SITE_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace espresso {
namespace test {

class TemporarySite {
public:
  TemporarySite() {
    static std::atomic<int> counter{0};
    const auto timestamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            ("espresso-site-" + std::to_string(timestamp) + "-" +
             std::to_string(counter++));
    std::filesystem::create_directories(root_);
  }

  ~TemporarySite() { std::filesystem::remove_all(root_); }

  std::filesystem::path AddFile(const std::filesystem::path &relative,
                                const std::string &content = "") const {
    const auto full_path = root_ / relative;
    std::filesystem::create_directories(full_path.parent_path());
    std::ofstream stream(full_path);
    stream << content;
    return full_path;
  }

  std::filesystem::path AddArticle(const std::filesystem::path &relative,
                                   const std::string &title,
                                   const std::string &date,
                                   const std::string &extra = "") const {
    return AddFile(std::filesystem::path("content") / relative,
                   "---\ntitle: " + title + "\ndate: " + date + "\n" + extra +
                       "---\nBody of " + title + "\n");
  }

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};

} // namespace test
} // namespace espresso

#endif // ESPRESSO_TEST_SUPPORT_TEMPORARY_SITE_H
