
#include "image_store.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>

namespace tilecast {

namespace fs = std::filesystem;

ImageStore::ImageStore(std::string root) : root_(std::move(root)) {}

std::string ImageStore::path_for(const FinalizedImage &img) const {
  std::string name = img.image_name.empty() ? std::string("image.bin")
                                            : img.image_name;
  fs::path p = fs::path(root_) / sanitize_component(img.transmitter_id) /
               "images" / sanitize_component(name);
  return p.string();
}

bool ImageStore::save(const FinalizedImage &img) {
  std::lock_guard<std::mutex> lk(mtx_);
  fs::path target(path_for(img));
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "cannot create %s: %s",
                           target.parent_path().string().c_str(),
                           ec.message().c_str());
    return false;
  }

  // never overwrite an earlier image with the same name
  fs::path out = target;
  for (int n = 1; fs::exists(out, ec) && n < 10000; n++)
    out = target.string() + "." + std::to_string(n);

  std::ofstream f(out, std::ios::binary | std::ios::trunc);
  f.write((const char *)img.data.data(), (std::streamsize)img.data.size());
  f.close();
  if (!f) {
    Logger::instance().log(LogLevel::ERROR, "write failed: %s",
                           out.string().c_str());
    return false;
  }

  if (!img.missing.empty()) {
    std::ofstream side(out.string() + ".missing", std::ios::trunc);
    side << "# rows=" << img.params.grid_rows << " cols=" << img.params.grid_cols
         << " chunk=" << img.params.chunk_size << "\n";
    for (uint16_t idx : img.missing)
      side << idx << "\n";
    if (!side)
      Logger::instance().log(LogLevel::WARN, "sidecar write failed for %s",
                             out.string().c_str());
  }
  saved_++;
  Logger::instance().log(LogLevel::INFO, "saved %s (%zu bytes, %zu missing)",
                         out.string().c_str(), img.data.size(),
                         img.missing.size());
  return true;
}

size_t ImageStore::saved_count() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return saved_;
}

} // namespace tilecast
