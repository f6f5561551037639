
#include "image_source.hpp"
#include "logging.hpp"
#include "transport.hpp"
#include "util.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>

namespace tilecast {

FileImageSource::FileImageSource(std::string path, std::string transmitter_id)
    : path_(std::move(path)), transmitter_id_(std::move(transmitter_id)) {}

bool FileImageSource::next_image(SourceImage &out) {
  std::vector<uint8_t> bytes;
  if (!read_file(path_, bytes)) {
    Logger::instance().log(LogLevel::WARN, "cannot read image %s",
                           path_.c_str());
    return false;
  }

  std::filesystem::path p(path_);
  auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", &tm_buf);

  std::string ext = p.extension().string();
  std::string base = sanitize_component(transmitter_id_) + "_" +
                     p.stem().string() + "_" + ts + "_" +
                     std::to_string(seq_++);
  // the name travels in a fixed 100-byte hello field
  size_t room = kNameFieldSize > ext.size() ? kNameFieldSize - ext.size() : 0;
  if (base.size() > room)
    base.resize(room);
  out.name = base + ext.substr(0, kNameFieldSize - base.size());
  out.bytes = std::move(bytes);
  return true;
}

} // namespace tilecast
