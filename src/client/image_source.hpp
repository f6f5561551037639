
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace tilecast {

struct SourceImage {
    std::string name;
    std::vector<uint8_t> bytes;
};

// Supplies already-compressed images; the bytes are opaque to the engine.
class ImageSource {
public:
    virtual ~ImageSource() = default;
    virtual bool next_image(SourceImage& out) = 0;
};

// Re-reads one file on every call so an external capture/codec process can
// keep replacing it. Each image gets a unique name: <id>_<stem>_<time>_<seq><ext>.
class FileImageSource : public ImageSource {
public:
    FileImageSource(std::string path, std::string transmitter_id);
    bool next_image(SourceImage& out) override;
private:
    std::string path_;
    std::string transmitter_id_;
    uint32_t seq_{0};
};

} // namespace tilecast
