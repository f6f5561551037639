
#pragma once
#include <mutex>
#include <string>
#include "reassembler.hpp"

namespace tilecast {

// Writes finalized images to <root>/<transmitter>/images/<name>. Degraded
// images get a "<name>.missing" sidecar with one placeholder index per line.
class ImageStore {
public:
    explicit ImageStore(std::string root);

    bool save(const FinalizedImage& img);
    std::string path_for(const FinalizedImage& img) const;
    size_t saved_count() const;

private:
    std::string root_;
    mutable std::mutex mtx_;
    size_t saved_{0};
};

} // namespace tilecast
