#include "asset_registry.hpp"

#include <cstddef>
#include <iostream>
#include <utility>

AssetRegistry::AssetRegistry(ImageLoader loader, ImageReleaser releaser)
    : loader_(std::move(loader)), releaser_(std::move(releaser)) {}

AssetRegistry::~AssetRegistry() {
    clear();
}

void AssetRegistry::request(const std::string& path) {
    if (path.empty()) return;
    auto res = entries_.emplace(path, Entry{});
    if (!res.second) return;

    res.first->second.status = Status::Pending;
    queue_.push_back(path);
}

void AssetRegistry::requestAll(const std::vector<std::string>& paths) {
    for (const auto& p : paths) request(p);
}

int AssetRegistry::pump(int maxLoads) {
    int done = 0;
    size_t i = 0;
    while (i < queue_.size() && (maxLoads <= 0 || done < maxLoads)) {
        const std::string& path = queue_[i];
        ++i;

        auto it = entries_.find(path);
        if (it == entries_.end() || it->second.status != Status::Pending) continue;

        ++attempts_;
        ++done;

        std::optional<LoadedImage> img;
        if (loader_) img = loader_(path);

        if (img && img->w > 0 && img->h > 0) {
            it->second.image = *img;
            it->second.status = Status::Ready;
        } else {
            if (img && releaser_) releaser_(*img);
            it->second.status = Status::Unavailable;
            std::cerr << "[assets] could not load " << path << "; using fallback colors\n";
        }
    }
    queue_.erase(queue_.begin(), queue_.begin() + static_cast<std::ptrdiff_t>(i));
    return done;
}

AssetRegistry::Status AssetRegistry::status(const std::string& path) const {
    auto it = entries_.find(path);
    return (it == entries_.end()) ? Status::Unknown : it->second.status;
}

const LoadedImage* AssetRegistry::get(const std::string& path) const {
    auto it = entries_.find(path);
    if (it == entries_.end() || it->second.status != Status::Ready) return nullptr;
    return &it->second.image;
}

void AssetRegistry::clear() {
    for (auto& kv : entries_) {
        if (kv.second.status == Status::Ready && releaser_) releaser_(kv.second.image);
    }
    entries_.clear();
    queue_.clear();
}

std::vector<std::string> artCandidateKeys(const TerrainModel& model, const LayerValues& values) {
    const std::string& h = model.idOf(LayerKind::Height, values.get(LayerKind::Height));
    const std::string& c = model.idOf(LayerKind::Climate, values.get(LayerKind::Climate));
    const std::string& v = model.idOf(LayerKind::Vegetation, values.get(LayerKind::Vegetation));

    std::vector<std::string> keys;
    keys.reserve(6);
    if (!v.empty()) {
        if (!c.empty() && !h.empty()) keys.push_back(v + "+" + c + "+" + h);
        if (!h.empty()) keys.push_back(v + "+" + h);
        if (!c.empty()) keys.push_back(v + "+" + c);
        keys.push_back(v);
    }
    if (!h.empty()) keys.push_back(h);
    if (!c.empty()) keys.push_back(c);
    return keys;
}

std::vector<std::string> resolveArtPaths(const std::unordered_map<std::string, std::string>& table,
                                         const std::vector<std::string>& keys) {
    std::vector<std::string> out;
    for (const auto& k : keys) {
        auto it = table.find(k);
        if (it != table.end() && !it->second.empty()) out.push_back(it->second);
    }
    return out;
}

const LoadedImage* firstReadyImage(const AssetRegistry& assets, const std::vector<std::string>& paths) {
    for (const auto& p : paths) {
        if (const LoadedImage* img = assets.get(p)) return img;
    }
    return nullptr;
}
