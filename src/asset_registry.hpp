#pragma once

#include "terrain_layers.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct SDL_Texture;

struct LoadedImage {
    SDL_Texture* texture = nullptr;
    int w = 0;
    int h = 0;
};

// Turns a path into an image, or nullopt if it cannot be loaded.
using ImageLoader = std::function<std::optional<LoadedImage>(const std::string& path)>;
// Frees whatever the loader created.
using ImageReleaser = std::function<void(const LoadedImage& img)>;

// Path-keyed image cache owned by the renderer.
//
// Requests are fire-and-forget and deduplicated; loads run cooperatively in
// pump() a few per frame. A failed load marks the path Unavailable (logged once)
// and callers simply fall back to flat colors.
class AssetRegistry {
public:
    enum class Status : uint8_t {
        Unknown = 0,
        Pending,
        Ready,
        Unavailable,
    };

    AssetRegistry(ImageLoader loader, ImageReleaser releaser);
    ~AssetRegistry();

    AssetRegistry(const AssetRegistry&) = delete;
    AssetRegistry& operator=(const AssetRegistry&) = delete;

    // No-op for empty paths and paths already known.
    void request(const std::string& path);
    void requestAll(const std::vector<std::string>& paths);

    // Performs up to maxLoads pending loads (all of them if maxLoads <= 0).
    // Returns the number of loads attempted.
    int pump(int maxLoads);

    Status status(const std::string& path) const;
    // nullptr unless the path is Ready.
    const LoadedImage* get(const std::string& path) const;

    size_t pendingCount() const { return queue_.size(); }
    int loadAttempts() const { return attempts_; }

    // Releases every loaded image and forgets every path.
    void clear();

private:
    struct Entry {
        Status status = Status::Unknown;
        LoadedImage image;
    };

    ImageLoader loader_;
    ImageReleaser releaser_;
    std::unordered_map<std::string, Entry> entries_;
    std::vector<std::string> queue_;
    int attempts_ = 0;
};

// Lookup keys from most to least specific:
//   veg+climate+height, veg+height, veg+climate, veg, height, climate
std::vector<std::string> artCandidateKeys(const TerrainModel& model, const LayerValues& values);

// Maps candidate keys through an art table, keeping order and skipping misses.
std::vector<std::string> resolveArtPaths(const std::unordered_map<std::string, std::string>& table,
                                         const std::vector<std::string>& keys);

// First path in `paths` whose image is Ready, or nullptr.
const LoadedImage* firstReadyImage(const AssetRegistry& assets, const std::vector<std::string>& paths);
