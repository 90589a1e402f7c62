#include "detector/ad_classifier.h"

namespace ad_silencer::detector {

namespace {

constexpr const char* kAdvertisementTitle = "Advertisement";
constexpr const char* kBrandingTitle = "Spotify";

}  // namespace

bool classify(const std::string& artist, const std::string& title) {
    if (!artist.empty()) {
        return false;
    }
    return title == kAdvertisementTitle || title == kBrandingTitle;
}

bool SignatureAdClassifier::isAd(const std::string& artist, const std::string& title) const {
    return classify(artist, title);
}

const AdClassifier& defaultClassifier() {
    static const SignatureAdClassifier instance;
    return instance;
}

}  // namespace ad_silencer::detector
