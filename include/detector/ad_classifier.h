/**
 * @file ad_classifier.h
 * @brief Decides whether reported track metadata belongs to an advertisement
 *
 * The signature below was observed on the Spotify desktop client: adverts are
 * published with an empty artist and a placeholder title. It is not a protocol
 * guarantee, so the State Tracker consumes the abstract AdClassifier and the
 * heuristic can be swapped without touching the state machine.
 */

#pragma once

#include <string>

namespace ad_silencer::detector {

class AdClassifier {
   public:
    virtual ~AdClassifier() = default;

    virtual bool isAd(const std::string& artist, const std::string& title) const = 0;
};

/**
 * @brief Empty artist and a title of "Advertisement" or "Spotify"
 */
class SignatureAdClassifier : public AdClassifier {
   public:
    bool isAd(const std::string& artist, const std::string& title) const override;
};

/**
 * @brief Pure form of SignatureAdClassifier::isAd
 */
bool classify(const std::string& artist, const std::string& title);

/**
 * @brief Process-wide default classifier instance
 */
const AdClassifier& defaultClassifier();

}  // namespace ad_silencer::detector
