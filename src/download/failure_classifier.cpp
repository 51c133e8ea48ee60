#include "failure_classifier.h"
#include "../common/url_parser.h"

BlockedSignal FailureClassifier::classify(const std::string& error_text) {
    std::string text = UrlParser::toLower(error_text);

    if (text.find("http error 403") != std::string::npos || text.find("forbidden") != std::string::npos) {
        return BlockedSignal::Forbidden;
    }
    if (text.find("429") != std::string::npos || text.find("too many requests") != std::string::npos) {
        return BlockedSignal::RateLimited;
    }
    if (text.find("sign in to confirm your age") != std::string::npos) {
        return BlockedSignal::AgeGate;
    }
    if (text.find("playback on other websites has been disabled by the video owner") != std::string::npos) {
        return BlockedSignal::OwnerDisabled;
    }
    return BlockedSignal::Other;
}

const char* FailureClassifier::toString(BlockedSignal signal) {
    switch (signal) {
        case BlockedSignal::Forbidden:     return "forbidden";
        case BlockedSignal::RateLimited:   return "rate-limited";
        case BlockedSignal::AgeGate:       return "age-gate";
        case BlockedSignal::OwnerDisabled: return "owner-disabled";
        default:                           return "other";
    }
}
