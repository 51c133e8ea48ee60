#pragma once

#include <string>

enum class BlockedSignal {
    Forbidden,
    RateLimited,
    AgeGate,
    OwnerDisabled,
    Other
};

// Maps extractor failure text to the reason a source refused the request.
// Matching is plain substring search on lower-cased text, so it follows
// whatever wording the extractor happens to print.
class FailureClassifier {
public:
    static BlockedSignal classify(const std::string& error_text);

    // True for every signal that warrants the alternate client retry
    static bool needsAlternateClient(BlockedSignal signal) {
        return signal != BlockedSignal::Other;
    }

    static const char* toString(BlockedSignal signal);
};
