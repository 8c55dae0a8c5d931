#pragma once

#include "classify/Classifier.hpp"
#include "classify/ConflictResolver.hpp"

#include <string>
#include <utility>

namespace fw::classify {

// POSTs {"category", "files"} to a decision service and parses its reply.
class HttpClassifier final : public Classifier {
public:
    HttpClassifier(std::string endpoint, unsigned int timeoutSeconds)
        : endpoint_(std::move(endpoint)), timeoutSeconds_(timeoutSeconds) {}

    std::vector<Decision> classify(const std::vector<FileCandidate>& files, const std::string& category) override;

private:
    std::string endpoint_;
    unsigned int timeoutSeconds_;
};

// POSTs {"existing", "incoming"} and expects a single resolution back.
class HttpConflictResolver final : public ConflictResolver {
public:
    HttpConflictResolver(std::string endpoint, unsigned int timeoutSeconds)
        : endpoint_(std::move(endpoint)), timeoutSeconds_(timeoutSeconds) {}

    Resolution resolve(const ConflictFile& existing, const ConflictFile& incoming) override;

private:
    std::string endpoint_;
    unsigned int timeoutSeconds_;
};

}
