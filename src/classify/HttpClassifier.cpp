#include "classify/HttpClassifier.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace fw::classify;
using json = nlohmann::json;

namespace {

json postForJson(const std::string& endpoint, const json& request, const unsigned int timeoutSeconds) {
    const auto resp = fw::util::postJson(endpoint, request.dump(), static_cast<long>(timeoutSeconds));
    if (!resp.ok()) throw std::runtime_error("decision service " + endpoint + " failed: " + resp.describe());

    auto parsed = json::parse(resp.body, nullptr, false);
    if (parsed.is_discarded()) throw std::runtime_error("decision service " + endpoint + " returned invalid JSON");
    return parsed;
}

}

std::vector<Decision> HttpClassifier::classify(const std::vector<FileCandidate>& files, const std::string& category) {
    const json request = {
        {"category", category},
        {"files", files}
    };

    fw::log::Registry::classify()->debug("[HttpClassifier] Sending {} files for category '{}'", files.size(), category);
    auto decisions = parseDecisions(postForJson(endpoint_, request, timeoutSeconds_));
    fw::log::Registry::classify()->debug("[HttpClassifier] Received {} decisions", decisions.size());
    return decisions;
}

Resolution HttpConflictResolver::resolve(const ConflictFile& existing, const ConflictFile& incoming) {
    const json request = {
        {"existing", existing},
        {"incoming", incoming}
    };

    return parseResolution(postForJson(endpoint_, request, timeoutSeconds_));
}
