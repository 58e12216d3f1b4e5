#include "insight_synthesizer.h"

#include <condition_variable>
#include <future>
#include <mutex>
#include <system_error>
#include <sstream>
#include <thread>
#include <crow/logging.h>

const char* const InsightSynthesizer::kFallbackInsight = "AI insights are currently unavailable.";

namespace {

struct WorkerRegistry
{
    std::mutex mutex;
    std::condition_variable idle;
    int active = 0;
};

// Workers hold a reference, so the registry outlives static destruction.
std::shared_ptr<WorkerRegistry> workerRegistry()
{
    static const std::shared_ptr<WorkerRegistry> registry = std::make_shared<WorkerRegistry>();
    return registry;
}

struct WorkerSlot
{
    std::shared_ptr<WorkerRegistry> registry;

    explicit WorkerSlot(std::shared_ptr<WorkerRegistry> r) : registry(std::move(r))
    {
        std::lock_guard<std::mutex> lock(registry->mutex);
        ++registry->active;
    }
    ~WorkerSlot()
    {
        std::lock_guard<std::mutex> lock(registry->mutex);
        if (--registry->active == 0) registry->idle.notify_all();
    }
    WorkerSlot(const WorkerSlot&) = delete;
    WorkerSlot& operator=(const WorkerSlot&) = delete;
};

const char* const kPreamble =
    "As an expert AI insurance claims assistant, give the user clear, concise and helpful "
    "insights about their motor insurance claim.\n"
    "Cover the following:\n"
    "- Policy coverage: whether the incident type appears to be covered.\n"
    "- Key considerations: 1-2 critical actions the user should take next.\n"
    "- Potential exclusions or risk factors relevant to the description.\n"
    "Answer in at most 3-4 short, easy-to-understand sentences. Do not start with a greeting. "
    "Be direct and helpful.\n";

std::string stripNul(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '\0') out.push_back(c);
    }
    return out;
}

std::string trim(const std::string& s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

InsightSynthesizer::InsightSynthesizer(std::shared_ptr<const LanguageModelClient> client,
                                       std::chrono::milliseconds timeout)
    : client_(std::move(client)), timeout_(timeout)
{
}

std::string InsightSynthesizer::buildPrompt(const InsightRequest& request)
{
    std::ostringstream p;
    p << kPreamble;

    std::string description = trim(stripNul(request.incident_description));
    p << "\n---\nUser's incident description:\n\""
      << (description.empty() ? "No description provided." : description) << "\"\n";

    p << "\n---\nClaim details:\n" << request.claim_summary;

    if (request.predicted_success) {
        p << "\nEstimated claim success likelihood: " << *request.predicted_success << "%\n";
    }

    if (request.policy && request.policy->meaningful) {
        std::string excerpt = stripNul(request.policy->text).substr(0, kPolicyExcerptChars);
        p << "\n---\nInsurance policy text:\n\"" << excerpt << "\"\n";
    }

    p << "---\n\nAI insights:\n";
    return p.str();
}

StageResult<std::string> InsightSynthesizer::synthesize(const InsightRequest& request) const
{
    if (!client_) {
        return StageResult<std::string>::degraded(kFallbackInsight, "no language model backend configured");
    }

    const std::string prompt = buildPrompt(request);

    // The worker owns its state, so a call that outlives the timeout
    // finishes in the background without touching this frame.
    auto promise = std::make_shared<std::promise<std::optional<std::string>>>();
    std::future<std::optional<std::string>> future = promise->get_future();
    auto slot = std::make_shared<WorkerSlot>(workerRegistry());
    try {
        std::thread([client = client_, promise, prompt, timeout = timeout_, slot]() mutable {
            try {
                promise->set_value(client->generate(prompt, timeout));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            client.reset();
            slot.reset();
        }).detach();
    } catch (const std::system_error& e) {
        CROW_LOG_ERROR << "[insights] cannot start generation thread: " << e.what();
        return StageResult<std::string>::degraded(kFallbackInsight, "insight generation could not start");
    }
    slot.reset();

    if (future.wait_for(timeout_) != std::future_status::ready) {
        CROW_LOG_WARNING << "[insights] " << client_->name() << " timed out after "
                         << timeout_.count() << " ms";
        return StageResult<std::string>::degraded(kFallbackInsight, "insight generation timed out");
    }

    try {
        std::optional<std::string> reply = future.get();
        std::string text = reply ? trim(*reply) : std::string();
        if (text.empty()) {
            CROW_LOG_WARNING << "[insights] " << client_->name() << " returned no usable text";
            return StageResult<std::string>::degraded(kFallbackInsight, "language model returned no usable text");
        }
        return StageResult<std::string>::ok(std::move(text));
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "[insights] " << client_->name() << " failed: " << e.what();
        return StageResult<std::string>::degraded(kFallbackInsight,
                                                  std::string("insight generation failed: ") + e.what());
    }
}

int InsightSynthesizer::activeWorkers()
{
    auto registry = workerRegistry();
    std::lock_guard<std::mutex> lock(registry->mutex);
    return registry->active;
}

bool InsightSynthesizer::waitForWorkers(std::chrono::milliseconds bound)
{
    auto registry = workerRegistry();
    std::unique_lock<std::mutex> lock(registry->mutex);
    return registry->idle.wait_for(lock, bound, [&] { return registry->active == 0; });
}
