// ─────────────────────────────────────────────────────────────
//  llama_client.cpp: insight generation on llama.cpp b4570
// ─────────────────────────────────────────────────────────────
#include "llama_client.h"

#include <memory>
#include <vector>
#include <crow/logging.h>

// ─── Global parameters ───────────────────────────────────────
static constexpr int32_t N_GPU_LAYERS = 99;     // Metal / CUDA
static constexpr int32_t N_THREADS    = 8;
static constexpr int32_t N_CTX        = 4096;
static constexpr int32_t N_PREDICT    = 256;    // 3-4 sentences

namespace {

struct ContextDeleter {
    void operator()(llama_context* ctx) const { llama_free(ctx); }
};
struct SamplerDeleter {
    void operator()(llama_sampler* s) const { llama_sampler_free(s); }
};

} // namespace

LlamaClient::LlamaClient() = default;

LlamaClient::~LlamaClient()
{
    if (model_) llama_model_free(model_);
    if (backend_ready_) llama_backend_free();
}

/* ----------------------------------------------------------- */
bool LlamaClient::initializeLlama(const std::string& model_path)
{
    if (!backend_ready_) {
        llama_backend_init();
        backend_ready_ = true;
    }
    if (model_) {
        llama_model_free(model_);
        model_ = nullptr;
        model_path_.clear();
    }

    llama_model_params mp = llama_model_default_params();
    mp.n_gpu_layers = N_GPU_LAYERS;

    model_ = llama_model_load_from_file(model_path.c_str(), mp);
    if (!model_) {
        CROW_LOG_ERROR << "[llama] cannot load model: " << model_path;
        return false;
    }
    model_path_ = model_path;

    CROW_LOG_INFO << "[llama] initialised " << model_path
                  << "  n_ctx=" << N_CTX << "  gpu_layers=" << mp.n_gpu_layers;
    return true;
}

std::string LlamaClient::chatPrompt(const std::string& prompt)
{
    return "<|user|>\n" + prompt + "<|end|>\n<|assistant|>\n";
}

std::unique_lock<std::timed_mutex>
LlamaClient::reserveDecoder(std::chrono::steady_clock::time_point deadline) const
{
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_until(deadline)) return lock;
    // Acquired right at the deadline: nothing left to spend on decoding.
    if (std::chrono::steady_clock::now() >= deadline) lock.unlock();
    return lock;
}

/* ----------------------------------------------------------- */
std::optional<std::string> LlamaClient::generate(const std::string& prompt,
                                                 std::chrono::milliseconds timeout) const
{
    if (!model_) return std::nullopt;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::timed_mutex> lock = reserveDecoder(deadline);
    if (!lock.owns_lock()) {
        CROW_LOG_WARNING << "[llama] decoder busy until the deadline, request dropped";
        return std::nullopt;
    }

    // Fresh context per request: no KV state leaks between claims.
    llama_context_params cp = llama_context_default_params();
    cp.n_ctx     = N_CTX;
    cp.n_batch   = N_CTX;
    cp.n_threads = N_THREADS;
    std::unique_ptr<llama_context, ContextDeleter> ctx(llama_init_from_model(model_, cp));
    if (!ctx) {
        CROW_LOG_ERROR << "[llama] cannot create llama_context";
        return std::nullopt;
    }

    const llama_vocab* vocab = llama_model_get_vocab(model_);
    const std::string text = chatPrompt(prompt);

    /* 1. tokenize prompt (with BOS) */
    int n_prompt = -llama_tokenize(vocab, text.c_str(), static_cast<int32_t>(text.size()),
                                   nullptr, 0, /*add_special=*/true, /*parse_special=*/true);
    if (n_prompt <= 0 || n_prompt + N_PREDICT > N_CTX) {
        CROW_LOG_WARNING << "[llama] prompt does not fit the context (" << n_prompt << " tokens)";
        return std::nullopt;
    }
    std::vector<llama_token> tok(n_prompt);
    if (llama_tokenize(vocab, text.c_str(), static_cast<int32_t>(text.size()),
                       tok.data(), static_cast<int32_t>(tok.size()), true, true) < 0) {
        CROW_LOG_WARNING << "[llama] tokenize error";
        return std::nullopt;
    }

    /* 2. sampler chain */
    llama_sampler_chain_params sp = llama_sampler_chain_default_params();
    sp.no_perf = true;
    std::unique_ptr<llama_sampler, SamplerDeleter> smpl(llama_sampler_chain_init(sp));
    llama_sampler_chain_add(smpl.get(), llama_sampler_init_temp(0.20f));
    llama_sampler_chain_add(smpl.get(), llama_sampler_init_top_p(0.80f, 1));
    llama_sampler_chain_add(smpl.get(), llama_sampler_init_dist(LLAMA_DEFAULT_SEED));

    /* 3. decode loop */
    llama_batch batch = llama_batch_get_one(tok.data(), static_cast<int32_t>(tok.size()));
    llama_token next_id = 0;
    std::string out;
    int n_decode = 0;

    while (n_decode < N_PREDICT) {
        if (std::chrono::steady_clock::now() > deadline) {
            CROW_LOG_WARNING << "[llama] deadline reached after " << n_decode << " tokens";
            break;
        }
        if (llama_decode(ctx.get(), batch)) {
            CROW_LOG_ERROR << "[llama] llama_decode failed";
            return std::nullopt;
        }

        next_id = llama_sampler_sample(smpl.get(), ctx.get(), -1);
        if (llama_vocab_is_eog(vocab, next_id)) break;

        char buf[128];
        int n = llama_token_to_piece(vocab, next_id, buf, sizeof(buf), 0, false);
        if (n > 0) out.append(buf, n);

        batch = llama_batch_get_one(&next_id, 1);
        n_decode++;
    }

    CROW_LOG_DEBUG << "[llama] decoded " << n_decode << " tokens, got " << out.size() << " chars";
    if (out.empty()) return std::nullopt;
    return out;
}
