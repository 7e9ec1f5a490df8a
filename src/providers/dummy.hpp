#pragma once
#include "../provider.hpp"
#include <atomic>
#include <chrono>
#include <string>

namespace switchyard {

// Canned text returned by the "good" dummy model
extern const char* const kDummyResponseText;

// Deterministic in-process provider. Its behaviour is chosen by model name:
// good, json, json_cot, tool, reasoner, echo, error*, flaky_*, slow,
// best_of_n_<k>, best_of_n_big, bad_judge.
class DummyProvider : public Provider {
public:
    explicit DummyProvider(std::string model_name,
                           std::chrono::milliseconds delay = std::chrono::milliseconds(0));

    ProviderInferenceResponse infer(const ModelInferenceRequest& request,
                                    const CancellationToken& cancel) override;

    ProviderStream infer_stream(const ModelInferenceRequest& request,
                                const CancellationToken& cancel) override;

    std::string provider_type() const override { return "dummy"; }

    const std::string& model_name() const { return model_name_; }

private:
    // Sleeps for the configured latency and fails per model name
    void simulate_call(const CancellationToken& cancel);
    std::vector<ContentBlock> output_for(const ModelInferenceRequest& request) const;
    std::string raw_request_for(const ModelInferenceRequest& request) const;

    std::string model_name_;
    std::chrono::milliseconds delay_;
    std::atomic<uint32_t> calls_{0};
};

} // namespace switchyard
