#include <catch2/catch.hpp>
#include "function.hpp"
#include "inference/collect.hpp"
#include "mock_provider.hpp"
#include <map>
#include <optional>
#include <thread>

using namespace switchyard;
using namespace std::chrono_literals;

static VariantConfig first_of_n(std::vector<std::string> candidates, double timeout_s = 5.0) {
    FirstOfNConfig cfg;
    cfg.candidates = std::move(candidates);
    cfg.timeout_s = timeout_s;
    return VariantConfig{cfg};
}

static Error infer_failure(const VariantConfig& variant, const ModelTable& models,
                           const FunctionConfig& fn) {
    try {
        variant.infer(user_input("hi"), models, fn, test_context("race"));
    } catch (const Error& e) {
        return e;
    }
    FAIL("expected inference to fail");
    return Error::config("unreachable");
}

// ── Winning ──────────────────────────────────────────────────────

TEST_CASE("FirstOfN: fastest candidate wins with a single record", "[first_of_n]") {
    ModelTable models;
    MockProvider* fast = add_mock_model(models, "fast_model");
    fast->text = "fast answer";
    MockProvider* slow = add_mock_model(models, "slow_model");
    slow->text = "slow answer";
    slow->delay = 10s;

    FunctionConfig fn(FunctionType::Chat, "chat");
    fn.add_variant("slow", VariantConfig{chat_variant("slow_model")});
    fn.add_variant("fast", VariantConfig{chat_variant("fast_model")});

    auto start = std::chrono::steady_clock::now();
    auto result = first_of_n({"slow", "fast"}).infer(user_input("hi"), models, fn,
                                                     test_context("race"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(first_text(result.content) == "fast answer");
    REQUIRE(result.model_inference_results.size() == 1);
    REQUIRE(result.model_inference_results[0].model_name == "fast_model");
    REQUIRE(result.usage == Usage{5, 7});
    REQUIRE(result.inference_id == "test-inference");

    // The loser was cancelled and joined before infer returned
    REQUIRE(slow->cancelled_count.load() == slow->call_count.load());
    REQUIRE(slow->completed_count.load() == 0);
    REQUIRE(elapsed < 5s);
}

TEST_CASE("FirstOfN: failed candidates do not stop the race", "[first_of_n]") {
    ModelTable models;
    add_dummy_model(models, "broken", "error");
    MockProvider* ok = add_mock_model(models, "ok_model");
    ok->text = "survivor";
    ok->delay = 50ms;

    FunctionConfig fn(FunctionType::Chat, "chat");
    fn.add_variant("broken", VariantConfig{chat_variant("broken")});
    fn.add_variant("ok", VariantConfig{chat_variant("ok_model")});

    auto result = first_of_n({"broken", "ok"}).infer(user_input("hi"), models, fn,
                                                     test_context("race"));
    REQUIRE(first_text(result.content) == "survivor");
    REQUIRE(result.model_inference_results.size() == 1);
}

TEST_CASE("FirstOfN: unknown candidate counts as that candidate's failure", "[first_of_n]") {
    ModelTable models;
    add_dummy_model(models, "good", "good");
    FunctionConfig fn(FunctionType::Chat, "chat");
    fn.add_variant("good", VariantConfig{chat_variant("good")});

    auto result = first_of_n({"ghost", "good"}).infer(user_input("hi"), models, fn,
                                                      test_context("race"));
    REQUIRE(first_text(result.content) == kDummyResponseText);
}

// ── Failing ──────────────────────────────────────────────────────

TEST_CASE("FirstOfN: zero candidates is an Inference error", "[first_of_n]") {
    ModelTable models;
    FunctionConfig fn(FunctionType::Chat, "chat");
    Error e = infer_failure(first_of_n({}), models, fn);
    REQUIRE(e.kind() == ErrorKind::Inference);
    REQUIRE(e.sub_errors().empty());
}

TEST_CASE("FirstOfN: all failures are aggregated by candidate", "[first_of_n]") {
    ModelTable models;
    add_dummy_model(models, "broken", "error");
    FunctionConfig fn(FunctionType::Chat, "chat");
    fn.add_variant("a", VariantConfig{chat_variant("broken")});
    fn.add_variant("b", VariantConfig{chat_variant("missing")});

    Error e = infer_failure(first_of_n({"a", "b", "ghost"}), models, fn);
    REQUIRE(e.kind() == ErrorKind::Inference);
    REQUIRE(e.message() == "All candidates failed in first of n variant race");
    REQUIRE(e.sub_errors().size() == 3);

    std::map<std::string, ErrorKind> by_source;
    for (const auto& sub : e.sub_errors()) by_source[sub.source()] = sub.kind();
    REQUIRE(by_source["a"] == ErrorKind::ModelProvidersExhausted);
    REQUIRE(by_source["b"] == ErrorKind::ModelNotFound);
    REQUIRE(by_source["ghost"] == ErrorKind::UnknownCandidate);
}

TEST_CASE("FirstOfN: every candidate timing out", "[first_of_n]") {
    ModelTable models;
    MockProvider* a = add_mock_model(models, "model_a");
    a->delay = 10s;
    add_dummy_model(models, "model_b", "slow");

    FunctionConfig fn(FunctionType::Chat, "chat");
    fn.add_variant("a", VariantConfig{chat_variant("model_a")});
    fn.add_variant("b", VariantConfig{chat_variant("model_b")});

    auto start = std::chrono::steady_clock::now();
    Error e = infer_failure(first_of_n({"a", "b"}, 0.05), models, fn);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(e.kind() == ErrorKind::Inference);
    REQUIRE(e.sub_errors().size() == 2);
    for (const auto& sub : e.sub_errors()) {
        REQUIRE(sub.kind() == ErrorKind::InferenceTimeout);
        REQUIRE(sub.variant_name() == sub.source());
    }
    REQUIRE(elapsed < 3s);
    REQUIRE(a->completed_count.load() == 0);
}

TEST_CASE("FirstOfN: a very large timeout does not expire candidates", "[first_of_n]") {
    ModelTable models;
    add_dummy_model(models, "good_model", "good");
    FunctionConfig fn(FunctionType::Chat, "chat");
    fn.add_variant("good", VariantConfig{chat_variant("good_model")});

    auto result = first_of_n({"good"}, 1e10).infer(user_input("hi"), models, fn,
                                                   test_context("race"));
    REQUIRE(first_text(result.content) == kDummyResponseText);
}

TEST_CASE("FirstOfN: caller cancellation stops every candidate", "[first_of_n]") {
    ModelTable models;
    MockProvider* a = add_mock_model(models, "model_a");
    a->delay = 10s;
    FunctionConfig fn(FunctionType::Chat, "chat");
    fn.add_variant("a", VariantConfig{chat_variant("model_a")});

    auto ctx = test_context("race");
    std::thread canceller([cancel = ctx.cancel] {
        std::this_thread::sleep_for(30ms);
        cancel.cancel();
    });
    std::optional<Error> failure;
    try {
        first_of_n({"a"}).infer(user_input("hi"), models, fn, ctx);
    } catch (const Error& e) {
        failure = e;
    }
    canceller.join();

    REQUIRE(failure.has_value());
    REQUIRE(failure->sub_errors().size() == 1);
    REQUIRE(failure->sub_errors()[0].kind() == ErrorKind::Cancelled);
    REQUIRE(a->cancelled_count.load() == a->call_count.load());
    REQUIRE(a->completed_count.load() == 0);
}

// ── Streaming and validation ─────────────────────────────────────

TEST_CASE("FirstOfN: infer_stream replays the winner", "[first_of_n]") {
    ModelTable models;
    add_dummy_model(models, "good", "good");
    FunctionConfig fn(FunctionType::Chat, "chat");
    fn.add_variant("good", VariantConfig{chat_variant("good")});
    auto ctx = test_context("race");

    auto stream = first_of_n({"good"}).infer_stream(user_input("hi"), models, fn, ctx);
    REQUIRE(stream.model_used_info.model_name == "good");
    auto result = collect_stream(std::move(stream), fn, ctx);
    REQUIRE(first_text(result.content) == kDummyResponseText);
    REQUIRE(result.model_inference_results.size() == 1);
}

TEST_CASE("FirstOfN: validate", "[first_of_n]") {
    ModelTable models;
    add_mock_model(models, "m");
    FunctionConfig fn(FunctionType::Chat, "chat");
    fn.add_variant("good", VariantConfig{chat_variant("m")});
    fn.add_variant("bad", VariantConfig{chat_variant("missing")});
    TemplateConfig templates;

    REQUIRE_NOTHROW(first_of_n({"good"}).validate(fn, models, templates, "race"));
    REQUIRE_THROWS_AS(first_of_n({"good", "bad"}).validate(fn, models, templates, "race"), Error);
    REQUIRE_THROWS_AS(first_of_n({"good"}, 0.0).validate(fn, models, templates, "race"), Error);
    REQUIRE_THROWS_AS(first_of_n({"good"}, 1e10).validate(fn, models, templates, "race"), Error);
}
