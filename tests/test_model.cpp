#include <catch2/catch.hpp>
#include "mock_provider.hpp"
#include "model.hpp"
#include <optional>
#include <thread>

using namespace switchyard;
using namespace std::chrono_literals;

static ModelInferenceRequest hello_request() {
    ModelInferenceRequest request;
    request.system = "be brief";
    request.messages.push_back(RequestMessage{Role::User, {Text{"hello"}}});
    return request;
}

// ── Routing and fallback ─────────────────────────────────────────

TEST_CASE("ModelConfig: first provider answers", "[model]") {
    auto primary = std::make_unique<MockProvider>();
    primary->text = "from primary";
    auto backup = std::make_unique<MockProvider>();
    MockProvider* backup_raw = backup.get();

    ModelConfig model;
    model.add_provider("primary", std::move(primary));
    model.add_provider("backup", std::move(backup));

    auto result = model.infer(hello_request(), "my_model", CancellationToken{});
    REQUIRE(result.model_name == "my_model");
    REQUIRE(result.model_provider_name == "primary");
    REQUIRE(first_text(result.output) == "from primary");
    REQUIRE(result.system == std::optional<std::string>("be brief"));
    REQUIRE(result.input_messages.size() == 1);
    REQUIRE(result.usage == Usage{5, 7});
    REQUIRE(result.raw_response == "mock-response:from primary");
    REQUIRE_FALSE(result.id.empty());
    REQUIRE(backup_raw->call_count.load() == 0);
}

TEST_CASE("ModelConfig: falls back to the next provider on failure", "[model]") {
    auto primary = std::make_unique<MockProvider>();
    primary->fail = true;
    auto backup = std::make_unique<MockProvider>();
    backup->text = "from backup";

    ModelConfig model;
    model.add_provider("primary", std::move(primary));
    model.add_provider("backup", std::move(backup));
    REQUIRE(model.routing() == std::vector<std::string>{"primary", "backup"});

    auto result = model.infer(hello_request(), "my_model", CancellationToken{});
    REQUIRE(result.model_provider_name == "backup");
    REQUIRE(first_text(result.output) == "from backup");
}

TEST_CASE("ModelConfig: all providers failing lists every error", "[model]") {
    auto a = std::make_unique<MockProvider>();
    a->fail = true;
    ModelConfig model;
    model.add_provider("a", std::move(a));
    model.add_provider("b", std::make_unique<DummyProvider>("error"));

    try {
        model.infer(hello_request(), "my_model", CancellationToken{});
        FAIL("expected throw");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::ModelProvidersExhausted);
        REQUIRE(e.sub_errors().size() == 2);
        REQUIRE(e.sub_errors()[0].source() == "a");
        REQUIRE(e.sub_errors()[0].kind() == ErrorKind::InferenceClient);
        REQUIRE(e.sub_errors()[1].source() == "b");
    }
}

TEST_CASE("ModelConfig: duplicate provider name rejected", "[model]") {
    ModelConfig model;
    model.add_provider("p", std::make_unique<MockProvider>());
    REQUIRE_THROWS_AS(model.add_provider("p", std::make_unique<MockProvider>()), Error);
}

// ── Cancellation ─────────────────────────────────────────────────

TEST_CASE("ModelConfig: cancelled token stops before calling providers", "[model]") {
    ModelTable models;
    MockProvider* provider = add_mock_model(models, "m");
    CancellationToken cancel;
    cancel.cancel();
    try {
        models.get("m")->infer(hello_request(), "m", cancel);
        FAIL("expected throw");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::Cancelled);
    }
    REQUIRE(provider->call_count.load() == 0);
}

TEST_CASE("ModelConfig: cancellation mid-call is not a provider failure", "[model]") {
    auto slow = std::make_unique<MockProvider>();
    slow->delay = 10s;
    auto backup = std::make_unique<MockProvider>();
    MockProvider* backup_raw = backup.get();
    ModelConfig model;
    model.add_provider("slow", std::move(slow));
    model.add_provider("backup", std::move(backup));

    CancellationToken cancel;
    std::thread canceller([cancel] {
        std::this_thread::sleep_for(20ms);
        cancel.cancel();
    });
    std::optional<ErrorKind> kind;
    try {
        model.infer(hello_request(), "m", cancel);
    } catch (const Error& e) {
        kind = e.kind();
    }
    canceller.join();
    REQUIRE(kind == ErrorKind::Cancelled);
    REQUIRE(backup_raw->call_count.load() == 0);
}

// ── Streaming ────────────────────────────────────────────────────

TEST_CASE("ModelConfig: infer_stream falls back like infer", "[model]") {
    ModelConfig model;
    model.add_provider("broken", std::make_unique<DummyProvider>("error"));
    model.add_provider("good", std::make_unique<DummyProvider>("good"));

    auto request = hello_request();
    request.stream = true;
    auto stream = model.infer_stream(request, CancellationToken{});
    REQUIRE(stream.model_provider_name == "good");
    REQUIRE_FALSE(stream.raw_request.empty());

    std::string text = std::get<TextChunk>(stream.first_chunk.content[0]).text;
    while (auto chunk = stream.rest->next()) {
        for (const auto& fragment : chunk->content) {
            text += std::get<TextChunk>(fragment).text;
        }
    }
    REQUIRE(text == kDummyResponseText);
}

TEST_CASE("ModelConfig: infer_stream exhaustion", "[model]") {
    ModelConfig model;
    model.add_provider("broken", std::make_unique<DummyProvider>("error"));
    try {
        model.infer_stream(hello_request(), CancellationToken{});
        FAIL("expected throw");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::ModelProvidersExhausted);
        REQUIRE(e.sub_errors().size() == 1);
    }
}

// ── ModelTable ───────────────────────────────────────────────────

TEST_CASE("ModelTable: lookup and names", "[model]") {
    ModelTable models;
    add_mock_model(models, "zeta");
    add_mock_model(models, "alpha");
    REQUIRE(models.contains("zeta"));
    REQUIRE_FALSE(models.contains("missing"));
    REQUIRE(models.get("missing") == nullptr);
    REQUIRE(models.get("alpha") != nullptr);
    REQUIRE(models.names() == std::vector<std::string>{"alpha", "zeta"});
}
