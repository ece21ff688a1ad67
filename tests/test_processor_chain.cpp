#include <catch2/catch_test_macros.hpp>
#include "processor/processor_chain.hpp"
#include "processor/processor_chain_builder.hpp"
#include "processor/processor_factory.hpp"
#include "processor/remove_post_data_processor.hpp"
#include "processor/remove_stack_locals_processor.hpp"
#include "processor/sanitize_sensitive_fields_processor.hpp"
#include "config/config_types.hpp"
#include "mocks/event_fixtures.hpp"
#include "mocks/mock_processor.hpp"

#include <stdexcept>
#include <vector>

using namespace eventscrub;
using namespace eventscrub::testing;

static const std::string kMask(SanitizeSensitiveFieldsProcessor::kDefaultMask);

// ============================================================================
// ProcessorChain
// ============================================================================

TEST_CASE("ProcessorChain: processors run in the configured order", "[chain]") {
    std::vector<std::unique_ptr<IProcessor>> processors;
    processors.push_back(std::make_unique<RecordingProcessor>("first"));
    processors.push_back(std::make_unique<RecordingProcessor>("second"));
    processors.push_back(std::make_unique<RecordingProcessor>("third"));
    const ProcessorChain chain(std::move(processors));

    auto result = chain.process(EventDocument::object());
    REQUIRE(result.is_ok());
    CHECK(result.value()["trail"] == EventDocument::array({"first", "second", "third"}));

    const std::vector<std::string> expected = {"first", "second", "third"};
    CHECK(chain.processor_names() == expected);
    CHECK(chain.size() == 3);
}

TEST_CASE("ProcessorChain: empty chain returns the event unchanged", "[chain]") {
    const ProcessorChain chain(std::vector<std::unique_ptr<IProcessor>>{});
    CHECK(chain.empty());

    const EventDocument event = http_event();
    auto result = chain.process(event);
    REQUIRE(result.is_ok());
    CHECK(result.value() == event);
}

TEST_CASE("ProcessorChain: caller's document is not aliased", "[chain]") {
    std::vector<std::unique_ptr<IProcessor>> processors;
    processors.push_back(std::make_unique<SanitizeSensitiveFieldsProcessor>());
    const ProcessorChain chain(std::move(processors));

    const EventDocument original = http_event();
    auto result = chain.process(original);
    REQUIRE(result.is_ok());

    CHECK(original["request"]["data"]["password"] == "hello");
    CHECK(result.value()["request"]["data"]["password"] == kMask);
}

TEST_CASE("ProcessorChain: failing processor aborts and is reported", "[chain]") {
    std::vector<std::unique_ptr<IProcessor>> processors;
    processors.push_back(std::make_unique<RecordingProcessor>("before"));
    processors.push_back(std::make_unique<ThrowingProcessor>());
    processors.push_back(std::make_unique<RecordingProcessor>("after"));
    const ProcessorChain chain(std::move(processors));

    auto result = chain.process(EventDocument::object());
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::PROCESSOR_ERROR);
    CHECK(result.failure().source == "throwing");
    CHECK(result.failure().message == "internal fault");
    CHECK(result.error_message() == "throwing: internal fault");
}

TEST_CASE("ProcessorChain: null processor is rejected", "[chain]") {
    std::vector<std::unique_ptr<IProcessor>> processors;
    processors.push_back(nullptr);
    CHECK_THROWS_AS(ProcessorChain(std::move(processors)), std::invalid_argument);
}

TEST_CASE("ProcessorChain: remove locals before sanitize leaves no vars", "[chain]") {
    auto chain = ProcessorChainBuilder()
        .with_processor("remove_stack_locals")
        .with_processor("sanitize_sensitive_fields")
        .build();

    auto result = chain->process(stack_trace_event());
    REQUIRE(result.is_ok());

    size_t frames = 0;
    doc::for_each_frame(result.value(), [&frames](EventDocument& frame) {
        ++frames;
        CHECK_FALSE(frame.contains("vars"));
    });
    CHECK(frames == 2);
}

TEST_CASE("ProcessorChain: sanitize before remove also ends with no vars", "[chain]") {
    auto chain = ProcessorChainBuilder()
        .with_processor("sanitize_sensitive_fields")
        .with_processor("remove_stack_locals")
        .with_processor("remove_post_data")
        .build();

    auto result = chain->process(http_event());
    REQUIRE(result.is_ok());
    const auto& event = result.value();

    CHECK_FALSE(event["request"].contains("data"));
    CHECK(event["request"]["env"]["password"] == kMask);
    CHECK_FALSE(event["exception"]["values"][0]["stacktrace"]["frames"][1].contains("vars"));
}

// ============================================================================
// ProcessorChainBuilder / factory
// ============================================================================

TEST_CASE("ProcessorChainBuilder: identifiers and instances mix in order", "[chain][builder]") {
    auto chain = ProcessorChainBuilder()
        .with_processor(std::make_unique<RecordingProcessor>("custom"))
        .with_processor("remove_post_data")
        .build();

    const std::vector<std::string> expected = {"custom", "remove_post_data"};
    CHECK(chain->processor_names() == expected);
}

TEST_CASE("ProcessorChainBuilder: sanitizer config applies to identifiers", "[chain][builder]") {
    SanitizeSensitiveFieldsProcessor::Config config;
    config.mask = "<hidden>";

    auto chain = ProcessorChainBuilder()
        .with_processor("sanitize_sensitive_fields")
        .with_sanitizer_config(config)
        .build();

    auto result = chain->process(http_event());
    REQUIRE(result.is_ok());
    CHECK(result.value()["request"]["headers"]["api_key"] == "<hidden>");
}

TEST_CASE("ProcessorChainBuilder: unknown identifier throws", "[chain][builder]") {
    ProcessorChainBuilder builder;
    builder.with_processor("remove_everything");
    CHECK_THROWS_AS(builder.build(), std::invalid_argument);
}

TEST_CASE("ProcessorChainBuilder: empty builder throws", "[chain][builder]") {
    ProcessorChainBuilder builder;
    CHECK_THROWS_AS(builder.build(), std::runtime_error);
}

TEST_CASE("ProcessorChainBuilder: from_config follows config order", "[chain][builder]") {
    ScrubberConfig config;
    config.processors = {"remove_post_data", "sanitize_passwords"};
    config.sanitizer.mask = "X";

    auto chain = ProcessorChainBuilder::from_config(config).build();
    const std::vector<std::string> expected = {"remove_post_data", "sanitize_sensitive_fields"};
    CHECK(chain->processor_names() == expected);

    auto result = chain->process(http_event());
    REQUIRE(result.is_ok());
    CHECK(result.value()["request"]["cookies"]["password"] == "X");
}

TEST_CASE("ProcessorFactory: identifier parsing", "[chain][factory]") {
    CHECK(parse_processor_kind("sanitize_sensitive_fields") == ProcessorKind::SANITIZE_SENSITIVE_FIELDS);
    CHECK(parse_processor_kind("sanitize_passwords") == ProcessorKind::SANITIZE_SENSITIVE_FIELDS);
    CHECK(parse_processor_kind(" Remove_Post_Data ") == ProcessorKind::REMOVE_POST_DATA);
    CHECK(parse_processor_kind("remove_stack_locals") == ProcessorKind::REMOVE_STACK_LOCALS);
    CHECK_FALSE(parse_processor_kind("").has_value());
    CHECK_FALSE(parse_processor_kind("unknown").has_value());

    for (auto kind : {ProcessorKind::SANITIZE_SENSITIVE_FIELDS,
                      ProcessorKind::REMOVE_POST_DATA,
                      ProcessorKind::REMOVE_STACK_LOCALS}) {
        const auto processor = create_processor(kind);
        REQUIRE(processor != nullptr);
        CHECK(processor->name() == processor_kind_to_string(kind));
        CHECK(parse_processor_kind(processor_kind_to_string(kind)) == kind);
    }

    CHECK_THROWS_AS(create_processor("nope"), std::invalid_argument);
}
