#include "promptmap/pipeline.hpp"
#include "promptmap/error.hpp"
#include "promptmap/logging.hpp"
#include "promptmap/parse/parser.hpp"

namespace promptmap {

Pipeline::Pipeline(std::unique_ptr<tokenize::AdapterRegistry> registry,
                   parse::ParserTuning parser_tuning,
                   tokenize::WalkerTuning walker_tuning)
    : registry_(std::move(registry))
    , parser_tuning_(parser_tuning)
    , walker_tuning_(walker_tuning) {
    PROMPTMAP_CHECK_ARGUMENT(registry_ != nullptr, "Pipeline requires an adapter registry");
}

std::unique_ptr<Pipeline> Pipeline::from_config() {
    return std::make_unique<Pipeline>(tokenize::AdapterRegistry::from_config(),
                                      parse::ParserTuning::from_config(),
                                      tokenize::WalkerTuning::from_config());
}

RequestId Pipeline::submit_parse(std::string text, parse::ParseOptions options, ParseRequestSink sink) {
    PROMPTMAP_CHECK_ARGUMENT(static_cast<bool>(sink), "submit_parse requires an event sink");

    RequestId id = next_id_.fetch_add(1);
    LOG_DEBUG("Queued parse request ", id, " (", text.size(), " bytes)");

    parse_worker_.submit([this, id, text = std::move(text), options, sink = std::move(sink)]() {
        try {
            parse::parse_markup(text, options,
                                [&](const parse::ParseEvent& event) { sink(id, event); },
                                parser_tuning_);
        } catch (const std::exception& e) {
            LOG_ERROR("Parse request ", id, ": event sink threw: ", e.what());
        }
    });
    return id;
}

RequestId Pipeline::submit_tokenize(ParsedNodePtr root, std::string model_id, TokenizeRequestSink sink) {
    PROMPTMAP_CHECK_ARGUMENT(static_cast<bool>(sink), "submit_tokenize requires an event sink");

    RequestId id = next_id_.fetch_add(1);
    LOG_DEBUG("Queued tokenize request ", id, " for '", model_id, "'");

    tokenize_worker_.submit([this, id, root = std::move(root), model_id = std::move(model_id),
                             sink = std::move(sink)]() {
        tokenize::TokenizationWalker walker(*registry_, walker_tuning_);
        try {
            walker.run(root, model_id, [&](const tokenize::TokenizeEvent& event) { sink(id, event); });
        } catch (const std::exception& e) {
            LOG_ERROR("Tokenize request ", id, ": event sink threw: ", e.what());
        }
    });
    return id;
}

void Pipeline::wait_idle() {
    parse_worker_.wait_idle();
    tokenize_worker_.wait_idle();
}

} // namespace promptmap
