#include "analyzer/analyzer.hpp"
#include "analyzer/span_resolver.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <exception>
#include <format>
#include <future>
#include <memory>
#include <thread>

namespace piishield {

namespace {

/**
 * @brief Run one recognizer on a detached worker.
 *
 * The worker owns shared references to the recognizer and to a copy of the
 * text, so a pass that gives up on it (timeout) can return while the worker
 * finishes in the background without touching freed memory. `done` is set
 * once detect() has returned or thrown.
 *
 * @throws std::system_error when no thread can be started
 */
std::future<std::vector<Span>> launch_detached(
    std::shared_ptr<const IRecognizer> recognizer,
    std::shared_ptr<const std::string> text,
    std::shared_ptr<std::atomic<bool>> done) {

    std::promise<std::vector<Span>> promise;
    auto future = promise.get_future();

    std::thread([recognizer = std::move(recognizer),
                 text = std::move(text),
                 done = std::move(done),
                 promise = std::move(promise)]() mutable {
        try {
            auto spans = recognizer->detect(*text);
            done->store(true);
            promise.set_value(std::move(spans));
        } catch (...) {
            done->store(true);
            promise.set_exception(std::current_exception());
        }
    }).detach();

    return future;
}

std::string describe_exception(const std::exception_ptr& ep) {
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // anonymous namespace

Analyzer::Analyzer(const RecognizerRegistry& registry, AnalyzerOptions options)
    : registry_(registry),
      options_(std::move(options)),
      entity_filter_(options_.entities.begin(), options_.entities.end()) {}

AnalysisResult Analyzer::analyze(std::string_view text) const {
    return analyze(text, registry_.snapshot());
}

AnalysisResult Analyzer::analyze(std::string_view text, const RegistrySnapshot& snapshot) const {
    AnalysisResult result;
    if (text.empty() || !snapshot || snapshot->empty()) {
        return result;
    }

    const bool use_workers = options_.parallel || options_.recognizer_timeout.count() > 0;
    auto outcomes = use_workers ? run_on_workers(text, *snapshot) : run_inline(text, *snapshot);

    std::vector<Span> candidates;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        collect(*snapshot->recognizers[i], std::move(outcomes[i]), text.size(),
                candidates, result.warnings);
    }

    result.spans = resolve_conflicts(std::move(candidates));
    return result;
}

std::vector<Analyzer::Outcome> Analyzer::run_inline(std::string_view text,
                                                    const RecognizerSet& set) const {
    std::vector<Outcome> outcomes(set.size());
    for (size_t i = 0; i < set.size(); ++i) {
        try {
            outcomes[i].spans = set.recognizers[i]->detect(text);
        } catch (...) {
            outcomes[i].failure = RecognizerFailure{
                set.recognizers[i]->name(), FailureKind::FAULT,
                describe_exception(std::current_exception())};
        }
    }
    return outcomes;
}

std::vector<Analyzer::Outcome> Analyzer::run_on_workers(std::string_view text,
                                                        const RecognizerSet& set) const {
    const auto shared_text = std::make_shared<const std::string>(text);
    const auto budget = options_.recognizer_timeout;
    const bool bounded = budget.count() > 0;

    std::vector<Outcome> outcomes(set.size());

    struct Launched {
        std::future<std::vector<Span>> future;
        DoneFlag done;
    };

    // Empty when the recognizer did not get a worker; outcomes[i] says why
    auto launch = [&](size_t i) -> std::optional<Launched> {
        const auto& recognizer = set.recognizers[i];
        if (bounded && still_running(recognizer.get())) {
            outcomes[i].failure = RecognizerFailure{
                recognizer->name(), FailureKind::TIMEOUT,
                "previous invocation still running past its budget"};
            return std::nullopt;
        }
        auto done = std::make_shared<std::atomic<bool>>(false);
        try {
            return Launched{launch_detached(recognizer, shared_text, done), done};
        } catch (const std::exception& e) {
            outcomes[i].failure = RecognizerFailure{
                recognizer->name(), FailureKind::FAULT,
                std::format("could not start worker: {}", e.what())};
            return std::nullopt;
        }
    };

    auto await = [&](size_t i, Launched& launched,
                     std::chrono::steady_clock::time_point deadline) {
        const auto& recognizer = set.recognizers[i];
        if (bounded && launched.future.wait_until(deadline) != std::future_status::ready) {
            abandon(recognizer, std::move(launched.done));
            outcomes[i].failure = RecognizerFailure{
                recognizer->name(), FailureKind::TIMEOUT,
                std::format("exceeded {} ms budget", budget.count())};
            return;
        }
        try {
            outcomes[i].spans = launched.future.get();
        } catch (...) {
            outcomes[i].failure = RecognizerFailure{
                recognizer->name(), FailureKind::FAULT,
                describe_exception(std::current_exception())};
        }
    };

    if (options_.parallel) {
        std::vector<std::optional<Launched>> launched;
        launched.reserve(set.size());
        const auto deadline = std::chrono::steady_clock::now() + budget;
        for (size_t i = 0; i < set.size(); ++i) {
            launched.push_back(launch(i));
        }
        for (size_t i = 0; i < launched.size(); ++i) {
            if (launched[i]) {
                await(i, *launched[i], deadline);
            }
        }
    } else {
        for (size_t i = 0; i < set.size(); ++i) {
            if (auto launched = launch(i)) {
                await(i, *launched, std::chrono::steady_clock::now() + budget);
            }
        }
    }
    return outcomes;
}

bool Analyzer::still_running(const IRecognizer* recognizer) const {
    std::lock_guard<std::mutex> lock(abandoned_->mutex);
    const auto it = abandoned_->workers.find(recognizer);
    if (it == abandoned_->workers.end()) {
        return false;
    }
    if (it->second.done->load()) {
        abandoned_->workers.erase(it);
        return false;
    }
    return true;
}

void Analyzer::abandon(const std::shared_ptr<const IRecognizer>& recognizer, DoneFlag done) const {
    std::lock_guard<std::mutex> lock(abandoned_->mutex);
    std::erase_if(abandoned_->workers, [](const auto& entry) {
        return entry.second.done->load();
    });
    abandoned_->workers.insert_or_assign(recognizer.get(), Abandoned{recognizer, std::move(done)});
}

void Analyzer::collect(const IRecognizer& recognizer,
                       Outcome&& outcome,
                       size_t text_size,
                       std::vector<Span>& spans,
                       std::vector<RecognizerFailure>& warnings) const {
    if (outcome.failure) {
        utils::log::warn(std::format("Recognizer '{}' dropped ({}): {}",
            outcome.failure->recognizer,
            failure_kind_to_string(outcome.failure->kind),
            outcome.failure->message));
        warnings.emplace_back(std::move(*outcome.failure));
        return;
    }

    size_t invalid = 0;
    for (auto& span : outcome.spans) {
        if (!span.valid_for(text_size)) {
            ++invalid;
            continue;
        }
        if (!entity_filter_.empty() && !entity_filter_.contains(span.type)) {
            continue;
        }
        if (span.score < options_.score_threshold) {
            continue;
        }
        if (span.recognizer.empty()) {
            span.recognizer = recognizer.name();
        }
        spans.emplace_back(std::move(span));
    }

    if (invalid > 0) {
        auto message = std::format("{} span(s) outside the text or with score outside [0, 1]",
                                   invalid);
        utils::log::warn(std::format("Recognizer '{}': {}", recognizer.name(), message));
        warnings.push_back(RecognizerFailure{
            recognizer.name(), FailureKind::INVALID_SPAN, std::move(message)});
    }
}

} // namespace piishield
