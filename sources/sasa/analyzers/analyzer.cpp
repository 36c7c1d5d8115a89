//
// Created by gregorian-rayne on 1/9/26.
//

#include "sasa/analyzers/analyzer.hpp"
#include "sasa/analyzers/chunker.hpp"
#include "sasa/analyzers/complexity_analyzer.hpp"
#include "sasa/analyzers/dependency_analyzer.hpp"
#include "sasa/analyzers/table_extractor.hpp"
#include "sasa/lexer/lexer.hpp"
#include "sasa/utils/string_utils.hpp"

#include <algorithm>
#include <chrono>

namespace sasa::analyzers
{
    std::size_t estimate_tokens(const std::string_view text, const std::size_t chars_per_token) noexcept {
        if (chars_per_token == 0) {
            return 0;
        }
        return (text.size() + chars_per_token - 1) / chars_per_token;
    }

    Result<void, Error> validate_options(const AnalysisOptions& options) {
        if (options.token_budget == 0) {
            return Result<void, Error>::failure(
                Error::invalid_argument("token budget must be positive", "token_budget")
            );
        }
        if (options.chars_per_token == 0) {
            return Result<void, Error>::failure(
                Error::invalid_argument("chars per token must be positive", "chars_per_token")
            );
        }
        return Result<void, Error>::success();
    }

    Result<SourceUnit, Error> prepare_source(const std::string_view text, const AnalysisOptions& options) {
        if (string_utils::is_blank(text)) {
            return Result<SourceUnit, Error>::failure(
                Error::invalid_argument("source text is empty")
            );
        }
        if (text.find('\0') != std::string_view::npos) {
            return Result<SourceUnit, Error>::failure(
                Error::invalid_argument("source text contains NUL bytes", options.source_name)
            );
        }
        if (!string_utils::is_valid_utf8(text)) {
            return Result<SourceUnit, Error>::failure(
                Error::invalid_argument("source text is not valid UTF-8", options.source_name)
            );
        }

        SourceUnit unit;
        unit.text = std::string(text);

        auto lexed = lexer::tokenize(unit.text);
        unit.tokens = std::move(lexed.tokens);
        unit.anomalies = std::move(lexed.anomalies);

        unit.segmentation = Segmenter{}.segment(unit.text, unit.tokens);
        unit.anomalies.insert(unit.anomalies.end(),
                              unit.segmentation.anomalies.begin(),
                              unit.segmentation.anomalies.end());

        for (const auto& [name, value] : options.predefined_variables) {
            unit.resolver.predefine(name, value);
        }
        unit.resolver.collect(unit.text, unit.tokens);

        unit.libraries.collect(unit.text, unit.tokens, unit.resolver);
        unit.anomalies.insert(unit.anomalies.end(),
                              unit.libraries.anomalies().begin(),
                              unit.libraries.anomalies().end());

        return Result<SourceUnit, Error>::success(std::move(unit));
    }

    std::vector<std::unique_ptr<IAnalyzer>> create_analyzers(const AnalysisOptions& options) {
        std::vector<std::unique_ptr<IAnalyzer>> analyzers;
        analyzers.push_back(std::make_unique<TableExtractor>());
        if (!options.database_only) {
            analyzers.push_back(std::make_unique<DependencyAnalyzer>());
            analyzers.push_back(std::make_unique<ComplexityAnalyzer>());
            analyzers.push_back(std::make_unique<Chunker>());
        }
        return analyzers;
    }

    Result<AnalysisReport, Error> run_full_analysis(
        const SourceUnit& unit,
        const AnalysisOptions& options
    ) {
        AnalysisReport combined;
        const auto start_time = std::chrono::steady_clock::now();

        combined.source_name = options.source_name;
        combined.database_only = options.database_only;
        combined.variables = unit.resolver.snapshot();
        combined.anomalies = unit.anomalies;

        for (const auto analyzers = create_analyzers(options); const auto& analyzer : analyzers) {
            auto result = analyzer->analyze(unit, options);

            if (result.is_err()) {
                return Result<AnalysisReport, Error>::failure(
                    result.error().with_context(std::string(analyzer->name()))
                );
            }

            auto& partial = result.value();

            if (!partial.databases.databases.empty() || !partial.databases.unattributed.empty()) {
                combined.databases = std::move(partial.databases);
            }

            if (!partial.dependencies.macros.empty() || !partial.dependencies.calls.empty() ||
                !partial.dependencies.includes.empty() || !partial.dependencies.datasets.empty()) {
                combined.dependencies = std::move(partial.dependencies);
            }

            if (!partial.complexity.method.empty()) {
                combined.complexity = std::move(partial.complexity);
            }

            if (partial.chunking.token_budget > 0) {
                combined.chunking = std::move(partial.chunking);
            }

            combined.anomalies.insert(combined.anomalies.end(),
                                      std::make_move_iterator(partial.anomalies.begin()),
                                      std::make_move_iterator(partial.anomalies.end()));
        }

        std::ranges::stable_sort(combined.anomalies, [](const Anomaly& a, const Anomaly& b) {
            return a.span.begin < b.span.begin;
        });

        const auto end_time = std::chrono::steady_clock::now();
        combined.analysis_time = std::chrono::system_clock::now();
        combined.analysis_duration = std::chrono::duration_cast<Duration>(end_time - start_time);

        return Result<AnalysisReport, Error>::success(std::move(combined));
    }

    Result<AnalysisReport, Error> analyze(const std::string_view source_text, const AnalysisOptions& options) {
        if (auto valid = validate_options(options); valid.is_err()) {
            return Result<AnalysisReport, Error>::failure(valid.error());
        }

        auto unit = prepare_source(source_text, options);
        if (unit.is_err()) {
            return Result<AnalysisReport, Error>::failure(unit.error());
        }

        return run_full_analysis(unit.value(), options);
    }

}  // namespace sasa::analyzers
