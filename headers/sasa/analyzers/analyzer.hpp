//
// Created by gregorian-rayne on 1/7/26.
//

#ifndef SASA_ANALYZER_HPP
#define SASA_ANALYZER_HPP

/**
 * @file analyzer.hpp
 * @brief Analysis interface, report types and the analyze() entry point.
 *
 * A source text is validated, tokenized and segmented once into a SourceUnit.
 * Independent analyzers then read the unit and each fill one section of the
 * report:
 *
 * - TableExtractor: databases and the tables each one touches
 * - DependencyAnalyzer: macro call graph and conversion order
 * - ComplexityAnalyzer: per-block line counts and cyclomatic complexity
 * - Chunker: token-budgeted chunks with macro placeholders
 *
 * Every run builds its own analyzers, resolver and registry, so analyses of
 * different inputs may run concurrently.
 */

#include "sasa/analyzers/library_registry.hpp"
#include "sasa/analyzers/segmenter.hpp"
#include "sasa/analyzers/variable_resolver.hpp"
#include "sasa/error.hpp"
#include "sasa/lexer/token.hpp"
#include "sasa/result.hpp"
#include "sasa/types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sasa::analyzers {

    /**
     * Options controlling a single analysis run.
     */
    struct AnalysisOptions {
        std::size_t token_budget = 4000;
        std::size_t chars_per_token = 4;
        bool database_only = false;
        bool include_unused_libraries = false;

        /// Bindings visible before the first %let.
        std::map<std::string, std::string> predefined_variables;

        /// Library aliases whose tables are never reported.
        std::vector<std::string> builtin_libraries = {"WORK", "SASHELP", "SASUSER"};

        /// Macro names treated as language built-ins in addition to the defaults.
        std::vector<std::string> extra_builtin_macros;

        /// Used in macro placeholders.
        std::string source_name = "input";
    };

    /**
     * Validates option values. A zero token budget or chars-per-token
     * fails with InvalidArgument.
     */
    [[nodiscard]] Result<void, Error> validate_options(const AnalysisOptions& options);

    /**
     * Tokenized and segmented source shared by all analyzers.
     */
    struct SourceUnit {
        std::string text;
        std::vector<lexer::Token> tokens;
        Segmentation segmentation;
        VariableResolver resolver;
        LibraryRegistry libraries;
        std::vector<Anomaly> anomalies;  ///< Lexer, segmenter and registry faults
    };

    /**
     * Validates the input and builds a SourceUnit.
     *
     * Empty, whitespace-only, NUL-containing or non-UTF-8 input fails with
     * InvalidArgument before any component runs.
     */
    [[nodiscard]] Result<SourceUnit, Error> prepare_source(
        std::string_view text,
        const AnalysisOptions& options = {}
    );

    // ============================================================================
    // Report Sections
    // ============================================================================

    /**
     * A declared library and the tables referenced through it.
     */
    struct DatabaseUsage {
        DatabaseHandle handle;
        std::vector<TableReference> tables;
    };

    struct DatabaseAnalysisResult {
        std::vector<DatabaseUsage> databases;
        std::vector<TableReference> unattributed;
    };

    struct MacroInfo {
        std::string name;
        std::string parameters;
        SourceSpan span;
        std::optional<std::string> parent;
        bool terminated = true;
        std::vector<std::string> calls;  ///< Distinct callees, first-call order
        bool invoked = false;            ///< Called from another block
    };

    /**
     * One macro invocation site. Repeated calls give repeated edges.
     */
    struct MacroCall {
        std::string caller;  ///< Macro name or "<main>"
        std::string callee;
        bool internal = false;
        SourceSpan site;
    };

    /**
     * Datasets one block reads and writes outside proc sql. Inputs come from
     * set/merge statements and data= options, outputs from data statements
     * and out= options. Names are variable-substituted and listed once each.
     */
    struct DatasetUsage {
        std::string block;
        std::vector<std::string> inputs;
        std::vector<std::string> outputs;
    };

    struct DependencyAnalysisResult {
        std::vector<MacroInfo> macros;
        std::vector<MacroCall> calls;
        std::vector<std::string> external_macros;
        std::vector<std::string> unused_macros;
        std::vector<std::string> includes;
        std::vector<DatasetUsage> datasets;  ///< Blocks in first-use order
        std::vector<std::string> conversion_order;  ///< Callees before callers
        std::vector<std::vector<std::string>> recursive_cycles;
    };

    struct ComplexityMetrics {
        std::string block;
        SourceSpan span;
        std::size_t total_lines = 0;
        std::size_t code_lines = 0;
        std::size_t comment_lines = 0;
        std::size_t blank_lines = 0;
        std::size_t macro_count = 0;
        std::size_t proc_count = 0;
        std::size_t data_step_count = 0;
        std::size_t if_count = 0;
        std::size_t loop_count = 0;

        [[nodiscard]] std::size_t decision_points() const noexcept {
            return if_count + loop_count;
        }

        [[nodiscard]] std::size_t cyclomatic_complexity() const noexcept {
            return decision_points() + 1;
        }
    };

    struct ComplexityAnalysisResult {
        std::string method;
        ComplexityMetrics overall;
        std::vector<ComplexityMetrics> blocks;
    };

    /**
     * A macro definition lifted out of the main body.
     */
    struct MacroUnit {
        std::size_t index = 0;
        std::string name;
        std::string placeholder;
        std::string text;
        SourceSpan span;
        std::size_t estimated_tokens = 0;
        bool exceeds_budget = false;
    };

    struct Chunk {
        SourceSpan span;
        std::string text;
        std::size_t estimated_tokens = 0;
        bool oversized = false;
    };

    struct ChunkingResult {
        std::size_t token_budget = 0;
        std::vector<MacroUnit> macros;
        std::vector<Chunk> chunks;
    };

    /**
     * Combined result of one analysis run.
     */
    struct AnalysisReport {
        std::string source_name;
        bool database_only = false;

        DatabaseAnalysisResult databases;
        DependencyAnalysisResult dependencies;
        ComplexityAnalysisResult complexity;
        ChunkingResult chunking;
        std::vector<Anomaly> anomalies;  ///< Sorted by offset
        std::map<std::string, std::string> variables;

        Timestamp analysis_time;
        Duration analysis_duration = Duration::zero();
    };

    // ============================================================================
    // Analyzer Interface
    // ============================================================================

    class IAnalyzer {
    public:
        virtual ~IAnalyzer() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * Analyzes a prepared unit, filling the analyzer's report section.
         */
        [[nodiscard]] virtual Result<AnalysisReport, Error> analyze(
            const SourceUnit& unit,
            const AnalysisOptions& options
        ) const = 0;
    };

    /**
     * Analyzers for one run. Database-only mode runs only the table
     * extractor.
     */
    [[nodiscard]] std::vector<std::unique_ptr<IAnalyzer>> create_analyzers(
        const AnalysisOptions& options
    );

    /**
     * Runs every analyzer over a prepared unit and merges the sections. A
     * failing analyzer fails the whole run.
     */
    [[nodiscard]] Result<AnalysisReport, Error> run_full_analysis(
        const SourceUnit& unit,
        const AnalysisOptions& options = {}
    );

    /**
     * Analyzes SAS source text.
     *
     * @param source_text The SAS program.
     * @param options Analysis options.
     * @return A complete report, or an error for unusable input or options.
     */
    [[nodiscard]] Result<AnalysisReport, Error> analyze(
        std::string_view source_text,
        const AnalysisOptions& options = {}
    );

    /**
     * Estimated LLM token count of a text: ceil(chars / chars_per_token).
     */
    [[nodiscard]] std::size_t estimate_tokens(std::string_view text, std::size_t chars_per_token) noexcept;

}  // namespace sasa::analyzers

#endif //SASA_ANALYZER_HPP
