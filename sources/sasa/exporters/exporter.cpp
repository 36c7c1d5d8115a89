//
// Created by gregorian-rayne on 1/10/26.
//

#include "sasa/exporters/exporter.hpp"
#include "sasa/utils/file_utils.hpp"
#include "sasa/utils/json_utils.hpp"
#include "sasa/utils/string_utils.hpp"
#include "sasa/version.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sasa::exporters
{
    using json = nlohmann::json;

    namespace {

        /**
         * Formats a timestamp to ISO 8601.
         */
        std::string format_timestamp(const Timestamp ts) {
            const auto time_t_val = std::chrono::system_clock::to_time_t(ts);
            std::ostringstream ss;

#ifdef _WIN32
            std::tm time_info{};
            gmtime_s(&time_info, &time_t_val);
            ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
#else
            std::tm time_info{};
            gmtime_r(&time_t_val, &time_info);
            ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
#endif

            return ss.str();
        }

        double duration_to_ms(const Duration d) {
            return static_cast<double>(std::chrono::duration_cast<std::chrono::microseconds>(d).count()) / 1000.0;
        }

        /**
         * Escapes the characters that break a Markdown table cell.
         */
        std::string escape_cell(const std::string_view text) {
            std::string result;
            result.reserve(text.size());
            for (const char c : text) {
                switch (c) {
                case '|': result += "\\|"; break;
                case '\n': result += ' '; break;
                case '\r': break;
                default: result += c; break;
                }
            }
            return result;
        }

        json operations_to_json(const OperationSet& operations) {
            json ops = json::array();
            for (const auto op : operations) {
                ops.push_back(to_string(op));
            }
            return ops;
        }

        std::string join_operations(const OperationSet& operations) {
            std::vector<std::string> names;
            names.reserve(operations.size());
            for (const auto op : operations) {
                names.emplace_back(to_string(op));
            }
            return string_utils::join(names, ", ");
        }

        json lines_to_json(const SourceSpan& span) {
            return json{{"startLine", span.line_begin}, {"endLine", span.line_end}};
        }

        json database_to_json(const analyzers::DatabaseUsage& usage, const bool database_only) {
            json entry;
            entry["databaseName"] = usage.handle.database_name;
            entry["databaseType"] = to_string(usage.handle.type);
            entry["connectionDetail"] = usage.handle.connection_detail;

            if (!database_only) {
                entry["libraryName"] = usage.handle.alias;
                entry["engine"] = usage.handle.engine;
                if (usage.handle.schema) {
                    entry["schema"] = *usage.handle.schema;
                }
                entry["declaredAtLine"] = usage.handle.declared_at.line_begin;
            }

            json tables = json::array();
            for (const auto& table : usage.tables) {
                tables.push_back({
                    {"tableName", table.table},
                    {"operations", operations_to_json(table.operations)}
                });
            }
            entry["operationTables"] = std::move(tables);
            return entry;
        }

        json dependencies_to_json(const analyzers::DependencyAnalysisResult& deps, const ExportOptions& options) {
            json out;

            json macros = json::array();
            for (const auto& macro : deps.macros) {
                json m;
                m["name"] = macro.name;
                m["parameters"] = macro.parameters;
                m["parent"] = macro.parent ? json(*macro.parent) : json(nullptr);
                m["lines"] = lines_to_json(macro.span);
                m["terminated"] = macro.terminated;
                m["calls"] = macro.calls;
                m["invoked"] = macro.invoked;
                macros.push_back(std::move(m));
            }
            out["macros"] = std::move(macros);

            if (options.include_call_sites) {
                json calls = json::array();
                for (const auto& call : deps.calls) {
                    calls.push_back({
                        {"caller", call.caller},
                        {"callee", call.callee},
                        {"internal", call.internal},
                        {"line", call.site.line_begin}
                    });
                }
                out["calls"] = std::move(calls);
            }

            out["externalMacros"] = deps.external_macros;
            out["unusedMacros"] = deps.unused_macros;
            out["includes"] = deps.includes;

            json datasets = json::array();
            for (const auto& usage : deps.datasets) {
                datasets.push_back({
                    {"block", usage.block},
                    {"inputs", usage.inputs},
                    {"outputs", usage.outputs}
                });
            }
            out["datasetUsage"] = std::move(datasets);
            out["conversionOrder"] = deps.conversion_order;
            out["recursiveCycles"] = deps.recursive_cycles;
            return out;
        }

        json metrics_to_json(const analyzers::ComplexityMetrics& metrics) {
            return json{
                {"block", metrics.block},
                {"lines", lines_to_json(metrics.span)},
                {"totalLines", metrics.total_lines},
                {"codeLines", metrics.code_lines},
                {"commentLines", metrics.comment_lines},
                {"blankLines", metrics.blank_lines},
                {"macroCount", metrics.macro_count},
                {"procCount", metrics.proc_count},
                {"dataStepCount", metrics.data_step_count},
                {"ifCount", metrics.if_count},
                {"loopCount", metrics.loop_count},
                {"decisionPoints", metrics.decision_points()},
                {"cyclomaticComplexity", metrics.cyclomatic_complexity()}
            };
        }

        json complexity_to_json(const analyzers::ComplexityAnalysisResult& complexity) {
            json blocks = json::array();
            for (const auto& block : complexity.blocks) {
                blocks.push_back(metrics_to_json(block));
            }
            return json{
                {"method", complexity.method},
                {"overall", metrics_to_json(complexity.overall)},
                {"blocks", std::move(blocks)}
            };
        }

        json chunking_to_json(const analyzers::ChunkingResult& chunking, const ExportOptions& options) {
            json macros = json::array();
            for (const auto& macro : chunking.macros) {
                json m;
                m["index"] = macro.index;
                m["name"] = macro.name;
                m["placeholder"] = macro.placeholder;
                m["lines"] = lines_to_json(macro.span);
                m["estimatedTokens"] = macro.estimated_tokens;
                m["exceedsBudget"] = macro.exceeds_budget;
                if (options.include_chunk_text) {
                    m["text"] = macro.text;
                }
                macros.push_back(std::move(m));
            }

            json body = json::array();
            for (std::size_t i = 0; i < chunking.chunks.size(); ++i) {
                const auto& chunk = chunking.chunks[i];
                json c;
                c["index"] = i;
                c["lines"] = lines_to_json(chunk.span);
                c["estimatedTokens"] = chunk.estimated_tokens;
                c["oversized"] = chunk.oversized;
                if (options.include_chunk_text) {
                    c["text"] = chunk.text;
                }
                body.push_back(std::move(c));
            }

            return json{
                {"tokenBudget", chunking.token_budget},
                {"macros", std::move(macros)},
                {"mainBody", std::move(body)}
            };
        }

    }  // namespace

    // =============================================================================
    // JSON Document
    // =============================================================================

    json to_json(const analyzers::AnalysisReport& report, const ExportOptions& options) {
        const bool database_only = options.database_only || report.database_only;

        json output;

        json databases = json::array();
        for (const auto& usage : report.databases.databases) {
            databases.push_back(database_to_json(usage, database_only));
        }

        if (database_only) {
            output["databases"] = std::move(databases);
            return output;
        }

        if (options.include_metadata) {
            output["metadata"] = {
                {"tool", PROJECT_SHORT_NAME},
                {"version", VERSION_STRING},
                {"sourceName", report.source_name},
                {"generatedAt", format_timestamp(report.analysis_time)},
                {"analysisDurationMs", duration_to_ms(report.analysis_duration)}
            };
        }

        output["databases"] = std::move(databases);

        json unattributed = json::array();
        for (const auto& table : report.databases.unattributed) {
            unattributed.push_back({
                {"libraryName", table.alias},
                {"tableName", table.table},
                {"operations", operations_to_json(table.operations)}
            });
        }
        output["unattributedTables"] = std::move(unattributed);

        output["dependencies"] = dependencies_to_json(report.dependencies, options);
        output["complexity"] = complexity_to_json(report.complexity);
        output["chunks"] = chunking_to_json(report.chunking, options);

        json variables = json::object();
        for (const auto& [name, value] : report.variables) {
            variables[name] = value;
        }
        output["variables"] = std::move(variables);

        json anomalies = json::array();
        for (const auto& anomaly : report.anomalies) {
            anomalies.push_back({
                {"kind", to_string(anomaly.kind)},
                {"message", anomaly.message},
                {"subject", anomaly.subject},
                {"line", anomaly.span.line_begin}
            });
        }
        output["anomalies"] = std::move(anomalies);

        return output;
    }

    // =============================================================================
    // Format Conversion
    // =============================================================================

    std::string_view format_to_string(const ExportFormat format) noexcept {
        switch (format) {
        case ExportFormat::JSON: return "json";
        case ExportFormat::Markdown: return "markdown";
        case ExportFormat::Text: return "text";
        }
        return "unknown";
    }

    std::optional<ExportFormat> string_to_format(const std::string_view str) noexcept {
        if (string_utils::iequals(str, "json")) return ExportFormat::JSON;
        if (string_utils::iequals(str, "markdown") || string_utils::iequals(str, "md")) return ExportFormat::Markdown;
        if (string_utils::iequals(str, "text") || string_utils::iequals(str, "txt")) return ExportFormat::Text;
        return std::nullopt;
    }

    // =============================================================================
    // Exporter Factory
    // =============================================================================

    Result<std::unique_ptr<IExporter>, Error> ExporterFactory::create(const ExportFormat format) {
        switch (format) {
        case ExportFormat::JSON:
            return Result<std::unique_ptr<IExporter>, Error>::success(
                std::make_unique<JsonExporter>()
            );
        case ExportFormat::Markdown:
            return Result<std::unique_ptr<IExporter>, Error>::success(
                std::make_unique<MarkdownExporter>()
            );
        case ExportFormat::Text:
            return Result<std::unique_ptr<IExporter>, Error>::success(
                std::make_unique<TextExporter>()
            );
        }
        return Result<std::unique_ptr<IExporter>, Error>::failure(
            Error::invalid_argument("Unknown export format")
        );
    }

    Result<std::unique_ptr<IExporter>, Error> ExporterFactory::create_for_file(const fs::path& path) {
        const std::string ext = string_utils::to_lower(path.extension().string());

        if (ext == ".json") return create(ExportFormat::JSON);
        if (ext == ".md" || ext == ".markdown") return create(ExportFormat::Markdown);
        if (ext == ".txt") return create(ExportFormat::Text);

        return Result<std::unique_ptr<IExporter>, Error>::failure(
            Error::invalid_argument("Cannot determine format from extension: " + ext, path.string())
        );
    }

    std::vector<ExportFormat> ExporterFactory::available_formats() {
        return {
            ExportFormat::JSON,
            ExportFormat::Markdown,
            ExportFormat::Text
        };
    }

    // =============================================================================
    // Shared Exporter Plumbing
    // =============================================================================

    Result<void, Error> IExporter::export_to_file(
        const fs::path& path,
        const analyzers::AnalysisReport& report,
        const ExportOptions& options
    ) const {
        auto content = export_to_string(report, options);
        if (content.is_err()) {
            return Result<void, Error>::failure(content.error());
        }
        return file_utils::write_file(path, content.value());
    }

    Result<std::string, Error> IExporter::export_to_string(
        const analyzers::AnalysisReport& report,
        const ExportOptions& options
    ) const {
        std::ostringstream ss;
        if (auto result = export_to_stream(ss, report, options); result.is_err()) {
            return Result<std::string, Error>::failure(result.error());
        }
        return Result<std::string, Error>::success(ss.str());
    }

    // =============================================================================
    // JSON Exporter
    // =============================================================================

    Result<void, Error> JsonExporter::export_to_stream(
        std::ostream& stream,
        const analyzers::AnalysisReport& report,
        const ExportOptions& options
    ) const {
        const json output = to_json(report, options);
        stream << json_utils::to_string(output, options.pretty_print ? 2 : -1);
        if (options.pretty_print) {
            stream << '\n';
        }

        if (!stream) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write JSON report")
            );
        }
        return Result<void, Error>::success();
    }

    // =============================================================================
    // Markdown Exporter
    // =============================================================================

    Result<void, Error> MarkdownExporter::export_to_stream(
        std::ostream& stream,
        const analyzers::AnalysisReport& report,
        const ExportOptions& options
    ) const {
        const bool database_only = options.database_only || report.database_only;

        stream << "# SAS Analysis Report: " << report.source_name << "\n\n";
        if (options.include_metadata) {
            stream << "_Generated by " << PROJECT_SHORT_NAME << " v" << VERSION_STRING
                   << " on " << format_timestamp(report.analysis_time) << "_\n\n";
        }

        stream << "## Databases\n\n";
        if (report.databases.databases.empty()) {
            stream << "No database libraries referenced.\n\n";
        } else {
            stream << "| Database | Type | Table | Operations |\n";
            stream << "|----------|------|-------|------------|\n";
            for (const auto& usage : report.databases.databases) {
                if (usage.tables.empty()) {
                    stream << "| " << escape_cell(usage.handle.database_name)
                           << " | " << to_string(usage.handle.type) << " | | |\n";
                }
                for (const auto& table : usage.tables) {
                    stream << "| " << escape_cell(usage.handle.database_name)
                           << " | " << to_string(usage.handle.type)
                           << " | " << escape_cell(table.table)
                           << " | " << join_operations(table.operations) << " |\n";
                }
            }
            stream << "\n";
        }

        if (database_only) {
            return Result<void, Error>::success();
        }

        if (!report.databases.unattributed.empty()) {
            stream << "### Unattributed Tables\n\n";
            for (const auto& table : report.databases.unattributed) {
                stream << "- `" << table.alias << "." << table.table << "` ("
                       << join_operations(table.operations) << ")\n";
            }
            stream << "\n";
        }

        const auto& deps = report.dependencies;
        stream << "## Macros\n\n";
        if (deps.macros.empty()) {
            stream << "No macro definitions.\n\n";
        } else {
            stream << "| Macro | Lines | Calls | Invoked |\n";
            stream << "|-------|-------|-------|---------|\n";
            for (const auto& macro : deps.macros) {
                stream << "| " << escape_cell(macro.name)
                       << " | " << macro.span.line_begin << "-" << macro.span.line_end
                       << " | " << escape_cell(string_utils::join(macro.calls, ", "))
                       << " | " << (macro.invoked ? "yes" : "no") << " |\n";
            }
            stream << "\n";
        }

        if (!deps.external_macros.empty()) {
            stream << "- **External Macros:** " << string_utils::join(deps.external_macros, ", ") << "\n";
        }
        if (!deps.unused_macros.empty()) {
            stream << "- **Unused Macros:** " << string_utils::join(deps.unused_macros, ", ") << "\n";
        }
        if (!deps.includes.empty()) {
            stream << "- **Includes:** " << string_utils::join(deps.includes, ", ") << "\n";
        }
        for (const auto& usage : deps.datasets) {
            stream << "- **Datasets (" << usage.block << "):** reads "
                   << (usage.inputs.empty() ? "-" : string_utils::join(usage.inputs, ", "))
                   << "; writes "
                   << (usage.outputs.empty() ? "-" : string_utils::join(usage.outputs, ", ")) << "\n";
        }
        if (!deps.conversion_order.empty()) {
            stream << "- **Conversion Order:** " << string_utils::join(deps.conversion_order, " -> ") << "\n";
        }
        for (const auto& cycle : deps.recursive_cycles) {
            stream << "- **Recursive Cycle:** " << string_utils::join(cycle, " -> ") << "\n";
        }
        stream << "\n";

        const auto& complexity = report.complexity;
        if (!complexity.method.empty()) {
            stream << "## Complexity\n\n";
            stream << "_Method: " << complexity.method << "_\n\n";
            stream << "| Block | Lines | Code | Comment | Blank | Decisions | Cyclomatic |\n";
            stream << "|-------|-------|------|---------|-------|-----------|------------|\n";

            const auto row = [&stream](const analyzers::ComplexityMetrics& m) {
                stream << "| " << escape_cell(m.block)
                       << " | " << m.total_lines
                       << " | " << m.code_lines
                       << " | " << m.comment_lines
                       << " | " << m.blank_lines
                       << " | " << m.decision_points()
                       << " | " << m.cyclomatic_complexity() << " |\n";
            };
            for (const auto& block : complexity.blocks) {
                row(block);
            }
            row(complexity.overall);
            stream << "\n";
        }

        const auto& chunking = report.chunking;
        if (chunking.token_budget > 0) {
            stream << "## Chunks\n\n";
            stream << "- **Token Budget:** " << chunking.token_budget << "\n";
            stream << "- **Lifted Macros:** " << chunking.macros.size() << "\n";
            stream << "- **Main Body Chunks:** " << chunking.chunks.size() << "\n\n";

            for (const auto& macro : chunking.macros) {
                if (macro.exceeds_budget) {
                    stream << "- Macro `" << macro.name << "` is over budget ("
                           << macro.estimated_tokens << " tokens)\n";
                }
            }
            for (std::size_t i = 0; i < chunking.chunks.size(); ++i) {
                if (chunking.chunks[i].oversized) {
                    stream << "- Chunk " << i << " is over budget ("
                           << chunking.chunks[i].estimated_tokens << " tokens)\n";
                }
            }
            stream << "\n";
        }

        if (!report.anomalies.empty()) {
            stream << "## Anomalies\n\n";
            for (const auto& anomaly : report.anomalies) {
                stream << "- Line " << anomaly.span.line_begin << " `" << to_string(anomaly.kind) << "`: "
                       << anomaly.message << "\n";
            }
            stream << "\n";
        }

        return Result<void, Error>::success();
    }

    // =============================================================================
    // Text Exporter
    // =============================================================================

    Result<void, Error> TextExporter::export_to_stream(
        std::ostream& stream,
        const analyzers::AnalysisReport& report,
        const ExportOptions& options
    ) const {
        const bool database_only = options.database_only || report.database_only;

        stream << "Source: " << report.source_name << "\n";
        stream << "Databases: " << report.databases.databases.size() << "\n";
        for (const auto& usage : report.databases.databases) {
            stream << "  " << usage.handle.database_name << " (" << to_string(usage.handle.type) << ")\n";
            for (const auto& table : usage.tables) {
                stream << "    " << table.table << ": " << join_operations(table.operations) << "\n";
            }
        }

        if (!database_only) {
            for (const auto& table : report.databases.unattributed) {
                stream << "  ? " << table.alias << "." << table.table << ": "
                       << join_operations(table.operations) << "\n";
            }

            stream << "Macros: " << report.dependencies.macros.size()
                   << " defined, " << report.dependencies.external_macros.size() << " external\n";
            if (!report.dependencies.conversion_order.empty()) {
                stream << "Conversion order: "
                       << string_utils::join(report.dependencies.conversion_order, " -> ") << "\n";
            }
            if (!report.complexity.method.empty()) {
                stream << "Cyclomatic complexity: " << report.complexity.overall.cyclomatic_complexity()
                       << " (" << report.complexity.overall.code_lines << " code lines)\n";
            }
            if (report.chunking.token_budget > 0) {
                stream << "Chunks: " << report.chunking.chunks.size()
                       << " (budget " << report.chunking.token_budget << " tokens)\n";
            }
            stream << "Anomalies: " << report.anomalies.size() << "\n";
            stream << "Analysis time: "
                   << string_utils::format_duration(report.analysis_duration.count()) << "\n";
        }

        if (!stream) {
            return Result<void, Error>::failure(Error::io_error("Failed to write text report"));
        }
        return Result<void, Error>::success();
    }

}  // namespace sasa::exporters
