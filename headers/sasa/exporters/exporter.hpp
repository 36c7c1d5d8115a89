//
// Created by gregorian-rayne on 1/10/26.
//

#ifndef SASA_EXPORTER_HPP
#define SASA_EXPORTER_HPP

/**
 * @file exporter.hpp
 * @brief Report exporters.
 *
 * Renders an AnalysisReport as:
 * - JSON (the machine-readable database report, plus the full sections)
 * - Markdown (human-readable summary tables)
 * - Text (compact console summary)
 *
 * Every exporter writes to a file, a stream or a string.
 */

#include "sasa/analyzers/analyzer.hpp"
#include "sasa/error.hpp"
#include "sasa/result.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sasa::exporters
{
    namespace fs = std::filesystem;

    /**
     * Supported export formats.
     */
    enum class ExportFormat {
        JSON,
        Markdown,
        Text
    };

    /**
     * Export options.
     */
    struct ExportOptions {
        bool pretty_print = true;
        bool include_metadata = true;

        /// Emit only the databases key, whatever the report holds.
        bool database_only = false;

        /// Include the source text of every chunk and lifted macro.
        bool include_chunk_text = true;

        /// Include per-call sites in the dependency section.
        bool include_call_sites = true;
    };

    /**
     * Builds the JSON document for a report.
     *
     * In database-only mode (either on the report or in the options) the
     * document holds exactly one key, "databases".
     */
    [[nodiscard]] nlohmann::json to_json(
        const analyzers::AnalysisReport& report,
        const ExportOptions& options = {}
    );

    /**
     * Base interface for exporters.
     */
    class IExporter {
    public:
        virtual ~IExporter() = default;

        [[nodiscard]] virtual ExportFormat format() const noexcept = 0;
        [[nodiscard]] virtual std::string_view file_extension() const noexcept = 0;
        [[nodiscard]] virtual std::string_view format_name() const noexcept = 0;

        [[nodiscard]] virtual Result<void, Error> export_to_file(
            const fs::path& path,
            const analyzers::AnalysisReport& report,
            const ExportOptions& options
        ) const;

        [[nodiscard]] virtual Result<void, Error> export_to_stream(
            std::ostream& stream,
            const analyzers::AnalysisReport& report,
            const ExportOptions& options
        ) const = 0;

        [[nodiscard]] virtual Result<std::string, Error> export_to_string(
            const analyzers::AnalysisReport& report,
            const ExportOptions& options
        ) const;
    };

    /**
     * Factory for creating exporters.
     */
    class ExporterFactory {
    public:
        [[nodiscard]] static Result<std::unique_ptr<IExporter>, Error> create(ExportFormat format);

        /**
         * Picks the exporter from a file extension (.json, .md, .txt).
         */
        [[nodiscard]] static Result<std::unique_ptr<IExporter>, Error> create_for_file(const fs::path& path);

        [[nodiscard]] static std::vector<ExportFormat> available_formats();
    };

    [[nodiscard]] std::string_view format_to_string(ExportFormat format) noexcept;

    [[nodiscard]] std::optional<ExportFormat> string_to_format(std::string_view str) noexcept;

    /**
     * JSON Exporter.
     */
    class JsonExporter : public IExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::JSON; }
        [[nodiscard]] std::string_view file_extension() const noexcept override { return ".json"; }
        [[nodiscard]] std::string_view format_name() const noexcept override { return "JSON"; }

        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream,
            const analyzers::AnalysisReport& report,
            const ExportOptions& options
        ) const override;
    };

    /**
     * Markdown Exporter.
     *
     * Exports the report to Markdown for documentation and migration
     * planning.
     */
    class MarkdownExporter : public IExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::Markdown; }
        [[nodiscard]] std::string_view file_extension() const noexcept override { return ".md"; }
        [[nodiscard]] std::string_view format_name() const noexcept override { return "Markdown"; }

        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream,
            const analyzers::AnalysisReport& report,
            const ExportOptions& options
        ) const override;
    };

    class TextExporter : public IExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::Text; }
        [[nodiscard]] std::string_view file_extension() const noexcept override { return ".txt"; }
        [[nodiscard]] std::string_view format_name() const noexcept override { return "Text"; }

        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream,
            const analyzers::AnalysisReport& report,
            const ExportOptions& options
        ) const override;
    };

}  // namespace sasa::exporters

#endif //SASA_EXPORTER_HPP
