//
// Created by gregorian-rayne on 1/12/26.
//

#include "sasa/cli/commands/command.hpp"
#include "sasa/cli/commands/options.hpp"

#include "sasa/sasa.hpp"

#include <iostream>

namespace sasa::cli
{
    /**
     * Analyze command - reports databases, tables, macros and metrics of a
     * SAS program.
     */
    class AnalyzeCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "analyze";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Analyze a SAS program for database usage, macro dependencies and complexity";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: sasa analyze [OPTIONS] [FILE|-]\n"
                   "\n"
                   "Examples:\n"
                   "  sasa analyze etl/load_risk.sas\n"
                   "  sasa analyze -d --compact etl/load_risk.sas\n"
                   "  sasa analyze -f markdown -o report.md -D ENV=PROD etl/load_risk.sas\n"
                   "  cat job.sas | sasa analyze -";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"output", 'o', "Output file for the report", false, true, "", "FILE"},
                {"format", 'f', "Output format (json, markdown, text)", false, true, "", "FORMAT"},
                {"database-only", 'd', "Only report databases and their tables", false, false, "", ""},
                {"tokens", 't', "Token budget per chunk", false, true, "", "TOKENS"},
                {"config", 'c', "TOML configuration file", false, true, "", "FILE"},
                {"define", 'D', "Predefine a macro variable", false, true, "", "NAME=VALUE", true},
                {"include-unused", 0, "Report libraries without table references", false, false, "", ""},
                {"compact", 0, "Write JSON without indentation", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() > 1) {
                return "Only one input file may be analyzed at a time";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_flags(args);

            auto resolved = resolve_options(args);
            if (resolved.is_err()) {
                print_error(resolved.error().to_string());
                return 1;
            }
            auto& options = resolved.value().analysis;
            const auto& config = resolved.value().config;

            const std::string input = args.positional().empty() ? "-" : args.positional().front();
            options.source_name = source_name_for(input);

            print_verbose("Reading " + (input == "-" ? std::string("standard input") : input));
            auto source = file_utils::read_source(input);
            if (source.is_err()) {
                print_error(source.error().to_string());
                return 1;
            }

            print_debug("Token budget: " + std::to_string(options.token_budget) +
                        ", chars per token: " + std::to_string(options.chars_per_token));

            auto report = analyzers::analyze(source.value(), options);
            if (report.is_err()) {
                print_error("Analysis failed: " + report.error().to_string());
                return 1;
            }

            print_verbose("Analyzed in " + string_utils::format_duration(report.value().analysis_duration.count()));
            if (is_verbose()) {
                for (const auto& anomaly : report.value().anomalies) {
                    print_warning("line " + std::to_string(anomaly.span.line_begin) + ": " +
                                  to_string(anomaly.kind) + ": " + anomaly.message);
                }
            }

            auto format_name = args.get_or("format", config.output.format);
            if (args.get_flag("json")) {
                format_name = "json";
            }
            const auto format = exporters::string_to_format(format_name);
            if (!format) {
                print_error("Unknown output format: " + format_name);
                return 1;
            }

            auto exporter = exporters::ExporterFactory::create(*format);
            if (exporter.is_err()) {
                print_error(exporter.error().to_string());
                return 1;
            }

            exporters::ExportOptions export_options;
            export_options.pretty_print = config.output.pretty && !args.get_flag("compact");
            export_options.database_only = options.database_only;

            if (const auto output_file = args.get("output")) {
                if (auto written = exporter.value()->export_to_file(*output_file, report.value(), export_options);
                    written.is_err()) {
                    print_error(written.error().to_string());
                    return 1;
                }
                print("Report written to " + *output_file);
                return 0;
            }

            if (auto written = exporter.value()->export_to_stream(std::cout, report.value(), export_options);
                written.is_err()) {
                print_error(written.error().to_string());
                return 1;
            }
            return 0;
        }
    };

    namespace {
        struct AnalyzeCommandRegistrar {
            AnalyzeCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<AnalyzeCommand>()
                );
            }
        } analyze_registrar;
    }
}  // namespace sasa::cli
