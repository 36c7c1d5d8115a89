//
// Created by gregorian-rayne on 1/13/26.
//

#include "sasa/cli/commands/command.hpp"
#include "sasa/cli/commands/options.hpp"

#include "sasa/sasa.hpp"
#include "sasa/utils/json_utils.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace sasa::cli
{
    namespace fs = std::filesystem;

    namespace {

        std::string chunk_file_name(const std::string& source_name, const std::size_t index) {
            std::ostringstream ss;
            ss << source_name << "_chunk_" << std::setw(3) << std::setfill('0') << index << ".sas";
            return ss.str();
        }

        std::string macro_file_name(const std::string& source_name, const analyzers::MacroUnit& macro) {
            return source_name + "_macro_" + std::to_string(macro.index) + "_" +
                   string_utils::to_lower(macro.name) + ".sas";
        }

    }  // namespace

    /**
     * Chunk command - splits a SAS program into token-budgeted files for
     * LLM-assisted conversion.
     */
    class ChunkCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "chunk";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Split a SAS program into macro files and token-budgeted main body chunks";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: sasa chunk [OPTIONS] <FILE>\n"
                   "\n"
                   "Examples:\n"
                   "  sasa chunk etl/load_risk.sas\n"
                   "  cat job.sas | sasa chunk -o chunks/ -\n"
                   "  sasa chunk -t 2000 -o chunks/ etl/load_risk.sas";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"tokens", 't', "Token budget per chunk", false, true, "", "TOKENS"},
                {"output", 'o', "Output directory (default: <name>_chunks)", false, true, "", "DIR"},
                {"config", 'c', "TOML configuration file", false, true, "", "FILE"},
                {"define", 'D', "Predefine a macro variable", false, true, "", "NAME=VALUE", true},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Exactly one input file is required. Use 'sasa chunk <file>'";
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
            options.database_only = false;

            const auto& input = args.positional().front();
            options.source_name = source_name_for(input);

            auto source = file_utils::read_source(input);
            if (source.is_err()) {
                print_error(source.error().to_string());
                return 1;
            }

            auto report = analyzers::analyze(source.value(), options);
            if (report.is_err()) {
                print_error("Analysis failed: " + report.error().to_string());
                return 1;
            }

            const auto& chunking = report.value().chunking;
            const fs::path out_dir = args.get_or("output", options.source_name + "_chunks");

            nlohmann::json manifest;
            manifest["source"] = input;
            manifest["tokenBudget"] = chunking.token_budget;
            manifest["macros"] = nlohmann::json::array();
            manifest["chunks"] = nlohmann::json::array();

            for (const auto& macro : chunking.macros) {
                const auto path = out_dir / macro_file_name(options.source_name, macro);
                if (auto written = file_utils::write_file(path, macro.text); written.is_err()) {
                    print_error(written.error().to_string());
                    return 1;
                }
                if (macro.exceeds_budget) {
                    print_warning("macro " + macro.name + " exceeds the token budget (" +
                                  std::to_string(macro.estimated_tokens) + " tokens)");
                }
                print_verbose("Wrote " + path.string());
                manifest["macros"].push_back({
                    {"name", macro.name},
                    {"placeholder", macro.placeholder},
                    {"file", path.string()},
                    {"estimatedTokens", macro.estimated_tokens}
                });
            }

            for (std::size_t i = 0; i < chunking.chunks.size(); ++i) {
                const auto& chunk = chunking.chunks[i];
                const auto path = out_dir / chunk_file_name(options.source_name, i);
                if (auto written = file_utils::write_file(path, chunk.text); written.is_err()) {
                    print_error(written.error().to_string());
                    return 1;
                }
                if (chunk.oversized) {
                    print_warning("chunk " + std::to_string(i) + " exceeds the token budget (" +
                                  std::to_string(chunk.estimated_tokens) + " tokens)");
                }
                print_verbose("Wrote " + path.string());
                manifest["chunks"].push_back({
                    {"file", path.string()},
                    {"startLine", chunk.span.line_begin},
                    {"endLine", chunk.span.line_end},
                    {"estimatedTokens", chunk.estimated_tokens}
                });
            }

            if (args.get_flag("json")) {
                std::cout << json_utils::to_string(manifest, 2) << "\n";
            } else {
                print("Wrote " + std::to_string(chunking.macros.size()) + " macro files and " +
                      std::to_string(chunking.chunks.size()) + " chunks to " + out_dir.string());
            }
            return 0;
        }
    };

    namespace {
        struct ChunkCommandRegistrar {
            ChunkCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ChunkCommand>()
                );
            }
        } chunk_registrar;
    }
}  // namespace sasa::cli
