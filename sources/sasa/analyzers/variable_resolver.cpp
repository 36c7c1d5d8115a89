//
// Created by gregorian-rayne on 1/5/26.
//

#include "sasa/analyzers/variable_resolver.hpp"
#include "sasa/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <unordered_set>

namespace sasa::analyzers {

    namespace {

        constexpr int kMaxSubstitutionPasses = 16;

        bool is_name_start(const char c) noexcept {
            return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
        }

        bool is_name_char(const char c) noexcept {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        /**
         * A single &name occurrence inside some text.
         */
        struct Reference {
            std::size_t begin = 0;      ///< Offset of the '&'
            std::size_t name_end = 0;   ///< One past the last name character
            bool indirect = false;      ///< Preceded by more '&'
            bool dotted = false;        ///< Followed by a terminating '.'
            std::string_view name;
        };

        /**
         * Calls visit for every reference, and copy for the text between them.
         */
        template<typename Visit>
        void scan_references(const std::string_view text, Visit&& visit) {
            std::size_t i = 0;
            while (i < text.size()) {
                if (text[i] != '&') {
                    ++i;
                    continue;
                }

                std::size_t j = i;
                while (j < text.size() && text[j] == '&') {
                    ++j;
                }

                if (j >= text.size() || !is_name_start(text[j])) {
                    i = j;
                    continue;
                }

                std::size_t k = j;
                while (k < text.size() && is_name_char(text[k])) {
                    ++k;
                }

                Reference ref;
                ref.begin = i;
                ref.name_end = k;
                ref.indirect = (j - i) > 1;
                ref.dotted = k < text.size() && text[k] == '.';
                ref.name = text.substr(j, k - j);
                visit(ref);
                i = k;
            }
        }

    }  // namespace

    std::vector<std::string> referenced_variables(const std::string_view text) {
        std::vector<std::string> names;
        scan_references(text, [&](const Reference& ref) {
            if (!ref.indirect) {
                names.emplace_back(ref.name);
            }
        });
        return names;
    }

    void VariableResolver::predefine(const std::string_view name, const std::string_view value) {
        VariableBinding binding;
        binding.name = string_utils::to_upper(string_utils::trim(name));
        binding.value = std::string(string_utils::trim(value));
        binding.order = bindings_.size();
        binding.offset = 0;
        binding.predefined = true;
        bindings_.push_back(std::move(binding));
    }

    void VariableResolver::define(const std::string_view name, const std::string_view raw_value,
                                  const std::size_t offset) {
        VariableBinding binding;
        binding.name = string_utils::to_upper(string_utils::trim(name));
        binding.value = substitute(string_utils::trim(raw_value), offset);
        binding.order = bindings_.size();
        binding.offset = offset;
        bindings_.push_back(std::move(binding));
    }

    void VariableResolver::collect(const std::string_view source, const std::vector<lexer::Token>& tokens) {
        const auto next_significant = [&](std::size_t index) {
            while (index < tokens.size() && tokens[index].is_comment()) {
                ++index;
            }
            return index;
        };

        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (!tokens[i].is_macro("let")) {
                continue;
            }

            const auto name_index = next_significant(i + 1);
            if (name_index >= tokens.size() || tokens[name_index].kind != lexer::TokenKind::Word) {
                continue;
            }

            const auto eq_index = next_significant(name_index + 1);
            if (eq_index >= tokens.size() || !tokens[eq_index].is_punct('=')) {
                continue;
            }

            std::size_t end_index = eq_index + 1;
            while (end_index < tokens.size() && !tokens[end_index].is_punct(';')) {
                ++end_index;
            }

            const auto value_begin = tokens[eq_index].end();
            const auto value_end = end_index < tokens.size() ? tokens[end_index].offset : source.size();

            // %let &name = ... defines the variable named by another variable.
            auto name = substitute(tokens[name_index].text, tokens[i].offset);
            if (string_utils::contains(name, "&")) {
                continue;
            }

            define(name, source.substr(value_begin, value_end - value_begin), tokens[i].offset);
            i = end_index;
        }
    }

    const VariableBinding* VariableResolver::lookup(const std::string_view name, const std::size_t at) const {
        const auto key = string_utils::to_upper(name);
        for (auto it = bindings_.rbegin(); it != bindings_.rend(); ++it) {
            if (it->name == key && (it->predefined || it->offset < at)) {
                return &*it;
            }
        }
        return nullptr;
    }

    bool VariableResolver::is_cyclic(const std::string_view name, const std::size_t at) const {
        const auto target = string_utils::to_upper(name);
        std::unordered_set<std::string> visited;

        std::function<bool(const std::string&)> reaches = [&](const std::string& current) {
            const auto* binding = lookup(current, at);
            if (binding == nullptr) {
                return false;
            }
            for (const auto& ref : referenced_variables(binding->value)) {
                auto upper = string_utils::to_upper(ref);
                if (upper == target) {
                    return true;
                }
                if (visited.insert(upper).second && reaches(upper)) {
                    return true;
                }
            }
            return false;
        };

        return reaches(target);
    }

    std::string VariableResolver::substitute_once(const std::string_view text, const std::size_t at,
                                                  std::vector<std::string>& stack) const {
        std::string out;
        out.reserve(text.size());
        std::size_t copied = 0;

        scan_references(text, [&](const Reference& ref) {
            if (ref.indirect) {
                return;
            }

            auto key = string_utils::to_upper(ref.name);
            const auto* binding = lookup(key, at);
            if (binding == nullptr || std::ranges::find(stack, key) != stack.end() || is_cyclic(key, at)) {
                return;
            }

            out.append(text.substr(copied, ref.begin - copied));
            stack.push_back(key);
            out += substitute_once(binding->value, at, stack);
            stack.pop_back();
            copied = ref.name_end + (ref.dotted ? 1 : 0);
        });

        out.append(text.substr(copied));
        return out;
    }

    std::string VariableResolver::substitute(const std::string_view text, const std::size_t at) const {
        std::string current(text);
        for (int pass = 0; pass < kMaxSubstitutionPasses; ++pass) {
            std::vector<std::string> stack;
            auto next = substitute_once(current, at, stack);
            if (next == current) {
                break;
            }
            current = std::move(next);
        }
        return current;
    }

    std::map<std::string, std::string> VariableResolver::snapshot() const {
        std::map<std::string, std::string> result;
        for (const auto& binding : bindings_) {
            result[binding.name] = binding.value;
        }
        return result;
    }

}  // namespace sasa::analyzers
