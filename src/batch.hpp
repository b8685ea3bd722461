#ifndef REGEXCC_BATCH_HPP
#define REGEXCC_BATCH_HPP

#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "regex.hpp"

namespace regexcc {
    // Outcome of running one expression (and optionally one word) through the whole pipeline
    struct CompilationReport {
        std::string expression;
        std::optional<std::string> word;

        bool compiled = false;
        std::optional<RegexError::Kind> errorKind;
        std::string errorMessage;

        std::vector<std::string> warnings;
        size_t nfaStates = 0;
        size_t dfaStates = 0;
        size_t minimalStates = 0;
        std::chrono::nanoseconds subsetConstructionTime{0};
        std::optional<Verdict> verdict;

        void reportTo(std::ostream& output, bool colorful = true) const;
    };

    CompilationReport compileExpression(std::string_view expression, std::optional<std::string> word = std::nullopt,
                                        const RegexOptions& options = {});

    struct BatchEntry {
        std::string expression;
        std::optional<std::string> word;
    };

    struct BatchSummary {
        std::vector<CompilationReport> reports;

        [[nodiscard]] size_t total() const { return reports.size(); }
        [[nodiscard]] size_t succeeded() const;

        void reportTo(std::ostream& output, bool colorful = true) const;
    };

    // Every entry is compiled on its own; a failing expression does not stop the rest
    BatchSummary compileBatch(const std::vector<BatchEntry>& entries, const RegexOptions& options = {});

    struct CrossTable {
        std::vector<std::string> expressions;
        std::vector<std::string> words;
        // cells[i][j]: expression i on word j, empty when expression i failed to compile
        std::vector<std::vector<std::optional<bool>>> cells;
        std::vector<std::string> errors;

        [[nodiscard]] size_t acceptedCount() const;

        void reportTo(std::ostream& output) const;
    };

    CrossTable crossTest(const std::vector<std::string>& expressions, const std::vector<std::string>& words,
                         const RegexOptions& options = {});

    struct CaseMismatch {
        std::string word;
        bool expected;
        Verdict verdict;
    };

    std::vector<CaseMismatch> verifyCases(const Regex& regex, const std::vector<std::pair<std::string, bool>>& cases);
}

#endif // REGEXCC_BATCH_HPP
