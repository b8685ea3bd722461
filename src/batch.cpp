#include "batch.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <fmt/ostream.h>

using namespace regexcc;

namespace {
    const char* CONSOLE_RED = "\033[31m";
    const char* CONSOLE_GREEN = "\033[32m";
    const char* CONSOLE_YELLOW = "\033[33m";
    const char* CONSOLE_RESET = "\033[0m";

    const char* yesNo(bool value) {
        return value ? "yes" : "no";
    }
}

void CompilationReport::reportTo(std::ostream& output, bool colorful) const {
    const char* red = colorful ? CONSOLE_RED : "";
    const char* green = colorful ? CONSOLE_GREEN : "";
    const char* yellow = colorful ? CONSOLE_YELLOW : "";
    const char* reset = colorful ? CONSOLE_RESET : "";

    fmt::print(output, "r (infix)      : {}\n", expression);
    if (!compiled) {
        std::string_view kind = errorKind.has_value() ? errorKindName(*errorKind) : "";
        fmt::print(output, "regexcc: {}Error{}: {} [{}]\n", red, reset, errorMessage, kind);
        return;
    }

    for (const std::string& warning : warnings) {
        fmt::print(output, "regexcc: {}Warning{}: {}\n", yellow, reset, warning);
    }
    fmt::print(output, "NFA: {} states, DFA: {} states, minimal DFA: {} states\n", nfaStates, dfaStates, minimalStates);
    fmt::print(output, "subset construction took {:.6f} s\n", std::chrono::duration<double>(subsetConstructionTime).count());

    if (!verdict.has_value() || !word.has_value()) return;

    fmt::print(output, "w              : '{}'\n", *word);
    fmt::print(output, "  NFA          : {}\n", yesNo(verdict->nfa));
    fmt::print(output, "  DFA          : {}\n", yesNo(verdict->dfa));
    fmt::print(output, "  minimal DFA  : {}\n", yesNo(verdict->minimalDfa));
    if (verdict->consistent()) {
        fmt::print(output, "{}all automata agree{}\n", green, reset);
    } else {
        fmt::print(output, "{}automata are not equivalent{}\n", red, reset);
    }
    fmt::print(output, "result: '{}' {} the language of '{}'\n", *word,
               verdict->accepted() ? "belongs to" : "does not belong to", expression);
}

CompilationReport regexcc::compileExpression(std::string_view expression, std::optional<std::string> word,
                                             const RegexOptions& options) {
    CompilationReport report;
    report.expression = expression;
    report.word = std::move(word);

    try {
        Regex regex(expression, options);

        for (const auto& issue : regex.issues()) {
            report.warnings.push_back(issue.message);
        }
        report.nfaStates = regex.automaton().stateCount();
        report.dfaStates = regex.deterministicAutomaton().stateCount();
        report.minimalStates = regex.minimalAutomaton().stateCount();
        report.subsetConstructionTime = regex.subsetConstructionTime();

        if (report.word.has_value()) {
            Verdict verdict = regex.evaluate(*report.word);
            if (!verdict.consistent()) {
                report.warnings.push_back(fmt::format("automata are not equivalent on '{}'", *report.word));
            }
            report.verdict = verdict;
        }
        report.compiled = true;
    } catch (const RegexError& e) {
        report.errorKind = e.kind();
        report.errorMessage = e.what();
        if (options.trace != nullptr) {
            fmt::print(*options.trace, "[regex] error: {}\n", e.what());
        }
    }

    return report;
}

size_t BatchSummary::succeeded() const {
    return std::count_if(reports.begin(), reports.end(), [](const CompilationReport& r) { return r.compiled; });
}

void BatchSummary::reportTo(std::ostream& output, bool colorful) const {
    for (size_t i = 0; i < reports.size(); i++) {
        fmt::print(output, "\n=== Expr #{} ===\n", i + 1);
        reports[i].reportTo(output, colorful);
    }
    fmt::print(output, "\nSummary: {}/{} expressions processed successfully\n", succeeded(), total());
}

BatchSummary regexcc::compileBatch(const std::vector<BatchEntry>& entries, const RegexOptions& options) {
    BatchSummary summary;
    summary.reports.reserve(entries.size());

    for (const BatchEntry& entry : entries) {
        summary.reports.push_back(compileExpression(entry.expression, entry.word, options));
    }

    return summary;
}

size_t CrossTable::acceptedCount() const {
    size_t count = 0;
    for (const auto& row : cells) {
        count += std::count(row.begin(), row.end(), std::optional<bool>(true));
    }
    return count;
}

void CrossTable::reportTo(std::ostream& output) const {
    size_t width = 10;
    for (const std::string& expr : expressions) {
        width = std::max(width, expr.size());
    }

    fmt::print(output, "{:<{}}", "expression", width);
    for (const std::string& word : words) {
        fmt::print(output, " | '{}'", word);
    }
    fmt::print(output, "\n");

    for (size_t i = 0; i < expressions.size(); i++) {
        fmt::print(output, "{:<{}}", expressions[i], width);
        for (size_t j = 0; j < words.size(); j++) {
            const std::optional<bool>& cell = cells[i][j];
            std::string text = cell.has_value() ? yesNo(*cell) : "error";
            fmt::print(output, " | {:<{}}", text, words[j].size() + 2);
        }
        fmt::print(output, "\n");
    }

    for (const std::string& error : errors) {
        fmt::print(output, "error: {}\n", error);
    }
    fmt::print(output, "accepted {}/{} combinations\n", acceptedCount(), expressions.size() * words.size());
}

CrossTable regexcc::crossTest(const std::vector<std::string>& expressions, const std::vector<std::string>& words,
                              const RegexOptions& options) {
    CrossTable table;
    table.expressions = expressions;
    table.words = words;

    for (const std::string& expr : expressions) {
        std::vector<std::optional<bool>> row(words.size());
        try {
            Regex regex(expr, options);
            for (size_t j = 0; j < words.size(); j++) {
                row[j] = regex.automaton().accepts(words[j]);
            }
        } catch (const RegexError& e) {
            table.errors.emplace_back(e.what());
        }
        table.cells.push_back(std::move(row));
    }

    return table;
}

std::vector<CaseMismatch> regexcc::verifyCases(const Regex& regex, const std::vector<std::pair<std::string, bool>>& cases) {
    std::vector<CaseMismatch> mismatches;
    for (const auto& [word, expected] : cases) {
        Verdict verdict = regex.evaluate(word);
        if (verdict.nfa != expected || verdict.dfa != expected || verdict.minimalDfa != expected) {
            mismatches.push_back({word, expected, verdict});
        }
    }
    return mismatches;
}
