#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace omc::evolution {

/**
 * @brief Lexical contradiction heuristics between an old and a new statement.
 *
 * Fires on a negation word that only the new text carries, on opposite sentiment words, or on
 * an explicit change marker. The two texts must share at least one content word.
 */
class ContradictionDetector {
public:
    // Reason such as "negation: never" when the texts contradict
    std::optional<std::string> detect(std::string_view oldContent,
                                      std::string_view newContent) const;

    bool isContradiction(std::string_view oldContent, std::string_view newContent) const {
        return detect(oldContent, newContent).has_value();
    }
};

} // namespace omc::evolution
