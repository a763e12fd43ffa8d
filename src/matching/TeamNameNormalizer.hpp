#pragma once

#include "ITextNormalizer.hpp"

#include <string>
#include <utility>
#include <vector>

namespace matching
{

/**
 * @brief Word tables driving team name normalization.
 *
 * Keys are matched as whole words against case-folded text. Abbreviations are expanded
 * in table order; organizational tokens and stop words are removed.
 */
struct NormalizerRules
{
    std::vector<std::pair<std::string, std::string>> abbreviations;
    std::vector<std::string> organizational_tokens;
    std::vector<std::string> stop_words;

    static NormalizerRules Defaults();
};

/**
 * @brief Normalizer for free-text team names.
 *
 * Pipeline (fixed order):
 * 1. NFKC + case fold, trim
 * 2. Whole-word abbreviation expansion ("LA" -> "los angeles")
 * 3. Whole-word removal of organizational tokens ("fc", "club") and stop words ("the", "de")
 * 4. Every code point that is neither a letter, a number nor whitespace becomes a space
 * 5. Whitespace collapse and trim
 *
 * Example:
 * @code
 * TeamNameNormalizer normalizer;
 * normalizer.normalize("The LA Lakers FC"); // "los angeles lakers"
 * @endcode
 */
class TeamNameNormalizer : public ITextNormalizer
{
public:
    TeamNameNormalizer();
    explicit TeamNameNormalizer(NormalizerRules rules);
    ~TeamNameNormalizer() override;

    [[nodiscard]] std::string normalize(const std::string& text) const override;

    const NormalizerRules& rules() const { return rules_; }

private:
    struct CompiledRule
    {
        std::u32string key;
        std::u32string replacement;
    };

    static std::u32string replaceWholeWord(const std::u32string& text, const CompiledRule& rule);

    NormalizerRules rules_;
    std::vector<CompiledRule> expansions_;
    std::vector<CompiledRule> removals_;
};

} // namespace matching
