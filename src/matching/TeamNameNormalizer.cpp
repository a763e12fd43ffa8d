#include "TeamNameNormalizer.hpp"
#include "TextUtils.hpp"

namespace matching
{

NormalizerRules NormalizerRules::Defaults()
{
    NormalizerRules rules;
    rules.abbreviations = {
        { "la",    "los angeles"   },
        { "n.y.",  "new york"      },
        { "ny",    "new york"      },
        { "s.f.",  "san francisco" },
        { "sf",    "san francisco" },
        { "d.c.",  "washington"    },
        { "dc",    "washington"    },
        { "l.a.",  "los angeles"   },
        { "chi",   "chicago"       },
        { "phila", "philadelphia"  },
        { "n.o.",  "new orleans"   },
        { "no",    "new orleans"   },
        { "s.a.",  "san antonio"   },
        { "sa",    "san antonio"   },
        { "utd",   "united"        },
        { "ht",    "heat"          },
        { "mn",    "minnesota"     },
        { "man.",  "manchester"    }
    };
    rules.organizational_tokens = { "fc", "cf", "sc", "ac", "bc", "fk", "kk", "club", "team", "basketball", "football" };
    rules.stop_words = { "real", "de", "del", "la", "le", "the", "of", "and" };
    return rules;
}

TeamNameNormalizer::TeamNameNormalizer()
    : TeamNameNormalizer(NormalizerRules::Defaults())
{
}

TeamNameNormalizer::TeamNameNormalizer(NormalizerRules rules)
    : rules_(std::move(rules))
{
    auto compile = [](const std::string& key, const std::string& replacement) -> CompiledRule
    {
        return CompiledRule{ utf8ToUtf32(foldCase(key)), utf8ToUtf32(foldCase(replacement)) };
    };

    for (const auto& [key, expansion] : rules_.abbreviations)
    {
        if (!key.empty())
            expansions_.push_back(compile(key, expansion));
    }
    for (const auto& token : rules_.organizational_tokens)
    {
        if (!token.empty())
            removals_.push_back(compile(token, ""));
    }
    for (const auto& word : rules_.stop_words)
    {
        if (!word.empty())
            removals_.push_back(compile(word, ""));
    }
}

TeamNameNormalizer::~TeamNameNormalizer() = default;

std::string TeamNameNormalizer::normalize(const std::string& text) const
{
    std::u32string work = trim(utf8ToUtf32(foldCase(text)));
    if (work.empty())
    {
        return {};
    }

    for (const auto& rule : expansions_)
    {
        work = replaceWholeWord(work, rule);
    }
    for (const auto& rule : removals_)
    {
        work = replaceWholeWord(work, rule);
    }

    // Punctuation to spaces, then collapse
    std::u32string collapsed;
    collapsed.reserve(work.size());
    bool pending_space = false;
    for (char32_t cp : work)
    {
        if (isWordChar(cp))
        {
            if (pending_space && !collapsed.empty())
            {
                collapsed.push_back(U' ');
            }
            pending_space = false;
            collapsed.push_back(cp);
        }
        else
        {
            pending_space = true;
        }
    }

    return utf32ToUtf8(collapsed);
}

std::u32string TeamNameNormalizer::replaceWholeWord(const std::u32string& text, const CompiledRule& rule)
{
    const std::u32string& key = rule.key;
    const size_t n = text.size();
    const size_t k = key.size();
    if (k == 0 || k > n)
    {
        return text;
    }

    // A key ending in punctuation ("man.") carries its own right boundary
    const bool needs_right_boundary = isWordChar(key.back());

    std::u32string out;
    out.reserve(n + rule.replacement.size());

    size_t i = 0;
    while (i < n)
    {
        bool left_ok = (i == 0) || !isWordChar(text[i - 1]);
        bool matched = left_ok && text.compare(i, k, key) == 0;
        if (matched && needs_right_boundary && i + k < n && isWordChar(text[i + k]))
        {
            matched = false;
        }

        if (!matched)
        {
            out.push_back(text[i]);
            ++i;
            continue;
        }

        out.append(rule.replacement);
        if (!rule.replacement.empty() && i + k < n && isWordChar(text[i + k]))
        {
            out.push_back(U' ');
        }
        i += k;
    }

    return out;
}

} // namespace matching
