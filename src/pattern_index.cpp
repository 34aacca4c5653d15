#include "pattern_index.hpp"

#include "item_model.hpp"

namespace vb
{
namespace
{
// evaluates the character set opening at pattern[open] against c
// returns 1 on match, 0 on mismatch and -1 if the '[' has no closing ']'
int match_set(const std::string& pattern, size_t open, char c, size_t& next)
{
    size_t i = open + 1;
    bool negate = i < pattern.size() && pattern[i] == '!';
    if (negate) ++i;

    // a ']' right after the opening bracket is a literal member
    size_t close = i;
    if (close < pattern.size() && pattern[close] == ']') ++close;
    while (close < pattern.size() && pattern[close] != ']') ++close;
    if (close >= pattern.size()) return -1;

    bool matched = false;
    for (size_t k = i; k < close && !matched; )
    {
        if (k + 2 < close && pattern[k + 1] == '-')
        {
            matched = pattern[k] <= c && c <= pattern[k + 2];
            k += 3;
        } else
        {
            matched = pattern[k] == c;
            ++k;
        }
    }
    next = close + 1;
    return (matched != negate) ? 1 : 0;
}
} // namespace

PatternIndex::PatternIndex(const ItemModel& model, int column) : model(model), column(column)
{}

bool PatternIndex::match(const std::string& label, const std::string& pattern)
{
    size_t s = 0;
    size_t p = 0;
    size_t star_p = std::string::npos;
    size_t star_s = 0;

    while (s < label.size())
    {
        if (p < pattern.size())
        {
            char pc = pattern[p];
            if (pc == '*')
            {
                star_p = p++;
                star_s = s;
                continue;
            }
            if (pc == '?')
            {
                ++p;
                ++s;
                continue;
            }
            if (pc == '[')
            {
                size_t next = p;
                int result = match_set(pattern, p, label[s], next);
                if (result == 1 || (result == -1 && label[s] == '['))
                {
                    p = (result == 1) ? next : p + 1;
                    ++s;
                    continue;
                }
            } else if (pc == label[s])
            {
                ++p;
                ++s;
                continue;
            }
        }

        // retry the last '*' with one more character consumed
        if (star_p != std::string::npos)
        {
            p = star_p + 1;
            s = ++star_s;
            continue;
        }
        return false;
    }

    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

std::vector<int> PatternIndex::filter_rows(const std::string& pattern) const
{
    std::vector<int> filtered;
    for (int row = 0; row < model.row_count(); ++row)
    {
        if (match(model.item(row, column), pattern)) filtered.push_back(row);
    }
    return filtered;
}
} // namespace vb
