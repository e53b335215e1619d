/*
 * This file is part of Letterpress.
 * Copyright (C) 2025 Luisma Peramato
 *
 * Letterpress is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Letterpress is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Letterpress. If not, see <https://www.gnu.org/licenses/>.
 */
#include "markupnormalizer.h"

#include "markuptags.h"
#include "receipttypes.h"
#include "stringutils.h"

#include <cctype>
#include <string_view>
#include <vector>

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Skips an element including its content, e.g. <style>...</style>.
size_t SkipElement(const std::string &text, size_t tagEnd, const std::string &name) {
    const std::string lower = StringUtils::ToLowerCopy(text);
    size_t close = lower.find("</" + name, tagEnd);
    if (close == std::string::npos)
        return text.size();
    size_t end = text.find('>', close);
    return end == std::string::npos ? text.size() : end + 1;
}

// Copies `text` to the output while rewriting `delim`-delimited spans with
// the given tags. A span must open and close on the same line.
std::string ReplaceDelimitedSpans(const std::string &text, const std::string &delim,
                                  const std::string &openTag, const std::string &closeTag) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t tagEnd = FindMarkupTagEnd(text, pos);
        if (tagEnd != std::string::npos) {
            out.append(text, pos, tagEnd - pos);
            pos = tagEnd;
            continue;
        }
        if (text.compare(pos, delim.size(), delim) != 0) {
            out.push_back(text[pos++]);
            continue;
        }
        size_t innerStart = pos + delim.size();
        size_t close = text.find(delim, innerStart);
        size_t lineEnd = text.find(LINE_BREAK, innerStart);
        bool valid = close != std::string::npos && close > innerStart &&
                     (lineEnd == std::string::npos || close < lineEnd);
        if (!valid) {
            out.append(delim);
            pos = innerStart;
            continue;
        }
        out += openTag;
        out.append(text, innerStart, close - innerStart);
        out += closeTag;
        pos = close + delim.size();
    }
    return out;
}

struct ListContext {
    bool ordered = false;
    int counter = 0;
};

} // namespace

std::string ConvertStrongDelimiters(const std::string &text) {
    std::string out = ReplaceDelimitedSpans(text, "**", "<strong>", "</strong>");
    return ReplaceDelimitedSpans(out, "__", "<strong>", "</strong>");
}

std::string ConvertEmphasisDelimiters(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t tagEnd = FindMarkupTagEnd(text, pos);
        if (tagEnd != std::string::npos) {
            out.append(text, pos, tagEnd - pos);
            pos = tagEnd;
            continue;
        }
        if (text[pos] != '*') {
            out.push_back(text[pos++]);
            continue;
        }
        // An opening '*' must touch the word it emphasises; "* item" is a
        // bullet, not emphasis.
        size_t innerStart = pos + 1;
        if (innerStart >= text.size() || IsSpace(text[innerStart]) || text[innerStart] == '*') {
            out.push_back(text[pos++]);
            continue;
        }
        size_t close = std::string::npos;
        for (size_t i = innerStart + 1; i < text.size(); ++i) {
            if (text[i] == LINE_BREAK)
                break;
            if (text[i] == '*' && !IsSpace(text[i - 1])) {
                close = i;
                break;
            }
        }
        if (close == std::string::npos) {
            out.push_back(text[pos++]);
            continue;
        }
        out += "<em>";
        out.append(text, innerStart, close - innerStart);
        out += "</em>";
        pos = close + 1;
    }
    return out;
}

std::string CanonicalizeTags(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    std::vector<ListContext> lists;
    size_t pos = 0;
    while (pos < text.size()) {
        if (text.compare(pos, 4, "<!--") == 0) {
            size_t end = text.find("-->", pos + 4);
            pos = end == std::string::npos ? text.size() : end + 3;
            continue;
        }
        size_t tagEnd = FindMarkupTagEnd(text, pos);
        if (tagEnd == std::string::npos) {
            out.push_back(text[pos++]);
            continue;
        }

        const std::string_view tag(text.data() + pos, tagEnd - pos);
        const MarkupTag info = ParseMarkupTag(tag);
        const std::string &name = info.name;

        if (!info.closing && (name == "head" || name == "style" || name == "script" ||
                              name == "title")) {
            pos = SkipElement(text, tagEnd, name);
            continue;
        }
        pos = tagEnd;

        if (name == "!doctype" || name == "html" || name == "body" || name == "meta" ||
            name == "head" || name == "style" || name == "script" || name == "title") {
            continue;
        }
        if (name == "b" || name == "strong") {
            out += info.closing ? "</strong>" : "<strong>";
        } else if (name == "i" || name == "em") {
            out += info.closing ? "</em>" : "<em>";
        } else if (name == "p" || name == "div" || name == "hr") {
            out += PARAGRAPH_BREAK;
        } else if (name == "br") {
            out.push_back(LINE_BREAK);
        } else if (name == "ul" || name == "ol") {
            if (info.closing) {
                if (!lists.empty())
                    lists.pop_back();
            } else {
                lists.push_back({name == "ol", 0});
            }
            out += PARAGRAPH_BREAK;
        } else if (name == "li") {
            if (info.closing)
                continue;
            if (!out.empty() && out.back() != LINE_BREAK)
                out.push_back(LINE_BREAK);
            if (!lists.empty() && lists.back().ordered) {
                out += std::to_string(++lists.back().counter) + ". ";
            } else {
                out += "\xE2\x80\xA2 "; // U+2022 bullet
            }
        } else if (name.size() == 2 && name[0] == 'h' && name[1] >= '1' && name[1] <= '6') {
            if (info.closing) {
                out += "</strong>";
                out += PARAGRAPH_BREAK;
            } else {
                out += PARAGRAPH_BREAK;
                out += "<strong>";
            }
        } else {
            out.append(tag.data(), tag.size());
        }
    }
    return out;
}

std::string DecodeEntities(const std::string &text) {
    struct Entity {
        const char *name;
        const char *value;
    };
    static const Entity kEntities[] = {
        {"&nbsp;", "\xC2\xA0"}, {"&amp;", "&"}, {"&quot;", "\""},
        {"&#39;", "'"},  {"&apos;", "'"},
    };
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] == '&') {
            bool matched = false;
            for (const auto &entity : kEntities) {
                const std::string_view name(entity.name);
                if (text.compare(pos, name.size(), name) == 0) {
                    out += entity.value;
                    pos += name.size();
                    matched = true;
                    break;
                }
            }
            if (matched)
                continue;
        }
        out.push_back(text[pos++]);
    }
    return out;
}

std::string CollapseBreaks(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        if (!IsSpace(text[pos])) {
            out.push_back(text[pos++]);
            continue;
        }
        size_t end = pos;
        int newlines = 0;
        while (end < text.size() && IsSpace(text[end])) {
            if (text[end] == LINE_BREAK)
                ++newlines;
            ++end;
        }
        if (newlines >= 2)
            out += PARAGRAPH_BREAK;
        else
            out.append(text, pos, end - pos);
        pos = end;
    }

    // Breaks at either end carry no content.
    size_t start = 0;
    while (start < out.size() && IsSpace(out[start]))
        ++start;
    size_t stop = out.size();
    while (stop > start && IsSpace(out[stop - 1]))
        --stop;
    return out.substr(start, stop - start);
}

std::string NormalizeMarkup(const std::string &input) {
    std::string text = input;
    StringUtils::ReplaceAll(text, "\r\n", "\n");
    StringUtils::ReplaceAll(text, "\r", "\n");

    text = CanonicalizeTags(text);
    text = ConvertStrongDelimiters(text);
    text = ConvertEmphasisDelimiters(text);
    text = DecodeEntities(text);
    return CollapseBreaks(text);
}
